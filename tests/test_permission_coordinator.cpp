#include <doctest/doctest.h>
#include "acp/permission_coordinator.hpp"
#include "mocks/fake_backends.hpp"
#include <algorithm>

using namespace acp;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
	return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace


TEST_CASE("missing advertise permission does not block when scan and connect are granted") {
	ManualEventLoop loop;
	FakePermissions perms;
	perms.current[PermissionKind::Advertise] = PermissionStatus::Denied;
	PermissionCoordinator pc(perms, loop);

	PermissionCheck r = pc.check_permissions();
	CHECK(r.granted);
	REQUIRE(r.missing.size() == 1);
	CHECK(r.missing[0] == "BLUETOOTH_ADVERTISE");
	CHECK(r.details["BLUETOOTH_ADVERTISE"] == "denied");
	CHECK(r.details["BLUETOOTH_SCAN"] == "granted");
}

TEST_CASE("missing connect permission is critical") {
	ManualEventLoop loop;
	FakePermissions perms;
	perms.current[PermissionKind::Connect] = PermissionStatus::DeniedForever;
	PermissionCoordinator pc(perms, loop);

	PermissionCheck r = pc.check_permissions();
	CHECK_FALSE(r.granted);
	CHECK(r.details["BLUETOOTH_CONNECT"] == "never_ask_again");
}

TEST_CASE("permissions are queried fresh on every check") {
	ManualEventLoop loop;
	FakePermissions perms;
	PermissionCoordinator pc(perms, loop);

	CHECK(pc.check_permissions().granted);
	perms.current[PermissionKind::Scan] = PermissionStatus::Denied;
	CHECK_FALSE(pc.check_permissions().granted);
	CHECK(perms.query_calls == 8);
}

TEST_CASE("unanswered query counts as denied after the timeout") {
	ManualEventLoop loop;
	FakePermissions perms;
	perms.hang_query = true;
	PermissionCoordinator pc(perms, loop, nullptr, Millis(500));

	PermissionCheck r = pc.check_permissions();
	CHECK_FALSE(r.granted);
	CHECK(r.missing.size() == 4);
	CHECK(loop.elapsed() == Millis(2000));
}

TEST_CASE("default query timeout comes from the compile-time config") {
	ManualEventLoop loop;
	FakePermissions perms;
	perms.hang_query = true;
	PermissionCoordinator pc(perms, loop);

	CHECK_FALSE(pc.check_permissions().granted);
	CHECK(loop.elapsed() == Millis(4 * ACP_PERMISSION_TIMEOUT_MS));
}

TEST_CASE("request reports granted and denied sets") {
	ManualEventLoop loop;
	FakePermissions perms;
	perms.current[PermissionKind::Scan] = PermissionStatus::Denied;
	perms.current[PermissionKind::Location] = PermissionStatus::Denied;
	perms.after_request[PermissionKind::Scan] = PermissionStatus::Granted;
	PermissionCoordinator pc(perms, loop);

	PermissionRequestResult r = pc.request_permissions_enhanced();
	CHECK(r.success);
	CHECK_FALSE(r.needs_settings_redirect);
	CHECK(contains(r.granted_permissions, "BLUETOOTH_SCAN"));
	CHECK(contains(r.denied_permissions, "ACCESS_FINE_LOCATION"));
}

TEST_CASE("permanently denied permission asks for a settings redirect") {
	ManualEventLoop loop;
	FakePermissions perms;
	perms.current[PermissionKind::Connect] = PermissionStatus::DeniedForever;
	PermissionCoordinator pc(perms, loop);

	PermissionRequestResult r = pc.request_permissions_enhanced();
	CHECK_FALSE(r.success);
	CHECK(r.needs_settings_redirect);
	CHECK(contains(r.denied_permissions, "BLUETOOTH_CONNECT"));
}
