#include <doctest/doctest.h>
#include "acp/scan_controller.hpp"
#include "acp/security_layer.hpp"
#include "acp/wire_codec.hpp"
#include "mocks/fake_backends.hpp"
#include <stdexcept>
#include <vector>

using namespace acp;

namespace {

PaymentPayload payload(const std::string& device) {
	PaymentPayload p;
	p.wallet_address = "0x00ff00ff";
	p.amount = std::string("3");
	p.token = TokenSymbol::ETH;
	p.chain_id = "core_testnet";
	p.timestamp = 1700000000000LL;
	p.device_name = device;
	return p;
}

Advertisement advert(const std::string& addr, const std::string& name, int rssi = -55) {
	Advertisement a;
	a.address = addr;
	a.rssi = rssi;
	a.local_name = name;
	a.service_uuids.push_back(ACP_SERVICE_UUID);
	a.manufacturer_data[ACP_MANUFACTURER_ID] = to_bytes(encode_wire(build_wire_message(payload(name), 1)));
	return a;
}

struct Rig {
	ManualEventLoop loop;
	FakeRadioAdapter adapter;
	FakeScanBackend backend;
	RadioStateMonitor radio{ adapter };
	HealthMonitor health{ loop };
	std::vector<ScanResult> found;

	FoundCallback collect() {
		return [this](const ScanResult& r) { found.push_back(r); };
	}
};

} // namespace


TEST_CASE("scan stops on its own after the timeout with nothing found") {
	Rig rig;
	ScanController scan(rig.loop, &rig.backend, rig.radio, &rig.health);

	REQUIRE(scan.start_scan(rig.collect(), Millis(30000)).ok);
	CHECK(scan.is_scanning());
	rig.loop.advance(Millis(29999));
	CHECK(scan.is_scanning());
	rig.loop.advance(Millis(1));
	CHECK_FALSE(scan.is_scanning());
	CHECK_FALSE(rig.backend.running());
	CHECK(rig.found.empty());
}

TEST_CASE("matching devices are reported once per session") {
	Rig rig;
	ScanController scan(rig.loop, &rig.backend, rig.radio, &rig.health);
	REQUIRE(scan.start_scan(rig.collect()).ok);

	rig.backend.emit(advert("AA:00:00:00:00:01", "AirChainPay-1111", -40));
	rig.backend.emit(advert("AA:00:00:00:00:01", "AirChainPay-1111", -70));
	rig.backend.emit(advert("AA:00:00:00:00:02", "AirChainPay-2222", -80));

	REQUIRE(rig.found.size() == 2);
	CHECK(rig.found[0].device.id == "AA:00:00:00:00:01");
	CHECK(rig.found[0].device.name == "AirChainPay-1111");
	CHECK(rig.found[0].rssi == -40);
	REQUIRE(rig.found[0].payload.has_value());
	CHECK(*rig.found[0].payload == payload("AirChainPay-1111"));
	CHECK(scan.discovered_devices().size() == 2);

	scan.clear_discovered_devices();
	rig.backend.emit(advert("AA:00:00:00:00:01", "AirChainPay-1111"));
	CHECK(rig.found.size() == 3);
}

TEST_CASE("devices without the service uuid or name prefix are ignored") {
	Rig rig;
	ScanController scan(rig.loop, &rig.backend, rig.radio, &rig.health);
	REQUIRE(scan.start_scan(rig.collect()).ok);

	Advertisement wrong_name = advert("AA:00:00:00:00:03", "Headphones");
	wrong_name.manufacturer_data.clear();
	rig.backend.emit(wrong_name);

	Advertisement wrong_uuid;
	wrong_uuid.address = "AA:00:00:00:00:04";
	wrong_uuid.local_name = std::string("AirChainPay-4444");
	wrong_uuid.service_uuids.push_back("0000180d-0000-1000-8000-00805f9b34fb");
	rig.backend.emit(wrong_uuid);

	CHECK(rig.found.empty());
}

TEST_CASE("service id from the JSON message satisfies the uuid filter") {
	Rig rig;
	ScanController scan(rig.loop, &rig.backend, rig.radio, &rig.health);
	REQUIRE(scan.start_scan(rig.collect()).ok);

	Advertisement a = advert("AA:00:00:00:00:05", "AirChainPay-5555");
	a.service_uuids.clear();
	rig.backend.emit(a);
	CHECK(rig.found.size() == 1);
}

TEST_CASE("unparseable payload is still reported without payload") {
	Rig rig;
	ScanController scan(rig.loop, &rig.backend, rig.radio, &rig.health);
	REQUIRE(scan.start_scan(rig.collect()).ok);

	Advertisement a;
	a.address = "AA:00:00:00:00:06";
	a.local_name = std::string("AirChainPay-6666");
	a.service_uuids.push_back(ACP_SERVICE_UUID);
	a.manufacturer_data[ACP_MANUFACTURER_ID] = to_bytes("garbage");
	rig.backend.emit(a);

	REQUIRE(rig.found.size() == 1);
	CHECK_FALSE(rig.found[0].payload.has_value());
}

TEST_CASE("encrypted payloads are decrypted with the configured key") {
	Rig rig;
	ScanOptions opts;
	opts.decrypt_key = "k3y";
	ScanController scan(rig.loop, &rig.backend, rig.radio, &rig.health, nullptr, opts);
	REQUIRE(scan.start_scan(rig.collect()).ok);

	ManualEventLoop sec_loop;
	SecurityLayer sec(sec_loop);
	SecurityConfig cfg;
	cfg.enable_encryption = true;
	cfg.encryption_key = "k3y";
	auto enc = sec.create_secure_payload(payload("AirChainPay-7777"), cfg);

	Advertisement a = advert("AA:00:00:00:00:07", "AirChainPay-7777");
	a.manufacturer_data[ACP_MANUFACTURER_ID] = to_bytes(encode_wire(build_wire_message(enc.payload, 1, true)));
	rig.backend.emit(a);

	REQUIRE(rig.found.size() == 1);
	CHECK_FALSE(rig.found[0].encrypted);
	REQUIRE(rig.found[0].payload.has_value());
	CHECK(rig.found[0].payload->wallet_address == "0x00ff00ff");
}

TEST_CASE("scan requires a backend and a powered radio") {
	Rig rig;
	ScanController no_backend(rig.loop, nullptr, rig.radio);
	CHECK(no_backend.start_scan(rig.collect()).error == ErrorKind::BleNotAvailable);

	rig.adapter.is_on = false;
	ScanController scan(rig.loop, &rig.backend, rig.radio);
	CHECK(scan.start_scan(rig.collect()).error == ErrorKind::BleNotAvailable);
	CHECK(rig.backend.start_calls == 0);
}

TEST_CASE("backend start failure is reported as a scan error") {
	Rig rig;
	rig.backend.start_result = BackendStatus::failure(ErrorKind::PermissionDenied, "hci_open_dev failed");
	ScanController scan(rig.loop, &rig.backend, rig.radio);

	BackendStatus st = scan.start_scan(rig.collect());
	CHECK_FALSE(st.ok);
	CHECK(st.error == ErrorKind::ScanError);
	CHECK_FALSE(scan.is_scanning());
}

TEST_CASE("stop is idempotent and a throwing callback does not break scanning") {
	Rig rig;
	ScanController scan(rig.loop, &rig.backend, rig.radio, &rig.health);
	int calls = 0;
	REQUIRE(scan.start_scan([&](const ScanResult&) { ++calls; throw std::runtime_error("ui gone"); }).ok);

	rig.backend.emit(advert("AA:00:00:00:00:08", "AirChainPay-8888"));
	rig.backend.emit(advert("AA:00:00:00:00:09", "AirChainPay-9999"));
	CHECK(calls == 2);

	scan.stop_scan();
	scan.stop_scan();
	CHECK(rig.backend.stop_calls == 1);
}

TEST_CASE("scan sessions feed signal samples to the health monitor") {
	Rig rig;
	ScanController scan(rig.loop, &rig.backend, rig.radio, &rig.health);
	REQUIRE(scan.start_scan(rig.collect()).ok);
	rig.backend.emit(advert("AA:00:00:00:00:0A", "AirChainPay-0010", -50));
	rig.backend.emit(advert("AA:00:00:00:00:0B", "AirChainPay-0011", -70));
	scan.stop_scan();

	OverallStatistics s = rig.health.overall_statistics();
	CHECK(s.scan_sessions == 1);
	CHECK(s.total_sessions == 0);
	CHECK(s.active_sessions == 0);
	CHECK(s.success_rate == doctest::Approx(0.0));
	CHECK(s.average_signal_strength == doctest::Approx(-60.0));
}

TEST_CASE("two scans in the same millisecond are separate sessions") {
	Rig rig;
	ScanController scan(rig.loop, &rig.backend, rig.radio, &rig.health);
	REQUIRE(scan.start_scan(rig.collect()).ok);
	scan.stop_scan();
	REQUIRE(scan.start_scan(rig.collect()).ok);
	scan.stop_scan();
	CHECK(rig.health.overall_statistics().scan_sessions == 2);
}

TEST_CASE("a beacon-only advertisement points the caller to a characteristic read") {
	Rig rig;
	ScanController scan(rig.loop, &rig.backend, rig.radio, &rig.health);
	REQUIRE(scan.start_scan(rig.collect()).ok);

	Advertisement a = advert("AA:00:00:00:00:0C", "AirChainPay-0012", -45);
	a.manufacturer_data[ACP_MANUFACTURER_ID] = encode_beacon(build_wire_message(payload("AirChainPay-0012"), 1700000000000LL));
	rig.backend.emit(a);

	// 결제 정보 없는 비콘
	Advertisement idle = advert("AA:00:00:00:00:0D", "AirChainPay-0013");
	WireMessage empty = build_wire_message(payload("AirChainPay-0013"), 1700000000000LL);
	empty.payment.reset();
	idle.manufacturer_data[ACP_MANUFACTURER_ID] = encode_beacon(empty);
	rig.backend.emit(idle);

	REQUIRE(rig.found.size() == 2);
	CHECK(rig.found[0].device.name == "AirChainPay-0012");
	CHECK_FALSE(rig.found[0].payload.has_value());
	CHECK(rig.found[0].payment_over_gatt);
	CHECK_FALSE(rig.found[1].payload.has_value());
	CHECK_FALSE(rig.found[1].payment_over_gatt);
}
