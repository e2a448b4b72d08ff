#include "acp/permission_coordinator.hpp"
#include <memory>
#include <optional>


namespace acp {

const char* to_string(PermissionStatus s) {
	switch (s) {
	case PermissionStatus::Granted: return "granted";
	case PermissionStatus::Denied: return "denied";
	case PermissionStatus::DeniedForever: return "never_ask_again";
	}
	return "?";
}


PermissionCoordinator::PermissionCoordinator(PermissionBackend& backend, EventLoop& loop, LogSink* log, Millis timeout)
	: backend_(backend), loop_(loop), log_(log), timeout_(timeout) {}


bool PermissionCoordinator::is_critical(PermissionKind k) {
	return k == PermissionKind::Scan || k == PermissionKind::Connect;
}


const std::vector<PermissionKind>& PermissionCoordinator::all_kinds() {
	static const std::vector<PermissionKind> kinds{
		PermissionKind::Scan, PermissionKind::Connect, PermissionKind::Advertise, PermissionKind::Location
	};
	return kinds;
}


PermissionCheck PermissionCoordinator::check_permissions() {
	PermissionCheck r;
	r.granted = true;

	for (PermissionKind k : all_kinds()) {
		// 응답이 timeout 뒤에 와도 안전하도록 공유 상태에 기록
		auto answer = std::make_shared<std::optional<PermissionStatus>>();
		backend_.query(k, [answer](PermissionStatus s) { if (!*answer) *answer = s; });

		const std::string id = backend_.identifier(k);
		PermissionStatus st = PermissionStatus::Denied;
		if (loop_.wait_until([answer]() { return answer->has_value(); }, timeout_)) {
			st = **answer;
		}
		else if (log_) {
			log_->warn("PERM", "query timed out: " + id);
		}

		r.details[id] = to_string(st);
		if (st != PermissionStatus::Granted) {
			r.missing.push_back(id);
			if (is_critical(k)) r.granted = false;
		}
	}

	if (log_) log_->debug("PERM", std::string("check: ") + (r.granted ? "granted" : "missing critical"));
	return r;
}


PermissionRequestResult PermissionCoordinator::request_permissions_enhanced() {
	PermissionRequestResult r;
	using StatusMap = std::map<PermissionKind, PermissionStatus>;

	auto answer = std::make_shared<std::optional<StatusMap>>();
	backend_.request(all_kinds(), [answer](const StatusMap& m) { if (!*answer) *answer = m; });

	StatusMap statuses;
	if (loop_.wait_until([answer]() { return answer->has_value(); }, timeout_)) {
		statuses = **answer;
	}
	else if (log_) {
		log_->warn("PERM", "permission request timed out");
	}

	bool critical_ok = true;
	for (PermissionKind k : all_kinds()) {
		auto it = statuses.find(k);
		PermissionStatus st = (it == statuses.end()) ? PermissionStatus::Denied : it->second;
		const std::string id = backend_.identifier(k);

		if (st == PermissionStatus::Granted) {
			r.granted_permissions.push_back(id);
		}
		else {
			r.denied_permissions.push_back(id);
			if (st == PermissionStatus::DeniedForever) r.needs_settings_redirect = true;
			if (is_critical(k)) critical_ok = false;
		}
	}
	r.success = critical_ok;

	if (log_) {
		log_->info("PERM", std::string("request: ") + (r.success ? "success" : "denied") +
			(r.needs_settings_redirect ? " (settings redirect needed)" : ""));
	}
	return r;
}

} // namespace acp
