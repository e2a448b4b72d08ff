#pragma once
#include "acp/backends.hpp"
#include "acp/event_loop.hpp"
#include "acp/log_sink.hpp"
#include "config/acp_config.h"
#include <map>
#include <string>
#include <vector>


namespace acp {

struct PermissionCheck {
	bool granted{ false };                      ///< 필수 권한(scan, connect) 모두 허용
	std::vector<std::string> missing;           ///< 허용되지 않은 모든 권한 (best-effort 포함)
	std::map<std::string, std::string> details; ///< 식별자 → "granted" | "denied" | "never_ask_again"
};


struct PermissionRequestResult {
	bool success{ false };
	std::vector<std::string> granted_permissions;
	std::vector<std::string> denied_permissions;
	bool needs_settings_redirect{ false };
};


/**
* PermissionCoordinator
* - scan/connect 는 필수, advertise/location 은 best-effort.
* - 매 호출마다 백엔드에 새로 질의한다. 응답이 timeout 안에 없으면 거부로 본다.
*/
class PermissionCoordinator {
public:
	PermissionCoordinator(PermissionBackend& backend, EventLoop& loop, LogSink* log = nullptr,
		Millis timeout = Millis(ACP_PERMISSION_TIMEOUT_MS));

	PermissionCheck check_permissions();
	PermissionRequestResult request_permissions_enhanced();

	static bool is_critical(PermissionKind k);
	static const std::vector<PermissionKind>& all_kinds();

private:
	PermissionBackend& backend_;
	EventLoop& loop_;
	LogSink* log_ = nullptr;
	Millis timeout_;
};

} // namespace acp
