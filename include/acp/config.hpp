#pragma once
#include "acp/advertising_controller.hpp"
#include "acp/connection_manager.hpp"
#include "acp/log_sink.hpp"
#include "acp/scan_controller.hpp"
#include "config/acp_config.h"
#include <string>


namespace acp {

/**
* 런타임 설정. 기본값은 config/acp_config.h
* JSON 파일 예:
*   { "device_name": "AirChainPay-0042", "log": { "level": "debug", "file": "/var/log/acp.log" },
*     "advertising": { "max_retries": 3, "auto_stop_ms": 60000 }, "scan": { "timeout_ms": 30000 } }
*/
struct ProximityConfig {
	std::string device_name; ///< 비어 있으면 "<prefix>-<0..9999>" 생성
	int hci_index{ ACP_HCI_INDEX };

	LogLevel log_level{ LogLevel::Info };
	std::string log_file;
	bool log_echo{ true };

	Millis permission_timeout{ ACP_PERMISSION_TIMEOUT_MS };
	Millis health_period{ ACP_HEALTH_CHECK_PERIOD_MS };
	size_t max_event_history{ ACP_MAX_EVENT_HISTORY };
	Millis scan_timeout{ ACP_SCAN_TIMEOUT_MS };

	AdvertisingOptions advertising;
	ScanOptions scan;
	ConnectOptions connection;
};


/**
* @brief JSON 설정 파일 로드 (없는 키는 기본값 유지, 모르는 키는 무시)
* @param err 실패 사유 (파일 없음, 파싱 실패, 타입 오류)
*/
bool load_config(const std::string& path, ProximityConfig& cfg, std::string& err);

/** @brief JSON 텍스트에서 로드 */
bool parse_config(const std::string& text, ProximityConfig& cfg, std::string& err);

/** @brief 설정값 범위 검사 */
bool validate_config(const ProximityConfig& cfg, std::string& err);

} // namespace acp
