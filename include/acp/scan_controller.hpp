#pragma once
#include "acp/backends.hpp"
#include "acp/event_loop.hpp"
#include "acp/health_monitor.hpp"
#include "acp/log_sink.hpp"
#include "acp/radio_state_monitor.hpp"
#include "acp/types.hpp"
#include "config/acp_config.h"
#include <functional>
#include <map>
#include <string>
#include <vector>


namespace acp {

struct ScanOptions {
	std::string service_uuid{ ACP_SERVICE_UUID };
	std::string name_prefix{ ACP_DEVICE_PREFIX };
	std::string decrypt_key; ///< 비어 있으면 암호화 페이로드를 그대로 전달
};


using FoundCallback = std::function<void(const ScanResult&)>;


/**
* ScanController
* - 서비스 UUID + 이름 접두사로 필터링, 스캔 세션 동안 기기 ID 기준 1회만 보고.
* - 페이로드 파싱 실패 기기도 payload 없이 보고한다.
* - timeout 이 지나면 자동 정지, stop_scan 으로 조기 정지 (중복 호출 무해).
*/
class ScanController {
public:
	ScanController(EventLoop& loop, ScanBackend* backend, RadioStateMonitor& radio,
		HealthMonitor* health = nullptr, LogSink* log = nullptr, ScanOptions opts = {});
	~ScanController();

	ScanController(const ScanController&) = delete;
	ScanController& operator=(const ScanController&) = delete;

	BackendStatus start_scan(FoundCallback on_found, Millis timeout = Millis(ACP_SCAN_TIMEOUT_MS));
	void stop_scan();

	bool is_scanning() const { return scanning_; }
	std::vector<ScanResult> discovered_devices() const;
	void clear_discovered_devices();

private:
	void on_advertisement_(const Advertisement& adv);
	bool matches_filter_(const Advertisement& adv, const std::string& name, const std::string& service_id) const;

	EventLoop& loop_;
	ScanBackend* backend_ = nullptr;
	RadioStateMonitor& radio_;
	HealthMonitor* health_ = nullptr;
	LogSink* log_ = nullptr;
	ScanOptions opts_;

	bool scanning_{ false };
	FoundCallback on_found_;
	TimerId timeout_timer_{ 0 };
	std::string scan_session_;
	uint64_t session_seq_{ 0 };
	std::map<std::string, ScanResult> discovered_; ///< device id → 첫 보고 결과
};

} // namespace acp
