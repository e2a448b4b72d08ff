#pragma once
#include "acp/backends.hpp"
#include "acp/event_loop.hpp"
#include "acp/health_monitor.hpp"
#include "acp/log_sink.hpp"
#include "acp/permission_coordinator.hpp"
#include "acp/radio_state_monitor.hpp"
#include "acp/security_layer.hpp"
#include "acp/types.hpp"
#include "config/acp_config.h"
#include <functional>
#include <map>
#include <optional>
#include <string>


namespace acp {

struct AdvertisingOptions {
	int  max_retries{ ACP_ADV_MAX_RETRIES };
	Millis attempt_timeout{ ACP_ADV_ATTEMPT_TIMEOUT_MS };
	Millis backoff_base{ ACP_ADV_BACKOFF_BASE_MS };     ///< n 번째 실패 후 base*n 대기
	Millis fallback_period{ ACP_ADV_FALLBACK_PERIOD_MS };
	Millis auto_stop{ ACP_ADV_AUTO_STOP_MS };
	Millis stop_timeout{ ACP_ADV_STOP_TIMEOUT_MS };
	int  radio_check_attempts{ ACP_RADIO_CHECK_ATTEMPTS };
	Millis radio_check_delay{ ACP_RADIO_CHECK_DELAY_MS };
	size_t max_history{ ACP_MAX_SESSION_HISTORY };       ///< 보관할 세션 metrics 수 (통계 범위)
	AdvertisingConfig advertisement{ ACP_TX_POWER_DEFAULT, ACP_ADV_MODE_DEFAULT, ACP_ADV_INTERVAL_DEFAULT_MS,
		true, true, false, ACP_SERVICE_UUID };
};


struct AdvertiseResult {
	bool success{ false };
	std::optional<std::string> session_id;
	bool needs_settings_redirect{ false };
	ErrorKind error{ ErrorKind::None };
	std::string message;
	AdvertisingMode mode{ AdvertisingMode::None };
};


struct AdvertisingSession {
	std::string session_id; ///< "<deviceName>-<epoch ms>-<seq>"
	std::string device_name;
	PaymentPayload payload;
	AdvState state{ AdvState::Idle };
	int retry_count{ 0 }; ///< 네이티브 시도 횟수
	AdvertisingMode mode{ AdvertisingMode::None };
	bool secure{ false };
	bool encrypted{ false };
	std::optional<std::string> auth_token;
	int64_t started_at{ 0 };
	AdvertisementSpec spec;
};


struct AdvertisingMetrics {
	std::string session_id;
	int64_t start_ms{ 0 };
	int64_t stop_ms{ 0 };
	bool success{ false };
	uint32_t error_count{ 0 };
	uint32_t restart_count{ 0 };
	AdvertisingMode mode{ AdvertisingMode::None };
};


struct BasicStatistics {
	size_t total_sessions{ 0 };
	size_t successful_sessions{ 0 };
	size_t failed_sessions{ 0 };
	double average_duration_ms{ 0.0 }; ///< 종료된 세션 기준
	uint32_t total_errors{ 0 };
	uint32_t total_restarts{ 0 };
};


struct AdvertisingStatus {
	AdvState state{ AdvState::Idle };
	std::optional<std::string> session_id;
	Capability capability{ Capability::Unavailable };
	AdvertisingMode mode{ AdvertisingMode::None };
	int retry_count{ 0 };
	bool secure{ false };
};


/**
* AdvertisingController
* - Idle → Starting → {Active | Failed}, Active → Stopping → Idle
* - start: 재진입 가드 → 검증 → 능력 확인 → 권한 → 라디오 → 네이티브 광고(타임아웃 경쟁, 재시도) → 폴백
* - Active 는 로컬 상태일 뿐이다. 실제 송출은 헬스 체크가 주기적으로 가정만 점검한다.
* - stop 은 네이티브 결과와 무관하게 항상 Idle 로 끝난다.
*/
class AdvertisingController {
public:
	AdvertisingController(EventLoop& loop, Capability capability, RadioStateMonitor& radio,
		PermissionCoordinator& permissions, NativeAdvertiser* advertiser, HealthMonitor& health,
		LogSink* log = nullptr, AdvertisingOptions opts = {});
	~AdvertisingController();

	AdvertisingController(const AdvertisingController&) = delete;
	AdvertisingController& operator=(const AdvertisingController&) = delete;

	AdvertiseResult start_advertising(const PaymentPayload& payload,
		const std::optional<SecurityConfig>& security = std::nullopt);
	void stop_advertising();

	bool is_advertising() const { return state_ == AdvState::Active; }
	AdvState state() const { return state_; }
	AdvertisingStatus status() const;
	const AdvertisingSession* session() const { return session_ ? &*session_ : nullptr; }
	Capability capability() const { return capability_; }

	BasicStatistics statistics() const;
	const std::map<std::string, AdvertisingMetrics>& metrics() const { return metrics_; }

	SecurityLayer& security() { return security_; }
	const SecurityLayer& security() const { return security_; }

	int add_advertising_listener(std::function<void(bool)> cb);
	void remove_advertising_listener(int id);

	/** @brief 광고 중 원격 기기가 특성에 쓴 데이터 (base64 해제 후 UTF-8) */
	int add_incoming_listener(std::function<void(const std::string& device, const std::string& data)> cb);
	void remove_incoming_listener(int id);

private:
	AdvertiseResult fail_(ErrorKind kind, const std::string& msg);
	AdvertiseResult abort_session_(ErrorKind kind, const std::string& msg);
	AdvertiseResult cancelled_();
	AdvertiseResult enter_active_(AdvertisingMode mode, const std::string& msg);

	BackendStatus invoke_native_(const AdvertisementSpec& spec);
	void undo_native_(const char* why);
	void trim_metrics_();
	void arm_fallback_();
	bool fallback_tick_();
	void on_health_failed_();
	void cancel_timers_();
	void notify_listeners_(bool active);
	void on_write_(const std::string& device, const bytes& value);

	EventLoop& loop_;
	Capability capability_;
	RadioStateMonitor& radio_;
	PermissionCoordinator& permissions_;
	NativeAdvertiser* advertiser_ = nullptr;
	HealthMonitor& health_;
	LogSink* log_ = nullptr;
	AdvertisingOptions opts_;
	SecurityLayer security_;

	AdvState state_{ AdvState::Idle };
	std::optional<AdvertisingSession> session_;
	std::map<std::string, AdvertisingMetrics> metrics_;
	uint64_t session_seq_{ 0 };

	// start/stop 직렬화. 첫 대기 지점 이전에 동기적으로 세팅
	bool starting_{ false };
	bool stopping_{ false };
	uint64_t generation_{ 0 }; ///< stop 이 진행 중인 start 를 무효화할 때 증가

	TimerId fallback_timer_{ 0 };
	TimerId auto_stop_timer_{ 0 };

	std::map<int, std::function<void(bool)>> adv_listeners_;
	std::map<int, std::function<void(const std::string&, const std::string&)>> incoming_listeners_;
	int next_listener_id_{ 1 };
};

} // namespace acp
