#pragma once
#include "acp/errors.hpp"
#include "acp/event_loop.hpp"
#include "acp/log_sink.hpp"
#include "config/acp_config.h"
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>


namespace acp {

// 스캔 세션 모드. 성공률/평균 시간에서 빠지고 신호 샘플에만 쓰인다
constexpr const char* SCAN_SESSION_MODE = "scan";

// 세션별 사용 통계
struct SessionHealth {
	std::string session_id;
	std::string device_name;
	std::string mode; ///< "standard" | "secure" | "scan" ...
	int64_t start_ms{ 0 };
	int64_t end_ms{ 0 };
	bool active{ true };
	bool success{ false }; ///< Active 상태에 도달했는지
	uint32_t error_count{ 0 };
	uint32_t restart_count{ 0 };
	uint32_t packets_sent{ 0 };
	uint64_t bytes_transmitted{ 0 };
	std::vector<int> signal_samples;
	uint32_t connection_attempts{ 0 };
	uint32_t successful_connections{ 0 };
	uint32_t failed_connections{ 0 };
	std::vector<std::string> errors;

	int64_t duration_ms(int64_t now_ms) const { return (active ? now_ms : end_ms) - start_ms; }
	double average_signal() const;
};


struct HealthEvent {
	int64_t at{ 0 };
	std::string session_id;
	std::string kind; ///< "start" | "stop" | "error" | "restart" | "health_fail" ...
	std::string detail;
};


struct OverallStatistics {
	size_t total_sessions{ 0 };  ///< 광고 세션
	size_t active_sessions{ 0 };
	size_t scan_sessions{ 0 };
	uint32_t total_errors{ 0 };
	uint32_t total_restarts{ 0 };
	double average_session_duration_ms{ 0.0 };
	double average_signal_strength{ 0.0 }; ///< 샘플이 있는 세션만
	uint64_t total_bytes_transmitted{ 0 };
	double success_rate{ 0.0 };            ///< %, 광고 세션 기준
};


/**
* HealthMonitor
* - 세션 시작/종료, 오류, 재시작, 신호 샘플을 기록.
* - 주기 헬스 체크는 **로컬 불변식**(세션 Active + 라디오 켜짐)만 확인한다.
*   실제 전파 송출 여부는 검증하지 않는다.
*/
class HealthMonitor {
public:
	HealthMonitor(EventLoop& loop, LogSink* log = nullptr,
		Millis period = Millis(ACP_HEALTH_CHECK_PERIOD_MS), size_t max_history = ACP_MAX_EVENT_HISTORY,
		size_t max_sessions = ACP_MAX_SESSION_HISTORY);
	~HealthMonitor();

	HealthMonitor(const HealthMonitor&) = delete;
	HealthMonitor& operator=(const HealthMonitor&) = delete;

	void start_monitoring(const std::string& session_id, const std::string& device_name, const std::string& mode);
	void stop_monitoring(const std::string& session_id);
	void mark_success(const std::string& session_id);

	void record_error(const std::string& session_id, ErrorKind kind, const std::string& message);
	void record_restart(const std::string& session_id);
	void record_signal_sample(const std::string& session_id, int rssi);
	void record_transmission(const std::string& session_id, size_t bytes_sent);
	void record_connection_attempt(const std::string& session_id, bool ok);

	/**
	* @brief 주기 헬스 체크 시작 (기존 체크는 교체)
	* @param invariant 로컬 불변식. false 면 오류 기록 후 on_failed 호출
	*/
	void start_health_checks(const std::string& session_id, std::function<bool()> invariant,
		std::function<void()> on_failed);
	void stop_health_checks();
	bool health_checks_running() const { return check_timer_ != 0; }

	const SessionHealth* session(const std::string& session_id) const;
	const std::deque<HealthEvent>& events() const { return events_; }

	OverallStatistics overall_statistics() const;
	std::string generate_report() const;
	void clear();

private:
	SessionHealth* find_(const std::string& session_id);
	void push_event_(const std::string& session_id, const char* kind, const std::string& detail);
	bool run_check_();
	void trim_sessions_();

	EventLoop& loop_;
	LogSink* log_ = nullptr;
	Millis period_;
	size_t max_history_;
	size_t max_sessions_; ///< 넘으면 종료된 세션부터 오래된 순으로 버린다

	std::map<std::string, SessionHealth> sessions_;
	std::deque<HealthEvent> events_;

	TimerId check_timer_{ 0 };
	std::string check_session_;
	std::function<bool()> invariant_;
	std::function<void()> on_failed_;
};

} // namespace acp
