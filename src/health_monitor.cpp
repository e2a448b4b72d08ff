#include "acp/health_monitor.hpp"
#include <iomanip>
#include <sstream>


namespace acp {

namespace { constexpr const char* TAG = "HEALTH"; }


double SessionHealth::average_signal() const {
	if (signal_samples.empty()) return 0.0;
	double sum = 0.0;
	for (int s : signal_samples) sum += s;
	return sum / (double)signal_samples.size();
}


HealthMonitor::HealthMonitor(EventLoop& loop, LogSink* log, Millis period, size_t max_history, size_t max_sessions)
	: loop_(loop), log_(log), period_(period), max_history_(max_history), max_sessions_(max_sessions) {}


HealthMonitor::~HealthMonitor() {
	stop_health_checks();
}


void HealthMonitor::start_monitoring(const std::string& session_id, const std::string& device_name,
	const std::string& mode) {
	SessionHealth h;
	h.session_id = session_id;
	h.device_name = device_name;
	h.mode = mode;
	h.start_ms = loop_.wall_ms();
	sessions_[session_id] = h;
	trim_sessions_();
	push_event_(session_id, "start", mode);
	if (log_) log_->debug(TAG, "monitoring " + session_id + " (" + mode + ")");
}


void HealthMonitor::stop_monitoring(const std::string& session_id) {
	SessionHealth* h = find_(session_id);
	if (!h || !h->active) return;
	h->active = false;
	h->end_ms = loop_.wall_ms();
	push_event_(session_id, "stop", std::to_string(h->end_ms - h->start_ms) + "ms");
	if (check_session_ == session_id) stop_health_checks();
}


void HealthMonitor::mark_success(const std::string& session_id) {
	if (SessionHealth* h = find_(session_id)) h->success = true;
}


void HealthMonitor::record_error(const std::string& session_id, ErrorKind kind, const std::string& message) {
	const std::string detail = std::string(to_code(kind)) + ": " + message;
	if (SessionHealth* h = find_(session_id)) {
		h->error_count++;
		h->errors.push_back(detail);
	}
	push_event_(session_id, "error", detail);
}


void HealthMonitor::record_restart(const std::string& session_id) {
	if (SessionHealth* h = find_(session_id)) h->restart_count++;
	push_event_(session_id, "restart", "");
}


void HealthMonitor::record_signal_sample(const std::string& session_id, int rssi) {
	if (SessionHealth* h = find_(session_id)) h->signal_samples.push_back(rssi);
}


void HealthMonitor::record_transmission(const std::string& session_id, size_t bytes_sent) {
	if (SessionHealth* h = find_(session_id)) {
		h->packets_sent++;
		h->bytes_transmitted += bytes_sent;
	}
}


void HealthMonitor::record_connection_attempt(const std::string& session_id, bool ok) {
	SessionHealth* h = find_(session_id);
	if (!h) return;
	h->connection_attempts++;
	if (ok) h->successful_connections++;
	else h->failed_connections++;
}


void HealthMonitor::start_health_checks(const std::string& session_id, std::function<bool()> invariant,
	std::function<void()> on_failed) {
	stop_health_checks();
	check_session_ = session_id;
	invariant_ = std::move(invariant);
	on_failed_ = std::move(on_failed);
	check_timer_ = loop_.add_timer(period_, [this]() { return run_check_(); });
}


void HealthMonitor::stop_health_checks() {
	if (check_timer_) loop_.cancel(check_timer_);
	check_timer_ = 0;
	check_session_.clear();
	invariant_ = nullptr;
	on_failed_ = nullptr;
}


bool HealthMonitor::run_check_() {
	if (!invariant_ || invariant_()) {
		push_event_(check_session_, "health_ok", "");
		return true;
	}

	record_error(check_session_, ErrorKind::RadioUnavailable, "health check failed");
	if (log_) log_->warn(TAG, "health check failed for " + check_session_);

	// on_failed 안에서 체크가 재시작/중지될 수 있음
	const TimerId before = check_timer_;
	auto cb = on_failed_;
	if (cb) cb();
	return check_timer_ == before && check_timer_ != 0;
}


const SessionHealth* HealthMonitor::session(const std::string& session_id) const {
	auto it = sessions_.find(session_id);
	return it == sessions_.end() ? nullptr : &it->second;
}


void HealthMonitor::trim_sessions_() {
	while (sessions_.size() > max_sessions_) {
		auto oldest = sessions_.end();
		for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
			if (it->second.active) continue;
			if (oldest == sessions_.end() || it->second.start_ms < oldest->second.start_ms) oldest = it;
		}
		if (oldest == sessions_.end()) break;
		sessions_.erase(oldest);
	}
}


OverallStatistics HealthMonitor::overall_statistics() const {
	OverallStatistics s;
	const int64_t now = loop_.wall_ms();
	double total_duration = 0.0, signal_sum = 0.0;
	size_t signal_sessions = 0, successful = 0;
	for (auto& kv : sessions_) {
		const SessionHealth& h = kv.second;
		if (!h.signal_samples.empty()) {
			signal_sum += h.average_signal();
			signal_sessions++;
		}
		if (h.mode == SCAN_SESSION_MODE) {
			s.scan_sessions++;
			continue;
		}
		s.total_sessions++;
		if (h.active) s.active_sessions++;
		if (h.success) successful++;
		s.total_errors += h.error_count;
		s.total_restarts += h.restart_count;
		s.total_bytes_transmitted += h.bytes_transmitted;
		total_duration += (double)h.duration_ms(now);
	}
	if (signal_sessions) s.average_signal_strength = signal_sum / (double)signal_sessions;
	if (s.total_sessions) {
		s.average_session_duration_ms = total_duration / (double)s.total_sessions;
		s.success_rate = 100.0 * (double)successful / (double)s.total_sessions;
	}
	return s;
}


std::string HealthMonitor::generate_report() const {
	const OverallStatistics s = overall_statistics();
	std::ostringstream os;
	os << std::fixed << std::setprecision(1);
	os << "AirChainPay BLE Advertising Report\n";
	os << "==================================\n";
	os << "Total Sessions: " << s.total_sessions << " (active " << s.active_sessions << ")\n";
	os << "Scan Sessions: " << s.scan_sessions << "\n";
	os << "Success Rate: " << s.success_rate << "%\n";
	os << "Average Session Duration: " << (s.average_session_duration_ms / 1000.0) << "s\n";
	os << "Average Signal Strength: " << s.average_signal_strength << " dBm\n";
	os << "Total Bytes Transmitted: " << s.total_bytes_transmitted << "\n";
	os << "Total Errors: " << s.total_errors << "\n";
	os << "Total Restarts: " << s.total_restarts << "\n";

	const int64_t now = loop_.wall_ms();
	if (!sessions_.empty()) {
		os << "\nSessions:\n";
		for (auto& kv : sessions_) {
			const SessionHealth& h = kv.second;
			os << "  - " << h.session_id << " [" << h.mode << "] "
				<< (h.active ? "active" : "ended")
				<< ", " << (h.duration_ms(now) / 1000.0) << "s"
				<< ", packets " << h.packets_sent
				<< ", errors " << h.error_count
				<< ", restarts " << h.restart_count << "\n";
		}
	}
	return os.str();
}


void HealthMonitor::clear() {
	stop_health_checks();
	sessions_.clear();
	events_.clear();
}


SessionHealth* HealthMonitor::find_(const std::string& session_id) {
	auto it = sessions_.find(session_id);
	return it == sessions_.end() ? nullptr : &it->second;
}


void HealthMonitor::push_event_(const std::string& session_id, const char* kind, const std::string& detail) {
	events_.push_back(HealthEvent{ loop_.wall_ms(), session_id, kind, detail });
	while (events_.size() > max_history_) events_.pop_front();
}

} // namespace acp
