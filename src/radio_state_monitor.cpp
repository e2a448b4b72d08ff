#include "acp/radio_state_monitor.hpp"
#include <vector>


namespace acp {

RadioStateMonitor::RadioStateMonitor(RadioAdapter& adapter, LogSink* log)
	: adapter_(adapter), log_(log) {
	adapter_.watch_power([this](bool on) { on_power_(on); });
}


bool RadioStateMonitor::is_powered_on() {
	last_known_ = adapter_.powered();
	return last_known_;
}


bool RadioStateMonitor::wait_powered_on(EventLoop& loop, int attempts, Millis delay) {
	for (int i = 1; i <= attempts; ++i) {
		if (is_powered_on()) return true;
		if (log_) log_->info("RADIO", "radio off, check " + std::to_string(i) + "/" + std::to_string(attempts));
		if (i < attempts) loop.sleep_for(delay);
	}
	return false;
}


int RadioStateMonitor::add_listener(std::function<void(bool)> cb) {
	int id = next_id_++;
	listeners_[id] = std::move(cb);
	return id;
}


void RadioStateMonitor::remove_listener(int id) {
	listeners_.erase(id);
}


void RadioStateMonitor::on_power_(bool on) {
	if (on != last_known_ && log_) log_->info("RADIO", on ? "powered on" : "powered off");
	last_known_ = on;

	// 콜백 중 remove_listener 가능
	std::vector<std::function<void(bool)>> cbs;
	for (auto& kv : listeners_) cbs.push_back(kv.second);
	for (auto& cb : cbs) cb(on);
}

} // namespace acp
