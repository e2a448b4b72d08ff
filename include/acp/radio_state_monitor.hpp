#pragma once
#include "acp/backends.hpp"
#include "acp/event_loop.hpp"
#include "acp/log_sink.hpp"
#include <functional>
#include <map>


namespace acp {

/**
* RadioStateMonitor
* - 라디오 전원 상태를 매번 어댑터에 새로 질의한다 (캐시 없음).
* - 전원 변화 알림을 구독자에게 전달.
*/
class RadioStateMonitor {
public:
	RadioStateMonitor(RadioAdapter& adapter, LogSink* log = nullptr);

	bool is_powered_on();

	/**
	* @brief 전원이 켜질 때까지 제한 횟수만큼 재확인
	* @return attempts 안에 켜지면 true
	*/
	bool wait_powered_on(EventLoop& loop, int attempts, Millis delay);

	int add_listener(std::function<void(bool)> cb);
	void remove_listener(int id);

	bool last_known() const { return last_known_; }

private:
	void on_power_(bool on);

	RadioAdapter& adapter_;
	LogSink* log_ = nullptr;
	bool last_known_{ false };
	std::map<int, std::function<void(bool)>> listeners_;
	int next_id_{ 1 };
};

} // namespace acp
