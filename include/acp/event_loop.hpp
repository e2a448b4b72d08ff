#pragma once
#include "acp/common.hpp"
#include <functional>
#include <map>
#include <glib.h>


namespace acp {

using TimerId = unsigned;


/**
* EventLoop
* - 단일 스레드 협력 스케줄링. 모든 콜백(타이머, D-Bus, HCI fd)은 iterate() 안에서 실행된다.
* - 블로킹처럼 보이는 호출(sleep_for, wait_until)은 내부에서 루프를 돌린다.
*   그 동안 다른 콜백이 재진입할 수 있으므로 호출자는 재개 후 상태를 다시 확인해야 한다.
*/
class EventLoop {
public:
	virtual ~EventLoop() = default;

	virtual TimePoint now() const = 0;
	virtual int64_t wall_ms() const = 0; ///< epoch ms (타임스탬프, 토큰 만료)

	/**
	* @brief 타이머 등록
	* @param fn true 를 반환하면 같은 주기로 반복, false 면 해제
	*/
	virtual TimerId add_timer(Millis interval, std::function<bool()> fn) = 0;
	virtual void cancel(TimerId id) = 0;

	/** @brief 이벤트 1회 처리. 처리한 것이 있으면 true */
	virtual bool iterate(bool may_block) = 0;

	/** @brief pred 가 참이 되거나 timeout 이 지날 때까지 루프를 돌린다 */
	bool wait_until(const std::function<bool()>& pred, Millis timeout);

	/** @brief d 동안 루프를 돌린다 */
	void sleep_for(Millis d);
};


/** GMainContext 기반 구현 (기본 컨텍스트 = GDBus 콜백이 도는 곳) */
class GlibEventLoop : public EventLoop {
public:
	explicit GlibEventLoop(GMainContext* ctx = nullptr);
	~GlibEventLoop() override;

	GlibEventLoop(const GlibEventLoop&) = delete;
	GlibEventLoop& operator=(const GlibEventLoop&) = delete;

	TimePoint now() const override;
	int64_t wall_ms() const override;
	TimerId add_timer(Millis interval, std::function<bool()> fn) override;
	void cancel(TimerId id) override;
	bool iterate(bool may_block) override;

	/** @brief quit() 가 불릴 때까지 실행 (데몬 메인 루프) */
	void run();
	void quit();

	GMainContext* context() const { return ctx_; }

private:
	struct TimerSlot {
		GlibEventLoop* loop;
		TimerId id;
		std::function<bool()> fn;
	};

	static gboolean on_timer_(gpointer user);
	static void free_slot_(gpointer user);
	void forget_(TimerId id);

	GMainContext* ctx_{ nullptr };
	GMainLoop* main_loop_{ nullptr };
	std::map<TimerId, GSource*> timers_;
	TimerId next_id_{ 1 };
};

} // namespace acp
