#include "acp/event_loop.hpp"


namespace acp {

bool EventLoop::wait_until(const std::function<bool()>& pred, Millis timeout) {
	if (pred()) return true;

	bool expired = false;
	TimerId t = add_timer(timeout, [&expired]() { expired = true; return false; });
	while (!pred() && !expired) iterate(true);
	if (!expired) cancel(t);
	return pred();
}


void EventLoop::sleep_for(Millis d) {
	bool done = false;
	add_timer(d, [&done]() { done = true; return false; });
	while (!done) iterate(true);
}


GlibEventLoop::GlibEventLoop(GMainContext* ctx) {
	ctx_ = ctx ? g_main_context_ref(ctx) : g_main_context_ref(g_main_context_default());
	main_loop_ = g_main_loop_new(ctx_, FALSE);
}


GlibEventLoop::~GlibEventLoop() {
	for (auto& kv : timers_) {
		g_source_destroy(kv.second);
		g_source_unref(kv.second);
	}
	timers_.clear();
	g_main_loop_unref(main_loop_);
	g_main_context_unref(ctx_);
}


TimePoint GlibEventLoop::now() const {
	return Clock::now();
}


int64_t GlibEventLoop::wall_ms() const {
	return epoch_ms();
}


TimerId GlibEventLoop::add_timer(Millis interval, std::function<bool()> fn) {
	TimerId id = next_id_++;
	auto* slot = new TimerSlot{ this, id, std::move(fn) };

	GSource* src = g_timeout_source_new((guint)interval.count());
	g_source_set_callback(src, &GlibEventLoop::on_timer_, slot, &GlibEventLoop::free_slot_);
	g_source_attach(src, ctx_);
	timers_[id] = src; // attach 후에도 우리 참조 1개 유지
	return id;
}


void GlibEventLoop::cancel(TimerId id) {
	auto it = timers_.find(id);
	if (it == timers_.end()) return;
	GSource* src = it->second;
	timers_.erase(it);
	g_source_destroy(src);
	g_source_unref(src);
}


bool GlibEventLoop::iterate(bool may_block) {
	return g_main_context_iteration(ctx_, may_block ? TRUE : FALSE);
}


void GlibEventLoop::run() {
	g_main_loop_run(main_loop_);
}


void GlibEventLoop::quit() {
	g_main_loop_quit(main_loop_);
}


gboolean GlibEventLoop::on_timer_(gpointer user) {
	auto* slot = static_cast<TimerSlot*>(user);
	// 콜백 안에서 자기 자신을 cancel 할 수 있으므로 필요한 값은 먼저 복사
	GlibEventLoop* loop = slot->loop;
	TimerId id = slot->id;
	auto fn = slot->fn;

	if (fn()) return G_SOURCE_CONTINUE;
	loop->forget_(id);
	return G_SOURCE_REMOVE;
}


void GlibEventLoop::free_slot_(gpointer user) {
	delete static_cast<TimerSlot*>(user);
}


void GlibEventLoop::forget_(TimerId id) {
	auto it = timers_.find(id);
	if (it == timers_.end()) return;
	g_source_unref(it->second);
	timers_.erase(it);
}

} // namespace acp
