#include "acp/advertising_controller.hpp"
#include "acp/wire_codec.hpp"
#include <memory>
#include <vector>


namespace acp {

namespace {

constexpr const char* TAG = "ADV";

// 스코프 종료 시 플래그 해제
struct FlagGuard {
	bool& f;
	explicit FlagGuard(bool& flag) : f(flag) { f = true; }
	~FlagGuard() { f = false; }
};

} // namespace


AdvertisingController::AdvertisingController(EventLoop& loop, Capability capability, RadioStateMonitor& radio,
	PermissionCoordinator& permissions, NativeAdvertiser* advertiser, HealthMonitor& health,
	LogSink* log, AdvertisingOptions opts)
	: loop_(loop), capability_(capability), radio_(radio), permissions_(permissions),
	advertiser_(advertiser), health_(health), log_(log), opts_(std::move(opts)), security_(loop, log) {
	if (advertiser_) {
		advertiser_->set_write_handler([this](const std::string& device, const bytes& value) {
			on_write_(device, value);
		});
	}
}


AdvertisingController::~AdvertisingController() {
	cancel_timers_();
	health_.stop_health_checks();
	if (advertiser_) advertiser_->set_write_handler(nullptr);
}


AdvertiseResult AdvertisingController::start_advertising(const PaymentPayload& payload,
	const std::optional<SecurityConfig>& security) {
	// 이미 Active 면 부작용 없이 성공
	if (state_ == AdvState::Active && session_) {
		AdvertiseResult r;
		r.success = true;
		r.session_id = session_->session_id;
		r.mode = session_->mode;
		r.message = "already advertising";
		return r;
	}
	if (starting_ || stopping_) {
		return fail_(ErrorKind::OperationInProgress, "advertising start/stop already in progress");
	}
	FlagGuard guard(starting_);
	const uint64_t gen = ++generation_;

	// 1. 검증 (라디오 부작용 없음)
	std::string why;
	if (!validate_payload(payload, &why)) return fail_(ErrorKind::InvalidPayload, why);
	if (!validate_advertising_config(opts_.advertisement, &why)) return fail_(ErrorKind::InvalidConfig, why);

	AdvertisementSpec spec;
	spec.local_name = payload.device_name;
	spec.service_uuid = opts_.advertisement.service_uuid;
	spec.manufacturer_id = ACP_MANUFACTURER_ID;
	spec.manufacturer_data.assign(BEACON_SIZE, 0);
	spec.tx_power = opts_.advertisement.tx_power;
	spec.interval_ms = opts_.advertisement.interval_ms;
	spec.connectable = opts_.advertisement.connectable;
	spec.include_device_name = opts_.advertisement.include_device_name;
	spec.include_tx_power = opts_.advertisement.include_tx_power;
	const ErrorKind layout = check_legacy_layout(spec, &why);
	if (layout != ErrorKind::None) return fail_(layout, why);

	// 세션 생성
	const int64_t now = loop_.wall_ms();
	AdvertisingSession s;
	s.session_id = payload.device_name + "-" + std::to_string(now) + "-" + std::to_string(++session_seq_);
	s.device_name = payload.device_name;
	s.payload = payload;
	s.state = AdvState::Starting;
	s.secure = security.has_value();
	s.started_at = now;
	session_ = s;
	state_ = AdvState::Starting;
	const std::string id = s.session_id;

	AdvertisingMetrics m;
	m.session_id = id;
	m.start_ms = now;
	metrics_[id] = m;
	trim_metrics_();
	health_.start_monitoring(id, payload.device_name, security ? "secure" : "standard");

	// 보안 처리 + 와이어 메시지
	PaymentPayload wire_payload = payload;
	if (security) {
		security_.open_session(id);
		auto res = security_.create_secure_payload(payload, *security, id);
		wire_payload = res.payload;
		session_->encrypted = res.encrypted;
		if (security->enable_authentication) {
			session_->auth_token = security_.generate_auth_token(payload.device_name, security->session_timeout, id);
		}
	}
	WireMessage msg = build_wire_message(wire_payload, now, session_->encrypted, session_->auth_token);

	// 광고에는 비콘, 전체 메시지는 특성 읽기로
	spec.manufacturer_data = encode_beacon(msg);
	spec.gatt_value = to_bytes(encode_wire(msg));
	session_->spec = spec;

	// 2. 플랫폼 능력: 네이티브 광고 불가면 바로 폴백
	if (capability_ != Capability::NativeAdvertiser || !advertiser_) {
		const AdvertisingMode mode = (capability_ == Capability::FallbackAdvertiser && advertiser_)
			? AdvertisingMode::Fallback : AdvertisingMode::Simulated;
		if (log_) log_->info(TAG, std::string("native advertiser unavailable (") + to_string(capability_) +
			"), using " + to_string(mode) + " loop");
		return enter_active_(mode, "advertising in fallback mode");
	}

	// 3. 권한 (필수 권한만 실패 사유)
	PermissionCheck chk = permissions_.check_permissions();
	if (gen != generation_) return cancelled_();
	if (!chk.granted) {
		PermissionRequestResult req = permissions_.request_permissions_enhanced();
		if (gen != generation_) return cancelled_();
		if (!req.success) {
			const ErrorKind kind = req.needs_settings_redirect
				? ErrorKind::PermissionPermanentlyDenied : ErrorKind::PermissionDenied;
			AdvertiseResult r = abort_session_(kind, req.needs_settings_redirect
				? "bluetooth permissions permanently denied, enable them in system settings"
				: "bluetooth permissions denied");
			r.needs_settings_redirect = req.needs_settings_redirect;
			return r;
		}
	}

	// 4. 라디오 전원
	const bool powered = radio_.wait_powered_on(loop_, opts_.radio_check_attempts, opts_.radio_check_delay);
	if (gen != generation_) return cancelled_();
	if (!powered) return abort_session_(ErrorKind::RadioUnavailable, "bluetooth radio is not powered on");

	// 5. 네이티브 광고 (시도마다 타임아웃 경쟁, 점증 백오프)
	for (int attempt = 1; attempt <= opts_.max_retries; ++attempt) {
		session_->retry_count = attempt;
		BackendStatus st = invoke_native_(spec);
		if (gen != generation_) {
			// stop 이후 늦게 성공한 등록은 되돌린다
			if (st.ok) undo_native_("late unregister failed: ");
			return cancelled_();
		}
		if (st.ok) {
			health_.record_transmission(id, spec.manufacturer_data.size());
			if (log_) log_->info(TAG, "native advertising started (attempt " + std::to_string(attempt) + ")");
			return enter_active_(AdvertisingMode::Native, "advertising started");
		}

		metrics_[id].error_count++;
		health_.record_error(id, st.error, st.message);
		if (log_) log_->warn(TAG, "attempt " + std::to_string(attempt) + "/" + std::to_string(opts_.max_retries) +
			" failed: " + to_code(st.error) + " " + st.message);

		if (attempt < opts_.max_retries) {
			loop_.sleep_for(opts_.backoff_base * attempt);
			if (gen != generation_) return cancelled_();
		}
	}

	// 6. 재시도 소진 → 폴백 루프가 주기적으로 다시 송출
	state_ = AdvState::Failed;
	session_->state = AdvState::Failed;
	health_.record_error(id, ErrorKind::RetryExhausted, "native advertising failed after retries");
	if (log_) log_->error(TAG, "native advertising exhausted " + std::to_string(opts_.max_retries) +
		" attempts, arming fallback");
	AdvertiseResult r = enter_active_(AdvertisingMode::Fallback, "native advertising failed, fallback active");
	r.error = ErrorKind::RetryExhausted;
	return r;
}


void AdvertisingController::stop_advertising() {
	if (stopping_) return;
	if (state_ == AdvState::Idle) return;
	if (!session_) {
		state_ = AdvState::Idle;
		return;
	}

	FlagGuard guard(stopping_);
	++generation_; // 진행 중인 start 무효화
	const bool was_active = (state_ == AdvState::Active);
	state_ = AdvState::Stopping;
	session_->state = AdvState::Stopping;

	cancel_timers_();
	health_.stop_health_checks();

	// 네이티브 정지는 best-effort (로그만, 예외 없음)
	if (advertiser_ && capability_ != Capability::Unavailable) {
		auto done = std::make_shared<std::optional<BackendStatus>>();
		advertiser_->stop_broadcast([done](const BackendStatus& s) { if (!*done) *done = s; });
		if (!loop_.wait_until([done]() { return done->has_value(); }, opts_.stop_timeout)) {
			if (log_) log_->warn(TAG, "native stop timed out");
		}
		else if (!(*done)->ok) {
			if (log_) log_->warn(TAG, "native stop failed: " + (*done)->message);
		}
	}

	const std::string id = session_->session_id;
	auto it = metrics_.find(id);
	if (it != metrics_.end()) {
		it->second.stop_ms = loop_.wall_ms();
		it->second.mode = session_->mode;
	}
	if (session_->secure) security_.close_session(id, session_->device_name);
	health_.stop_monitoring(id);

	session_.reset();
	state_ = AdvState::Idle;
	if (log_) log_->info(TAG, "advertising stopped (" + id + ")");
	if (was_active) notify_listeners_(false);
}


AdvertisingStatus AdvertisingController::status() const {
	AdvertisingStatus s;
	s.state = state_;
	s.capability = capability_;
	if (session_) {
		s.session_id = session_->session_id;
		s.mode = session_->mode;
		s.retry_count = session_->retry_count;
		s.secure = session_->secure;
	}
	return s;
}


BasicStatistics AdvertisingController::statistics() const {
	BasicStatistics s;
	s.total_sessions = metrics_.size();
	double total_duration = 0.0;
	size_t ended = 0;
	for (auto& kv : metrics_) {
		const AdvertisingMetrics& m = kv.second;
		if (m.success) s.successful_sessions++;
		else if (m.stop_ms) s.failed_sessions++;
		s.total_errors += m.error_count;
		s.total_restarts += m.restart_count;
		if (m.stop_ms) {
			total_duration += (double)(m.stop_ms - m.start_ms);
			ended++;
		}
	}
	if (ended) s.average_duration_ms = total_duration / (double)ended;
	return s;
}


int AdvertisingController::add_advertising_listener(std::function<void(bool)> cb) {
	int id = next_listener_id_++;
	adv_listeners_[id] = std::move(cb);
	return id;
}


void AdvertisingController::remove_advertising_listener(int id) {
	adv_listeners_.erase(id);
}


int AdvertisingController::add_incoming_listener(
	std::function<void(const std::string& device, const std::string& data)> cb) {
	int id = next_listener_id_++;
	incoming_listeners_[id] = std::move(cb);
	return id;
}


void AdvertisingController::remove_incoming_listener(int id) {
	incoming_listeners_.erase(id);
}


AdvertiseResult AdvertisingController::fail_(ErrorKind kind, const std::string& msg) {
	if (log_) log_->warn(TAG, std::string(to_code(kind)) + ": " + msg);
	AdvertiseResult r;
	r.success = false;
	r.error = kind;
	r.message = msg;
	return r;
}


AdvertiseResult AdvertisingController::abort_session_(ErrorKind kind, const std::string& msg) {
	if (session_) {
		const std::string id = session_->session_id;
		auto it = metrics_.find(id);
		if (it != metrics_.end()) {
			it->second.error_count++;
			it->second.stop_ms = loop_.wall_ms();
		}
		health_.record_error(id, kind, msg);
		health_.stop_monitoring(id);
		if (session_->secure) security_.close_session(id, session_->device_name);
		session_.reset();
	}
	state_ = AdvState::Failed;
	return fail_(kind, msg);
}


AdvertiseResult AdvertisingController::cancelled_() {
	// stop 이 이미 세션을 정리했다
	return fail_(ErrorKind::Cancelled, "advertising start cancelled by stop");
}


AdvertiseResult AdvertisingController::enter_active_(AdvertisingMode mode, const std::string& msg) {
	const std::string id = session_->session_id;
	state_ = AdvState::Active;
	session_->state = AdvState::Active;
	session_->mode = mode;
	metrics_[id].success = true;
	metrics_[id].mode = mode;
	health_.mark_success(id);

	if (mode != AdvertisingMode::Native) arm_fallback_();

	auto_stop_timer_ = loop_.add_timer(opts_.auto_stop, [this]() {
		auto_stop_timer_ = 0;
		if (log_) log_->info(TAG, "auto-stop timeout reached");
		stop_advertising();
		return false;
	});

	health_.start_health_checks(id,
		[this]() { return state_ == AdvState::Active && radio_.is_powered_on(); },
		[this]() { on_health_failed_(); });

	notify_listeners_(true);

	AdvertiseResult r;
	r.success = true;
	r.session_id = id;
	r.mode = mode;
	r.message = msg;
	return r;
}


BackendStatus AdvertisingController::invoke_native_(const AdvertisementSpec& spec) {
	// 콜백이 타임아웃 이후에 와도 안전하도록 공유 상태 사용
	auto done = std::make_shared<std::optional<BackendStatus>>();
	advertiser_->broadcast(spec, [done](const BackendStatus& s) { if (!*done) *done = s; });
	if (!loop_.wait_until([done]() { return done->has_value(); }, opts_.attempt_timeout)) {
		// 뒤늦게 등록될 수 있으므로 해제 요청
		undo_native_("unregister after timeout failed: ");
		return BackendStatus::failure(ErrorKind::OperationTimeout, "native broadcast did not complete in time");
	}
	return **done;
}


void AdvertisingController::undo_native_(const char* why) {
	LogSink* log = log_;
	const std::string prefix = why;
	advertiser_->stop_broadcast([log, prefix](const BackendStatus& s) {
		if (!s.ok && log) log->warn(TAG, prefix + s.message);
	});
}


void AdvertisingController::trim_metrics_() {
	// 종료된 세션부터 오래된 순으로 버린다
	while (metrics_.size() > opts_.max_history) {
		auto oldest = metrics_.end();
		for (auto it = metrics_.begin(); it != metrics_.end(); ++it) {
			if (!it->second.stop_ms) continue;
			if (oldest == metrics_.end() || it->second.start_ms < oldest->second.start_ms) oldest = it;
		}
		if (oldest == metrics_.end()) break;
		metrics_.erase(oldest);
	}
}


void AdvertisingController::arm_fallback_() {
	if (fallback_timer_) loop_.cancel(fallback_timer_);
	fallback_timer_ = loop_.add_timer(opts_.fallback_period, [this]() { return fallback_tick_(); });
}


bool AdvertisingController::fallback_tick_() {
	if (state_ != AdvState::Active || !session_) {
		fallback_timer_ = 0;
		return false;
	}

	const std::string& id = session_->session_id;
	if (session_->mode == AdvertisingMode::Fallback && advertiser_) {
		// 폴백 재송출은 결과를 기다리지 않는다
		LogSink* log = log_;
		advertiser_->broadcast(session_->spec, [log](const BackendStatus& s) {
			if (!s.ok && log) log->debug(TAG, "fallback broadcast failed: " + s.message);
		});
		health_.record_transmission(id, session_->spec.manufacturer_data.size());
	}
	else {
		if (log_) log_->debug(TAG, "simulated broadcast tick " + id);
		health_.record_transmission(id, 0);
	}
	return true;
}


void AdvertisingController::on_health_failed_() {
	if (!session_) return;
	const std::string id = session_->session_id;
	metrics_[id].restart_count++;
	health_.record_restart(id);

	if (session_->mode == AdvertisingMode::Native) {
		session_->mode = (capability_ == Capability::FallbackAdvertiser && advertiser_)
			? AdvertisingMode::Fallback : AdvertisingMode::Simulated;
	}
	if (log_) log_->warn(TAG, std::string("re-arming ") + to_string(session_->mode) + " loop for " + id);
	arm_fallback_();
}


void AdvertisingController::cancel_timers_() {
	if (fallback_timer_) loop_.cancel(fallback_timer_);
	if (auto_stop_timer_) loop_.cancel(auto_stop_timer_);
	fallback_timer_ = 0;
	auto_stop_timer_ = 0;
}


void AdvertisingController::notify_listeners_(bool active) {
	std::vector<std::function<void(bool)>> cbs;
	for (auto& kv : adv_listeners_) cbs.push_back(kv.second);
	for (auto& cb : cbs) {
		try {
			cb(active);
		}
		catch (const std::exception& e) {
			if (log_) log_->error(TAG, std::string("advertising listener threw: ") + e.what());
		}
	}
}


void AdvertisingController::on_write_(const std::string& device, const bytes& value) {
	std::string text = to_string(value);
	bytes decoded;
	if (base64_decode(text, decoded)) text = to_string(decoded);

	if (log_) log_->info(TAG, "incoming write from " + device + " (" + std::to_string(value.size()) + " bytes)");
	if (session_) health_.record_connection_attempt(session_->session_id, true);

	std::vector<std::function<void(const std::string&, const std::string&)>> cbs;
	for (auto& kv : incoming_listeners_) cbs.push_back(kv.second);
	for (auto& cb : cbs) {
		try {
			cb(device, text);
		}
		catch (const std::exception& e) {
			if (log_) log_->error(TAG, std::string("incoming data listener threw: ") + e.what());
		}
	}
}

} // namespace acp
