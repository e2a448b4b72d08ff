#include "acp/scan_controller.hpp"
#include "acp/security_layer.hpp"
#include "acp/wire_codec.hpp"


namespace acp {

namespace { constexpr const char* TAG = "SCAN"; }


ScanController::ScanController(EventLoop& loop, ScanBackend* backend, RadioStateMonitor& radio,
	HealthMonitor* health, LogSink* log, ScanOptions opts)
	: loop_(loop), backend_(backend), radio_(radio), health_(health), log_(log), opts_(std::move(opts)) {}


ScanController::~ScanController() {
	stop_scan();
}


BackendStatus ScanController::start_scan(FoundCallback on_found, Millis timeout) {
	if (!backend_) {
		return BackendStatus::failure(ErrorKind::BleNotAvailable, "no scan backend on this platform");
	}
	if (!radio_.is_powered_on()) {
		return BackendStatus::failure(ErrorKind::BleNotAvailable, "bluetooth radio is not powered on");
	}
	if (scanning_) stop_scan(); // 이전 스캔 세션 종료

	discovered_.clear();
	on_found_ = std::move(on_found);
	scanning_ = true;

	BackendStatus st = backend_->start([this](const Advertisement& adv) { on_advertisement_(adv); });
	if (!st.ok) {
		scanning_ = false;
		on_found_ = nullptr;
		if (log_) log_->error(TAG, "scan start failed: " + st.message);
		return BackendStatus::failure(ErrorKind::ScanError, st.message);
	}

	scan_session_ = "scan-" + std::to_string(loop_.wall_ms()) + "-" + std::to_string(++session_seq_);
	if (health_) health_->start_monitoring(scan_session_, opts_.name_prefix, SCAN_SESSION_MODE);

	if (timeout.count() > 0) {
		timeout_timer_ = loop_.add_timer(timeout, [this]() {
			timeout_timer_ = 0;
			if (log_) log_->info(TAG, "scan timeout reached");
			stop_scan();
			return false;
		});
	}
	if (log_) log_->info(TAG, "scanning for " + opts_.service_uuid);
	return BackendStatus::success();
}


void ScanController::stop_scan() {
	if (!scanning_) return;
	scanning_ = false;
	if (timeout_timer_) loop_.cancel(timeout_timer_);
	timeout_timer_ = 0;
	if (backend_) backend_->stop();
	on_found_ = nullptr;
	if (health_ && !scan_session_.empty()) health_->stop_monitoring(scan_session_);
	if (log_) log_->info(TAG, "scan stopped, " + std::to_string(discovered_.size()) + " device(s) found");
}


std::vector<ScanResult> ScanController::discovered_devices() const {
	std::vector<ScanResult> out;
	out.reserve(discovered_.size());
	for (auto& kv : discovered_) out.push_back(kv.second);
	return out;
}


void ScanController::clear_discovered_devices() {
	discovered_.clear();
}


bool ScanController::matches_filter_(const Advertisement& adv, const std::string& name,
	const std::string& service_id) const {
	bool uuid_ok = uuid_equals(service_id, opts_.service_uuid);
	for (auto& u : adv.service_uuids) {
		if (uuid_equals(u, opts_.service_uuid)) uuid_ok = true;
	}
	if (!uuid_ok) return false;
	return name.compare(0, opts_.name_prefix.size(), opts_.name_prefix) == 0;
}


void ScanController::on_advertisement_(const Advertisement& adv) {
	if (!scanning_) return;
	if (adv.address.empty() || discovered_.count(adv.address)) return;

	ParsedAdvert parsed = parse_advertisement(adv);
	if (!matches_filter_(adv, parsed.name, parsed.service_id)) return;

	ScanResult r;
	r.device.id = adv.address;
	r.device.name = parsed.name;
	r.device.path = adv.path;
	r.rssi = adv.rssi;
	r.discovered_at = loop_.wall_ms();
	r.encrypted = parsed.encrypted;
	r.auth_token = parsed.auth_token;
	r.payload = parsed.payload;
	r.payment_over_gatt = !r.payload && parsed.beacon && parsed.beacon->has_payment;

	if (r.payload && r.encrypted && !opts_.decrypt_key.empty()) {
		PaymentPayload plain;
		if (SecurityLayer::decrypt_fields(*r.payload, opts_.decrypt_key, plain)) {
			r.payload = plain;
			r.encrypted = false;
		}
		else if (log_) {
			log_->warn(TAG, "could not decrypt payload from " + adv.address);
		}
	}

	discovered_[adv.address] = r;
	if (health_) health_->record_signal_sample(scan_session_, adv.rssi);
	if (log_) {
		log_->info(TAG, "found " + r.device.name + " (" + adv.address + ") rssi=" + std::to_string(adv.rssi) +
			" payload=" + to_string(parsed.source));
	}

	if (on_found_) {
		auto cb = on_found_; // 콜백에서 stop_scan 가능
		try {
			cb(r);
		}
		catch (const std::exception& e) {
			if (log_) log_->error(TAG, std::string("device found callback threw: ") + e.what());
		}
	}
}

} // namespace acp
