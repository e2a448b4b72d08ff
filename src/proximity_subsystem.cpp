#include "acp/proximity_subsystem.hpp"
#include "acp/security_layer.hpp"
#include <glib.h>
#include <sstream>


namespace acp {

bool ProximitySubsystem::s_alive_ = false;


ProximitySubsystem::ProximitySubsystem(EventLoop& loop, const SubsystemBackends& backends,
	const ProximityConfig& cfg, LogSink& log)
	: loop_(loop), log_(log), cfg_(cfg), backends_(backends) {
	if (s_alive_) {
		throw BluetoothError(ErrorKind::AlreadyInstantiated, "proximity subsystem already exists in this process");
	}
	if (!backends_.adapter || !backends_.permissions) {
		throw BluetoothError(ErrorKind::PlatformUnsupported, "radio adapter and permission backends are required");
	}

	device_name_ = cfg_.device_name;
	if (device_name_.empty()) {
		device_name_ = std::string(ACP_DEVICE_PREFIX) + "-" + std::to_string(g_random_int_range(0, 10000));
	}

	// 능력 판별은 여기서 1회
	capability_ = backends_.adapter->resolve_capability();
	log_.info("RADIO", std::string("capability: ") + to_string(capability_) + " (" + backends_.adapter->describe() + ")");

	radio_ = std::make_unique<RadioStateMonitor>(*backends_.adapter, &log_);
	permissions_ = std::make_unique<PermissionCoordinator>(*backends_.permissions, loop_, &log_, cfg_.permission_timeout);
	health_ = std::make_unique<HealthMonitor>(loop_, &log_, cfg_.health_period, cfg_.max_event_history);
	advertising_ = std::make_unique<AdvertisingController>(loop_, capability_, *radio_, *permissions_,
		backends_.advertiser, *health_, &log_, cfg_.advertising);
	scanning_ = std::make_unique<ScanController>(loop_, backends_.scanner, *radio_, health_.get(), &log_, cfg_.scan);
	connections_ = std::make_unique<ConnectionManager>(loop_, backends_.central, *radio_, &log_, cfg_.connection);

	s_alive_ = true;
	log_.info("APP", "proximity subsystem ready as " + device_name_);
}


ProximitySubsystem::~ProximitySubsystem() {
	shutdown();
	s_alive_ = false;
}


AdvertiseResult ProximitySubsystem::start_advertising(const PaymentPayload& payload,
	const std::optional<SecurityConfig>& security) {
	PaymentPayload p = payload;
	if (p.device_name.empty()) p.device_name = device_name_;
	if (p.timestamp == 0) p.timestamp = loop_.wall_ms();
	return advertising_->start_advertising(p, security);
}


void ProximitySubsystem::stop_advertising() {
	advertising_->stop_advertising();
}


BackendStatus ProximitySubsystem::start_scan(FoundCallback on_found, std::optional<Millis> timeout) {
	return scanning_->start_scan(std::move(on_found), timeout.value_or(cfg_.scan_timeout));
}


void ProximitySubsystem::stop_scan() {
	scanning_->stop_scan();
}


ConnectionState ProximitySubsystem::connect_to_device(const DeviceHandle& device) {
	return connections_->connect(device);
}


void ProximitySubsystem::disconnect_from_device(const std::string& device_id) {
	connections_->disconnect(device_id);
}


void ProximitySubsystem::send_data_to_device(const std::string& device_id, const std::string& data,
	const std::string& service_uuid, const std::string& characteristic_uuid) {
	connections_->send_data(device_id, data, service_uuid, characteristic_uuid);
}


DataSubscription ProximitySubsystem::listen_for_data(const std::string& device_id,
	std::function<void(const std::string&)> on_data, const std::string& service_uuid,
	const std::string& characteristic_uuid) {
	return connections_->listen_for_data(device_id, std::move(on_data), service_uuid, characteristic_uuid);
}


WireMessage ProximitySubsystem::read_payment_from_device(const std::string& device_id) {
	WireMessage m = connections_->read_payment(device_id);
	if (m.payment && m.encrypted && !cfg_.scan.decrypt_key.empty()) {
		PaymentPayload plain;
		if (SecurityLayer::decrypt_fields(*m.payment, cfg_.scan.decrypt_key, plain)) {
			m.payment = plain;
			m.encrypted = false;
		}
		else {
			log_.warn("APP", "could not decrypt payment read from " + device_id);
		}
	}
	return m;
}


AdvertisingStatistics ProximitySubsystem::get_advertising_statistics() const {
	AdvertisingStatistics s;
	s.basic = advertising_->statistics();
	s.security = advertising_->security().statistics();
	s.monitoring = health_->overall_statistics();
	return s;
}


AdvertisingSupport ProximitySubsystem::check_advertising_support() {
	AdvertisingSupport r;
	const bool powered = radio_->is_powered_on();

	r.details["platform"] = "linux-bluez";
	r.details["adapter"] = backends_.adapter->describe();
	r.details["capability"] = to_string(capability_);
	r.details["powered"] = powered ? "true" : "false";
	r.details["scanner"] = backends_.scanner ? "available" : "missing";
	r.details["central"] = backends_.central ? "available" : "missing";

	if (capability_ == Capability::Unavailable) r.missing_requirements.push_back("LE advertising support");
	if (capability_ == Capability::NativeAdvertiser && !backends_.advertiser)
		r.missing_requirements.push_back("native advertiser backend");
	if (!powered) r.missing_requirements.push_back("bluetooth radio powered on");

	PermissionCheck perms = permissions_->check_permissions();
	for (auto& kv : perms.details) r.details["permission " + kv.first] = kv.second;
	if (!perms.granted) {
		for (auto& m : perms.missing) r.missing_requirements.push_back("permission " + m);
	}

	r.supported = r.missing_requirements.empty();
	return r;
}


PermissionCheck ProximitySubsystem::check_permissions() {
	return permissions_->check_permissions();
}


PermissionRequestResult ProximitySubsystem::request_permissions() {
	return permissions_->request_permissions_enhanced();
}


std::string ProximitySubsystem::get_advertising_report() const {
	const AdvertisingStatistics s = get_advertising_statistics();
	std::ostringstream os;
	os << health_->generate_report();
	os << "\nAdvertising:\n";
	os << "  Sessions: " << s.basic.total_sessions << " (ok " << s.basic.successful_sessions
		<< ", failed " << s.basic.failed_sessions << ")\n";
	os << "  Capability: " << to_string(capability_) << ", state " << to_string(advertising_->state()) << "\n";
	os << "\nSecurity:\n";
	os << "  Sessions: " << s.security.total_sessions << "\n";
	os << "  Encryption Success Rate: " << s.security.encryption_success_rate << "%\n";
	os << "  Authentication Success Rate: " << s.security.authentication_success_rate << "%\n";
	return os.str();
}


Diagnostics ProximitySubsystem::run_diagnostics() {
	Diagnostics d;
	AdvertisingSupport support = check_advertising_support();
	d.supported = support.supported;

	if (capability_ == Capability::Unavailable) {
		d.issues.push_back("adapter does not expose LE advertising");
		d.recommendations.push_back("check that bluetoothd is running and the controller supports LE");
	}
	else if (capability_ == Capability::FallbackAdvertiser) {
		d.issues.push_back("LE advertising manager has no free instances or no peripheral role");
		d.recommendations.push_back("release other advertisements or enable experimental features in bluetoothd");
	}
	if (support.details["powered"] != "true") {
		d.issues.push_back("bluetooth radio is powered off");
		d.recommendations.push_back("power the adapter on (bluetoothctl power on)");
	}

	PermissionCheck perms = permissions_->check_permissions();
	for (auto& m : perms.missing) {
		d.issues.push_back("permission missing: " + m);
		if (perms.details[m] == "never_ask_again") {
			d.recommendations.push_back("grant " + m + " to the daemon (setcap / D-Bus policy)");
		}
		else {
			d.recommendations.push_back("request " + m + " again");
		}
	}

	const OverallStatistics mon = health_->overall_statistics();
	if (mon.total_sessions && mon.success_rate < 50.0) {
		d.issues.push_back("low advertising success rate");
		d.recommendations.push_back("inspect the advertising report for repeated native failures");
	}
	return d;
}


void ProximitySubsystem::shutdown() {
	advertising_->stop_advertising();
	scanning_->stop_scan();
	connections_->disconnect_all();
}

} // namespace acp
