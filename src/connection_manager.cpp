#include "acp/connection_manager.hpp"
#include <glib.h>
#include <memory>
#include <optional>


namespace acp {

namespace { constexpr const char* TAG = "CONN"; }


ConnectionManager::ConnectionManager(EventLoop& loop, CentralBackend* central, RadioStateMonitor& radio,
	LogSink* log, ConnectOptions opts, std::function<int(int)> jitter)
	: loop_(loop), central_(central), radio_(radio), log_(log), opts_(std::move(opts)), jitter_(std::move(jitter)) {
	if (!jitter_) {
		jitter_ = [](int n) { return n > 0 ? (int)g_random_int_range(0, n) : 0; };
	}
}


ConnectionManager::~ConnectionManager() {
	// 백엔드 구독만 정리 (연결 해제는 disconnect_all 에서 명시적으로)
	if (central_) {
		for (auto& kv : subs_) central_->unsubscribe(kv.second.handle);
	}
	subs_.clear();
}


void ConnectionManager::ensure_available_() {
	if (!central_) throw BluetoothError(ErrorKind::BleNotAvailable, "no BLE central backend on this platform");
	if (!radio_.is_powered_on()) throw BluetoothError(ErrorKind::BleNotAvailable, "bluetooth radio is not powered on");
}


BackendStatus ConnectionManager::await_status_(const std::function<void(StatusCallback)>& call) {
	auto done = std::make_shared<std::optional<BackendStatus>>();
	call([done](const BackendStatus& s) { if (!*done) *done = s; });
	if (!loop_.wait_until([done]() { return done->has_value(); }, opts_.timeout)) {
		return BackendStatus::failure(ErrorKind::OperationTimeout, "operation timed out");
	}
	return **done;
}


ConnectionState ConnectionManager::connect(const DeviceHandle& device) {
	ensure_available_();

	auto it = devices_.find(device.id);
	if (it != devices_.end() && it->second.status == ConnectionStatus::Connected) return it->second;

	std::string last_error;
	for (int attempt = 1; attempt <= opts_.max_retries; ++attempt) {
		set_status_(device, ConnectionStatus::Connecting);
		if (log_) log_->info(TAG, "connecting to " + device.id + " (attempt " + std::to_string(attempt) + "/" +
			std::to_string(opts_.max_retries) + ")");

		BackendStatus st = await_status_([&](StatusCallback cb) { central_->connect(device, std::move(cb)); });
		if (st.ok) {
			// 서비스 탐색
			auto found = std::make_shared<std::optional<std::pair<BackendStatus, std::vector<GattService>>>>();
			central_->discover_services(device, [found](const BackendStatus& s, const std::vector<GattService>& svcs) {
				if (!*found) *found = std::make_pair(s, svcs);
			});
			if (!loop_.wait_until([found]() { return found->has_value(); }, opts_.timeout)) {
				st = BackendStatus::failure(ErrorKind::OperationTimeout, "service discovery timed out");
			}
			else if (!(*found)->first.ok) {
				st = (*found)->first;
			}
			else {
				ConnectionState& cs = devices_[device.id];
				cs.device = device;
				cs.services = (*found)->second;
				cs.status = ConnectionStatus::Connected;
				const ConnectionState snapshot = cs;
				if (log_) log_->info(TAG, "connected to " + device.id + ", " + std::to_string(cs.services.size()) +
					" service(s)");
				notify_(device.id, ConnectionStatus::Connected);
				return snapshot;
			}
			// 탐색 실패 시 물리 연결은 정리
			central_->disconnect(device, [](const BackendStatus&) {});
		}

		last_error = st.message;
		if (log_) log_->warn(TAG, "connect attempt " + std::to_string(attempt) + " failed: " + st.message);

		if (attempt < opts_.max_retries) {
			const auto delay = opts_.base_delay * (1 << (attempt - 1)) + Millis(jitter_(opts_.jitter_ms));
			loop_.sleep_for(delay);
		}
	}

	set_status_(device, ConnectionStatus::Error);
	notify_(device.id, ConnectionStatus::Error);
	devices_.erase(device.id);
	throw BluetoothError(ErrorKind::ConnectionFailed, "failed to connect to " + device.id + " after " +
		std::to_string(opts_.max_retries) + " attempts: " + last_error);
}


void ConnectionManager::disconnect(const std::string& device_id) {
	auto it = devices_.find(device_id);
	if (it == devices_.end()) return;

	drop_subscriptions_for_(device_id);
	const DeviceHandle dev = it->second.device;
	if (central_) {
		BackendStatus st = await_status_([&](StatusCallback cb) { central_->disconnect(dev, std::move(cb)); });
		if (!st.ok && log_) log_->warn(TAG, "disconnect " + device_id + " failed: " + st.message);
	}

	devices_.erase(device_id);
	if (log_) log_->info(TAG, "disconnected " + device_id);
	notify_(device_id, ConnectionStatus::Disconnected);
}


void ConnectionManager::disconnect_all() {
	std::vector<std::string> ids;
	for (auto& kv : devices_) ids.push_back(kv.first);
	for (auto& id : ids) disconnect(id);
}


const GattCharacteristic& ConnectionManager::find_characteristic_(const std::string& device_id,
	const std::string& service_uuid, const std::string& characteristic_uuid) const {
	auto it = devices_.find(device_id);
	if (it == devices_.end() || it->second.status != ConnectionStatus::Connected) {
		throw BluetoothError(ErrorKind::DeviceNotConnected, "device " + device_id + " is not connected");
	}

	const std::string svc_uuid = service_uuid.empty() ? opts_.service_uuid : service_uuid;
	const std::string chr_uuid = characteristic_uuid.empty() ? opts_.characteristic_uuid : characteristic_uuid;

	for (auto& svc : it->second.services) {
		if (!uuid_equals(svc.uuid, svc_uuid)) continue;
		for (auto& ch : svc.characteristics) {
			if (uuid_equals(ch.uuid, chr_uuid)) return ch;
		}
		throw BluetoothError(ErrorKind::CharacteristicNotFound, "characteristic " + chr_uuid + " not found");
	}
	throw BluetoothError(ErrorKind::ServiceNotFound, "service " + svc_uuid + " not found");
}


void ConnectionManager::send_data(const std::string& device_id, const std::string& data,
	const std::string& service_uuid, const std::string& characteristic_uuid) {
	ensure_available_();
	const GattCharacteristic ch = find_characteristic_(device_id, service_uuid, characteristic_uuid);

	const bytes value = to_bytes(base64_encode(data));
	BackendStatus st = await_status_([&](StatusCallback cb) { central_->write(ch, value, std::move(cb)); });
	if (!st.ok) {
		throw BluetoothError(st.error == ErrorKind::OperationTimeout ? ErrorKind::OperationTimeout : ErrorKind::SendFailed,
			"write to " + device_id + " failed: " + st.message);
	}
	if (log_) log_->debug(TAG, "sent " + std::to_string(data.size()) + " bytes to " + device_id);
}


DataSubscription ConnectionManager::listen_for_data(const std::string& device_id,
	std::function<void(const std::string&)> on_data, const std::string& service_uuid,
	const std::string& characteristic_uuid) {
	ensure_available_();
	const GattCharacteristic ch = find_characteristic_(device_id, service_uuid, characteristic_uuid);

	// 타임아웃 이후 도착한 구독은 버린다
	struct Pending {
		std::optional<std::pair<BackendStatus, unsigned>> result;
		bool abandoned{ false };
	};
	auto pending = std::make_shared<Pending>();

	LogSink* log = log_;
	auto on_value = [on_data, log, device_id, pending](const bytes& value) {
		if (pending->abandoned) return;
		bytes decoded;
		if (!base64_decode(to_string(value), decoded)) {
			if (log) log->warn(TAG, "dropping malformed notification from " + device_id);
			return;
		}
		try {
			on_data(to_string(decoded));
		}
		catch (const std::exception& e) {
			if (log) log->error(TAG, std::string("data listener threw: ") + e.what());
		}
	};

	CentralBackend* central = central_;
	central_->subscribe(ch, on_value, [pending, central, log, device_id](const BackendStatus& s, unsigned handle) {
		if (pending->abandoned) {
			if (s.ok) {
				central->unsubscribe(handle);
				if (log) log->warn(TAG, "late subscription to " + device_id + " released");
			}
			return;
		}
		if (!pending->result) pending->result = std::make_pair(s, handle);
	});
	if (!loop_.wait_until([pending]() { return pending->result.has_value(); }, opts_.timeout)) {
		pending->abandoned = true;
		throw BluetoothError(ErrorKind::OperationTimeout, "subscribe to " + device_id + " timed out");
	}
	if (!pending->result->first.ok) {
		throw BluetoothError(ErrorKind::ListenerFailed, "subscribe to " + device_id + " failed: " +
			pending->result->first.message);
	}

	const unsigned key = next_sub_++;
	subs_[key] = Subscription{ device_id, pending->result->second };
	if (log_) log_->debug(TAG, "listening for data from " + device_id);

	std::weak_ptr<bool> alive = alive_;
	return DataSubscription([this, key, alive]() {
		if (alive.expired()) return;
		drop_subscription_(key);
	});
}


WireMessage ConnectionManager::read_payment(const std::string& device_id,
	const std::string& service_uuid, const std::string& characteristic_uuid) {
	ensure_available_();
	const GattCharacteristic ch = find_characteristic_(device_id, service_uuid, characteristic_uuid);

	auto got = std::make_shared<std::optional<std::pair<BackendStatus, bytes>>>();
	central_->read(ch, [got](const BackendStatus& s, const bytes& value) {
		if (!*got) *got = std::make_pair(s, value);
	});
	if (!loop_.wait_until([got]() { return got->has_value(); }, opts_.timeout)) {
		throw BluetoothError(ErrorKind::OperationTimeout, "read from " + device_id + " timed out");
	}
	if (!(*got)->first.ok) {
		throw BluetoothError(ErrorKind::ConnectionFailed, "read from " + device_id + " failed: " + (*got)->first.message);
	}

	WireMessage m;
	std::string err;
	if (!decode_wire(to_string((*got)->second), m, &err)) {
		throw BluetoothError(ErrorKind::InvalidPayload, "value read from " + device_id + " is not a payment message: " + err);
	}
	if (log_) log_->debug(TAG, "read " + std::to_string((*got)->second.size()) + " bytes from " + device_id);
	return m;
}


int ConnectionManager::add_connection_listener(ConnectionListener cb) {
	int id = next_listener_id_++;
	listeners_[id] = std::move(cb);
	return id;
}


void ConnectionManager::remove_connection_listener(int id) {
	listeners_.erase(id);
}


std::vector<ConnectionState> ConnectionManager::connected_devices() const {
	std::vector<ConnectionState> out;
	for (auto& kv : devices_) {
		if (kv.second.status == ConnectionStatus::Connected) out.push_back(kv.second);
	}
	return out;
}


bool ConnectionManager::is_device_connected(const std::string& device_id) const {
	auto it = devices_.find(device_id);
	return it != devices_.end() && it->second.status == ConnectionStatus::Connected;
}


void ConnectionManager::set_status_(const DeviceHandle& device, ConnectionStatus st) {
	ConnectionState& cs = devices_[device.id];
	cs.device = device;
	cs.status = st;
	if (st == ConnectionStatus::Connecting) notify_(device.id, st);
}


void ConnectionManager::notify_(const std::string& device_id, ConnectionStatus st) {
	std::vector<ConnectionListener> cbs;
	for (auto& kv : listeners_) cbs.push_back(kv.second);
	for (auto& cb : cbs) {
		try {
			cb(device_id, st);
		}
		catch (const std::exception& e) {
			if (log_) log_->error(TAG, std::string("connection listener threw: ") + e.what());
		}
	}
}


void ConnectionManager::drop_subscription_(unsigned key) {
	auto it = subs_.find(key);
	if (it == subs_.end()) return;
	if (central_) central_->unsubscribe(it->second.handle);
	subs_.erase(it);
}


void ConnectionManager::drop_subscriptions_for_(const std::string& device_id) {
	for (auto it = subs_.begin(); it != subs_.end();) {
		if (it->second.device_id == device_id) {
			if (central_) central_->unsubscribe(it->second.handle);
			it = subs_.erase(it);
		}
		else {
			++it;
		}
	}
}

} // namespace acp
