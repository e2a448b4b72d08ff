#pragma once
#include "acp/backends.hpp"
#include "acp/event_loop.hpp"
#include "acp/log_sink.hpp"
#include "acp/radio_state_monitor.hpp"
#include "acp/types.hpp"
#include "acp/wire_codec.hpp"
#include "config/acp_config.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>


namespace acp {

struct ConnectOptions {
	int max_retries{ ACP_CONNECT_MAX_RETRIES };
	Millis base_delay{ ACP_CONNECT_BASE_DELAY_MS }; ///< base * 2^(n-1) + jitter
	int jitter_ms{ ACP_CONNECT_JITTER_MS };
	Millis timeout{ ACP_CONNECT_TIMEOUT_MS };       ///< 연결/탐색/쓰기 각각
	std::string service_uuid{ ACP_SERVICE_UUID };
	std::string characteristic_uuid{ ACP_CHARACTERISTIC_UUID };
};


struct ConnectionState {
	DeviceHandle device;
	ConnectionStatus status{ ConnectionStatus::Disconnected };
	std::vector<GattService> services;
};


/**
* 데이터 수신 구독 핸들. 소멸 또는 remove() 시 해제된다.
* 발급한 ConnectionManager 가 먼저 사라지면 해제는 아무 일도 하지 않는다.
*/
class DataSubscription {
public:
	DataSubscription() = default;
	explicit DataSubscription(std::function<void()> disposer) : disposer_(std::move(disposer)) {}
	~DataSubscription() { remove(); }

	DataSubscription(DataSubscription&& o) noexcept : disposer_(std::move(o.disposer_)) { o.disposer_ = nullptr; }
	DataSubscription& operator=(DataSubscription&& o) noexcept {
		if (this != &o) {
			remove();
			disposer_ = std::move(o.disposer_);
			o.disposer_ = nullptr;
		}
		return *this;
	}
	DataSubscription(const DataSubscription&) = delete;
	DataSubscription& operator=(const DataSubscription&) = delete;

	void remove() {
		if (!disposer_) return;
		auto d = std::move(disposer_);
		disposer_ = nullptr;
		d();
	}
	bool active() const { return (bool)disposer_; }

private:
	std::function<void()> disposer_;
};


using ConnectionListener = std::function<void(const std::string& device_id, ConnectionStatus status)>;


/**
* ConnectionManager
* - 재시도(지수 백오프 + 지터) 연결, 서비스 탐색, 고정 특성 쓰기/구독.
* - 페이로드는 UTF-8 텍스트를 base64 로 감싸서 주고받는다.
* - 실패는 BluetoothError 로 던진다.
*/
class ConnectionManager {
public:
	ConnectionManager(EventLoop& loop, CentralBackend* central, RadioStateMonitor& radio,
		LogSink* log = nullptr, ConnectOptions opts = {}, std::function<int(int)> jitter = nullptr);
	~ConnectionManager();

	ConnectionManager(const ConnectionManager&) = delete;
	ConnectionManager& operator=(const ConnectionManager&) = delete;

	ConnectionState connect(const DeviceHandle& device);
	void disconnect(const std::string& device_id);
	void disconnect_all();

	void send_data(const std::string& device_id, const std::string& data,
		const std::string& service_uuid = "", const std::string& characteristic_uuid = "");
	DataSubscription listen_for_data(const std::string& device_id, std::function<void(const std::string&)> on_data,
		const std::string& service_uuid = "", const std::string& characteristic_uuid = "");

	/**
	* @brief 광고 측 특성을 읽어 전체 와이어 메시지를 받는다 (비콘만 보인 기기용)
	* @throws BluetoothError DeviceNotConnected / OperationTimeout / ConnectionFailed / InvalidPayload
	*/
	WireMessage read_payment(const std::string& device_id,
		const std::string& service_uuid = "", const std::string& characteristic_uuid = "");

	int add_connection_listener(ConnectionListener cb);
	void remove_connection_listener(int id);

	std::vector<ConnectionState> connected_devices() const;
	bool is_device_connected(const std::string& device_id) const;

private:
	struct Subscription {
		std::string device_id;
		unsigned handle{ 0 };
	};

	void ensure_available_();
	const GattCharacteristic& find_characteristic_(const std::string& device_id,
		const std::string& service_uuid, const std::string& characteristic_uuid) const;
	BackendStatus await_status_(const std::function<void(StatusCallback)>& call);
	void set_status_(const DeviceHandle& device, ConnectionStatus st);
	void notify_(const std::string& device_id, ConnectionStatus st);
	void drop_subscription_(unsigned key);
	void drop_subscriptions_for_(const std::string& device_id);

	EventLoop& loop_;
	CentralBackend* central_ = nullptr;
	RadioStateMonitor& radio_;
	LogSink* log_ = nullptr;
	ConnectOptions opts_;
	std::function<int(int)> jitter_; ///< [0, n) 난수

	std::map<std::string, ConnectionState> devices_;
	std::map<unsigned, Subscription> subs_;
	unsigned next_sub_{ 1 };
	std::map<int, ConnectionListener> listeners_;
	int next_listener_id_{ 1 };
	std::shared_ptr<bool> alive_{ std::make_shared<bool>(true) }; ///< 구독 핸들이 약참조
};

} // namespace acp
