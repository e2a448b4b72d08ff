#pragma once
#include "acp/backends.hpp"
#include "config/acp_config.h"
#include "mocks/manual_event_loop.hpp"
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>


// 완료 콜백 전달 방식
enum class Reply { Sync, Posted, Hang };


class FakeRadioAdapter : public acp::RadioAdapter {
public:
	acp::Capability capability{ acp::Capability::NativeAdvertiser };
	bool is_on{ true };
	int capability_queries{ 0 };
	int power_queries{ 0 };

	acp::Capability resolve_capability() override { ++capability_queries; return capability; }
	bool powered() override { ++power_queries; return is_on; }
	void watch_power(std::function<void(bool)> cb) override { watchers_.push_back(std::move(cb)); }
	std::string describe() const override { return "fake-adapter"; }

	void set_powered(bool on) {
		is_on = on;
		for (auto& cb : watchers_) cb(on);
	}

private:
	std::vector<std::function<void(bool)>> watchers_;
};


class FakeAdvertiser : public acp::NativeAdvertiser {
public:
	explicit FakeAdvertiser(ManualEventLoop& loop) : loop_(loop) {}

	Reply reply{ Reply::Posted };
	acp::Millis delay{ 0 };                       ///< > 0 이면 타이머로 완료
	std::deque<acp::BackendStatus> results;        ///< 비면 성공
	int broadcast_calls{ 0 };
	int stop_calls{ 0 };
	acp::AdvertisementSpec last_spec;
	std::vector<acp::Millis> call_times;

	void broadcast(const acp::AdvertisementSpec& spec, acp::StatusCallback done) override {
		++broadcast_calls;
		last_spec = spec;
		call_times.push_back(loop_.elapsed());
		acp::BackendStatus st = acp::BackendStatus::success();
		if (!results.empty()) {
			st = results.front();
			results.pop_front();
		}
		deliver_(std::move(done), st);
	}

	void stop_broadcast(acp::StatusCallback done) override {
		++stop_calls;
		if (reply == Reply::Hang) return;
		loop_.post([done]() { done(acp::BackendStatus::success()); });
	}

	void set_write_handler(std::function<void(const std::string&, const acp::bytes&)> cb) override {
		write_handler_ = std::move(cb);
	}

	void remote_write(const std::string& device, const acp::bytes& value) {
		if (write_handler_) write_handler_(device, value);
	}

private:
	void deliver_(acp::StatusCallback done, acp::BackendStatus st) {
		if (reply == Reply::Hang) return;
		if (delay.count() > 0) {
			loop_.add_timer(delay, [done, st]() { done(st); return false; });
			return;
		}
		if (reply == Reply::Sync) done(st);
		else loop_.post([done, st]() { done(st); });
	}

	ManualEventLoop& loop_;
	std::function<void(const std::string&, const acp::bytes&)> write_handler_;
};


class FakeScanBackend : public acp::ScanBackend {
public:
	acp::BackendStatus start_result{ acp::BackendStatus::success() };
	int start_calls{ 0 };
	int stop_calls{ 0 };

	acp::BackendStatus start(std::function<void(const acp::Advertisement&)> on_adv) override {
		++start_calls;
		if (start_result.ok) on_adv_ = std::move(on_adv);
		return start_result;
	}

	void stop() override {
		++stop_calls;
		on_adv_ = nullptr;
	}

	bool running() const { return (bool)on_adv_; }

	void emit(const acp::Advertisement& adv) {
		if (on_adv_) {
			auto cb = on_adv_;
			cb(adv);
		}
	}

private:
	std::function<void(const acp::Advertisement&)> on_adv_;
};


class FakeCentral : public acp::CentralBackend {
public:
	explicit FakeCentral(ManualEventLoop& loop) : loop_(loop) {}

	std::deque<acp::BackendStatus> connect_results; ///< 비면 성공
	Reply connect_reply{ Reply::Posted };
	Reply write_reply{ Reply::Posted };
	Reply subscribe_reply{ Reply::Posted };
	acp::BackendStatus write_result{ acp::BackendStatus::success() };
	acp::BackendStatus subscribe_result{ acp::BackendStatus::success() };
	acp::Millis subscribe_delay{ 0 };               ///< > 0 이면 타이머로 완료
	acp::BackendStatus read_result{ acp::BackendStatus::success() };
	acp::bytes read_value;
	std::vector<acp::GattService> services;

	int connect_calls{ 0 };
	int disconnect_calls{ 0 };
	std::vector<acp::Millis> connect_times;
	std::vector<acp::bytes> written;
	std::vector<unsigned> unsubscribed;
	int read_calls{ 0 };

	void connect(const acp::DeviceHandle&, acp::StatusCallback done) override {
		++connect_calls;
		connect_times.push_back(loop_.elapsed());
		acp::BackendStatus st = acp::BackendStatus::success();
		if (!connect_results.empty()) {
			st = connect_results.front();
			connect_results.pop_front();
		}
		if (connect_reply == Reply::Hang) return;
		if (connect_reply == Reply::Sync) done(st);
		else loop_.post([done, st]() { done(st); });
	}

	void discover_services(const acp::DeviceHandle&,
		std::function<void(const acp::BackendStatus&, const std::vector<acp::GattService>&)> done) override {
		auto svcs = services;
		loop_.post([done, svcs]() { done(acp::BackendStatus::success(), svcs); });
	}

	void disconnect(const acp::DeviceHandle&, acp::StatusCallback done) override {
		++disconnect_calls;
		loop_.post([done]() { done(acp::BackendStatus::success()); });
	}

	void write(const acp::GattCharacteristic&, const acp::bytes& value, acp::StatusCallback done) override {
		written.push_back(value);
		auto st = write_result;
		if (write_reply == Reply::Hang) return;
		loop_.post([done, st]() { done(st); });
	}

	void subscribe(const acp::GattCharacteristic&, std::function<void(const acp::bytes&)> on_value,
		std::function<void(const acp::BackendStatus&, unsigned)> done) override {
		if (subscribe_reply == Reply::Hang) return;
		auto st = subscribe_result;
		unsigned handle = 0;
		if (st.ok) {
			handle = next_handle_++;
			notifiers_[handle] = std::move(on_value);
		}
		if (subscribe_delay.count() > 0) {
			loop_.add_timer(subscribe_delay, [done, st, handle]() { done(st, handle); return false; });
			return;
		}
		loop_.post([done, st, handle]() { done(st, handle); });
	}

	void read(const acp::GattCharacteristic&,
		std::function<void(const acp::BackendStatus&, const acp::bytes&)> done) override {
		++read_calls;
		auto st = read_result;
		auto v = read_value;
		loop_.post([done, st, v]() { done(st, v); });
	}

	void unsubscribe(unsigned handle) override {
		unsubscribed.push_back(handle);
		notifiers_.erase(handle);
	}

	void notify(const acp::bytes& value) {
		auto copy = notifiers_;
		for (auto& kv : copy) kv.second(value);
	}

	size_t active_subscriptions() const { return notifiers_.size(); }

	/** @brief 기본 AirChainPay 서비스/특성 하나 */
	static std::vector<acp::GattService> default_services();

private:
	ManualEventLoop& loop_;
	std::map<unsigned, std::function<void(const acp::bytes&)>> notifiers_;
	unsigned next_handle_{ 1 };
};


inline std::vector<acp::GattService> FakeCentral::default_services() {
	acp::GattCharacteristic ch{ ACP_CHARACTERISTIC_UUID, "/dev/service0/char0", { "read", "write", "notify" } };
	acp::GattService svc{ ACP_SERVICE_UUID, "/dev/service0", { ch } };
	return { svc };
}


class FakePermissions : public acp::PermissionBackend {
public:
	std::map<acp::PermissionKind, acp::PermissionStatus> current{
		{ acp::PermissionKind::Scan, acp::PermissionStatus::Granted },
		{ acp::PermissionKind::Connect, acp::PermissionStatus::Granted },
		{ acp::PermissionKind::Advertise, acp::PermissionStatus::Granted },
		{ acp::PermissionKind::Location, acp::PermissionStatus::Granted },
	};
	std::map<acp::PermissionKind, acp::PermissionStatus> after_request; ///< request 후 current 에 덮어씀
	bool hang_query{ false };
	int query_calls{ 0 };
	int request_calls{ 0 };

	std::string identifier(acp::PermissionKind k) const override {
		switch (k) {
		case acp::PermissionKind::Scan: return "BLUETOOTH_SCAN";
		case acp::PermissionKind::Connect: return "BLUETOOTH_CONNECT";
		case acp::PermissionKind::Advertise: return "BLUETOOTH_ADVERTISE";
		case acp::PermissionKind::Location: return "ACCESS_FINE_LOCATION";
		}
		return "?";
	}

	void query(acp::PermissionKind k, std::function<void(acp::PermissionStatus)> done) override {
		++query_calls;
		if (hang_query) return;
		done(current[k]);
	}

	void request(const std::vector<acp::PermissionKind>& kinds,
		std::function<void(const std::map<acp::PermissionKind, acp::PermissionStatus>&)> done) override {
		++request_calls;
		for (auto& kv : after_request) current[kv.first] = kv.second;
		std::map<acp::PermissionKind, acp::PermissionStatus> out;
		for (auto k : kinds) out[k] = current[k];
		done(out);
	}
};
