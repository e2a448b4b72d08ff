#pragma once
#include "acp/advertising_controller.hpp"
#include "acp/backends.hpp"
#include "acp/config.hpp"
#include "acp/connection_manager.hpp"
#include "acp/event_loop.hpp"
#include "acp/health_monitor.hpp"
#include "acp/log_sink.hpp"
#include "acp/permission_coordinator.hpp"
#include "acp/radio_state_monitor.hpp"
#include "acp/scan_controller.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>


namespace acp {

// 플랫폼 구현 묶음 (소유권 없음). adapter, permissions 는 필수
struct SubsystemBackends {
	RadioAdapter* adapter = nullptr;
	NativeAdvertiser* advertiser = nullptr;
	ScanBackend* scanner = nullptr;
	CentralBackend* central = nullptr;
	PermissionBackend* permissions = nullptr;
};


struct AdvertisingSupport {
	bool supported{ false };
	std::map<std::string, std::string> details;
	std::vector<std::string> missing_requirements;
};


struct AdvertisingStatistics {
	BasicStatistics basic;
	SecurityStatistics security;
	OverallStatistics monitoring;
};


struct Diagnostics {
	bool supported{ false };
	std::vector<std::string> issues;
	std::vector<std::string> recommendations;
};


/**
* ProximitySubsystem
* - 광고/스캔/연결 컴포넌트를 묶는 단일 핸들. 프로세스당 하나만 생성 가능 (두 번째 생성은 예외).
* - 광고 능력은 생성 시 1회 판별해서 고정한다.
* - 모든 호출은 이벤트 루프 스레드에서.
*/
class ProximitySubsystem {
public:
	ProximitySubsystem(EventLoop& loop, const SubsystemBackends& backends, const ProximityConfig& cfg, LogSink& log);
	~ProximitySubsystem();

	ProximitySubsystem(const ProximitySubsystem&) = delete;
	ProximitySubsystem& operator=(const ProximitySubsystem&) = delete;

	const std::string& device_name() const { return device_name_; }
	Capability capability() const { return capability_; }

	// ── 광고
	AdvertiseResult start_advertising(const PaymentPayload& payload,
		const std::optional<SecurityConfig>& security = std::nullopt);
	void stop_advertising();

	// ── 스캔
	BackendStatus start_scan(FoundCallback on_found, std::optional<Millis> timeout = std::nullopt);
	void stop_scan();

	// ── 연결
	ConnectionState connect_to_device(const DeviceHandle& device);
	void disconnect_from_device(const std::string& device_id);
	void send_data_to_device(const std::string& device_id, const std::string& data,
		const std::string& service_uuid = "", const std::string& characteristic_uuid = "");
	DataSubscription listen_for_data(const std::string& device_id, std::function<void(const std::string&)> on_data,
		const std::string& service_uuid = "", const std::string& characteristic_uuid = "");

	/** @brief 연결된 광고 기기의 결제 메시지 읽기 (scan 설정의 키로 복호화) */
	WireMessage read_payment_from_device(const std::string& device_id);

	// ── 상태/진단
	AdvertisingStatistics get_advertising_statistics() const;
	AdvertisingSupport check_advertising_support();
	PermissionCheck check_permissions();
	PermissionRequestResult request_permissions();
	std::string get_advertising_report() const;
	Diagnostics run_diagnostics();

	/** @brief 광고/스캔 정지, 모든 연결 해제 (중복 호출 무해) */
	void shutdown();

	AdvertisingController& advertising() { return *advertising_; }
	ScanController& scanning() { return *scanning_; }
	ConnectionManager& connections() { return *connections_; }
	HealthMonitor& health() { return *health_; }
	RadioStateMonitor& radio() { return *radio_; }

private:
	static bool s_alive_; ///< 프로세스 단일 인스턴스 플래그

	EventLoop& loop_;
	LogSink& log_;
	ProximityConfig cfg_;
	SubsystemBackends backends_;
	std::string device_name_;
	Capability capability_{ Capability::Unavailable };

	std::unique_ptr<RadioStateMonitor> radio_;
	std::unique_ptr<PermissionCoordinator> permissions_;
	std::unique_ptr<HealthMonitor> health_;
	std::unique_ptr<AdvertisingController> advertising_;
	std::unique_ptr<ScanController> scanning_;
	std::unique_ptr<ConnectionManager> connections_;
};

} // namespace acp
