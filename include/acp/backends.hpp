#pragma once
#include "acp/common.hpp"
#include "acp/errors.hpp"
#include "acp/types.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>


/*
 * 플랫폼 경계. 컨트롤러들은 이 인터페이스만 알고,
 * Linux 에서는 BlueZ(D-Bus) / HCI raw socket / capability 구현을 붙인다.
 * 모든 완료 콜백은 이벤트 루프 스레드에서 호출되며, 호출되지 않을 수도 있다.
 */

namespace acp {

using StatusCallback = std::function<void(const BackendStatus&)>;


class RadioAdapter {
public:
	virtual ~RadioAdapter() = default;

	/** @brief 광고 능력 판별 (초기화 시 1회만 호출된다) */
	virtual Capability resolve_capability() = 0;

	/** @brief 현재 전원 상태를 새로 질의 */
	virtual bool powered() = 0;

	/** @brief 전원 상태 변화 구독 */
	virtual void watch_power(std::function<void(bool)> cb) = 0;

	virtual std::string describe() const = 0; ///< 진단용 (어댑터 경로 등)
};


// 네이티브 광고 요청
struct AdvertisementSpec {
	std::string local_name;
	std::string service_uuid;
	uint16_t manufacturer_id{ 0xFFFF };
	bytes manufacturer_data;   ///< 레거시 광고에 맞는 비콘 레코드
	bytes gatt_value;          ///< 특성 ReadValue 응답 (전체 와이어 메시지)
	int tx_power{ 0 };
	uint32_t interval_ms{ 100 };
	bool connectable{ true };
	bool include_device_name{ true };
	bool include_tx_power{ false };
};


class NativeAdvertiser {
public:
	virtual ~NativeAdvertiser() = default;

	/** @brief 광고 등록(이미 등록돼 있으면 교체). done 이 오지 않을 수 있음 */
	virtual void broadcast(const AdvertisementSpec& spec, StatusCallback done) = 0;
	virtual void stop_broadcast(StatusCallback done) = 0;

	/** @brief 특성(Characteristic)에 원격 기기가 쓴 값 */
	virtual void set_write_handler(std::function<void(const std::string& device, const bytes& value)> cb) = 0;
};


class ScanBackend {
public:
	virtual ~ScanBackend() = default;
	virtual BackendStatus start(std::function<void(const Advertisement&)> on_adv) = 0;
	virtual void stop() = 0;
};


struct GattCharacteristic {
	std::string uuid;
	std::string path;
	std::vector<std::string> flags;
};

struct GattService {
	std::string uuid;
	std::string path;
	std::vector<GattCharacteristic> characteristics;
};


class CentralBackend {
public:
	virtual ~CentralBackend() = default;

	virtual void connect(const DeviceHandle& dev, StatusCallback done) = 0;
	virtual void discover_services(const DeviceHandle& dev,
		std::function<void(const BackendStatus&, const std::vector<GattService>&)> done) = 0;
	virtual void disconnect(const DeviceHandle& dev, StatusCallback done) = 0;

	virtual void write(const GattCharacteristic& ch, const bytes& value, StatusCallback done) = 0;
	virtual void read(const GattCharacteristic& ch, std::function<void(const BackendStatus&, const bytes&)> done) = 0;

	/** @brief 알림 구독. done 에 구독 핸들 전달 */
	virtual void subscribe(const GattCharacteristic& ch, std::function<void(const bytes&)> on_value,
		std::function<void(const BackendStatus&, unsigned handle)> done) = 0;
	virtual void unsubscribe(unsigned handle) = 0;
};


enum class PermissionKind { Scan, Connect, Advertise, Location };
enum class PermissionStatus { Granted, Denied, DeniedForever };

const char* to_string(PermissionStatus s);


class PermissionBackend {
public:
	virtual ~PermissionBackend() = default;

	/** @brief OS 권한 식별자 (로그/결과에 그대로 노출) */
	virtual std::string identifier(PermissionKind k) const = 0;

	virtual void query(PermissionKind k, std::function<void(PermissionStatus)> done) = 0;
	virtual void request(const std::vector<PermissionKind>& kinds,
		std::function<void(const std::map<PermissionKind, PermissionStatus>&)> done) = 0;
};

} // namespace acp
