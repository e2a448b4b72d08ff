#pragma once
#include "acp/common.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>


namespace acp {

// 지원 토큰 (소수 자릿수 고정)
enum class TokenSymbol { USDC, USDT, ETH, TCORE2 };

const char* to_string(TokenSymbol t);
std::optional<TokenSymbol> parse_token(const std::string& s);
int token_decimals(TokenSymbol t);


// 광고에 실리는 결제 정보
struct PaymentPayload {
	std::string wallet_address;
	std::optional<std::string> amount; ///< 10진 문자열 (예: "1.5")
	TokenSymbol token{ TokenSymbol::USDC };
	std::string chain_id;
	int64_t timestamp{ 0 }; ///< epoch ms
	std::string device_name;

	bool operator==(const PaymentPayload& o) const {
		return wallet_address == o.wallet_address && amount == o.amount && token == o.token &&
			chain_id == o.chain_id && timestamp == o.timestamp && device_name == o.device_name;
	}
	bool operator!=(const PaymentPayload& o) const { return !(*this == o); }
};

/** @brief 금액: 양수, 토큰 소수 자릿수 이하 */
bool is_valid_amount(const std::string& amount, TokenSymbol token);

/**
* @brief 광고 전 결제 정보 검증
* @param why 실패 사유 (선택)
*/
bool validate_payload(const PaymentPayload& p, std::string* why = nullptr);


// 광고 파라미터
struct AdvertisingConfig {
	int tx_power{ 0 };            ///< dBm, -30..10
	int advertise_mode{ 2 };      ///< 0..2
	uint32_t interval_ms{ 100 };  ///< 20..10240
	bool connectable{ true };
	bool include_device_name{ true };
	bool include_tx_power{ false };
	std::string service_uuid;
};

bool validate_advertising_config(const AdvertisingConfig& c, std::string* why = nullptr);


// 원격 기기 식별자 (BlueZ 기준 MAC 주소 + 오브젝트 경로)
struct DeviceHandle {
	std::string id;   ///< "AA:BB:CC:DD:EE:FF"
	std::string name;
	std::string path; ///< "/org/bluez/hci0/dev_AA_BB_..." (없으면 id 에서 유도)
};


// 스캔 백엔드가 보고하는 광고 원본 (ADV_IND + SCAN_RSP 병합)
struct Advertisement {
	std::string address; ///< "AA:BB:CC:DD:EE:FF"
	std::string path;    ///< BlueZ 오브젝트 경로 (알 수 있을 때)
	int rssi{ 0 };       ///< 수신 RSSI(dBm)
	std::optional<std::string> local_name;
	std::vector<std::string> service_uuids; ///< 정규 128-bit 문자열
	std::map<uint16_t, bytes> manufacturer_data;
};


struct ScanResult {
	DeviceHandle device;
	std::optional<PaymentPayload> payload;
	int rssi{ 0 };
	int64_t discovered_at{ 0 }; ///< epoch ms
	bool encrypted{ false };
	std::optional<std::string> auth_token;
	bool payment_over_gatt{ false }; ///< 비콘만 수신, 결제 정보는 특성 읽기로
};


// 초기화 시 1회 결정되는 광고 능력
enum class Capability { NativeAdvertiser, FallbackAdvertiser, Unavailable };
const char* to_string(Capability c);

enum class AdvState { Idle, Starting, Active, Stopping, Failed };
const char* to_string(AdvState s);

enum class AdvertisingMode { None, Native, Fallback, Simulated };
const char* to_string(AdvertisingMode m);

enum class ConnectionStatus { Disconnected, Connecting, Connected, Error };
const char* to_string(ConnectionStatus s);

} // namespace acp
