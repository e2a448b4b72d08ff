#pragma once
#include "acp/backends.hpp"
#include "acp/types.hpp"
#include "config/acp_config.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>


/**
* 광고 와이어 포맷
* - 기본: 제조사 데이터(0xFFFF)에 compact JSON
*   { name, serviceId, type:"AirChainPay", version, capabilities[], timestamp,
*     paymentData?{walletAddress, amount, token, chainId, timestamp}, encrypted?, authenticationToken? }
* - 이름 인코딩: "<prefix>-<id>#<base64(paymentData JSON)>"
* - 구형 파이프 포맷: "ACP|wallet|amount|token|chainId|timestamp"
* 파싱 순서는 위 순서 그대로이며, 하나라도 성공하면 나머지는 보지 않는다.
*
* 실제 레거시 광고(31바이트)에는 JSON 이 들어가지 않으므로 제조사 데이터에는
* 비콘 레코드만 싣고, 전체 JSON 은 GATT 특성 읽기로 내준다.
*/

namespace acp {

struct WireMessage {
	std::string name;
	std::string service_id;
	std::string type;
	std::string version;
	std::vector<std::string> capabilities;
	int64_t timestamp{ 0 };
	std::optional<PaymentPayload> payment; ///< device_name 은 name 에서 채움
	bool encrypted{ false };
	std::optional<std::string> auth_token;
};


/** @brief 광고용 메시지 구성 (버전/capabilities 고정값 채움) */
WireMessage build_wire_message(const PaymentPayload& p, int64_t now_ms,
	bool encrypted = false, const std::optional<std::string>& auth_token = std::nullopt);

nlohmann::json to_json(const WireMessage& m);
nlohmann::json payment_to_json(const PaymentPayload& p);

/** @brief compact JSON 문자열 */
std::string encode_wire(const WireMessage& m);

/**
* @brief JSON 텍스트 → WireMessage
* paymentData 가 있지만 형식이 틀리면 메시지는 성공, payment 는 비운다.
* @return type 이 맞지 않거나 JSON 이 아니면 false
*/
bool decode_wire(const std::string& text, WireMessage& out, std::string* err = nullptr);

/** @brief paymentData 오브젝트 → payload (encrypted 이면 amount 형식 검사 생략) */
bool payment_from_json(const nlohmann::json& j, bool encrypted, PaymentPayload& out);

/**
* 비콘 레코드 (10바이트)
* [ 'A' 'C' 'P' ][version][flags][token][timestamp 초, big-endian 4바이트]
* flags: bit0 결제 정보 있음, bit1 암호화, bit2 인증 토큰 있음. token 은 없으면 0xFF.
*/
struct BeaconRecord {
	uint8_t version{ ACP_BEACON_VERSION };
	bool has_payment{ false };
	bool encrypted{ false };
	bool authenticated{ false };
	std::optional<TokenSymbol> token;
	int64_t timestamp{ 0 }; ///< epoch ms (초 단위로 잘림)
};

constexpr size_t BEACON_SIZE = 10;

bytes encode_beacon(const WireMessage& m);
bool decode_beacon(const bytes& data, BeaconRecord& out);

/** @brief 레거시 광고 PDU 의 AD 바이트 수 (BlueZ 가 붙이는 Flags 포함, 이름 제외) */
size_t advertising_data_size(const AdvertisementSpec& spec);

/** @brief 스캔 응답 바이트 수 (BlueZ 는 LocalName 을 스캔 응답에 싣는다) */
size_t scan_response_size(const AdvertisementSpec& spec);

/**
* @brief 두 PDU 가 31바이트 안에 들어가는지
* @return None, 이름 초과는 InvalidPayload, 그 외 초과는 InvalidConfig
*/
ErrorKind check_legacy_layout(const AdvertisementSpec& spec, std::string* why = nullptr);

std::string encode_name_form(const std::string& device_name, const PaymentPayload& p);
std::string encode_legacy(const PaymentPayload& p);
bool decode_legacy(const std::string& text, PaymentPayload& out);


enum class PayloadSource { None, ManufacturerJson, NameEncoded, PipeLegacy, Beacon };
const char* to_string(PayloadSource s);

struct ParsedAdvert {
	std::string name;       ///< 광고 이름 ('#' 앞부분 또는 JSON name)
	std::string service_id; ///< JSON serviceId (있다면)
	std::optional<PaymentPayload> payload;
	PayloadSource source{ PayloadSource::None };
	bool encrypted{ false };
	std::optional<std::string> auth_token;
	std::optional<BeaconRecord> beacon; ///< 제조사 데이터가 비콘일 때
};

ParsedAdvert parse_advertisement(const Advertisement& adv);

} // namespace acp
