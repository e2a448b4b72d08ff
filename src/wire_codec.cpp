#include "acp/wire_codec.hpp"
#include "config/acp_config.h"
#include <cctype>
#include <sstream>

using json = nlohmann::json;


namespace acp {

WireMessage build_wire_message(const PaymentPayload& p, int64_t now_ms,
	bool encrypted, const std::optional<std::string>& auth_token) {
	WireMessage m;
	m.name = p.device_name;
	m.service_id = ACP_SERVICE_UUID;
	m.type = ACP_MESSAGE_TYPE;
	m.version = ACP_MESSAGE_VERSION;
	m.capabilities = { "payment", "secure_ble" };
	if (encrypted) m.capabilities.push_back("encrypted");
	m.timestamp = now_ms;
	m.payment = p;
	m.encrypted = encrypted;
	m.auth_token = auth_token;
	return m;
}


json payment_to_json(const PaymentPayload& p) {
	json j{
		{"walletAddress", p.wallet_address},
		{"token", to_string(p.token)},
		{"chainId", p.chain_id},
		{"timestamp", p.timestamp}
	};
	if (p.amount) j["amount"] = *p.amount;
	return j;
}


json to_json(const WireMessage& m) {
	json j{
		{"name", m.name},
		{"serviceId", m.service_id},
		{"type", m.type},
		{"version", m.version},
		{"capabilities", m.capabilities},
		{"timestamp", m.timestamp}
	};
	if (m.payment) j["paymentData"] = payment_to_json(*m.payment);
	if (m.encrypted) j["encrypted"] = true;
	if (m.auth_token) j["authenticationToken"] = *m.auth_token;
	return j;
}


std::string encode_wire(const WireMessage& m) {
	return to_json(m).dump();
}


bool payment_from_json(const json& j, bool encrypted, PaymentPayload& out) {
	if (!j.is_object()) return false;
	if (!j.contains("walletAddress") || !j["walletAddress"].is_string()) return false;
	if (!j.contains("token") || !j["token"].is_string()) return false;
	auto tok = parse_token(j["token"].get<std::string>());
	if (!tok) return false;

	PaymentPayload p;
	p.wallet_address = j["walletAddress"].get<std::string>();
	if (p.wallet_address.empty()) return false;
	p.token = *tok;

	if (j.contains("amount") && !j["amount"].is_null()) {
		if (!j["amount"].is_string()) return false;
		p.amount = j["amount"].get<std::string>();
		if (!encrypted && !is_valid_amount(*p.amount, p.token)) return false;
	}
	if (j.contains("chainId")) {
		if (!j["chainId"].is_string()) return false;
		p.chain_id = j["chainId"].get<std::string>();
	}
	if (j.contains("timestamp")) {
		if (!j["timestamp"].is_number_integer()) return false;
		p.timestamp = j["timestamp"].get<int64_t>();
	}
	out = p;
	return true;
}


bool decode_wire(const std::string& text, WireMessage& out, std::string* err) {
	auto j = json::parse(text, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		if (err) *err = "not a JSON object";
		return false;
	}
	if (!j.contains("type") || !j["type"].is_string() || j["type"].get<std::string>() != ACP_MESSAGE_TYPE) {
		if (err) *err = "unexpected message type";
		return false;
	}

	WireMessage m;
	m.type = j["type"].get<std::string>();
	if (j.contains("name") && j["name"].is_string()) m.name = j["name"].get<std::string>();
	if (j.contains("serviceId") && j["serviceId"].is_string()) m.service_id = j["serviceId"].get<std::string>();
	if (j.contains("version") && j["version"].is_string()) m.version = j["version"].get<std::string>();
	if (j.contains("timestamp") && j["timestamp"].is_number_integer()) m.timestamp = j["timestamp"].get<int64_t>();
	if (j.contains("capabilities") && j["capabilities"].is_array()) {
		for (auto& c : j["capabilities"]) if (c.is_string()) m.capabilities.push_back(c.get<std::string>());
	}
	if (j.contains("encrypted") && j["encrypted"].is_boolean()) m.encrypted = j["encrypted"].get<bool>();
	if (j.contains("authenticationToken") && j["authenticationToken"].is_string())
		m.auth_token = j["authenticationToken"].get<std::string>();

	if (j.contains("paymentData")) {
		PaymentPayload p;
		if (payment_from_json(j["paymentData"], m.encrypted, p)) {
			p.device_name = m.name;
			m.payment = p;
		}
	}
	out = std::move(m);
	return true;
}


bytes encode_beacon(const WireMessage& m) {
	bytes b = { 'A', 'C', 'P', (uint8_t)ACP_BEACON_VERSION, 0, 0xFF };
	if (m.payment) {
		b[4] |= 0x01;
		b[5] = (uint8_t)m.payment->token;
	}
	if (m.encrypted) b[4] |= 0x02;
	if (m.auth_token) b[4] |= 0x04;

	const uint32_t secs = (uint32_t)(m.timestamp / 1000);
	b.push_back((uint8_t)(secs >> 24));
	b.push_back((uint8_t)(secs >> 16));
	b.push_back((uint8_t)(secs >> 8));
	b.push_back((uint8_t)secs);
	return b;
}


bool decode_beacon(const bytes& data, BeaconRecord& out) {
	if (data.size() != BEACON_SIZE) return false;
	if (data[0] != 'A' || data[1] != 'C' || data[2] != 'P') return false;
	if (data[3] != ACP_BEACON_VERSION) return false;

	BeaconRecord r;
	r.version = data[3];
	r.has_payment = data[4] & 0x01;
	r.encrypted = data[4] & 0x02;
	r.authenticated = data[4] & 0x04;
	if (data[5] != 0xFF) {
		if (data[5] > (uint8_t)TokenSymbol::TCORE2) return false;
		r.token = (TokenSymbol)data[5];
	}
	const uint32_t secs = ((uint32_t)data[6] << 24) | ((uint32_t)data[7] << 16) |
		((uint32_t)data[8] << 8) | (uint32_t)data[9];
	r.timestamp = (int64_t)secs * 1000;
	out = r;
	return true;
}


// 16-bit(2), 32-bit(4) 베이스 UUID 는 짧은 형태로 광고된다
static size_t uuid_ad_len_(const std::string& uuid) {
	static const std::string base_suffix = "-0000-1000-8000-00805f9b34fb";
	if (uuid.size() != 36) return 16;
	std::string lower = uuid;
	for (auto& c : lower) c = (char)std::tolower((unsigned char)c);
	if (lower.compare(8, std::string::npos, base_suffix) != 0) return 16;
	return lower.compare(0, 4, "0000") == 0 ? 2 : 4;
}


size_t advertising_data_size(const AdvertisementSpec& spec) {
	size_t n = 3; // Flags
	if (!spec.service_uuid.empty()) n += 2 + uuid_ad_len_(spec.service_uuid);
	if (!spec.manufacturer_data.empty()) n += 2 + 2 + spec.manufacturer_data.size();
	if (spec.include_tx_power) n += 3;
	return n;
}


size_t scan_response_size(const AdvertisementSpec& spec) {
	if (!spec.include_device_name || spec.local_name.empty()) return 0;
	return 2 + spec.local_name.size();
}


ErrorKind check_legacy_layout(const AdvertisementSpec& spec, std::string* why) {
	const size_t rsp = scan_response_size(spec);
	if (rsp > ACP_LEGACY_ADV_MAX_BYTES) {
		if (why) *why = "device name needs " + std::to_string(rsp) + " bytes of scan response, limit is " +
			std::to_string(ACP_LEGACY_ADV_MAX_BYTES);
		return ErrorKind::InvalidPayload;
	}
	const size_t adv = advertising_data_size(spec);
	if (adv > ACP_LEGACY_ADV_MAX_BYTES) {
		if (why) *why = "advertising data needs " + std::to_string(adv) + " bytes, limit is " +
			std::to_string(ACP_LEGACY_ADV_MAX_BYTES);
		return ErrorKind::InvalidConfig;
	}
	return ErrorKind::None;
}


std::string encode_name_form(const std::string& device_name, const PaymentPayload& p) {
	return device_name + "#" + base64_encode(payment_to_json(p).dump());
}


std::string encode_legacy(const PaymentPayload& p) {
	std::ostringstream os;
	os << ACP_LEGACY_TAG << '|' << p.wallet_address << '|' << p.amount.value_or("") << '|'
		<< to_string(p.token) << '|' << p.chain_id << '|' << p.timestamp;
	return os.str();
}


static std::vector<std::string> split_(const std::string& s, char sep) {
	std::vector<std::string> out;
	std::string cur;
	for (char c : s) {
		if (c == sep) { out.push_back(cur); cur.clear(); }
		else cur.push_back(c);
	}
	out.push_back(cur);
	return out;
}


bool decode_legacy(const std::string& text, PaymentPayload& out) {
	auto f = split_(text, '|');
	if (f.size() != 6 || f[0] != ACP_LEGACY_TAG) return false;
	if (f[1].empty()) return false;
	auto tok = parse_token(f[3]);
	if (!tok) return false;

	PaymentPayload p;
	p.wallet_address = f[1];
	p.token = *tok;
	if (!f[2].empty()) {
		if (!is_valid_amount(f[2], p.token)) return false;
		p.amount = f[2];
	}
	p.chain_id = f[4];
	try {
		size_t used = 0;
		p.timestamp = std::stoll(f[5], &used);
		if (used != f[5].size()) return false;
	}
	catch (const std::exception&) {
		return false;
	}
	out = p;
	return true;
}


const char* to_string(PayloadSource s) {
	switch (s) {
	case PayloadSource::None: return "none";
	case PayloadSource::ManufacturerJson: return "manufacturer-json";
	case PayloadSource::NameEncoded: return "name-encoded";
	case PayloadSource::PipeLegacy: return "pipe-legacy";
	case PayloadSource::Beacon: return "beacon";
	}
	return "?";
}


ParsedAdvert parse_advertisement(const Advertisement& adv) {
	ParsedAdvert r;

	// 로컬 이름: "<name>#<suffix>"
	std::string suffix;
	if (adv.local_name) {
		const std::string& ln = *adv.local_name;
		auto hash = ln.find('#');
		r.name = ln.substr(0, hash);
		if (hash != std::string::npos) suffix = ln.substr(hash + 1);
	}

	const bytes* mfr = nullptr;
	auto it = adv.manufacturer_data.find((uint16_t)ACP_MANUFACTURER_ID);
	if (it != adv.manufacturer_data.end()) mfr = &it->second;

	// 1) 제조사 데이터 JSON
	if (mfr && !mfr->empty() && (*mfr)[0] == '{') {
		WireMessage m;
		if (decode_wire(to_string(*mfr), m)) {
			if (!m.name.empty()) r.name = m.name;
			r.service_id = m.service_id;
			r.encrypted = m.encrypted;
			r.auth_token = m.auth_token;
			if (m.payment) {
				r.payload = m.payment;
				r.payload->device_name = r.name;
				r.source = PayloadSource::ManufacturerJson;
				return r;
			}
		}
	}
	else if (mfr) {
		// 비콘: 결제 정보 본문은 GATT 읽기로 받는다
		BeaconRecord b;
		if (decode_beacon(*mfr, b)) {
			r.encrypted = b.encrypted;
			r.beacon = b;
		}
	}

	// 2) 이름 인코딩
	if (!suffix.empty() && suffix.rfind(ACP_LEGACY_TAG "|", 0) != 0) {
		bytes raw;
		if (base64_decode(suffix, raw)) {
			auto j = json::parse(to_string(raw), nullptr, false);
			PaymentPayload p;
			if (!j.is_discarded() && payment_from_json(j, false, p)) {
				p.device_name = r.name;
				r.payload = p;
				r.source = PayloadSource::NameEncoded;
				return r;
			}
		}
	}

	// 3) 파이프 포맷 (제조사 데이터 → 이름 접미사)
	PaymentPayload p;
	if ((mfr && decode_legacy(to_string(*mfr), p)) || (!suffix.empty() && decode_legacy(suffix, p))) {
		p.device_name = r.name;
		r.payload = p;
		r.source = PayloadSource::PipeLegacy;
		return r;
	}
	if (r.beacon) r.source = PayloadSource::Beacon;
	return r;
}

} // namespace acp
