#include <doctest/doctest.h>
#include "acp/wire_codec.hpp"
#include "config/acp_config.h"

using namespace acp;

namespace {

PaymentPayload sample_payload() {
	PaymentPayload p;
	p.wallet_address = "0xabc1234567890def";
	p.amount = std::string("1.5");
	p.token = TokenSymbol::USDC;
	p.chain_id = "core_testnet";
	p.timestamp = 1700000000123LL;
	p.device_name = "AirChainPay-0042";
	return p;
}

Advertisement advert_with_mfr(const std::string& name, const std::string& mfr_text) {
	Advertisement a;
	a.address = "AA:BB:CC:DD:EE:01";
	a.rssi = -60;
	a.local_name = name;
	a.service_uuids.push_back(ACP_SERVICE_UUID);
	a.manufacturer_data[ACP_MANUFACTURER_ID] = to_bytes(mfr_text);
	return a;
}

} // namespace


TEST_CASE("wire message round-trips through the advertisement parser") {
	const PaymentPayload p = sample_payload();
	const WireMessage m = build_wire_message(p, 1700000000500LL);
	const Advertisement adv = advert_with_mfr(p.device_name, encode_wire(m));

	ParsedAdvert parsed = parse_advertisement(adv);
	REQUIRE(parsed.payload.has_value());
	CHECK(parsed.source == PayloadSource::ManufacturerJson);
	CHECK(*parsed.payload == p);
	CHECK(parsed.name == "AirChainPay-0042");
	CHECK(parsed.service_id == ACP_SERVICE_UUID);
	CHECK_FALSE(parsed.encrypted);
}

TEST_CASE("wire message carries fixed type, version and capabilities") {
	WireMessage m = build_wire_message(sample_payload(), 42, true, std::string("tok"));
	auto j = to_json(m);
	CHECK(j["type"] == "AirChainPay");
	CHECK(j["version"] == "1.0.0");
	CHECK(j["serviceId"] == ACP_SERVICE_UUID);
	CHECK(j["capabilities"].size() == 3);
	CHECK(j["capabilities"][2] == "encrypted");
	CHECK(j["encrypted"] == true);
	CHECK(j["authenticationToken"] == "tok");
	CHECK(j["paymentData"]["amount"] == "1.5");
}

TEST_CASE("amount is omitted from paymentData when absent") {
	PaymentPayload p = sample_payload();
	p.amount.reset();
	auto j = payment_to_json(p);
	CHECK_FALSE(j.contains("amount"));

	WireMessage out;
	REQUIRE(decode_wire(encode_wire(build_wire_message(p, 1)), out));
	REQUIRE(out.payment.has_value());
	CHECK_FALSE(out.payment->amount.has_value());
}

TEST_CASE("decode_wire rejects foreign JSON and non-JSON") {
	WireMessage out;
	std::string err;
	CHECK_FALSE(decode_wire(R"({"type":"Other","name":"x"})", out, &err));
	CHECK(err == "unexpected message type");
	CHECK_FALSE(decode_wire("not json at all", out, &err));
	CHECK_FALSE(decode_wire("[1,2,3]", out));
}

TEST_CASE("malformed paymentData yields a message without payment") {
	const std::string text =
		R"({"name":"AirChainPay-1","serviceId":"0000abcd-0000-1000-8000-00805f9b34fb","type":"AirChainPay",)"
		R"("version":"1.0.0","capabilities":["payment"],"timestamp":1,"paymentData":{"walletAddress":"0x1","token":"DOGE"}})";
	WireMessage out;
	REQUIRE(decode_wire(text, out));
	CHECK_FALSE(out.payment.has_value());

	ParsedAdvert parsed = parse_advertisement(advert_with_mfr("AirChainPay-1", text));
	CHECK_FALSE(parsed.payload.has_value());
	CHECK(parsed.source == PayloadSource::None);
	CHECK(parsed.name == "AirChainPay-1");
}

TEST_CASE("name-encoded payload is used when manufacturer data is absent") {
	const PaymentPayload p = sample_payload();
	Advertisement adv;
	adv.address = "AA:BB:CC:DD:EE:02";
	adv.local_name = encode_name_form(p.device_name, p);

	ParsedAdvert parsed = parse_advertisement(adv);
	REQUIRE(parsed.payload.has_value());
	CHECK(parsed.source == PayloadSource::NameEncoded);
	CHECK(parsed.name == p.device_name);
	CHECK(*parsed.payload == p);
}

TEST_CASE("manufacturer JSON wins over a name-encoded suffix") {
	PaymentPayload json_p = sample_payload();
	PaymentPayload name_p = sample_payload();
	name_p.wallet_address = "0xfromname";

	Advertisement adv = advert_with_mfr(encode_name_form(json_p.device_name, name_p),
		encode_wire(build_wire_message(json_p, 5)));
	ParsedAdvert parsed = parse_advertisement(adv);
	REQUIRE(parsed.payload.has_value());
	CHECK(parsed.source == PayloadSource::ManufacturerJson);
	CHECK(parsed.payload->wallet_address == "0xabc1234567890def");
}

TEST_CASE("legacy pipe format parses from manufacturer data and name suffix") {
	PaymentPayload p = sample_payload();
	const std::string legacy = encode_legacy(p);
	CHECK(legacy == "ACP|0xabc1234567890def|1.5|USDC|core_testnet|1700000000123");

	ParsedAdvert from_mfr = parse_advertisement(advert_with_mfr(p.device_name, legacy));
	REQUIRE(from_mfr.payload.has_value());
	CHECK(from_mfr.source == PayloadSource::PipeLegacy);
	CHECK(*from_mfr.payload == p);

	Advertisement adv;
	adv.address = "AA:BB:CC:DD:EE:03";
	adv.local_name = p.device_name + "#" + legacy;
	ParsedAdvert from_name = parse_advertisement(adv);
	REQUIRE(from_name.payload.has_value());
	CHECK(from_name.source == PayloadSource::PipeLegacy);
}

TEST_CASE("legacy decoder rejects malformed records") {
	PaymentPayload p;
	CHECK_FALSE(decode_legacy("ACP|0x1|1.5|USDC|chain", p));          // 필드 부족
	CHECK_FALSE(decode_legacy("XYZ|0x1|1.5|USDC|chain|1", p));        // 태그
	CHECK_FALSE(decode_legacy("ACP||1.5|USDC|chain|1", p));           // 지갑 없음
	CHECK_FALSE(decode_legacy("ACP|0x1|-1|USDC|chain|1", p));         // 음수
	CHECK_FALSE(decode_legacy("ACP|0x1|1.5|BTC|chain|1", p));         // 토큰
	CHECK_FALSE(decode_legacy("ACP|0x1|1.5|USDC|chain|12x", p));      // 타임스탬프
	CHECK(decode_legacy("ACP|0x1||ETH|chain|7", p));
	CHECK_FALSE(p.amount.has_value());
	CHECK(p.timestamp == 7);
}

TEST_CASE("advertisement with nothing recognisable has no payload") {
	Advertisement adv;
	adv.address = "AA:BB:CC:DD:EE:04";
	adv.local_name = std::string("AirChainPay-7#%%%not-base64");
	ParsedAdvert parsed = parse_advertisement(adv);
	CHECK(parsed.name == "AirChainPay-7");
	CHECK_FALSE(parsed.payload.has_value());
}

TEST_CASE("encrypted paymentData skips amount format checks") {
	PaymentPayload p = sample_payload();
	p.amount = std::string("bm90LWEtbnVtYmVy");
	WireMessage m = build_wire_message(p, 9, true);
	WireMessage out;
	REQUIRE(decode_wire(encode_wire(m), out));
	REQUIRE(out.payment.has_value());
	CHECK(out.encrypted);
	CHECK(*out.payment->amount == "bm90LWEtbnVtYmVy");
}

TEST_CASE("beacon record packs flags, token and seconds") {
	const WireMessage m = build_wire_message(sample_payload(), 1700000000500LL, true, std::string("tok"));
	const bytes b = encode_beacon(m);
	const bytes expected = { 'A', 'C', 'P', ACP_BEACON_VERSION, 0x07, 0x00, 0x65, 0x53, 0xF1, 0x00 };
	CHECK(b == expected);

	BeaconRecord r;
	REQUIRE(decode_beacon(b, r));
	CHECK(r.has_payment);
	CHECK(r.encrypted);
	CHECK(r.authenticated);
	CHECK(r.token == TokenSymbol::USDC);
	CHECK(r.timestamp == 1700000000000LL);
}

TEST_CASE("beacon without payment carries no token") {
	WireMessage m = build_wire_message(sample_payload(), 1700000000500LL);
	m.payment.reset();
	BeaconRecord r;
	REQUIRE(decode_beacon(encode_beacon(m), r));
	CHECK_FALSE(r.has_payment);
	CHECK_FALSE(r.token.has_value());
}

TEST_CASE("decode_beacon rejects foreign bytes") {
	BeaconRecord r;
	bytes b = encode_beacon(build_wire_message(sample_payload(), 1700000000500LL));
	SUBCASE("short") { b.pop_back(); }
	SUBCASE("magic") { b[0] = 'X'; }
	SUBCASE("version") { b[3] = ACP_BEACON_VERSION + 1; }
	SUBCASE("token") { b[5] = 0x40; }
	CHECK_FALSE(decode_beacon(b, r));
}

TEST_CASE("beacon manufacturer data is recognised by the parser") {
	const PaymentPayload p = sample_payload();
	Advertisement adv = advert_with_mfr(p.device_name, "");
	adv.manufacturer_data[ACP_MANUFACTURER_ID] = encode_beacon(build_wire_message(p, 1700000000500LL, true));

	ParsedAdvert parsed = parse_advertisement(adv);
	CHECK(parsed.source == PayloadSource::Beacon);
	CHECK(std::string(to_string(parsed.source)) == "beacon");
	CHECK(parsed.name == "AirChainPay-0042");
	CHECK(parsed.encrypted);
	CHECK_FALSE(parsed.payload.has_value());
	REQUIRE(parsed.beacon.has_value());
	CHECK(parsed.beacon->has_payment);

	// 이름 인코딩이 함께 있으면 그 결제 정보를 쓴다
	adv.local_name = encode_name_form(p.device_name, p);
	parsed = parse_advertisement(adv);
	CHECK(parsed.source == PayloadSource::NameEncoded);
	REQUIRE(parsed.payload.has_value());
	CHECK(*parsed.payload == p);
	CHECK(parsed.beacon.has_value());
}

TEST_CASE("legacy layout budget") {
	AdvertisementSpec spec;
	spec.local_name = "AirChainPay-0042";
	spec.service_uuid = ACP_SERVICE_UUID;
	spec.manufacturer_id = ACP_MANUFACTURER_ID;
	spec.manufacturer_data = encode_beacon(build_wire_message(sample_payload(), 1700000000500LL));

	CHECK(advertising_data_size(spec) == 3 + 4 + 4 + BEACON_SIZE);
	CHECK(scan_response_size(spec) == 2 + 16);
	CHECK(check_legacy_layout(spec) == ErrorKind::None);

	spec.include_tx_power = true;
	CHECK(advertising_data_size(spec) == 3 + 4 + 4 + BEACON_SIZE + 3);
	CHECK(check_legacy_layout(spec) == ErrorKind::None);

	std::string why;
	SUBCASE("json does not fit") {
		spec.manufacturer_data = to_bytes(encode_wire(build_wire_message(sample_payload(), 1700000000500LL)));
		CHECK(check_legacy_layout(spec, &why) == ErrorKind::InvalidConfig);
		CHECK(why.find("advertising data") == 0);
	}
	SUBCASE("128-bit uuid") {
		spec.include_tx_power = false;
		spec.service_uuid = "12345678-1234-5678-1234-567812345678";
		CHECK(advertising_data_size(spec) == 3 + 18 + 4 + BEACON_SIZE);
		CHECK(check_legacy_layout(spec, &why) == ErrorKind::InvalidConfig);
	}
	SUBCASE("32-bit uuid") {
		spec.include_tx_power = false;
		spec.service_uuid = "1234abcd-0000-1000-8000-00805f9b34fb";
		CHECK(advertising_data_size(spec) == 3 + 6 + 4 + BEACON_SIZE);
	}
	SUBCASE("long name") {
		spec.local_name = "AirChainPay-0123456789abcdefghi";
		CHECK(check_legacy_layout(spec, &why) == ErrorKind::InvalidPayload);
		spec.include_device_name = false;
		CHECK(check_legacy_layout(spec) == ErrorKind::None);
	}
}
