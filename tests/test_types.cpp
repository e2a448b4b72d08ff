#include <doctest/doctest.h>
#include "acp/common.hpp"
#include "acp/errors.hpp"
#include "acp/types.hpp"

using namespace acp;


TEST_CASE("amount validation honours token decimals") {
	CHECK(is_valid_amount("1.5", TokenSymbol::USDC));
	CHECK(is_valid_amount("0.000001", TokenSymbol::USDC));
	CHECK_FALSE(is_valid_amount("0.0000001", TokenSymbol::USDC));
	CHECK(is_valid_amount("0.0000001", TokenSymbol::ETH));
	CHECK_FALSE(is_valid_amount("0", TokenSymbol::ETH));
	CHECK_FALSE(is_valid_amount("0.000", TokenSymbol::ETH));
	CHECK_FALSE(is_valid_amount("-1", TokenSymbol::USDT));
	CHECK_FALSE(is_valid_amount(".5", TokenSymbol::USDT));
	CHECK_FALSE(is_valid_amount("5.", TokenSymbol::USDT));
	CHECK_FALSE(is_valid_amount("1.2.3", TokenSymbol::USDT));
	CHECK_FALSE(is_valid_amount("", TokenSymbol::USDT));
	CHECK_FALSE(is_valid_amount("1e5", TokenSymbol::TCORE2));
}

TEST_CASE("payload validation") {
	PaymentPayload p;
	p.wallet_address = "0xabc";
	p.device_name = "AirChainPay-1";
	std::string why;
	CHECK(validate_payload(p, &why));

	p.wallet_address = "0x|abc";
	CHECK_FALSE(validate_payload(p, &why));
	CHECK(why == "walletAddress contains reserved characters");

	p.wallet_address = "0xabc";
	p.device_name.clear();
	CHECK_FALSE(validate_payload(p, &why));

	p.device_name = "AirChainPay-1";
	p.amount = std::string("abc");
	CHECK_FALSE(validate_payload(p));
}

TEST_CASE("advertising config ranges") {
	AdvertisingConfig c;
	c.service_uuid = "0000abcd-0000-1000-8000-00805f9b34fb";
	CHECK(validate_advertising_config(c));
	c.tx_power = 11;
	CHECK_FALSE(validate_advertising_config(c));
	c.tx_power = -30;
	c.interval_ms = 19;
	CHECK_FALSE(validate_advertising_config(c));
	c.interval_ms = 10240;
	c.advertise_mode = 3;
	CHECK_FALSE(validate_advertising_config(c));
	c.advertise_mode = 0;
	c.service_uuid = "abcd";
	CHECK_FALSE(validate_advertising_config(c));
}

TEST_CASE("token parsing and decimals") {
	CHECK(parse_token("TCORE2") == TokenSymbol::TCORE2);
	CHECK_FALSE(parse_token("usdc").has_value());
	CHECK(token_decimals(TokenSymbol::USDT) == 6);
	CHECK(token_decimals(TokenSymbol::ETH) == 18);
}

TEST_CASE("uuid helpers") {
	CHECK(uuid_equals("0000ABCD-0000-1000-8000-00805F9B34FB", "0000abcd-0000-1000-8000-00805f9b34fb"));
	CHECK(is_canonical_uuid("0000abcd-0000-1000-8000-00805f9b34fb"));
	CHECK_FALSE(is_canonical_uuid("0000abcd00001000800000805f9b34fb"));
	CHECK_FALSE(is_canonical_uuid("0000abcd-0000-1000-8000-00805f9b34fz"));
}

TEST_CASE("base64 decoding is strict") {
	bytes out;
	CHECK(base64_decode(base64_encode(std::string("hello")), out));
	CHECK(to_string(out) == "hello");
	CHECK_FALSE(base64_decode("aGVsbG8", out));   // 패딩 누락
	CHECK_FALSE(base64_decode("aGV*bG8=", out));  // 알파벳 외
	CHECK(base64_decode("", out));
	CHECK(out.empty());
}

TEST_CASE("error codes") {
	CHECK(std::string(to_code(ErrorKind::ConnectionFailed)) == "CONNECTION_ERROR");
	CHECK(std::string(to_code(ErrorKind::DeviceNotConnected)) == "DEVICE_NOT_CONNECTED");
	BluetoothError e(ErrorKind::SendFailed, "boom");
	CHECK(e.code() == "SEND_DATA_ERROR");
	CHECK(std::string(e.what()) == "boom");
}
