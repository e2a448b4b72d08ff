#include "acp/types.hpp"
#include <cctype>


namespace acp {

const char* to_string(TokenSymbol t) {
	switch (t) {
	case TokenSymbol::USDC: return "USDC";
	case TokenSymbol::USDT: return "USDT";
	case TokenSymbol::ETH: return "ETH";
	case TokenSymbol::TCORE2: return "TCORE2";
	}
	return "?";
}


std::optional<TokenSymbol> parse_token(const std::string& s) {
	if (s == "USDC") return TokenSymbol::USDC;
	if (s == "USDT") return TokenSymbol::USDT;
	if (s == "ETH") return TokenSymbol::ETH;
	if (s == "TCORE2") return TokenSymbol::TCORE2;
	return std::nullopt;
}


int token_decimals(TokenSymbol t) {
	switch (t) {
	case TokenSymbol::USDC:
	case TokenSymbol::USDT: return 6;
	case TokenSymbol::ETH:
	case TokenSymbol::TCORE2: return 18;
	}
	return 0;
}


bool is_valid_amount(const std::string& amount, TokenSymbol token) {
	if (amount.empty()) return false;
	size_t dot = std::string::npos;
	bool nonzero = false;
	for (size_t i = 0; i < amount.size(); ++i) {
		char c = amount[i];
		if (c == '.') {
			if (dot != std::string::npos) return false;
			dot = i;
			continue;
		}
		if (!std::isdigit((unsigned char)c)) return false;
		if (c != '0') nonzero = true;
	}
	if (dot == 0 || dot == amount.size() - 1) return false; // ".5", "5."
	if (!nonzero) return false;
	if (dot != std::string::npos) {
		int frac = (int)(amount.size() - dot - 1);
		if (frac > token_decimals(token)) return false;
	}
	return true;
}


static bool fail_(std::string* why, const char* msg) {
	if (why) *why = msg;
	return false;
}


bool validate_payload(const PaymentPayload& p, std::string* why) {
	if (p.wallet_address.empty()) return fail_(why, "walletAddress is required");
	for (char c : p.wallet_address) {
		if (c == '|' || c == '#' || std::isspace((unsigned char)c))
			return fail_(why, "walletAddress contains reserved characters");
	}
	if (p.device_name.empty()) return fail_(why, "deviceName is required");
	if (p.amount && !is_valid_amount(*p.amount, p.token))
		return fail_(why, "amount must be positive and fit the token decimals");
	if (p.chain_id.find('|') != std::string::npos) return fail_(why, "chainId contains reserved characters");
	if (p.timestamp < 0) return fail_(why, "timestamp must not be negative");
	return true;
}


bool validate_advertising_config(const AdvertisingConfig& c, std::string* why) {
	if (c.tx_power < -30 || c.tx_power > 10) return fail_(why, "txPowerLevel out of range (-30..10)");
	if (c.advertise_mode < 0 || c.advertise_mode > 2) return fail_(why, "advertiseMode out of range (0..2)");
	if (c.interval_ms < 20 || c.interval_ms > 10240) return fail_(why, "interval out of range (20..10240 ms)");
	if (!is_canonical_uuid(c.service_uuid)) return fail_(why, "serviceUUID is not a valid UUID");
	return true;
}


const char* to_string(Capability c) {
	switch (c) {
	case Capability::NativeAdvertiser: return "native";
	case Capability::FallbackAdvertiser: return "fallback";
	case Capability::Unavailable: return "unavailable";
	}
	return "?";
}


const char* to_string(AdvState s) {
	switch (s) {
	case AdvState::Idle: return "idle";
	case AdvState::Starting: return "starting";
	case AdvState::Active: return "active";
	case AdvState::Stopping: return "stopping";
	case AdvState::Failed: return "failed";
	}
	return "?";
}


const char* to_string(AdvertisingMode m) {
	switch (m) {
	case AdvertisingMode::None: return "none";
	case AdvertisingMode::Native: return "native";
	case AdvertisingMode::Fallback: return "fallback";
	case AdvertisingMode::Simulated: return "simulated";
	}
	return "?";
}


const char* to_string(ConnectionStatus s) {
	switch (s) {
	case ConnectionStatus::Disconnected: return "disconnected";
	case ConnectionStatus::Connecting: return "connecting";
	case ConnectionStatus::Connected: return "connected";
	case ConnectionStatus::Error: return "error";
	}
	return "?";
}

} // namespace acp
