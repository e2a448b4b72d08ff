#include "acp/security_layer.hpp"
#include <glib.h>
#include <sstream>


namespace acp {

namespace {

constexpr const char* TAG = "SEC";

std::string sha256_hex(const std::string& s) {
	gchar* d = g_compute_checksum_for_string(G_CHECKSUM_SHA256, s.c_str(), (gssize)s.size());
	std::string out = d ? d : "";
	g_free(d);
	return out;
}

std::string random_hex(int words) {
	std::ostringstream os;
	os << std::hex;
	for (int i = 0; i < words; ++i) os << g_random_int();
	return os.str();
}

} // namespace


SecurityLayer::SecurityLayer(EventLoop& loop, LogSink* log) : loop_(loop), log_(log) {}


std::string SecurityLayer::xor_encode(const std::string& plain, const std::string& key) {
	if (key.empty()) return plain;
	bytes out(plain.size());
	for (size_t i = 0; i < plain.size(); ++i)
		out[i] = (uint8_t)plain[i] ^ (uint8_t)key[i % key.size()];
	return base64_encode(out);
}


bool SecurityLayer::xor_decode(const std::string& encoded, const std::string& key, std::string& out) {
	if (key.empty()) { out = encoded; return true; }
	bytes raw;
	if (!base64_decode(encoded, raw)) return false;
	out.resize(raw.size());
	for (size_t i = 0; i < raw.size(); ++i)
		out[i] = (char)(raw[i] ^ (uint8_t)key[i % key.size()]);
	return true;
}


SecurityLayer::SecureResult SecurityLayer::create_secure_payload(const PaymentPayload& p,
	const SecurityConfig& cfg, const std::string& session_id) {
	SecureResult r{ p, false };
	if (!cfg.enable_encryption || cfg.encryption_key.empty()) return r;

	SecurityMetrics* m = session_(session_id);
	if (m) m->encryption_attempts++;

	r.payload.wallet_address = xor_encode(p.wallet_address, cfg.encryption_key);
	if (p.amount) r.payload.amount = xor_encode(*p.amount, cfg.encryption_key);
	r.encrypted = true;

	if (m) m->successful_encryptions++;
	if (log_) log_->debug(TAG, "payload encrypted for " + p.device_name);
	return r;
}


bool SecurityLayer::decrypt_fields(const PaymentPayload& in, const std::string& key, PaymentPayload& out) {
	PaymentPayload p = in;
	if (!xor_decode(in.wallet_address, key, p.wallet_address)) return false;
	if (in.amount) {
		std::string a;
		if (!xor_decode(*in.amount, key, a)) return false;
		p.amount = a;
	}
	out = p;
	return true;
}


std::optional<PaymentPayload> SecurityLayer::decrypt_payload(const PaymentPayload& p, const std::string& key,
	const std::string& session_id) {
	SecurityMetrics* m = session_(session_id);
	if (m) m->encryption_attempts++;

	PaymentPayload out;
	if (!decrypt_fields(p, key, out)) {
		if (m) m->failed_encryptions++;
		record_error_(session_id, "decryption failed: malformed ciphertext");
		return std::nullopt;
	}
	if (m) m->successful_encryptions++;
	return out;
}


std::string SecurityLayer::generate_auth_token(const std::string& device_name, Millis ttl,
	const std::string& session_id) {
	const int64_t now = loop_.wall_ms();
	std::ostringstream seed;
	seed << device_name << '|' << now << '|' << random_hex(4);

	TokenEntry e;
	e.token = sha256_hex(seed.str());
	e.expires_at = now + ttl.count();
	tokens_[device_name] = e;

	if (SecurityMetrics* m = session_(session_id)) m->authentication_attempts++;
	if (log_) log_->debug(TAG, "auth token issued for " + device_name);
	return e.token;
}


bool SecurityLayer::validate_auth_token(const std::string& device_name, const std::string& token,
	const std::string& session_id) {
	SecurityMetrics* m = session_(session_id);
	auto it = tokens_.find(device_name);

	bool ok = false;
	if (it != tokens_.end()) {
		if (loop_.wall_ms() >= it->second.expires_at) {
			tokens_.erase(it);
			record_error_(session_id, "auth token expired for " + device_name);
		}
		else {
			ok = (it->second.token == token);
		}
	}

	if (m) {
		if (ok) m->successful_authentications++;
		else m->failed_authentications++;
	}
	return ok;
}


bool SecurityLayer::has_auth_token(const std::string& device_name) const {
	return tokens_.count(device_name) != 0;
}


std::string SecurityLayer::generate_encryption_key(const std::string& device_name) {
	std::ostringstream seed;
	seed << device_name << '|' << loop_.wall_ms() << '|' << random_hex(4);
	std::string key = sha256_hex(seed.str()).substr(0, 32);
	keys_[device_name] = key;
	return key;
}


std::optional<std::string> SecurityLayer::encryption_key(const std::string& device_name) const {
	auto it = keys_.find(device_name);
	if (it == keys_.end()) return std::nullopt;
	return it->second;
}


void SecurityLayer::open_session(const std::string& session_id) {
	metrics_.emplace(session_id, SecurityMetrics{});
}


void SecurityLayer::close_session(const std::string& session_id, const std::string& device_name) {
	metrics_.erase(session_id);
	tokens_.erase(device_name);
	keys_.erase(device_name);
	size_t n = purge_expired();
	if (log_ && n) log_->debug(TAG, "purged " + std::to_string(n) + " expired token(s)");
}


size_t SecurityLayer::purge_expired() {
	const int64_t now = loop_.wall_ms();
	size_t n = 0;
	for (auto it = tokens_.begin(); it != tokens_.end();) {
		if (now >= it->second.expires_at) { it = tokens_.erase(it); ++n; }
		else ++it;
	}
	return n;
}


const SecurityMetrics* SecurityLayer::metrics(const std::string& session_id) const {
	auto it = metrics_.find(session_id);
	return it == metrics_.end() ? nullptr : &it->second;
}


SecurityStatistics SecurityLayer::statistics() const {
	SecurityStatistics s;
	s.total_sessions = metrics_.size();
	uint32_t enc_attempts = 0;
	size_t errors = 0;
	for (auto& kv : metrics_) {
		const SecurityMetrics& m = kv.second;
		s.successful_encryptions += m.successful_encryptions;
		s.failed_encryptions += m.failed_encryptions;
		s.successful_authentications += m.successful_authentications;
		s.failed_authentications += m.failed_authentications;
		enc_attempts += m.encryption_attempts;
		errors += m.errors.size();
	}
	if (s.total_sessions) s.average_security_errors = (double)errors / (double)s.total_sessions;
	if (enc_attempts) s.encryption_success_rate = 100.0 * s.successful_encryptions / enc_attempts;
	const uint32_t auth_done = s.successful_authentications + s.failed_authentications;
	if (auth_done) s.authentication_success_rate = 100.0 * s.successful_authentications / auth_done;
	return s;
}


SecurityMetrics* SecurityLayer::session_(const std::string& session_id) {
	if (session_id.empty()) return nullptr;
	auto it = metrics_.find(session_id);
	return it == metrics_.end() ? nullptr : &it->second;
}


void SecurityLayer::record_error_(const std::string& session_id, const std::string& msg) {
	if (log_) log_->warn(TAG, msg);
	if (SecurityMetrics* m = session_(session_id)) m->errors.push_back(msg);
}

} // namespace acp
