#include "acp/config.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;


namespace acp {

namespace {

// 키가 있으면 타입 검사 후 대입
template <typename T>
void read_(const json& obj, const char* key, T& out) {
	if (obj.contains(key)) out = obj.at(key).get<T>();
}

void read_ms_(const json& obj, const char* key, Millis& out) {
	if (obj.contains(key)) out = Millis(obj.at(key).get<int64_t>());
}

const json& section_(const json& root, const char* key) {
	static const json empty = json::object();
	if (!root.contains(key)) return empty;
	const json& s = root.at(key);
	if (!s.is_object()) throw std::invalid_argument(std::string("section '") + key + "' must be an object");
	return s;
}

} // namespace


bool parse_config(const std::string& text, ProximityConfig& cfg, std::string& err) {
	json root = json::parse(text, nullptr, false);
	if (root.is_discarded() || !root.is_object()) {
		err = "config is not a JSON object";
		return false;
	}

	ProximityConfig c = cfg;
	try {
		read_(root, "device_name", c.device_name);
		read_(root, "hci_index", c.hci_index);

		const json& log = section_(root, "log");
		if (log.contains("level")) {
			if (!parse_log_level(log.at("level").get<std::string>(), c.log_level)) {
				err = "log.level must be one of debug|info|warn|error";
				return false;
			}
		}
		read_(log, "file", c.log_file);
		read_(log, "echo", c.log_echo);

		read_ms_(section_(root, "permissions"), "timeout_ms", c.permission_timeout);

		const json& health = section_(root, "health");
		read_ms_(health, "period_ms", c.health_period);
		read_(health, "max_event_history", c.max_event_history);

		const json& adv = section_(root, "advertising");
		read_(adv, "max_retries", c.advertising.max_retries);
		read_ms_(adv, "attempt_timeout_ms", c.advertising.attempt_timeout);
		read_ms_(adv, "backoff_base_ms", c.advertising.backoff_base);
		read_ms_(adv, "fallback_period_ms", c.advertising.fallback_period);
		read_ms_(adv, "auto_stop_ms", c.advertising.auto_stop);
		read_ms_(adv, "stop_timeout_ms", c.advertising.stop_timeout);
		read_(adv, "radio_check_attempts", c.advertising.radio_check_attempts);
		read_ms_(adv, "radio_check_delay_ms", c.advertising.radio_check_delay);
		read_(adv, "tx_power", c.advertising.advertisement.tx_power);
		read_(adv, "advertise_mode", c.advertising.advertisement.advertise_mode);
		read_(adv, "interval_ms", c.advertising.advertisement.interval_ms);
		read_(adv, "connectable", c.advertising.advertisement.connectable);
		read_(adv, "include_device_name", c.advertising.advertisement.include_device_name);
		read_(adv, "include_tx_power", c.advertising.advertisement.include_tx_power);

		const json& scan = section_(root, "scan");
		read_ms_(scan, "timeout_ms", c.scan_timeout);
		read_(scan, "decrypt_key", c.scan.decrypt_key);

		const json& conn = section_(root, "connection");
		read_(conn, "max_retries", c.connection.max_retries);
		read_ms_(conn, "base_delay_ms", c.connection.base_delay);
		read_(conn, "jitter_ms", c.connection.jitter_ms);
		read_ms_(conn, "timeout_ms", c.connection.timeout);
	}
	catch (const std::exception& e) {
		err = e.what();
		return false;
	}

	if (!validate_config(c, err)) return false;
	cfg = c;
	return true;
}


bool load_config(const std::string& path, ProximityConfig& cfg, std::string& err) {
	std::ifstream f(path);
	if (!f) {
		err = "cannot open " + path;
		return false;
	}
	std::stringstream ss;
	ss << f.rdbuf();
	return parse_config(ss.str(), cfg, err);
}


bool validate_config(const ProximityConfig& cfg, std::string& err) {
	if (!cfg.device_name.empty() &&
		cfg.device_name.compare(0, std::string(ACP_DEVICE_PREFIX).size(), ACP_DEVICE_PREFIX) != 0) {
		err = "device_name must start with " ACP_DEVICE_PREFIX;
		return false;
	}
	if (cfg.advertising.max_retries < 1) { err = "advertising.max_retries must be >= 1"; return false; }
	if (cfg.advertising.radio_check_attempts < 1) { err = "advertising.radio_check_attempts must be >= 1"; return false; }
	if (cfg.connection.max_retries < 1) { err = "connection.max_retries must be >= 1"; return false; }
	if (cfg.connection.jitter_ms < 0) { err = "connection.jitter_ms must be >= 0"; return false; }
	if (cfg.advertising.fallback_period.count() <= 0) { err = "advertising.fallback_period_ms must be > 0"; return false; }
	if (cfg.health_period.count() <= 0) { err = "health.period_ms must be > 0"; return false; }
	if (cfg.max_event_history == 0) { err = "health.max_event_history must be > 0"; return false; }

	std::string why;
	if (!validate_advertising_config(cfg.advertising.advertisement, &why)) {
		err = "advertising: " + why;
		return false;
	}
	return true;
}

} // namespace acp
