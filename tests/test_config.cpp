#include <doctest/doctest.h>
#include "acp/config.hpp"
#include "acp/log_sink.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace acp;


TEST_CASE("defaults come from the compile-time config") {
	ProximityConfig cfg;
	std::string err;
	CHECK(validate_config(cfg, err));
	CHECK(cfg.advertising.max_retries == ACP_ADV_MAX_RETRIES);
	CHECK(cfg.advertising.auto_stop == Millis(ACP_ADV_AUTO_STOP_MS));
	CHECK(cfg.scan_timeout == Millis(ACP_SCAN_TIMEOUT_MS));
	CHECK(cfg.connection.max_retries == ACP_CONNECT_MAX_RETRIES);
	CHECK(cfg.log_level == LogLevel::Info);
}

TEST_CASE("sections override only the keys they name") {
	ProximityConfig cfg;
	std::string err;
	const char* text = R"({
		"device_name": "AirChainPay-0042",
		"hci_index": 1,
		"log": { "level": "debug", "file": "/tmp/acp.log", "echo": false },
		"permissions": { "timeout_ms": 2500 },
		"health": { "period_ms": 10000, "max_event_history": 50 },
		"advertising": { "max_retries": 5, "auto_stop_ms": 120000, "tx_power": -12, "connectable": false },
		"scan": { "timeout_ms": 15000, "decrypt_key": "k3y" },
		"connection": { "jitter_ms": 0, "base_delay_ms": 500 },
		"future_section": { "whatever": true }
	})";
	REQUIRE_MESSAGE(parse_config(text, cfg, err), err);

	CHECK(cfg.device_name == "AirChainPay-0042");
	CHECK(cfg.hci_index == 1);
	CHECK(cfg.log_level == LogLevel::Debug);
	CHECK(cfg.log_file == "/tmp/acp.log");
	CHECK_FALSE(cfg.log_echo);
	CHECK(cfg.permission_timeout == Millis(2500));
	CHECK(cfg.health_period == Millis(10000));
	CHECK(cfg.max_event_history == 50);
	CHECK(cfg.advertising.max_retries == 5);
	CHECK(cfg.advertising.auto_stop == Millis(120000));
	CHECK(cfg.advertising.advertisement.tx_power == -12);
	CHECK_FALSE(cfg.advertising.advertisement.connectable);
	CHECK(cfg.advertising.attempt_timeout == Millis(ACP_ADV_ATTEMPT_TIMEOUT_MS));
	CHECK(cfg.scan_timeout == Millis(15000));
	CHECK(cfg.scan.decrypt_key == "k3y");
	CHECK(cfg.connection.jitter_ms == 0);
	CHECK(cfg.connection.base_delay == Millis(500));
	CHECK(cfg.connection.max_retries == ACP_CONNECT_MAX_RETRIES);
}

TEST_CASE("rejected configs leave the target untouched") {
	ProximityConfig cfg;
	cfg.device_name = "AirChainPay-0001";
	std::string err;

	SUBCASE("not JSON") {
		CHECK_FALSE(parse_config("device_name = x", cfg, err));
	}
	SUBCASE("wrong type") {
		CHECK_FALSE(parse_config(R"({"advertising": {"max_retries": "three"}})", cfg, err));
		CHECK_FALSE(err.empty());
	}
	SUBCASE("section is not an object") {
		CHECK_FALSE(parse_config(R"({"scan": 5})", cfg, err));
		CHECK(err.find("scan") != std::string::npos);
	}
	SUBCASE("device name prefix") {
		CHECK_FALSE(parse_config(R"({"device_name": "Headphones"})", cfg, err));
		CHECK(err.find(ACP_DEVICE_PREFIX) != std::string::npos);
	}
	SUBCASE("unknown log level") {
		CHECK_FALSE(parse_config(R"({"log": {"level": "verbose"}})", cfg, err));
	}
	SUBCASE("retry bound") {
		CHECK_FALSE(parse_config(R"({"advertising": {"max_retries": 0}})", cfg, err));
	}
	SUBCASE("tx power range") {
		CHECK_FALSE(parse_config(R"({"advertising": {"tx_power": 20}})", cfg, err));
		CHECK(err.find("advertising") == 0);
	}
	CHECK(cfg.device_name == "AirChainPay-0001");
	CHECK(cfg.advertising.max_retries == ACP_ADV_MAX_RETRIES);
}

TEST_CASE("load_config reads a file") {
	const std::string path = "acp_test_config.json";
	{
		std::ofstream f(path);
		f << R"({"scan": {"timeout_ms": 5000}})";
	}
	ProximityConfig cfg;
	std::string err;
	CHECK(load_config(path, cfg, err));
	CHECK(cfg.scan_timeout == Millis(5000));
	std::remove(path.c_str());

	CHECK_FALSE(load_config("does/not/exist.json", cfg, err));
	CHECK(err.find("cannot open") == 0);
}

TEST_CASE("log sink filters by level and writes tagged lines") {
	const std::string path = "acp_test_log.txt";
	std::remove(path.c_str());

	LogLevel lv;
	CHECK(parse_log_level("warn", lv));
	CHECK(lv == LogLevel::Warn);
	CHECK_FALSE(parse_log_level("WARN", lv));

	{
		LogSink log;
		log.set_echo(false);
		REQUIRE(log.open(path));
		log.set_level(LogLevel::Info);
		log.debug("ADV", "hidden");
		log.info("ADV", "advertising started");
		log.error("SCAN", "scan failed");
		CHECK(log.count(LogLevel::Debug) == 1);
		CHECK(log.count(LogLevel::Info) == 1);
		CHECK(log.count(LogLevel::Error) == 1);
	}

	std::ifstream in(path);
	std::string l1, l2, l3;
	REQUIRE(std::getline(in, l1));
	REQUIRE(std::getline(in, l2));
	CHECK_FALSE(std::getline(in, l3));
	CHECK(l1.find("| INFO  | [ADV] advertising started") != std::string::npos);
	CHECK(l2.find("| ERROR | [SCAN] scan failed") != std::string::npos);
	in.close();
	std::remove(path.c_str());
}
