// acp_proximityd: AirChainPay BLE 근접 결제 데몬
//
// Usage:
//   acp_proximityd advertise --wallet 0xABC [--amount 1.5] [--token USDC] [--chain core_testnet]
//                            [--encrypt KEY] [--auth]
//   acp_proximityd scan [--timeout SEC] [--key KEY]
//   acp_proximityd send --device AA:BB:CC:DD:EE:FF --data TEXT
//   acp_proximityd read --device AA:BB:CC:DD:EE:FF [--key KEY]
//   acp_proximityd status
// 공통: [--config FILE] [--hci N] [--log-level debug|info|warn|error] [--log-file FILE]
#include "acp/bluez_central.hpp"
#include "acp/bluez_radio.hpp"
#include "acp/config.hpp"
#include "acp/errors.hpp"
#include "acp/event_loop.hpp"
#include "acp/hci_scanner.hpp"
#include "acp/linux_permissions.hpp"
#include "acp/log_sink.hpp"
#include "acp/proximity_subsystem.hpp"
#include "acp/wire_codec.hpp"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <glib-unix.h>

using namespace acp;

namespace {

struct Args {
	std::string mode;
	std::string config_path;
	std::optional<int> hci;
	std::optional<std::string> log_level;
	std::optional<std::string> log_file;

	// advertise
	std::string wallet;
	std::optional<std::string> amount;
	std::string token{ "USDC" };
	std::string chain{ "core_testnet" };
	std::string encrypt_key;
	bool auth{ false };

	// scan
	int timeout_s{ 0 };
	std::string decrypt_key;

	// send / read
	std::string device;
	std::string data;
};

void usage(const char* prog) {
	std::printf("usage: %s advertise|scan|send|read|status [options]\n"
		"  advertise --wallet ADDR [--amount N] [--token USDC|USDT|ETH|TCORE2] [--chain ID] [--encrypt KEY] [--auth]\n"
		"  scan      [--timeout SEC] [--key KEY]\n"
		"  send      --device MAC --data TEXT\n"
		"  read      --device MAC [--key KEY]\n"
		"  common    [--config FILE] [--hci N] [--log-level LEVEL] [--log-file FILE]\n", prog);
}

bool parse_args(int argc, char** argv, Args& a) {
	if (argc < 2) return false;
	a.mode = argv[1];
	for (int i = 2; i < argc; ++i) {
		const bool has_val = i + 1 < argc;
		if (!strcmp(argv[i], "--config") && has_val) a.config_path = argv[++i];
		else if (!strcmp(argv[i], "--hci") && has_val) a.hci = atoi(argv[++i]);
		else if (!strcmp(argv[i], "--log-level") && has_val) a.log_level = argv[++i];
		else if (!strcmp(argv[i], "--log-file") && has_val) a.log_file = argv[++i];
		else if (!strcmp(argv[i], "--wallet") && has_val) a.wallet = argv[++i];
		else if (!strcmp(argv[i], "--amount") && has_val) a.amount = argv[++i];
		else if (!strcmp(argv[i], "--token") && has_val) a.token = argv[++i];
		else if (!strcmp(argv[i], "--chain") && has_val) a.chain = argv[++i];
		else if (!strcmp(argv[i], "--encrypt") && has_val) a.encrypt_key = argv[++i];
		else if (!strcmp(argv[i], "--auth")) a.auth = true;
		else if (!strcmp(argv[i], "--timeout") && has_val) a.timeout_s = atoi(argv[++i]);
		else if (!strcmp(argv[i], "--key") && has_val) a.decrypt_key = argv[++i];
		else if (!strcmp(argv[i], "--device") && has_val) a.device = argv[++i];
		else if (!strcmp(argv[i], "--data") && has_val) a.data = argv[++i];
		else return false;
	}
	return a.mode == "advertise" || a.mode == "scan" || a.mode == "send" || a.mode == "read" || a.mode == "status";
}

gboolean on_signal(gpointer user) {
	static_cast<GlibEventLoop*>(user)->quit();
	return G_SOURCE_CONTINUE;
}


int run_advertise(ProximitySubsystem& sys, GlibEventLoop& loop, const Args& a, LogSink& log) {
	auto token = parse_token(a.token);
	if (!token) {
		log.error("APP", "unknown token: " + a.token);
		return 2;
	}
	PaymentPayload p;
	p.wallet_address = a.wallet;
	p.amount = a.amount;
	p.token = *token;
	p.chain_id = a.chain;

	std::optional<SecurityConfig> sec;
	if (!a.encrypt_key.empty() || a.auth) {
		SecurityConfig sc;
		sc.enable_encryption = !a.encrypt_key.empty();
		sc.encryption_key = a.encrypt_key;
		sc.enable_authentication = a.auth;
		sec = sc;
	}

	sys.advertising().add_incoming_listener([&log](const std::string& device, const std::string& data) {
		log.info("APP", "incoming from " + device + ": " + data);
	});
	const int listener = sys.advertising().add_advertising_listener([&loop](bool active) {
		if (!active) loop.quit(); // 자동 정지 포함
	});

	AdvertiseResult r = sys.start_advertising(p, sec);
	if (!r.success) {
		log.error("APP", std::string("advertising failed [") + to_code(r.error) + "]: " + r.message);
		if (r.needs_settings_redirect) log.error("APP", "grant the missing permissions and restart the daemon");
		sys.advertising().remove_advertising_listener(listener);
		return 1;
	}
	log.info("APP", "advertising as " + sys.device_name() + " (" + to_string(r.mode) + "), Ctrl-C to stop");
	if (r.error != ErrorKind::None) log.warn("APP", r.message);

	loop.run();
	sys.advertising().remove_advertising_listener(listener);
	sys.stop_advertising();
	std::printf("%s\n", sys.get_advertising_report().c_str());
	return 0;
}


int run_scan(ProximitySubsystem& sys, GlibEventLoop& loop, const Args& a, LogSink& log) {
	std::optional<Millis> timeout;
	if (a.timeout_s > 0) timeout = Millis(a.timeout_s * 1000);

	BackendStatus st = sys.start_scan([&log](const ScanResult& r) {
		std::string line = r.device.id + " \"" + r.device.name + "\" rssi=" + std::to_string(r.rssi);
		if (r.payload) {
			line += " wallet=" + r.payload->wallet_address;
			if (r.payload->amount) line += " amount=" + *r.payload->amount;
			line += std::string(" token=") + to_string(r.payload->token) + " chain=" + r.payload->chain_id;
		}
		else if (r.payment_over_gatt) line += " (payment via read --device " + r.device.id + ")";
		if (r.encrypted) line += " (encrypted)";
		log.info("APP", "found " + line);
	}, timeout);
	if (!st.ok) {
		log.error("APP", std::string("scan failed [") + to_code(st.error) + "]: " + st.message);
		return 1;
	}

	// 스캔 타임아웃이 지나면 루프 종료
	loop.add_timer(Millis(100), [&sys, &loop]() {
		if (sys.scanning().is_scanning()) return true;
		loop.quit();
		return false;
	});
	loop.run();
	sys.stop_scan();
	log.info("APP", std::to_string(sys.scanning().discovered_devices().size()) + " device(s) discovered");
	return 0;
}


int run_send(ProximitySubsystem& sys, const Args& a, LogSink& log) {
	if (a.device.empty() || a.data.empty()) {
		log.error("APP", "send requires --device and --data");
		return 2;
	}
	DeviceHandle dev;
	dev.id = a.device;
	try {
		sys.connect_to_device(dev);
		sys.send_data_to_device(dev.id, a.data);
		log.info("APP", "sent " + std::to_string(a.data.size()) + " byte(s) to " + dev.id);
		sys.disconnect_from_device(dev.id);
	}
	catch (const BluetoothError& e) {
		log.error("APP", std::string("[") + e.code() + "] " + e.what());
		sys.disconnect_from_device(dev.id);
		return 1;
	}
	return 0;
}


int run_read(ProximitySubsystem& sys, const Args& a, LogSink& log) {
	if (a.device.empty()) {
		log.error("APP", "read requires --device");
		return 2;
	}
	DeviceHandle dev;
	dev.id = a.device;
	try {
		sys.connect_to_device(dev);
		WireMessage m = sys.read_payment_from_device(dev.id);
		std::printf("%s\n", encode_wire(m).c_str());
		sys.disconnect_from_device(dev.id);
	}
	catch (const BluetoothError& e) {
		log.error("APP", std::string("[") + e.code() + "] " + e.what());
		sys.disconnect_from_device(dev.id);
		return 1;
	}
	return 0;
}


int run_status(ProximitySubsystem& sys) {
	AdvertisingSupport s = sys.check_advertising_support();
	std::printf("device     : %s\n", sys.device_name().c_str());
	std::printf("capability : %s\n", to_string(sys.capability()));
	std::printf("supported  : %s\n", s.supported ? "yes" : "no");
	for (auto& kv : s.details) std::printf("  %-18s %s\n", kv.first.c_str(), kv.second.c_str());

	Diagnostics d = sys.run_diagnostics();
	for (auto& i : d.issues) std::printf("issue      : %s\n", i.c_str());
	for (auto& r : d.recommendations) std::printf("recommend  : %s\n", r.c_str());
	return s.supported ? 0 : 1;
}

} // namespace


int main(int argc, char** argv) {
	Args args;
	if (!parse_args(argc, argv, args)) {
		usage(argv[0]);
		return 2;
	}

	ProximityConfig cfg;
	std::string err;
	if (!args.config_path.empty() && !load_config(args.config_path, cfg, err)) {
		std::fprintf(stderr, "config: %s\n", err.c_str());
		return 2;
	}
	if (args.hci) cfg.hci_index = *args.hci;
	if (args.log_file) cfg.log_file = *args.log_file;
	if (args.log_level && !parse_log_level(*args.log_level, cfg.log_level)) {
		std::fprintf(stderr, "unknown log level: %s\n", args.log_level->c_str());
		return 2;
	}
	if (!args.decrypt_key.empty()) cfg.scan.decrypt_key = args.decrypt_key;
	if (!validate_config(cfg, err)) {
		std::fprintf(stderr, "config: %s\n", err.c_str());
		return 2;
	}

	LogSink log;
	log.set_level(cfg.log_level);
	log.set_echo(cfg.log_echo);
	if (!cfg.log_file.empty() && !log.open(cfg.log_file)) {
		std::fprintf(stderr, "cannot open log file %s\n", cfg.log_file.c_str());
	}

	GlibEventLoop loop;
	g_unix_signal_add(SIGINT, on_signal, &loop);
	g_unix_signal_add(SIGTERM, on_signal, &loop);

	BluezRadio radio(&log);
	if (!radio.init(err)) log.error("RADIO", "BlueZ init failed: " + err);
	radio.set_call_timeout(cfg.advertising.attempt_timeout);
	HciScanner scanner(cfg.hci_index, &log);
	BluezCentral central(radio.connection(), radio.adapter_path(), &log);
	LinuxPermissions perms(radio.connection(), radio.adapter_path(), &log);

	SubsystemBackends backends;
	backends.adapter = &radio;
	backends.advertiser = &radio;
	backends.scanner = &scanner;
	backends.central = &central;
	backends.permissions = &perms;

	try {
		ProximitySubsystem sys(loop, backends, cfg, log);
		if (args.mode == "advertise") return run_advertise(sys, loop, args, log);
		if (args.mode == "scan") return run_scan(sys, loop, args, log);
		if (args.mode == "send") return run_send(sys, args, log);
		if (args.mode == "read") return run_read(sys, args, log);
		return run_status(sys);
	}
	catch (const BluetoothError& e) {
		log.error("APP", std::string("[") + e.code() + "] " + e.what());
		return 1;
	}
}
