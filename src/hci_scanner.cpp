#include "acp/hci_scanner.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <glib-unix.h>

extern "C" {
#include <fcntl.h>
#include <unistd.h>
#include <sys/socket.h>
#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
}


namespace acp {

namespace { constexpr const char* TAG = "SCAN"; }


HciScanner::HciScanner(int hci_index, LogSink* log) : hci_index_(hci_index), log_(log) {}


HciScanner::~HciScanner() {
	stop();
}


std::string HciScanner::uuid16_to_string(uint16_t u) {
	char buf[37];
	std::snprintf(buf, sizeof(buf), "0000%04x-0000-1000-8000-00805f9b34fb", u);
	return buf;
}


std::string HciScanner::uuid128_le_to_string(const uint8_t* le) {
	// AD 는 LE → 문자열은 BE 순서
	uint8_t be[16];
	for (int i = 0; i < 16; ++i) be[i] = le[15 - i];
	char buf[37];
	std::snprintf(buf, sizeof(buf),
		"%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
		be[0], be[1], be[2], be[3], be[4], be[5], be[6], be[7],
		be[8], be[9], be[10], be[11], be[12], be[13], be[14], be[15]);
	return buf;
}


void HciScanner::parse_ad(const uint8_t* data, size_t len, Advertisement& out) {
	size_t idx = 0;
	while (idx + 2 <= len) {
		uint8_t field_len = data[idx];
		if (field_len == 0) break;
		if (idx + 1 + field_len > len) break;
		uint8_t type = data[idx + 1];
		const uint8_t* val = &data[idx + 2];
		size_t vlen = field_len - 1;

		switch (type) {
		case 0x08: // Shortened Local Name
		case 0x09: // Complete Local Name
			if (type == 0x09 || !out.local_name)
				out.local_name = std::string(reinterpret_cast<const char*>(val), vlen);
			break;
		case 0x02:
		case 0x03: // 16-bit UUIDs
			for (size_t i = 0; i + 1 < vlen; i += 2) {
				std::string u = uuid16_to_string((uint16_t)(val[i] | (val[i + 1] << 8)));
				bool dup = false;
				for (auto& x : out.service_uuids) if (x == u) dup = true;
				if (!dup) out.service_uuids.push_back(u);
			}
			break;
		case 0x06:
		case 0x07: // 128-bit UUIDs
			for (size_t i = 0; i + 15 < vlen; i += 16) {
				std::string u = uuid128_le_to_string(val + i);
				bool dup = false;
				for (auto& x : out.service_uuids) if (x == u) dup = true;
				if (!dup) out.service_uuids.push_back(u);
			}
			break;
		case 0xFF: // Manufacturer Specific: [company LE 2B][data]
			if (vlen >= 2) {
				uint16_t company = (uint16_t)(val[0] | (val[1] << 8));
				out.manufacturer_data[company] = bytes(val + 2, val + vlen);
			}
			break;
		default:
			break;
		}
		idx += (1 + field_len);
	}
}


BackendStatus HciScanner::start(std::function<void(const Advertisement&)> on_adv) {
	if (dev_ >= 0) stop();

	int dev_id = hci_index_ >= 0 ? hci_index_ : hci_get_route(nullptr);
	if (dev_id < 0) return BackendStatus::failure(ErrorKind::BleNotAvailable, "no HCI device");
	dev_ = hci_open_dev(dev_id);
	if (dev_ < 0) {
		return BackendStatus::failure(ErrorKind::PermissionDenied,
			std::string("hci_open_dev failed: ") + std::strerror(errno));
	}
	hci_index_ = dev_id;

	// 스캔 파라미터 설정 (LE, active: SCAN_RSP 의 이름까지 받기 위해)
	le_set_scan_parameters_cp scan_params{};
	scan_params.type = 0x01; // active
	scan_params.interval = htobs(0x0010);
	scan_params.window = htobs(0x0010);
	scan_params.own_bdaddr_type = 0x00; // public
	scan_params.filter = 0x00; // accept all
	if (hci_send_cmd(dev_, OGF_LE_CTL, OCF_LE_SET_SCAN_PARAMETERS,
		LE_SET_SCAN_PARAMETERS_CP_SIZE, &scan_params) < 0) {
		const std::string msg = std::string("set scan parameters: ") + std::strerror(errno);
		hci_close_dev(dev_); dev_ = -1;
		return BackendStatus::failure(ErrorKind::ScanError, msg);
	}

	// 수신 필터: LE Meta Event만
	struct hci_filter nf {};
	hci_filter_clear(&nf);
	hci_filter_set_ptype(HCI_EVENT_PKT, &nf);
	hci_filter_set_event(EVT_LE_META_EVENT, &nf);
	if (setsockopt(dev_, SOL_HCI, HCI_FILTER, &nf, sizeof(nf)) < 0) {
		if (log_) log_->warn(TAG, "setsockopt HCI_FILTER failed");
	}

	if (!set_scan_enable_(true)) {
		const std::string msg = std::string("set scan enable: ") + std::strerror(errno);
		hci_close_dev(dev_); dev_ = -1;
		return BackendStatus::failure(ErrorKind::ScanError, msg);
	}

	int flags = fcntl(dev_, F_GETFL, 0);
	fcntl(dev_, F_SETFL, flags | O_NONBLOCK);

	seen_.clear();
	on_adv_ = std::move(on_adv);
	watch_ = g_unix_fd_add(dev_, G_IO_IN, &HciScanner::on_readable_, this);
	if (log_) log_->debug(TAG, "HCI scan started on hci" + std::to_string(dev_id));
	return BackendStatus::success();
}


void HciScanner::stop() {
	if (watch_) g_source_remove(watch_);
	watch_ = 0;
	on_adv_ = nullptr;
	if (dev_ < 0) return;
	if (!set_scan_enable_(false) && log_) log_->warn(TAG, "failed to disable LE scan");
	hci_close_dev(dev_);
	dev_ = -1;
}


bool HciScanner::set_scan_enable_(bool on) {
	le_set_scan_enable_cp cp{};
	cp.enable = on ? 0x01 : 0x00;
	cp.filter_dup = 0x00; // SCAN_RSP 병합을 위해 중복도 받는다 (중복 제거는 상위에서)
	return hci_send_cmd(dev_, OGF_LE_CTL, OCF_LE_SET_SCAN_ENABLE, LE_SET_SCAN_ENABLE_CP_SIZE, &cp) >= 0;
}


gboolean HciScanner::on_readable_(gint, GIOCondition, gpointer user) {
	auto* self = static_cast<HciScanner*>(user);
	self->drain_();
	return G_SOURCE_CONTINUE;
}


void HciScanner::drain_() {
	for (;;) {
		uint8_t buf[HCI_MAX_EVENT_SIZE];
		ssize_t n = read(dev_, buf, sizeof(buf));
		if (n <= 0) return; // EAGAIN

		if (n < 1 + HCI_EVENT_HDR_SIZE + 2) continue;
		evt_le_meta_event* meta = (evt_le_meta_event*)(buf + (1 + HCI_EVENT_HDR_SIZE));
		if (meta->subevent != EVT_LE_ADVERTISING_REPORT) continue;

		const uint8_t* end = buf + n;
		const uint8_t* ptr = meta->data + 1; // [0]=num reports
		uint8_t num_reports = meta->data[0];
		for (uint8_t i = 0; i < num_reports; ++i) {
			// evt_type(1) addr_type(1) bdaddr(6) len(1) data(len) rssi(1)
			if (ptr + 9 > end) break;
			bdaddr_t bdaddr; std::memcpy(&bdaddr, ptr + 2, 6);
			uint8_t data_len = ptr[8];
			const uint8_t* data = ptr + 9;
			if (data + data_len + 1 > end) break;
			int8_t rssi = (int8_t)data[data_len];

			char addr[18]{}; ba2str(&bdaddr, addr);
			Advertisement& adv = seen_[addr];
			if (adv.address.empty()) {
				adv.address = addr;
				std::string path = "/org/bluez/hci" + std::to_string(hci_index_) + "/dev_" + addr;
				for (auto& c : path) if (c == ':') c = '_';
				adv.path = path;
			}
			adv.rssi = rssi;
			parse_ad(data, data_len, adv);

			if (on_adv_) {
				auto cb = on_adv_; // 콜백에서 stop 가능
				cb(adv);
				if (dev_ < 0) return;
			}
			ptr = data + data_len + 1;
		}
	}
}

} // namespace acp
