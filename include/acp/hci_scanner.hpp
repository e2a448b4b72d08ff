#pragma once
#include "acp/backends.hpp"
#include "acp/log_sink.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <glib.h>


namespace acp {

/**
* HciScanner
* - BlueZ **HCI raw socket**으로 LE 광고(EVT_LE_ADVERTISING_REPORT)를 직접 수신.
* - 소켓 fd 를 GLib 메인 컨텍스트에 붙여서 이벤트 루프 스레드에서 콜백한다 (별도 스레드 없음).
* - active 스캔: ADV_IND 와 SCAN_RSP 를 주소별로 병합해서 전달.
* - CAP_NET_RAW + CAP_NET_ADMIN 필요.
*/
class HciScanner : public ScanBackend {
public:
	explicit HciScanner(int hci_index = -1, LogSink* log = nullptr);
	~HciScanner() override;

	HciScanner(const HciScanner&) = delete;
	HciScanner& operator=(const HciScanner&) = delete;

	BackendStatus start(std::function<void(const Advertisement&)> on_adv) override;
	void stop() override;

	/** @brief AD(Advertising Data) 구조 파싱 결과를 out 에 병합 */
	static void parse_ad(const uint8_t* data, size_t len, Advertisement& out);

	/** @brief 16-bit UUID → Bluetooth Base UUID 문자열 */
	static std::string uuid16_to_string(uint16_t u);
	/** @brief AD 내 128-bit UUID(LE 바이트열) → 정규 문자열 */
	static std::string uuid128_le_to_string(const uint8_t* le);

private:
	static gboolean on_readable_(gint fd, GIOCondition cond, gpointer user);
	void drain_();
	bool set_scan_enable_(bool on);

	int hci_index_;
	LogSink* log_ = nullptr;
	int dev_ = -1;       ///< HCI raw 소켓 fd
	guint watch_{ 0 };   ///< g_unix_fd_add 소스 id
	std::function<void(const Advertisement&)> on_adv_;
	std::map<std::string, Advertisement> seen_; ///< 주소별 병합 캐시
};

} // namespace acp
