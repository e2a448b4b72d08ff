#pragma once
#include "acp/backends.hpp"
#include "acp/log_sink.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <gio/gio.h>


namespace acp {

/**
* LinuxPermissions
* - Scan      : HCI raw socket → CAP_NET_RAW + CAP_NET_ADMIN (effective set)
* - Connect   : system bus 의 org.bluez.Device1 접근 (D-Bus 정책)
* - Advertise : org.bluez.LEAdvertisingManager1 접근
* - Location  : Linux 에는 해당 없음 → 항상 granted
*
* 상태 매핑: 권한 있음 = Granted, permitted 에 있어 올릴 수 있음 = Denied,
*           정책상 거부(AccessDenied) 또는 permitted 에도 없음 = DeniedForever
*/
class LinuxPermissions : public PermissionBackend {
public:
    LinuxPermissions(GDBusConnection* conn, std::string adapter_path, LogSink* log = nullptr);
    ~LinuxPermissions() override;

    LinuxPermissions(const LinuxPermissions&) = delete;
    LinuxPermissions& operator=(const LinuxPermissions&) = delete;

    std::string identifier(PermissionKind k) const override;
    void query(PermissionKind k, std::function<void(PermissionStatus)> done) override;
    void request(const std::vector<PermissionKind>& kinds,
        std::function<void(const std::map<PermissionKind, PermissionStatus>&)> done) override;

private:
    struct CapState {
        bool effective{ false };
        bool permitted{ false };
    };

    struct BusQuery {
        LinuxPermissions* self;
        std::function<void(PermissionStatus)> done;
    };

    static CapState read_caps_();
    static bool raise_caps_();
    static PermissionStatus from_caps_(const CapState& c);

    void query_bus_(const char* iface, const char* prop, std::function<void(PermissionStatus)> done);
    static void on_bus_query_(GObject* src, GAsyncResult* res, gpointer user);

    LogSink* log_ = nullptr;
    GDBusConnection* conn_{ nullptr };
    GCancellable* cancel_{ nullptr };
    std::string adapter_path_;
};

} // namespace acp
