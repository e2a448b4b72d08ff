#pragma once
#include "acp/backends.hpp"
#include "acp/log_sink.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <gio/gio.h>
#include <glib.h>

/*
 * BlueZ(D-Bus) 기반 GATT 클라이언트.
 *
 *  connect            → org.bluez.Device1.Connect
 *  discover_services  → ServicesResolved 대기 후 GetManagedObjects 에서 서비스/특성 수집
 *  write              → GattCharacteristic1.WriteValue (type=request)
 *  read               → GattCharacteristic1.ReadValue
 *  subscribe          → StartNotify + PropertiesChanged("Value") 구독
 */

namespace acp {

class BluezCentral : public CentralBackend {
public:
    BluezCentral(GDBusConnection* conn, std::string adapter_path, LogSink* log = nullptr);
    ~BluezCentral() override;

    BluezCentral(const BluezCentral&) = delete;
    BluezCentral& operator=(const BluezCentral&) = delete;

    void connect(const DeviceHandle& dev, StatusCallback done) override;
    void discover_services(const DeviceHandle& dev,
        std::function<void(const BackendStatus&, const std::vector<GattService>&)> done) override;
    void disconnect(const DeviceHandle& dev, StatusCallback done) override;

    void write(const GattCharacteristic& ch, const bytes& value, StatusCallback done) override;
    void read(const GattCharacteristic& ch, std::function<void(const BackendStatus&, const bytes&)> done) override;
    void subscribe(const GattCharacteristic& ch, std::function<void(const bytes&)> on_value,
        std::function<void(const BackendStatus&, unsigned handle)> done) override;
    void unsubscribe(unsigned handle) override;

    /** @brief 핸들의 path 가 비어 있으면 MAC 주소로 오브젝트 경로를 만든다 */
    std::string device_path(const DeviceHandle& dev) const;

private:
    using DiscoverCallback = std::function<void(const BackendStatus&, const std::vector<GattService>&)>;

    struct PendingCall {
        BluezCentral* self;
        ErrorKind kind;
        StatusCallback done;
    };

    struct PendingRead {
        BluezCentral* self;
        std::function<void(const BackendStatus&, const bytes&)> done;
    };

    struct PendingResolve {
        guint sub{ 0 };
        std::vector<DiscoverCallback> waiters;
    };

    struct Notify {
        guint sub{ 0 };
        std::string char_path;
        std::function<void(const bytes&)> on_value;
    };

    void call_(const std::string& path, const char* iface, const char* method, GVariant* params,
        ErrorKind kind, int timeout_ms, StatusCallback done);
    bool services_resolved_(const std::string& dev_path);
    void finish_resolve_(const std::string& dev_path);
    void collect_services_(const std::string& dev_path, std::vector<GattService>& out);

    static void on_call_done_(GObject* src, GAsyncResult* res, gpointer user);
    static void on_read_done_(GObject* src, GAsyncResult* res, gpointer user);
    static void on_device_props_(GDBusConnection*, const gchar*, const gchar* path, const gchar*,
        const gchar*, GVariant* params, gpointer user);
    static void on_char_props_(GDBusConnection*, const gchar*, const gchar* path, const gchar*,
        const gchar*, GVariant* params, gpointer user);

    LogSink* log_ = nullptr;
    GDBusConnection* conn_{ nullptr };
    GCancellable* cancel_{ nullptr };
    std::string adapter_path_;

    std::map<std::string, PendingResolve> resolving_; ///< device path → ServicesResolved 대기
    std::map<unsigned, Notify> notifies_;
    unsigned next_handle_{ 1 };
};

} // namespace acp
