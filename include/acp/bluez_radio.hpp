#pragma once
#include "acp/backends.hpp"
#include "acp/log_sink.hpp"
#include "config/acp_config.h"
#include <functional>
#include <string>
#include <vector>
#include <gio/gio.h>
#include <glib.h>

/*
 * BlueZ(D-Bus) 기반 어댑터 + 광고 + GATT 서버.
 *
 * 동작:
 *  - org.bluez.Adapter1 의 Powered 조회/구독
 *  - LEAdvertisement1 오브젝트를 내보내고 RegisterAdvertisement (비동기)
 *  - GattService1/GattCharacteristic1 을 내보내 원격 기기의 WriteValue 수신
 *  - ReadValue 는 현재 광고 중인 전체 와이어 메시지(JSON)를 offset 부터 돌려준다
 */

namespace acp {

class BluezRadio : public RadioAdapter, public NativeAdvertiser {
public:
    explicit BluezRadio(LogSink* log = nullptr);
    ~BluezRadio() override;

    BluezRadio(const BluezRadio&) = delete;
    BluezRadio& operator=(const BluezRadio&) = delete;

    // 시스템 버스 연결 + 어댑터 탐색 + 오브젝트 export
    bool init(std::string& err);

    // RadioAdapter
    Capability resolve_capability() override;
    bool powered() override;
    void watch_power(std::function<void(bool)> cb) override;
    std::string describe() const override;

    // NativeAdvertiser
    void broadcast(const AdvertisementSpec& spec, StatusCallback done) override;
    void stop_broadcast(StatusCallback done) override;
    void set_write_handler(std::function<void(const std::string&, const bytes&)> cb) override;

    /** @brief RegisterAdvertisement 의 D-Bus 타임아웃 (광고 시도 타임아웃 이하로 둔다) */
    void set_call_timeout(Millis t) { call_timeout_ms_ = (int)t.count(); }

    GDBusConnection* connection() const { return conn_; }
    const std::string& adapter_path() const { return adapter_path_; }

private:
    struct PendingCall {
        BluezRadio* self;
        StatusCallback done;
    };

    bool export_objects_(std::string& err);
    void unexport_objects_();
    void register_adv_(StatusCallback done);
    void unregister_adv_(StatusCallback done);
    void register_app_();
    GVariant* get_managed_objects_();

    static void on_register_adv_(GObject* src, GAsyncResult* res, gpointer user);
    static void on_unregister_adv_(GObject* src, GAsyncResult* res, gpointer user);
    static void on_register_app_(GObject* src, GAsyncResult* res, gpointer user);
    static void on_props_changed_(GDBusConnection*, const gchar*, const gchar*, const gchar*,
        const gchar*, GVariant* params, gpointer user);

    // ==== DBus XML/VTABLE ====
    static const char* SERVICE_IF_XML;
    static const char* CHAR_IF_XML;
    static const char* ADV_IF_XML;
    static const char* OBJMGR_IF_XML;

    static void objmgr_method_call(GDBusConnection* c, const gchar* sender, const gchar* obj_path,
        const gchar* iface, const gchar* method, GVariant* params,
        GDBusMethodInvocation* inv, gpointer user_data);
    static GVariant* service_get(GDBusConnection*, const gchar*, const gchar*, const gchar*,
        const gchar* prop, GError**, gpointer user_data);
    static GVariant* char_get(GDBusConnection*, const gchar*, const gchar*, const gchar*,
        const gchar* prop, GError**, gpointer user_data);
    static GVariant* adv_get(GDBusConnection*, const gchar*, const gchar*, const gchar*,
        const gchar* prop, GError**, gpointer user_data);
    static void char_method_call(GDBusConnection*, const gchar*, const gchar*, const gchar*,
        const gchar* method, GVariant* params, GDBusMethodInvocation* inv, gpointer user_data);
    static void adv_method_call(GDBusConnection*, const gchar*, const gchar*, const gchar* iface,
        const gchar* method, GVariant*, GDBusMethodInvocation* inv, gpointer user_data);

    static const GDBusInterfaceVTable SERVICE_VTABLE;
    static const GDBusInterfaceVTable CHAR_VTABLE;
    static const GDBusInterfaceVTable ADV_VTABLE;
    static const GDBusInterfaceVTable OBJMGR_VTABLE;

    LogSink* log_ = nullptr;
    GDBusConnection* conn_{ nullptr };
    GCancellable* cancel_{ nullptr };
    std::string adapter_path_;

    guint reg_service_{ 0 };
    guint reg_char_{ 0 };
    guint reg_adv_{ 0 };
    guint reg_objmgr_{ 0 };
    guint power_sub_{ 0 };

    bool app_registered_{ false };
    bool adv_registered_{ false };   ///< 등록됐거나 등록 여부를 알 수 없음
    bool register_pending_{ false };
    bool stop_requested_{ false };   ///< 등록 응답 전에 정지 요청됨
    int call_timeout_ms_{ ACP_ADV_ATTEMPT_TIMEOUT_MS };
    AdvertisementSpec spec_;

    std::vector<std::function<void(bool)>> power_watchers_;
    std::function<void(const std::string&, const bytes&)> write_handler_;
};

} // namespace acp
