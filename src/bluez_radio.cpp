#include "acp/bluez_radio.hpp"
#include "config/acp_config.h"
#include <memory>


namespace acp {

namespace {

constexpr const char* TAG = "RADIO";

const char* APP_PATH = "/org/airchainpay/app";
const char* SERVICE_PATH = "/org/airchainpay/app/service0";
const char* CHAR_PATH = "/org/airchainpay/app/service0/char0";
const char* ADV_PATH = "/org/airchainpay/adv0";

GVariant* byte_array(const bytes& v) {
    return g_variant_new_fixed_array(G_VARIANT_TYPE_BYTE, v.data(), v.size(), sizeof(guchar));
}

std::string take_error(GError* err) {
    std::string msg = err ? err->message : "unknown error";
    if (err) g_error_free(err);
    return msg;
}

} // namespace


const char* BluezRadio::SERVICE_IF_XML = R"XML(
<node>
  <interface name="org.bluez.GattService1">
    <property name="UUID" type="s" access="read"/>
    <property name="Primary" type="b" access="read"/>
    <property name="Includes" type="ao" access="read"/>
  </interface>
</node>
)XML";

const char* BluezRadio::CHAR_IF_XML = R"XML(
<node>
  <interface name="org.bluez.GattCharacteristic1">
    <method name="ReadValue">
      <arg type="a{sv}" name="Options" direction="in"/>
      <arg type="ay"    name="Value"   direction="out"/>
    </method>
    <method name="WriteValue">
      <arg type="ay"    name="Value"   direction="in"/>
      <arg type="a{sv}" name="Options" direction="in"/>
    </method>
    <property name="UUID"     type="s"  access="read"/>
    <property name="Service"  type="o"  access="read"/>
    <property name="Flags"    type="as" access="read"/>
    <property name="Descriptors" type="ao" access="read"/>
  </interface>
</node>
)XML";

const char* BluezRadio::ADV_IF_XML = R"XML(
<node>
  <interface name="org.bluez.LEAdvertisement1">
    <method name="Release"/>
    <property name="Type"             type="s"      access="read"/>
    <property name="ServiceUUIDs"     type="as"     access="read"/>
    <property name="ManufacturerData" type="a{qv}"  access="read"/>
    <property name="LocalName"        type="s"      access="read"/>
    <property name="Includes"         type="as"     access="read"/>
    <property name="MinInterval"      type="u"      access="read"/>
    <property name="MaxInterval"      type="u"      access="read"/>
    <property name="TxPower"          type="n"      access="read"/>
  </interface>
</node>
)XML";

const char* BluezRadio::OBJMGR_IF_XML = R"XML(
<node>
  <interface name="org.freedesktop.DBus.ObjectManager">
    <method name="GetManagedObjects">
      <arg type="a{oa{sa{sv}}}" direction="out"/>
    </method>
  </interface>
</node>
)XML";

const GDBusInterfaceVTable BluezRadio::SERVICE_VTABLE = { nullptr, BluezRadio::service_get, nullptr };
const GDBusInterfaceVTable BluezRadio::CHAR_VTABLE = { BluezRadio::char_method_call, BluezRadio::char_get, nullptr };
const GDBusInterfaceVTable BluezRadio::ADV_VTABLE = { BluezRadio::adv_method_call, BluezRadio::adv_get, nullptr };
const GDBusInterfaceVTable BluezRadio::OBJMGR_VTABLE = { BluezRadio::objmgr_method_call, nullptr, nullptr };


BluezRadio::BluezRadio(LogSink* log) : log_(log) {
    cancel_ = g_cancellable_new();
}


BluezRadio::~BluezRadio() {
    // 진행 중인 비동기 호출의 콜백이 this 를 건드리지 않도록
    g_cancellable_cancel(cancel_);

    if (conn_ && adv_registered_) {
        GVariant* r = g_dbus_connection_call_sync(conn_, "org.bluez", adapter_path_.c_str(),
            "org.bluez.LEAdvertisingManager1", "UnregisterAdvertisement",
            g_variant_new("(o)", ADV_PATH), nullptr, G_DBUS_CALL_FLAGS_NONE, 2000, nullptr, nullptr);
        if (r) g_variant_unref(r);
    }
    if (conn_ && app_registered_) {
        GVariant* r = g_dbus_connection_call_sync(conn_, "org.bluez", adapter_path_.c_str(),
            "org.bluez.GattManager1", "UnregisterApplication",
            g_variant_new("(o)", APP_PATH), nullptr, G_DBUS_CALL_FLAGS_NONE, 2000, nullptr, nullptr);
        if (r) g_variant_unref(r);
    }
    if (conn_ && power_sub_) g_dbus_connection_signal_unsubscribe(conn_, power_sub_);
    unexport_objects_();
    if (conn_) g_object_unref(conn_);
    g_object_unref(cancel_);
}


bool BluezRadio::init(std::string& err) {
    GError* e = nullptr;
    conn_ = g_bus_get_sync(G_BUS_TYPE_SYSTEM, nullptr, &e);
    if (!conn_) {
        err = "system bus: " + take_error(e);
        return false;
    }

    GVariant* objs = get_managed_objects_();
    if (objs) {
        GVariantIter* it = nullptr; g_variant_get(objs, "(a{oa{sa{sv}}})", &it);
        const gchar* objpath = nullptr; GVariant* ifaces = nullptr;
        while (g_variant_iter_loop(it, "{&o@a{sa{sv}}}", &objpath, &ifaces)) {
            GVariant* adapter = g_variant_lookup_value(ifaces, "org.bluez.Adapter1", G_VARIANT_TYPE("a{sv}"));
            if (adapter) {
                if (adapter_path_.empty()) adapter_path_ = objpath;
                g_variant_unref(adapter);
            }
        }
        if (it) g_variant_iter_free(it);
        g_variant_unref(objs);
    }

    // 어댑터가 없어도 실패는 아니다 (능력 판별에서 Unavailable)
    if (adapter_path_.empty()) {
        if (log_) log_->warn(TAG, "no org.bluez.Adapter1 found");
        return true;
    }
    if (!export_objects_(err)) return false;
    if (log_) log_->info(TAG, "using adapter " + adapter_path_);
    return true;
}


GVariant* BluezRadio::get_managed_objects_() {
    GError* err = nullptr;
    GVariant* ret = g_dbus_connection_call_sync(
        conn_, "org.bluez", "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects",
        nullptr, G_VARIANT_TYPE("(a{oa{sa{sv}}})"), G_DBUS_CALL_FLAGS_NONE, 5000, nullptr, &err);
    if (!ret && log_) log_->warn(TAG, "GetManagedObjects failed: " + take_error(err));
    else if (!ret && err) g_error_free(err);
    return ret;
}


Capability BluezRadio::resolve_capability() {
    if (!conn_ || adapter_path_.empty()) return Capability::Unavailable;

    GVariant* objs = get_managed_objects_();
    if (!objs) return Capability::Unavailable;

    bool has_manager = false;
    bool has_peripheral_role = true; // Roles 프로퍼티가 없는 구버전은 허용으로 본다
    guint8 instances = 1;

    GVariantIter* it = nullptr; g_variant_get(objs, "(a{oa{sa{sv}}})", &it);
    const gchar* objpath = nullptr; GVariant* ifaces = nullptr;
    while (g_variant_iter_loop(it, "{&o@a{sa{sv}}}", &objpath, &ifaces)) {
        if (adapter_path_ != objpath) continue;

        GVariantIter* ii = nullptr; const gchar* ifname = nullptr; GVariant* props = nullptr;
        g_variant_get(ifaces, "a{sa{sv}}", &ii);
        while (g_variant_iter_loop(ii, "{&s@a{sv}}", &ifname, &props)) {
            if (g_strcmp0(ifname, "org.bluez.LEAdvertisingManager1") == 0) {
                has_manager = true;
                g_variant_lookup(props, "SupportedInstances", "y", &instances);
            }
            else if (g_strcmp0(ifname, "org.bluez.Adapter1") == 0) {
                GVariant* roles = g_variant_lookup_value(props, "Roles", G_VARIANT_TYPE_STRING_ARRAY);
                if (roles) {
                    has_peripheral_role = false;
                    gsize n = 0;
                    const gchar** arr = g_variant_get_strv(roles, &n);
                    for (gsize i = 0; i < n; ++i) {
                        if (g_strcmp0(arr[i], "peripheral") == 0) has_peripheral_role = true;
                    }
                    g_free(arr);
                    g_variant_unref(roles);
                }
            }
        }
        if (ii) g_variant_iter_free(ii);
    }
    if (it) g_variant_iter_free(it);
    g_variant_unref(objs);

    if (!has_manager) return Capability::Unavailable;
    if (instances == 0 || !has_peripheral_role) return Capability::FallbackAdvertiser;
    return Capability::NativeAdvertiser;
}


bool BluezRadio::powered() {
    if (!conn_ || adapter_path_.empty()) return false;

    GError* err = nullptr;
    GVariant* r = g_dbus_connection_call_sync(conn_, "org.bluez", adapter_path_.c_str(),
        "org.freedesktop.DBus.Properties", "Get",
        g_variant_new("(ss)", "org.bluez.Adapter1", "Powered"),
        G_VARIANT_TYPE("(v)"), G_DBUS_CALL_FLAGS_NONE, 2000, nullptr, &err);
    if (!r) {
        if (log_) log_->warn(TAG, "Powered query failed: " + take_error(err));
        else if (err) g_error_free(err);
        return false;
    }
    GVariant* v = nullptr; g_variant_get(r, "(v)", &v);
    bool on = v && g_variant_is_of_type(v, G_VARIANT_TYPE_BOOLEAN) && g_variant_get_boolean(v);
    if (v) g_variant_unref(v);
    g_variant_unref(r);
    return on;
}


void BluezRadio::watch_power(std::function<void(bool)> cb) {
    power_watchers_.push_back(std::move(cb));
    if (power_sub_ || !conn_ || adapter_path_.empty()) return;
    power_sub_ = g_dbus_connection_signal_subscribe(conn_, "org.bluez",
        "org.freedesktop.DBus.Properties", "PropertiesChanged", adapter_path_.c_str(),
        "org.bluez.Adapter1", G_DBUS_SIGNAL_FLAGS_NONE, &BluezRadio::on_props_changed_, this, nullptr);
}


void BluezRadio::on_props_changed_(GDBusConnection*, const gchar*, const gchar*, const gchar*,
    const gchar*, GVariant* params, gpointer user) {
    auto* self = static_cast<BluezRadio*>(user);
    const gchar* iface = nullptr; GVariant* changed = nullptr; GVariantIter* invalidated = nullptr;
    g_variant_get(params, "(&s@a{sv}as)", &iface, &changed, &invalidated);

    gboolean on = FALSE;
    if (g_variant_lookup(changed, "Powered", "b", &on)) {
        for (auto& cb : self->power_watchers_) cb(on == TRUE);
    }
    g_variant_unref(changed);
    if (invalidated) g_variant_iter_free(invalidated);
}


std::string BluezRadio::describe() const {
    return adapter_path_.empty() ? std::string("no adapter") : adapter_path_;
}


bool BluezRadio::export_objects_(std::string& err) {
    GError* e = nullptr;
    struct NodeGuard {
        GDBusNodeInfo* n = nullptr;
        ~NodeGuard() { if (n) g_dbus_node_info_unref(n); }
    } service_node, char_node, adv_node, objmgr_node;

    service_node.n = g_dbus_node_info_new_for_xml(SERVICE_IF_XML, &e);
    if (!service_node.n) { err = take_error(e); return false; }
    char_node.n = g_dbus_node_info_new_for_xml(CHAR_IF_XML, &e);
    if (!char_node.n) { err = take_error(e); return false; }
    adv_node.n = g_dbus_node_info_new_for_xml(ADV_IF_XML, &e);
    if (!adv_node.n) { err = take_error(e); return false; }
    objmgr_node.n = g_dbus_node_info_new_for_xml(OBJMGR_IF_XML, &e);
    if (!objmgr_node.n) { err = take_error(e); return false; }

    // 등록된 오브젝트는 interface info 에 참조를 잡으므로 node 해제는 안전
    reg_service_ = g_dbus_connection_register_object(conn_, SERVICE_PATH, service_node.n->interfaces[0],
        &SERVICE_VTABLE, this, nullptr, &e);
    if (!reg_service_) { err = take_error(e); unexport_objects_(); return false; }
    reg_char_ = g_dbus_connection_register_object(conn_, CHAR_PATH, char_node.n->interfaces[0],
        &CHAR_VTABLE, this, nullptr, &e);
    if (!reg_char_) { err = take_error(e); unexport_objects_(); return false; }
    reg_adv_ = g_dbus_connection_register_object(conn_, ADV_PATH, adv_node.n->interfaces[0],
        &ADV_VTABLE, this, nullptr, &e);
    if (!reg_adv_) { err = take_error(e); unexport_objects_(); return false; }
    reg_objmgr_ = g_dbus_connection_register_object(conn_, APP_PATH, objmgr_node.n->interfaces[0],
        &OBJMGR_VTABLE, this, nullptr, &e);
    if (!reg_objmgr_) { err = take_error(e); unexport_objects_(); return false; }
    return true;
}


void BluezRadio::unexport_objects_() {
    if (!conn_) return;
    if (reg_objmgr_) g_dbus_connection_unregister_object(conn_, reg_objmgr_);
    if (reg_adv_) g_dbus_connection_unregister_object(conn_, reg_adv_);
    if (reg_char_) g_dbus_connection_unregister_object(conn_, reg_char_);
    if (reg_service_) g_dbus_connection_unregister_object(conn_, reg_service_);
    reg_objmgr_ = reg_adv_ = reg_char_ = reg_service_ = 0;
}


void BluezRadio::broadcast(const AdvertisementSpec& spec, StatusCallback done) {
    if (!conn_ || adapter_path_.empty() || !reg_adv_) {
        done(BackendStatus::failure(ErrorKind::NativeCapabilityUnavailable, "no BlueZ adapter"));
        return;
    }
    spec_ = spec;
    stop_requested_ = false;
    if (!app_registered_) register_app_();

    if (!adv_registered_) {
        register_adv_(std::move(done));
        return;
    }

    // BlueZ 는 등록 시점의 프로퍼티만 읽는다 → 해제 후 재등록
    unregister_adv_([this, done](const BackendStatus&) {
        // DoesNotExist 등은 무시하고 재등록
        register_adv_(done);
    });
}


void BluezRadio::register_adv_(StatusCallback done) {
    auto* pc = new PendingCall{ this, std::move(done) };
    register_pending_ = true;
    GVariant* opts = g_variant_new_array(G_VARIANT_TYPE("{sv}"), nullptr, 0);
    g_dbus_connection_call(conn_, "org.bluez", adapter_path_.c_str(),
        "org.bluez.LEAdvertisingManager1", "RegisterAdvertisement",
        g_variant_new("(o@a{sv})", ADV_PATH, opts),
        nullptr, G_DBUS_CALL_FLAGS_NONE, call_timeout_ms_, cancel_, &BluezRadio::on_register_adv_, pc);
}


void BluezRadio::on_register_adv_(GObject* src, GAsyncResult* res, gpointer user) {
    std::unique_ptr<PendingCall> pc(static_cast<PendingCall*>(user));
    GError* e = nullptr;
    GVariant* r = g_dbus_connection_call_finish(G_DBUS_CONNECTION(src), res, &e);
    if (!r && g_error_matches(e, G_IO_ERROR, G_IO_ERROR_CANCELLED)) { g_error_free(e); return; }

    BluezRadio* self = pc->self;
    self->register_pending_ = false;
    if (!r) {
        // 타임아웃이면 bluetoothd 쪽 등록 여부를 알 수 없다 → 다음 stop/broadcast 가 해제
        if (g_error_matches(e, G_IO_ERROR, G_IO_ERROR_TIMED_OUT)) self->adv_registered_ = true;
        const std::string msg = take_error(e);
        if (self->log_) self->log_->warn(TAG, "RegisterAdvertisement failed: " + msg);
        pc->done(BackendStatus::failure(ErrorKind::NativeCapabilityUnavailable, msg));
        return;
    }
    g_variant_unref(r);
    self->adv_registered_ = true;

    if (self->stop_requested_) {
        // 응답 전에 정지가 요청됨 → 바로 해제
        self->stop_requested_ = false;
        LogSink* log = self->log_;
        self->unregister_adv_([log](const BackendStatus& st) {
            if (!st.ok && log) log->warn(TAG, "late UnregisterAdvertisement failed: " + st.message);
        });
        pc->done(BackendStatus::failure(ErrorKind::Cancelled, "advertisement stopped before registration completed"));
        return;
    }
    if (self->log_) self->log_->debug(TAG, "advertisement registered");
    pc->done(BackendStatus::success());
}


void BluezRadio::stop_broadcast(StatusCallback done) {
    if (conn_ && register_pending_) stop_requested_ = true;
    if (!conn_ || !adv_registered_) {
        done(BackendStatus::success());
        return;
    }
    unregister_adv_(std::move(done));
}


void BluezRadio::unregister_adv_(StatusCallback done) {
    auto* pc = new PendingCall{ this, std::move(done) };
    g_dbus_connection_call(conn_, "org.bluez", adapter_path_.c_str(),
        "org.bluez.LEAdvertisingManager1", "UnregisterAdvertisement",
        g_variant_new("(o)", ADV_PATH), nullptr, G_DBUS_CALL_FLAGS_NONE, 5000, cancel_,
        &BluezRadio::on_unregister_adv_, pc);
}


void BluezRadio::on_unregister_adv_(GObject* src, GAsyncResult* res, gpointer user) {
    std::unique_ptr<PendingCall> pc(static_cast<PendingCall*>(user));
    GError* e = nullptr;
    GVariant* r = g_dbus_connection_call_finish(G_DBUS_CONNECTION(src), res, &e);
    if (!r) {
        if (g_error_matches(e, G_IO_ERROR, G_IO_ERROR_CANCELLED)) { g_error_free(e); return; }
        pc->self->adv_registered_ = false;
        // 등록돼 있지 않았다면 정지는 이미 이뤄진 것
        gchar* remote = g_dbus_error_is_remote_error(e) ? g_dbus_error_get_remote_error(e) : nullptr;
        const bool missing = g_strcmp0(remote, "org.bluez.Error.DoesNotExist") == 0;
        g_free(remote);
        if (missing) {
            g_error_free(e);
            pc->done(BackendStatus::success());
            return;
        }
        pc->done(BackendStatus::failure(ErrorKind::NativeCapabilityUnavailable, take_error(e)));
        return;
    }
    g_variant_unref(r);
    pc->self->adv_registered_ = false;
    pc->done(BackendStatus::success());
}


void BluezRadio::register_app_() {
    app_registered_ = true; // 중복 요청 방지, 실패 시 되돌림
    GVariant* options = g_variant_new_array(G_VARIANT_TYPE("{sv}"), nullptr, 0);
    g_dbus_connection_call(conn_, "org.bluez", adapter_path_.c_str(),
        "org.bluez.GattManager1", "RegisterApplication",
        g_variant_new("(o@a{sv})", APP_PATH, options),
        nullptr, G_DBUS_CALL_FLAGS_NONE, 5000, cancel_, &BluezRadio::on_register_app_, this);
}


void BluezRadio::on_register_app_(GObject* src, GAsyncResult* res, gpointer user) {
    GError* e = nullptr;
    GVariant* r = g_dbus_connection_call_finish(G_DBUS_CONNECTION(src), res, &e);
    if (!r) {
        if (g_error_matches(e, G_IO_ERROR, G_IO_ERROR_CANCELLED)) { g_error_free(e); return; }
        auto* self = static_cast<BluezRadio*>(user);
        self->app_registered_ = false;
        const std::string msg = take_error(e);
        if (self->log_) self->log_->warn(TAG, "RegisterApplication failed: " + msg);
        return;
    }
    g_variant_unref(r);
}


void BluezRadio::set_write_handler(std::function<void(const std::string&, const bytes&)> cb) {
    write_handler_ = std::move(cb);
}


// ===== ObjectManager 응답 =====
void BluezRadio::objmgr_method_call(GDBusConnection*, const gchar*, const gchar*,
    const gchar* iface, const gchar* method, GVariant*, GDBusMethodInvocation* inv, gpointer) {

    if (g_strcmp0(iface, "org.freedesktop.DBus.ObjectManager") != 0 ||
        g_strcmp0(method, "GetManagedObjects") != 0) {
        g_dbus_method_invocation_return_dbus_error(inv, "org.freedesktop.DBus.Error.UnknownMethod", "Unknown method");
        return;
    }

    GVariantBuilder root;
    g_variant_builder_init(&root, G_VARIANT_TYPE("a{oa{sa{sv}}}"));

    // service
    {
        GVariantBuilder ifmap;  g_variant_builder_init(&ifmap, G_VARIANT_TYPE("a{sa{sv}}"));
        GVariantBuilder props;  g_variant_builder_init(&props, G_VARIANT_TYPE("a{sv}"));
        g_variant_builder_add(&props, "{sv}", "UUID", g_variant_new_string(ACP_SERVICE_UUID));
        g_variant_builder_add(&props, "{sv}", "Primary", g_variant_new_boolean(TRUE));
        g_variant_builder_add(&props, "{sv}", "Includes", g_variant_new("ao", NULL));
        g_variant_builder_add(&ifmap, "{s@a{sv}}", "org.bluez.GattService1", g_variant_builder_end(&props));
        g_variant_builder_add(&root, "{o@a{sa{sv}}}", SERVICE_PATH, g_variant_builder_end(&ifmap));
    }

    // characteristic
    {
        GVariantBuilder ifmap;  g_variant_builder_init(&ifmap, G_VARIANT_TYPE("a{sa{sv}}"));
        GVariantBuilder props;  g_variant_builder_init(&props, G_VARIANT_TYPE("a{sv}"));
        g_variant_builder_add(&props, "{sv}", "UUID", g_variant_new_string(ACP_CHARACTERISTIC_UUID));
        g_variant_builder_add(&props, "{sv}", "Service", g_variant_new_object_path(SERVICE_PATH));
        const char* flags_arr[] = { "read", "write", "write-without-response", NULL };
        g_variant_builder_add(&props, "{sv}", "Flags", g_variant_new_strv(flags_arr, -1));
        g_variant_builder_add(&props, "{sv}", "Descriptors", g_variant_new("ao", NULL));
        g_variant_builder_add(&ifmap, "{s@a{sv}}", "org.bluez.GattCharacteristic1", g_variant_builder_end(&props));
        g_variant_builder_add(&root, "{o@a{sa{sv}}}", CHAR_PATH, g_variant_builder_end(&ifmap));
    }

    GVariant* dict = g_variant_builder_end(&root);
    g_dbus_method_invocation_return_value(inv, g_variant_new("(@a{oa{sa{sv}}})", dict));
}


// ===== Properties Getters =====
GVariant* BluezRadio::service_get(GDBusConnection*, const gchar*, const gchar*, const gchar*,
    const gchar* prop, GError**, gpointer) {
    if (!g_strcmp0(prop, "UUID"))     return g_variant_new_string(ACP_SERVICE_UUID);
    if (!g_strcmp0(prop, "Primary"))  return g_variant_new_boolean(TRUE);
    if (!g_strcmp0(prop, "Includes")) return g_variant_new("ao", nullptr);
    return nullptr;
}


GVariant* BluezRadio::char_get(GDBusConnection*, const gchar*, const gchar*, const gchar*,
    const gchar* prop, GError**, gpointer) {
    if (!g_strcmp0(prop, "UUID"))    return g_variant_new_string(ACP_CHARACTERISTIC_UUID);
    if (!g_strcmp0(prop, "Service")) return g_variant_new_object_path(SERVICE_PATH);
    if (!g_strcmp0(prop, "Descriptors")) return g_variant_new("ao", nullptr);
    if (!g_strcmp0(prop, "Flags")) {
        const gchar* flags[] = { "read", "write", "write-without-response", nullptr };
        return g_variant_new_strv(flags, -1);
    }
    return nullptr;
}


GVariant* BluezRadio::adv_get(GDBusConnection*, const gchar*, const gchar*, const gchar*,
    const gchar* prop, GError**, gpointer user_data) {
    auto* self = static_cast<BluezRadio*>(user_data);
    const AdvertisementSpec& s = self->spec_;

    if (g_strcmp0(prop, "Type") == 0)
        return g_variant_new_string(s.connectable ? "peripheral" : "broadcast");
    if (g_strcmp0(prop, "ServiceUUIDs") == 0) {
        const char* u = s.service_uuid.c_str();
        return g_variant_new_strv(&u, 1);
    }
    if (g_strcmp0(prop, "ManufacturerData") == 0) {
        GVariantBuilder b; g_variant_builder_init(&b, G_VARIANT_TYPE("a{qv}"));
        g_variant_builder_add(&b, "{qv}", (guint16)s.manufacturer_id, byte_array(s.manufacturer_data));
        return g_variant_builder_end(&b);
    }
    if (g_strcmp0(prop, "LocalName") == 0)
        return g_variant_new_string(s.include_device_name ? s.local_name.c_str() : "");
    if (g_strcmp0(prop, "Includes") == 0) {
        if (s.include_tx_power) {
            const gchar* inc[] = { "tx-power", nullptr };
            return g_variant_new_strv(inc, -1);
        }
        return g_variant_new_strv(nullptr, 0);
    }
    if (g_strcmp0(prop, "MinInterval") == 0 || g_strcmp0(prop, "MaxInterval") == 0)
        return g_variant_new_uint32(s.interval_ms);
    if (g_strcmp0(prop, "TxPower") == 0)
        return g_variant_new_int16((gint16)s.tx_power);
    return nullptr;
}


// ===== Method Handlers =====
void BluezRadio::char_method_call(GDBusConnection*, const gchar*, const gchar*, const gchar*,
    const gchar* method, GVariant* params, GDBusMethodInvocation* inv, gpointer user_data) {
    auto* self = static_cast<BluezRadio*>(user_data);

    if (!g_strcmp0(method, "WriteValue")) {
        GVariant* value = nullptr, * options = nullptr;
        g_variant_get(params, "(@ay@a{sv})", &value, &options);
        gsize n = 0; const guchar* data = (const guchar*)g_variant_get_fixed_array(value, &n, sizeof(guchar));
        bytes v(data, data + n);

        const gchar* device = nullptr;
        std::string device_path = "unknown";
        if (g_variant_lookup(options, "device", "&o", &device)) device_path = device;

        if (self->log_) self->log_->debug(TAG, "WriteValue len=" + std::to_string(n) + " from " + device_path);
        g_dbus_method_invocation_return_value(inv, nullptr);
        if (self->write_handler_) self->write_handler_(device_path, v);

        if (options) g_variant_unref(options);
        if (value) g_variant_unref(value);
        return;
    }
    if (!g_strcmp0(method, "ReadValue")) {
        // 현재 광고 중인 와이어 메시지 (긴 값은 bluetoothd 가 offset 으로 나눠 읽는다)
        GVariant* options = nullptr;
        g_variant_get(params, "(@a{sv})", &options);
        guint16 offset = 0;
        if (options) {
            g_variant_lookup(options, "offset", "q", &offset);
            g_variant_unref(options);
        }
        const bytes& full = self->spec_.gatt_value;
        if (offset > full.size()) {
            g_dbus_method_invocation_return_dbus_error(inv, "org.bluez.Error.InvalidOffset", "Invalid offset");
            return;
        }
        GVariant* value = byte_array(bytes(full.begin() + offset, full.end()));
        g_dbus_method_invocation_return_value(inv, g_variant_new_tuple(&value, 1));
        return;
    }
    g_dbus_method_invocation_return_dbus_error(inv, "org.freedesktop.DBus.Error.UnknownMethod", "Unknown method");
}


void BluezRadio::adv_method_call(GDBusConnection*, const gchar*, const gchar*,
    const gchar* iface, const gchar* method, GVariant*, GDBusMethodInvocation* inv, gpointer user_data) {
    if (!g_strcmp0(iface, "org.bluez.LEAdvertisement1") && !g_strcmp0(method, "Release")) {
        // bluetoothd 가 광고를 회수함
        auto* self = static_cast<BluezRadio*>(user_data);
        self->adv_registered_ = false;
        if (self->log_) self->log_->info(TAG, "advertisement released by bluetoothd");
        g_dbus_method_invocation_return_value(inv, NULL);
        return;
    }
    g_dbus_method_invocation_return_dbus_error(inv, "org.freedesktop.DBus.Error.UnknownMethod", "Unknown");
}

} // namespace acp
