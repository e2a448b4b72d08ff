#include "acp/bluez_central.hpp"
#include <memory>


namespace acp {

namespace {

constexpr const char* TAG = "CENTRAL";

std::string take_error(GError* err) {
    std::string msg = err ? err->message : "unknown error";
    if (err) g_error_free(err);
    return msg;
}

bool remote_error_is(GError* err, const char* name) {
    if (!err || !g_dbus_error_is_remote_error(err)) return false;
    gchar* remote = g_dbus_error_get_remote_error(err);
    bool match = g_strcmp0(remote, name) == 0;
    g_free(remote);
    return match;
}

bytes bytes_from_variant(GVariant* v) {
    gsize n = 0;
    const guint8* p = static_cast<const guint8*>(g_variant_get_fixed_array(v, &n, sizeof(guint8)));
    return bytes(p, p + n);
}

} // namespace


BluezCentral::BluezCentral(GDBusConnection* conn, std::string adapter_path, LogSink* log)
    : log_(log), conn_(conn), adapter_path_(std::move(adapter_path)) {
    if (conn_) g_object_ref(conn_);
    cancel_ = g_cancellable_new();
}


BluezCentral::~BluezCentral() {
    g_cancellable_cancel(cancel_);
    if (conn_) {
        for (auto& kv : resolving_) {
            if (kv.second.sub) g_dbus_connection_signal_unsubscribe(conn_, kv.second.sub);
        }
        for (auto& kv : notifies_) {
            if (kv.second.sub) g_dbus_connection_signal_unsubscribe(conn_, kv.second.sub);
        }
        g_object_unref(conn_);
    }
    g_object_unref(cancel_);
}


std::string BluezCentral::device_path(const DeviceHandle& dev) const {
    if (!dev.path.empty()) return dev.path;
    std::string mac = dev.id;
    for (auto& c : mac) {
        if (c == ':') c = '_';
        else c = (char)g_ascii_toupper(c);
    }
    return adapter_path_ + "/dev_" + mac;
}


void BluezCentral::call_(const std::string& path, const char* iface, const char* method, GVariant* params,
    ErrorKind kind, int timeout_ms, StatusCallback done) {
    if (!conn_) {
        if (params) g_variant_unref(g_variant_ref_sink(params));
        done(BackendStatus::failure(ErrorKind::BleNotAvailable, "no system bus"));
        return;
    }
    auto* pc = new PendingCall{ this, kind, std::move(done) };
    g_dbus_connection_call(conn_, "org.bluez", path.c_str(), iface, method, params,
        nullptr, G_DBUS_CALL_FLAGS_NONE, timeout_ms, cancel_, &BluezCentral::on_call_done_, pc);
}


void BluezCentral::on_call_done_(GObject* src, GAsyncResult* res, gpointer user) {
    std::unique_ptr<PendingCall> pc(static_cast<PendingCall*>(user));
    GError* e = nullptr;
    GVariant* r = g_dbus_connection_call_finish(G_DBUS_CONNECTION(src), res, &e);
    if (r) {
        g_variant_unref(r);
        pc->done(BackendStatus::success());
        return;
    }
    if (g_error_matches(e, G_IO_ERROR, G_IO_ERROR_CANCELLED)) { g_error_free(e); return; }
    // 이미 연결/구독된 상태는 성공으로 취급
    if (pc->kind == ErrorKind::ConnectionFailed &&
        (remote_error_is(e, "org.bluez.Error.AlreadyConnected") || remote_error_is(e, "org.bluez.Error.InProgress"))) {
        g_error_free(e);
        pc->done(BackendStatus::success());
        return;
    }
    const std::string msg = take_error(e);
    if (pc->self->log_) pc->self->log_->debug(TAG, "D-Bus call failed: " + msg);
    pc->done(BackendStatus::failure(pc->kind, msg));
}


void BluezCentral::connect(const DeviceHandle& dev, StatusCallback done) {
    const std::string path = device_path(dev);
    if (log_) log_->debug(TAG, "Device1.Connect " + path);
    call_(path, "org.bluez.Device1", "Connect", nullptr, ErrorKind::ConnectionFailed, 30000, std::move(done));
}


void BluezCentral::disconnect(const DeviceHandle& dev, StatusCallback done) {
    const std::string path = device_path(dev);
    auto it = resolving_.find(path);
    if (it != resolving_.end()) {
        if (conn_ && it->second.sub) g_dbus_connection_signal_unsubscribe(conn_, it->second.sub);
        resolving_.erase(it);
    }
    call_(path, "org.bluez.Device1", "Disconnect", nullptr, ErrorKind::ConnectionFailed, 5000, std::move(done));
}


bool BluezCentral::services_resolved_(const std::string& dev_path) {
    GError* err = nullptr;
    GVariant* r = g_dbus_connection_call_sync(conn_, "org.bluez", dev_path.c_str(),
        "org.freedesktop.DBus.Properties", "Get",
        g_variant_new("(ss)", "org.bluez.Device1", "ServicesResolved"),
        G_VARIANT_TYPE("(v)"), G_DBUS_CALL_FLAGS_NONE, 2000, nullptr, &err);
    if (!r) {
        if (err) g_error_free(err);
        return false;
    }
    GVariant* v = nullptr; g_variant_get(r, "(v)", &v);
    bool resolved = v && g_variant_is_of_type(v, G_VARIANT_TYPE_BOOLEAN) && g_variant_get_boolean(v);
    if (v) g_variant_unref(v);
    g_variant_unref(r);
    return resolved;
}


void BluezCentral::collect_services_(const std::string& dev_path, std::vector<GattService>& out) {
    GError* err = nullptr;
    GVariant* objs = g_dbus_connection_call_sync(conn_, "org.bluez", "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects",
        nullptr, G_VARIANT_TYPE("(a{oa{sa{sv}}})"), G_DBUS_CALL_FLAGS_NONE, 5000, nullptr, &err);
    if (!objs) {
        if (log_) log_->warn(TAG, "GetManagedObjects failed: " + take_error(err));
        else if (err) g_error_free(err);
        return;
    }

    const std::string prefix = dev_path + "/";
    std::map<std::string, GattService> by_path;
    std::vector<std::pair<std::string, GattCharacteristic>> chars; // (service path, characteristic)

    GVariantIter* it = nullptr; g_variant_get(objs, "(a{oa{sa{sv}}})", &it);
    const gchar* objpath = nullptr; GVariant* ifaces = nullptr;
    while (g_variant_iter_loop(it, "{&o@a{sa{sv}}}", &objpath, &ifaces)) {
        if (!g_str_has_prefix(objpath, prefix.c_str())) continue;

        GVariant* svc = g_variant_lookup_value(ifaces, "org.bluez.GattService1", G_VARIANT_TYPE("a{sv}"));
        if (svc) {
            const gchar* uuid = nullptr;
            GattService s;
            s.path = objpath;
            if (g_variant_lookup(svc, "UUID", "&s", &uuid)) s.uuid = uuid;
            by_path[s.path] = s;
            g_variant_unref(svc);
        }

        GVariant* chr = g_variant_lookup_value(ifaces, "org.bluez.GattCharacteristic1", G_VARIANT_TYPE("a{sv}"));
        if (chr) {
            const gchar* uuid = nullptr;
            const gchar* service = nullptr;
            GattCharacteristic c;
            c.path = objpath;
            if (g_variant_lookup(chr, "UUID", "&s", &uuid)) c.uuid = uuid;
            g_variant_lookup(chr, "Service", "&o", &service);
            GVariant* flags = g_variant_lookup_value(chr, "Flags", G_VARIANT_TYPE_STRING_ARRAY);
            if (flags) {
                gsize n = 0;
                const gchar** arr = g_variant_get_strv(flags, &n);
                for (gsize i = 0; i < n; ++i) c.flags.push_back(arr[i]);
                g_free(arr);
                g_variant_unref(flags);
            }
            chars.emplace_back(service ? service : "", c);
            g_variant_unref(chr);
        }
    }
    if (it) g_variant_iter_free(it);
    g_variant_unref(objs);

    for (auto& pc : chars) {
        auto s = by_path.find(pc.first);
        if (s != by_path.end()) s->second.characteristics.push_back(pc.second);
    }
    for (auto& kv : by_path) out.push_back(kv.second);
}


void BluezCentral::discover_services(const DeviceHandle& dev, DiscoverCallback done) {
    if (!conn_) {
        done(BackendStatus::failure(ErrorKind::BleNotAvailable, "no system bus"), {});
        return;
    }
    const std::string path = device_path(dev);

    PendingResolve& pr = resolving_[path];
    pr.waiters.push_back(std::move(done));
    if (!pr.sub) {
        pr.sub = g_dbus_connection_signal_subscribe(conn_, "org.bluez",
            "org.freedesktop.DBus.Properties", "PropertiesChanged", path.c_str(),
            "org.bluez.Device1", G_DBUS_SIGNAL_FLAGS_NONE, &BluezCentral::on_device_props_, this, nullptr);
    }

    // 구독 뒤에 현재 값을 확인해야 신호를 놓치지 않는다
    if (services_resolved_(path)) finish_resolve_(path);
}


void BluezCentral::on_device_props_(GDBusConnection*, const gchar*, const gchar* path, const gchar*,
    const gchar*, GVariant* params, gpointer user) {
    auto* self = static_cast<BluezCentral*>(user);
    const gchar* iface = nullptr; GVariant* changed = nullptr; GVariantIter* invalidated = nullptr;
    g_variant_get(params, "(&s@a{sv}as)", &iface, &changed, &invalidated);

    gboolean resolved = FALSE;
    const bool has = g_variant_lookup(changed, "ServicesResolved", "b", &resolved);
    g_variant_unref(changed);
    if (invalidated) g_variant_iter_free(invalidated);

    if (has && resolved) self->finish_resolve_(path);
}


void BluezCentral::finish_resolve_(const std::string& dev_path) {
    auto it = resolving_.find(dev_path);
    if (it == resolving_.end()) return;
    PendingResolve pr = std::move(it->second);
    resolving_.erase(it);
    if (pr.sub) g_dbus_connection_signal_unsubscribe(conn_, pr.sub);

    std::vector<GattService> services;
    collect_services_(dev_path, services);
    if (log_) log_->debug(TAG, dev_path + ": " + std::to_string(services.size()) + " service(s) resolved");
    for (auto& cb : pr.waiters) cb(BackendStatus::success(), services);
}


void BluezCentral::write(const GattCharacteristic& ch, const bytes& value, StatusCallback done) {
    GVariantBuilder opts; g_variant_builder_init(&opts, G_VARIANT_TYPE("a{sv}"));
    g_variant_builder_add(&opts, "{sv}", "type", g_variant_new_string("request"));
    GVariant* arr = g_variant_new_fixed_array(G_VARIANT_TYPE_BYTE, value.data(), value.size(), sizeof(guchar));
    call_(ch.path, "org.bluez.GattCharacteristic1", "WriteValue",
        g_variant_new("(@ay@a{sv})", arr, g_variant_builder_end(&opts)),
        ErrorKind::SendFailed, 10000, std::move(done));
}


void BluezCentral::read(const GattCharacteristic& ch, std::function<void(const BackendStatus&, const bytes&)> done) {
    if (!conn_) {
        done(BackendStatus::failure(ErrorKind::BleNotAvailable, "no system bus"), {});
        return;
    }
    auto* pr = new PendingRead{ this, std::move(done) };
    GVariant* opts = g_variant_new_array(G_VARIANT_TYPE("{sv}"), nullptr, 0);
    g_dbus_connection_call(conn_, "org.bluez", ch.path.c_str(), "org.bluez.GattCharacteristic1", "ReadValue",
        g_variant_new("(@a{sv})", opts), G_VARIANT_TYPE("(ay)"), G_DBUS_CALL_FLAGS_NONE, 10000, cancel_,
        &BluezCentral::on_read_done_, pr);
}


void BluezCentral::on_read_done_(GObject* src, GAsyncResult* res, gpointer user) {
    std::unique_ptr<PendingRead> pr(static_cast<PendingRead*>(user));
    GError* e = nullptr;
    GVariant* r = g_dbus_connection_call_finish(G_DBUS_CONNECTION(src), res, &e);
    if (!r) {
        if (g_error_matches(e, G_IO_ERROR, G_IO_ERROR_CANCELLED)) { g_error_free(e); return; }
        const std::string msg = take_error(e);
        if (pr->self->log_) pr->self->log_->debug(TAG, "ReadValue failed: " + msg);
        pr->done(BackendStatus::failure(ErrorKind::ConnectionFailed, msg), {});
        return;
    }
    GVariant* value = g_variant_get_child_value(r, 0);
    const bytes data = bytes_from_variant(value);
    g_variant_unref(value);
    g_variant_unref(r);
    pr->done(BackendStatus::success(), data);
}


void BluezCentral::subscribe(const GattCharacteristic& ch, std::function<void(const bytes&)> on_value,
    std::function<void(const BackendStatus&, unsigned)> done) {
    if (!conn_) {
        done(BackendStatus::failure(ErrorKind::BleNotAvailable, "no system bus"), 0);
        return;
    }

    const unsigned handle = next_handle_++;
    Notify& n = notifies_[handle];
    n.char_path = ch.path;
    n.on_value = std::move(on_value);
    n.sub = g_dbus_connection_signal_subscribe(conn_, "org.bluez",
        "org.freedesktop.DBus.Properties", "PropertiesChanged", ch.path.c_str(),
        "org.bluez.GattCharacteristic1", G_DBUS_SIGNAL_FLAGS_NONE, &BluezCentral::on_char_props_, this, nullptr);

    call_(ch.path, "org.bluez.GattCharacteristic1", "StartNotify", nullptr, ErrorKind::ListenerFailed, 10000,
        [this, handle, done](const BackendStatus& st) {
            if (!st.ok) {
                unsubscribe(handle);
                done(st, 0);
                return;
            }
            done(st, handle);
        });
}


void BluezCentral::on_char_props_(GDBusConnection*, const gchar*, const gchar* path, const gchar*,
    const gchar*, GVariant* params, gpointer user) {
    auto* self = static_cast<BluezCentral*>(user);
    const gchar* iface = nullptr; GVariant* changed = nullptr; GVariantIter* invalidated = nullptr;
    g_variant_get(params, "(&s@a{sv}as)", &iface, &changed, &invalidated);

    GVariant* value = g_variant_lookup_value(changed, "Value", G_VARIANT_TYPE_BYTESTRING);
    if (value) {
        const bytes data = bytes_from_variant(value);
        g_variant_unref(value);

        std::vector<std::function<void(const bytes&)>> targets;
        for (auto& kv : self->notifies_) {
            if (kv.second.char_path == path) targets.push_back(kv.second.on_value);
        }
        for (auto& cb : targets) cb(data);
    }
    g_variant_unref(changed);
    if (invalidated) g_variant_iter_free(invalidated);
}


void BluezCentral::unsubscribe(unsigned handle) {
    auto it = notifies_.find(handle);
    if (it == notifies_.end()) return;
    const std::string path = it->second.char_path;
    if (conn_ && it->second.sub) g_dbus_connection_signal_unsubscribe(conn_, it->second.sub);
    notifies_.erase(it);

    for (auto& kv : notifies_) {
        if (kv.second.char_path == path) return; // 같은 특성을 다른 구독이 쓰는 중
    }
    call_(path, "org.bluez.GattCharacteristic1", "StopNotify", nullptr, ErrorKind::ListenerFailed, 5000,
        [this, path](const BackendStatus& st) {
            if (!st.ok && log_) log_->debug(TAG, "StopNotify " + path + ": " + st.message);
        });
}

} // namespace acp
