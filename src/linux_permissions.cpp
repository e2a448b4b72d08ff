#include "acp/linux_permissions.hpp"
#include <memory>

extern "C" {
#include <linux/capability.h>
#include <sys/syscall.h>
#include <unistd.h>
}


namespace acp {

namespace {

constexpr const char* TAG = "PERM";
constexpr unsigned NEEDED = (1u << CAP_NET_RAW) | (1u << CAP_NET_ADMIN); // 둘 다 32 미만

} // namespace


LinuxPermissions::LinuxPermissions(GDBusConnection* conn, std::string adapter_path, LogSink* log)
    : log_(log), conn_(conn), adapter_path_(std::move(adapter_path)) {
    if (conn_) g_object_ref(conn_);
    cancel_ = g_cancellable_new();
}


LinuxPermissions::~LinuxPermissions() {
    g_cancellable_cancel(cancel_);
    if (conn_) g_object_unref(conn_);
    g_object_unref(cancel_);
}


std::string LinuxPermissions::identifier(PermissionKind k) const {
    switch (k) {
    case PermissionKind::Scan: return "cap_net_raw+cap_net_admin";
    case PermissionKind::Connect: return "org.bluez.Device1";
    case PermissionKind::Advertise: return "org.bluez.LEAdvertisingManager1";
    case PermissionKind::Location: return "location";
    }
    return "unknown";
}


LinuxPermissions::CapState LinuxPermissions::read_caps_() {
    __user_cap_header_struct hdr{};
    __user_cap_data_struct data[2]{};
    hdr.version = _LINUX_CAPABILITY_VERSION_3;
    hdr.pid = 0;

    CapState c;
    if (syscall(SYS_capget, &hdr, data) != 0) return c;
    c.effective = (data[0].effective & NEEDED) == NEEDED;
    c.permitted = (data[0].permitted & NEEDED) == NEEDED;
    return c;
}


bool LinuxPermissions::raise_caps_() {
    __user_cap_header_struct hdr{};
    __user_cap_data_struct data[2]{};
    hdr.version = _LINUX_CAPABILITY_VERSION_3;
    hdr.pid = 0;

    if (syscall(SYS_capget, &hdr, data) != 0) return false;
    if ((data[0].permitted & NEEDED) != NEEDED) return false;
    data[0].effective |= NEEDED;
    return syscall(SYS_capset, &hdr, data) == 0;
}


PermissionStatus LinuxPermissions::from_caps_(const CapState& c) {
    if (c.effective) return PermissionStatus::Granted;
    if (c.permitted) return PermissionStatus::Denied;
    return PermissionStatus::DeniedForever;
}


void LinuxPermissions::query(PermissionKind k, std::function<void(PermissionStatus)> done) {
    switch (k) {
    case PermissionKind::Scan:
        done(from_caps_(read_caps_()));
        return;
    case PermissionKind::Connect:
        query_bus_("org.bluez.Adapter1", "Address", std::move(done));
        return;
    case PermissionKind::Advertise:
        query_bus_("org.bluez.LEAdvertisingManager1", "ActiveInstances", std::move(done));
        return;
    case PermissionKind::Location:
        done(PermissionStatus::Granted);
        return;
    }
}


void LinuxPermissions::query_bus_(const char* iface, const char* prop, std::function<void(PermissionStatus)> done) {
    if (!conn_ || adapter_path_.empty()) {
        done(PermissionStatus::Denied);
        return;
    }
    auto* p = new BusQuery{ this, std::move(done) };
    g_dbus_connection_call(conn_, "org.bluez", adapter_path_.c_str(),
        "org.freedesktop.DBus.Properties", "Get", g_variant_new("(ss)", iface, prop),
        G_VARIANT_TYPE("(v)"), G_DBUS_CALL_FLAGS_NONE, 3000, cancel_, &LinuxPermissions::on_bus_query_, p);
}


void LinuxPermissions::on_bus_query_(GObject* src, GAsyncResult* res, gpointer user) {
    std::unique_ptr<BusQuery> p(static_cast<BusQuery*>(user));
    GError* e = nullptr;
    GVariant* r = g_dbus_connection_call_finish(G_DBUS_CONNECTION(src), res, &e);
    if (r) {
        g_variant_unref(r);
        p->done(PermissionStatus::Granted);
        return;
    }
    if (g_error_matches(e, G_IO_ERROR, G_IO_ERROR_CANCELLED)) { g_error_free(e); return; }

    PermissionStatus st = PermissionStatus::Denied;
    if (g_error_matches(e, G_DBUS_ERROR, G_DBUS_ERROR_ACCESS_DENIED)) st = PermissionStatus::DeniedForever;
    if (p->self->log_) p->self->log_->debug(TAG, std::string("bus query: ") + e->message);
    g_error_free(e);
    p->done(st);
}


void LinuxPermissions::request(const std::vector<PermissionKind>& kinds,
    std::function<void(const std::map<PermissionKind, PermissionStatus>&)> done) {
    // 대화형 요청이 없으므로 capability 만 올려 보고 다시 질의한다
    for (PermissionKind k : kinds) {
        if (k != PermissionKind::Scan) continue;
        if (!read_caps_().effective && !raise_caps_() && log_) {
            log_->warn(TAG, "cannot raise CAP_NET_RAW/CAP_NET_ADMIN");
        }
    }

    struct Gather {
        std::map<PermissionKind, PermissionStatus> result;
        size_t remaining{ 0 };
        std::function<void(const std::map<PermissionKind, PermissionStatus>&)> done;
    };
    auto g = std::make_shared<Gather>();
    g->remaining = kinds.size();
    g->done = std::move(done);
    if (kinds.empty()) {
        g->done(g->result);
        return;
    }
    for (PermissionKind k : kinds) {
        query(k, [g, k](PermissionStatus s) {
            g->result[k] = s;
            if (--g->remaining == 0) g->done(g->result);
        });
    }
}

} // namespace acp
