#include "nm/GDBusSignalBus.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

namespace evpn::nm {

namespace {

void onVpnStateChanged(GDBusConnection*, const gchar*, const gchar* objectPath, const gchar*, const gchar*,
                       GVariant* parameters, const gpointer data) {
    if (!g_variant_is_of_type(parameters, G_VARIANT_TYPE("(uu)"))) {
        log::Registry::bus()->warn("[GDBusSignalBus] Unexpected {} signature: {}", NM_DBUS_SIGNAL_VPN_STATE,
                                   g_variant_get_type_string(parameters));
        return;
    }

    guint32 state = 0, reason = 0;
    g_variant_get(parameters, "(uu)", &state, &reason);
    (*static_cast<SignalBus::VpnStateHandler*>(data))(objectPath ? objectPath : "", state, reason);
}

}

GDBusSignalBus::GDBusSignalBus() {
    GError* raw = nullptr;
    GDBusConnection* bus = g_bus_get_sync(G_BUS_TYPE_SYSTEM, nullptr, &raw);
    const glib::ScopedGError err(raw);
    if (!bus) throw std::runtime_error("Unable to connect to the system bus: " + glib::messageOf(err.get()));
    bus_.reset(bus);
}

GDBusSignalBus::~GDBusSignalBus() {
    for (const auto& [id, handler] : handlers_) g_dbus_connection_signal_unsubscribe(bus_.get(), id);
}

SignalBus::SubscriptionId GDBusSignalBus::subscribeVpnStateChanged(VpnStateHandler handler) {
    auto owned = std::make_unique<VpnStateHandler>(std::move(handler));
    const auto id = g_dbus_connection_signal_subscribe(
        bus_.get(), nullptr, NM_DBUS_IFACE_VPN, NM_DBUS_SIGNAL_VPN_STATE,
        nullptr, nullptr, G_DBUS_SIGNAL_FLAGS_NONE,
        onVpnStateChanged, owned.get(), nullptr);

    handlers_.emplace(id, std::move(owned));
    log::Registry::bus()->debug("[GDBusSignalBus] Subscribed to {} ({})", NM_DBUS_SIGNAL_VPN_STATE, id);
    return id;
}

void GDBusSignalBus::unsubscribe(const SubscriptionId id) {
    const auto it = handlers_.find(id);
    if (it == handlers_.end()) return;
    g_dbus_connection_signal_unsubscribe(bus_.get(), id);
    handlers_.erase(it);
}

glib::ScopedGVariant GDBusSignalBus::getProperty(const char* objectPath, const char* iface,
                                                 const char* property) const {
    GError* raw = nullptr;
    GVariant* reply = g_dbus_connection_call_sync(
        bus_.get(), NM_DBUS_SERVICE_NAME, objectPath,
        "org.freedesktop.DBus.Properties", "Get",
        g_variant_new("(ss)", iface, property),
        G_VARIANT_TYPE("(v)"), G_DBUS_CALL_FLAGS_NONE, -1, nullptr, &raw);
    const glib::ScopedGError err(raw);

    if (!reply)
        throw std::runtime_error(std::string("Failed to read ") + iface + "." + property + " on " + objectPath +
                                 ": " + glib::messageOf(err.get()));

    const glib::ScopedGVariant owned(reply);
    GVariant* value = nullptr;
    g_variant_get(reply, "(v)", &value);
    return glib::ScopedGVariant(value);
}

std::vector<ActiveConnectionInfo> GDBusSignalBus::activeConnections() {
    std::vector<ActiveConnectionInfo> out;

    const auto paths = getProperty(NM_DBUS_OBJECT_PATH, NM_DBUS_SERVICE_NAME, "ActiveConnections");
    if (!g_variant_is_of_type(paths.get(), G_VARIANT_TYPE("ao")))
        throw std::runtime_error("ActiveConnections has unexpected type");

    GVariantIter iter;
    g_variant_iter_init(&iter, paths.get());
    const gchar* path = nullptr;
    while (g_variant_iter_next(&iter, "&o", &path)) {
        ActiveConnectionInfo info;
        info.objectPath = path;

        const auto id = getProperty(path, NM_DBUS_IFACE_ACTIVE, "Id");
        info.id = g_variant_get_string(id.get(), nullptr);

        const auto vpn = getProperty(path, NM_DBUS_IFACE_ACTIVE, "Vpn");
        info.vpn = g_variant_get_boolean(vpn.get());

        if (info.vpn) {
            const auto state = getProperty(path, NM_DBUS_IFACE_VPN, "VpnState");
            info.vpnState = g_variant_get_uint32(state.get());
        }

        log::Registry::bus()->debug("[GDBusSignalBus] Id: {} Vpn: {} VpnState: {}", info.id, info.vpn,
                                    info.vpnState ? std::to_string(*info.vpnState) : "-");
        out.push_back(std::move(info));
    }

    return out;
}

}
