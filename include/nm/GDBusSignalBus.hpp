#pragma once

#include "nm/SignalBus.hpp"
#include "glib/scopers.hpp"

#include <gio/gio.h>
#include <map>
#include <memory>

namespace evpn::nm {

constexpr auto NM_DBUS_SERVICE_NAME = "org.freedesktop.NetworkManager";
constexpr auto NM_DBUS_OBJECT_PATH = "/org/freedesktop/NetworkManager";
constexpr auto NM_DBUS_IFACE_ACTIVE = "org.freedesktop.NetworkManager.Connection.Active";
constexpr auto NM_DBUS_IFACE_VPN = "org.freedesktop.NetworkManager.VPN.Connection";
constexpr auto NM_DBUS_SIGNAL_VPN_STATE = "VpnStateChanged";

// NetworkManager signals and properties on the system bus through GDBus.
class GDBusSignalBus final : public SignalBus {
public:
    GDBusSignalBus();
    ~GDBusSignalBus() override;

    GDBusSignalBus(const GDBusSignalBus&) = delete;
    GDBusSignalBus& operator=(const GDBusSignalBus&) = delete;

    SubscriptionId subscribeVpnStateChanged(VpnStateHandler handler) override;
    void unsubscribe(SubscriptionId id) override;

    std::vector<ActiveConnectionInfo> activeConnections() override;

private:
    glib::ScopedGObject<GDBusConnection> bus_;
    std::map<SubscriptionId, std::unique_ptr<VpnStateHandler>> handlers_;

    glib::ScopedGVariant getProperty(const char* objectPath, const char* iface, const char* property) const;
};

}
