#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace evpn::nm {

struct ActiveConnectionInfo {
    std::string objectPath;
    std::string id;
    bool vpn = false;
    std::optional<uint32_t> vpnState;   // raw NMVpnConnectionState, VPN connections only
};

class SignalBus {
public:
    using VpnStateHandler = std::function<void(const std::string& objectPath, uint32_t state, uint32_t reason)>;
    using SubscriptionId = unsigned int;

    virtual ~SignalBus() = default;

    virtual SubscriptionId subscribeVpnStateChanged(VpnStateHandler handler) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;

    // Synchronous property reads of the manager's ActiveConnections.
    virtual std::vector<ActiveConnectionInfo> activeConnections() = 0;
};

}
