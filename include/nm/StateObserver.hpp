#pragma once

#include "nm/ConnectionManager.hpp"
#include "nm/SignalBus.hpp"

#include <functional>
#include <optional>
#include <utility>

namespace evpn::nm {

// Primary connection's uuid and state when it is a VPN, else {nullopt, nullopt}.
// More than one active VPN yields {nullopt, UNKNOWN}.
StatusReport pollStatus(ConnectionManager& manager);

/**
 * Normalizes VPN state from two sources: the VpnStateChanged signal on the
 * system bus, and direct queries of the connection manager.
 */
class StateObserver {
public:
    using StateCallback = std::function<void(VpnState, StateReason)>;

    StateObserver(ConnectionManager& manager, SignalBus& bus);
    ~StateObserver();

    StateObserver(const StateObserver&) = delete;
    StateObserver& operator=(const StateObserver&) = delete;

    // Emits the current state synchronously before returning, then every change.
    void subscribe(StateCallback cb);
    void unsubscribe();

    [[nodiscard]] bool subscribed() const { return subscription_.has_value(); }

    [[nodiscard]] StatusReport poll() const { return pollStatus(manager_); }

    // State of the single active VPN; UNKNOWN/UNKNOWN when there is none or more than one.
    [[nodiscard]] std::pair<VpnState, StateReason> vpnStatus() const;

private:
    ConnectionManager& manager_;
    SignalBus& bus_;
    std::optional<SignalBus::SubscriptionId> subscription_;

    std::pair<VpnState, StateReason> initialState() const;
};

}
