#include "nm/StateObserver.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

namespace evpn::nm {

StateObserver::StateObserver(ConnectionManager& manager, SignalBus& bus) : manager_(manager), bus_(bus) {}

StateObserver::~StateObserver() { unsubscribe(); }

void StateObserver::subscribe(StateCallback cb) {
    if (subscription_) throw std::logic_error("StateObserver is already subscribed");
    if (!cb) throw std::invalid_argument("StateObserver::subscribe requires a callback");

    // Read before subscribing so a failed read leaves nothing installed.
    const auto [state, reason] = initialState();

    subscription_ = bus_.subscribeVpnStateChanged(
        [cb](const std::string& objectPath, const uint32_t state, const uint32_t reason) {
            const auto normalized = vpnStateFromRaw(state);
            log::Registry::bus()->debug("[StateObserver] {} VpnStateChanged {} ({}), reason {}",
                                        objectPath, to_string(normalized), state, reason);
            cb(normalized, reasonFromRaw(reason));
        });

    cb(state, reason);
}

void StateObserver::unsubscribe() {
    if (!subscription_) return;
    bus_.unsubscribe(*subscription_);
    subscription_.reset();
}

std::pair<VpnState, StateReason> StateObserver::initialState() const {
    std::vector<ActiveConnectionInfo> vpns;
    for (auto& info : bus_.activeConnections())
        if (info.vpn) vpns.push_back(std::move(info));

    if (vpns.size() == 1 && vpns.front().vpnState) {
        log::Registry::bus()->debug("[StateObserver] Id: {} VpnState: {}", vpns.front().id, *vpns.front().vpnState);
        return {vpnStateFromRaw(*vpns.front().vpnState), StateReason::None};
    }

    if (vpns.size() > 1)
        log::Registry::bus()->warn("[StateObserver] {} VPN connections active, reporting disconnected", vpns.size());

    return {VpnState::Disconnected, StateReason::None};
}

StatusReport pollStatus(ConnectionManager& manager) {
    const auto active = manager.listActive();
    const auto vpnCount = std::ranges::count_if(active, [](const ActiveConnectionPtr& a) { return a && a->isVpn(); });
    if (vpnCount > 1) {
        log::Registry::nm()->warn("[StateObserver] more than one VPN connection active");
        return {std::nullopt, VpnState::Unknown};
    }

    const auto primary = manager.primaryActive();
    if (!primary || !primary->isVpn()) return {};
    return {primary->uuid(), primary->state()};
}

std::pair<VpnState, StateReason> StateObserver::vpnStatus() const {
    std::vector<ActiveConnectionPtr> vpns;
    for (auto& a : manager_.listActive())
        if (a && a->isVpn()) vpns.push_back(std::move(a));

    if (vpns.size() > 1) {
        log::Registry::nm()->warn("[StateObserver] more than one VPN connection active");
        return {VpnState::Unknown, StateReason::Unknown};
    }
    if (vpns.empty()) return {VpnState::Unknown, StateReason::Unknown};
    return {vpns.front()->state(), vpns.front()->stateReason()};
}

}
