#include "nm/types.hpp"

namespace evpn::nm {

VpnState vpnStateFromRaw(const uint32_t raw) {
    switch (raw) {
        case 1: case 2: case 3: case 4: return VpnState::Connecting;
        case 5: return VpnState::Connected;
        case 6: return VpnState::Failed;
        case 7: return VpnState::Disconnected;
        default: return VpnState::Unknown;
    }
}

VpnState activeStateFromRaw(const uint32_t raw) {
    switch (raw) {
        case 1: return VpnState::Connecting;
        case 2: return VpnState::Connected;
        case 3: return VpnState::Disconnecting;
        case 4: return VpnState::Disconnected;
        default: return VpnState::Unknown;
    }
}

StateReason reasonFromRaw(const uint32_t raw) {
    if (raw > static_cast<uint32_t>(StateReason::DeviceRemoved)) return StateReason::Unknown;
    return static_cast<StateReason>(raw);
}

std::string_view to_string(const VpnState state) {
    switch (state) {
        case VpnState::Unknown: return "unknown";
        case VpnState::Disconnected: return "disconnected";
        case VpnState::Connecting: return "connecting";
        case VpnState::Connected: return "connected";
        case VpnState::Disconnecting: return "disconnecting";
        case VpnState::Failed: return "failed";
    }
    return "unknown";
}

std::string_view to_string(const StateReason reason) {
    switch (reason) {
        case StateReason::Unknown: return "unknown";
        case StateReason::None: return "none";
        case StateReason::UserDisconnected: return "user-disconnected";
        case StateReason::DeviceDisconnected: return "device-disconnected";
        case StateReason::ServiceStopped: return "service-stopped";
        case StateReason::IpConfigInvalid: return "ip-config-invalid";
        case StateReason::ConnectTimeout: return "connect-timeout";
        case StateReason::ServiceStartTimeout: return "service-start-timeout";
        case StateReason::ServiceStartFailed: return "service-start-failed";
        case StateReason::NoSecrets: return "no-secrets";
        case StateReason::LoginFailed: return "login-failed";
        case StateReason::ConnectionRemoved: return "connection-removed";
        case StateReason::DependencyFailed: return "dependency-failed";
        case StateReason::DeviceRealizeFailed: return "device-realize-failed";
        case StateReason::DeviceRemoved: return "device-removed";
    }
    return "unknown";
}

std::string_view to_string(const Error error) {
    switch (error) {
        case Error::None: return "none";
        case Error::ConnectionNotResolved: return "connection not resolved";
        case Error::ExternalManagerRejected: return "rejected by NetworkManager";
        case Error::StoreFailed: return "connection store failed";
    }
    return "unknown";
}

}
