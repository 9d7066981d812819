#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace evpn::nm {

enum class VpnState : uint8_t {
    Unknown,
    Disconnected,
    Connecting,
    Connected,
    Disconnecting,
    Failed
};

// Mirrors NMActiveConnectionStateReason, whose first values are shared with
// NMVpnConnectionStateReason.
enum class StateReason : uint32_t {
    Unknown = 0,
    None = 1,
    UserDisconnected = 2,
    DeviceDisconnected = 3,
    ServiceStopped = 4,
    IpConfigInvalid = 5,
    ConnectTimeout = 6,
    ServiceStartTimeout = 7,
    ServiceStartFailed = 8,
    NoSecrets = 9,
    LoginFailed = 10,
    ConnectionRemoved = 11,
    DependencyFailed = 12,
    DeviceRealizeFailed = 13,
    DeviceRemoved = 14
};

// NMVpnConnectionState: 0 unknown, 1..4 prepare/need-auth/connect/ip-config, 5 activated, 6 failed, 7 disconnected
VpnState vpnStateFromRaw(uint32_t raw);

// NMActiveConnectionState: 0 unknown, 1 activating, 2 activated, 3 deactivating, 4 deactivated
VpnState activeStateFromRaw(uint32_t raw);

StateReason reasonFromRaw(uint32_t raw);

std::string_view to_string(VpnState state);
std::string_view to_string(StateReason reason);

enum class Error : uint8_t {
    None,
    ConnectionNotResolved,
    ExternalManagerRejected,
    StoreFailed
};

std::string_view to_string(Error error);

struct OpResult {
    bool success = true;
    bool performed = true;      // false when the operation was a deliberate no-op
    Error error = Error::None;
    std::string message;        // manager error text, verbatim

    static OpResult ok() { return {}; }
    static OpResult skipped(std::string why) { return {true, false, Error::None, std::move(why)}; }
    static OpResult failure(const Error error, std::string message) { return {false, true, error, std::move(message)}; }
};

using Completion = std::function<void(const OpResult&)>;

struct StatusReport {
    std::optional<std::string> uuid;
    std::optional<VpnState> state;
};

}
