#pragma once

#include "nm/types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace evpn::nm {

// A connection profile, either freshly imported or stored by the manager.
class Connection {
public:
    virtual ~Connection() = default;

    [[nodiscard]] virtual std::string uuid() const = 0;
    [[nodiscard]] virtual std::string id() const = 0;

    // Entry of the VPN setting's data map, e.g. "cert" or "key".
    [[nodiscard]] virtual std::optional<std::string> vpnDataItem(const std::string& key) const = 0;
};

class ActiveConnection {
public:
    virtual ~ActiveConnection() = default;

    [[nodiscard]] virtual std::string uuid() const = 0;
    [[nodiscard]] virtual bool isVpn() const = 0;
    [[nodiscard]] virtual VpnState state() const = 0;
    [[nodiscard]] virtual StateReason stateReason() const = 0;
};

using ConnectionPtr = std::shared_ptr<Connection>;
using ActiveConnectionPtr = std::shared_ptr<ActiveConnection>;

/**
 * The system connection manager as seen by this client. Every asynchronous
 * operation completes on the event loop thread and invokes its callback
 * exactly once.
 */
class ConnectionManager {
public:
    using AddCallback = std::function<void(const OpResult&, ConnectionPtr added)>;

    virtual ~ConnectionManager() = default;

    // nullptr when no stored connection carries the uuid.
    virtual ConnectionPtr resolve(const std::string& uuid) = 0;

    virtual void add(ConnectionPtr connection, bool persist, AddCallback cb) = 0;

    virtual void replaceSettings(Connection& existing, const Connection& replacement) = 0;
    virtual void commit(ConnectionPtr existing, bool persist, Completion cb) = 0;

    virtual void activate(ConnectionPtr connection, Completion cb) = 0;
    virtual void deactivate(ActiveConnectionPtr active, Completion cb) = 0;

    virtual std::vector<ActiveConnectionPtr> listActive() = 0;
    virtual ActiveConnectionPtr primaryActive() = 0;
};

}
