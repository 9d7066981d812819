#pragma once

#include "nm/ConnectionManager.hpp"
#include "glib/scopers.hpp"

#include <NetworkManager.h>

namespace evpn::nm {

class LibnmConnection final : public Connection {
public:
    explicit LibnmConnection(glib::ScopedGObject<NMConnection> connection);

    [[nodiscard]] std::string uuid() const override;
    [[nodiscard]] std::string id() const override;
    [[nodiscard]] std::optional<std::string> vpnDataItem(const std::string& key) const override;

    [[nodiscard]] NMConnection* native() const { return connection_.get(); }

private:
    glib::ScopedGObject<NMConnection> connection_;
};

class LibnmActiveConnection final : public ActiveConnection {
public:
    explicit LibnmActiveConnection(glib::ScopedGObject<NMActiveConnection> active);

    [[nodiscard]] std::string uuid() const override;
    [[nodiscard]] bool isVpn() const override;
    [[nodiscard]] VpnState state() const override;
    [[nodiscard]] StateReason stateReason() const override;

    [[nodiscard]] NMActiveConnection* native() const { return active_.get(); }

private:
    glib::ScopedGObject<NMActiveConnection> active_;
};

// ConnectionManager over libnm's NMClient. Must be created and used on the
// thread running the default GLib main context.
class LibnmClient final : public ConnectionManager {
public:
    LibnmClient();

    // True when a client can be created, i.e. NetworkManager is reachable.
    static bool available();

    ConnectionPtr resolve(const std::string& uuid) override;

    void add(ConnectionPtr connection, bool persist, AddCallback cb) override;

    void replaceSettings(Connection& existing, const Connection& replacement) override;
    void commit(ConnectionPtr existing, bool persist, Completion cb) override;

    void activate(ConnectionPtr connection, Completion cb) override;
    void deactivate(ActiveConnectionPtr active, Completion cb) override;

    std::vector<ActiveConnectionPtr> listActive() override;
    ActiveConnectionPtr primaryActive() override;

private:
    glib::ScopedGObject<NMClient> client_;
};

}
