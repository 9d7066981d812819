#include "nm/LibnmClient.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

namespace evpn::nm {

namespace {

NMConnection* nativeOf(const Connection& connection) {
    const auto* nmConn = dynamic_cast<const LibnmConnection*>(&connection);
    if (!nmConn) throw std::invalid_argument("Connection was not created by libnm");
    return nmConn->native();
}

NMActiveConnection* nativeOf(const ActiveConnection& active) {
    const auto* nmActive = dynamic_cast<const LibnmActiveConnection*>(&active);
    if (!nmActive) throw std::invalid_argument("Active connection was not created by libnm");
    return nmActive->native();
}

std::string orEmpty(const char* s) { return s ? s : ""; }

struct AddCall {
    ConnectionPtr connection;
    ConnectionManager::AddCallback cb;
};

// Keeps the object the operation runs on alive until the result arrives.
template <typename T>
struct PendingCall {
    std::shared_ptr<T> target;
    Completion cb;
};

void onAdded(GObject* source, GAsyncResult* res, const gpointer data) {
    const std::unique_ptr<AddCall> call(static_cast<AddCall*>(data));

    GError* raw = nullptr;
    NMRemoteConnection* remote = nm_client_add_connection_finish(NM_CLIENT(source), res, &raw);
    const glib::ScopedGError err(raw);

    if (!remote) {
        log::Registry::nm()->error("[LibnmClient] Adding connection failed: {}", glib::messageOf(err.get()));
        call->cb(OpResult::failure(Error::ExternalManagerRejected, glib::messageOf(err.get())), nullptr);
        return;
    }

    auto added = std::make_shared<LibnmConnection>(glib::ScopedGObject<NMConnection>(NM_CONNECTION(remote)));
    log::Registry::nm()->info("[LibnmClient] Connection added for uuid: {}", added->uuid());
    call->cb(OpResult::ok(), std::move(added));
}

void onCommitted(GObject* source, GAsyncResult* res, const gpointer data) {
    const std::unique_ptr<PendingCall<Connection>> call(static_cast<PendingCall<Connection>*>(data));

    GError* raw = nullptr;
    const gboolean ok = nm_remote_connection_commit_changes_finish(NM_REMOTE_CONNECTION(source), res, &raw);
    const glib::ScopedGError err(raw);

    if (!ok) {
        log::Registry::nm()->error("[LibnmClient] Committing connection {} failed: {}",
                                   call->target->uuid(), glib::messageOf(err.get()));
        call->cb(OpResult::failure(Error::ExternalManagerRejected, glib::messageOf(err.get())));
        return;
    }

    log::Registry::nm()->debug("[LibnmClient] Connection updated for uuid: {}", call->target->uuid());
    call->cb(OpResult::ok());
}

void onActivated(GObject* source, GAsyncResult* res, const gpointer data) {
    const std::unique_ptr<PendingCall<Connection>> call(static_cast<PendingCall<Connection>*>(data));

    GError* raw = nullptr;
    NMActiveConnection* active = nm_client_activate_connection_finish(NM_CLIENT(source), res, &raw);
    const glib::ScopedGError err(raw);

    if (!active) {
        call->cb(OpResult::failure(Error::ExternalManagerRejected, glib::messageOf(err.get())));
        return;
    }

    const glib::ScopedGObject<NMActiveConnection> owned(active);
    log::Registry::nm()->debug("[LibnmClient] Activation requested, active connection {}",
                               orEmpty(nm_object_get_path(NM_OBJECT(active))));
    call->cb(OpResult::ok());
}

void onDeactivated(GObject* source, GAsyncResult* res, const gpointer data) {
    const std::unique_ptr<PendingCall<ActiveConnection>> call(static_cast<PendingCall<ActiveConnection>*>(data));

    GError* raw = nullptr;
    const gboolean ok = nm_client_deactivate_connection_finish(NM_CLIENT(source), res, &raw);
    const glib::ScopedGError err(raw);

    if (!ok) {
        call->cb(OpResult::failure(Error::ExternalManagerRejected, glib::messageOf(err.get())));
        return;
    }

    call->cb(OpResult::ok());
}

}

LibnmConnection::LibnmConnection(glib::ScopedGObject<NMConnection> connection)
    : connection_(std::move(connection)) {
    if (!connection_) throw std::invalid_argument("LibnmConnection requires a connection");
}

std::string LibnmConnection::uuid() const { return orEmpty(nm_connection_get_uuid(connection_.get())); }

std::string LibnmConnection::id() const { return orEmpty(nm_connection_get_id(connection_.get())); }

std::optional<std::string> LibnmConnection::vpnDataItem(const std::string& key) const {
    NMSettingVpn* vpn = nm_connection_get_setting_vpn(connection_.get());
    if (!vpn) return std::nullopt;
    const char* value = nm_setting_vpn_get_data_item(vpn, key.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

LibnmActiveConnection::LibnmActiveConnection(glib::ScopedGObject<NMActiveConnection> active)
    : active_(std::move(active)) {
    if (!active_) throw std::invalid_argument("LibnmActiveConnection requires an active connection");
}

std::string LibnmActiveConnection::uuid() const { return orEmpty(nm_active_connection_get_uuid(active_.get())); }

bool LibnmActiveConnection::isVpn() const { return NM_IS_VPN_CONNECTION(active_.get()); }

VpnState LibnmActiveConnection::state() const {
    if (isVpn()) return vpnStateFromRaw(nm_vpn_connection_get_vpn_state(NM_VPN_CONNECTION(active_.get())));
    return activeStateFromRaw(nm_active_connection_get_state(active_.get()));
}

StateReason LibnmActiveConnection::stateReason() const {
    return reasonFromRaw(nm_active_connection_get_state_reason(active_.get()));
}

LibnmClient::LibnmClient() {
    GError* raw = nullptr;
    NMClient* client = nm_client_new(nullptr, &raw);
    const glib::ScopedGError err(raw);
    if (!client) throw std::runtime_error("Network Manager not available: " + glib::messageOf(err.get()));
    client_.reset(client);
}

bool LibnmClient::available() {
    GError* raw = nullptr;
    const glib::ScopedGObject<NMClient> client(nm_client_new(nullptr, &raw));
    const glib::ScopedGError err(raw);
    if (!client) {
        log::Registry::nm()->warn("[LibnmClient] Network Manager not available: {}", glib::messageOf(err.get()));
        return false;
    }
    return true;
}

ConnectionPtr LibnmClient::resolve(const std::string& uuid) {
    NMRemoteConnection* remote = nm_client_get_connection_by_uuid(client_.get(), uuid.c_str());
    if (!remote) return nullptr;
    return std::make_shared<LibnmConnection>(glib::retain(NM_CONNECTION(remote)));
}

void LibnmClient::add(ConnectionPtr connection, const bool persist, AddCallback cb) {
    NMConnection* native = nativeOf(*connection);
    log::Registry::nm()->info("[LibnmClient] Adding new connection");
    auto* call = new AddCall{std::move(connection), std::move(cb)};
    nm_client_add_connection_async(client_.get(), native, persist, nullptr, onAdded, call);
}

void LibnmClient::replaceSettings(Connection& existing, const Connection& replacement) {
    log::Registry::nm()->info("[LibnmClient] Updating existing connection with new configuration");
    nm_connection_replace_settings_from_connection(nativeOf(existing), nativeOf(replacement));
}

void LibnmClient::commit(ConnectionPtr existing, const bool persist, Completion cb) {
    NMConnection* native = nativeOf(*existing);
    if (!NM_IS_REMOTE_CONNECTION(native)) {
        cb(OpResult::failure(Error::ExternalManagerRejected, "connection is not stored by NetworkManager"));
        return;
    }
    auto* call = new PendingCall<Connection>{std::move(existing), std::move(cb)};
    nm_remote_connection_commit_changes_async(NM_REMOTE_CONNECTION(native), persist, nullptr, onCommitted, call);
}

void LibnmClient::activate(ConnectionPtr connection, Completion cb) {
    NMConnection* native = nativeOf(*connection);
    auto* call = new PendingCall<Connection>{std::move(connection), std::move(cb)};
    nm_client_activate_connection_async(client_.get(), native, nullptr, nullptr, nullptr, onActivated, call);
}

void LibnmClient::deactivate(ActiveConnectionPtr active, Completion cb) {
    NMActiveConnection* native = nativeOf(*active);
    auto* call = new PendingCall<ActiveConnection>{std::move(active), std::move(cb)};
    nm_client_deactivate_connection_async(client_.get(), native, nullptr, onDeactivated, call);
}

std::vector<ActiveConnectionPtr> LibnmClient::listActive() {
    std::vector<ActiveConnectionPtr> out;
    const GPtrArray* active = nm_client_get_active_connections(client_.get());
    if (!active) return out;

    out.reserve(active->len);
    for (guint i = 0; i < active->len; ++i) {
        auto* ac = NM_ACTIVE_CONNECTION(g_ptr_array_index(active, i));
        out.push_back(std::make_shared<LibnmActiveConnection>(glib::retain(ac)));
    }
    return out;
}

ActiveConnectionPtr LibnmClient::primaryActive() {
    NMActiveConnection* primary = nm_client_get_primary_connection(client_.get());
    if (!primary) return nullptr;
    return std::make_shared<LibnmActiveConnection>(glib::retain(primary));
}

}
