#pragma once

#include "nm/ConnectionManager.hpp"
#include "storage/ConnectionStore.hpp"

#include <functional>
#include <optional>
#include <string>

namespace evpn::nm {

enum class ReconcileAction : uint8_t { Update, Insert };

struct ReconcileResult {
    ReconcileAction action = ReconcileAction::Insert;
    std::string uuid;       // managed connection after the operation, empty if an insert failed
    OpResult result;
};

/**
 * Folds a freshly imported connection into the one connection this client
 * manages. A stored uuid that still resolves is updated in place; anything
 * else becomes an insert whose new uuid replaces the stored one.
 */
class Reconciler {
public:
    using Callback = std::function<void(const ReconcileResult&)>;

    Reconciler(ConnectionManager& manager, storage::ConnectionStore& store, bool persist = true);

    void reconcile(ConnectionPtr newConnection, const std::optional<std::string>& storedId, Callback cb);

private:
    ConnectionManager& manager_;
    storage::ConnectionStore& store_;
    bool persist_;

    void update(ConnectionPtr existing, const ConnectionPtr& newConnection, Callback cb);
    void insert(ConnectionPtr newConnection, Callback cb);
};

}
