#include "nm/Reconciler.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

namespace evpn::nm {

Reconciler::Reconciler(ConnectionManager& manager, storage::ConnectionStore& store, const bool persist)
    : manager_(manager), store_(store), persist_(persist) {}

void Reconciler::reconcile(ConnectionPtr newConnection, const std::optional<std::string>& storedId, Callback cb) {
    if (!newConnection) throw std::invalid_argument("Reconciler::reconcile requires a connection");

    if (storedId) {
        if (auto existing = manager_.resolve(*storedId)) {
            update(std::move(existing), newConnection, std::move(cb));
            return;
        }
        log::Registry::nm()->info("[Reconciler] Stored connection {} no longer exists, adding a new one", *storedId);
    }

    insert(std::move(newConnection), std::move(cb));
}

void Reconciler::update(ConnectionPtr existing, const ConnectionPtr& newConnection, Callback cb) {
    const auto uuid = existing->uuid();
    manager_.replaceSettings(*existing, *newConnection);

    manager_.commit(std::move(existing), persist_, [uuid, cb = std::move(cb)](const OpResult& result) {
        if (result.success) log::Registry::nm()->info("[Reconciler] Connection updated for uuid: {}", uuid);
        else log::Registry::nm()->error("[Reconciler] Updating {} failed: {}", uuid, result.message);
        cb({ReconcileAction::Update, uuid, result});
    });
}

void Reconciler::insert(ConnectionPtr newConnection, Callback cb) {
    manager_.add(std::move(newConnection), persist_,
                 [this, cb = std::move(cb)](const OpResult& result, const ConnectionPtr& added) {
        if (!result.success || !added) {
            const auto failed = result.success
                ? OpResult::failure(Error::ExternalManagerRejected, "NetworkManager returned no connection")
                : result;
            log::Registry::nm()->error("[Reconciler] Adding connection failed: {}", failed.message);
            cb({ReconcileAction::Insert, {}, failed});
            return;
        }

        const auto uuid = added->uuid();
        try {
            store_.set(uuid);
        } catch (const std::exception& e) {
            log::Registry::nm()->error("[Reconciler] Connection {} added but not stored: {}", uuid, e.what());
            cb({ReconcileAction::Insert, uuid, OpResult::failure(Error::StoreFailed, e.what())});
            return;
        }

        log::Registry::nm()->info("[Reconciler] Connection added for uuid: {}", uuid);
        cb({ReconcileAction::Insert, uuid, OpResult::ok()});
    });
}

}
