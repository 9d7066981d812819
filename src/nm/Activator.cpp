#include "nm/Activator.hpp"
#include "log/Registry.hpp"

#include <thread>

namespace evpn::nm {

Activator::Activator(ConnectionManager& manager, EventLoop& loop, const RetryPolicy policy)
    : manager_(manager), loop_(loop), policy_(policy) {}

void Activator::activate(const std::string& uuid, Completion cb) {
    attemptActivate(uuid, Done(std::move(cb)), policy_.maxRetries);
}

void Activator::attemptActivate(const std::string& uuid, const Done& done, const unsigned int retriesLeft) {
    auto connection = manager_.resolve(uuid);
    const auto logger = log::Registry::nm();
    logger->info("[Activator] activate_connection uuid: {} found: {}", uuid, connection != nullptr);

    if (!connection) {
        if (retriesLeft == 0) {
            logger->error("[Activator] Connection {} not found, giving up", uuid);
            done(OpResult::failure(Error::ConnectionNotResolved, "connection " + uuid + " not found"));
            return;
        }

        logger->warn("[Activator] Connection {} not visible yet, retrying in {}ms", uuid, policy_.delay.count());
        auto retry = [this, uuid, done, retriesLeft] { attemptActivate(uuid, done, retriesLeft - 1); };

        if (policy_.blocking) {
            std::this_thread::sleep_for(policy_.delay);
            loop_.post(std::move(retry));
        } else {
            loop_.postDelayed(policy_.delay, std::move(retry));
        }
        return;
    }

    manager_.activate(std::move(connection), [uuid, done](const OpResult& result) {
        if (result.success) log::Registry::nm()->info("[Activator] Activation of {} requested", uuid);
        else log::Registry::nm()->error("[Activator] Activation of {} failed: {}", uuid, result.message);
        done(result);
    });
}

void Activator::deactivate(const std::string& uuid, Completion cb) {
    const Done done(std::move(cb));
    const auto logger = log::Registry::nm();

    auto primary = manager_.primaryActive();
    if (!primary) {
        logger->info("[Activator] No active connection to deactivate");
        done(OpResult::skipped("no active connection"));
        return;
    }

    const auto activeUuid = primary->uuid();
    logger->debug("[Activator] deactivate_connection uuid: {} primary: {}", uuid, activeUuid);
    if (activeUuid != uuid) {
        logger->info("[Activator] Primary connection {} is not {}, nothing to deactivate", activeUuid, uuid);
        done(OpResult::skipped("connection is not the primary connection"));
        return;
    }

    manager_.deactivate(std::move(primary), [uuid, done](const OpResult& result) {
        if (result.success) log::Registry::nm()->info("[Activator] Deactivated {}", uuid);
        else log::Registry::nm()->error("[Activator] Deactivation of {} failed: {}", uuid, result.message);
        done(result);
    });
}

}
