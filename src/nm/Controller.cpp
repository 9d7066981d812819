#include "nm/Controller.hpp"
#include "nm/StateObserver.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace evpn::nm {

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error("Failed to open " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}

Controller::Controller(ConnectionManager& manager,
                       const ProfileImporter& importer,
                       storage::ConnectionStore& store,
                       EventLoop& loop,
                       const RetryPolicy retry,
                       const bool persist)
    : manager_(manager),
      importer_(importer),
      store_(store),
      reconciler_(manager, store, persist),
      activator_(manager, loop, retry) {}

void Controller::saveConnection(const std::string& config, const std::string& privateKey,
                                const std::string& certificate, Completion cb) {
    auto connection = importer_.importProfile(config, privateKey, certificate);
    log::Registry::evpn()->info("[Controller] Saving connection {}", connection->id());

    reconciler_.reconcile(std::move(connection), store_.get(), [cb = std::move(cb)](const ReconcileResult& r) {
        if (cb) cb(r.result);
    });
}

void Controller::activate(Completion cb) {
    const auto uuid = store_.get();
    if (!uuid) {
        log::Registry::evpn()->warn("[Controller] No managed connection to activate");
        if (cb) cb(OpResult::failure(Error::ConnectionNotResolved, "no connection has been saved"));
        return;
    }
    activator_.activate(*uuid, std::move(cb));
}

void Controller::deactivate(Completion cb) {
    const auto uuid = store_.get();
    if (!uuid) {
        log::Registry::evpn()->info("[Controller] No managed connection to deactivate");
        if (cb) cb(OpResult::skipped("no connection has been saved"));
        return;
    }
    activator_.deactivate(*uuid, std::move(cb));
}

StatusReport Controller::status() const { return pollStatus(manager_); }

std::pair<std::string, std::string> Controller::certKey() const {
    const auto uuid = store_.get();
    const auto connection = uuid ? manager_.resolve(*uuid) : nullptr;
    if (!connection) throw std::runtime_error("Can't fetch VPN profile");

    const auto cert = connection->vpnDataItem("cert");
    const auto key = connection->vpnDataItem("key");
    if (!cert || !key) throw std::runtime_error("Can't fetch VPN profile");

    return {readFile(*cert), readFile(*key)};
}

OpResult runWithMainLoop(EventLoop& loop, const std::function<void(Completion)>& operation) {
    OpResult outcome = OpResult::failure(Error::None, "operation did not complete");
    bool completed = false;

    operation([&](const OpResult& result) {
        outcome = result;
        completed = true;
        loop.quit();
    });

    if (!completed) loop.run();
    return outcome;
}

}
