#pragma once

#include "nm/Activator.hpp"
#include "nm/ProfileImporter.hpp"
#include "nm/Reconciler.hpp"

#include <functional>
#include <string>
#include <utility>

namespace evpn::nm {

/**
 * Entry point for the client's connection lifecycle. Owns nothing external:
 * manager, importer, store and loop are borrowed and must outlive it.
 */
class Controller {
public:
    Controller(ConnectionManager& manager,
               const ProfileImporter& importer,
               storage::ConnectionStore& store,
               EventLoop& loop,
               RetryPolicy retry = {},
               bool persist = true);

    // Imports the profile and inserts or updates the managed connection.
    void saveConnection(const std::string& config, const std::string& privateKey,
                        const std::string& certificate, Completion cb);

    void activate(Completion cb);
    void deactivate(Completion cb);

    [[nodiscard]] StatusReport status() const;

    // Contents of the certificate and key files referenced by the managed connection.
    [[nodiscard]] std::pair<std::string, std::string> certKey() const;

    [[nodiscard]] Activator& activator() { return activator_; }

private:
    ConnectionManager& manager_;
    const ProfileImporter& importer_;
    storage::ConnectionStore& store_;
    Reconciler reconciler_;
    Activator activator_;
};

// Runs one asynchronous operation to completion on a loop nobody else is
// driving, for command line use.
OpResult runWithMainLoop(EventLoop& loop, const std::function<void(Completion)>& operation);

}
