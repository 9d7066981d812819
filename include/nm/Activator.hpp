#pragma once

#include "nm/ConnectionManager.hpp"
#include "nm/EventLoop.hpp"
#include "nm/OnceCallback.hpp"

#include <chrono>
#include <string>

namespace evpn::nm {

struct RetryPolicy {
    std::chrono::milliseconds delay{100};
    unsigned int maxRetries = 1;
    // Sleep before posting the retry instead of scheduling a timer. Only for
    // one-shot batch runs where nothing else is waiting on the loop.
    bool blocking = false;
};

/**
 * Activates and deactivates the managed connection.
 *
 * A connection that was just added or updated is sometimes not yet known to
 * the client even though NetworkManager already reported success. Activation
 * therefore treats "not found" as transient and retries the lookup from the
 * event loop. This is a workaround for a known race, not a fix: a lookup that
 * still fails after the last retry is reported as ConnectionNotResolved.
 *
 * Pending retries capture this object, so it must outlive the event loop run.
 */
class Activator {
public:
    Activator(ConnectionManager& manager, EventLoop& loop, RetryPolicy policy = {});

    void activate(const std::string& uuid, Completion cb);

    // Only deactivates when uuid is the primary active connection.
    void deactivate(const std::string& uuid, Completion cb);

    void setRetryPolicy(const RetryPolicy& policy) { policy_ = policy; }
    [[nodiscard]] const RetryPolicy& retryPolicy() const { return policy_; }

private:
    using Done = OnceCallback<const OpResult&>;

    ConnectionManager& manager_;
    EventLoop& loop_;
    RetryPolicy policy_;

    void attemptActivate(const std::string& uuid, const Done& done, unsigned int retriesLeft);
};

}
