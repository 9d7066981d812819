#pragma once

#include <functional>
#include <memory>
#include <utility>

namespace evpn::nm {

// Copies share one slot: whichever copy runs first consumes the callback,
// later invocations are dropped.
template <typename... Args>
class OnceCallback {
public:
    using Fn = std::function<void(Args...)>;

    OnceCallback() : state_(std::make_shared<State>()) {}
    explicit OnceCallback(Fn fn) : state_(std::make_shared<State>()) { state_->fn = std::move(fn); }

    bool operator()(Args... args) const {
        if (state_->fired) return false;
        state_->fired = true;
        auto fn = std::move(state_->fn);
        state_->fn = nullptr;
        if (fn) fn(std::forward<Args>(args)...);
        return true;
    }

    [[nodiscard]] bool fired() const { return state_->fired; }

private:
    struct State {
        Fn fn;
        bool fired = false;
    };

    std::shared_ptr<State> state_;
};

}
