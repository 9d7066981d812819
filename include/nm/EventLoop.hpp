#pragma once

#include <chrono>
#include <functional>

#include "glib/scopers.hpp"

namespace evpn::nm {

// Single-threaded cooperative scheduler all NetworkManager callbacks run on.
class EventLoop {
public:
    using Task = std::function<void()>;

    virtual ~EventLoop() = default;

    virtual void post(Task task) = 0;
    virtual void postDelayed(std::chrono::milliseconds delay, Task task) = 0;

    virtual void run() = 0;
    virtual void quit() = 0;
};

// Backed by a GMainLoop on the default main context, which is where libnm
// and GDBus deliver their callbacks.
class GLibEventLoop final : public EventLoop {
public:
    GLibEventLoop();

    void post(Task task) override;
    void postDelayed(std::chrono::milliseconds delay, Task task) override;

    void run() override;
    void quit() override;

    [[nodiscard]] GMainLoop* native() const { return loop_.get(); }

private:
    glib::ScopedGMainLoop loop_;
};

}
