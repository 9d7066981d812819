#include "nm/EventLoop.hpp"

#include <algorithm>

namespace evpn::nm {

namespace {

gboolean runTask(const gpointer data) {
    (*static_cast<EventLoop::Task*>(data))();
    return G_SOURCE_REMOVE;
}

void destroyTask(const gpointer data) {
    delete static_cast<EventLoop::Task*>(data);
}

}

GLibEventLoop::GLibEventLoop() : loop_(g_main_loop_new(nullptr, FALSE)) {}

void GLibEventLoop::post(Task task) {
    g_idle_add_full(G_PRIORITY_DEFAULT_IDLE, runTask, new Task(std::move(task)), destroyTask);
}

void GLibEventLoop::postDelayed(const std::chrono::milliseconds delay, Task task) {
    const auto ms = std::clamp<std::chrono::milliseconds::rep>(delay.count(), 0, G_MAXUINT);
    g_timeout_add_full(G_PRIORITY_DEFAULT, static_cast<guint>(ms), runTask,
                       new Task(std::move(task)), destroyTask);
}

void GLibEventLoop::run() { g_main_loop_run(loop_.get()); }

void GLibEventLoop::quit() { g_main_loop_quit(loop_.get()); }

}
