#include <gtest/gtest.h>
#include "nm/EventLoop.hpp"

#include <vector>

using evpn::nm::GLibEventLoop;
using namespace std::chrono_literals;

class GLibEventLoopTest : public ::testing::Test {
protected:
    GLibEventLoop loop;
    bool timedOut = false;
    guint guard = 0;

    // Stops a run() that would otherwise hang the suite.
    void SetUp() override {
        guard = g_timeout_add_full(G_PRIORITY_HIGH, 2000, [](const gpointer data) -> gboolean {
            auto* self = static_cast<GLibEventLoopTest*>(data);
            self->timedOut = true;
            self->loop.quit();
            return G_SOURCE_REMOVE;
        }, this, nullptr);
    }

    void TearDown() override {
        if (!timedOut) g_source_remove(guard);
    }
};

TEST_F(GLibEventLoopTest, PostedTasksRunInOrder) {
    std::vector<int> order;
    loop.post([&] { order.push_back(1); });
    loop.post([&] { order.push_back(2); loop.quit(); });
    loop.run();

    EXPECT_FALSE(timedOut);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST_F(GLibEventLoopTest, DelayedTaskRuns) {
    bool ran = false;
    loop.postDelayed(5ms, [&] { ran = true; loop.quit(); });
    loop.run();

    EXPECT_FALSE(timedOut);
    EXPECT_TRUE(ran);
}

TEST_F(GLibEventLoopTest, NegativeDelayRunsImmediately) {
    bool ran = false;
    loop.postDelayed(-5ms, [&] { ran = true; loop.quit(); });
    loop.run();

    EXPECT_FALSE(timedOut);
    EXPECT_TRUE(ran);
}
