#include <gtest/gtest.h>
#include "nm/OnceCallback.hpp"

using evpn::nm::OnceCallback;

TEST(OnceCallbackTest, CopiesShareOneShot) {
    int calls = 0, last = 0;
    const OnceCallback<int> cb([&](const int v) { ++calls; last = v; });
    const auto copy = cb;

    EXPECT_FALSE(copy.fired());
    EXPECT_TRUE(copy(7));
    EXPECT_FALSE(cb(8));
    EXPECT_FALSE(copy(9));

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(last, 7);
    EXPECT_TRUE(cb.fired());
}

TEST(OnceCallbackTest, EmptyCallbackStillConsumes) {
    const OnceCallback<> cb;
    EXPECT_TRUE(cb());
    EXPECT_FALSE(cb());
}

TEST(OnceCallbackTest, ReentrantCallIsDropped) {
    int calls = 0;
    OnceCallback<> cb;
    cb = OnceCallback<>([&] {
        ++calls;
        EXPECT_FALSE(cb());
    });
    EXPECT_TRUE(cb());
    EXPECT_EQ(calls, 1);
}
