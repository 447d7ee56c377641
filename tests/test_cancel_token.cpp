#include <gtest/gtest.h>
#include <dispatch/cancel.hpp>
#include <atomic>
#include <chrono>
#include <thread>

TEST(CancelToken, StartsUncancelled) {
    CancelToken token;
    EXPECT_FALSE(token.cancelled());
}

TEST(CancelToken, HooksRunOnceOnFirstCancel) {
    CancelToken token;
    int a = 0, b = 0;
    token.subscribe([&] { ++a; });
    token.subscribe([&] { ++b; });

    token.cancel();
    token.cancel();

    EXPECT_TRUE(token.cancelled());
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 1);
}

TEST(CancelToken, CopiesShareState) {
    CancelToken token;
    CancelToken copy = token;
    int fired = 0;
    token.subscribe([&] { ++fired; });

    copy.cancel();
    EXPECT_TRUE(token.cancelled());
    EXPECT_EQ(fired, 1);
}

TEST(CancelToken, SubscribeAfterCancelRunsImmediately) {
    CancelToken token;
    token.cancel();
    int fired = 0;
    uint64_t id = token.subscribe([&] { ++fired; });
    EXPECT_EQ(id, 0u);
    EXPECT_EQ(fired, 1);
    token.unsubscribe(id);
}

TEST(CancelToken, UnsubscribedHookDoesNotRun) {
    CancelToken token;
    int fired = 0;
    uint64_t id = token.subscribe([&] { ++fired; });
    token.unsubscribe(id);
    token.cancel();
    EXPECT_EQ(fired, 0);
}

TEST(CancelToken, UnsubscribeFromInsideHook) {
    CancelToken token;
    uint64_t id = 0;
    bool ran = false;
    id = token.subscribe([&] {
        token.unsubscribe(id);
        ran = true;
    });
    token.cancel();
    EXPECT_TRUE(ran);
}

TEST(CancelToken, UnsubscribeWaitsForRunningHook) {
    CancelToken token;
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    uint64_t id = token.subscribe([&] {
        started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        finished = true;
    });

    std::thread canceller([&] { token.cancel(); });
    while (!started) std::this_thread::yield();

    token.unsubscribe(id);
    EXPECT_TRUE(finished);
    canceller.join();
}
