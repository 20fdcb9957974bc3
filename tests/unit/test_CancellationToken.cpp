#include <gtest/gtest.h>
#include "concurrency/CancellationToken.hpp"

#include <thread>

using namespace md::concurrency;

TEST(CancellationTokenTest, CallbacksRunOnceOnCancel) {
    const auto token = CancellationToken::create();
    int calls = 0;
    auto sub = token->subscribe([&] { ++calls; });

    EXPECT_FALSE(token->isCancelled());
    token->cancel();
    token->cancel();

    EXPECT_TRUE(token->isCancelled());
    EXPECT_EQ(calls, 1);
}

TEST(CancellationTokenTest, SubscribingAfterCancelRunsImmediately) {
    const auto token = CancellationToken::create();
    token->cancel();

    bool ran = false;
    auto sub = token->subscribe([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CancellationTokenTest, DroppedSubscriptionDoesNotFire) {
    const auto token = CancellationToken::create();
    int calls = 0;
    {
        auto sub = token->subscribe([&] { ++calls; });
    }
    auto kept = token->subscribe([&] { calls += 10; });
    auto reset = token->subscribe([&] { calls += 100; });
    reset.reset();

    token->cancel();
    EXPECT_EQ(calls, 10);
}

TEST(CancellationTokenTest, MovedSubscriptionStaysActive) {
    const auto token = CancellationToken::create();
    int calls = 0;
    CancellationToken::Subscription outer;
    {
        auto inner = token->subscribe([&] { ++calls; });
        outer = std::move(inner);
    }
    token->cancel();
    EXPECT_EQ(calls, 1);
}

TEST(CancellationTokenTest, SubscriptionOutlivingTokenIsHarmless) {
    CancellationToken::Subscription sub;
    {
        const auto token = CancellationToken::create();
        sub = token->subscribe([] {});
    }
    sub.reset();
    SUCCEED();
}

TEST(CancellationTokenTest, CancelFromAnotherThreadIsObserved) {
    const auto token = CancellationToken::create();
    std::thread t([token] { token->cancel(); });
    t.join();
    EXPECT_TRUE(token->isCancelled());
}
