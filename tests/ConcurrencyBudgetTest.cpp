#include <gtest/gtest.h>

#include "core/ConcurrencyBudget.h"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

TEST(ConcurrencyBudget, SlotsAreReturnedOnRelease)
{
    ConcurrencyBudget budget(2);
    CancellationToken token;

    auto a = budget.acquire(token);
    auto b = budget.acquire(token);
    EXPECT_TRUE(a.held());
    EXPECT_TRUE(b.held());
    EXPECT_EQ(2u, budget.inUse());

    a.release();
    EXPECT_EQ(1u, budget.inUse());
    {
        auto c = std::move(b);
        EXPECT_FALSE(b.held());
        EXPECT_EQ(1u, budget.inUse());
    }
    EXPECT_EQ(0u, budget.inUse());
}

TEST(ConcurrencyBudget, NeverExceedsLimit)
{
    ConcurrencyBudget budget(3);
    CancellationToken token;
    std::atomic<std::size_t> current{ 0 };
    std::atomic<std::size_t> peak{ 0 };

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&]() {
            for (int round = 0; round < 20; ++round) {
                auto slot = budget.acquire(token);
                ASSERT_TRUE(slot.held());
                auto now = ++current;
                auto prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                --current;
            }
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_LE(peak.load(), 3u);
    EXPECT_EQ(0u, budget.inUse());
}

TEST(ConcurrencyBudget, WaitingAcquireGivesUpOnCancel)
{
    ConcurrencyBudget budget(1);
    CancellationToken holderToken;
    auto held = budget.acquire(holderToken);

    CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });

    auto slot = budget.acquire(token);
    EXPECT_FALSE(slot.held());
    EXPECT_EQ(1u, budget.inUse());
    canceller.join();
}

TEST(ConcurrencyBudget, ZeroLimitIsRejected)
{
    EXPECT_THROW(ConcurrencyBudget(0), std::invalid_argument);
}

} // namespace
