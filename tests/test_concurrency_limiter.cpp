//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_concurrency_limiter.cpp
// Purpose: Global and per-tool admission, counters and slot release
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "flymcp/ConcurrencyLimiter.h"
#include "flymcp/errors/Errors.h"

using namespace flymcp;

TEST(ConcurrencyLimiter, StartCompleteCounters) {
    ConcurrencyLimiter limiter(2);
    EXPECT_TRUE(limiter.CanStart("a"));
    limiter.Start("a");
    limiter.Start("b");
    EXPECT_EQ(limiter.CurrentGlobal(), 2u);
    EXPECT_EQ(limiter.CurrentFor("a"), 1u);
    EXPECT_FALSE(limiter.CanStart("c"));

    limiter.Complete("a");
    EXPECT_EQ(limiter.CurrentFor("a"), 0u);
    EXPECT_TRUE(limiter.CanStart("c"));
    limiter.Complete("b");
    EXPECT_EQ(limiter.CurrentGlobal(), 0u);

    // Unmatched Complete is tolerated
    limiter.Complete("never-started");
    EXPECT_EQ(limiter.CurrentGlobal(), 0u);
}

TEST(ConcurrencyLimiter, PerToolLimitBindsBeforeGlobal) {
    ConcurrencyLimiter limiter(10, {{"echo", 1}});
    EXPECT_EQ(limiter.LimitFor("echo"), 1u);
    EXPECT_EQ(limiter.LimitFor("other"), 10u);
    limiter.Start("echo");
    EXPECT_FALSE(limiter.CanStart("echo"));
    EXPECT_TRUE(limiter.CanStart("other"));

    try {
        limiter.EnsureCanStart("echo");
        FAIL() << "expected ConcurrencyLimitError";
    } catch (const errors::ConcurrencyLimitError& e) {
        EXPECT_EQ(e.toolName, "echo");
        EXPECT_EQ(e.current, 1u);
        EXPECT_EQ(e.limit, 1u);
    }
    limiter.Complete("echo");

    limiter.SetToolLimit("other", 0);
    EXPECT_FALSE(limiter.CanStart("other"));
}

TEST(ConcurrencyLimiter, ExecuteReleasesSlotOnThrow) {
    ConcurrencyLimiter limiter(1);
    EXPECT_THROW(limiter.Execute("t", []() -> int { throw std::runtime_error("handler failed"); }),
                 std::runtime_error);
    EXPECT_EQ(limiter.CurrentGlobal(), 0u);
    EXPECT_EQ(limiter.CurrentFor("t"), 0u);
    EXPECT_EQ(limiter.Execute("t", []() { return 5; }), 5);
    EXPECT_EQ(limiter.CurrentGlobal(), 0u);
}

TEST(ConcurrencyLimiter, RejectionHasNoSideEffects) {
    ConcurrencyLimiter limiter(1);
    limiter.Start("busy");
    bool ran = false;
    EXPECT_THROW(limiter.Execute("other", [&]() { ran = true; return 0; }), errors::ConcurrencyLimitError);
    EXPECT_FALSE(ran);
    EXPECT_EQ(limiter.CurrentGlobal(), 1u);
    EXPECT_EQ(limiter.CurrentFor("other"), 0u);
    limiter.Complete("busy");
}

// N+1 simultaneous executes against a bound of N: exactly one rejection
TEST(ConcurrencyLimiter, ExactlyOneRejectionForOverflowingBurst) {
    constexpr std::size_t N = 4;
    ConcurrencyLimiter limiter(N);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<std::size_t> admitted{0};
    std::atomic<std::size_t> rejected{0};

    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < N + 1; ++i) {
        threads.emplace_back([&]() {
            try {
                limiter.Execute("tool", [&]() {
                    ++admitted;
                    gate.wait();
                    return 0;
                });
            } catch (const errors::ConcurrencyLimitError&) {
                ++rejected;
            }
        });
    }

    // Everyone has either been admitted or rejected before the gate opens
    for (int i = 0; i < 400 && admitted.load() + rejected.load() < N + 1; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(admitted.load(), N);
    EXPECT_EQ(rejected.load(), 1u);
    EXPECT_EQ(limiter.CurrentGlobal(), N);

    release.set_value();
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(limiter.CurrentGlobal(), 0u);
    EXPECT_EQ(limiter.CurrentFor("tool"), 0u);
}
