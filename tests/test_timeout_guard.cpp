//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_timeout_guard.cpp
// Purpose: Deadline racing for handler bodies, alone and combined with the limiter
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "flymcp/Cancellation.h"
#include "flymcp/ConcurrencyLimiter.h"
#include "flymcp/TimeoutGuard.h"
#include "flymcp/errors/Errors.h"

using namespace flymcp;

TEST(TimeoutGuard, ReturnsResultWhenBodyFinishesFirst) {
    int v = WithTimeout<int>([]() { return 42; }, std::chrono::milliseconds(1000));
    EXPECT_EQ(v, 42);
}

TEST(TimeoutGuard, ForwardsBodyException) {
    EXPECT_THROW(WithTimeout<int>([]() -> int { throw std::invalid_argument("bad"); }, std::chrono::milliseconds(1000)),
                 std::invalid_argument);
}

TEST(TimeoutGuard, VoidBody) {
    bool ran = false;
    EXPECT_NO_THROW(WithTimeout<void>([&ran]() { ran = true; }, std::chrono::milliseconds(1000)));
    EXPECT_TRUE(ran);
}

TEST(TimeoutGuard, TimeoutWinsAndCancelsToken) {
    auto token = std::make_shared<CancellationToken>();
    const auto started = std::chrono::steady_clock::now();
    try {
        (void)WithTimeout<int>([]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2000));
            return 1;
        }, std::chrono::milliseconds(50), std::string("slow_op"), token);
        FAIL() << "expected TimeoutError";
    } catch (const errors::TimeoutError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("slow_op"), std::string::npos);
        EXPECT_EQ(e.timeout, std::chrono::milliseconds(50));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(500));
    EXPECT_TRUE(token->IsCancelled());
}

TEST(TimeoutGuard, ExternalCancellationStopsWaiting) {
    auto token = std::make_shared<CancellationToken>();
    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        token->Cancel();
    });
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW((void)WithTimeout<int>([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(2000));
        return 1;
    }, std::chrono::seconds(10), std::nullopt, token), errors::CancellationError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(500));
    canceller.join();
}

// Limiter slot is released as soon as the deadline fires
TEST(TimeoutGuard, TimeoutReleasesLimiterSlot) {
    ConcurrencyLimiter limiter(1);
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(limiter.Execute("sleepy", [&]() {
        return WithTimeout<int>([]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1000));
            return 0;
        }, std::chrono::milliseconds(50), std::string("sleepy"));
    }), errors::TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(500));
    EXPECT_EQ(limiter.CurrentGlobal(), 0u);
    EXPECT_TRUE(limiter.CanStart("sleepy"));
}
