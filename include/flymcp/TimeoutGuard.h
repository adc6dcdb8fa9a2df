//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TimeoutGuard.h
// Purpose: Races a unit of work against a deadline without blocking on abandoned work
//==========================================================================================================

#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>

#include "flymcp/Cancellation.h"
#include "flymcp/errors/Errors.h"

namespace flymcp {

// Granularity at which a pending call notices its token being cancelled
inline constexpr std::chrono::milliseconds kCancelPollInterval{10};

//==========================================================================================================
// WithTimeout
// Purpose: Runs body on its own detached thread and waits for it up to timeout.
// Args:
//   body: Work to run; its result or exception is forwarded unchanged.
//   timeout: Deadline measured from the call.
//   operation: Name reported in the timeout error message and data.
//   token: When set, cancelled on expiry so cooperative work can stop early.
// Returns:
//   body's result when it finishes first.
// Throws:
//   errors::TimeoutError on expiry; errors::CancellationError when token is cancelled by someone else
//   while waiting; otherwise whatever body threw.
// Notes:
//   - On expiry or cancellation the body keeps running until it returns; its outcome is dropped.
//==========================================================================================================
template <typename T>
T WithTimeout(std::function<T()> body,
              std::chrono::milliseconds timeout,
              std::optional<std::string> operation = std::nullopt,
              std::shared_ptr<CancellationToken> token = nullptr) {
    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> result = promise->get_future();

    std::thread([promise, work = std::move(body)]() mutable {
        try {
            if constexpr (std::is_void_v<T>) {
                work();
                promise->set_value();
            } else {
                promise->set_value(work());
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            if (result.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                break;
            }
            if (token) {
                token->Cancel();
            }
            throw errors::TimeoutError(timeout, std::move(operation));
        }
        const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kCancelPollInterval);
        if (result.wait_for(slice) == std::future_status::ready) {
            break;
        }
        if (token && token->IsCancelled()) {
            throw errors::CancellationError();
        }
    }
    return result.get();
}

} // namespace flymcp
