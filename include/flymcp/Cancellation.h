//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Cancellation.h
// Purpose: Per-request cancellation token and the registry that maps in-flight request ids to tokens
//==========================================================================================================

#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace flymcp {

//==========================================================================================================
// CancellationToken
// Purpose: One-way cancelled flag shared between the registry and the call that owns it.
// Notes:
//   - Cancel() is idempotent and thread-safe; only the first call fires OnCancel().
//   - Handlers may poll IsCancelled(), wait on OnCancel(), use GetStopToken() with std::stop_callback,
//     or call ThrowIfCancelled().
//==========================================================================================================
class CancellationToken {
public:
    CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void Cancel();
    bool IsCancelled() const noexcept { return cancelled.load(std::memory_order_acquire); }

    // Ready once Cancel() has been called
    std::shared_future<void> OnCancel() const { return cancelledFuture; }

    std::stop_token GetStopToken() const noexcept { return stopSource.get_token(); }

    //======================================================================================================
    // ThrowIfCancelled
    // Purpose: Cooperative exit point for handlers.
    // Throws:
    //   errors::CancellationError when the token has been cancelled.
    //======================================================================================================
    void ThrowIfCancelled() const;

private:
    std::atomic<bool> cancelled{false};
    std::promise<void> cancelledPromise;
    std::shared_future<void> cancelledFuture;
    std::stop_source stopSource;
};

//==========================================================================================================
// CancellationRegistry
// Purpose: Thread-safe map of request key (IdToKey) -> token for requests in flight.
//==========================================================================================================
class CancellationRegistry {
public:
    void Register(const std::string& requestId, std::shared_ptr<CancellationToken> token);

    //======================================================================================================
    // Cancel
    // Purpose: Signals and removes the token for requestId.
    // Returns:
    //   true when a token was found; unknown ids are a no-op.
    //======================================================================================================
    bool Cancel(const std::string& requestId);

    // Erases the entry; when owner is given only if it still maps to that token (ids may be reused)
    void Remove(const std::string& requestId, const std::shared_ptr<CancellationToken>& owner = nullptr);

    // Signals and removes every token; returns how many there were
    std::size_t CancelAll();

    std::shared_ptr<CancellationToken> Get(const std::string& requestId) const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<CancellationToken>> tokens;
};

} // namespace flymcp
