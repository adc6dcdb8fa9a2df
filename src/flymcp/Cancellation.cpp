//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Cancellation.cpp
// Purpose: CancellationToken and CancellationRegistry implementation
//==========================================================================================================

#include "flymcp/Cancellation.h"
#include "flymcp/errors/Errors.h"
#include "logging/Logger.h"

namespace flymcp {

CancellationToken::CancellationToken()
    : cancelledFuture(cancelledPromise.get_future().share()) {}

void CancellationToken::Cancel() {
    bool expected = false;
    if (!cancelled.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    stopSource.request_stop();
    cancelledPromise.set_value();
}

void CancellationToken::ThrowIfCancelled() const {
    if (IsCancelled()) {
        throw errors::CancellationError();
    }
}

void CancellationRegistry::Register(const std::string& requestId, std::shared_ptr<CancellationToken> token) {
    std::lock_guard<std::mutex> lock(mutex);
    tokens[requestId] = std::move(token);
}

bool CancellationRegistry::Cancel(const std::string& requestId) {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = tokens.find(requestId);
        if (it == tokens.end()) {
            LOG_DEBUG("Cancel for unknown request id {} ignored", requestId);
            return false;
        }
        token = std::move(it->second);
        tokens.erase(it);
    }
    // Signal outside the lock; stop callbacks may run arbitrary handler code
    token->Cancel();
    return true;
}

void CancellationRegistry::Remove(const std::string& requestId, const std::shared_ptr<CancellationToken>& owner) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = tokens.find(requestId);
    if (it == tokens.end()) {
        return;
    }
    if (owner && it->second != owner) {
        return;
    }
    tokens.erase(it);
}

std::size_t CancellationRegistry::CancelAll() {
    std::unordered_map<std::string, std::shared_ptr<CancellationToken>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex);
        pending.swap(tokens);
    }
    for (auto& [id, token] : pending) {
        LOG_DEBUG("Cancelling request {} on shutdown", id);
        token->Cancel();
    }
    return pending.size();
}

std::shared_ptr<CancellationToken> CancellationRegistry::Get(const std::string& requestId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = tokens.find(requestId);
    return (it == tokens.end()) ? nullptr : it->second;
}

std::size_t CancellationRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return tokens.size();
}

} // namespace flymcp
