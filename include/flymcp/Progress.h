//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Progress.h
// Purpose: Progress reporting handle passed to request handlers
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "flymcp/JSONRPCTypes.h"

namespace flymcp {

using NotificationSink = std::function<void(std::unique_ptr<JSONRPCNotification>)>;

//==========================================================================================================
// ProgressNotifier
// Purpose: Emits notifications/progress for one request when the peer supplied a progress token.
// Notes:
//   - Without a token (or sink) Notify() does nothing.
//   - Safe to call from any thread; the sink is expected to be thread-safe.
//==========================================================================================================
class ProgressNotifier {
public:
    ProgressNotifier() = default;
    ProgressNotifier(std::optional<JSONValue> progressToken, NotificationSink sink);

    //======================================================================================================
    // Notify
    // Purpose: Sends { progressToken, progress, total?, message }.
    // Args:
    //   message: Human readable status.
    //   percent: 0..100; when present progress=percent and total=100, else progress=0.
    //======================================================================================================
    void Notify(const std::string& message, std::optional<int> percent = std::nullopt) const;

    bool IsEnabled() const { return token.has_value() && static_cast<bool>(sink); }

    // Extracts params._meta.progressToken (string or integer); nullopt otherwise
    static std::optional<JSONValue> TokenFromParams(const std::optional<JSONValue>& params);

private:
    std::optional<JSONValue> token;
    NotificationSink sink;
};

} // namespace flymcp
