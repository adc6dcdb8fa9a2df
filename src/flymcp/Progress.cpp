//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Progress.cpp
// Purpose: ProgressNotifier implementation
//==========================================================================================================

#include "flymcp/Progress.h"
#include "flymcp/Protocol.h"
#include "logging/Logger.h"

namespace flymcp {

ProgressNotifier::ProgressNotifier(std::optional<JSONValue> progressToken, NotificationSink notificationSink)
    : token(std::move(progressToken)), sink(std::move(notificationSink)) {}

void ProgressNotifier::Notify(const std::string& message, std::optional<int> percent) const {
    if (!IsEnabled()) {
        return;
    }
    JSONValue params{JSONValue::Object{}};
    params.set("progressToken", token.value());
    params.set("progress", JSONValue(static_cast<int64_t>(percent.value_or(0))));
    if (percent.has_value()) {
        params.set("total", JSONValue(static_cast<int64_t>(100)));
    }
    params.set("message", JSONValue(message));
    LOG_DEBUG("Progress {}: {}", SerializeJSON(token.value()), message);
    sink(std::make_unique<JSONRPCNotification>(Methods::Progress, std::move(params)));
}

std::optional<JSONValue> ProgressNotifier::TokenFromParams(const std::optional<JSONValue>& params) {
    if (!params.has_value()) {
        return std::nullopt;
    }
    const JSONValue* meta = params->find("_meta");
    if (meta == nullptr) {
        return std::nullopt;
    }
    const JSONValue* t = meta->find("progressToken");
    if (t == nullptr) {
        return std::nullopt;
    }
    if (t->isString() || std::holds_alternative<int64_t>(t->value)) {
        return *t;
    }
    return std::nullopt;
}

} // namespace flymcp
