//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EchoTool.cpp
// Purpose: Demo "echo" tool served by flymcp_server
//==========================================================================================================

#include "flymcp/tools/EchoTool.h"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "logging/Logger.h"

namespace flymcp {
namespace tools {

namespace {

JSONValue typeSchema(const char* type) {
    JSONValue schema{JSONValue::Object{}};
    schema.set("type", JSONValue(type));
    return schema;
}

JSONValue echoInputSchema() {
    JSONValue properties{JSONValue::Object{}};
    properties.set("message", typeSchema("string"));
    properties.set("delayMs", typeSchema("integer"));

    JSONValue schema = typeSchema("object");
    schema.set("properties", std::move(properties));
    schema.set("required", MakeStringArray({"message"}));
    return schema;
}

JSONValue echo(const JSONValue& args, const CancellationToken& token, const ProgressNotifier& progress) {
    const std::string message = GetString(args, "message").value_or("");
    const int64_t delayMs = GetInt(args, "delayMs").value_or(0);

    if (delayMs > 0) {
        progress.Notify("echo: waiting", 0);
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delayMs);
        while (true) {
            token.ThrowIfCancelled();
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                break;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                deadline - now, std::chrono::milliseconds(5)));
        }
        progress.Notify("echo: done", 100);
    }
    token.ThrowIfCancelled();
    LOG_DEBUG("echo returning {} bytes", message.size());
    return JSONValue(message);
}

} // namespace

HandlerDefinition MakeEchoTool(std::optional<std::size_t> maxConcurrency) {
    HandlerDefinition def;
    def.name = "echo";
    def.description = "Echo a message, optionally after delayMs milliseconds";
    def.paramsSchema = echoInputSchema();
    def.readOnly = true;
    def.idempotent = true;
    def.maxConcurrency = maxConcurrency;
    def.handler = MakeToolHandler(&echo);
    return def;
}

} // namespace tools
} // namespace flymcp
