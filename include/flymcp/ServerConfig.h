//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Immutable server configuration: limits, timeouts, logging and dispatch sizing
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>

#include "logging/Logger.h"

namespace flymcp {

struct ConcurrencyConfig {
    std::size_t maxConcurrency = 10;
    std::unordered_map<std::string, std::size_t> perToolLimits;
};

struct TimeoutConfig {
    std::chrono::milliseconds defaultTimeout{std::chrono::minutes(5)};
    std::unordered_map<std::string, std::chrono::milliseconds> perToolTimeouts;
};

// Byte limits; parameter/result sizes are measured on the compact JSON encoding
struct SizeLimitsConfig {
    std::size_t maxParameterSize = 1024 * 1024;
    std::size_t maxResultSize = 10 * 1024 * 1024;
    std::size_t maxResourceSize = 50 * 1024 * 1024;
    std::size_t maxMessageSize = 2 * 1024 * 1024;
};

struct LoggingConfig {
    bool enabled = true;
    Logger::Level level = Logger::Level::INFO;
    LogFormat format = LogFormat::Text;
    bool includeCorrelationIds = true;
};

//==========================================================================================================
// ServerConfig
// Purpose: Everything the server reads at construction; never re-read afterwards.
// Fields:
//   defaultTimeout: Top-level default; kept in step with timeouts.defaultTimeout by Parse().
//   dispatchThreads: Worker pool size; 0 selects concurrency.maxConcurrency + 2.
//   writeQueueMaxBytes: Bound on frames queued for stdout.
//==========================================================================================================
struct ServerConfig {
    std::chrono::milliseconds defaultTimeout{std::chrono::minutes(5)};
    ConcurrencyConfig concurrency;
    TimeoutConfig timeouts;
    SizeLimitsConfig sizeLimits;
    LoggingConfig logging;
    std::size_t dispatchThreads = 0;
    std::size_t writeQueueMaxBytes = 8 * 1024 * 1024;

    //======================================================================================================
    // Validate
    // Purpose: Rejects non-positive timeouts, limits and sizes, and a parameter limit above the
    //          message limit.
    // Throws:
    //   std::invalid_argument naming the offending field.
    //======================================================================================================
    void Validate() const;

    // Worker count after resolving the 0 default
    std::size_t EffectiveDispatchThreads() const;

    // Timeout for a call: per-tool override when present, else fallback
    std::chrono::milliseconds TimeoutFor(const std::string& tool, std::chrono::milliseconds fallback) const;

    //======================================================================================================
    // Parse
    // Purpose: Builds a configuration from "key=value" pairs separated by ';' or whitespace, starting
    //          from the defaults.
    // Keys:
    //   default_timeout_ms, max_concurrency, tool_limit.<tool>, tool_timeout_ms.<tool>,
    //   max_parameter_bytes, max_result_bytes, max_resource_bytes, max_message_bytes,
    //   log_level, log_format (text|json), log_enabled, log_correlation_ids,
    //   dispatch_threads, write_queue_max_bytes
    // Throws:
    //   std::invalid_argument for an unknown key, a token without '=', or a malformed value.
    //   The result is not validated; call Validate().
    //======================================================================================================
    static ServerConfig Parse(const std::string& text);

    // Parse(FLYMCP_CONFIG) or defaults when the variable is unset
    static ServerConfig FromEnvironment();
};

// Pushes the logging section into the process-wide Logger
void ApplyLoggingConfig(const LoggingConfig& logging);

} // namespace flymcp
