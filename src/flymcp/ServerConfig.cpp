//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: ServerConfig parsing and validation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "env/EnvVars.h"
#include "flymcp/ServerConfig.h"

namespace flymcp {

namespace {
std::size_t parseCount(const std::string& key, const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c){ return std::isdigit(c); })) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Value out of range for " + key + ": " + value);
    }
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw std::invalid_argument("Invalid boolean for " + key + ": '" + value + "'");
}

Logger::Level parseLevel(const std::string& value) {
    std::string s; s.reserve(value.size());
    for (char c : value) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s != "DEBUG" && s != "INFO" && s != "WARN" && s != "WARNING" && s != "ERROR" && s != "FATAL") {
        throw std::invalid_argument("Invalid log_level: '" + value + "'");
    }
    return Logger::levelFromString(s);
}

void requirePositive(std::size_t v, const char* field) {
    if (v == 0) {
        throw std::invalid_argument(std::string(field) + " must be positive");
    }
}
} // namespace

void ServerConfig::Validate() const {
    if (defaultTimeout.count() <= 0) {
        throw std::invalid_argument("defaultTimeout must be positive");
    }
    requirePositive(concurrency.maxConcurrency, "maxConcurrency");
    for (const auto& [tool, limit] : concurrency.perToolLimits) {
        if (limit == 0) {
            throw std::invalid_argument("perToolLimits." + tool + " must be positive");
        }
    }
    if (timeouts.defaultTimeout.count() <= 0) {
        throw std::invalid_argument("timeouts.defaultTimeout must be positive");
    }
    for (const auto& [tool, t] : timeouts.perToolTimeouts) {
        if (t.count() <= 0) {
            throw std::invalid_argument("perToolTimeouts." + tool + " must be positive");
        }
    }
    requirePositive(sizeLimits.maxParameterSize, "maxParameterSize");
    requirePositive(sizeLimits.maxResultSize, "maxResultSize");
    requirePositive(sizeLimits.maxResourceSize, "maxResourceSize");
    requirePositive(sizeLimits.maxMessageSize, "maxMessageSize");
    if (sizeLimits.maxParameterSize > sizeLimits.maxMessageSize) {
        throw std::invalid_argument("maxParameterSize (" + std::to_string(sizeLimits.maxParameterSize) +
                                    ") cannot exceed maxMessageSize (" +
                                    std::to_string(sizeLimits.maxMessageSize) + ")");
    }
    requirePositive(writeQueueMaxBytes, "writeQueueMaxBytes");
}

std::size_t ServerConfig::EffectiveDispatchThreads() const {
    return dispatchThreads != 0 ? dispatchThreads : concurrency.maxConcurrency + 2;
}

std::chrono::milliseconds ServerConfig::TimeoutFor(const std::string& tool, std::chrono::milliseconds fallback) const {
    auto it = timeouts.perToolTimeouts.find(tool);
    return (it == timeouts.perToolTimeouts.end()) ? fallback : it->second;
}

ServerConfig ServerConfig::Parse(const std::string& config) {
    ServerConfig out;
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        // Skip separators and spaces
        while (i < config.size() && (config[i] == ';' || std::isspace(static_cast<unsigned char>(config[i])))) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && !std::isspace(static_cast<unsigned char>(config[i]))) ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::invalid_argument("Expected key=value, got '" + token + "'");
        }
        const std::string key = token.substr(0, eq);
        const std::string val = token.substr(eq + 1);

        if (key == "default_timeout_ms") {
            auto t = std::chrono::milliseconds(parseCount(key, val));
            out.defaultTimeout = t;
            out.timeouts.defaultTimeout = t;
        } else if (key == "max_concurrency") {
            out.concurrency.maxConcurrency = parseCount(key, val);
        } else if (key.rfind("tool_limit.", 0) == 0 && key.size() > 11) {
            out.concurrency.perToolLimits[key.substr(11)] = parseCount(key, val);
        } else if (key.rfind("tool_timeout_ms.", 0) == 0 && key.size() > 16) {
            out.timeouts.perToolTimeouts[key.substr(16)] = std::chrono::milliseconds(parseCount(key, val));
        } else if (key == "max_parameter_bytes") {
            out.sizeLimits.maxParameterSize = parseCount(key, val);
        } else if (key == "max_result_bytes") {
            out.sizeLimits.maxResultSize = parseCount(key, val);
        } else if (key == "max_resource_bytes") {
            out.sizeLimits.maxResourceSize = parseCount(key, val);
        } else if (key == "max_message_bytes") {
            out.sizeLimits.maxMessageSize = parseCount(key, val);
        } else if (key == "log_level") {
            out.logging.level = parseLevel(val);
        } else if (key == "log_format") {
            if (val == "text") {
                out.logging.format = LogFormat::Text;
            } else if (val == "json") {
                out.logging.format = LogFormat::Json;
            } else {
                throw std::invalid_argument("Invalid log_format: '" + val + "'");
            }
        } else if (key == "log_enabled") {
            out.logging.enabled = parseBool(key, val);
        } else if (key == "log_correlation_ids") {
            out.logging.includeCorrelationIds = parseBool(key, val);
        } else if (key == "dispatch_threads") {
            out.dispatchThreads = parseCount(key, val);
        } else if (key == "write_queue_max_bytes") {
            out.writeQueueMaxBytes = parseCount(key, val);
        } else {
            throw std::invalid_argument("Unknown configuration key: " + key);
        }
    }
    return out;
}

ServerConfig ServerConfig::FromEnvironment() {
    return Parse(GetEnvOrDefault("FLYMCP_CONFIG", ""));
}

void ApplyLoggingConfig(const LoggingConfig& logging) {
    // Disabled logging keeps FATAL only
    Logger::setLogLevel(logging.enabled ? Logger::toLogLevel(logging.level) : LogLevel::LOG_FATAL_LEVEL);
    Logger::setFormat(logging.format);
}

} // namespace flymcp
