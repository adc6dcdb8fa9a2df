//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants, method names and server identity
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>

namespace flymcp {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version reported by initialize
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

// Identity reported by the bundled server executable as serverInfo
constexpr const char* SERVER_NAME = "flymcp";
constexpr const char* SERVER_VERSION = "0.3.0";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* CancelRequest = "$/cancelRequest";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace flymcp
