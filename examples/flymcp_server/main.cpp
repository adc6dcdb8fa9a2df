//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: flymcp stdio server: serves the echo tool until stdin closes
//==========================================================================================================

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "flymcp/Protocol.h"
#include "flymcp/Server.h"
#include "flymcp/ServerConfig.h"
#include "flymcp/StdioTransport.hpp"
#include "flymcp/tools/EchoTool.h"

using namespace flymcp;

int main() {
    // stdout carries frames only; must be set before the first log line
    ::setenv("FLYMCP_STDIO_MODE", "1", 0);
    ::signal(SIGPIPE, SIG_IGN);
    FUNC_SCOPE();

    ServerConfig config;
    try {
        config = ServerConfig::FromEnvironment();
        config.Validate();
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid configuration (FLYMCP_CONFIG): {}", e.what());
        return EXIT_FAILURE;
    }

    ApplyLoggingConfig(config.logging);
    const std::string logFile = GetEnvOrDefault("FLYMCP_LOG_FILE", "");
    if (!logFile.empty()) {
        Logger::setLogFile(logFile);
    }

    Server server(Implementation{SERVER_NAME, SERVER_VERSION}, config);
    server.RegisterTool(tools::MakeEchoTool());

    // Fires on EOF or transport error
    std::promise<void> stopped;
    std::atomic<bool> stopSignalled{false};
    server.SetErrorCallback([&stopped, &stopSignalled](const std::string& err) {
        LOG_INFO("Server stopping: {}", err);
        if (!stopSignalled.exchange(true)) {
            stopped.set_value();
        }
    });

    auto transport = std::make_unique<StdioTransport>();
    transport->SetMaxContentLength(config.sizeLimits.maxMessageSize);
    transport->SetWriteQueueMaxBytes(config.writeQueueMaxBytes);

    try {
        server.Start(std::move(transport)).get();
    } catch (const std::exception& e) {
        LOG_ERROR("Server start failed: {}", e.what());
        return EXIT_FAILURE;
    }

    stopped.get_future().wait();
    server.Stop().get();
    return EXIT_SUCCESS;
}
