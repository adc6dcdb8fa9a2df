//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: MCP server: request routing and the admission/execution pipeline for tools, resources and prompts
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "flymcp/JSONRPCTypes.h"
#include "flymcp/Protocol.h"
#include "flymcp/Registries.h"
#include "flymcp/ServerConfig.h"
#include "flymcp/Transport.h"

namespace flymcp {

//==========================================================================================================
// Server
// Purpose: Owns the registries, limiter, cancellation registry and the request worker pool, and answers
//          every request received from its transport with exactly one response.
// Notes:
//   - Register handlers before Start(); definitions are read concurrently afterwards.
//   - Notifications (including cancellation) are handled inline on the transport reader thread;
//     requests run on the worker pool.
//==========================================================================================================
class Server {
public:
    explicit Server(Implementation serverInfo, ServerConfig config = ServerConfig());
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    ///////////////////////////////////////// Registration ///////////////////////////////////////////
    //==========================================================================================================
    // RegisterTool / RegisterResource / RegisterPrompt
    // Purpose: Adds a definition (last write wins). A definition maxConcurrency becomes the per-tool limit
    //          unless the configuration already sets one for that name.
    // Throws:
    //   std::invalid_argument when the definition has no handler.
    //==========================================================================================================
    void RegisterTool(HandlerDefinition definition);
    void RegisterResource(HandlerDefinition definition);
    void RegisterPrompt(HandlerDefinition definition);

    ///////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Start
    // Purpose: Takes ownership of the transport, wires its handlers and starts it.
    // Returns:
    //   Future completing once the transport is running.
    //==========================================================================================================
    std::future<void> Start(std::unique_ptr<ITransport> transport);

    //==========================================================================================================
    // Stop
    // Purpose: Cancels every in-flight call, waits for the workers, flushes and closes the transport.
    //==========================================================================================================
    std::future<void> Stop();

    bool IsRunning() const;

    // Called for transport failures and end of input
    void SetErrorCallback(std::function<void(const std::string&)> callback);

    ///////////////////////////////////////// Dispatch ///////////////////////////////////////////
    //==========================================================================================================
    // HandleRequest
    // Purpose: Runs the pipeline for one request on the calling thread.
    // Returns:
    //   The single response for the request (result or error); never throws.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request);

    // Processes cancellation and lifecycle notifications in place
    void HandleNotification(const JSONRPCNotification& notification);

    ///////////////////////////////////////// Introspection ///////////////////////////////////////////
    const ServerConfig& GetConfig() const;
    const ToolRegistry& Tools() const;
    const ResourceRegistry& Resources() const;
    const PromptRegistry& Prompts() const;

    // Calls currently holding a limiter slot
    std::size_t ActiveCalls() const;

    // Requests with a registered cancellation token
    std::size_t PendingRequests() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace flymcp
