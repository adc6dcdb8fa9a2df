//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport interface between the framed byte stream and the dispatch pipeline
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>

namespace flymcp {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// ITransport
// Purpose: Single-peer message transport. Incoming requests and notifications are delivered to the
//          registered handlers in receipt order on the transport's reader thread; outgoing messages are
//          written whole, one frame at a time.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loops.
    // Returns:
    //   A future that completes when the transport is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops reading, flushes frames already queued and stops writing.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    // Diagnostic identifier for log lines
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Queues a response (or a notification) for the writer. Safe to call from any thread.
    // Returns:
    //   Future completing once the frame is queued; dropped with a log line when not connected.
    //==========================================================================================================
    virtual std::future<void> SendResponse(std::unique_ptr<JSONRPCResponse> response) = 0;
    virtual std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Incoming handlers ///////////////////////////////////////////
    //==========================================================================================================
    // Request handler: receives ownership of each request. The handler must answer through SendResponse
    // and must return promptly, since it runs on the reader thread.
    //==========================================================================================================
    using RequestHandler = std::function<void(std::unique_ptr<JSONRPCRequest>)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    // Error handler: transport failures and end of input
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace flymcp
