//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Content-Length framed transport over a pair of file descriptors (stdin/stdout by default)
//==========================================================================================================
#pragma once

#include "flymcp/Transport.h"
#include <memory>
#include <cstdint>
#include <string>

namespace flymcp {

//==========================================================================================================
// StdioTransport
// Purpose: JSON-RPC transport over stdin/stdout for a single local peer.
// Notes:
//   - One reader thread decodes frames and delivers messages in receipt order.
//   - One writer thread drains a bounded queue, writing each frame completely before the next.
//   - End of input is reported through the error handler ("EOF on stdin"); queued output is still
//     flushed by Close().
//   - The descriptors are never closed by the transport.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    StdioTransport();
    StdioTransport(int inputFd, int outputFd);
    virtual ~StdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<void> SendResponse(std::unique_ptr<JSONRPCResponse> response) override;
    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override;

    void SetRequestHandler(RequestHandler handler) override;
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetWriteQueueMaxBytes
    // Purpose: Backpressure clamp for pending write buffers.
    // Args:
    //   maxBytes: Maximum allowed bytes in write queue before emitting an error and closing.
    //==========================================================================================================
    void SetWriteQueueMaxBytes(std::size_t maxBytes);

    //==========================================================================================================
    // SetMaxContentLength
    // Purpose: Largest accepted frame body; larger frames are dropped. Call before Start().
    //==========================================================================================================
    void SetMaxContentLength(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct StdioTransportTestHooks;
};

struct StdioTransportTestHooks {
    // Feeds raw bytes through the frame decoder and dispatches every completed message
    static void drainFrames(StdioTransport& t, const std::string& chunk);
    static void setConnected(StdioTransport& t, bool v);
    static bool isConnected(const StdioTransport& t);
    static std::size_t writeQueueMaxBytes(const StdioTransport& t);
};

} // namespace flymcp
