//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_e2e.cpp
// Purpose: Full server over Content-Length framed pipes: handshake, concurrency rejection, cancellation
//==========================================================================================================

#include <gtest/gtest.h>

#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <map>
#include <optional>
#include <memory>
#include <string>
#include <vector>

#include "flymcp/ContentFramer.h"
#include "flymcp/Protocol.h"
#include "flymcp/Server.h"
#include "flymcp/StdioTransport.hpp"
#include "flymcp/tools/EchoTool.h"

using namespace flymcp;

namespace {

class PipePeer {
public:
    PipePeer() : decoder(4 * 1024 * 1024), framer(MakeContentLengthFramer()) {}

    bool Open() {
        return ::pipe(toServer) == 0 && ::pipe(fromServer) == 0;
    }

    ~PipePeer() {
        for (int fd : {toServer[0], toServer[1], fromServer[0], fromServer[1]}) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }

    int ServerIn() const { return toServer[0]; }
    int ServerOut() const { return fromServer[1]; }

    void Send(const JSONRPCMessage& message) {
        SendRaw(framer->encode(message.Serialize()));
    }

    void SendRaw(const std::string& frame) {
        std::size_t off = 0;
        while (off < frame.size()) {
            ssize_t n = ::write(toServer[1], frame.data() + off, frame.size() - off);
            ASSERT_GT(n, 0);
            off += static_cast<std::size_t>(n);
        }
    }

    void CloseInput() {
        ::close(toServer[1]);
        toServer[1] = -1;
    }

    // Reads frames until count responses (by id) have arrived or the timeout passes
    bool CollectResponses(std::size_t count, std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (responses.size() < count) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return false;
            }
            pollfd pfd{fromServer[0], POLLIN, 0};
            if (::poll(&pfd, 1, static_cast<int>(left.count())) <= 0) {
                continue;
            }
            char buf[4096];
            ssize_t n = ::read(fromServer[0], buf, sizeof(buf));
            if (n <= 0) {
                return false;
            }
            for (auto& body : decoder.Feed(std::string(buf, static_cast<std::size_t>(n)))) {
                JSONValue doc = ParseJSON(body);
                if (doc.find("id") != nullptr && doc.find("method") == nullptr) {
                    const JSONValue* id = doc.find("id");
                    const std::string key = id->isString() ? std::get<std::string>(id->value)
                                                           : SerializeJSON(*id);
                    responses[key] = doc;
                }
            }
        }
        return true;
    }

    std::map<std::string, JSONValue> responses;

private:
    int toServer[2]{-1, -1};
    int fromServer[2]{-1, -1};
    FrameDecoder decoder;
    std::unique_ptr<IContentFramer> framer;
};

JSONRPCRequest echoCall(const std::string& id, const std::string& message, int64_t delayMs) {
    JSONValue args{JSONValue::Object{}};
    args.set("message", JSONValue(message));
    args.set("delayMs", JSONValue(delayMs));
    JSONValue params{JSONValue::Object{}};
    params.set("name", JSONValue("echo"));
    params.set("arguments", std::move(args));
    return JSONRPCRequest(JSONRPCId{id}, Methods::CallTool, std::move(params));
}

std::optional<int64_t> errorCodeOf(const JSONValue& response) {
    const JSONValue* err = response.find("error");
    if (err == nullptr) {
        return std::nullopt;
    }
    return GetInt(*err, "code");
}

} // namespace

TEST(StdioEndToEnd, HandshakeLimitAndCancel) {
    PipePeer peer;
    ASSERT_TRUE(peer.Open());

    Server server(Implementation{"flymcp", "test"});
    server.RegisterTool(tools::MakeEchoTool(1));
    auto transport = std::make_unique<StdioTransport>(peer.ServerIn(), peer.ServerOut());
    ASSERT_NO_THROW(server.Start(std::move(transport)).get());

    // Handshake
    JSONValue initParams{JSONValue::Object{}};
    initParams.set("protocolVersion", JSONValue(PROTOCOL_VERSION));
    peer.Send(JSONRPCRequest(JSONRPCId{std::string("init")}, Methods::Initialize, initParams));
    peer.Send(JSONRPCNotification(Methods::Initialized));
    ASSERT_TRUE(peer.CollectResponses(1, std::chrono::seconds(5)));
    ASSERT_EQ(peer.responses.count("init"), 1u);
    const JSONValue* initResult = peer.responses["init"].find("result");
    ASSERT_NE(initResult, nullptr);
    EXPECT_EQ(GetString(*initResult, "protocolVersion").value(), PROTOCOL_VERSION);

    // Two overlapping calls against maxConcurrency=1: one runs, one is refused
    peer.Send(echoCall("a", "first", 300));
    peer.Send(echoCall("b", "second", 300));
    ASSERT_TRUE(peer.CollectResponses(3, std::chrono::seconds(5)));

    int successes = 0;
    int rejections = 0;
    for (const char* id : {"a", "b"}) {
        const JSONValue& resp = peer.responses[id];
        if (resp.find("result") != nullptr) {
            ++successes;
        } else if (errorCodeOf(resp).value_or(0) == JSONRPCErrorCodes::PermissionDenied) {
            ++rejections;
        }
    }
    EXPECT_EQ(successes, 1);
    EXPECT_EQ(rejections, 1);

    // A long call cancelled by the client
    peer.Send(echoCall("c", "never", 5000));
    JSONValue cancelParams{JSONValue::Object{}};
    cancelParams.set("id", JSONValue("c"));
    peer.Send(JSONRPCNotification(Methods::CancelRequest, cancelParams));

    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(peer.CollectResponses(4, std::chrono::seconds(3)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_EQ(errorCodeOf(peer.responses["c"]).value_or(0), JSONRPCErrorCodes::Canceled);

    // End of input shuts the session down cleanly
    peer.CloseInput();
    server.Stop().get();
    EXPECT_FALSE(server.IsRunning());
    EXPECT_EQ(server.ActiveCalls(), 0u);
}

TEST(StdioEndToEnd, UnparseableFramesAreDroppedAndSessionContinues) {
    PipePeer peer;
    ASSERT_TRUE(peer.Open());

    Server server(Implementation{"flymcp", "test"});
    server.RegisterTool(tools::MakeEchoTool());
    server.Start(std::make_unique<StdioTransport>(peer.ServerIn(), peer.ServerOut())).get();

    // Garbage body in a well-formed frame, then a header without a length
    peer.SendRaw("Content-Length: 5\r\n\r\n{bad}X-Header: nope\r\n\r\n");

    peer.Send(JSONRPCRequest(JSONRPCId{std::string("ping")}, Methods::Ping));
    ASSERT_TRUE(peer.CollectResponses(1, std::chrono::seconds(5)));
    EXPECT_NE(peer.responses["ping"].find("result"), nullptr);

    peer.CloseInput();
    server.Stop().get();
}
