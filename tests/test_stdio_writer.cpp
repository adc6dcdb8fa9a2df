//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_writer.cpp
// Purpose: StdioTransport writer and lifecycle paths (queue overflow, framing on output, EOF)
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include "flymcp/ContentFramer.h"
#include "flymcp/StdioTransport.hpp"
#include "flymcp/JSONRPCTypes.h"

using namespace std::chrono_literals;

namespace {
struct Pipes {
    int in[2]{-1, -1};
    int out[2]{-1, -1};
    bool open() { return ::pipe(in) == 0 && ::pipe(out) == 0; }
    ~Pipes() {
        for (int fd : {in[0], in[1], out[0], out[1]}) {
            if (fd >= 0) ::close(fd);
        }
    }
};
}

TEST(StdioWriter, WriteQueueOverflowCloses) {
    Pipes p;
    ASSERT_TRUE(p.open());
    flymcp::StdioTransport t(p.in[0], p.out[1]);

    std::promise<void> errPromise;
    std::atomic<bool> sawError{false};
    std::string firstError;
    t.SetErrorHandler([&](const std::string& msg){
        if (!sawError.exchange(true)) { firstError = msg; errPromise.set_value(); }
    });

    t.SetWriteQueueMaxBytes(16);
    t.Start().get();

    auto n = std::make_unique<flymcp::JSONRPCNotification>();
    n->method = "notify/overflow";
    flymcp::JSONValue::Object obj; obj["data"] = std::make_shared<flymcp::JSONValue>(std::string(128, 'x'));
    n->params.emplace(obj);

    t.SendNotification(std::move(n)).get();

    auto fut = errPromise.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(firstError, "StdioTransport: write queue overflow");
    EXPECT_FALSE(t.IsConnected());

    t.Close().get();
}

TEST(StdioWriter, FramesWrittenWholeAndInOrder) {
    Pipes p;
    ASSERT_TRUE(p.open());
    flymcp::StdioTransport t(p.in[0], p.out[1]);
    t.Start().get();

    for (int i = 0; i < 20; ++i) {
        flymcp::JSONValue result{flymcp::JSONValue::Object{}};
        result.set("i", flymcp::JSONValue(static_cast<int64_t>(i)));
        t.SendResponse(std::make_unique<flymcp::JSONRPCResponse>(flymcp::JSONRPCId{static_cast<int64_t>(i)}, result)).get();
    }

    flymcp::FrameDecoder decoder(1024 * 1024);
    std::vector<std::string> bodies;
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (bodies.size() < 20 && std::chrono::steady_clock::now() < deadline) {
        pollfd pfd{p.out[0], POLLIN, 0};
        if (::poll(&pfd, 1, 100) <= 0) continue;
        char buf[1024];
        ssize_t r = ::read(p.out[0], buf, sizeof(buf));
        ASSERT_GT(r, 0);
        for (auto& b : decoder.Feed(std::string(buf, static_cast<std::size_t>(r)))) bodies.push_back(std::move(b));
    }
    ASSERT_EQ(bodies.size(), 20u);
    for (int i = 0; i < 20; ++i) {
        flymcp::JSONValue doc = flymcp::ParseJSON(bodies[static_cast<std::size_t>(i)]);
        EXPECT_EQ(flymcp::GetInt(doc, "id").value(), i);
    }
    EXPECT_EQ(decoder.Buffered(), 0u);

    t.Close().get();
}

TEST(StdioWriter, EofIsReportedThroughErrorHandler) {
    Pipes p;
    ASSERT_TRUE(p.open());
    flymcp::StdioTransport t(p.in[0], p.out[1]);

    std::promise<std::string> errPromise;
    std::atomic<bool> sawError{false};
    t.SetErrorHandler([&](const std::string& msg){ if (!sawError.exchange(true)) { errPromise.set_value(msg); } });
    t.Start().get();
    EXPECT_TRUE(t.IsConnected());

    ::close(p.in[1]);
    p.in[1] = -1;

    auto fut = errPromise.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "StdioTransport: EOF on stdin");

    t.Close().get();
    EXPECT_FALSE(t.IsConnected());
}

TEST(StdioWriter, OutputMatchesCodecEncoding) {
    Pipes p;
    ASSERT_TRUE(p.open());
    flymcp::StdioTransport t(p.in[0], p.out[1]);
    t.Start().get();

    flymcp::JSONValue result{flymcp::JSONValue::Object{}};
    result.set("text", flymcp::JSONValue("héllo"));
    flymcp::JSONRPCResponse response(flymcp::JSONRPCId{std::string("enc-1")}, result);
    const std::string expected = flymcp::MakeContentLengthFramer()->encode(response.Serialize());
    t.SendResponse(std::make_unique<flymcp::JSONRPCResponse>(response)).get();

    std::string written;
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (written.size() < expected.size() && std::chrono::steady_clock::now() < deadline) {
        pollfd pfd{p.out[0], POLLIN, 0};
        if (::poll(&pfd, 1, 100) <= 0) continue;
        char buf[256];
        ssize_t r = ::read(p.out[0], buf, sizeof(buf));
        ASSERT_GT(r, 0);
        written.append(buf, static_cast<std::size_t>(r));
    }
    EXPECT_EQ(written, expected);

    t.Close().get();
}
