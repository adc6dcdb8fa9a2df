//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_cancellation.cpp
// Purpose: Tests for cancellation tokens, the registry, and cancel notifications reaching running calls
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stop_token>
#include <thread>

#include "flymcp/Cancellation.h"
#include "flymcp/JSONRPCTypes.h"
#include "flymcp/Protocol.h"
#include "flymcp/Server.h"
#include "flymcp/errors/Errors.h"
#include "RecordingTransport.h"

using namespace flymcp;

TEST(CancellationToken, CancelIsIdempotent) {
    CancellationToken token;
    EXPECT_FALSE(token.IsCancelled());
    auto fired = token.OnCancel();
    EXPECT_NE(fired.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);

    token.Cancel();
    EXPECT_TRUE(token.IsCancelled());
    EXPECT_EQ(fired.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);

    EXPECT_NO_THROW(token.Cancel());
    EXPECT_TRUE(token.IsCancelled());
}

TEST(CancellationToken, StopCallbackRuns) {
    CancellationToken token;
    std::atomic<bool> called{false};
    std::stop_callback cb(token.GetStopToken(), [&]() { called = true; });
    token.Cancel();
    EXPECT_TRUE(called.load());
}

TEST(CancellationToken, ThrowIfCancelled) {
    CancellationToken token;
    EXPECT_NO_THROW(token.ThrowIfCancelled());
    token.Cancel();
    EXPECT_THROW(token.ThrowIfCancelled(), errors::CancellationError);
}

TEST(CancellationRegistry, CancelSignalsAndRemoves) {
    CancellationRegistry registry;
    auto token = std::make_shared<CancellationToken>();
    registry.Register("1", token);
    EXPECT_EQ(registry.Size(), 1u);
    EXPECT_EQ(registry.Get("1"), token);

    EXPECT_TRUE(registry.Cancel("1"));
    EXPECT_TRUE(token->IsCancelled());
    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_EQ(registry.Get("1"), nullptr);

    // Second cancel and unknown ids are no-ops
    EXPECT_FALSE(registry.Cancel("1"));
    EXPECT_FALSE(registry.Cancel("unknown"));
}

TEST(CancellationRegistry, RemoveWithOwnerKeepsNewerToken) {
    CancellationRegistry registry;
    auto first = std::make_shared<CancellationToken>();
    auto second = std::make_shared<CancellationToken>();
    registry.Register("dup", first);
    registry.Register("dup", second);

    registry.Remove("dup", first);
    EXPECT_EQ(registry.Get("dup"), second);

    registry.Remove("dup", second);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(CancellationRegistry, CancelAll) {
    CancellationRegistry registry;
    auto a = std::make_shared<CancellationToken>();
    auto b = std::make_shared<CancellationToken>();
    registry.Register("a", a);
    registry.Register("b", b);
    EXPECT_EQ(registry.CancelAll(), 2u);
    EXPECT_TRUE(a->IsCancelled());
    EXPECT_TRUE(b->IsCancelled());
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(Cancellation, CancelRequestNotificationStopsLongRunningTool) {
    auto channel = std::make_shared<test::RecordingTransport::Channel>();
    ServerConfig config;
    config.dispatchThreads = 2;
    Server server(Implementation{"CancelServer", "1.0"}, config);

    std::atomic<bool> observed{false};
    HandlerDefinition slow;
    slow.name = "slow";
    slow.description = "Waits for cancellation";
    slow.handler = MakeToolHandler([&observed](const JSONValue&, const CancellationToken& token, const ProgressNotifier&) {
        auto fired = token.OnCancel();
        if (fired.wait_for(std::chrono::seconds(5)) == std::future_status::ready) {
            observed = true;
        }
        return JSONValue("finished");
    });
    server.RegisterTool(slow);
    server.Start(std::make_unique<test::RecordingTransport>(channel)).get();

    JSONValue params{JSONValue::Object{}};
    params.set("name", JSONValue("slow"));
    channel->DeliverRequest(JSONRPCId{std::string("cancel-1")}, Methods::CallTool, params);

    // Wait until the call is in flight before cancelling
    for (int i = 0; i < 200 && server.ActiveCalls() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(server.ActiveCalls(), 1u);

    JSONValue cancelParams{JSONValue::Object{}};
    cancelParams.set("id", JSONValue("cancel-1"));
    channel->DeliverNotification(Methods::CancelRequest, cancelParams);

    ASSERT_TRUE(channel->WaitForResponses(1, std::chrono::seconds(2)));
    JSONValue doc = ParseJSON(channel->ResponseFor("cancel-1"));
    const JSONValue* err = doc.find("error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetInt(*err, "code").value(), JSONRPCErrorCodes::Canceled);
    ASSERT_NE(err->find("data"), nullptr);
    EXPECT_EQ(GetString(*err->find("data"), "requestId").value(), "cancel-1");

    server.Stop().get();
    for (int i = 0; i < 200 && !observed.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(observed.load());
    EXPECT_EQ(server.ActiveCalls(), 0u);
    EXPECT_EQ(server.PendingRequests(), 0u);
}

TEST(Cancellation, CancelledAliasWithIntegerId) {
    auto channel = std::make_shared<test::RecordingTransport::Channel>();
    Server server(Implementation{"CancelServer", "1.0"});

    HandlerDefinition slow;
    slow.name = "slow";
    slow.handler = MakeToolHandler([](const JSONValue&, const CancellationToken& token, const ProgressNotifier&) {
        while (!token.IsCancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        token.ThrowIfCancelled();
        return JSONValue();
    });
    server.RegisterTool(slow);
    server.Start(std::make_unique<test::RecordingTransport>(channel)).get();

    JSONValue params{JSONValue::Object{}};
    params.set("name", JSONValue("slow"));
    channel->DeliverRequest(JSONRPCId{static_cast<int64_t>(17)}, Methods::CallTool, params);

    JSONValue cancelParams{JSONValue::Object{}};
    cancelParams.set("requestId", JSONValue(static_cast<int64_t>(17)));
    channel->DeliverNotification(Methods::Cancelled, cancelParams);

    ASSERT_TRUE(channel->WaitForResponses(1, std::chrono::seconds(2)));
    JSONValue doc = ParseJSON(channel->ResponseFor("17"));
    ASSERT_NE(doc.find("error"), nullptr);
    EXPECT_EQ(GetInt(*doc.find("error"), "code").value(), JSONRPCErrorCodes::Canceled);

    server.Stop().get();
}

TEST(Cancellation, StopCancelsInFlightCalls) {
    auto channel = std::make_shared<test::RecordingTransport::Channel>();
    Server server(Implementation{"StopServer", "1.0"});

    HandlerDefinition blocked;
    blocked.name = "blocked";
    blocked.handler = MakeToolHandler([](const JSONValue&, const CancellationToken& token, const ProgressNotifier&) {
        (void)token.OnCancel().wait_for(std::chrono::seconds(5));
        return JSONValue("late");
    });
    server.RegisterTool(blocked);
    server.Start(std::make_unique<test::RecordingTransport>(channel)).get();

    JSONValue params{JSONValue::Object{}};
    params.set("name", JSONValue("blocked"));
    channel->DeliverRequest(JSONRPCId{std::string("s-1")}, Methods::CallTool, params);
    for (int i = 0; i < 200 && server.ActiveCalls() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    const auto started = std::chrono::steady_clock::now();
    server.Stop().get();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_FALSE(server.IsRunning());

    JSONValue doc = ParseJSON(channel->ResponseFor("s-1"));
    ASSERT_NE(doc.find("error"), nullptr);
    EXPECT_EQ(GetInt(*doc.find("error"), "code").value(), JSONRPCErrorCodes::Canceled);
}

TEST(Cancellation, StringAndIntegerIdsAreDistinct) {
    Server server(Implementation{"CancelServer", "1.0"});

    HandlerDefinition slow;
    slow.name = "slow";
    slow.handler = MakeToolHandler([](const JSONValue&, const CancellationToken& token, const ProgressNotifier&) {
        (void)token.OnCancel().wait_for(std::chrono::seconds(5));
        token.ThrowIfCancelled();
        return JSONValue("finished");
    });
    server.RegisterTool(slow);

    JSONValue params{JSONValue::Object{}};
    params.set("name", JSONValue("slow"));
    const JSONRPCRequest stringCall(JSONRPCId{std::string("7")}, Methods::CallTool, params);
    const JSONRPCRequest intCall(JSONRPCId{static_cast<int64_t>(7)}, Methods::CallTool, params);

    auto stringResponse = std::async(std::launch::async, [&]() { return server.HandleRequest(stringCall); });
    auto intResponse = std::async(std::launch::async, [&]() { return server.HandleRequest(intCall); });
    for (int i = 0; i < 400 && server.ActiveCalls() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(server.ActiveCalls(), 2u);
    EXPECT_EQ(server.PendingRequests(), 2u);

    // Cancelling integer 7 leaves the call with string id "7" running
    JSONValue cancelInt{JSONValue::Object{}};
    cancelInt.set("id", JSONValue(static_cast<int64_t>(7)));
    server.HandleNotification(JSONRPCNotification(Methods::CancelRequest, cancelInt));

    ASSERT_EQ(intResponse.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto intDone = intResponse.get();
    ASSERT_TRUE(intDone->error.has_value());
    EXPECT_EQ(GetInt(*intDone->error, "code").value(), JSONRPCErrorCodes::Canceled);
    EXPECT_EQ(stringResponse.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
    EXPECT_EQ(server.PendingRequests(), 1u);

    JSONValue cancelString{JSONValue::Object{}};
    cancelString.set("id", JSONValue("7"));
    server.HandleNotification(JSONRPCNotification(Methods::CancelRequest, cancelString));

    ASSERT_EQ(stringResponse.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto stringDone = stringResponse.get();
    ASSERT_TRUE(stringDone->error.has_value());
    EXPECT_EQ(GetInt(*stringDone->error, "code").value(), JSONRPCErrorCodes::Canceled);
    EXPECT_EQ(server.PendingRequests(), 0u);
}
