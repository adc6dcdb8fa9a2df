//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_jsonrpc_messages.cpp
// Purpose: JSON value parsing/serialization and JSON-RPC message classification
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <variant>

#include "flymcp/JSONRPCTypes.h"

using namespace flymcp;

TEST(JSONParse, ScalarsAndContainers) {
    JSONValue v = ParseJSON(" {\"s\":\"x\",\"i\":-42,\"d\":1.5,\"b\":true,\"n\":null,\"a\":[1,\"two\",{}]} ");
    ASSERT_TRUE(v.isObject());
    EXPECT_EQ(GetString(v, "s").value(), "x");
    EXPECT_EQ(GetInt(v, "i").value(), -42);
    ASSERT_NE(v.find("d"), nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>(v.find("d")->value), 1.5);
    EXPECT_EQ(GetBool(v, "b").value(), true);
    ASSERT_NE(v.find("n"), nullptr);
    EXPECT_TRUE(v.find("n")->isNull());
    const JSONValue* a = v.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isArray());
    EXPECT_EQ(std::get<JSONValue::Array>(a->value).size(), 3u);
    EXPECT_FALSE(GetString(v, "i").has_value());
    EXPECT_FALSE(GetInt(v, "missing").has_value());
}

TEST(JSONParse, UnicodeEscapesIncludingSurrogatePairs) {
    JSONValue v = ParseJSON("\"caf\\u00e9 \\ud83d\\ude00\"");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(std::get<std::string>(v.value), "caf\xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JSONParse, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("{\"a\":1"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":1} x"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,]"), std::runtime_error);
    EXPECT_THROW(ParseJSON("'single'"), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
}

TEST(JSONSerialize, EscapesControlCharactersAndQuotes) {
    const std::string text = "line1\nline2\t\"q\"\\";
    const std::string encoded = SerializeJSON(JSONValue(text));
    EXPECT_EQ(encoded, "\"line1\\nline2\\t\\\"q\\\"\\\\\"");
    EXPECT_EQ(std::get<std::string>(ParseJSON(encoded).value), text);
}

TEST(JSONSerialize, ArraysKeepOrder) {
    JSONValue::Array arr;
    arr.push_back(std::make_shared<JSONValue>(static_cast<int64_t>(1)));
    arr.push_back(std::make_shared<JSONValue>("two"));
    arr.push_back(std::make_shared<JSONValue>(false));
    EXPECT_EQ(SerializeJSON(JSONValue(arr)), "[1,\"two\",false]");
}

TEST(ParseMessage, ClassifiesRequestNotificationResponse) {
    auto req = ParseMessage("{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"tools/call\",\"params\":{\"name\":\"echo\"}}");
    ASSERT_TRUE(req.has_value());
    ASSERT_TRUE(std::holds_alternative<JSONRPCRequest>(*req));
    const auto& r = std::get<JSONRPCRequest>(*req);
    EXPECT_EQ(r.method, "tools/call");
    EXPECT_EQ(std::get<int64_t>(r.id), 7);
    ASSERT_TRUE(r.params.has_value());
    EXPECT_EQ(GetString(*r.params, "name").value(), "echo");

    auto note = ParseMessage("{\"jsonrpc\":\"2.0\",\"method\":\"$/cancelRequest\",\"params\":{\"id\":\"abc\"}}");
    ASSERT_TRUE(note.has_value());
    ASSERT_TRUE(std::holds_alternative<JSONRPCNotification>(*note));
    EXPECT_EQ(std::get<JSONRPCNotification>(*note).method, "$/cancelRequest");

    auto resp = ParseMessage("{\"jsonrpc\":\"2.0\",\"id\":\"x\",\"result\":{}}");
    ASSERT_TRUE(resp.has_value());
    ASSERT_TRUE(std::holds_alternative<JSONRPCResponse>(*resp));
    EXPECT_EQ(std::get<std::string>(std::get<JSONRPCResponse>(*resp).id), "x");
}

TEST(ParseMessage, RejectsOtherShapes) {
    EXPECT_FALSE(ParseMessage("not json").has_value());
    EXPECT_FALSE(ParseMessage("[]").has_value());
    EXPECT_FALSE(ParseMessage("{\"jsonrpc\":\"2.0\"}").has_value());
    EXPECT_FALSE(ParseMessage("{\"jsonrpc\":\"2.0\",\"method\":5}").has_value());
    EXPECT_FALSE(ParseMessage("{\"jsonrpc\":\"2.0\",\"id\":{},\"method\":\"ping\"}").has_value());
    EXPECT_FALSE(ParseMessage("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}garbage").has_value());
}

TEST(JSONRPCMessages, SerializedRequestParsesBack) {
    JSONValue params{JSONValue::Object{}};
    params.set("name", JSONValue("echo"));
    JSONRPCRequest out(JSONRPCId{std::string("req-1")}, "tools/call", params);

    auto parsed = ParseMessage(out.Serialize());
    ASSERT_TRUE(parsed.has_value());
    ASSERT_TRUE(std::holds_alternative<JSONRPCRequest>(*parsed));
    const auto& in = std::get<JSONRPCRequest>(*parsed);
    EXPECT_EQ(in.method, "tools/call");
    EXPECT_EQ(std::get<std::string>(in.id), "req-1");
    ASSERT_TRUE(in.params.has_value());
    EXPECT_EQ(GetString(*in.params, "name").value(), "echo");
}

TEST(JSONRPCMessages, NotificationHasNoId) {
    JSONRPCNotification n("notifications/progress");
    JSONValue doc = ParseJSON(n.Serialize());
    EXPECT_EQ(doc.find("id"), nullptr);
    EXPECT_EQ(GetString(doc, "method").value(), "notifications/progress");
    EXPECT_EQ(GetString(doc, "jsonrpc").value(), "2.0");
}

TEST(JSONRPCMessages, ErrorResponseShape) {
    JSONValue data{JSONValue::Object{}};
    data.set("tool", JSONValue("missing"));
    auto resp = CreateErrorResponse(JSONRPCId{static_cast<int64_t>(3)}, JSONRPCErrorCodes::NotFound, "Tool not found: missing", data);
    ASSERT_TRUE(resp->IsError());

    JSONValue doc = ParseJSON(resp->Serialize());
    EXPECT_EQ(GetInt(doc, "id").value(), 3);
    EXPECT_EQ(doc.find("result"), nullptr);
    const JSONValue* err = doc.find("error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetInt(*err, "code").value(), -32804);
    EXPECT_EQ(GetString(*err, "message").value(), "Tool not found: missing");
    ASSERT_NE(err->find("data"), nullptr);
    EXPECT_EQ(GetString(*err->find("data"), "tool").value(), "missing");
}

TEST(JSONRPCMessages, IdToString) {
    EXPECT_EQ(IdToString(JSONRPCId{std::string("abc")}), "abc");
    EXPECT_EQ(IdToString(JSONRPCId{static_cast<int64_t>(42)}), "42");
    EXPECT_EQ(IdToString(JSONRPCId{nullptr}), "");
}

TEST(JSONRPCMessages, IdToKeyKeepsTheIdType) {
    EXPECT_EQ(IdToKey(JSONRPCId{std::string("7")}), "\"7\"");
    EXPECT_EQ(IdToKey(JSONRPCId{static_cast<int64_t>(7)}), "7");
    EXPECT_EQ(IdToKey(JSONRPCId{nullptr}), "null");
    EXPECT_NE(IdToKey(JSONRPCId{std::string("7")}), IdToKey(JSONRPCId{static_cast<int64_t>(7)}));
}
