//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: GoogleTests for JSON parsing, serialization and JSON-RPC message builders
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpws/JSONRPCTypes.h"
#include "mcpws/typed/Content.h"
#include <string>

using namespace mcpws;

TEST(JSONParser, ParsesScalars) {
    EXPECT_TRUE(ParseJSON("null").IsNull());
    EXPECT_EQ(std::get<bool>(ParseJSON("true").value), true);
    EXPECT_EQ(std::get<int64_t>(ParseJSON("-42").value), -42);
    EXPECT_DOUBLE_EQ(std::get<double>(ParseJSON("2.5e1").value), 25.0);
    EXPECT_EQ(std::get<std::string>(ParseJSON("  \"hi\"  ").value), "hi");
}

TEST(JSONParser, LargeIntegerFallsBackToDouble) {
    auto v = ParseJSON("123456789012345678901234");
    ASSERT_TRUE(std::holds_alternative<double>(v.value));
    EXPECT_GT(std::get<double>(v.value), 1e23);
}

TEST(JSONParser, ParsesNestedDocument) {
    auto v = ParseJSON(R"({"a":[1,{"b":"c"}],"d":{}})");
    ASSERT_TRUE(v.IsObject());
    const JSONValue* a = typed::getMember(v, "a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->IsArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 2u);
    EXPECT_EQ(typed::getString(*arr[1], "b").value_or(""), "c");
    EXPECT_TRUE(typed::getMember(v, "d")->IsObject());
}

TEST(JSONParser, DecodesEscapesAndSurrogatePairs) {
    auto v = ParseJSON(R"("line\nquote\" \u00e9 \ud83d\ude00")");
    EXPECT_EQ(std::get<std::string>(v.value), "line\nquote\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON(""), JSONParseError);
    EXPECT_THROW(ParseJSON("{"), JSONParseError);
    EXPECT_THROW(ParseJSON("{\"a\":1,}"), JSONParseError);
    EXPECT_THROW(ParseJSON("[1 2]"), JSONParseError);
    EXPECT_THROW(ParseJSON("01"), JSONParseError);
    EXPECT_THROW(ParseJSON("1."), JSONParseError);
    EXPECT_THROW(ParseJSON("{} trailing"), JSONParseError);
    EXPECT_THROW(ParseJSON("not json"), JSONParseError);
}

TEST(JSONParser, RejectsExcessiveNesting) {
    std::string deep(1000, '[');
    deep += std::string(1000, ']');
    EXPECT_THROW(ParseJSON(deep), JSONParseError);
}

TEST(JSONSerializer, CompactOutputAndEscaping) {
    JSONValue::Array arr;
    arr.push_back(std::make_shared<JSONValue>(int64_t{1}));
    arr.push_back(std::make_shared<JSONValue>(std::string("a\"b\n")));
    arr.push_back(std::make_shared<JSONValue>(nullptr));
    arr.push_back(std::make_shared<JSONValue>(false));
    EXPECT_EQ(SerializeJSON(JSONValue{arr}), "[1,\"a\\\"b\\n\",null,false]");
}

TEST(JSONSerializer, ReparsesToEquivalentValue) {
    const std::string text = R"({"name":"create_user","arguments":{"user_id":"u1","n":0.5}})";
    auto v = ParseJSON(SerializeJSON(ParseJSON(text)));
    EXPECT_EQ(typed::getString(v, "name").value_or(""), "create_user");
    const JSONValue* args = typed::getMember(v, "arguments");
    ASSERT_NE(args, nullptr);
    EXPECT_EQ(typed::getString(*args, "user_id").value_or(""), "u1");
    EXPECT_DOUBLE_EQ(typed::getNumber(*args, "n").value_or(0.0), 0.5);
}

TEST(JSONRPCMessages, IdHelpers) {
    EXPECT_EQ(IdToString(JSONRPCId{std::string("abc")}), "abc");
    EXPECT_EQ(IdToString(JSONRPCId{int64_t{7}}), "7");
    EXPECT_EQ(IdToString(JSONRPCId{nullptr}), "");
    EXPECT_TRUE(IdToJSON(JSONRPCId{nullptr}).IsNull());
    EXPECT_EQ(std::get<int64_t>(IdToJSON(JSONRPCId{int64_t{3}}).value), 3);
}

TEST(JSONRPCMessages, ErrorResponseShape) {
    auto resp = CreateErrorResponse(JSONRPCId{int64_t{5}}, JSONRPCErrorCodes::MethodNotFound, "Method 'x' not found");
    ASSERT_TRUE(resp->IsError());
    auto v = ParseJSON(resp->Serialize());
    EXPECT_EQ(typed::getString(v, "jsonrpc").value_or(""), "2.0");
    EXPECT_EQ(typed::getInt(v, "id").value_or(0), 5);
    EXPECT_EQ(typed::getMember(v, "result"), nullptr);
    const JSONValue* err = typed::getMember(v, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(typed::getInt(*err, "code").value_or(0), -32601);
    EXPECT_EQ(typed::getString(*err, "message").value_or(""), "Method 'x' not found");
    EXPECT_EQ(typed::getMember(*err, "data"), nullptr);
}

TEST(JSONRPCMessages, NotificationHasNoId) {
    JSONValue::Object p;
    p["done"] = std::make_shared<JSONValue>(true);
    JSONRPCNotification note("stream", JSONValue{p});
    auto v = ParseJSON(note.Serialize());
    EXPECT_EQ(typed::getString(v, "method").value_or(""), "stream");
    EXPECT_EQ(typed::getMember(v, "id"), nullptr);
    EXPECT_TRUE(typed::getBool(*typed::getMember(v, "params"), "done").value_or(false));
}
