//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpws/JSONRPCTypes.h"
#include "mcpws/errors/Errors.h"
#include "mcpws/typed/Content.h"

using namespace mcpws;

TEST(Errors, CodeValues) {
    EXPECT_EQ(JSONRPCErrorCodes::ParseError, -32700);
    EXPECT_EQ(JSONRPCErrorCodes::InvalidRequest, -32600);
    EXPECT_EQ(JSONRPCErrorCodes::MethodNotFound, -32601);
    EXPECT_EQ(JSONRPCErrorCodes::InvalidParams, -32602);
    EXPECT_EQ(JSONRPCErrorCodes::InternalError, -32603);
    EXPECT_EQ(JSONRPCErrorCodes::ToolNotFound, -32000);
    EXPECT_EQ(JSONRPCErrorCodes::ToolExecutionError, -32001);
    EXPECT_EQ(JSONRPCErrorCodes::SessionNotInitialized, -32002);
    EXPECT_EQ(JSONRPCErrorCodes::ConsentRequired, -32003);
}

TEST(Errors, CategoryMapping) {
    using errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::ToolNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolExecutionError), ErrorCategory::ToolExecution);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::SessionNotInitialized), ErrorCategory::SessionNotInitialized);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ConsentRequired), ErrorCategory::ConsentRequired);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ToolNotFoundCarriesKindData) {
    errors::ToolNotFoundError e("nope");
    EXPECT_EQ(e.Code(), -32000);
    EXPECT_STREQ(e.what(), "Tool 'nope' not found");
    ASSERT_TRUE(e.Data().has_value());
    EXPECT_EQ(typed::getString(e.Data().value(), "kind").value_or(""), "notFound");
    EXPECT_EQ(typed::getString(e.Data().value(), "tool").value_or(""), "nope");
}

TEST(Errors, ValidationErrorSharesToolErrorCode) {
    errors::ValidationError e("'name' is a required property", "");
    EXPECT_EQ(e.Code(), -32000);
    EXPECT_EQ(std::string(e.what()), "Parameter validation failed: 'name' is a required property");
    ASSERT_TRUE(e.Data().has_value());
    EXPECT_EQ(typed::getString(e.Data().value(), "kind").value_or(""), "validation");
    EXPECT_EQ(typed::getString(e.Data().value(), "path").value_or("x"), "");
}

TEST(Errors, ResponseRoundTripThroughMcpError) {
    errors::ToolExecutionError e("Tool execution failed: boom");
    auto mcpErr = e.ToMcpError();
    auto resp = errors::makeErrorResponse(JSONRPCId{std::string("r1")}, mcpErr);
    auto parsed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, -32001);
    EXPECT_EQ(parsed->message, "Tool execution failed: boom");
    EXPECT_EQ(parsed->category, errors::ErrorCategory::ToolExecution);
    EXPECT_FALSE(parsed->data.has_value());
}

TEST(Errors, MalformedErrorValueYieldsNullopt) {
    JSONValue::Object o;
    o["code"] = std::make_shared<JSONValue>(std::string("not-a-number"));
    o["message"] = std::make_shared<JSONValue>(std::string("m"));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue{o}).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue(int64_t{1})).has_value());
}
