//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_schema_validator.cpp
// Purpose: GoogleTests for schema well-formedness checks and instance validation
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpws/JSONRPCTypes.h"
#include "mcpws/errors/Errors.h"
#include "mcpws/validation/SchemaValidator.h"

using namespace mcpws;
using validation::SchemaValidator;

namespace {
JSONValue schemaOf(const char* text) {
    auto s = ParseJSON(text);
    SchemaValidator::CheckSchema(s);
    return s;
}
}

TEST(SchemaCheck, AcceptsWellFormedSchemas) {
    EXPECT_NO_THROW(SchemaValidator::CheckSchema(ParseJSON("true")));
    EXPECT_NO_THROW(SchemaValidator::CheckSchema(ParseJSON("{}")));
    EXPECT_NO_THROW(SchemaValidator::CheckSchema(ParseJSON(
        R"({"type":"object","properties":{"a":{"type":["string","null"],"pattern":"^x"}},"required":["a"]})")));
}

TEST(SchemaCheck, RejectsMalformedSchemas) {
    EXPECT_THROW(SchemaValidator::CheckSchema(ParseJSON("5")), errors::InvalidSchemaError);
    EXPECT_THROW(SchemaValidator::CheckSchema(ParseJSON(R"({"type":"strin"})")), errors::InvalidSchemaError);
    EXPECT_THROW(SchemaValidator::CheckSchema(ParseJSON(R"({"type":5})")), errors::InvalidSchemaError);
    EXPECT_THROW(SchemaValidator::CheckSchema(ParseJSON(R"({"required":"a"})")), errors::InvalidSchemaError);
    EXPECT_THROW(SchemaValidator::CheckSchema(ParseJSON(R"({"properties":{"a":{"type":"nope"}}})")),
                 errors::InvalidSchemaError);
}

TEST(SchemaValidate, RequiredAndType) {
    auto s = schemaOf(R"({"type":"object","properties":{"name":{"type":"string"}},"required":["name"]})");
    auto issues = SchemaValidator::Validate(s, ParseJSON("{}"));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].keyword, "required");
    EXPECT_EQ(issues[0].message, "'name' is a required property");
    EXPECT_EQ(issues[0].instancePath, "");

    issues = SchemaValidator::Validate(s, ParseJSON(R"({"name":3})"));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].keyword, "type");
    EXPECT_EQ(issues[0].instancePath, "/name");
    EXPECT_EQ(issues[0].message, "3 is not of type 'string'");

    EXPECT_TRUE(SchemaValidator::IsValid(s, ParseJSON(R"({"name":"Ada"})")));
}

TEST(SchemaValidate, AdditionalPropertiesFalse) {
    auto s = schemaOf(R"({"type":"object","properties":{"a":{}},"additionalProperties":false})");
    auto issues = SchemaValidator::Validate(s, ParseJSON(R"({"a":1,"b":2})"));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].keyword, "additionalProperties");
    EXPECT_EQ(issues[0].message, "Additional properties are not allowed ('b' was unexpected)");
}

TEST(SchemaValidate, StringConstraints) {
    auto s = schemaOf(R"({"type":"string","minLength":1,"maxLength":3,"pattern":"^[a-z]+$"})");
    EXPECT_TRUE(SchemaValidator::IsValid(s, ParseJSON(R"("abc")")));
    EXPECT_FALSE(SchemaValidator::IsValid(s, ParseJSON(R"("")")));
    EXPECT_FALSE(SchemaValidator::IsValid(s, ParseJSON(R"("abcd")")));
    EXPECT_FALSE(SchemaValidator::IsValid(s, ParseJSON(R"("AB")")));
    // Length counts code points
    auto two = schemaOf(R"({"type":"string","maxLength":2})");
    EXPECT_TRUE(SchemaValidator::IsValid(two, ParseJSON(R"("éé")")));
}

TEST(SchemaValidate, NumericConstraints) {
    auto s = schemaOf(R"({"type":"integer","minimum":1,"maximum":10,"multipleOf":2})");
    EXPECT_TRUE(SchemaValidator::IsValid(s, ParseJSON("4")));
    EXPECT_TRUE(SchemaValidator::IsValid(s, ParseJSON("4.0")));
    EXPECT_FALSE(SchemaValidator::IsValid(s, ParseJSON("3")));
    EXPECT_FALSE(SchemaValidator::IsValid(s, ParseJSON("12")));
    EXPECT_FALSE(SchemaValidator::IsValid(s, ParseJSON("0")));
    EXPECT_FALSE(SchemaValidator::IsValid(s, ParseJSON("4.5")));
    auto excl = schemaOf(R"({"type":"number","exclusiveMinimum":0})");
    EXPECT_FALSE(SchemaValidator::IsValid(excl, ParseJSON("0")));
    EXPECT_TRUE(SchemaValidator::IsValid(excl, ParseJSON("0.1")));
}

TEST(SchemaValidate, BooleanIsNotInteger) {
    auto s = schemaOf(R"({"type":"integer"})");
    EXPECT_FALSE(SchemaValidator::IsValid(s, ParseJSON("true")));
}

TEST(SchemaValidate, EnumConstAndArrays) {
    auto e = schemaOf(R"({"enum":["user","assistant"]})");
    EXPECT_TRUE(SchemaValidator::IsValid(e, ParseJSON(R"("user")")));
    EXPECT_FALSE(SchemaValidator::IsValid(e, ParseJSON(R"("system")")));

    auto c = schemaOf(R"({"const":1})");
    EXPECT_TRUE(SchemaValidator::IsValid(c, ParseJSON("1.0")));

    auto a = schemaOf(R"({"type":"array","items":{"type":"string"},"minItems":1,"uniqueItems":true})");
    EXPECT_TRUE(SchemaValidator::IsValid(a, ParseJSON(R"(["a","b"])")));
    EXPECT_FALSE(SchemaValidator::IsValid(a, ParseJSON("[]")));
    EXPECT_FALSE(SchemaValidator::IsValid(a, ParseJSON(R"(["a","a"])")));
    auto issues = SchemaValidator::Validate(a, ParseJSON(R"(["a",2])"));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].instancePath, "/1");
}

TEST(SchemaValidate, Combinators) {
    auto any = schemaOf(R"({"anyOf":[{"type":"string"},{"type":"integer"}]})");
    EXPECT_TRUE(SchemaValidator::IsValid(any, ParseJSON("1")));
    EXPECT_FALSE(SchemaValidator::IsValid(any, ParseJSON("null")));

    auto one = schemaOf(R"({"oneOf":[{"type":"number"},{"type":"integer"}]})");
    EXPECT_TRUE(SchemaValidator::IsValid(one, ParseJSON("1.5")));
    EXPECT_FALSE(SchemaValidator::IsValid(one, ParseJSON("1")));

    auto notS = schemaOf(R"({"not":{"type":"null"}})");
    EXPECT_FALSE(SchemaValidator::IsValid(notS, ParseJSON("null")));
}

TEST(SchemaValidate, Formats) {
    auto email = schemaOf(R"({"type":"string","format":"email"})");
    EXPECT_TRUE(SchemaValidator::IsValid(email, ParseJSON(R"("a@b.io")")));
    EXPECT_FALSE(SchemaValidator::IsValid(email, ParseJSON(R"("not-an-email")")));
    auto dt = schemaOf(R"({"type":"string","format":"date-time"})");
    EXPECT_TRUE(SchemaValidator::IsValid(dt, ParseJSON(R"("2024-01-31T12:00:00Z")")));
    EXPECT_FALSE(SchemaValidator::IsValid(dt, ParseJSON(R"("2024-13-31T12:00:00Z")")));
}

TEST(SchemaValidate, FalseSchemaRejectsEverything) {
    EXPECT_FALSE(SchemaValidator::IsValid(ParseJSON("false"), ParseJSON("{}")));
    EXPECT_TRUE(SchemaValidator::IsValid(ParseJSON("true"), ParseJSON("{}")));
}
