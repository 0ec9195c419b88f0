//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: JSON Schema (draft-07 subset) structural checker and instance validator for tool input schemas
//==========================================================================================================

#pragma once

#include <string>
#include <vector>
#include "mcpws/JSONRPCTypes.h"

namespace mcpws {
namespace validation {

//==========================================================================================================
// ValidationIssue
// Purpose: One failed assertion against an instance.
// Fields:
//   instancePath: JSON pointer to the failing value ("" for the root, "/user_id", "/items/0").
//   keyword: Schema keyword that failed (e.g. "required", "type").
//   message: Human-readable description, e.g. "'name' is a required property".
//==========================================================================================================
struct ValidationIssue {
    std::string instancePath;
    std::string keyword;
    std::string message;
};

//==========================================================================================================
// SchemaValidator
// Purpose: Static helpers implementing the supported draft-07 keywords.
// Supported keywords:
//   type, properties, required, additionalProperties, minProperties, maxProperties,
//   minLength, maxLength, pattern, format (email, date-time, date, uri, uuid),
//   enum, const, minimum, maximum, exclusiveMinimum, exclusiveMaximum, multipleOf,
//   items, additionalItems, minItems, maxItems, uniqueItems, allOf, anyOf, oneOf, not.
//   Annotation keywords and unknown keywords are ignored. $ref is not resolved.
//==========================================================================================================
class SchemaValidator {
public:
    //==========================================================================================================
    // CheckSchema
    // Purpose: Verifies that schema is a well-formed schema document (object or boolean, keyword values of
    //          the right shape, compilable patterns) recursively through every subschema.
    // Throws:
    //   errors::InvalidSchemaError naming the offending schema location.
    //==========================================================================================================
    static void CheckSchema(const JSONValue& schema);

    //==========================================================================================================
    // Validate
    // Purpose: Validates instance against a schema that already passed CheckSchema.
    // Returns:
    //   All issues found, in document order; empty when the instance is valid.
    //==========================================================================================================
    static std::vector<ValidationIssue> Validate(const JSONValue& schema, const JSONValue& instance);

    // True when Validate(schema, instance) reports no issues.
    static bool IsValid(const JSONValue& schema, const JSONValue& instance);
};

// Structural JSON equality used by enum/const/uniqueItems. 1 and 1.0 compare equal.
bool JsonEquals(const JSONValue& a, const JSONValue& b);

} // namespace validation
} // namespace mcpws
