//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, protocol exceptions and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpws/JSONRPCTypes.h"

namespace mcpws {
namespace errors {

// Categorization of JSON-RPC and server-defined error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    ToolNotFound,
    ToolExecution,
    SessionNotInitialized,
    ConsentRequired,
    Unknown
};

// Typed error representation used at the dispatch boundary.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or server-defined).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::ToolNotFound;
        case JSONRPCErrorCodes::ToolExecutionError: return ErrorCategory::ToolExecution;
        case JSONRPCErrorCodes::SessionNotInitialized: return ErrorCategory::SessionNotInitialized;
        case JSONRPCErrorCodes::ConsentRequired: return ErrorCategory::ConsentRequired;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    auto itCode = obj.find("code");
    auto itMsg = obj.find("message");
    if (itCode == obj.end() || itMsg == obj.end()) {
        return std::nullopt;
    }
    if (!itCode->second || !itMsg->second) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(itCode->second->value) ||
        !std::holds_alternative<std::string>(itMsg->second->value)) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(itCode->second->value));
    e.message = std::get<std::string>(itMsg->second->value);
    auto itData = obj.find("data");
    if (itData != obj.end() && itData->second) {
        e.data = *(itData->second);
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// ProtocolError
// Purpose: Exception carrying a JSON-RPC error code, message and optional data. Thrown inside the
//          core and converted into an error response by ProtocolHandler.
//==========================================================================================================
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    int Code() const { return code_; }
    const std::optional<JSONValue>& Data() const { return data_; }

    McpError ToMcpError() const {
        McpError e;
        e.code = code_;
        e.message = what();
        e.data = data_;
        e.category = errorCategoryFromCode(code_);
        return e;
    }

private:
    int code_;
    std::optional<JSONValue> data_;
};

// Builds the { kind, ... } data payload attached to registry errors.
inline JSONValue makeKindData(const std::string& kind, const std::string& key, const std::string& value) {
    JSONValue::Object o;
    o["kind"] = std::make_shared<JSONValue>(kind);
    o[key] = std::make_shared<JSONValue>(value);
    return JSONValue{o};
}

// Tool name is not registered.
class ToolNotFoundError : public ProtocolError {
public:
    explicit ToolNotFoundError(const std::string& toolName)
        : ProtocolError(JSONRPCErrorCodes::ToolNotFound, "Tool '" + toolName + "' not found",
                        makeKindData("notFound", "tool", toolName)) {}
};

// Arguments violate the tool's input schema. Shares the not-found code; data.kind tells them apart.
class ValidationError : public ProtocolError {
public:
    ValidationError(const std::string& detail, const std::string& instancePath)
        : ProtocolError(JSONRPCErrorCodes::ToolNotFound, "Parameter validation failed: " + detail,
                        makeKindData("validation", "path", instancePath)) {}
};

// Handler failed, timed out or was cancelled.
class ToolExecutionError : public ProtocolError {
public:
    explicit ToolExecutionError(const std::string& message)
        : ProtocolError(JSONRPCErrorCodes::ToolExecutionError, message) {}
};

//==========================================================================================================
// InvalidSchemaError
// Purpose: Registration-time failure: the supplied input schema is not a well-formed schema document.
//==========================================================================================================
class InvalidSchemaError : public std::invalid_argument {
public:
    explicit InvalidSchemaError(const std::string& message) : std::invalid_argument(message) {}
};

//==========================================================================================================
// ConnectionClosedError
// Purpose: Raised (through a failed send future) when a frame is sent on a closed connection.
//==========================================================================================================
class ConnectionClosedError : public std::runtime_error {
public:
    explicit ConnectionClosedError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace errors
} // namespace mcpws
