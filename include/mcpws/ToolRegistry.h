//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Named tool table with input-schema enforcement and handler invocation
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcpws/Protocol.h"

namespace mcpws {

//==========================================================================================================
// ToolCallContext
// Purpose: Per-invocation context handed to tool handlers.
// Fields:
//   requestId: Client-supplied id of the tool.invoke request (null when invoked directly).
//   stopToken: Signalled on mcp.cancel or when a configured timeout elapses. Handlers should poll it.
//   progress: Optional sink for tool.progress notifications (progress in [0,1], message).
//   stream: Optional sink for stream notifications (content chunk, done flag).
//==========================================================================================================
struct ToolCallContext {
    JSONRPCId requestId{nullptr};
    std::stop_token stopToken;
    std::function<void(double, const std::string&)> progress;
    std::function<void(const std::string&, bool)> stream;

    bool StopRequested() const { return stopToken.stop_requested(); }

    void ReportProgress(double value, const std::string& message) const {
        if (progress) progress(value, message);
    }

    void EmitStream(const std::string& content, bool done) const {
        if (stream) stream(content, done);
    }
};

// Handler contract: receives validated arguments and returns the tool's result value asynchronously.
using ToolHandler = std::function<std::future<JSONValue>(const JSONValue& arguments, const ToolCallContext& ctx)>;

//==========================================================================================================
// InvocationOptions
// Purpose: Optional knobs for ToolRegistry::InvokeTool.
// Fields:
//   stopSource: Caller-owned stop source; a private one is created when null.
//   timeout: When set, the handler's stop token is signalled and ToolExecutionError raised on expiry.
//   requestId/progress/stream: Forwarded into ToolCallContext.
//==========================================================================================================
struct InvocationOptions {
    std::shared_ptr<std::stop_source> stopSource;
    std::optional<std::chrono::milliseconds> timeout;
    JSONRPCId requestId{nullptr};
    std::function<void(double, const std::string&)> progress;
    std::function<void(const std::string&, bool)> stream;
};

//==========================================================================================================
// ToolRegistry
// Purpose: Thread-safe registry of tools. Enumeration order is registration order; re-registering a name
//          replaces the entry in place.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry();
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    //==========================================================================================================
    // RegisterTool
    // Purpose: Adds or replaces a tool after checking its input schema.
    // Throws:
    //   errors::InvalidSchemaError when inputSchema is malformed (the registry is left unchanged).
    //   std::invalid_argument when name is empty or handler is empty.
    //==========================================================================================================
    void RegisterTool(const std::string& name, const std::string& description,
                      const JSONValue& inputSchema, ToolHandler handler);
    void RegisterTool(const Tool& tool, ToolHandler handler);

    // Snapshot of all tools in registration order.
    std::vector<Tool> ListTools() const;

    std::optional<Tool> GetTool(const std::string& name) const;
    bool HasTool(const std::string& name) const;
    std::size_t Size() const;

    //==========================================================================================================
    // ValidateParameters
    // Purpose: Validates arguments against the named tool's schema.
    // Throws:
    //   errors::ToolNotFoundError when the tool is unknown.
    //   errors::ValidationError describing the first failing assertion.
    //==========================================================================================================
    void ValidateParameters(const std::string& name, const JSONValue& arguments) const;

    //==========================================================================================================
    // InvokeTool
    // Purpose: Re-validates arguments, runs the handler and waits for its result. Blocks the calling thread.
    // Throws:
    //   errors::ToolNotFoundError / errors::ValidationError as ValidateParameters.
    //   errors::ToolExecutionError when the handler throws, times out or observes a stop request.
    //==========================================================================================================
    JSONValue InvokeTool(const std::string& name, const JSONValue& arguments);
    JSONValue InvokeTool(const std::string& name, const JSONValue& arguments, const InvocationOptions& options);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpws
