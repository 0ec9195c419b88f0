//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool table, schema enforcement and blocking invocation with cancellation/timeout
//==========================================================================================================

#include "mcpws/ToolRegistry.h"

#include <algorithm>
#include <format>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcpws/errors/Errors.h"
#include "mcpws/validation/SchemaValidator.h"

namespace mcpws {

namespace {
// Poll interval while waiting on a handler future so stop requests are observed promptly.
constexpr std::chrono::milliseconds kWaitSlice{10};
}

class ToolRegistry::Impl {
public:
    struct Entry {
        Tool tool;
        ToolHandler handler;
    };

    mutable std::mutex registryMutex;
    std::vector<Entry> entries;
    std::unordered_map<std::string, std::size_t> index;

    // Futures of timed-out or cancelled handlers; kept so their destructors never block a caller.
    std::mutex abandonedMutex;
    std::vector<std::future<JSONValue>> abandoned;

    std::optional<Entry> find(const std::string& name) const {
        std::lock_guard<std::mutex> lock(registryMutex);
        auto it = index.find(name);
        if (it == index.end()) return std::nullopt;
        return entries[it->second];
    }

    void abandon(std::future<JSONValue> fut) {
        std::lock_guard<std::mutex> lk(abandonedMutex);
        abandoned.erase(std::remove_if(abandoned.begin(), abandoned.end(), [](std::future<JSONValue>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }), abandoned.end());
        abandoned.push_back(std::move(fut));
    }

    static void validate(const Entry& e, const JSONValue& arguments) {
        auto issues = validation::SchemaValidator::Validate(e.tool.inputSchema, arguments);
        if (!issues.empty()) {
            const auto& first = issues.front();
            LOG_DEBUG("Validation failed for tool '{}' at '{}': {}", e.tool.name, first.instancePath, first.message);
            throw errors::ValidationError(first.message, first.instancePath);
        }
    }
};

ToolRegistry::ToolRegistry() : pImpl(std::make_unique<Impl>()) {}

ToolRegistry::~ToolRegistry() = default;

void ToolRegistry::RegisterTool(const std::string& name, const std::string& description,
                                const JSONValue& inputSchema, ToolHandler handler) {
    FUNC_SCOPE();
    if (name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool '" + name + "' has no handler");
    }
    try {
        validation::SchemaValidator::CheckSchema(inputSchema);
    } catch (const errors::InvalidSchemaError& e) {
        LOG_ERROR("Rejected tool '{}': {}", name, e.what());
        throw;
    }

    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    Impl::Entry entry{Tool{name, description, inputSchema}, std::move(handler)};
    auto it = pImpl->index.find(name);
    if (it != pImpl->index.end()) {
        pImpl->entries[it->second] = std::move(entry);
        LOG_WARN("Tool '{}' re-registered; previous definition replaced", name);
        return;
    }
    pImpl->index.emplace(name, pImpl->entries.size());
    pImpl->entries.push_back(std::move(entry));
    LOG_INFO("Registered tool: {}", name);
}

void ToolRegistry::RegisterTool(const Tool& tool, ToolHandler handler) {
    RegisterTool(tool.name, tool.description, tool.inputSchema, std::move(handler));
}

std::vector<Tool> ToolRegistry::ListTools() const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    std::vector<Tool> out;
    out.reserve(pImpl->entries.size());
    for (const auto& e : pImpl->entries) {
        out.push_back(e.tool);
    }
    return out;
}

std::optional<Tool> ToolRegistry::GetTool(const std::string& name) const {
    auto e = pImpl->find(name);
    if (!e.has_value()) return std::nullopt;
    return e->tool;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return pImpl->index.count(name) != 0;
}

std::size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return pImpl->entries.size();
}

void ToolRegistry::ValidateParameters(const std::string& name, const JSONValue& arguments) const {
    auto e = pImpl->find(name);
    if (!e.has_value()) {
        throw errors::ToolNotFoundError(name);
    }
    Impl::validate(e.value(), arguments);
}

JSONValue ToolRegistry::InvokeTool(const std::string& name, const JSONValue& arguments) {
    return InvokeTool(name, arguments, InvocationOptions{});
}

JSONValue ToolRegistry::InvokeTool(const std::string& name, const JSONValue& arguments,
                                   const InvocationOptions& options) {
    FUNC_SCOPE();
    auto e = pImpl->find(name);
    if (!e.has_value()) {
        throw errors::ToolNotFoundError(name);
    }
    Impl::validate(e.value(), arguments);

    auto src = options.stopSource ? options.stopSource : std::make_shared<std::stop_source>();
    ToolCallContext ctx;
    ctx.requestId = options.requestId;
    ctx.stopToken = src->get_token();
    ctx.progress = options.progress;
    ctx.stream = options.stream;

    std::future<JSONValue> fut;
    try {
        fut = e->handler(arguments, ctx);
    } catch (const errors::ToolExecutionError&) {
        throw;
    } catch (const std::exception& ex) {
        LOG_ERROR("Tool '{}' failed to start: {}", name, ex.what());
        throw errors::ToolExecutionError(std::string("Tool execution failed: ") + ex.what());
    } catch (...) {
        LOG_ERROR("Tool '{}' failed to start with a non-standard exception", name);
        throw errors::ToolExecutionError("Tool execution failed: unknown error");
    }
    if (!fut.valid()) {
        throw errors::ToolExecutionError("Tool execution failed: handler returned no result");
    }

    const auto started = std::chrono::steady_clock::now();
    for (;;) {
        auto status = fut.wait_for(kWaitSlice);
        if (status != std::future_status::timeout) {
            // ready, or deferred (runs inline in get())
            break;
        }
        if (src->stop_requested()) {
            LOG_INFO("Tool '{}' stop requested; abandoning pending result", name);
            pImpl->abandon(std::move(fut));
            throw errors::ToolExecutionError("Tool invocation cancelled");
        }
        if (options.timeout.has_value() &&
            std::chrono::steady_clock::now() - started >= options.timeout.value()) {
            src->request_stop();
            pImpl->abandon(std::move(fut));
            LOG_WARN("Tool '{}' timed out after {} ms", name, options.timeout->count());
            throw errors::ToolExecutionError(
                std::format("Tool execution failed: timed out after {} ms", options.timeout->count()));
        }
    }

    // Anything the handler raises is a tool failure (-32001), including protocol errors of its own;
    // only the validation above reports bad input.
    try {
        return fut.get();
    } catch (const errors::ToolExecutionError&) {
        throw;
    } catch (const std::exception& ex) {
        LOG_ERROR("Tool '{}' raised: {}", name, ex.what());
        throw errors::ToolExecutionError(std::string("Tool execution failed: ") + ex.what());
    } catch (...) {
        LOG_ERROR("Tool '{}' raised a non-standard exception", name);
        throw errors::ToolExecutionError("Tool execution failed: unknown error");
    }
}

} // namespace mcpws
