//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol data structures, method names and notification names
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>

namespace mcpws {
//==========================================================================================================
// Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Negotiated protocol version. The server always answers with this value.
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Advertised server identity
constexpr const char* SERVER_NAME = "MCP Demo Server";
constexpr const char* SERVER_VERSION = "1.0.0";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
// Server capability flags returned from mcp.initialize
struct ServerCapabilities {
    bool tools = true;
    bool streaming = true;
    bool progress = true;
    bool consent = true;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool descriptor as enumerated by tools.list
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue schema)
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(schema)) {}
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "mcp.initialize";
    constexpr const char* Ping = "mcp.ping";
    constexpr const char* Cancel = "mcp.cancel";
    constexpr const char* ListTools = "tools.list";
    constexpr const char* InvokeTool = "tool.invoke";
}

///////////////////////////////////////// Notification names ///////////////////////////////////////////
namespace Notifications {
    // Server -> client
    constexpr const char* UserConsent = "user.consent";
    constexpr const char* ToolProgress = "tool.progress";
    constexpr const char* Stream = "stream";
    // Client -> server reply to user.consent when explicit consent is enabled
    constexpr const char* ConsentResponse = "user.consent.response";
}

} // namespace mcpws
