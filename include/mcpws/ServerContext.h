//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerContext.h
// Purpose: Owns and wires the server components for one process
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "mcpws/ConnectionServer.hpp"
#include "mcpws/ProtocolHandler.h"
#include "mcpws/ServerConfig.h"
#include "mcpws/SessionManager.h"
#include "mcpws/ToolRegistry.h"
#include "mcpws/demo/UserTools.h"
#include "mcpws/llm/GenerationBackend.h"

namespace mcpws {

//==========================================================================================================
// ServerContext
// Purpose: Builds the session table, tool registry (with the sample tools), generation backend, protocol
//          handler and connection server from a ServerConfig.
// Notes:
//   Members are destroyed in reverse order: the server stops before the handler, the handler goes before
//   the registry and session table it refers to.
//==========================================================================================================
class ServerContext {
public:
    ServerContext(const ServerConfig& config, const std::string& deploymentVersion);
    ~ServerContext();

    ServerContext(const ServerContext&) = delete;
    ServerContext& operator=(const ServerContext&) = delete;

    SessionManager& Sessions() { return *sessions_; }
    ToolRegistry& Tools() { return *tools_; }
    ProtocolHandler& Protocol() { return *protocol_; }
    ConnectionServer& Server() { return *server_; }
    llm::IGenerationBackend& Backend() { return *backend_; }
    demo::UserStore& Users() { return *users_; }

private:
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<ToolRegistry> tools_;
    std::shared_ptr<demo::UserStore> users_;
    std::shared_ptr<llm::IGenerationBackend> backend_;
    std::unique_ptr<ProtocolHandler> protocol_;
    std::unique_ptr<ConnectionServer> server_;
};

} // namespace mcpws
