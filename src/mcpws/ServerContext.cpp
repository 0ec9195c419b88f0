//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerContext.cpp
// Purpose: Component wiring
//==========================================================================================================

#include "mcpws/ServerContext.h"

#include "logging/Logger.h"
#include "mcpws/llm/HttpGenerationBackend.h"
#include "mcpws/llm/MockGenerationBackend.h"

namespace mcpws {

ServerContext::ServerContext(const ServerConfig& config, const std::string& deploymentVersion)
    : sessions_(std::make_unique<SessionManager>()),
      tools_(std::make_unique<ToolRegistry>()),
      users_(std::make_shared<demo::UserStore>()) {
    if (config.useMockLlm) {
        backend_ = std::make_shared<llm::MockGenerationBackend>();
    } else {
        backend_ = std::make_shared<llm::HttpGenerationBackend>(config.ToBackendOptions());
    }
    LOG_INFO("Generation backend: {}", backend_->Kind());

    demo::RegisterUserTools(*tools_, users_);
    demo::RegisterGenerationTools(*tools_, backend_);

    protocol_ = std::make_unique<ProtocolHandler>(*sessions_, *tools_, config.ToProtocolOptions(deploymentVersion));
    server_ = std::make_unique<ConnectionServer>(config.ToServerOptions(), *sessions_, *tools_, *protocol_);
}

ServerContext::~ServerContext() {
    server_.reset();
    protocol_.reset();
}

} // namespace mcpws
