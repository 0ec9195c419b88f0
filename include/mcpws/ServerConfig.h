//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Server configuration from defaults, MCPWS_* environment variables and command-line flags
//==========================================================================================================

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcpws/ConnectionServer.hpp"
#include "mcpws/ProtocolHandler.h"
#include "mcpws/llm/HttpGenerationBackend.h"

namespace mcpws {

//==========================================================================================================
// ConfigError
// Purpose: Invalid configuration value (bad port, unknown flag, unknown consent mode).
//==========================================================================================================
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message) : std::invalid_argument(message) {}
};

struct ServerConfig {
    std::string host{"localhost"};
    std::string port{"8080"};
    bool useMockLlm{false};
    long long pingIntervalMs{30000};
    long long pingTimeoutMs{10000};
    long long closeTimeoutMs{10000};
    long long ioThreads{2};
    ConsentMode consentMode{ConsentMode::Delivery};
    long long consentTimeoutMs{30000};
    long long toolTimeoutMs{0};
    std::string llmHost{"127.0.0.1"};
    std::string llmPort{"11434"};
    std::string llmPath{"/v1/completions"};
    std::string llmModel{"distilgpt2"};
    std::string tlsCertFile;
    std::string tlsKeyFile;
    std::string versionFile{"VERSION"};
    std::string logLevel{"INFO"};
    std::string logFile;
    bool showHelp{false};

    //==========================================================================================================
    // Load
    // Purpose: Defaults, overridden by the environment, overridden by args (argv[0] is skipped).
    // Throws:
    //   ConfigError for an unknown flag, a missing value or an invalid value.
    //==========================================================================================================
    static ServerConfig Load(int argc, const char* const* argv);

    // Applies MCPWS_* variables on top of the current values.
    void ApplyEnvironment();

    // Applies flags on top of the current values. Accepts "--key=value" and "--key value".
    void ApplyArguments(const std::vector<std::string>& args);

    // Port, thread count and timeout checks. Throws ConfigError.
    void Validate() const;

    ConnectionServer::Options ToServerOptions() const;
    ProtocolHandler::Options ToProtocolOptions(const std::string& deploymentVersion) const;
    llm::HttpGenerationBackend::Options ToBackendOptions() const;

    static std::string Usage(const std::string& program);
};

} // namespace mcpws
