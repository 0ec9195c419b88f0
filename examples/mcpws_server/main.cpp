//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: WebSocket JSON-RPC tool server executable
//==========================================================================================================

#include <csignal>
#include <cstdlib>
#include <iostream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "mcpws/ServerConfig.h"
#include "mcpws/ServerContext.h"
#include "mcpws/version.h"

using namespace mcpws;

int main(int argc, char** argv) {
    ServerConfig config;
    try {
        config = ServerConfig::Load(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << ServerConfig::Usage(argv[0]);
        return 2;
    }
    if (config.showHelp) {
        std::cout << ServerConfig::Usage(argv[0]);
        return 0;
    }

    Logger::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty()) {
        Logger::setLogFile(config.logFile);
    }
    FUNC_SCOPE();

    const std::string deploymentVersion = readVersionFile(config.versionFile);
    LOG_INFO("mcpws {} (library {}) starting on {}:{} mock_llm={} consent={}", deploymentVersion,
             getVersionString(), config.host, config.port, config.useMockLlm, toString(config.consentMode));

    try {
        ServerContext context(config, deploymentVersion);
        context.Backend().Initialize().get();
        context.Server().SetErrorHandler([](const std::string& err) {
            LOG_WARN("Server error: {}", err);
        });
        context.Server().Start().get();

        boost::asio::io_context signals;
        boost::asio::signal_set set(signals, SIGINT, SIGTERM);
        set.async_wait([](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                LOG_INFO("Received signal {}, shutting down", signo);
            }
        });
        signals.run();

        context.Server().Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        return EXIT_FAILURE;
    }
    LOG_INFO("Shutdown complete");
    return EXIT_SUCCESS;
}
