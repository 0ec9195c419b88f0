//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Configuration layering and validation
//==========================================================================================================

#include "mcpws/ServerConfig.h"

#include <cerrno>
#include <cstdlib>
#include <optional>

#include "env/EnvVars.h"

namespace mcpws {

namespace {

long long parseInteger(const std::string& flag, const std::string& value) {
    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (value.empty() || errno != 0 || end == value.c_str() || *end != '\0') {
        throw ConfigError("Invalid value for " + flag + ": '" + value + "'");
    }
    return parsed;
}

ConsentMode parseMode(const std::string& value) {
    auto mode = parseConsentMode(value);
    if (!mode.has_value()) {
        throw ConfigError("Invalid consent mode: '" + value + "' (expected delivery or explicit)");
    }
    return mode.value();
}

} // namespace

ServerConfig ServerConfig::Load(int argc, const char* const* argv) {
    ServerConfig cfg;
    cfg.ApplyEnvironment();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr) {
            args.emplace_back(argv[i]);
        }
    }
    cfg.ApplyArguments(args);
    if (!cfg.showHelp) {
        cfg.Validate();
    }
    return cfg;
}

void ServerConfig::ApplyEnvironment() {
    host = GetEnvOrDefault("MCPWS_HOST", host);
    port = GetEnvOrDefault("MCPWS_PORT", port);
    useMockLlm = GetEnvFlag("MCPWS_MOCK_LLM", useMockLlm);
    pingIntervalMs = GetEnvIntOrDefault("MCPWS_PING_INTERVAL_MS", pingIntervalMs);
    pingTimeoutMs = GetEnvIntOrDefault("MCPWS_PING_TIMEOUT_MS", pingTimeoutMs);
    closeTimeoutMs = GetEnvIntOrDefault("MCPWS_CLOSE_TIMEOUT_MS", closeTimeoutMs);
    ioThreads = GetEnvIntOrDefault("MCPWS_IO_THREADS", ioThreads);
    const std::string mode = GetEnvOrDefault("MCPWS_CONSENT_MODE", "");
    if (!mode.empty()) {
        consentMode = parseMode(mode);
    }
    consentTimeoutMs = GetEnvIntOrDefault("MCPWS_CONSENT_TIMEOUT_MS", consentTimeoutMs);
    toolTimeoutMs = GetEnvIntOrDefault("MCPWS_TOOL_TIMEOUT_MS", toolTimeoutMs);
    llmHost = GetEnvOrDefault("MCPWS_LLM_HOST", llmHost);
    llmPort = GetEnvOrDefault("MCPWS_LLM_PORT", llmPort);
    llmPath = GetEnvOrDefault("MCPWS_LLM_PATH", llmPath);
    llmModel = GetEnvOrDefault("MCPWS_LLM_MODEL", llmModel);
    tlsCertFile = GetEnvOrDefault("MCPWS_TLS_CERT", tlsCertFile);
    tlsKeyFile = GetEnvOrDefault("MCPWS_TLS_KEY", tlsKeyFile);
    versionFile = GetEnvOrDefault("MCPWS_VERSION_FILE", versionFile);
    logLevel = GetEnvOrDefault("MCPWS_LOG_LEVEL", logLevel);
    logFile = GetEnvOrDefault("MCPWS_LOG_FILE", logFile);
}

void ServerConfig::ApplyArguments(const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            showHelp = true;
            continue;
        }
        if (arg == "--mock-llm") {
            useMockLlm = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw ConfigError("Unexpected argument: '" + arg + "'");
        }

        std::string key = arg;
        std::optional<std::string> value;
        const std::size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            key = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }
        auto next = [&]() -> std::string {
            if (value.has_value()) {
                return value.value();
            }
            if (i + 1 >= args.size()) {
                throw ConfigError("Missing value for " + key);
            }
            return args[++i];
        };

        if (key == "--host") {
            host = next();
        } else if (key == "--port") {
            port = next();
        } else if (key == "--ping-interval-ms") {
            pingIntervalMs = parseInteger(key, next());
        } else if (key == "--ping-timeout-ms") {
            pingTimeoutMs = parseInteger(key, next());
        } else if (key == "--io-threads") {
            ioThreads = parseInteger(key, next());
        } else if (key == "--consent-mode") {
            consentMode = parseMode(next());
        } else if (key == "--consent-timeout-ms") {
            consentTimeoutMs = parseInteger(key, next());
        } else if (key == "--tool-timeout-ms") {
            toolTimeoutMs = parseInteger(key, next());
        } else if (key == "--tls-cert") {
            tlsCertFile = next();
        } else if (key == "--tls-key") {
            tlsKeyFile = next();
        } else if (key == "--log-level") {
            logLevel = next();
        } else if (key == "--log-file") {
            logFile = next();
        } else {
            throw ConfigError("Unknown option: " + key);
        }
    }
}

void ServerConfig::Validate() const {
    if (host.empty()) {
        throw ConfigError("Host must not be empty");
    }
    if (port.empty() || port.size() > 5 || port.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("Invalid port: '" + port + "'");
    }
    if (std::stol(port) > 65535) {
        throw ConfigError("Invalid port: '" + port + "' (must be 0-65535)");
    }
    if (ioThreads < 1) {
        throw ConfigError("io-threads must be at least 1");
    }
    if (pingIntervalMs < 0 || pingTimeoutMs < 0 || closeTimeoutMs < 0 || consentTimeoutMs < 0 || toolTimeoutMs < 0) {
        throw ConfigError("Timeouts must not be negative");
    }
    if (tlsCertFile.empty() != tlsKeyFile.empty()) {
        throw ConfigError("TLS requires both a certificate and a key file");
    }
}

ConnectionServer::Options ServerConfig::ToServerOptions() const {
    ConnectionServer::Options o;
    o.host = host;
    o.port = port;
    o.pingInterval = std::chrono::milliseconds(pingIntervalMs);
    o.pingTimeout = std::chrono::milliseconds(pingTimeoutMs);
    o.closeTimeout = std::chrono::milliseconds(closeTimeoutMs);
    o.ioThreads = static_cast<unsigned int>(ioThreads);
    o.certFile = tlsCertFile;
    o.keyFile = tlsKeyFile;
    o.llmType = useMockLlm ? "mock" : "real";
    return o;
}

ProtocolHandler::Options ServerConfig::ToProtocolOptions(const std::string& deploymentVersion) const {
    ProtocolHandler::Options o;
    if (!deploymentVersion.empty()) {
        o.serverInfo.version = deploymentVersion;
    }
    o.consentMode = consentMode;
    o.consentTimeout = std::chrono::milliseconds(consentTimeoutMs);
    if (toolTimeoutMs > 0) {
        o.toolTimeout = std::chrono::milliseconds(toolTimeoutMs);
    }
    return o;
}

llm::HttpGenerationBackend::Options ServerConfig::ToBackendOptions() const {
    llm::HttpGenerationBackend::Options o;
    o.host = llmHost;
    o.port = llmPort;
    o.path = llmPath;
    o.model = llmModel;
    return o;
}

std::string ServerConfig::Usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --host <addr>              Bind address (default localhost, env MCPWS_HOST)\n"
           "  --port <n>                 Bind port, 0 for ephemeral (default 8080, env MCPWS_PORT)\n"
           "  --mock-llm                 Use the mock generation backend (env MCPWS_MOCK_LLM)\n"
           "  --ping-interval-ms <n>     Heartbeat interval, 0 disables (default 30000)\n"
           "  --ping-timeout-ms <n>      Close after this long without traffic (default 10000)\n"
           "  --io-threads <n>           I/O threads (default 2)\n"
           "  --consent-mode <mode>      delivery | explicit (default delivery)\n"
           "  --consent-timeout-ms <n>   Explicit consent deadline (default 30000)\n"
           "  --tool-timeout-ms <n>      Per-invocation limit, 0 disables (default 0)\n"
           "  --tls-cert <file>          PEM certificate; with --tls-key serves wss\n"
           "  --tls-key <file>           PEM private key\n"
           "  --log-level <level>        DEBUG | INFO | WARN | ERROR (default INFO)\n"
           "  --log-file <file>          Also write logs to this file\n"
           "  --help                     Show this message\n";
}

} // namespace mcpws
