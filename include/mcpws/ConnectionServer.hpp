//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionServer.hpp
// Purpose: Coroutine-based WebSocket (ws/wss) server using Boost.Beast (TLS 1.3 only for wss)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "mcpws/JSONRPCTypes.h"
#include "mcpws/ProtocolHandler.h"
#include "mcpws/SessionManager.h"
#include "mcpws/ToolRegistry.h"

namespace mcpws {

class ConnectionServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Listener, heartbeat and TLS configuration.
    // Fields:
    //   host/port: Bind address and port ("0" selects an ephemeral port; see GetBoundPort).
    //   pingInterval: Interval between heartbeat pings (0 disables the heartbeat).
    //   pingTimeout: A connection with no inbound traffic or pong this long after a ping is closed.
    //   closeTimeout: Upper bound for the closing handshake and for draining one outbound frame.
    //   ioThreads: Threads running the I/O context.
    //   certFile/keyFile: PEM files; when both are set the server speaks wss (TLS 1.3 only).
    //   llmType: Reported by GetServerInfo ("mock" or "real").
    //==========================================================================================================
    struct Options {
        std::string host{"localhost"};
        std::string port{"8080"};
        std::chrono::milliseconds pingInterval{30000};
        std::chrono::milliseconds pingTimeout{10000};
        std::chrono::milliseconds closeTimeout{10000};
        unsigned int ioThreads{2};
        std::string certFile;
        std::string keyFile;
        std::string llmType{"real"};
    };

    // Counters reported at shutdown
    struct Stats {
        std::uint64_t connectionsAccepted{0};
        std::uint64_t messagesHandled{0};
        std::size_t activeConnections{0};
        std::size_t dispatchWorkers{0}; // worker threads not yet joined
    };

    ConnectionServer(const Options& opts, SessionManager& sessions, ToolRegistry& tools, ProtocolHandler& protocol);
    ~ConnectionServer();

    ConnectionServer(const ConnectionServer&) = delete;
    ConnectionServer& operator=(const ConnectionServer&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Validates the port, binds and listens synchronously, then runs the accept loop on the I/O
    //          threads.
    // Returns:
    //   Future that is ready once the server is listening. It carries std::runtime_error when the port is
    //   invalid, the address cannot be resolved or bound, or the TLS files cannot be loaded.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stop
    // Purpose: Refuses new connections, cancels in-flight tool invocations, closes every connection, waits
    //          for the dispatch workers, stops the I/O threads and logs final counts. Idempotent.
    // Notes:
    //   Must not be called from an I/O thread.
    //==========================================================================================================
    std::future<void> Stop();

    bool IsRunning() const;

    // Port actually bound (0 before Start).
    unsigned short GetBoundPort() const;

    Stats GetStats() const;

    //==========================================================================================================
    // GetServerInfo
    // Returns:
    //   { host, port, running, activeSessions, registeredTools, llmType }
    //==========================================================================================================
    JSONValue GetServerInfo() const;

    // Receives transport-level errors (accept failures); they are logged regardless.
    void SetErrorHandler(std::function<void(const std::string&)> handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpws
