//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.h
// Purpose: Session table keyed by connection and by session id, plus broadcast
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpws/Connection.h"
#include "mcpws/JSONRPCTypes.h"

namespace mcpws {

//==========================================================================================================
// Session
// Purpose: Server-side state bound to one connection. Created on connect in the un-initialized state and
//          flipped to initialized by mcp.initialize. All accessors are thread-safe.
//==========================================================================================================
class Session {
public:
    Session(std::string id, std::shared_ptr<IConnection> connection);

    const std::string& Id() const { return id_; }
    const std::shared_ptr<IConnection>& Connection() const { return connection_; }
    std::chrono::system_clock::time_point CreatedAt() const { return createdAt_; }

    bool IsInitialized() const;

    //==========================================================================================================
    // MarkInitialized
    // Purpose: Records the negotiated handshake values and flips the session to initialized. A repeated
    //          handshake overwrites the previous values.
    //==========================================================================================================
    void MarkInitialized(const std::string& protocolVersion, const JSONValue& clientCapabilities,
                         const std::optional<JSONValue>& clientInfo);

    std::string ProtocolVersion() const;
    JSONValue ClientCapabilities() const;
    std::optional<JSONValue> ClientInfo() const;

    // Free-form context map
    void SetContext(const std::string& key, const JSONValue& value);
    std::optional<JSONValue> GetContext(const std::string& key) const;
    std::unordered_map<std::string, JSONValue> ContextSnapshot() const;

private:
    const std::string id_;
    const std::shared_ptr<IConnection> connection_;
    const std::chrono::system_clock::time_point createdAt_;

    mutable std::mutex mutex_;
    bool initialized_{false};
    std::string protocolVersion_;
    JSONValue clientCapabilities_;
    std::optional<JSONValue> clientInfo_;
    std::unordered_map<std::string, JSONValue> context_;
};

//==========================================================================================================
// SessionManager
// Purpose: Owns the session table. One mutex guards both lookup directions so they never disagree.
//==========================================================================================================
class SessionManager {
public:
    SessionManager();
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    //==========================================================================================================
    // CreateSession
    // Purpose: Creates a session with a fresh random UUID for connection. If the connection already has a
    //          session, that session is replaced.
    //==========================================================================================================
    std::shared_ptr<Session> CreateSession(const std::shared_ptr<IConnection>& connection);

    std::shared_ptr<Session> GetSession(const IConnection* connection) const;
    std::shared_ptr<Session> GetSession(const std::shared_ptr<IConnection>& connection) const;
    std::shared_ptr<Session> GetSessionById(const std::string& sessionId) const;

    // Removes the connection's session from both indexes. No-op when absent.
    void RemoveSession(const IConnection* connection);
    void RemoveSession(const std::shared_ptr<IConnection>& connection);

    // Sets one context entry on the session; no-op when the session does not exist.
    void UpdateContext(const std::string& sessionId, const std::string& key, const JSONValue& value);

    std::vector<std::shared_ptr<Session>> GetActiveSessions() const;
    std::size_t SessionCount() const;

    //==========================================================================================================
    // Broadcast
    // Purpose: Sends frame to every session in a snapshot of the table. Sessions whose send fails are logged
    //          and removed after the pass; delivery to the others is unaffected.
    // Args:
    //   frame: Serialized message.
    //   sendTimeout: Upper bound for waiting on each send. A send still pending after it is logged but the
    //                session is kept.
    // Returns:
    //   Number of sessions the frame was delivered to.
    //==========================================================================================================
    std::size_t Broadcast(const std::string& frame,
                          std::chrono::milliseconds sendTimeout = std::chrono::milliseconds(5000));

private:
    mutable std::mutex mutex_;
    std::unordered_map<const IConnection*, std::shared_ptr<Session>> byConnection_;
    std::unordered_map<std::string, std::shared_ptr<Session>> byId_;
};

} // namespace mcpws
