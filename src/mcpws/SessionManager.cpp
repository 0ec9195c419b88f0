//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.cpp
// Purpose: Session lifecycle, lookups and broadcast
//==========================================================================================================

#include "mcpws/SessionManager.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"
#include "mcpws/Protocol.h"

namespace mcpws {

namespace {
std::string newSessionId() {
    // random_generator is not thread-safe; one per thread
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}
}

////////////////////////////////////////// Session //////////////////////////////////////////

Session::Session(std::string id, std::shared_ptr<IConnection> connection)
    : id_(std::move(id)),
      connection_(std::move(connection)),
      createdAt_(std::chrono::system_clock::now()),
      protocolVersion_(PROTOCOL_VERSION),
      clientCapabilities_(JSONValue::Object{}) {}

bool Session::IsInitialized() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return initialized_;
}

void Session::MarkInitialized(const std::string& protocolVersion, const JSONValue& clientCapabilities,
                              const std::optional<JSONValue>& clientInfo) {
    std::lock_guard<std::mutex> lk(mutex_);
    protocolVersion_ = protocolVersion;
    clientCapabilities_ = clientCapabilities;
    clientInfo_ = clientInfo;
    initialized_ = true;
}

std::string Session::ProtocolVersion() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return protocolVersion_;
}

JSONValue Session::ClientCapabilities() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return clientCapabilities_;
}

std::optional<JSONValue> Session::ClientInfo() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return clientInfo_;
}

void Session::SetContext(const std::string& key, const JSONValue& value) {
    std::lock_guard<std::mutex> lk(mutex_);
    context_[key] = value;
}

std::optional<JSONValue> Session::GetContext(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = context_.find(key);
    if (it == context_.end()) return std::nullopt;
    return it->second;
}

std::unordered_map<std::string, JSONValue> Session::ContextSnapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return context_;
}

////////////////////////////////////////// SessionManager //////////////////////////////////////////

SessionManager::SessionManager() = default;

SessionManager::~SessionManager() = default;

std::shared_ptr<Session> SessionManager::CreateSession(const std::shared_ptr<IConnection>& connection) {
    auto session = std::make_shared<Session>(newSessionId(), connection);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto existing = byConnection_.find(connection.get());
        if (existing != byConnection_.end()) {
            byId_.erase(existing->second->Id());
            LOG_WARN("Connection {} already had session {}; replacing", connection->GetRemoteAddress(), existing->second->Id());
        }
        byConnection_[connection.get()] = session;
        byId_[session->Id()] = session;
    }
    LOG_INFO("Created session {} for {}", session->Id(), connection->GetRemoteAddress());
    return session;
}

std::shared_ptr<Session> SessionManager::GetSession(const IConnection* connection) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = byConnection_.find(connection);
    return it == byConnection_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionManager::GetSession(const std::shared_ptr<IConnection>& connection) const {
    return GetSession(connection.get());
}

std::shared_ptr<Session> SessionManager::GetSessionById(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = byId_.find(sessionId);
    return it == byId_.end() ? nullptr : it->second;
}

void SessionManager::RemoveSession(const IConnection* connection) {
    std::shared_ptr<Session> removed;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = byConnection_.find(connection);
        if (it == byConnection_.end()) {
            return;
        }
        removed = it->second;
        byId_.erase(removed->Id());
        byConnection_.erase(it);
    }
    LOG_INFO("Removed session {}", removed->Id());
}

void SessionManager::RemoveSession(const std::shared_ptr<IConnection>& connection) {
    RemoveSession(connection.get());
}

void SessionManager::UpdateContext(const std::string& sessionId, const std::string& key, const JSONValue& value) {
    auto session = GetSessionById(sessionId);
    if (!session) {
        LOG_DEBUG("UpdateContext ignored for unknown session {}", sessionId);
        return;
    }
    session->SetContext(key, value);
}

std::vector<std::shared_ptr<Session>> SessionManager::GetActiveSessions() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(byId_.size());
    for (const auto& [id, session] : byId_) {
        out.push_back(session);
    }
    return out;
}

std::size_t SessionManager::SessionCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return byId_.size();
}

std::size_t SessionManager::Broadcast(const std::string& frame, std::chrono::milliseconds sendTimeout) {
    auto snapshot = GetActiveSessions();

    std::vector<std::pair<std::shared_ptr<Session>, std::future<void>>> inflight;
    std::vector<std::shared_ptr<Session>> failed;
    inflight.reserve(snapshot.size());
    for (const auto& session : snapshot) {
        try {
            inflight.emplace_back(session, session->Connection()->Send(frame));
        } catch (const std::exception& e) {
            LOG_WARN("Broadcast to session {} failed: {}", session->Id(), e.what());
            failed.push_back(session);
        }
    }

    std::size_t delivered = 0;
    for (auto& [session, fut] : inflight) {
        if (fut.wait_for(sendTimeout) != std::future_status::ready) {
            LOG_WARN("Broadcast to session {} still pending after {} ms", session->Id(), sendTimeout.count());
            continue;
        }
        try {
            fut.get();
            ++delivered;
        } catch (const std::exception& e) {
            LOG_WARN("Broadcast to session {} failed: {}", session->Id(), e.what());
            failed.push_back(session);
        }
    }

    for (const auto& session : failed) {
        RemoveSession(session->Connection().get());
    }
    LOG_DEBUG("Broadcast delivered to {} of {} sessions", delivered, snapshot.size());
    return delivered;
}

} // namespace mcpws
