//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolHandler.cpp
// Purpose: JSON-RPC envelope validation, dispatch table, consent gate and pending-request cancellation
//==========================================================================================================

#include "mcpws/ProtocolHandler.h"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"
#include "mcpws/errors/Errors.h"
#include "mcpws/typed/Content.h"

namespace mcpws {

namespace {

constexpr std::chrono::milliseconds kConsentPollSlice{10};

using MethodFn = std::function<JSONValue(Session&, const JSONValue& params, const JSONRPCId& id)>;

struct MethodEntry {
    bool requiresInitialization{false};
    MethodFn fn;
};

//==========================================================================================================
// PendingRequest
// Purpose: One in-flight tool.invoke eligible for mcp.cancel.
//==========================================================================================================
struct PendingRequest {
    std::string sessionId;
    std::string toolName;
    std::shared_ptr<std::stop_source> stopSource;
    std::atomic<bool> cancelled{false};
    std::chrono::steady_clock::time_point startedAt;
};

// Invocation waiting for user.consent.response
struct ConsentWaiter {
    std::string sessionId;
    std::string toolName;
    std::promise<bool> decision;
    std::atomic<bool> resolved{false};
};

// Pending invocations are scoped to the session that started them: (sessionId, IdToString(requestId))
using PendingKey = std::pair<std::string, std::string>;

// Request id named by mcp.cancel params, in IdToString form.
std::optional<std::string> cancelTarget(const JSONValue& params) {
    const JSONValue* rid = typed::getMember(params, "requestId");
    if (rid == nullptr) {
        return std::nullopt;
    }
    if (rid->IsString()) {
        return std::get<std::string>(rid->value);
    }
    if (std::holds_alternative<int64_t>(rid->value)) {
        return std::to_string(std::get<int64_t>(rid->value));
    }
    return std::nullopt;
}

std::string newConsentId() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

// Queues the frame on the connection and waits for delivery. Used from tool threads too, so it must not
// touch ProtocolHandler state.
bool deliver(const std::shared_ptr<IConnection>& connection, const std::string& sessionId,
             const std::string& method, const std::string& frame, std::chrono::milliseconds timeout) {
    if (!connection) {
        return false;
    }
    try {
        auto fut = connection->Send(frame);
        if (fut.wait_for(timeout) != std::future_status::ready) {
            LOG_WARN("Notification {} to session {} not delivered within {} ms", method, sessionId, timeout.count());
            return false;
        }
        fut.get();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Error sending {} to session {}: {}", method, sessionId, e.what());
        return false;
    }
}

JSONValue progressParams(const JSONRPCId& requestId, double progress, const std::string& message) {
    JSONValue::Object p;
    p["requestId"] = std::make_shared<JSONValue>(IdToJSON(requestId));
    p["progress"] = std::make_shared<JSONValue>(progress);
    p["message"] = std::make_shared<JSONValue>(message);
    return JSONValue{p};
}

JSONValue streamParams(const JSONRPCId& requestId, const std::string& content, bool done) {
    JSONValue::Object p;
    p["requestId"] = std::make_shared<JSONValue>(IdToJSON(requestId));
    p["content"] = std::make_shared<JSONValue>(content);
    p["done"] = std::make_shared<JSONValue>(done);
    return JSONValue{p};
}

} // namespace

class ProtocolHandler::Impl {
public:
    ProtocolHandler& self;
    SessionManager& sessions;
    ToolRegistry& tools;
    Options options;

    std::unordered_map<std::string, MethodEntry> methods;

    mutable std::mutex pendingMutex;
    std::map<PendingKey, std::shared_ptr<PendingRequest>> pending;

    mutable std::mutex consentMutex;
    std::unordered_map<std::string, std::shared_ptr<ConsentWaiter>> consentWaiters;

    Impl(ProtocolHandler& owner, SessionManager& s, ToolRegistry& t, Options o)
        : self(owner), sessions(s), tools(t), options(std::move(o)) {
        buildMethodTable();
    }

    void buildMethodTable() {
        methods[Methods::Initialize] = MethodEntry{false, [this](Session& s, const JSONValue& p, const JSONRPCId& id) { return handleInitialize(s, p, id); }};
        methods[Methods::Ping] = MethodEntry{false, [this](Session& s, const JSONValue& p, const JSONRPCId& id) { return handlePing(s, p, id); }};
        methods[Methods::Cancel] = MethodEntry{false, [this](Session& s, const JSONValue& p, const JSONRPCId& id) { return handleCancel(s, p, id); }};
        methods[Methods::ListTools] = MethodEntry{true, [this](Session& s, const JSONValue& p, const JSONRPCId& id) { return handleToolsList(s, p, id); }};
        methods[Methods::InvokeTool] = MethodEntry{true, [this](Session& s, const JSONValue& p, const JSONRPCId& id) { return handleToolInvoke(s, p, id); }};
    }

    ////////////////////////////////////////// Methods //////////////////////////////////////////

    JSONValue handleInitialize(Session& session, const JSONValue& params, const JSONRPCId&) {
        std::string clientVersion = typed::getString(params, "protocolVersion").value_or(PROTOCOL_VERSION);
        JSONValue clientCaps{JSONValue::Object{}};
        if (const JSONValue* c = typed::getMember(params, "capabilities"); c && c->IsObject()) {
            clientCaps = *c;
        }
        std::optional<JSONValue> clientInfo;
        if (const JSONValue* ci = typed::getMember(params, "clientInfo"); ci && !ci->IsNull()) {
            clientInfo = *ci;
        }
        session.MarkInitialized(clientVersion, clientCaps, clientInfo);
        LOG_INFO("Initialized session {} with protocol version {}", session.Id(), clientVersion);

        const ServerCapabilities caps;
        JSONValue::Object capObj;
        capObj["tools"] = std::make_shared<JSONValue>(caps.tools);
        capObj["streaming"] = std::make_shared<JSONValue>(caps.streaming);
        capObj["progress"] = std::make_shared<JSONValue>(caps.progress);
        capObj["consent"] = std::make_shared<JSONValue>(caps.consent);

        JSONValue::Object info;
        info["name"] = std::make_shared<JSONValue>(options.serverInfo.name);
        info["version"] = std::make_shared<JSONValue>(options.serverInfo.version);

        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
        result["sessionId"] = std::make_shared<JSONValue>(session.Id());
        result["capabilities"] = std::make_shared<JSONValue>(JSONValue{capObj});
        result["serverInfo"] = std::make_shared<JSONValue>(JSONValue{info});
        return JSONValue{result};
    }

    JSONValue handlePing(Session&, const JSONValue& params, const JSONRPCId&) {
        JSONValue::Object result;
        result["pong"] = std::make_shared<JSONValue>(true);
        const JSONValue* ts = typed::getMember(params, "timestamp");
        result["timestamp"] = std::make_shared<JSONValue>(ts ? *ts : JSONValue(nullptr));
        return JSONValue{result};
    }

    JSONValue handleCancel(Session& session, const JSONValue& params, const JSONRPCId&) {
        const JSONValue* rid = typed::getMember(params, "requestId");
        bool cancelled = false;
        if (auto key = cancelTarget(params)) {
            cancelled = self.CancelRequest(session.Id(), key.value());
        }
        if (!cancelled) {
            LOG_DEBUG("Session {}: cancel for unknown or completed request", session.Id());
        }
        JSONValue::Object result;
        result["cancelled"] = std::make_shared<JSONValue>(cancelled);
        result["requestId"] = std::make_shared<JSONValue>(rid ? *rid : JSONValue(nullptr));
        return JSONValue{result};
    }

    JSONValue handleToolsList(Session&, const JSONValue&, const JSONRPCId&) {
        JSONValue::Array arr;
        for (const auto& t : tools.ListTools()) {
            JSONValue::Object o;
            o["name"] = std::make_shared<JSONValue>(t.name);
            o["description"] = std::make_shared<JSONValue>(t.description);
            o["inputSchema"] = std::make_shared<JSONValue>(t.inputSchema);
            arr.push_back(std::make_shared<JSONValue>(JSONValue{o}));
        }
        JSONValue::Object result;
        result["tools"] = std::make_shared<JSONValue>(JSONValue{arr});
        return JSONValue{result};
    }

    JSONValue handleToolInvoke(Session& session, const JSONValue& params, const JSONRPCId& id) {
        auto name = typed::getString(params, "name");
        if (!name.has_value() || name->empty()) {
            throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "Missing tool name");
        }
        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* a = typed::getMember(params, "arguments"); a && !a->IsNull()) {
            if (!a->IsObject()) {
                throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "Invalid params: 'arguments' must be an object");
            }
            arguments = *a;
        }

        // Track the invocation for mcp.cancel while it runs
        const PendingKey key{session.Id(), IdToString(id)};
        std::shared_ptr<PendingRequest> entry;
        if (!std::holds_alternative<std::nullptr_t>(id)) {
            entry = registerPending(key, name.value());
        }
        struct PendingGuard {
            Impl* impl; PendingKey key; std::shared_ptr<PendingRequest> entry;
            ~PendingGuard() { if (entry) impl->unregisterPending(key, entry); }
        } guard{this, key, entry};
        auto stopSrc = entry ? entry->stopSource : std::make_shared<std::stop_source>();
        auto wasCancelled = [&entry]() { return entry && entry->cancelled.load(); };

        if (!requestConsent(session, name.value(), arguments, *stopSrc)) {
            if (wasCancelled()) {
                throw errors::ToolExecutionError("Tool invocation cancelled");
            }
            throw errors::ProtocolError(JSONRPCErrorCodes::ConsentRequired, "User consent required");
        }
        if (wasCancelled()) {
            throw errors::ToolExecutionError("Tool invocation cancelled");
        }

        InvocationOptions opts;
        opts.stopSource = stopSrc;
        opts.timeout = options.toolTimeout;
        opts.requestId = id;
        {
            auto conn = session.Connection();
            auto sid = session.Id();
            auto timeout = options.notificationTimeout;
            opts.progress = [conn, sid, id, timeout](double p, const std::string& m) {
                (void)deliver(conn, sid, Notifications::ToolProgress,
                              CreateNotification(Notifications::ToolProgress, progressParams(id, p, m)), timeout);
            };
            opts.stream = [conn, sid, id, timeout](const std::string& content, bool done) {
                (void)deliver(conn, sid, Notifications::Stream,
                              CreateNotification(Notifications::Stream, streamParams(id, content, done)), timeout);
            };
        }

        JSONValue result;
        try {
            result = tools.InvokeTool(name.value(), arguments, opts);
        } catch (const errors::ProtocolError& e) {
            if (wasCancelled()) {
                throw errors::ToolExecutionError("Tool invocation cancelled");
            }
            LOG_WARN("Tool '{}' failed in session {}: {}", name.value(), session.Id(), e.what());
            throw;
        }
        if (wasCancelled()) {
            throw errors::ToolExecutionError("Tool invocation cancelled");
        }
        LOG_INFO("Tool '{}' executed for session {}", name.value(), session.Id());

        JSONValue::Array content;
        content.push_back(std::make_shared<JSONValue>(typed::makeText("Tool '" + name.value() + "' executed successfully")));
        JSONValue::Object out;
        out["content"] = std::make_shared<JSONValue>(JSONValue{content});
        out["result"] = std::make_shared<JSONValue>(std::move(result));
        out["isError"] = std::make_shared<JSONValue>(false);
        return JSONValue{out};
    }

    ////////////////////////////////////////// Consent //////////////////////////////////////////

    bool requestConsent(Session& session, const std::string& toolName, const JSONValue& arguments,
                        const std::stop_source& stopSrc) {
        const std::string consentId = newConsentId();
        JSONValue::Object p;
        p["tool"] = std::make_shared<JSONValue>(toolName);
        p["arguments"] = std::make_shared<JSONValue>(arguments);
        p["message"] = std::make_shared<JSONValue>(
            "Do you want to execute tool '" + toolName + "' with the provided arguments?");
        p["consentId"] = std::make_shared<JSONValue>(consentId);

        std::shared_ptr<ConsentWaiter> waiter;
        std::future<bool> decision;
        if (options.consentMode == ConsentMode::Explicit) {
            waiter = std::make_shared<ConsentWaiter>();
            waiter->sessionId = session.Id();
            waiter->toolName = toolName;
            decision = waiter->decision.get_future();
            std::lock_guard<std::mutex> lk(consentMutex);
            consentWaiters[consentId] = waiter;
        }

        if (!self.SendNotification(session, Notifications::UserConsent, JSONValue{p})) {
            LOG_ERROR("Error requesting consent for tool {} in session {}", toolName, session.Id());
            dropConsentWaiter(consentId);
            return false;
        }

        if (options.consentMode == ConsentMode::Delivery) {
            LOG_INFO("Consent requested for tool {} in session {}", toolName, session.Id());
            return true;
        }

        LOG_INFO("Awaiting consent {} for tool {} in session {}", consentId, toolName, session.Id());
        const auto deadline = std::chrono::steady_clock::now() + options.consentTimeout;
        bool granted = false;
        for (;;) {
            if (decision.wait_for(kConsentPollSlice) == std::future_status::ready) {
                granted = decision.get();
                break;
            }
            if (stopSrc.stop_requested()) {
                LOG_INFO("Consent {} abandoned: invocation cancelled", consentId);
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                LOG_WARN("Consent {} for tool {} timed out after {} ms", consentId, toolName, options.consentTimeout.count());
                break;
            }
        }
        dropConsentWaiter(consentId);
        if (granted) {
            LOG_INFO("Consent granted for tool {} in session {}", toolName, session.Id());
        } else {
            LOG_INFO("Consent denied for tool {} in session {}", toolName, session.Id());
        }
        return granted;
    }

    void dropConsentWaiter(const std::string& consentId) {
        std::lock_guard<std::mutex> lk(consentMutex);
        consentWaiters.erase(consentId);
    }

    void resolveConsent(const std::shared_ptr<IConnection>& connection, const std::optional<JSONValue>& params) {
        const JSONValue p = params.value_or(JSONValue{JSONValue::Object{}});
        auto consentId = typed::getString(p, "consentId");
        auto granted = typed::getBool(p, "granted");
        if (!consentId.has_value() || !granted.has_value()) {
            LOG_WARN("Ignoring malformed {} notification", Notifications::ConsentResponse);
            return;
        }
        auto session = sessions.GetSession(connection);
        std::shared_ptr<ConsentWaiter> waiter;
        {
            std::lock_guard<std::mutex> lk(consentMutex);
            auto it = consentWaiters.find(consentId.value());
            if (it == consentWaiters.end()) {
                LOG_WARN("Consent response for unknown or expired consent {}", consentId.value());
                return;
            }
            if (!session || it->second->sessionId != session->Id()) {
                LOG_WARN("Consent response for {} from a different session ignored", consentId.value());
                return;
            }
            waiter = it->second;
            consentWaiters.erase(it);
        }
        if (!waiter->resolved.exchange(true)) {
            waiter->decision.set_value(granted.value());
        }
    }

    ////////////////////////////////////////// Pending requests //////////////////////////////////////////

    std::shared_ptr<PendingRequest> registerPending(const PendingKey& key, const std::string& toolName) {
        auto entry = std::make_shared<PendingRequest>();
        entry->sessionId = key.first;
        entry->toolName = toolName;
        entry->stopSource = std::make_shared<std::stop_source>();
        entry->startedAt = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lk(pendingMutex);
        if (!pending.emplace(key, entry).second) {
            LOG_WARN("Request id {} is already in flight in session {}; second invocation is not cancellable",
                     key.second, key.first);
            return nullptr;
        }
        return entry;
    }

    bool hasPending(const PendingKey& key) const {
        std::lock_guard<std::mutex> lk(pendingMutex);
        return pending.count(key) != 0;
    }

    void unregisterPending(const PendingKey& key, const std::shared_ptr<PendingRequest>& entry) {
        std::lock_guard<std::mutex> lk(pendingMutex);
        auto it = pending.find(key);
        if (it != pending.end() && it->second == entry) {
            pending.erase(it);
        }
    }

    ////////////////////////////////////////// Client notifications //////////////////////////////////////////

    void handleNotification(const std::shared_ptr<IConnection>& connection, const ParsedMessage& msg) {
        if (msg.method == Notifications::ConsentResponse) {
            resolveConsent(connection, msg.params);
            return;
        }
        auto it = methods.find(msg.method);
        if (it == methods.end()) {
            LOG_DEBUG("Ignoring unknown notification {}", msg.method);
            return;
        }
        auto session = sessions.GetSession(connection);
        if (!session) {
            LOG_WARN("Notification {} from connection without session", msg.method);
            return;
        }
        try {
            (void)self.Dispatch(*session, msg);
        } catch (const std::exception& e) {
            LOG_WARN("Notification {} failed in session {}: {}", msg.method, session->Id(), e.what());
        } catch (...) {
            LOG_ERROR("Notification {} failed in session {} with a non-standard exception", msg.method, session->Id());
        }
    }
};

ProtocolHandler::ProtocolHandler(SessionManager& sessions, ToolRegistry& tools, Options options)
    : pImpl(std::make_unique<Impl>(*this, sessions, tools, std::move(options))) {}

ProtocolHandler::ProtocolHandler(SessionManager& sessions, ToolRegistry& tools)
    : ProtocolHandler(sessions, tools, Options{}) {}

ProtocolHandler::~ProtocolHandler() = default;

ProtocolHandler::ParsedMessage ProtocolHandler::ParseMessage(const std::string& frame) {
    JSONValue doc;
    try {
        doc = ParseJSON(frame);
    } catch (const JSONParseError& e) {
        throw errors::ProtocolError(JSONRPCErrorCodes::ParseError, "Parse error", JSONValue(std::string(e.what())));
    }
    if (!doc.IsObject()) {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
    }
    auto version = typed::getString(doc, "jsonrpc");
    if (!version.has_value() || version.value() != "2.0") {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidRequest, "Invalid JSON-RPC version");
    }
    auto method = typed::getString(doc, "method");
    if (!method.has_value()) {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidRequest, "Missing method");
    }

    ParsedMessage msg;
    msg.method = method.value();
    const auto& obj = std::get<JSONValue::Object>(doc.value);
    auto idIt = obj.find("id");
    if (idIt == obj.end()) {
        msg.isNotification = true;
    } else {
        const JSONValue& idv = idIt->second ? *idIt->second : JSONValue(nullptr);
        if (std::holds_alternative<std::string>(idv.value)) {
            msg.id = std::get<std::string>(idv.value);
        } else if (std::holds_alternative<int64_t>(idv.value)) {
            msg.id = std::get<int64_t>(idv.value);
        } else if (idv.IsNull()) {
            msg.id = nullptr;
        } else {
            throw errors::ProtocolError(JSONRPCErrorCodes::InvalidRequest, "Invalid request id");
        }
    }
    if (const JSONValue* p = typed::getMember(doc, "params")) {
        msg.params = *p;
    }
    return msg;
}

std::optional<std::string> ProtocolHandler::HandleMessage(const std::shared_ptr<IConnection>& connection,
                                                          const std::string& frame) {
    FUNC_SCOPE();
    ParsedMessage msg;
    try {
        msg = ParseMessage(frame);
    } catch (const errors::ProtocolError& e) {
        LOG_WARN("Rejected frame from {}: {}", connection ? connection->GetRemoteAddress() : std::string("?"), e.what());
        return CreateError(nullptr, e.Code(), e.what(), e.Data());
    }

    if (msg.isNotification) {
        pImpl->handleNotification(connection, msg);
        return std::nullopt;
    }

    auto session = pImpl->sessions.GetSession(connection);
    if (!session) {
        return CreateError(msg.id, JSONRPCErrorCodes::InternalError, "Session not found");
    }

    try {
        JSONValue result = Dispatch(*session, msg);
        return CreateResponse(msg.id, result);
    } catch (const errors::ProtocolError& e) {
        LOG_DEBUG("Request {} ({}) failed with {}: {}", IdToString(msg.id), msg.method, e.Code(), e.what());
        return CreateError(msg.id, e.Code(), e.what(), e.Data());
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error handling {} in session {}: {}", msg.method, session->Id(), e.what());
        return CreateError(msg.id, JSONRPCErrorCodes::InternalError, "Internal server error");
    } catch (...) {
        LOG_ERROR("Non-standard exception handling {} in session {}", msg.method, session->Id());
        return CreateError(msg.id, JSONRPCErrorCodes::InternalError, "Internal server error");
    }
}

ProtocolHandler::OutOfBand ProtocolHandler::HandleOutOfBand(const std::shared_ptr<IConnection>& connection,
                                                            const std::string& frame) {
    OutOfBand out;
    if (frame.find(Notifications::ConsentResponse) == std::string::npos &&
        frame.find(Methods::Cancel) == std::string::npos) {
        return out;
    }
    ParsedMessage msg;
    try {
        msg = ParseMessage(frame);
    } catch (const errors::ProtocolError&) {
        // Left for the in-order path, which reports the error
        return out;
    }

    if (msg.isNotification && msg.method == Notifications::ConsentResponse) {
        pImpl->resolveConsent(connection, msg.params);
        out.consumed = true;
        return out;
    }

    // mcp.cancel jumps the queue only when it targets an invocation this session is running;
    // anything else keeps its place in arrival order.
    if (msg.isNotification || msg.method != Methods::Cancel || !msg.params.has_value()) {
        return out;
    }
    auto session = pImpl->sessions.GetSession(connection);
    auto key = cancelTarget(msg.params.value());
    if (!session || !key.has_value() || !pImpl->hasPending(PendingKey{session->Id(), key.value()})) {
        return out;
    }
    out.consumed = true;
    out.reply = HandleMessage(connection, frame);
    return out;
}

JSONValue ProtocolHandler::Dispatch(Session& session, const ParsedMessage& message) {
    auto it = pImpl->methods.find(message.method);
    if (it == pImpl->methods.end()) {
        throw errors::ProtocolError(JSONRPCErrorCodes::MethodNotFound, "Method '" + message.method + "' not found");
    }
    JSONValue params{JSONValue::Object{}};
    if (message.params.has_value() && !message.params->IsNull()) {
        if (!message.params->IsObject()) {
            throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "Invalid params: expected an object");
        }
        params = message.params.value();
    }
    if (it->second.requiresInitialization && !session.IsInitialized()) {
        throw errors::ProtocolError(JSONRPCErrorCodes::SessionNotInitialized, "Session not initialized");
    }
    return it->second.fn(session, params, message.id);
}

bool ProtocolHandler::CancelRequest(const std::string& sessionId, const std::string& requestKey) {
    std::shared_ptr<PendingRequest> entry;
    {
        std::lock_guard<std::mutex> lk(pImpl->pendingMutex);
        auto it = pImpl->pending.find(PendingKey{sessionId, requestKey});
        if (it == pImpl->pending.end()) {
            return false;
        }
        entry = it->second;
        pImpl->pending.erase(it);
    }
    entry->cancelled.store(true);
    entry->stopSource->request_stop();
    const auto ranMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - entry->startedAt).count();
    LOG_INFO("Cancelled request {} (tool '{}', session {}) after {} ms", requestKey, entry->toolName, sessionId, ranMs);
    return true;
}

std::size_t ProtocolHandler::CancelAll() {
    std::map<PendingKey, std::shared_ptr<PendingRequest>> all;
    {
        std::lock_guard<std::mutex> lk(pImpl->pendingMutex);
        all.swap(pImpl->pending);
    }
    for (const auto& [key, entry] : all) {
        entry->cancelled.store(true);
        entry->stopSource->request_stop();
        LOG_INFO("Cancelled request {} (tool '{}', session {}) at shutdown", key.second, entry->toolName, key.first);
    }
    return all.size();
}

std::size_t ProtocolHandler::PendingCount() const {
    std::lock_guard<std::mutex> lk(pImpl->pendingMutex);
    return pImpl->pending.size();
}

std::size_t ProtocolHandler::PendingConsentCount() const {
    std::lock_guard<std::mutex> lk(pImpl->consentMutex);
    return pImpl->consentWaiters.size();
}

bool ProtocolHandler::SendNotification(const Session& session, const std::string& method, const JSONValue& params) {
    return deliver(session.Connection(), session.Id(), method, CreateNotification(method, params),
                   pImpl->options.notificationTimeout);
}

bool ProtocolHandler::SendProgress(const Session& session, const JSONRPCId& requestId, double progress,
                                   const std::string& message) {
    return SendNotification(session, Notifications::ToolProgress, progressParams(requestId, progress, message));
}

bool ProtocolHandler::SendStream(const Session& session, const JSONRPCId& requestId, const std::string& content,
                                 bool done) {
    return SendNotification(session, Notifications::Stream, streamParams(requestId, content, done));
}

std::vector<std::string> ProtocolHandler::MethodNames() const {
    std::vector<std::string> out;
    out.reserve(pImpl->methods.size());
    for (const auto& [name, entry] : pImpl->methods) {
        out.push_back(name);
    }
    return out;
}

const ProtocolHandler::Options& ProtocolHandler::GetOptions() const {
    return pImpl->options;
}

std::string ProtocolHandler::CreateResponse(const JSONRPCId& id, const JSONValue& result) {
    JSONRPCResponse resp(id, result);
    return resp.Serialize();
}

std::string ProtocolHandler::CreateNotification(const std::string& method, const JSONValue& params) {
    JSONRPCNotification note(method, params);
    return note.Serialize();
}

std::string ProtocolHandler::CreateError(const JSONRPCId& id, int code, const std::string& message,
                                         const std::optional<JSONValue>& data) {
    return CreateErrorResponse(id, code, message, data)->Serialize();
}

} // namespace mcpws
