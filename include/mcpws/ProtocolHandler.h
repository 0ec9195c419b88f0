//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolHandler.h
// Purpose: JSON-RPC framing/validation, session state machine, method dispatch, consent and cancellation
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpws/Connection.h"
#include "mcpws/Protocol.h"
#include "mcpws/SessionManager.h"
#include "mcpws/ToolRegistry.h"

namespace mcpws {

//==========================================================================================================
// ConsentMode
// Purpose: How tool.invoke obtains consent after pushing user.consent.
//   Delivery: consent is granted once the notification was delivered (denied if delivery fails).
//   Explicit: the invocation waits for a correlated user.consent.response; no reply before the consent
//             timeout is a denial.
//==========================================================================================================
enum class ConsentMode {
    Delivery = 0,
    Explicit = 1,
};

inline const char* toString(ConsentMode mode) {
    switch (mode) {
        case ConsentMode::Explicit: return "explicit";
        case ConsentMode::Delivery:
        default: return "delivery";
    }
}

// Accepts "delivery"/"explicit" (case-sensitive); std::nullopt for anything else.
inline std::optional<ConsentMode> parseConsentMode(const std::string& s) {
    if (s == "delivery") return ConsentMode::Delivery;
    if (s == "explicit") return ConsentMode::Explicit;
    return std::nullopt;
}

class ProtocolHandler {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   serverInfo: Reported as serverInfo by mcp.initialize.
    //   consentMode/consentTimeout: See ConsentMode.
    //   toolTimeout: Optional upper bound for a single tool invocation (disabled when unset).
    //   notificationTimeout: Upper bound for waiting on delivery of one notification.
    //==========================================================================================================
    struct Options {
        Implementation serverInfo{SERVER_NAME, SERVER_VERSION};
        ConsentMode consentMode{ConsentMode::Delivery};
        std::chrono::milliseconds consentTimeout{30000};
        std::optional<std::chrono::milliseconds> toolTimeout;
        std::chrono::milliseconds notificationTimeout{10000};
    };

    //==========================================================================================================
    // ParsedMessage
    // Purpose: Result of ParseMessage. A frame without an "id" member is a notification; an explicit
    //          "id": null is a request whose response carries a null id.
    //==========================================================================================================
    struct ParsedMessage {
        bool isNotification{false};
        JSONRPCId id{nullptr};
        std::string method;
        std::optional<JSONValue> params;
    };

    ProtocolHandler(SessionManager& sessions, ToolRegistry& tools, Options options);
    ProtocolHandler(SessionManager& sessions, ToolRegistry& tools);
    ~ProtocolHandler();

    ProtocolHandler(const ProtocolHandler&) = delete;
    ProtocolHandler& operator=(const ProtocolHandler&) = delete;

    //==========================================================================================================
    // ParseMessage
    // Purpose: Decodes and validates one frame.
    // Throws:
    //   errors::ProtocolError with ParseError (malformed JSON) or InvalidRequest (wrong envelope).
    //==========================================================================================================
    static ParsedMessage ParseMessage(const std::string& frame);

    //==========================================================================================================
    // HandleMessage
    // Purpose: Full processing of one inbound frame for the given connection.
    // Returns:
    //   The serialized response for requests (success or error); std::nullopt for notifications.
    // Notes:
    //   Never throws; every failure becomes an error response (or a log line for notifications).
    //==========================================================================================================
    std::optional<std::string> HandleMessage(const std::shared_ptr<IConnection>& connection, const std::string& frame);

    //==========================================================================================================
    // OutOfBand
    // Purpose: Result of HandleOutOfBand. A consumed frame must not be queued for the dispatch worker; reply,
    //          when set, is the response to send right away.
    //==========================================================================================================
    struct OutOfBand {
        bool consumed{false};
        std::optional<std::string> reply;
    };

    //==========================================================================================================
    // HandleOutOfBand
    // Purpose: Lets the connection reader act on frames while the dispatch worker is blocked in tool.invoke:
    //          user.consent.response notifications, and mcp.cancel requests naming an invocation that the
    //          same session is running. Every other frame is left for HandleMessage.
    //==========================================================================================================
    OutOfBand HandleOutOfBand(const std::shared_ptr<IConnection>& connection, const std::string& frame);

    //==========================================================================================================
    // Dispatch
    // Purpose: Routes a parsed request through the method table with the session state checks applied.
    // Returns:
    //   The result value for the response.
    // Throws:
    //   errors::ProtocolError for protocol-level failures; other exceptions for unexpected faults.
    //==========================================================================================================
    JSONValue Dispatch(Session& session, const ParsedMessage& message);

    //==========================================================================================================
    // CancelRequest
    // Purpose: Cancels the pending tool invocation that session sessionId registered under requestKey
    //          (IdToString of the client id). Other sessions' invocations are never matched.
    // Returns:
    //   true when an in-flight invocation was found and cancelled.
    //==========================================================================================================
    bool CancelRequest(const std::string& sessionId, const std::string& requestKey);

    // Cancels every pending invocation (server shutdown). Returns the number cancelled.
    std::size_t CancelAll();

    // Number of in-flight tool invocations.
    std::size_t PendingCount() const;

    // Number of invocations currently waiting for an explicit consent reply.
    std::size_t PendingConsentCount() const;

    //==========================================================================================================
    // Notification helpers
    // Purpose: Push a notification to the session's connection and wait for delivery. Failures are logged
    //          and reported through the return value only.
    //==========================================================================================================
    bool SendNotification(const Session& session, const std::string& method, const JSONValue& params);
    bool SendProgress(const Session& session, const JSONRPCId& requestId, double progress, const std::string& message);
    bool SendStream(const Session& session, const JSONRPCId& requestId, const std::string& content, bool done);

    // Names in the dispatch table
    std::vector<std::string> MethodNames() const;

    const Options& GetOptions() const;

    ////////////////////////////////////////// Frame builders //////////////////////////////////////////
    static std::string CreateResponse(const JSONRPCId& id, const JSONValue& result);
    static std::string CreateNotification(const std::string& method, const JSONValue& params);
    static std::string CreateError(const JSONRPCId& id, int code, const std::string& message,
                                   const std::optional<JSONValue>& data = std::nullopt);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpws
