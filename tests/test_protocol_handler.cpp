//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_protocol_handler.cpp
// Purpose: GoogleTests for envelope parsing, session state, dispatch, consent, cancellation and notifications
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpws/InMemoryConnection.hpp"
#include "mcpws/ProtocolHandler.h"
#include "mcpws/SessionManager.h"
#include "mcpws/ToolRegistry.h"
#include "mcpws/errors/Errors.h"
#include "mcpws/typed/Content.h"
#include <functional>
#include <future>
#include <thread>

using namespace mcpws;

namespace {

const char* kInitialize = R"({"jsonrpc":"2.0","id":1,"method":"mcp.initialize","params":{"protocolVersion":"2024-11-05","clientInfo":{"name":"t","version":"1"}}})";

int errorCode(const JSONValue& resp) {
    const JSONValue* err = typed::getMember(resp, "error");
    if (err == nullptr) return 0;
    return static_cast<int>(typed::getInt(*err, "code").value_or(0));
}

std::string errorMessage(const JSONValue& resp) {
    const JSONValue* err = typed::getMember(resp, "error");
    if (err == nullptr) return std::string();
    return typed::getString(*err, "message").value_or("");
}

const JSONValue& result(const JSONValue& resp) {
    static const JSONValue empty{JSONValue::Object{}};
    const JSONValue* r = typed::getMember(resp, "result");
    return r != nullptr ? *r : empty;
}

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace

class ProtocolHandlerTest : public ::testing::Test {
protected:
    SessionManager sessions;
    ToolRegistry tools;
    std::shared_ptr<InMemoryConnection> conn;
    std::unique_ptr<ProtocolHandler> handler;

    void SetUp() override {
        tools.RegisterTool("echo", "Echo a message",
            ParseJSON(R"({"type":"object","properties":{"message":{"type":"string","minLength":1}},"required":["message"],"additionalProperties":false})"),
            [](const JSONValue& args, const ToolCallContext&) -> std::future<JSONValue> {
                return std::async(std::launch::async, [args]() {
                    JSONValue::Object o;
                    o["echo"] = std::make_shared<JSONValue>(typed::getString(args, "message").value_or(""));
                    return JSONValue{o};
                });
            });
        tools.RegisterTool("wait_for_stop", "Runs until cancelled", ParseJSON(R"({"type":"object"})"),
            [](const JSONValue&, const ToolCallContext& ctx) -> std::future<JSONValue> {
                return std::async(std::launch::async, [ctx]() {
                    for (int i = 0; i < 1000 && !ctx.StopRequested(); ++i) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(5));
                    }
                    return JSONValue{JSONValue::Object{}};
                });
            });
        tools.RegisterTool("reporter", "Emits progress and stream chunks", ParseJSON(R"({"type":"object"})"),
            [](const JSONValue&, const ToolCallContext& ctx) -> std::future<JSONValue> {
                return std::async(std::launch::async, [ctx]() {
                    ctx.ReportProgress(0.5, "halfway");
                    ctx.EmitStream("Hello", false);
                    ctx.EmitStream(" world", false);
                    ctx.EmitStream("", true);
                    ctx.ReportProgress(1.0, "done");
                    return JSONValue(std::string("Hello world"));
                });
            });
        conn = std::make_shared<InMemoryConnection>("test-peer");
        sessions.CreateSession(conn);
        handler = std::make_unique<ProtocolHandler>(sessions, tools);
    }

    void TearDown() override {
        handler.reset();
    }

    void useOptions(ProtocolHandler::Options opts) {
        handler = std::make_unique<ProtocolHandler>(sessions, tools, std::move(opts));
    }

    JSONValue send(const std::string& frame, const std::shared_ptr<InMemoryConnection>& on = nullptr) {
        auto out = handler->HandleMessage(on ? on : conn, frame);
        EXPECT_TRUE(out.has_value()) << "no response for " << frame;
        return out.has_value() ? ParseJSON(out.value()) : JSONValue{};
    }

    void initialize(const std::shared_ptr<InMemoryConnection>& on = nullptr) {
        auto resp = send(kInitialize, on);
        ASSERT_EQ(errorCode(resp), 0) << SerializeJSON(resp);
    }

    std::vector<JSONValue> framesWithMethod(const std::string& method) {
        std::vector<JSONValue> out;
        for (const auto& f : conn->SentFrames()) {
            auto v = ParseJSON(f);
            if (typed::getString(v, "method").value_or("") == method) out.push_back(v);
        }
        return out;
    }
};

////////////////////////////////////////// Envelope parsing //////////////////////////////////////////

TEST_F(ProtocolHandlerTest, MalformedJsonIsParseErrorWithNullId) {
    auto resp = send("{bad json");
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::ParseError);
    EXPECT_EQ(errorMessage(resp), "Parse error");
    ASSERT_NE(typed::getMember(resp, "id"), nullptr);
    EXPECT_TRUE(typed::getMember(resp, "id")->IsNull());
    const JSONValue* err = typed::getMember(resp, "error");
    ASSERT_NE(typed::getMember(*err, "data"), nullptr);
}

TEST_F(ProtocolHandlerTest, InvalidEnvelopes) {
    EXPECT_EQ(errorCode(send("[1,2]")), JSONRPCErrorCodes::InvalidRequest);
    auto wrongVersion = send(R"({"jsonrpc":"1.0","id":1,"method":"mcp.ping"})");
    EXPECT_EQ(errorCode(wrongVersion), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(errorMessage(wrongVersion), "Invalid JSON-RPC version");
    auto noMethod = send(R"({"jsonrpc":"2.0","id":1})");
    EXPECT_EQ(errorMessage(noMethod), "Missing method");
    auto badId = send(R"({"jsonrpc":"2.0","id":{"x":1},"method":"mcp.ping"})");
    EXPECT_EQ(errorCode(badId), JSONRPCErrorCodes::InvalidRequest);
}

TEST(ProtocolHandlerParse, DistinguishesNotificationsFromNullIds) {
    auto note = ProtocolHandler::ParseMessage(R"({"jsonrpc":"2.0","method":"mcp.ping"})");
    EXPECT_TRUE(note.isNotification);
    auto nullId = ProtocolHandler::ParseMessage(R"({"jsonrpc":"2.0","id":null,"method":"mcp.ping"})");
    EXPECT_FALSE(nullId.isNotification);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(nullId.id));
    auto strId = ProtocolHandler::ParseMessage(R"({"jsonrpc":"2.0","id":"abc","method":"x","params":{"a":1}})");
    EXPECT_EQ(std::get<std::string>(strId.id), "abc");
    ASSERT_TRUE(strId.params.has_value());
    EXPECT_THROW(ProtocolHandler::ParseMessage("nope"), errors::ProtocolError);
}

////////////////////////////////////////// Session state //////////////////////////////////////////

TEST_F(ProtocolHandlerTest, InitializeReturnsSessionAndCapabilities) {
    auto resp = send(kInitialize);
    EXPECT_EQ(typed::getInt(resp, "id").value_or(0), 1);
    const JSONValue& r = result(resp);
    EXPECT_EQ(typed::getString(r, "protocolVersion").value_or(""), "2024-11-05");
    EXPECT_EQ(typed::getString(r, "sessionId").value_or(""), sessions.GetSession(conn)->Id());
    const JSONValue* caps = typed::getMember(r, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_TRUE(typed::getBool(*caps, "tools").value_or(false));
    EXPECT_TRUE(typed::getBool(*caps, "streaming").value_or(false));
    const JSONValue* info = typed::getMember(r, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(typed::getString(*info, "name").value_or(""), "MCP Demo Server");
    EXPECT_TRUE(sessions.GetSession(conn)->IsInitialized());
}

TEST_F(ProtocolHandlerTest, ReinitializeIsAllowed) {
    initialize();
    auto again = send(kInitialize);
    EXPECT_EQ(errorCode(again), 0);
}

TEST_F(ProtocolHandlerTest, ToolMethodsRequireInitialization) {
    auto list = send(R"({"jsonrpc":"2.0","id":2,"method":"tools.list"})");
    EXPECT_EQ(errorCode(list), JSONRPCErrorCodes::SessionNotInitialized);
    EXPECT_EQ(errorMessage(list), "Session not initialized");
    auto invoke = send(R"({"jsonrpc":"2.0","id":3,"method":"tool.invoke","params":{"name":"echo","arguments":{"message":"x"}}})");
    EXPECT_EQ(errorCode(invoke), JSONRPCErrorCodes::SessionNotInitialized);
    EXPECT_TRUE(conn->SentFrames().empty());
}

TEST_F(ProtocolHandlerTest, PingWorksBeforeInitialization) {
    auto resp = send(R"({"jsonrpc":"2.0","id":"p","method":"mcp.ping","params":{"timestamp":12345}})");
    EXPECT_EQ(std::get<std::string>(typed::getMember(resp, "id")->value), "p");
    EXPECT_TRUE(typed::getBool(result(resp), "pong").value_or(false));
    EXPECT_EQ(typed::getInt(result(resp), "timestamp").value_or(0), 12345);

    auto bare = send(R"({"jsonrpc":"2.0","id":2,"method":"mcp.ping"})");
    EXPECT_TRUE(typed::getMember(result(bare), "timestamp")->IsNull());
}

TEST_F(ProtocolHandlerTest, UnknownConnectionHasNoSession) {
    auto stranger = std::make_shared<InMemoryConnection>("stranger");
    auto resp = send(R"({"jsonrpc":"2.0","id":1,"method":"mcp.ping"})", stranger);
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(resp), "Session not found");
}

////////////////////////////////////////// Dispatch //////////////////////////////////////////

TEST_F(ProtocolHandlerTest, UnknownMethod) {
    initialize();
    auto resp = send(R"({"jsonrpc":"2.0","id":9,"method":"does.not.exist"})");
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorMessage(resp), "Method 'does.not.exist' not found");
    EXPECT_EQ(typed::getInt(resp, "id").value_or(0), 9);
}

TEST_F(ProtocolHandlerTest, NonObjectParamsAreInvalid) {
    initialize();
    auto resp = send(R"({"jsonrpc":"2.0","id":4,"method":"tools.list","params":[1]})");
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::InvalidParams);
    auto nullParams = send(R"({"jsonrpc":"2.0","id":5,"method":"tools.list","params":null})");
    EXPECT_EQ(errorCode(nullParams), 0);
}

TEST_F(ProtocolHandlerTest, ToolsListDescribesRegisteredTools) {
    initialize();
    auto resp = send(R"({"jsonrpc":"2.0","id":2,"method":"tools.list"})");
    const JSONValue* list = typed::getMember(result(resp), "tools");
    ASSERT_NE(list, nullptr);
    const auto& arr = std::get<JSONValue::Array>(list->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(typed::getString(*arr[0], "name").value_or(""), "echo");
    EXPECT_EQ(typed::getString(*arr[0], "description").value_or(""), "Echo a message");
    ASSERT_NE(typed::getMember(*arr[0], "inputSchema"), nullptr);
    EXPECT_EQ(typed::getString(*typed::getMember(*arr[0], "inputSchema"), "type").value_or(""), "object");
}

TEST_F(ProtocolHandlerTest, InvokeSuccessShapeAndConsentNotification) {
    initialize();
    auto resp = send(R"({"jsonrpc":"2.0","id":3,"method":"tool.invoke","params":{"name":"echo","arguments":{"message":"hi"}}})");
    ASSERT_EQ(errorCode(resp), 0) << SerializeJSON(resp);
    const JSONValue& r = result(resp);
    EXPECT_FALSE(typed::getBool(r, "isError").value_or(true));
    const auto& content = std::get<JSONValue::Array>(typed::getMember(r, "content")->value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(typed::getText(*content[0]).value_or(""), "Tool 'echo' executed successfully");
    EXPECT_EQ(typed::getString(*typed::getMember(r, "result"), "echo").value_or(""), "hi");

    auto consent = framesWithMethod("user.consent");
    ASSERT_EQ(consent.size(), 1u);
    const JSONValue* p = typed::getMember(consent[0], "params");
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(typed::getString(*p, "tool").value_or(""), "echo");
    EXPECT_EQ(typed::getString(*p, "message").value_or(""),
              "Do you want to execute tool 'echo' with the provided arguments?");
    EXPECT_EQ(typed::getString(*typed::getMember(*p, "arguments"), "message").value_or(""), "hi");
    EXPECT_TRUE(typed::getString(*p, "consentId").has_value());
}

TEST_F(ProtocolHandlerTest, InvokeParameterErrors) {
    initialize();
    auto noName = send(R"({"jsonrpc":"2.0","id":1,"method":"tool.invoke","params":{"arguments":{}}})");
    EXPECT_EQ(errorCode(noName), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(noName), "Missing tool name");

    auto badArgs = send(R"({"jsonrpc":"2.0","id":2,"method":"tool.invoke","params":{"name":"echo","arguments":"x"}})");
    EXPECT_EQ(errorCode(badArgs), JSONRPCErrorCodes::InvalidParams);

    auto unknown = send(R"({"jsonrpc":"2.0","id":3,"method":"tool.invoke","params":{"name":"nope","arguments":{}}})");
    EXPECT_EQ(errorCode(unknown), JSONRPCErrorCodes::ToolNotFound);
    EXPECT_EQ(errorMessage(unknown), "Tool 'nope' not found");

    auto invalid = send(R"({"jsonrpc":"2.0","id":4,"method":"tool.invoke","params":{"name":"echo","arguments":{"message":""}}})");
    EXPECT_EQ(errorCode(invalid), JSONRPCErrorCodes::ToolNotFound);
    EXPECT_EQ(errorMessage(invalid), "Parameter validation failed: '' is too short");
    EXPECT_EQ(handler->PendingCount(), 0u);
}

TEST_F(ProtocolHandlerTest, ProgressAndStreamNotificationsPrecedeResponse) {
    initialize();
    conn->ClearFrames();
    auto resp = send(R"({"jsonrpc":"2.0","id":"gen-1","method":"tool.invoke","params":{"name":"reporter","arguments":{}}})");
    ASSERT_EQ(errorCode(resp), 0);
    EXPECT_EQ(std::get<std::string>(typed::getMember(result(resp), "result")->value), "Hello world");

    std::vector<std::string> methods;
    for (const auto& f : conn->SentFrames()) {
        methods.push_back(typed::getString(ParseJSON(f), "method").value_or(""));
    }
    const std::vector<std::string> expected{"user.consent", "tool.progress", "stream", "stream", "stream", "tool.progress"};
    EXPECT_EQ(methods, expected);

    auto streams = framesWithMethod("stream");
    ASSERT_EQ(streams.size(), 3u);
    const JSONValue* first = typed::getMember(streams[0], "params");
    EXPECT_EQ(typed::getString(*first, "requestId").value_or(""), "gen-1");
    EXPECT_EQ(typed::getString(*first, "content").value_or(""), "Hello");
    EXPECT_FALSE(typed::getBool(*first, "done").value_or(true));
    EXPECT_TRUE(typed::getBool(*typed::getMember(streams[2], "params"), "done").value_or(false));

    auto progress = framesWithMethod("tool.progress");
    EXPECT_DOUBLE_EQ(typed::getNumber(*typed::getMember(progress[0], "params"), "progress").value_or(0), 0.5);
}

////////////////////////////////////////// Consent //////////////////////////////////////////

TEST_F(ProtocolHandlerTest, DeliveryConsentFailsWhenConnectionClosed) {
    initialize();
    conn->Close().get();
    auto resp = send(R"({"jsonrpc":"2.0","id":5,"method":"tool.invoke","params":{"name":"echo","arguments":{"message":"x"}}})");
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::ConsentRequired);
    EXPECT_EQ(errorMessage(resp), "User consent required");
}

TEST_F(ProtocolHandlerTest, ExplicitConsentGranted) {
    ProtocolHandler::Options opts;
    opts.consentMode = ConsentMode::Explicit;
    useOptions(opts);
    initialize();
    conn->ClearFrames();

    auto fut = std::async(std::launch::async, [this]() {
        return send(R"({"jsonrpc":"2.0","id":6,"method":"tool.invoke","params":{"name":"echo","arguments":{"message":"ok"}}})");
    });
    ASSERT_TRUE(conn->WaitForFrames(1, std::chrono::seconds(2)));
    auto consent = ParseJSON(conn->SentFrames().front());
    auto consentId = typed::getString(*typed::getMember(consent, "params"), "consentId").value_or("");
    EXPECT_EQ(handler->PendingConsentCount(), 1u);

    const std::string reply = R"({"jsonrpc":"2.0","method":"user.consent.response","params":{"consentId":")" +
                              consentId + R"(","granted":true}})";
    EXPECT_TRUE(handler->HandleOutOfBand(conn, reply).consumed);

    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    EXPECT_EQ(errorCode(resp), 0) << SerializeJSON(resp);
    EXPECT_EQ(handler->PendingConsentCount(), 0u);
}

TEST_F(ProtocolHandlerTest, ExplicitConsentDenied) {
    ProtocolHandler::Options opts;
    opts.consentMode = ConsentMode::Explicit;
    useOptions(opts);
    initialize();
    conn->ClearFrames();

    auto fut = std::async(std::launch::async, [this]() {
        return send(R"({"jsonrpc":"2.0","id":7,"method":"tool.invoke","params":{"name":"echo","arguments":{"message":"no"}}})");
    });
    ASSERT_TRUE(conn->WaitForFrames(1, std::chrono::seconds(2)));
    auto consentId = typed::getString(*typed::getMember(ParseJSON(conn->SentFrames().front()), "params"), "consentId");
    ASSERT_TRUE(consentId.has_value());
    // Routed through the regular path as a notification
    auto none = handler->HandleMessage(conn, R"({"jsonrpc":"2.0","method":"user.consent.response","params":{"consentId":")" +
                                                 consentId.value() + R"(","granted":false}})");
    EXPECT_FALSE(none.has_value());

    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(errorCode(fut.get()), JSONRPCErrorCodes::ConsentRequired);
}

TEST_F(ProtocolHandlerTest, ExplicitConsentTimesOut) {
    ProtocolHandler::Options opts;
    opts.consentMode = ConsentMode::Explicit;
    opts.consentTimeout = std::chrono::milliseconds(50);
    useOptions(opts);
    initialize();
    auto resp = send(R"({"jsonrpc":"2.0","id":8,"method":"tool.invoke","params":{"name":"echo","arguments":{"message":"late"}}})");
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::ConsentRequired);
    EXPECT_EQ(handler->PendingConsentCount(), 0u);
}

TEST_F(ProtocolHandlerTest, ConsentFromAnotherSessionIsIgnored) {
    ProtocolHandler::Options opts;
    opts.consentMode = ConsentMode::Explicit;
    opts.consentTimeout = std::chrono::milliseconds(300);
    useOptions(opts);
    initialize();
    auto other = std::make_shared<InMemoryConnection>("other");
    sessions.CreateSession(other);
    conn->ClearFrames();

    auto fut = std::async(std::launch::async, [this]() {
        return send(R"({"jsonrpc":"2.0","id":10,"method":"tool.invoke","params":{"name":"echo","arguments":{"message":"x"}}})");
    });
    ASSERT_TRUE(conn->WaitForFrames(1, std::chrono::seconds(2)));
    auto consentId = typed::getString(*typed::getMember(ParseJSON(conn->SentFrames().front()), "params"), "consentId");
    ASSERT_TRUE(consentId.has_value());
    EXPECT_TRUE(handler->HandleOutOfBand(other, R"({"jsonrpc":"2.0","method":"user.consent.response","params":{"consentId":")" +
                                                    consentId.value() + R"(","granted":true}})").consumed);
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(errorCode(fut.get()), JSONRPCErrorCodes::ConsentRequired);
}

TEST_F(ProtocolHandlerTest, OutOfBandIgnoresOtherFrames) {
    EXPECT_FALSE(handler->HandleOutOfBand(conn, R"({"jsonrpc":"2.0","id":1,"method":"mcp.ping"})").consumed);
    EXPECT_FALSE(handler->HandleOutOfBand(conn, "garbage user.consent.response").consumed);
    // Nothing in flight: the cancel keeps its place in the queue
    auto cancel = handler->HandleOutOfBand(conn, R"({"jsonrpc":"2.0","id":2,"method":"mcp.cancel","params":{"requestId":9}})");
    EXPECT_FALSE(cancel.consumed);
    EXPECT_FALSE(cancel.reply.has_value());
}

////////////////////////////////////////// Cancellation and timeouts //////////////////////////////////////////

TEST_F(ProtocolHandlerTest, OutOfBandCancelStopsOwnInvocation) {
    initialize();
    auto fut = std::async(std::launch::async, [this]() {
        return send(R"({"jsonrpc":"2.0","id":7,"method":"tool.invoke","params":{"name":"wait_for_stop","arguments":{}}})");
    });
    ASSERT_TRUE(waitUntil([this]() { return handler->PendingCount() == 1; }));

    auto cancel = handler->HandleOutOfBand(conn, R"({"jsonrpc":"2.0","id":8,"method":"mcp.cancel","params":{"requestId":7}})");
    ASSERT_TRUE(cancel.consumed);
    ASSERT_TRUE(cancel.reply.has_value());
    auto reply = ParseJSON(cancel.reply.value());
    EXPECT_EQ(typed::getInt(reply, "id").value_or(0), 8);
    EXPECT_TRUE(typed::getBool(result(reply), "cancelled").value_or(false));
    EXPECT_EQ(typed::getInt(result(reply), "requestId").value_or(0), 7);

    ASSERT_EQ(fut.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    auto resp = fut.get();
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(errorMessage(resp), "Tool invocation cancelled");
    EXPECT_EQ(handler->PendingCount(), 0u);
}

TEST_F(ProtocolHandlerTest, SameRequestIdInTwoSessionsIsCancelledIndependently) {
    auto other = std::make_shared<InMemoryConnection>("other");
    sessions.CreateSession(other);
    auto bystander = std::make_shared<InMemoryConnection>("bystander");
    sessions.CreateSession(bystander);
    initialize();
    initialize(other);
    const char* invoke = R"({"jsonrpc":"2.0","id":"1","method":"tool.invoke","params":{"name":"wait_for_stop","arguments":{}}})";
    const char* cancel = R"({"jsonrpc":"2.0","id":"c","method":"mcp.cancel","params":{"requestId":"1"}})";

    auto mine = std::async(std::launch::async, [this, invoke]() { return send(invoke); });
    auto theirs = std::async(std::launch::async, [this, invoke, other]() { return send(invoke, other); });
    ASSERT_TRUE(waitUntil([this]() { return handler->PendingCount() == 2; }));

    // A session with nothing running cannot reach either invocation
    auto stray = send(cancel, bystander);
    EXPECT_FALSE(typed::getBool(result(stray), "cancelled").value_or(true));
    EXPECT_EQ(handler->PendingCount(), 2u);

    auto first = send(cancel, other);
    EXPECT_TRUE(typed::getBool(result(first), "cancelled").value_or(false));
    ASSERT_EQ(theirs.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(errorMessage(theirs.get()), "Tool invocation cancelled");

    // The other session's request with the same id keeps running
    EXPECT_EQ(mine.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
    EXPECT_EQ(handler->PendingCount(), 1u);
    EXPECT_FALSE(handler->CancelRequest(sessions.GetSession(other)->Id(), "1"));

    EXPECT_TRUE(handler->CancelRequest(sessions.GetSession(conn)->Id(), "1"));
    ASSERT_EQ(mine.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(errorMessage(mine.get()), "Tool invocation cancelled");
    EXPECT_EQ(handler->PendingCount(), 0u);
}

TEST_F(ProtocolHandlerTest, CancelUnknownRequestIsNotAnError) {
    auto resp = send(R"({"jsonrpc":"2.0","id":1,"method":"mcp.cancel","params":{"requestId":"missing"}})");
    EXPECT_EQ(errorCode(resp), 0);
    EXPECT_FALSE(typed::getBool(result(resp), "cancelled").value_or(true));
    EXPECT_FALSE(handler->CancelRequest(sessions.GetSession(conn)->Id(), "missing"));
}

TEST_F(ProtocolHandlerTest, CancelAllStopsEveryPendingInvocation) {
    auto other = std::make_shared<InMemoryConnection>("other");
    sessions.CreateSession(other);
    initialize();
    initialize(other);
    const char* invoke = R"({"jsonrpc":"2.0","id":"long","method":"tool.invoke","params":{"name":"wait_for_stop","arguments":{}}})";
    auto fut = std::async(std::launch::async, [this, invoke]() { return send(invoke); });
    auto otherFut = std::async(std::launch::async, [this, invoke, other]() { return send(invoke, other); });
    ASSERT_TRUE(waitUntil([this]() { return handler->PendingCount() == 2; }));
    EXPECT_EQ(handler->CancelAll(), 2u);
    EXPECT_EQ(handler->PendingCount(), 0u);
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    ASSERT_EQ(otherFut.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(errorCode(fut.get()), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(errorCode(otherFut.get()), JSONRPCErrorCodes::ToolExecutionError);
}

TEST_F(ProtocolHandlerTest, ToolTimeoutIsExecutionError) {
    ProtocolHandler::Options opts;
    opts.toolTimeout = std::chrono::milliseconds(50);
    useOptions(opts);
    initialize();
    auto resp = send(R"({"jsonrpc":"2.0","id":11,"method":"tool.invoke","params":{"name":"wait_for_stop","arguments":{}}})");
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(errorMessage(resp), "Tool execution failed: timed out after 50 ms");
}

TEST_F(ProtocolHandlerTest, HandlerFailureIsExecutionError) {
    tools.RegisterTool("broken", "Always fails", ParseJSON("{}"),
        [](const JSONValue&, const ToolCallContext&) -> std::future<JSONValue> {
            return std::async(std::launch::async, []() -> JSONValue { throw std::runtime_error("disk full"); });
        });
    initialize();
    auto resp = send(R"({"jsonrpc":"2.0","id":12,"method":"tool.invoke","params":{"name":"broken"}})");
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(errorMessage(resp), "Tool execution failed: disk full");
}

TEST_F(ProtocolHandlerTest, NonStandardHandlerExceptionKeepsHandlerServing) {
    tools.RegisterTool("int_thrower", "Throws an int", ParseJSON("{}"),
        [](const JSONValue&, const ToolCallContext&) -> std::future<JSONValue> {
            return std::async(std::launch::async, []() -> JSONValue { throw 42; });
        });
    tools.RegisterTool("db_lookup", "Fails with a lookup error of its own", ParseJSON("{}"),
        [](const JSONValue&, const ToolCallContext&) -> std::future<JSONValue> {
            return std::async(std::launch::async, []() -> JSONValue { throw errors::ToolNotFoundError("db"); });
        });
    initialize();

    auto resp = send(R"({"jsonrpc":"2.0","id":13,"method":"tool.invoke","params":{"name":"int_thrower"}})");
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(errorMessage(resp), "Tool execution failed: unknown error");

    auto nested = send(R"({"jsonrpc":"2.0","id":14,"method":"tool.invoke","params":{"name":"db_lookup"}})");
    EXPECT_EQ(errorCode(nested), JSONRPCErrorCodes::ToolExecutionError);

    auto ping = send(R"({"jsonrpc":"2.0","id":15,"method":"mcp.ping"})");
    EXPECT_TRUE(typed::getBool(result(ping), "pong").value_or(false));
}

////////////////////////////////////////// Notifications //////////////////////////////////////////

TEST_F(ProtocolHandlerTest, EveryRequestGetsOneResponseWithItsId) {
    initialize();
    for (const char* frame : {R"({"jsonrpc":"2.0","id":"abc","method":"mcp.ping"})",
                              R"({"jsonrpc":"2.0","id":"abc","method":"no.such.method"})",
                              R"({"jsonrpc":"2.0","id":"abc","method":"tool.invoke","params":{"name":"nope"}})"}) {
        auto reply = handler->HandleMessage(conn, frame);
        ASSERT_TRUE(reply.has_value()) << frame;
        EXPECT_EQ(typed::getString(ParseJSON(reply.value()), "id").value_or(""), "abc") << frame;
    }
}

TEST_F(ProtocolHandlerTest, NotificationsProduceNoResponse) {
    EXPECT_FALSE(handler->HandleMessage(conn, R"({"jsonrpc":"2.0","method":"mcp.ping"})").has_value());
    EXPECT_FALSE(handler->HandleMessage(conn, R"({"jsonrpc":"2.0","method":"unknown.note"})").has_value());
    EXPECT_FALSE(handler->HandleMessage(conn, R"({"jsonrpc":"2.0","method":"user.consent.response","params":{}})").has_value());
    EXPECT_TRUE(conn->SentFrames().empty());
}

TEST_F(ProtocolHandlerTest, NotificationHelpersWriteToConnection) {
    auto session = sessions.GetSession(conn);
    EXPECT_TRUE(handler->SendProgress(*session, JSONRPCId{int64_t{3}}, 0.25, "quarter"));
    EXPECT_TRUE(handler->SendStream(*session, JSONRPCId{int64_t{3}}, "abc", true));
    auto frames = conn->SentFrames();
    ASSERT_EQ(frames.size(), 2u);
    auto progress = ParseJSON(frames[0]);
    EXPECT_EQ(typed::getString(progress, "method").value_or(""), "tool.progress");
    EXPECT_EQ(typed::getInt(*typed::getMember(progress, "params"), "requestId").value_or(0), 3);
    EXPECT_EQ(typed::getString(*typed::getMember(progress, "params"), "message").value_or(""), "quarter");

    conn->Close().get();
    EXPECT_FALSE(handler->SendStream(*session, JSONRPCId{int64_t{3}}, "late", false));
}

TEST(ProtocolHandlerFrames, BuildersProduceValidJsonRpc) {
    auto ok = ParseJSON(ProtocolHandler::CreateResponse(JSONRPCId{std::string("x")}, JSONValue(true)));
    EXPECT_EQ(typed::getString(ok, "jsonrpc").value_or(""), "2.0");
    EXPECT_TRUE(typed::getBool(ok, "result").value_or(false));

    auto err = ParseJSON(ProtocolHandler::CreateError(JSONRPCId{nullptr}, -32603, "Internal server error"));
    EXPECT_TRUE(typed::getMember(err, "id")->IsNull());
    EXPECT_EQ(errorCode(err), -32603);

    auto note = ParseJSON(ProtocolHandler::CreateNotification("stream", JSONValue{JSONValue::Object{}}));
    EXPECT_EQ(typed::getMember(note, "id"), nullptr);
}

TEST(ProtocolHandlerOptions, ConsentModeParsing) {
    EXPECT_EQ(parseConsentMode("delivery"), ConsentMode::Delivery);
    EXPECT_EQ(parseConsentMode("explicit"), ConsentMode::Explicit);
    EXPECT_FALSE(parseConsentMode("Explicit").has_value());
    EXPECT_STREQ(toString(ConsentMode::Explicit), "explicit");
}
