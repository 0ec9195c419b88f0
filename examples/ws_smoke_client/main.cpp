//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: End-to-end smoke client: initialize, ping, list tools, create/get a user, unknown method
//==========================================================================================================

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpws/JSONRPCTypes.h"
#include "mcpws/Protocol.h"
#include "mcpws/typed/Content.h"

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using namespace mcpws;

static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        const std::string a = argv[i];
        const std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
        if (a == key && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

class SmokeClient {
public:
    SmokeClient(const std::string& host, const std::string& port) : ws_(ioc_) {
        tcp::resolver resolver(ioc_);
        auto results = resolver.resolve(host, port);
        net::connect(ws_.next_layer(), results);
        ws_.handshake(host + ":" + port, "/");
    }

    ~SmokeClient() {
        beast::error_code ec;
        ws_.close(websocket::close_code::normal, ec);
    }

    // Sends a request and reads frames until the matching response, answering consent prompts on the way.
    JSONValue Call(const std::string& method, const JSONValue& params) {
        const int64_t id = nextId_++;
        JSONValue::Object req;
        req["jsonrpc"] = std::make_shared<JSONValue>(std::string("2.0"));
        req["id"] = std::make_shared<JSONValue>(id);
        req["method"] = std::make_shared<JSONValue>(method);
        req["params"] = std::make_shared<JSONValue>(params);
        write(SerializeJSON(JSONValue{req}));

        for (;;) {
            JSONValue msg = ParseJSON(read());
            if (typed::getMember(msg, "method") != nullptr) {
                onNotification(msg);
                continue;
            }
            if (typed::getInt(msg, "id") == id) {
                return msg;
            }
            LOG_WARN("Ignoring unexpected frame");
        }
    }

private:
    void onNotification(const JSONValue& msg) {
        const std::string method = typed::getString(msg, "method").value_or("");
        LOG_INFO("<- notification {}", method);
        if (method != Notifications::UserConsent) {
            return;
        }
        const JSONValue* params = typed::getMember(msg, "params");
        auto consentId = params != nullptr ? typed::getString(*params, "consentId") : std::nullopt;
        if (!consentId.has_value()) {
            return;
        }
        JSONValue::Object p;
        p["consentId"] = std::make_shared<JSONValue>(consentId.value());
        p["granted"] = std::make_shared<JSONValue>(true);
        JSONValue::Object note;
        note["jsonrpc"] = std::make_shared<JSONValue>(std::string("2.0"));
        note["method"] = std::make_shared<JSONValue>(std::string(Notifications::ConsentResponse));
        note["params"] = std::make_shared<JSONValue>(JSONValue{p});
        write(SerializeJSON(JSONValue{note}));
    }

    void write(const std::string& text) {
        ws_.text(true);
        ws_.write(net::buffer(text));
    }

    std::string read() {
        beast::flat_buffer buffer;
        ws_.read(buffer);
        return beast::buffers_to_string(buffer.data());
    }

    net::io_context ioc_;
    websocket::stream<tcp::socket> ws_;
    int64_t nextId_{1};
};

static JSONValue object(std::initializer_list<std::pair<const std::string, std::string>> fields) {
    JSONValue::Object o;
    for (const auto& [k, v] : fields) {
        o[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue{o};
}

static bool expectResult(const std::string& step, const JSONValue& reply) {
    if (typed::getMember(reply, "result") == nullptr) {
        LOG_ERROR("{} failed: {}", step, SerializeJSON(reply));
        return false;
    }
    LOG_INFO("{} ok: {}", step, SerializeJSON(reply));
    return true;
}

int main(int argc, char** argv) {
    Logger::setLogLevelFromString(GetEnvOrDefault("MCPWS_LOG_LEVEL", "INFO"));
    const std::string host = getArgValue(argc, argv, "--host").value_or("localhost");
    const std::string port = getArgValue(argc, argv, "--port").value_or("8080");

    try {
        SmokeClient client(host, port);
        bool ok = true;

        JSONValue::Object init;
        init["clientInfo"] = std::make_shared<JSONValue>(object({{"name", "ws-smoke-client"}, {"version", "1.0.0"}}));
        ok = expectResult("initialize", client.Call(Methods::Initialize, JSONValue{init})) && ok;
        ok = expectResult("ping", client.Call(Methods::Ping, object({{"timestamp", "smoke"}}))) && ok;
        ok = expectResult("tools.list", client.Call(Methods::ListTools, JSONValue{JSONValue::Object{}})) && ok;

        JSONValue::Object create;
        create["name"] = std::make_shared<JSONValue>(std::string("create_user"));
        create["arguments"] = std::make_shared<JSONValue>(object({{"user_id", "u1"}, {"name", "Ada"}}));
        ok = expectResult("create_user", client.Call(Methods::InvokeTool, JSONValue{create})) && ok;

        JSONValue::Object get;
        get["name"] = std::make_shared<JSONValue>(std::string("get_user"));
        get["arguments"] = std::make_shared<JSONValue>(object({{"user_id", "u1"}}));
        ok = expectResult("get_user", client.Call(Methods::InvokeTool, JSONValue{get})) && ok;

        JSONValue unknown = client.Call("no.such.method", JSONValue{JSONValue::Object{}});
        const JSONValue* err = typed::getMember(unknown, "error");
        if (err == nullptr || typed::getInt(*err, "code") != static_cast<int64_t>(JSONRPCErrorCodes::MethodNotFound)) {
            LOG_ERROR("unknown method did not yield MethodNotFound: {}", SerializeJSON(unknown));
            ok = false;
        } else {
            LOG_INFO("unknown method ok: {}", SerializeJSON(unknown));
        }

        if (!ok) {
            return EXIT_FAILURE;
        }
        LOG_INFO("Smoke test passed");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        LOG_ERROR("Smoke client error: {}", e.what());
        return EXIT_FAILURE;
    }
}
