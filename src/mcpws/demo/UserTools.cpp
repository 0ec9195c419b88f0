//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UserTools.cpp
// Purpose: Sample user store, user tools and the text generation tool
//==========================================================================================================

#include "mcpws/demo/UserTools.h"

#include <algorithm>
#include <future>
#include <optional>
#include <stdexcept>
#include <vector>

#include "logging/Logger.h"
#include "mcpws/typed/Content.h"

namespace mcpws {
namespace demo {

namespace {

std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

std::shared_ptr<JSONValue> num(int64_t v) {
    return std::make_shared<JSONValue>(v);
}

std::shared_ptr<JSONValue> obj(JSONValue::Object o) {
    return std::make_shared<JSONValue>(JSONValue{std::move(o)});
}

JSONValue::Object stringProperty(const std::string& description) {
    JSONValue::Object p;
    p["type"] = str("string");
    p["description"] = str(description);
    p["minLength"] = num(1);
    return p;
}

JSONValue objectSchema(JSONValue::Object properties, const std::vector<std::string>& required) {
    JSONValue::Object schema;
    schema["type"] = str("object");
    schema["properties"] = obj(std::move(properties));
    schema["required"] = std::make_shared<JSONValue>(JSONValue{typed::makeStringArray(required)});
    schema["additionalProperties"] = std::make_shared<JSONValue>(false);
    return JSONValue{schema};
}

JSONValue userValue(const std::string& userId, const std::string& name) {
    JSONValue::Object user;
    user["user_id"] = str(userId);
    user["name"] = str(name);
    return JSONValue{user};
}

std::vector<llm::ChatMessage> readHistory(const JSONValue& args) {
    std::vector<llm::ChatMessage> history;
    const JSONValue* h = typed::getMember(args, "history");
    if (h == nullptr || !h->IsArray()) {
        return history;
    }
    for (const auto& item : std::get<JSONValue::Array>(h->value)) {
        if (!item) continue;
        llm::ChatMessage m;
        m.role = typed::getString(*item, "role").value_or("user");
        m.content = typed::getString(*item, "content").value_or("");
        history.push_back(std::move(m));
    }
    return history;
}

} // namespace

////////////////////////////////////////// UserStore //////////////////////////////////////////

JSONValue UserStore::CreateUser(const std::string& userId, const std::string& name) {
    std::size_t total = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        users_[userId] = name;
        total = users_.size();
    }
    LOG_INFO("create_user: user_id={} name={} | total_users={}", userId, name, total);
    return userValue(userId, name);
}

JSONValue UserStore::GetUser(const std::string& userId) const {
    std::optional<std::string> name;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = users_.find(userId);
        if (it != users_.end()) {
            name = it->second;
        }
    }
    if (!name.has_value()) {
        LOG_INFO("get_user: user_id={} | not found", userId);
        JSONValue::Object err;
        err["error"] = str("User not found");
        return JSONValue{err};
    }
    LOG_INFO("get_user: user_id={} | name={}", userId, name.value());
    return userValue(userId, name.value());
}

std::size_t UserStore::Size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return users_.size();
}

////////////////////////////////////////// Schemas //////////////////////////////////////////

JSONValue CreateUserSchema() {
    JSONValue::Object props;
    props["user_id"] = obj(stringProperty("Unique identifier for the user"));
    props["name"] = obj(stringProperty("Display name for the user"));
    return objectSchema(std::move(props), {"user_id", "name"});
}

JSONValue GetUserSchema() {
    JSONValue::Object props;
    props["user_id"] = obj(stringProperty("Unique identifier for the user to retrieve"));
    return objectSchema(std::move(props), {"user_id"});
}

JSONValue GenerateTextSchema() {
    JSONValue::Object props;
    props["prompt"] = obj(stringProperty("Prompt to complete"));

    JSONValue::Object maxTokens;
    maxTokens["type"] = str("integer");
    maxTokens["minimum"] = num(1);
    maxTokens["maximum"] = num(4096);
    props["max_tokens"] = obj(std::move(maxTokens));

    JSONValue::Object temperature;
    temperature["type"] = str("number");
    temperature["minimum"] = num(0);
    temperature["maximum"] = num(2);
    props["temperature"] = obj(std::move(temperature));

    JSONValue::Object stream;
    stream["type"] = str("boolean");
    stream["description"] = str("Emit the answer as stream notifications");
    props["stream"] = obj(std::move(stream));

    JSONValue::Object role;
    role["type"] = str("string");
    JSONValue::Array roles;
    roles.push_back(str("user"));
    roles.push_back(str("assistant"));
    role["enum"] = std::make_shared<JSONValue>(JSONValue{roles});
    JSONValue::Object content;
    content["type"] = str("string");
    JSONValue::Object messageProps;
    messageProps["role"] = obj(std::move(role));
    messageProps["content"] = obj(std::move(content));
    JSONValue::Object message;
    message["type"] = str("object");
    message["properties"] = obj(std::move(messageProps));
    message["required"] = std::make_shared<JSONValue>(JSONValue{typed::makeStringArray({"role", "content"})});
    JSONValue::Object history;
    history["type"] = str("array");
    history["description"] = str("Earlier conversation turns");
    history["items"] = obj(std::move(message));
    props["history"] = obj(std::move(history));

    return objectSchema(std::move(props), {"prompt"});
}

////////////////////////////////////////// Registration //////////////////////////////////////////

void RegisterUserTools(ToolRegistry& registry, const std::shared_ptr<UserStore>& store) {
    registry.RegisterTool("create_user", "Create a new user in the system with a unique ID and name",
        CreateUserSchema(),
        [store](const JSONValue& args, const ToolCallContext&) -> std::future<JSONValue> {
            return std::async(std::launch::async, [store, args]() {
                return store->CreateUser(typed::getString(args, "user_id").value_or(""),
                                         typed::getString(args, "name").value_or(""));
            });
        });

    registry.RegisterTool("get_user", "Retrieve user information by user ID",
        GetUserSchema(),
        [store](const JSONValue& args, const ToolCallContext&) -> std::future<JSONValue> {
            return std::async(std::launch::async, [store, args]() {
                return store->GetUser(typed::getString(args, "user_id").value_or(""));
            });
        });
}

void RegisterGenerationTools(ToolRegistry& registry, const std::shared_ptr<llm::IGenerationBackend>& backend) {
    registry.RegisterTool("generate_text", "Generate text with the configured language model",
        GenerateTextSchema(),
        [backend](const JSONValue& args, const ToolCallContext& ctx) -> std::future<JSONValue> {
            return std::async(std::launch::async, [backend, args, ctx]() {
                const std::string prompt = typed::getString(args, "prompt").value_or("");
                llm::GenerationOptions options;
                options.maxTokens = static_cast<int>(typed::getInt(args, "max_tokens").value_or(options.maxTokens));
                options.temperature = typed::getNumber(args, "temperature").value_or(options.temperature);
                options.stream = typed::getBool(args, "stream").value_or(false);

                JSONValue::Object result;
                result["backend"] = str(backend->Kind());

                if (!options.stream) {
                    auto history = readHistory(args);
                    std::string text;
                    if (history.empty()) {
                        text = backend->GenerateResponse(prompt, options).get();
                    } else {
                        history.push_back(llm::ChatMessage{"user", prompt});
                        text = backend->GenerateWithContext(history, options).get();
                    }
                    result["text"] = str(text);
                    return JSONValue{result};
                }

                ctx.ReportProgress(0.0, "Generating");
                auto chunks = backend->GenerateStreamingResponse(prompt, options);
                std::string full;
                int64_t count = 0;
                while (auto chunk = chunks->Next()) {
                    if (ctx.StopRequested()) {
                        throw std::runtime_error("generation cancelled");
                    }
                    full += chunk.value();
                    ++count;
                    ctx.EmitStream(chunk.value(), false);
                    const double fraction = std::min(0.99, static_cast<double>(count) / static_cast<double>(options.maxTokens));
                    ctx.ReportProgress(fraction, "Generated " + std::to_string(count) + " chunks");
                }
                ctx.EmitStream("", true);
                ctx.ReportProgress(1.0, "Generation complete");
                result["text"] = str(full);
                result["chunks"] = num(count);
                return JSONValue{result};
            });
        });
}

} // namespace demo
} // namespace mcpws
