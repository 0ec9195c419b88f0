//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UserTools.h
// Purpose: Sample user store and the demonstration tools registered by the server
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "mcpws/JSONRPCTypes.h"
#include "mcpws/ToolRegistry.h"
#include "mcpws/llm/GenerationBackend.h"

namespace mcpws {
namespace demo {

//==========================================================================================================
// UserStore
// Purpose: In-memory user table behind create_user / get_user. Thread-safe.
//==========================================================================================================
class UserStore {
public:
    // Creates or overwrites the user. Returns { user_id, name }.
    JSONValue CreateUser(const std::string& userId, const std::string& name);

    // Returns { user_id, name }, or { error: "User not found" } for an unknown id.
    JSONValue GetUser(const std::string& userId) const;

    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> users_;
};

///////////////////////////////////////// Schemas ///////////////////////////////////////////
JSONValue CreateUserSchema();
JSONValue GetUserSchema();
JSONValue GenerateTextSchema();

//==========================================================================================================
// RegisterUserTools
// Purpose: Registers create_user and get_user backed by store.
//==========================================================================================================
void RegisterUserTools(ToolRegistry& registry, const std::shared_ptr<UserStore>& store);

//==========================================================================================================
// RegisterGenerationTools
// Purpose: Registers generate_text backed by the selected generation backend.
// Notes:
//   With "stream": true the tool emits one stream notification per chunk, tool.progress updates, and a
//   final stream notification with done=true. The result carries the full text either way.
//==========================================================================================================
void RegisterGenerationTools(ToolRegistry& registry, const std::shared_ptr<llm::IGenerationBackend>& backend);

} // namespace demo
} // namespace mcpws
