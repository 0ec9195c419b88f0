//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Helpers for building tool content blocks and reading typed members out of JSONValue objects
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mcpws/JSONRPCTypes.h"

namespace mcpws {
namespace typed {

//------------------------------ Builders ------------------------------
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

inline JSONValue::Array makeStringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& s : items) arr.push_back(std::make_shared<JSONValue>(s));
    return arr;
}

//------------------------------ Inspectors ------------------------------
// Returns the member value or nullptr when v is not an object or the key is absent.
inline const JSONValue* getMember(const JSONValue& v, const std::string& key) {
    if (!std::holds_alternative<JSONValue::Object>(v.value)) return nullptr;
    const auto& o = std::get<JSONValue::Object>(v.value);
    auto it = o.find(key);
    if (it == o.end() || !it->second) return nullptr;
    return it->second.get();
}

inline std::optional<std::string> getString(const JSONValue& v, const std::string& key) {
    const JSONValue* m = getMember(v, key);
    if (!m || !std::holds_alternative<std::string>(m->value)) return std::nullopt;
    return std::get<std::string>(m->value);
}

inline std::optional<bool> getBool(const JSONValue& v, const std::string& key) {
    const JSONValue* m = getMember(v, key);
    if (!m || !std::holds_alternative<bool>(m->value)) return std::nullopt;
    return std::get<bool>(m->value);
}

inline std::optional<int64_t> getInt(const JSONValue& v, const std::string& key) {
    const JSONValue* m = getMember(v, key);
    if (!m || !std::holds_alternative<int64_t>(m->value)) return std::nullopt;
    return std::get<int64_t>(m->value);
}

// Accepts either JSON number representation.
inline std::optional<double> getNumber(const JSONValue& v, const std::string& key) {
    const JSONValue* m = getMember(v, key);
    if (!m) return std::nullopt;
    if (std::holds_alternative<int64_t>(m->value)) return static_cast<double>(std::get<int64_t>(m->value));
    if (std::holds_alternative<double>(m->value)) return std::get<double>(m->value);
    return std::nullopt;
}

inline bool isText(const JSONValue& v) {
    auto t = getString(v, "type");
    return t.has_value() && t.value() == "text";
}

inline std::optional<std::string> getText(const JSONValue& v) {
    if (!isText(v)) return std::nullopt;
    return getString(v, "text");
}

} // namespace typed
} // namespace mcpws
