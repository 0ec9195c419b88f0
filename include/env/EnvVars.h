//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPWS_* environment variables with typed defaults.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <cerrno>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return defaultValue;
    }
    return std::string(raw);
}

//==========================================================================================================
// GetEnvIntOrDefault
// Purpose: Reads a base-10 integer environment variable. Unset, empty, or malformed values
//          (trailing characters, overflow) yield defaultValue.
//==========================================================================================================
inline long long GetEnvIntOrDefault(const char* name, long long defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(v.c_str(), &end, 10);
    if (errno != 0 || end == v.c_str() || *end != '\0') {
        return defaultValue;
    }
    return parsed;
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Interprets "1", "true", "TRUE", "yes" or "on" as true and any other value as false.
//          Returns defaultValue when the variable is unset or empty.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    return v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on";
}
