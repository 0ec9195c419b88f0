//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers and the VERSION file reader.
//==========================================================================================================
#include "mcpws/version.h"

#include <fstream>
#include <sstream>

#include "logging/Logger.h"

namespace mcpws {

VersionInfo getVersion() {
    auto v = VersionInfo{1, 0, 0};
    return v;
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

std::string readVersionFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        LOG_DEBUG("VERSION file {} not found; using {}", path, DEFAULT_DEPLOYMENT_VERSION);
        return DEFAULT_DEPLOYMENT_VERSION;
    }
    std::string line;
    std::getline(in, line);
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return DEFAULT_DEPLOYMENT_VERSION;
    }
    const auto last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}

} // namespace mcpws
