//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version helpers and VERSION file reader
//==========================================================================================================
#pragma once

#include <string>

namespace mcpws {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Library semantic version components.
VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

// Version reported when no VERSION file is available
constexpr const char* DEFAULT_DEPLOYMENT_VERSION = "2.0.0";

//==========================================================================================================
// readVersionFile
// Purpose: Reads the deployment version from a VERSION file.
// Args:
//   path: File to read.
// Returns:
//   The first line with surrounding whitespace removed, or DEFAULT_DEPLOYMENT_VERSION when the file is
//   missing, unreadable or blank.
//==========================================================================================================
std::string readVersionFile(const std::string& path);

} // namespace mcpws
