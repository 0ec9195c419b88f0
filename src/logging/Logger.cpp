//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Log sink: static state, file output and line formatting
//==========================================================================================================

#include "logging/Logger.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

// Default threshold is INFO; the server overrides it from MCPWS_LOG_LEVEL / --log-level.
LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

// "2025-01-31 13:45:12.345"
std::string timestampNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm buf{};
    ::localtime_r(&secs, &buf);
    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

const char* labelColorFor(const char* level) {
    if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
        return "\033[38;5;88m"; // burgundy
    }
    if (::strncmp(level, "WARN", 4) == 0) {
        return "\033[33m";
    }
    return "\033[35m";
}

} // namespace

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    sLogFile << "\n=== Log opened at " << timestampNow() << " ===\n";
    sLogFile.flush();
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    static const bool colorEnabled = GetEnvFlag("MCPWS_LOG_COLOR", true);
    static const bool useStderr = GetEnvFlag("MCPWS_LOG_STDERR", false);

    const std::string stamp = timestampNow();
    std::ostringstream plain;
    plain << stamp << " [" << level << "] " << file << ":" << line << ": " << msg << '\n';

    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostream& console = useStderr ? std::cerr : std::cout;
    if (colorEnabled) {
        console << stamp << " [" << labelColorFor(level) << level << "\033[0m] " << file << ":" << line << ": " << msg
                << std::endl;
    } else {
        console << plain.str() << std::flush;
    }
    // The file never carries ANSI codes
    if (sLogFile.is_open()) {
        sLogFile << plain.str();
        sLogFile.flush();
    }
}
