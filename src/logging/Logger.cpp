//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sink: level parsing, timestamped line formatting, console and file output
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>

#include "env/EnvVars.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
bool Logger::sUseStderr = GetEnvFlag("IDEBRIDGE_LOG_STDERR", false);

namespace {

// 2025-01-31T12:34:56.789Z
std::string utcTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    ::gmtime_s(&tm, &t);
#else
    ::gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::format("{}.{:03}Z", buf, millis);
}

// Trims __FILE__ down to the component path below src/ or include/.
const char* shortFile(const char* file) {
    for (const char* marker : {"/src/", "/include/", "\\src\\", "\\include\\"}) {
        if (const char* p = std::strstr(file, marker)) {
            return p + std::strlen(marker);
        }
    }
    return file;
}

} // namespace

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) {
        s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG_LEVEL: return "DEBUG";
        case LogLevel::LOG_INFO_LEVEL: return "INFO";
        case LogLevel::LOG_WARN_LEVEL: return "WARN";
        case LogLevel::LOG_ERROR_LEVEL: return "ERROR";
        case LogLevel::LOG_FATAL_LEVEL: return "FATAL";
    }
    return "INFO";
}

void Logger::configureFromEnvironment() {
    const std::string lvl = GetEnvOrDefault("IDEBRIDGE_LOG_LEVEL", "");
    if (!lvl.empty()) {
        setLogLevelFromString(lvl);
    }
    setUseStderr(GetEnvFlag("IDEBRIDGE_LOG_STDERR", sUseStderr));
    const std::string file = GetEnvOrDefault("IDEBRIDGE_LOG_FILE", "");
    if (!file.empty()) {
        setLogFile(file);
    }
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    if (filePath.empty()) {
        return true;
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (" << std::strerror(errno) << ")" << std::endl;
        return false;
    }
    sLogFile << "\n=== Log opened at " << utcTimestamp() << " ===\n";
    sLogFile.flush();
    return true;
}

void Logger::setUseStderr(bool useStderr) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    sUseStderr = useStderr;
}

void Logger::log(LogLevel level, const std::string& msg, const char* file, unsigned int line) {
    static const bool colorEnabled = GetEnvFlag("IDEBRIDGE_LOG_COLOR", true);
    const char* name = levelName(level);
    const std::string where = std::format("{}:{}: {}\n", shortFile(file), line, msg);
    const std::string stamp = utcTimestamp();

    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostream& console = sUseStderr ? std::cerr : std::cout;
    if (colorEnabled) {
        const char* color = level >= LogLevel::LOG_ERROR_LEVEL ? "\033[38;5;88m" /* burgundy */
                          : level == LogLevel::LOG_WARN_LEVEL ? "\033[33m" : "\033[36m";
        console << stamp << " [" << color << name << "\033[0m] " << where;
    } else {
        console << stamp << " [" << name << "] " << where;
    }
    console.flush();

    if (sLogFile.is_open()) {
        sLogFile << stamp << " [" << name << "] " << where;
        sLogFile.flush();
    }
}
