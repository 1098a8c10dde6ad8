//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide leveled logging (std::format messages) to a console stream and an optional file.
//==========================================================================================================
#pragma once

#include <cstdlib>
#include <format>
#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: Static sink shared by every component.
// Line format:
//   <UTC timestamp> [LEVEL] <file>:<line>: <message>
// Environment (read by configureFromEnvironment and on first use):
//   IDEBRIDGE_LOG_LEVEL   DEBUG | INFO | WARN | ERROR | FATAL
//   IDEBRIDGE_LOG_FILE    Append every line to this file as well
//   IDEBRIDGE_LOG_STDERR  Write console output to stderr instead of stdout
//   IDEBRIDGE_LOG_COLOR   Colorize the level label (default on)
//==========================================================================================================
class Logger {
public:
    // Case-insensitive; unknown strings map to INFO.
    static LogLevel levelFromString(const std::string& lvl);
    static const char* levelName(LogLevel level);

    template <typename... Args>
    static void logf(LogLevel level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error in \"{}\": {}", fmt, e.what());
        }
        log(level, buffer, file, line);
    }

    static void setLogLevel(LogLevel level) { sLogLevel = level; }
    static void setLogLevelFromString(const std::string& level) { sLogLevel = levelFromString(level); }

    // Applies IDEBRIDGE_LOG_LEVEL, IDEBRIDGE_LOG_FILE and IDEBRIDGE_LOG_STDERR when present.
    static void configureFromEnvironment();

    //==========================================================================================================
    // Opens (append mode) the file every subsequent line is mirrored to. An empty path closes it.
    // Returns:
    //   false when the file could not be opened; console logging continues either way.
    //==========================================================================================================
    static bool setLogFile(const std::string& filePath);

    static void setUseStderr(bool useStderr);

    static void log(LogLevel level, const std::string& msg, const char* file, unsigned int line);

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
    static bool sUseStderr;
};

#define IDEBRIDGE_LOG_AT(lvl, fmt, ...) \
    do { if (Logger::sLogLevel <= (lvl)) Logger::logf((lvl), fmt, __FILE__, __LINE__, ##__VA_ARGS__); } while (0)

#define LOG_DEBUG(fmt, ...) IDEBRIDGE_LOG_AT(LogLevel::LOG_DEBUG_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  IDEBRIDGE_LOG_AT(LogLevel::LOG_INFO_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  IDEBRIDGE_LOG_AT(LogLevel::LOG_WARN_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) IDEBRIDGE_LOG_AT(LogLevel::LOG_ERROR_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) \
    do { Logger::logf(LogLevel::LOG_FATAL_LEVEL, fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while (0)

// Entry/exit tracing, compiled in for _DEBUG builds only.
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
