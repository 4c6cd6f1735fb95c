//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide server-side logger (stderr + optional file) with level filtering.
//==========================================================================================================
#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include <fmt/format.h>

#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: Writes one line per event:
//            2025-06-01T12:00:00.123Z [ERROR] tid=140213 ErrorSanitizer.cpp:92: message
//          Lines go to stderr and, when configured, are appended to a log file. Exception detail and
//          stack traces recorded by the error sanitizer only ever travel through this sink.
//==========================================================================================================
class Logger {
public:
    // Convert common level strings to LogLevel (case-insensitive). Unknown strings map to INFO.
    static LogLevel levelFromString(const std::string& lvl) {
        std::string s;
        s.reserve(lvl.size());
        for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
        if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
        if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
        return LogLevel::LOG_INFO_LEVEL;
    }

    static bool enabled(LogLevel level) { return level >= sLogLevel; }

    static void setLogLevel(LogLevel level) { sLogLevel = level; }

    //==========================================================================================================
    // setLogFile
    // Purpose: Start appending to filePath (in addition to stderr). An empty path closes the current file.
    // Returns:
    //   false when the file could not be opened; stderr logging continues either way.
    //==========================================================================================================
    static bool setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        if (filePath.empty()) {
            return true;
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << fmt::format("{} [ERROR] cannot open log file {}\n", timestamp(), filePath);
            return false;
        }
        return true;
    }

    // {fmt}-style formatting with a runtime format string; format errors are logged, not thrown
    template <typename... Args>
    static void logf(LogLevel level, const char* format, const char* file, unsigned int line, Args&&... args) {
        std::string msg;
        try {
            msg = fmt::vformat(format, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            msg = fmt::format("<bad log format \"{}\": {}>", format, e.what());
        }
        write(level, msg, file, line);
    }

    static void write(LogLevel level, const std::string& msg, const char* file, unsigned int line) {
        const std::string text = fmt::format("{} [{}] tid={} {}:{}: {}\n", timestamp(), label(level),
                                             std::hash<std::thread::id>{}(std::this_thread::get_id()),
                                             baseName(file), line, msg);
        std::lock_guard<std::mutex> lock(sLogMutex);
        std::cerr << text << std::flush;
        if (sLogFile.is_open()) {
            sLogFile << text;
            sLogFile.flush();
        }
    }

private:
    static LogLevel sLogLevel;
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;

    static const char* label(LogLevel level) {
        switch (level) {
            case LogLevel::LOG_DEBUG_LEVEL: return "DEBUG";
            case LogLevel::LOG_WARN_LEVEL: return "WARN";
            case LogLevel::LOG_ERROR_LEVEL: return "ERROR";
            case LogLevel::LOG_INFO_LEVEL:
            default: return "INFO";
        }
    }

    static const char* baseName(const char* path) {
        const char* base = path;
        for (const char* p = path; *p != '\0'; ++p) {
            if (*p == '/' || *p == '\\') base = p + 1;
        }
        return base;
    }

    // UTC, millisecond precision
    static std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t secs = std::chrono::system_clock::to_time_t(now);
        const auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm utc{};
        ::gmtime_r(&secs, &utc);
        return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", utc.tm_year + 1900, utc.tm_mon + 1,
                           utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
    }
};

// Definitions of static members are in Logger.cpp

#define STRIDEMCP_LOG(level, fmt, ...) \
    do { if (Logger::enabled(level)) Logger::logf(level, fmt, __FILE__, __LINE__, ##__VA_ARGS__); } while (0)

#define LOG_DEBUG(fmt, ...) STRIDEMCP_LOG(LogLevel::LOG_DEBUG_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  STRIDEMCP_LOG(LogLevel::LOG_INFO_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  STRIDEMCP_LOG(LogLevel::LOG_WARN_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) STRIDEMCP_LOG(LogLevel::LOG_ERROR_LEVEL, fmt, ##__VA_ARGS__)

// Debug builds trace entry and exit of request-path functions
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
