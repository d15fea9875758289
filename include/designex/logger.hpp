/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>

namespace designex {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

/*
 * Process-wide logger. Lines look like
 *   [2025-01-01 12:00:00.123] [INFO ] [Worker-0] message
 * and go to stderr unless redirected with setStream(). The threshold comes
 * from DESIGNEX_LOG_LEVEL on first use.
 */
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    // nullptr restores stderr. The stream must outlive any logging thread.
    static void setStream(std::ostream* out) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static LogLevel parseLevel(const std::string& name, LogLevel fallback) noexcept;

private:
    static const char* levelToString(LogLevel level) noexcept;
};

// Names the calling thread in its log lines; the name dies with the thread
void setThreadName(const std::string& name);
std::string getThreadName(int worker_id);

}

#define LOG_ERROR(msg) ::designex::Logger::error(msg)
#define LOG_WARN(msg)  ::designex::Logger::warn(msg)
#define LOG_INFO(msg)  ::designex::Logger::info(msg)
#define LOG_DEBUG(msg) ::designex::Logger::debug(msg)
#define LOG_TRACE(msg) ::designex::Logger::trace(msg)
