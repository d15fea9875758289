/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "designex/logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace designex {

namespace {
std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::INFO)};
std::once_flag g_env_once;
std::mutex g_write_mutex;
std::ostream* g_stream = nullptr; // guarded by g_write_mutex

// Job reader threads come and go, so names live with the thread
thread_local std::string t_thread_name;

LogLevel envLevel() noexcept {
    const char* value = std::getenv("DESIGNEX_LOG_LEVEL");
    if (!value) {
        return LogLevel::INFO;
    }
    return Logger::parseLevel(value, LogLevel::INFO);
}

void loadEnvOnce() noexcept {
    try {
        std::call_once(g_env_once, [] {
            g_level.store(static_cast<uint8_t>(envLevel()));
        });
    } catch (...) {
        // call_once only throws on system errors; keep the current level
    }
}

std::string currentThreadLabel() {
    if (!t_thread_name.empty()) {
        return t_thread_name;
    }
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}
}

void Logger::setLevel(LogLevel level) noexcept {
    loadEnvOnce();
    g_level.store(static_cast<uint8_t>(level));
}

void Logger::initFromEnv() noexcept {
    loadEnvOnce();
    g_level.store(static_cast<uint8_t>(envLevel()));
}

LogLevel Logger::level() noexcept {
    loadEnvOnce();
    return static_cast<LogLevel>(g_level.load());
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

void Logger::setStream(std::ostream* out) noexcept {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    g_stream = out;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto seconds = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
             << " [" << levelToString(level) << "]"
             << " [" << currentThreadLabel() << "]"
             << " " << message << '\n';

        // stdout is reserved for command results
        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::ostream& out = g_stream ? *g_stream : std::cerr;
        out << line.str() << std::flush;
    } catch (...) {
        // Logging must never throw into the caller
    }
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) noexcept {
    try {
        std::string lowered;
        lowered.reserve(name.size());
        for (unsigned char c : name) {
            lowered.push_back(static_cast<char>(std::tolower(c)));
        }

        if (lowered == "error") return LogLevel::ERROR;
        if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
        if (lowered == "info") return LogLevel::INFO;
        if (lowered == "debug") return LogLevel::DEBUG;
        if (lowered == "trace") return LogLevel::TRACE;
        return fallback;
    } catch (...) {
        return fallback;
    }
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    t_thread_name = name;
}

std::string getThreadName(int worker_id) {
    return "Worker-" + std::to_string(worker_id);
}

}
