/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "designex/config.hpp"
#include "designex/logger.hpp"
#include <cstdlib>
#include <stdexcept>
#include <sstream>

namespace designex {

namespace {
std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    // stoull accepts "-5" and wraps it
    if (std::string(val).find('-') != std::string::npos) {
        LOG_WARN(std::string("Ignoring negative ") + name + "=" + val);
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (...) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

long env_long(const char* name, long defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        long parsed = std::stol(val);
        return parsed < 0 ? defv : parsed;
    } catch (...) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

const char* env_str(const char* name) {
    const char* val = std::getenv(name);
    return (val && *val) ? val : nullptr;
}
}

std::optional<std::chrono::milliseconds> parseJobTimeout(const std::string& seconds) {
    if (seconds.empty() || seconds.find('-') != std::string::npos) {
        return std::nullopt;
    }
    const auto limit = std::chrono::duration_cast<std::chrono::seconds>(kMaxJobTimeout);
    unsigned long long parsed = 0;
    try {
        std::size_t used = 0;
        parsed = std::stoull(seconds, &used);
        if (used != seconds.size()) {
            return std::nullopt;
        }
    } catch (const std::out_of_range&) {
        parsed = static_cast<unsigned long long>(limit.count()) + 1;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    if (parsed == 0) {
        return std::nullopt;
    }
    if (parsed > static_cast<unsigned long long>(limit.count())) {
        LOG_WARN("Job timeout " + seconds + "s exceeds the limit, using " +
                 std::to_string(limit.count()) + "s");
        return std::chrono::milliseconds(kMaxJobTimeout);
    }
    return std::chrono::seconds(static_cast<long long>(parsed));
}

std::vector<std::string> splitCommand(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream in(command);
    std::string part;
    while (in >> part) {
        parts.push_back(part);
    }
    return parts;
}

Config Config::fromEnv() {
    Config config;

    if (const char* worker = env_str("DESIGNEX_WORKER")) {
        auto parts = splitCommand(worker);
        if (!parts.empty()) {
            config.workerCommand = std::move(parts);
        }
    }
    if (const char* model = env_str("DESIGNEX_MODEL_PATH")) {
        config.modelPath = model;
    }
    if (const char* library = env_str("DESIGNEX_STYLE_LIBRARY")) {
        config.styleLibraryPath = library;
    }
    if (const char* output = env_str("DESIGNEX_OUTPUT_DIR")) {
        config.outputDirectory = output;
    }
    if (const char* route = env_str("DESIGNEX_IMAGE_ROUTE")) {
        config.imageRoute = route;
    }

    if (const char* timeout = env_str("DESIGNEX_JOB_TIMEOUT_SEC")) {
        if (auto parsed = parseJobTimeout(timeout)) {
            config.jobTimeout = *parsed;
        } else {
            LOG_WARN(std::string("Ignoring invalid DESIGNEX_JOB_TIMEOUT_SEC=") + timeout);
        }
    }
    config.maxUploadBytes = env_size("DESIGNEX_MAX_UPLOAD_BYTES", config.maxUploadBytes);
    config.workers = static_cast<int>(env_size("DESIGNEX_WORKERS", static_cast<std::size_t>(config.workers)));
    config.retentionMaxAge = std::chrono::hours(env_long("DESIGNEX_RETENTION_HOURS", 0));

    return config;
}

}
