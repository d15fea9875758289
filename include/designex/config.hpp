/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace designex {

// Upper bound on any worker job
inline constexpr std::chrono::hours kMaxJobTimeout{24};

struct Config {
    // Program plus any fixed leading arguments, e.g. {"python3", "python/seg.py"}
    std::vector<std::string> workerCommand{"python3", "python/seg.py"};
    std::filesystem::path modelPath = "models/sam_vit_h.pth";
    std::filesystem::path styleLibraryPath = "style_library.json";
    std::filesystem::path outputDirectory = "output";

    std::chrono::milliseconds jobTimeout = std::chrono::minutes(5);
    std::size_t maxUploadBytes = 50ULL * 1024 * 1024;
    std::string imageRoute = "/api/designs/images/";
    float defaultBlendAlpha = 0.5f;

    int workers = 4;
    std::chrono::hours retentionMaxAge{0}; // 0 disables pruning

    // Defaults overridden by DESIGNEX_* environment variables
    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] bool retentionEnabled() const noexcept { return retentionMaxAge.count() > 0; }
};

[[nodiscard]] std::vector<std::string> splitCommand(const std::string& command);

// Whole seconds, as given to DESIGNEX_JOB_TIMEOUT_SEC or --timeout.
// nullopt unless positive; values past kMaxJobTimeout are clamped to it.
[[nodiscard]] std::optional<std::chrono::milliseconds> parseJobTimeout(const std::string& seconds);

}
