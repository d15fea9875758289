/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "designex/workspace.hpp"
#include "designex/logger.hpp"
#include <atomic>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace designex {

namespace {
bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

uint32_t randomComponent() {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);
    return dist(engine);
}
}

WorkspaceAllocator::WorkspaceAllocator(const std::filesystem::path& directory, Clock clock)
    : directory_(directory), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
    if (!ensureDirectory()) {
        LOG_ERROR("Failed to initialize output directory: " + directory_.string());
    }
}

Workspace WorkspaceAllocator::allocate() const {
    WorkspaceId id = generateId();
    auto pathFor = [&](const char* suffix) {
        return directory_ / (id + suffix + kExtension);
    };

    Workspace workspace{id, pathFor(kOriginalSuffix), pathFor(kStyledSuffix), pathFor(kBlendedSuffix)};
    LOG_DEBUG("Allocated workspace: " + id);
    return workspace;
}

// The counter alone makes ids unique within the process; the random part
// separates processes that restart inside the same second.
WorkspaceId WorkspaceAllocator::generateId() const {
    static std::atomic<uint64_t> counter{0};
    uint64_t unique_counter = counter.fetch_add(1);

    auto time = std::chrono::system_clock::to_time_t(clock_());
    std::tm local{};
    localtime_r(&time, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y%m%d_%H%M%S")
       << "_" << std::setfill('0') << std::setw(6) << unique_counter
       << "_" << std::hex << std::setw(6) << randomComponent();
    return ss.str();
}

PersistResult WorkspaceAllocator::persist(const Workspace& workspace, const std::string& bytes) const noexcept {
    if (!ensureDirectory()) {
        return {false, PersistError::DirectoryError, "Output directory unavailable: " + directory_.string()};
    }

    try {
        auto tempPath = workspace.original;
        tempPath += ".part";
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                return {false, PersistError::IoError, "Failed to open " + tempPath.string()};
            }
            file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            file.flush();
            if (!file.good()) {
                std::error_code ec;
                std::filesystem::remove(tempPath, ec);
                return {false, PersistError::IoError, "Failed to write " + tempPath.string()};
            }
        }

        std::error_code ec;
        std::filesystem::rename(tempPath, workspace.original, ec);
        if (ec) {
            std::filesystem::remove(tempPath, ec);
            return {false, PersistError::IoError, "Failed to publish upload: " + workspace.original.string()};
        }

        LOG_DEBUG("Upload persisted: " + workspace.original.string() + " (" + std::to_string(bytes.size()) + " bytes)");
        return {true, PersistError::None, ""};
    } catch (const std::exception& e) {
        return {false, PersistError::IoError, e.what()};
    } catch (...) {
        return {false, PersistError::IoError, "Unknown error persisting upload"};
    }
}

std::optional<std::filesystem::path> WorkspaceAllocator::resolve(const std::string& filename) const noexcept {
    try {
        if (filename.empty() || filename.front() == '.' ||
            filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos) {
            LOG_DEBUG("Rejected artifact name: " + filename);
            return std::nullopt;
        }
        // Temp files and anything else sharing the directory stay private
        if (!isArtifactName(filename)) {
            return std::nullopt;
        }

        auto path = directory_ / filename;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return std::nullopt;
        }
        return path;
    } catch (...) {
        return std::nullopt;
    }
}

std::size_t WorkspaceAllocator::prune(std::chrono::seconds maxAge) const noexcept {
    std::size_t removed = 0;
    try {
        std::error_code ec;
        if (!std::filesystem::is_directory(directory_, ec)) {
            return 0;
        }

        auto cutoff = std::filesystem::file_time_type::clock::now() - maxAge;
        for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
            if (!entry.is_regular_file(ec)) {
                continue;
            }
            std::string name = entry.path().filename().string();
            if (!isArtifactName(name)) {
                continue;
            }
            auto modified = entry.last_write_time(ec);
            if (ec || modified >= cutoff) {
                continue;
            }
            if (std::filesystem::remove(entry.path(), ec)) {
                ++removed;
                LOG_TRACE("Pruned artifact: " + name);
            } else if (ec) {
                LOG_WARN("Failed to prune " + name + ": " + ec.message());
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error pruning artifacts: " + std::string(e.what()));
    }

    if (removed > 0) {
        LOG_INFO("Pruned " + std::to_string(removed) + " expired artifact(s)");
    }
    return removed;
}

bool WorkspaceAllocator::isArtifactName(const std::string& filename) noexcept {
    try {
        const std::string ext = kExtension;
        return endsWith(filename, std::string(kOriginalSuffix) + ext) ||
               endsWith(filename, std::string(kStyledSuffix) + ext) ||
               endsWith(filename, std::string(kBlendedSuffix) + ext);
    } catch (...) {
        return false;
    }
}

bool WorkspaceAllocator::ensureDirectory() const noexcept {
    try {
        std::filesystem::create_directories(directory_);
        return std::filesystem::is_directory(directory_);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create output directory: " + std::string(e.what()));
        return false;
    } catch (...) {
        return false;
    }
}

}
