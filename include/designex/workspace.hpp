/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "designex/types.hpp"

namespace designex {

struct Workspace {
    WorkspaceId id;
    std::filesystem::path original;
    std::filesystem::path styled;
    std::filesystem::path blended;
};

enum class PersistError : uint8_t {
    None = 0,
    DirectoryError,
    IoError
};

struct PersistResult {
    bool ok = false;
    PersistError error = PersistError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class WorkspaceAllocator final {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr const char* kOriginalSuffix = "_original";
    static constexpr const char* kStyledSuffix = "_styled";
    static constexpr const char* kBlendedSuffix = "_blended";
    static constexpr const char* kExtension = ".png";

    explicit WorkspaceAllocator(const std::filesystem::path& directory, Clock clock = {});

    WorkspaceAllocator(const WorkspaceAllocator&) = delete;
    WorkspaceAllocator& operator=(const WorkspaceAllocator&) = delete;
    WorkspaceAllocator(WorkspaceAllocator&&) noexcept = default;
    WorkspaceAllocator& operator=(WorkspaceAllocator&&) noexcept = default;

    [[nodiscard]] Workspace allocate() const;
    [[nodiscard]] PersistResult persist(const Workspace& workspace, const std::string& bytes) const noexcept;

    // Maps a client-facing filename back to an artifact in the output directory
    [[nodiscard]] std::optional<std::filesystem::path> resolve(const std::string& filename) const noexcept;

    // Removes generated artifacts last modified more than maxAge ago
    std::size_t prune(std::chrono::seconds maxAge) const noexcept;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

    [[nodiscard]] static bool isArtifactName(const std::string& filename) noexcept;

private:
    std::filesystem::path directory_;
    Clock clock_;

    [[nodiscard]] bool ensureDirectory() const noexcept;
    [[nodiscard]] WorkspaceId generateId() const;
};

}
