/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace designex {

struct StyleRecommendation {
    std::string color;
    std::string texture;
    std::string material;
    std::string finish;
    double rating = 0.0;
    std::vector<std::string> keywords;
};

using Recommendations = std::vector<StyleRecommendation>;

// One loaded catalog. Never modified after parsing.
class StyleCatalog final {
public:
    StyleCatalog() = default;

    [[nodiscard]] bool styleExists(const std::string& style) const noexcept;
    [[nodiscard]] const std::vector<std::string>& regions() const noexcept { return regions_; }
    [[nodiscard]] const std::vector<std::string>& styles() const noexcept { return styles_; }
    [[nodiscard]] Recommendations recommendationsFor(const std::string& region, const std::string& style) const;
    [[nodiscard]] bool empty() const noexcept { return regions_.empty(); }

private:
    friend class CatalogParser;

    std::vector<std::string> regions_;   // catalog order
    std::vector<std::string> styles_;    // first-seen order
    std::unordered_map<std::string, std::unordered_map<std::string, Recommendations>> entries_;
};

enum class CatalogError : uint8_t {
    None = 0,
    NotFound,
    IoError,
    ParseError,
    InvalidSchema
};

struct CatalogLoadResult {
    bool ok = false;
    std::shared_ptr<const StyleCatalog> catalog;
    CatalogError error = CatalogError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] CatalogLoadResult parseCatalog(const std::string& json) noexcept;
[[nodiscard]] CatalogLoadResult readCatalog(const std::filesystem::path& path) noexcept;

/*
 * Read-only view over the current catalog snapshot. Queries grab the snapshot
 * pointer and read it without further locking; reload() swaps the pointer.
 * A failed initial load leaves an empty, degraded index.
 */
class StyleIndex final {
public:
    StyleIndex();

    StyleIndex(const StyleIndex&) = delete;
    StyleIndex& operator=(const StyleIndex&) = delete;
    StyleIndex(StyleIndex&&) = delete;
    StyleIndex& operator=(StyleIndex&&) = delete;

    CatalogLoadResult load(const std::filesystem::path& path) noexcept;
    CatalogLoadResult loadJson(const std::string& json) noexcept;
    // Keeps the current snapshot if the new catalog fails to load
    CatalogLoadResult reload(const std::filesystem::path& path) noexcept;

    [[nodiscard]] bool styleExists(const std::string& style) const noexcept;
    [[nodiscard]] std::vector<std::string> allRegionTypes() const;
    [[nodiscard]] std::vector<std::string> allStyles() const;
    [[nodiscard]] Recommendations recommendationsFor(const std::string& region, const std::string& style) const;

    [[nodiscard]] bool degraded() const noexcept;
    [[nodiscard]] std::shared_ptr<const StyleCatalog> snapshot() const noexcept;

private:
    CatalogLoadResult install(CatalogLoadResult result, bool keepPrevious) noexcept;

    mutable std::mutex mutex_;
    std::shared_ptr<const StyleCatalog> snapshot_;
    bool degraded_ = true;
};

const char* toString(CatalogError error) noexcept;

}
