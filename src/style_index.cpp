/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "designex/style_index.hpp"
#include "designex/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace designex {

using ordered_json = nlohmann::ordered_json;

class CatalogParser {
public:
    static CatalogLoadResult parse(const std::string& text) noexcept {
        try {
            ordered_json root = ordered_json::parse(text);
            if (!root.is_object()) {
                return fail(CatalogError::InvalidSchema, "Catalog root must be an object of region types");
            }

            auto catalog = std::make_shared<StyleCatalog>();
            for (const auto& region : root.items()) {
                if (!region.value().is_object()) {
                    return fail(CatalogError::InvalidSchema, "Region '" + region.key() + "' must map style names to lists");
                }
                catalog->regions_.push_back(region.key());
                auto& styles = catalog->entries_[region.key()];

                for (const auto& style : region.value().items()) {
                    if (!style.value().is_array()) {
                        return fail(CatalogError::InvalidSchema,
                                    "Style '" + style.key() + "' in region '" + region.key() + "' must be a list");
                    }
                    Recommendations recommendations;
                    recommendations.reserve(style.value().size());
                    for (const auto& item : style.value()) {
                        recommendations.push_back(parseRecommendation(item));
                    }
                    styles[style.key()] = std::move(recommendations);

                    auto& known = catalog->styles_;
                    if (std::find(known.begin(), known.end(), style.key()) == known.end()) {
                        known.push_back(style.key());
                    }
                }
            }

            CatalogLoadResult result;
            result.ok = true;
            result.catalog = std::move(catalog);
            return result;
        } catch (const ordered_json::parse_error& e) {
            return fail(CatalogError::ParseError, e.what());
        } catch (const std::exception& e) {
            return fail(CatalogError::InvalidSchema, e.what());
        }
    }

private:
    static StyleRecommendation parseRecommendation(const ordered_json& item) {
        if (!item.is_object()) {
            throw std::runtime_error("Recommendation entries must be objects");
        }
        StyleRecommendation rec;
        rec.color = item.value("color", std::string{});
        rec.texture = item.value("texture", std::string{});
        rec.material = item.value("material", std::string{});
        rec.finish = item.value("finish", std::string{});
        rec.rating = item.value("rating", 0.0);
        if (item.contains("keywords") && !item.at("keywords").is_null()) {
            rec.keywords = item.at("keywords").get<std::vector<std::string>>();
        }
        return rec;
    }

    static CatalogLoadResult fail(CatalogError error, std::string message) {
        CatalogLoadResult result;
        result.error = error;
        result.message = std::move(message);
        return result;
    }
};

bool StyleCatalog::styleExists(const std::string& style) const noexcept {
    if (style.empty()) {
        return false;
    }
    return std::find(styles_.begin(), styles_.end(), style) != styles_.end();
}

Recommendations StyleCatalog::recommendationsFor(const std::string& region, const std::string& style) const {
    auto regionIt = entries_.find(region);
    if (regionIt == entries_.end()) {
        return {};
    }
    auto styleIt = regionIt->second.find(style);
    if (styleIt == regionIt->second.end()) {
        return {};
    }
    return styleIt->second;
}

CatalogLoadResult parseCatalog(const std::string& json) noexcept {
    return CatalogParser::parse(json);
}

CatalogLoadResult readCatalog(const std::filesystem::path& path) noexcept {
    CatalogLoadResult result;
    try {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            result.error = CatalogError::NotFound;
            result.message = "Style library not found: " + path.string();
            return result;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            result.error = CatalogError::IoError;
            result.message = "Failed to open style library: " + path.string();
            return result;
        }
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        if (file.bad()) {
            result.error = CatalogError::IoError;
            result.message = "Failed to read style library: " + path.string();
            return result;
        }
        return CatalogParser::parse(content);
    } catch (const std::exception& e) {
        result.error = CatalogError::IoError;
        result.message = e.what();
        return result;
    }
}

StyleIndex::StyleIndex() : snapshot_(std::make_shared<const StyleCatalog>()) {
}

CatalogLoadResult StyleIndex::load(const std::filesystem::path& path) noexcept {
    LOG_DEBUG("Loading style library: " + path.string());
    return install(readCatalog(path), false);
}

CatalogLoadResult StyleIndex::loadJson(const std::string& json) noexcept {
    return install(parseCatalog(json), false);
}

CatalogLoadResult StyleIndex::reload(const std::filesystem::path& path) noexcept {
    LOG_DEBUG("Reloading style library: " + path.string());
    return install(readCatalog(path), true);
}

CatalogLoadResult StyleIndex::install(CatalogLoadResult result, bool keepPrevious) noexcept {
    if (result.ok) {
        std::size_t regions = result.catalog->regions().size();
        std::size_t styles = result.catalog->styles().size();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot_ = result.catalog;
            degraded_ = false;
        }
        LOG_INFO("Style library loaded: " + std::to_string(regions) + " region types, " +
                 std::to_string(styles) + " styles");
        return result;
    }

    if (keepPrevious) {
        LOG_ERROR("Style library reload failed, keeping previous catalog: " + result.message);
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_ = std::make_shared<const StyleCatalog>();
        degraded_ = true;
    }
    LOG_ERROR("Failed to load style library (" + std::string(toString(result.error)) + "): " +
              result.message + " - serving with an empty catalog");
    return result;
}

bool StyleIndex::styleExists(const std::string& style) const noexcept {
    return snapshot()->styleExists(style);
}

std::vector<std::string> StyleIndex::allRegionTypes() const {
    return snapshot()->regions();
}

std::vector<std::string> StyleIndex::allStyles() const {
    return snapshot()->styles();
}

Recommendations StyleIndex::recommendationsFor(const std::string& region, const std::string& style) const {
    return snapshot()->recommendationsFor(region, style);
}

bool StyleIndex::degraded() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return degraded_;
}

std::shared_ptr<const StyleCatalog> StyleIndex::snapshot() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

const char* toString(CatalogError error) noexcept {
    switch (error) {
        case CatalogError::None:          return "none";
        case CatalogError::NotFound:      return "not_found";
        case CatalogError::IoError:       return "io_error";
        case CatalogError::ParseError:    return "parse_error";
        case CatalogError::InvalidSchema: return "invalid_schema";
        default: return "unknown";
    }
}

}
