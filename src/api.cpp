/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "designex/api.hpp"
#include "designex/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>

namespace designex {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

ApiResponse jsonResponse(int status, const nlohmann::json& body) {
    ApiResponse response;
    response.status = status;
    response.body = body.dump();
    return response;
}

ApiResponse errorResponse(int status, const std::string& kind) {
    return jsonResponse(status, nlohmann::json{{"error", kind}});
}

// Avoids float noise such as 0.300000012 in the JSON output
double roundedAlpha(float alpha) {
    return std::round(static_cast<double>(alpha) * 1e6) / 1e6;
}
}

void to_json(nlohmann::json& j, const StyleRecommendation& rec) {
    j = nlohmann::json{
        {"color", rec.color},
        {"texture", rec.texture},
        {"material", rec.material},
        {"finish", rec.finish},
        {"rating", rec.rating},
        {"keywords", rec.keywords}
    };
}

void to_json(nlohmann::json& j, const DesignResponse& response) {
    j = nlohmann::json{
        {"originalImageUrl", response.originalImageUrl},
        {"styledImageUrl", response.styledImageUrl},
        {"blendedImageUrl", response.blendedImageUrl},
        {"selectedStyle", response.selectedStyle},
        {"blendAlpha", roundedAlpha(response.blendAlpha)},
        {"regionRecommendations", response.regionRecommendations}
    };
}

std::optional<float> parseBlendAlpha(const std::string& text) noexcept {
    try {
        std::size_t used = 0;
        float value = std::stof(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Api::Api(Pipeline& pipeline, const StyleIndex& index) noexcept
    : pipeline_(pipeline), index_(index) {
}

ApiResponse Api::postDesign(const std::string& imageBytes, const std::string& style,
                            const std::optional<std::string>& blendAlpha) noexcept {
    try {
        DesignRequest request;
        request.style = style;
        if (blendAlpha && !blendAlpha->empty()) {
            request.blendAlpha = parseBlendAlpha(*blendAlpha);
            if (!request.blendAlpha) {
                LOG_WARN("Invalid request parameters: blend factor '" + *blendAlpha + "'");
                return errorResponse(400, toString(PipelineError::InvalidRequest));
            }
        }

        DesignResult result = pipeline_.process(imageBytes, request);
        if (!result) {
            if (isClientError(result.error)) {
                LOG_WARN("Invalid request parameters: " + result.message);
            } else {
                LOG_ERROR("Error processing image: " + result.message);
            }
            return errorResponse(statusFor(result.error), toString(result.error));
        }
        return jsonResponse(200, nlohmann::json(result.response));
    } catch (const std::exception& e) {
        LOG_ERROR("Error building design response: " + std::string(e.what()));
        return errorResponse(500, "internal_error");
    }
}

ApiResponse Api::getImage(const std::string& filename) const noexcept {
    try {
        auto path = pipeline_.workspaces().resolve(filename);
        if (!path) {
            return errorResponse(404, "not_found");
        }

        std::ifstream file(*path, std::ios::binary);
        if (!file) {
            return errorResponse(404, "not_found");
        }
        ApiResponse response;
        response.body.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            LOG_ERROR("Error reading image file: " + path->string());
            return errorResponse(500, "internal_error");
        }
        response.contentType = contentTypeFor(filename);
        response.headers.emplace_back("Content-Disposition", "inline; filename=\"" + filename + "\"");
        return response;
    } catch (const std::exception& e) {
        LOG_ERROR("Error reading image file: " + std::string(e.what()));
        return errorResponse(500, "internal_error");
    }
}

ApiResponse Api::getStyles() const noexcept {
    try {
        nlohmann::json styles = nlohmann::json::array();
        for (const auto& name : index_.allStyles()) {
            styles.push_back({{"name", name}, {"description", "Design style: " + name}});
        }
        return jsonResponse(200, styles);
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing styles: " + std::string(e.what()));
        return errorResponse(500, "internal_error");
    }
}

ApiResponse Api::getRegions() const noexcept {
    try {
        nlohmann::json regions = nlohmann::json::array();
        for (const auto& type : index_.allRegionTypes()) {
            regions.push_back({{"type", type}, {"description", "Region type: " + type}});
        }
        return jsonResponse(200, regions);
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing regions: " + std::string(e.what()));
        return errorResponse(500, "internal_error");
    }
}

ApiResponse Api::getRecommendations(const std::string& style, const std::string& region) const noexcept {
    try {
        Recommendations recommendations = index_.recommendationsFor(region, style);
        if (recommendations.empty()) {
            return errorResponse(404, "not_found");
        }
        return jsonResponse(200, nlohmann::json(recommendations));
    } catch (const std::exception& e) {
        LOG_ERROR("Error looking up recommendations: " + std::string(e.what()));
        return errorResponse(500, "internal_error");
    }
}

std::string Api::contentTypeFor(const std::string& filename) {
    std::string name = toLowerCopy(filename);
    auto endsWith = [&](const char* ext) {
        std::string suffix(ext);
        return name.size() >= suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    if (endsWith(".png")) return "image/png";
    if (endsWith(".jpg") || endsWith(".jpeg")) return "image/jpeg";
    if (endsWith(".gif")) return "image/gif";
    return "application/octet-stream";
}

int Api::statusFor(PipelineError error) noexcept {
    if (error == PipelineError::None) {
        return 200;
    }
    return isClientError(error) ? 400 : 500;
}

}
