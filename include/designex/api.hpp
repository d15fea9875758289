/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "designex/pipeline.hpp"
#include "designex/style_index.hpp"

namespace designex {

struct ApiResponse {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
};

// Transport-neutral handlers for the HTTP surface. The hosting server owns
// routing and multipart parsing and forwards the decoded fields here.
class Api final {
public:
    Api(Pipeline& pipeline, const StyleIndex& index) noexcept;

    Api(const Api&) = delete;
    Api& operator=(const Api&) = delete;

    // POST /designs
    [[nodiscard]] ApiResponse postDesign(const std::string& imageBytes, const std::string& style,
                                         const std::optional<std::string>& blendAlpha) noexcept;
    // GET /designs/images/{id}
    [[nodiscard]] ApiResponse getImage(const std::string& filename) const noexcept;
    // GET /styles
    [[nodiscard]] ApiResponse getStyles() const noexcept;
    // GET /styles/regions
    [[nodiscard]] ApiResponse getRegions() const noexcept;
    // GET /styles/{style}/regions/{region}
    [[nodiscard]] ApiResponse getRecommendations(const std::string& style, const std::string& region) const noexcept;

    [[nodiscard]] static std::string contentTypeFor(const std::string& filename);
    [[nodiscard]] static int statusFor(PipelineError error) noexcept;

private:
    Pipeline& pipeline_;
    const StyleIndex& index_;
};

void to_json(nlohmann::json& j, const StyleRecommendation& rec);
void to_json(nlohmann::json& j, const DesignResponse& response);

[[nodiscard]] std::optional<float> parseBlendAlpha(const std::string& text) noexcept;

}
