/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "designex/config.hpp"
#include "designex/runner.hpp"
#include "designex/style_index.hpp"
#include "designex/workspace.hpp"

namespace designex {

struct DesignRequest {
    std::string style;
    std::optional<float> blendAlpha; // worker default when absent
};

struct DesignResponse {
    std::string originalImageUrl;
    std::string styledImageUrl;
    std::string blendedImageUrl;
    std::string selectedStyle;
    float blendAlpha = 0.5f;
    // Only regions with at least one recommendation for selectedStyle
    std::map<std::string, Recommendations> regionRecommendations;
};

enum class PipelineError : uint8_t {
    None = 0,
    UnknownStyle,
    InvalidRequest,
    UploadPersistFailure,
    JobTimeout,
    JobFailed,
    JobInterrupted
};

struct DesignResult {
    bool ok = false;
    DesignResponse response;
    PipelineError error = PipelineError::None;
    WorkspaceId workspace;
    std::optional<int> exitCode;
    std::vector<std::string> logExcerpt;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Input errors map to 4xx, everything else to 5xx
[[nodiscard]] bool isClientError(PipelineError error) noexcept;
[[nodiscard]] const char* toString(PipelineError error) noexcept;

class Pipeline final {
public:
    static constexpr std::size_t kLogExcerptLines = 20;

    Pipeline(const Config& config, const StyleIndex& index, JobExecutor& executor);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) = delete;
    Pipeline& operator=(Pipeline&&) = delete;

    [[nodiscard]] DesignResult process(const std::string& imageBytes, const DesignRequest& request) noexcept;

    [[nodiscard]] const WorkspaceAllocator& workspaces() const noexcept { return allocator_; }
    [[nodiscard]] std::string locatorFor(const std::filesystem::path& artifact) const;

private:
    Config config_;
    const StyleIndex& index_;
    JobExecutor& executor_;
    WorkspaceAllocator allocator_;

    [[nodiscard]] JobInvocation buildInvocation(const Workspace& workspace, const DesignRequest& request) const;
    [[nodiscard]] std::map<std::string, Recommendations> collectRecommendations(const std::string& style) const;
    [[nodiscard]] DesignResult reject(PipelineError error, std::string message) const;
};

}
