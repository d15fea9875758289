/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "designex/pipeline.hpp"
#include "designex/logger.hpp"
#include <cmath>

namespace designex {

Pipeline::Pipeline(const Config& config, const StyleIndex& index, JobExecutor& executor)
    : config_(config), index_(index), executor_(executor), allocator_(config.outputDirectory) {
    LOG_DEBUG("Pipeline created - output: " + config_.outputDirectory.string() +
              ", model: " + config_.modelPath.string() +
              ", style library: " + config_.styleLibraryPath.string());
}

DesignResult Pipeline::process(const std::string& imageBytes, const DesignRequest& request) noexcept {
    try {
        // Step 1: validate before anything touches disk or spawns
        if (!index_.styleExists(request.style)) {
            LOG_WARN("Rejected design request, unknown style: '" + request.style + "'" +
                     (index_.degraded() ? " (style library unavailable)" : ""));
            return reject(PipelineError::UnknownStyle, "Style not found: " + request.style);
        }
        if (request.blendAlpha &&
            (std::isnan(*request.blendAlpha) || *request.blendAlpha < 0.0f || *request.blendAlpha > 1.0f)) {
            return reject(PipelineError::InvalidRequest, "Blend factor must be within [0.0, 1.0]");
        }
        if (imageBytes.empty()) {
            return reject(PipelineError::InvalidRequest, "Uploaded image is empty");
        }
        if (imageBytes.size() > config_.maxUploadBytes) {
            return reject(PipelineError::InvalidRequest, "Uploaded image exceeds size limit (" +
                          std::to_string(config_.maxUploadBytes) + " bytes)");
        }

        // Step 2: allocate and persist the upload
        Workspace workspace = allocator_.allocate();
        DesignResult result;
        result.workspace = workspace.id;

        PersistResult persisted = allocator_.persist(workspace, imageBytes);
        if (!persisted) {
            LOG_ERROR("Failed to persist upload for " + workspace.id + ": " + persisted.message);
            result.error = PipelineError::UploadPersistFailure;
            result.message = "Failed to store uploaded image";
            return result;
        }

        // Step 3-4: single worker attempt
        JobResult job = executor_.run(buildInvocation(workspace, request));
        if (!isTerminal(job.state)) {
            LOG_ERROR("Executor returned unfinished job " + workspace.id + " (" + toString(job.state) + ")");
        }
        if (!job.ok()) {
            result.exitCode = job.exitCode;
            result.logExcerpt = job.tail(kLogExcerptLines);
            switch (job.state) {
                case JobState::TimedOut:
                    result.error = PipelineError::JobTimeout;
                    result.message = "Worker timed out";
                    break;
                case JobState::Interrupted:
                    result.error = PipelineError::JobInterrupted;
                    result.message = "Worker interrupted";
                    break;
                default:
                    result.error = PipelineError::JobFailed;
                    result.message = job.exitCode
                        ? "Worker failed with exit code " + std::to_string(*job.exitCode)
                        : "Worker failed to run" + (job.error.empty() ? std::string() : ": " + job.error);
                    break;
            }
            LOG_ERROR("Design job " + workspace.id + " " + toString(result.error) + ": " + result.message);
            for (const auto& line : result.logExcerpt) {
                LOG_DEBUG("[" + workspace.id + "] tail: " + line);
            }
            return result;
        }

        // Step 5-7: locators, recommendations, response
        DesignResponse& response = result.response;
        response.originalImageUrl = locatorFor(workspace.original);
        response.styledImageUrl = locatorFor(workspace.styled);
        response.blendedImageUrl = locatorFor(workspace.blended);
        response.selectedStyle = request.style;
        response.blendAlpha = request.blendAlpha.value_or(config_.defaultBlendAlpha);
        response.regionRecommendations = collectRecommendations(request.style);

        result.ok = true;
        LOG_INFO("Design job " + workspace.id + " completed: style " + request.style + ", " +
                 std::to_string(response.regionRecommendations.size()) + " region(s) with recommendations");
        return result;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing design request: " + std::string(e.what()));
        DesignResult result;
        result.error = PipelineError::JobFailed;
        result.message = "Internal processing error";
        return result;
    }
}

std::string Pipeline::locatorFor(const std::filesystem::path& artifact) const {
    return config_.imageRoute + artifact.filename().string();
}

JobInvocation Pipeline::buildInvocation(const Workspace& workspace, const DesignRequest& request) const {
    JobInvocation invocation;
    invocation.command = config_.workerCommand;
    invocation.input = workspace.original;
    invocation.styledOutput = workspace.styled;
    invocation.blendedOutput = workspace.blended;
    invocation.style = request.style;
    invocation.modelPath = config_.modelPath;
    invocation.styleLibraryPath = config_.styleLibraryPath;
    invocation.blendAlpha = request.blendAlpha;
    invocation.timeout = config_.jobTimeout;
    invocation.label = workspace.id;
    return invocation;
}

std::map<std::string, Recommendations> Pipeline::collectRecommendations(const std::string& style) const {
    // One snapshot for the whole merge so a concurrent reload can't mix catalogs
    auto catalog = index_.snapshot();
    std::map<std::string, Recommendations> merged;
    for (const auto& region : catalog->regions()) {
        Recommendations recommendations = catalog->recommendationsFor(region, style);
        if (!recommendations.empty()) {
            merged.emplace(region, std::move(recommendations));
        }
    }
    return merged;
}

DesignResult Pipeline::reject(PipelineError error, std::string message) const {
    DesignResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

bool isClientError(PipelineError error) noexcept {
    return error == PipelineError::UnknownStyle || error == PipelineError::InvalidRequest;
}

const char* toString(PipelineError error) noexcept {
    switch (error) {
        case PipelineError::None:                 return "none";
        case PipelineError::UnknownStyle:         return "unknown_style";
        case PipelineError::InvalidRequest:       return "invalid_request";
        case PipelineError::UploadPersistFailure: return "upload_persist_failure";
        case PipelineError::JobTimeout:           return "job_timeout";
        case PipelineError::JobFailed:            return "job_failed";
        case PipelineError::JobInterrupted:       return "job_interrupted";
        default: return "unknown";
    }
}

}
