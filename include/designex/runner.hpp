/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

#include "designex/types.hpp"

namespace designex {

struct JobInvocation {
    // Worker program plus fixed leading arguments (interpreter, script)
    std::vector<std::string> command;

    std::filesystem::path input;
    std::filesystem::path styledOutput;
    std::filesystem::path blendedOutput;
    std::string style;
    std::filesystem::path modelPath;
    std::filesystem::path styleLibraryPath;
    std::optional<float> blendAlpha;

    std::chrono::milliseconds timeout = std::chrono::minutes(5);
    std::string label; // log prefix, usually the workspace id

    // Full argv: command followed by the worker's flags
    [[nodiscard]] std::vector<std::string> arguments() const;
};

struct JobResult {
    JobState state = JobState::Created;
    std::optional<int> exitCode;
    std::vector<std::string> log;
    pid_t pid = -1;
    std::chrono::milliseconds elapsed{0};
    std::string error; // spawn or wait failure, empty otherwise

    [[nodiscard]] bool ok() const noexcept { return state == JobState::Completed; }
    [[nodiscard]] std::vector<std::string> tail(std::size_t lines) const;
};

// Invocation -> Result boundary around the worker
class JobExecutor {
public:
    virtual ~JobExecutor() = default;
    [[nodiscard]] virtual JobResult run(const JobInvocation& invocation) = 0;
};

// Runs the worker as a child process: merged stdout/stderr is read and logged
// on a dedicated thread, the wait is bounded by the invocation timeout, and the
// child's process group is killed on timeout or shutdown.
class Runner final : public JobExecutor {
public:
    explicit Runner(const std::atomic<bool>* shutdownFlag = nullptr,
                    std::chrono::milliseconds pollInterval = std::chrono::milliseconds(10)) noexcept;

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;
    Runner(Runner&&) = delete;
    Runner& operator=(Runner&&) = delete;

    [[nodiscard]] JobResult run(const JobInvocation& invocation) override;

private:
    const std::atomic<bool>* shutdownFlag_;
    std::chrono::milliseconds pollInterval_;

    [[nodiscard]] bool shutdownRequested() const noexcept;
};

[[nodiscard]] std::string formatBlendAlpha(float alpha);

}
