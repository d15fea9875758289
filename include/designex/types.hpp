/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace designex {

// Worker job lifecycle. Completed, TimedOut, Failed and Interrupted are terminal.
enum class JobState : std::uint8_t { Created, Running, Completed, TimedOut, Failed, Interrupted };

// Workspace identifier: "<yyyyMMdd_HHmmss>_<counter>_<random hex>"
using WorkspaceId = std::string;

[[nodiscard]] inline bool isTerminal(JobState state) noexcept {
    return state == JobState::Completed || state == JobState::TimedOut ||
           state == JobState::Failed || state == JobState::Interrupted;
}

[[nodiscard]] inline const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Created:     return "created";
        case JobState::Running:     return "running";
        case JobState::Completed:   return "completed";
        case JobState::TimedOut:    return "timed_out";
        case JobState::Failed:      return "failed";
        case JobState::Interrupted: return "interrupted";
        default: return "unknown";
    }
}

} // namespace designex
