#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stagehand {

namespace fs = std::filesystem;

using Clock = std::chrono::steady_clock;
using Seconds = std::chrono::duration<double>;

// Pipeline-level run state
enum class RunState {
    INITIALIZING,
    RUNNING,
    PAUSED,
    COMPLETED,
    FAILED,
    HALTED
};

inline std::string run_state_to_string(RunState state) {
    switch (state) {
        case RunState::INITIALIZING: return "initializing";
        case RunState::RUNNING: return "running";
        case RunState::PAUSED: return "paused";
        case RunState::COMPLETED: return "completed";
        case RunState::FAILED: return "failed";
        case RunState::HALTED: return "halted";
        default: return "unknown";
    }
}

// Step/stage checkpoint marker status
enum class MarkerStatus {
    ABSENT,
    INITIALIZING,
    RUNNING,
    COMPLETED,
    FAILED
};

inline std::string marker_status_to_string(MarkerStatus status) {
    switch (status) {
        case MarkerStatus::ABSENT: return "absent";
        case MarkerStatus::INITIALIZING: return "initializing";
        case MarkerStatus::RUNNING: return "running";
        case MarkerStatus::COMPLETED: return "completed";
        case MarkerStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

inline MarkerStatus string_to_marker_status(const std::string& s) {
    if (s == "initializing") return MarkerStatus::INITIALIZING;
    if (s == "running") return MarkerStatus::RUNNING;
    if (s == "completed") return MarkerStatus::COMPLETED;
    if (s == "failed") return MarkerStatus::FAILED;
    return MarkerStatus::ABSENT;
}

// A marker left behind by work that never reached a terminal status.
inline bool is_unfinished(MarkerStatus status) {
    return status == MarkerStatus::INITIALIZING ||
           status == MarkerStatus::RUNNING ||
           status == MarkerStatus::FAILED;
}

enum class RecoverMode {
    NONE,
    MANUAL,
    DYNAMIC
};

inline std::string recover_mode_to_string(RecoverMode mode) {
    switch (mode) {
        case RecoverMode::NONE: return "none";
        case RecoverMode::MANUAL: return "manual";
        case RecoverMode::DYNAMIC: return "dynamic";
        default: return "unknown";
    }
}

enum class Decision {
    SKIP,
    RUN,
    FORCE_RERUN
};

inline std::string decision_to_string(Decision d) {
    switch (d) {
        case Decision::SKIP: return "skip";
        case Decision::RUN: return "run";
        case Decision::FORCE_RERUN: return "force_rerun";
        default: return "unknown";
    }
}

enum class CleanupPolicy {
    ALWAYS,
    ONLY_ON_FAILURE
};

inline std::string cleanup_policy_to_string(CleanupPolicy p) {
    return p == CleanupPolicy::ALWAYS ? "always" : "only_on_failure";
}

inline std::optional<CleanupPolicy> string_to_cleanup_policy(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(norm.begin(), norm.end(), '-', '_');
    if (norm == "always") return CleanupPolicy::ALWAYS;
    if (norm == "only_on_failure" || norm == "on_failure") return CleanupPolicy::ONLY_ON_FAILURE;
    return std::nullopt;
}

// Identifies a checkpoint marker inside one pipeline. An empty step names
// the stage-level boundary marker.
struct CheckpointKey {
    std::string stage;
    std::string step;

    bool is_stage() const { return step.empty(); }

    std::string to_string() const {
        return step.empty() ? stage : stage + "/" + step;
    }

    bool operator==(const CheckpointKey& o) const {
        return stage == o.stage && step == o.step;
    }
    bool operator!=(const CheckpointKey& o) const { return !(*this == o); }
};

enum class ExitKind {
    SUCCESS,
    FAILED,
    KILLED_BY_SIGNAL
};

struct ExitOutcome {
    ExitKind kind = ExitKind::SUCCESS;
    int exit_code = 0;
    int signal = 0;
    bool interrupted = false;   // termination was requested by the pipeline
    Seconds duration{0.0};
    long max_rss_kb = 0;

    bool ok() const { return kind == ExitKind::SUCCESS; }
};

inline std::string exit_outcome_to_string(const ExitOutcome& o) {
    switch (o.kind) {
        case ExitKind::SUCCESS: return "success";
        case ExitKind::FAILED: return "failed(" + std::to_string(o.exit_code) + ")";
        case ExitKind::KILLED_BY_SIGNAL: return "signal(" + std::to_string(o.signal) + ")";
        default: return "unknown";
    }
}

enum class StageOutcome {
    COMPLETED,
    HALTED_AT_CHECKPOINT,
    FAILED
};

inline std::string stage_outcome_to_string(StageOutcome o) {
    switch (o) {
        case StageOutcome::COMPLETED: return "completed";
        case StageOutcome::HALTED_AT_CHECKPOINT: return "halted_at_checkpoint";
        case StageOutcome::FAILED: return "failed";
        default: return "unknown";
    }
}

enum class MissingTargetPolicy {
    WARN,
    RERUN,
    FAIL
};

inline std::string missing_target_policy_to_string(MissingTargetPolicy p) {
    switch (p) {
        case MissingTargetPolicy::WARN: return "warn";
        case MissingTargetPolicy::RERUN: return "rerun";
        case MissingTargetPolicy::FAIL: return "fail";
        default: return "unknown";
    }
}

inline std::optional<MissingTargetPolicy> string_to_missing_target_policy(const std::string& s) {
    if (s == "warn") return MissingTargetPolicy::WARN;
    if (s == "rerun") return MissingTargetPolicy::RERUN;
    if (s == "fail") return MissingTargetPolicy::FAIL;
    return std::nullopt;
}

} // namespace stagehand
