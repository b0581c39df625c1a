#pragma once

#include "stagehand/core/types.hpp"

#include <optional>
#include <vector>

namespace stagehand::runner {

struct KeyState {
    CheckpointKey key;
    MarkerStatus status = MarkerStatus::ABSENT;
};

struct StepDecision {
    CheckpointKey key;
    Decision decision = Decision::RUN;
    MarkerStatus marker = MarkerStatus::ABSENT;
    bool implicit = false;   // skipped because it precedes the start checkpoint
};

struct RecoveryPlan {
    std::vector<StepDecision> decisions;
    std::optional<size_t> pivot;   // index of the first unfinished key
    RecoverMode mode = RecoverMode::NONE;
};

// Decides skip/run/force-rerun for every step key in sequence order.
// Keys before `start_index` are skipped without consulting their markers.
//
// none:            completed -> skip, anything else -> run
// manual, dynamic: the pivot is the first key (from start_index on) whose
//                  marker is initializing, running or failed. Completed keys
//                  before it are skipped, completed keys from it on are
//                  force re-run. Without a pivot this is the same as none.
RecoveryPlan plan_recovery(const std::vector<KeyState>& keys, RecoverMode mode,
                           size_t start_index = 0);

} // namespace stagehand::runner
