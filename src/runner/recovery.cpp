#include "stagehand/runner/recovery.hpp"

namespace stagehand::runner {

RecoveryPlan plan_recovery(const std::vector<KeyState>& keys, RecoverMode mode,
                           size_t start_index) {
    RecoveryPlan plan;
    plan.mode = mode;
    plan.decisions.reserve(keys.size());

    if (mode != RecoverMode::NONE) {
        for (size_t i = start_index; i < keys.size(); ++i) {
            if (is_unfinished(keys[i].status)) {
                plan.pivot = i;
                break;
            }
        }
    }

    for (size_t i = 0; i < keys.size(); ++i) {
        StepDecision d;
        d.key = keys[i].key;
        d.marker = keys[i].status;

        if (i < start_index) {
            d.decision = Decision::SKIP;
            d.implicit = true;
        } else if (keys[i].status != MarkerStatus::COMPLETED) {
            d.decision = Decision::RUN;
        } else if (plan.pivot && i >= *plan.pivot) {
            d.decision = Decision::FORCE_RERUN;
        } else {
            d.decision = Decision::SKIP;
        }
        plan.decisions.push_back(d);
    }
    return plan;
}

} // namespace stagehand::runner
