#pragma once

#include "stagehand/core/events.hpp"
#include "stagehand/core/run_context.hpp"
#include "stagehand/core/types.hpp"
#include "stagehand/process/supervisor.hpp"
#include "stagehand/runner/checkpoint_store.hpp"
#include "stagehand/runner/cleanup_manifest.hpp"
#include "stagehand/runner/pipeline.hpp"
#include "stagehand/runner/recovery.hpp"
#include "stagehand/runner/reporting.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace stagehand::runner {

namespace fs = std::filesystem;

struct StageRunnerOptions {
    fs::path output_dir;
    MissingTargetPolicy on_missing_target = MissingTargetPolicy::WARN;
    fs::path command_log;   // empty: commands are not logged
};

struct StageRunResult {
    StageOutcome outcome = StageOutcome::COMPLETED;
    std::string failed_key;
    std::string message;
};

// Keys touched so far, across all stages run by one StageRunner.
struct RunTally {
    std::vector<std::string> executed;
    std::vector<std::string> skipped;
    std::vector<std::string> failed_nofail;
    size_t inconsistencies = 0;
};

class StageRunner {
public:
    StageRunner(CheckpointStore& store, process::ProcessSupervisor& supervisor,
                CleanupManifest& manifest, RunContext& ctx, core::EventEmitter& events,
                StageRunnerOptions options);

    void add_hook(ReportHook* hook);

    // Runs the steps of `stage` according to `decisions` (one per step).
    // With `halt_after` the stage's completion marker is written and the
    // result is HALTED_AT_CHECKPOINT. Throws InterruptedExecution when a stop
    // was requested, RecoveryInconsistency under the `fail` policy and
    // CheckpointStoreError when a marker cannot be written.
    StageRunResult run_stage(const Stage& stage, const std::vector<StepDecision>& decisions,
                             bool halt_after = false);

    const RunTally& tally() const { return tally_; }

private:
    // Returns false if the stage must stop because the step failed.
    bool run_step(const Step& step, const CheckpointKey& key, Decision decision,
                  StageRunResult& result);
    bool handle_skip(const Step& step, const StepDecision& decision, Decision& effective);
    [[noreturn]] void interrupted(const Step& step, const CheckpointKey& key, StepReport& report);

    std::string missing_target(const Step& step) const;
    void register_intermediates(const Step& step, const CheckpointKey& key, bool failed);
    void log_command(const CheckpointKey& key, const process::Command& cmd);
    void notify_step(const StepReport& report);
    void check_stop() const;

    CheckpointStore& store_;
    process::ProcessSupervisor& supervisor_;
    CleanupManifest& manifest_;
    RunContext& ctx_;
    core::EventEmitter& events_;
    StageRunnerOptions options_;
    std::vector<ReportHook*> hooks_;
    RunTally tally_;
};

} // namespace stagehand::runner
