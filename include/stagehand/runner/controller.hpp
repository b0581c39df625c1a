#pragma once

#include "stagehand/config/configuration.hpp"
#include "stagehand/core/run_context.hpp"
#include "stagehand/core/types.hpp"
#include "stagehand/process/supervisor.hpp"
#include "stagehand/runner/checkpoint_store.hpp"
#include "stagehand/runner/pipeline.hpp"
#include "stagehand/runner/reporting.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stagehand::runner {

namespace fs = std::filesystem;

struct RunOptions {
    bool recover = false;        // manual recovery
    bool new_start = false;      // clear every marker first
    std::string start_at;
    std::string stop_at;         // inclusive
    std::string stop_before;     // exclusive
    bool dirty = false;          // write the cleanup script, never delete
    MissingTargetPolicy on_missing_target = MissingTargetPolicy::WARN;
    process::SupervisorOptions supervisor;

    bool install_signal_handlers = true;
    bool events_file = true;
    bool echo_events = false;
    fs::path config_path;        // fingerprinted into the running flag

    std::vector<ReportHook*> hooks;
};

// Applies the engine sections of a config on top of `base`.
RunOptions options_from_config(const config::Config& cfg, RunOptions base = RunOptions());

struct RunResult {
    RunState state = RunState::INITIALIZING;
    int exit_code = 0;
    std::string error;
    int signal = 0;
    RecoverMode mode = RecoverMode::NONE;
    std::vector<std::string> executed;
    std::vector<std::string> skipped;
    std::vector<std::string> failed_nofail;
    size_t inconsistencies = 0;
};

// Top-level state machine:
// INITIALIZING -> RUNNING -> {PAUSED, COMPLETED, FAILED, HALTED}
class PipelineController {
public:
    PipelineController(PipelineDefinition definition, fs::path output_dir,
                       RunOptions options, RunContext& ctx);

    // Validates options before touching disk; illegal start/stop or a
    // concurrently running instance (unless new_start) raise
    // PipelineExecutionError (or UnknownStageError). Everything after that is
    // reported in the result.
    RunResult run();

    const PipelineDefinition& definition() const { return definition_; }
    CheckpointStore& store() { return store_; }
    const process::SupervisorStats& supervisor_stats() const { return supervisor_.stats(); }

    fs::path events_path() const;
    fs::path cleanup_script_path() const;
    fs::path command_log_path() const;
    fs::path profile_path() const;

private:
    struct Bounds {
        size_t start_stage = 0;
        size_t end_stage = 0;           // exclusive
        std::optional<size_t> halt_at;  // stop-at stage index
    };

    Bounds validate_bounds() const;
    void check_not_running() const;
    RecoverMode resolve_mode();
    bool has_unfinished_steps() const;

    PipelineDefinition definition_;
    fs::path output_dir_;
    RunOptions options_;
    RunContext& ctx_;
    CheckpointStore store_;
    process::ProcessSupervisor supervisor_;
};

// Exit status for a finished run: 0 completed or paused, 1 failed,
// 128+signal halted.
int exit_code_for(RunState state, int signal);

} // namespace stagehand::runner
