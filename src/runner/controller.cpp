#include "stagehand/runner/controller.hpp"
#include "stagehand/core/errors.hpp"
#include "stagehand/core/events.hpp"
#include "stagehand/core/utils.hpp"
#include "stagehand/process/signals.hpp"
#include "stagehand/runner/cleanup_manifest.hpp"
#include "stagehand/runner/recovery.hpp"
#include "stagehand/runner/stage_runner.hpp"

#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <utility>

#include <unistd.h>

namespace stagehand::runner {

using json = nlohmann::json;

namespace {

process::SupervisorOptions with_working_dir(process::SupervisorOptions opts, const fs::path& dir) {
    if (opts.working_dir.empty()) {
        opts.working_dir = dir.string();
    }
    return opts;
}

} // namespace

RunOptions options_from_config(const config::Config& cfg, RunOptions base) {
    auto policy = string_to_missing_target_policy(cfg.recovery.on_missing_target);
    if (!policy) {
        throw ConfigError("unknown recovery.on_missing_target '" + cfg.recovery.on_missing_target + "'");
    }
    base.on_missing_target = *policy;
    base.dirty = base.dirty || cfg.cleanup.manual;

    base.supervisor.grace_period = std::chrono::milliseconds(cfg.supervisor.grace_period_ms);
    base.supervisor.poll_interval = std::chrono::milliseconds(cfg.supervisor.poll_interval_ms);
    base.supervisor.shell = cfg.supervisor.shell;
    base.supervisor.container_runtime = cfg.container.runtime;
    if (base.supervisor.container_name.empty()) {
        base.supervisor.container_name = cfg.container.name;
    }

    base.events_file = cfg.logging.events_file;
    base.echo_events = cfg.logging.echo_events;
    return base;
}

int exit_code_for(RunState state, int signal) {
    switch (state) {
        case RunState::COMPLETED:
        case RunState::PAUSED:
            return 0;
        case RunState::HALTED:
            return 128 + (signal > 0 ? signal : SIGTERM);
        default:
            return 1;
    }
}

PipelineController::PipelineController(PipelineDefinition definition, fs::path output_dir,
                                       RunOptions options, RunContext& ctx)
    : definition_(std::move(definition)),
      output_dir_(fs::absolute(output_dir).lexically_normal()),
      options_(std::move(options)),
      ctx_(ctx),
      store_(output_dir_, definition_.name()),
      supervisor_(ctx, with_working_dir(options_.supervisor, output_dir_)) {}

fs::path PipelineController::events_path() const {
    return output_dir_ / "logs" / (definition_.name() + "_events.jsonl");
}

fs::path PipelineController::cleanup_script_path() const {
    return output_dir_ / (definition_.name() + "_cleanup.sh");
}

fs::path PipelineController::command_log_path() const {
    return output_dir_ / (definition_.name() + "_commands.sh");
}

fs::path PipelineController::profile_path() const {
    return output_dir_ / (definition_.name() + "_profile.tsv");
}

PipelineController::Bounds PipelineController::validate_bounds() const {
    if (options_.recover && options_.new_start) {
        throw PipelineExecutionError("recovery and a new start are mutually exclusive");
    }
    if (!options_.stop_at.empty() && !options_.stop_before.empty()) {
        throw PipelineExecutionError(
            "cannot specify both an inclusive (stop-at) and an exclusive (stop-before) stopping point");
    }

    const auto& stages = definition_.stages();
    auto require_checkpoint = [&](const std::string& name) {
        size_t idx = definition_.require_stage(name);
        if (!stages[idx].checkpoint) {
            throw PipelineExecutionError("stage '" + stages[idx].name + "' is not a checkpoint");
        }
        return idx;
    };

    Bounds b;
    b.end_stage = stages.size();

    if (!options_.start_at.empty()) {
        b.start_stage = require_checkpoint(options_.start_at);
    }
    if (!options_.stop_at.empty()) {
        size_t stop = require_checkpoint(options_.stop_at);
        if (b.start_stage > stop) {
            throw PipelineExecutionError("start stage '" + stages[b.start_stage].name +
                                         "' comes after stop stage '" + stages[stop].name + "'");
        }
        b.halt_at = stop;
        b.end_stage = stop + 1;
    }
    if (!options_.stop_before.empty()) {
        size_t stop = require_checkpoint(options_.stop_before);
        if (b.start_stage == stop) {
            throw PipelineExecutionError("start stage '" + stages[stop].name +
                                         "' is also the exclusive stop, nothing would run");
        }
        if (b.start_stage > stop) {
            throw PipelineExecutionError("start stage '" + stages[b.start_stage].name +
                                         "' comes after stop stage '" + stages[stop].name + "'");
        }
        b.end_stage = stop;
    }
    return b;
}

void PipelineController::check_not_running() const {
    auto rec = store_.run_state();
    if (!rec) return;
    if (rec->state != RunState::RUNNING && rec->state != RunState::INITIALIZING) return;
    if (rec->pid == ::getpid()) return;
    if (process::process_alive(rec->pid)) {
        if (options_.new_start) {
            // The pid may have been reused since a crashed run.
            std::cerr << "[stagehand] new start: overriding running flag held by pid " << rec->pid
                      << std::endl;
            return;
        }
        throw PipelineExecutionError("pipeline '" + definition_.name() + "' is already running (pid " +
                                     std::to_string(rec->pid) + ") in " + output_dir_.string());
    }
    std::cerr << "[stagehand] stale running flag from pid " << rec->pid
              << ", previous run did not shut down cleanly" << std::endl;
}

RecoverMode PipelineController::resolve_mode() {
    RecoverMode mode = RecoverMode::NONE;
    if (store_.dynamic_recovery_requested()) {
        store_.set_dynamic_recovery(false);
        mode = RecoverMode::DYNAMIC;
    } else if (options_.recover) {
        mode = RecoverMode::MANUAL;
    }
    ctx_.recover_mode = mode;
    return mode;
}

bool PipelineController::has_unfinished_steps() const {
    for (const auto& key : definition_.step_keys()) {
        MarkerStatus s = store_.status(key);
        if (s == MarkerStatus::RUNNING || s == MarkerStatus::INITIALIZING) {
            return true;
        }
    }
    return false;
}

RunResult PipelineController::run() {
    const Bounds bounds = validate_bounds();
    const auto& stages = definition_.stages();

    std::error_code ec;
    fs::create_directories(output_dir_ / "logs", ec);
    if (ec) {
        throw IOError("cannot create output folder " + output_dir_.string() + ": " + ec.message());
    }
    check_not_running();

    const std::string run_id = core::get_run_id();

    std::ofstream events_file;
    if (options_.events_file) {
        events_file.open(events_path(), std::ios::out | std::ios::app);
        if (!events_file) {
            throw IOError("cannot open events log " + events_path().string());
        }
    }
    core::TeeBuf tee_buf(options_.echo_events ? std::cout.rdbuf() : nullptr,
                         options_.events_file ? events_file.rdbuf() : nullptr);
    std::ostream event_stream(&tee_buf);
    core::EventEmitter events(run_id, event_stream);

    std::optional<process::SignalGuard> guard;
    if (options_.install_signal_handlers) {
        guard.emplace(ctx_);
    }

    CleanupManifest manifest;
    ProfileReporter profile(profile_path(), run_id);

    StageRunnerOptions runner_opts;
    runner_opts.output_dir = output_dir_;
    runner_opts.on_missing_target = options_.on_missing_target;
    runner_opts.command_log = command_log_path();
    StageRunner runner(store_, supervisor_, manifest, ctx_, events, runner_opts);
    runner.add_hook(&profile);
    for (auto* hook : options_.hooks) {
        runner.add_hook(hook);
    }

    RunResult result;
    RunState state = RunState::FAILED;
    std::string error;
    json flag_extra = {{"run_id", run_id}};

    try {
        if (options_.new_start) {
            std::cerr << "[stagehand] new start: clearing checkpoints of '" << definition_.name() << "'" << std::endl;
            store_.clear_all();
        }
        result.mode = resolve_mode();

        if (!options_.config_path.empty()) {
            const std::string fingerprint = core::sha256_file(options_.config_path);
            flag_extra["config_sha256"] = fingerprint;
            auto prev = store_.run_state();
            if (result.mode != RecoverMode::NONE && prev && prev->data.contains("config_sha256") &&
                prev->data["config_sha256"].get<std::string>() != fingerprint) {
                std::cerr << "[recovery] configuration changed since the previous run" << std::endl;
                events.warning("configuration changed since the previous run",
                               {{"previous_sha256", prev->data["config_sha256"]},
                                {"config_sha256", fingerprint}});
            }
        }
        flag_extra["recover_mode"] = recover_mode_to_string(result.mode);

        store_.set_run_state(RunState::INITIALIZING, flag_extra);

        std::error_code lec;
        if (!fs::exists(command_log_path(), lec)) {
            core::write_text(command_log_path(), "#!/bin/sh\n");
        }
        core::append_text(command_log_path(), "\n# run " + run_id + " " + core::get_iso_timestamp() + "\n");

        std::vector<KeyState> key_states;
        for (const auto& key : definition_.step_keys()) {
            key_states.push_back({key, store_.status(key)});
        }
        RecoveryPlan plan = plan_recovery(key_states, result.mode,
                                          definition_.first_key_index(bounds.start_stage));
        if (result.mode != RecoverMode::NONE) {
            if (plan.pivot) {
                std::cerr << "[recovery] " << recover_mode_to_string(result.mode) << " recovery from "
                          << plan.decisions[*plan.pivot].key.to_string() << std::endl;
            } else {
                std::cerr << "[recovery] no unfinished step found, running as a fresh start" << std::endl;
            }
        }

        store_.set_run_state(RunState::RUNNING, flag_extra);
        events.run_start({{"pipeline", definition_.name()},
                          {"output_dir", output_dir_.string()},
                          {"recover_mode", recover_mode_to_string(result.mode)},
                          {"start_at", options_.start_at},
                          {"stop_at", options_.stop_at},
                          {"stop_before", options_.stop_before},
                          {"stages", stages.size()},
                          {"pid", static_cast<int>(::getpid())}});

        state = RunState::COMPLETED;
        size_t offset = 0;
        for (size_t si = 0; si < stages.size(); ++si) {
            const Stage& stage = stages[si];
            if (si >= bounds.end_stage) {
                state = RunState::PAUSED;
                break;
            }
            std::vector<StepDecision> decisions(plan.decisions.begin() + offset,
                                                plan.decisions.begin() + offset + stage.steps.size());
            offset += stage.steps.size();

            if (ctx_.stop_requested()) {
                throw InterruptedExecution(ctx_.stop_signal());
            }
            events.stage_start(stage.name, si, stages.size());
            // A stop-at on the final stage leaves nothing to resume.
            const bool halt = bounds.halt_at && *bounds.halt_at == si && si + 1 < stages.size();
            StageRunResult sr = runner.run_stage(stage, decisions, halt);

            if (sr.outcome == StageOutcome::FAILED) {
                state = RunState::FAILED;
                error = sr.message;
                break;
            }
            if (sr.outcome == StageOutcome::HALTED_AT_CHECKPOINT) {
                state = RunState::PAUSED;
                break;
            }
        }
    } catch (const InterruptedExecution& e) {
        state = RunState::HALTED;
        result.signal = e.signal();
        error = e.what();
    } catch (const StagehandError& e) {
        state = RunState::FAILED;
        error = e.what();
    } catch (const std::exception& e) {
        state = RunState::FAILED;
        error = std::string("unexpected error: ") + e.what();
    }

    try {
        switch (state) {
            case RunState::HALTED: {
                events.run_stop_requested(result.signal, ctx_.signal_deliveries.load());
                std::cerr << "[stagehand] halted by signal " << result.signal << std::endl;
                if (has_unfinished_steps()) {
                    store_.set_dynamic_recovery(true, error);
                }
                store_.set_run_state(RunState::HALTED, flag_extra);
                break;
            }
            case RunState::FAILED:
                std::cerr << "[stagehand] " << error << std::endl;
                events.error(error);
                store_.set_run_state(RunState::FAILED, flag_extra);
                break;
            case RunState::PAUSED:
                store_.set_run_state(RunState::PAUSED, flag_extra);
                break;
            case RunState::COMPLETED:
                store_.set_dynamic_recovery(false);
                store_.set_run_state(RunState::COMPLETED, flag_extra);
                ctx_.recover_mode = RecoverMode::NONE;
                break;
            default:
                break;
        }
    } catch (const StagehandError& e) {
        std::cerr << "[stagehand] cannot record final state: " << e.what() << std::endl;
        if (state == RunState::COMPLETED || state == RunState::PAUSED) {
            state = RunState::FAILED;
        }
        if (error.empty()) {
            error = e.what();
        }
    }

    try {
        manifest.write_script(cleanup_script_path(), definition_.name(), state);
        if (state == RunState::COMPLETED && !options_.dirty) {
            size_t removed = manifest.perform(state, std::cerr);
            if (removed > 0) {
                std::cerr << "[cleanup] removed " << removed << " intermediate path(s)" << std::endl;
            }
        }
    } catch (const IOError& e) {
        std::cerr << "[cleanup] " << e.what() << std::endl;
        events.warning(e.what());
    }

    const RunTally& tally = runner.tally();
    result.state = state;
    result.error = error;
    result.executed = tally.executed;
    result.skipped = tally.skipped;
    result.failed_nofail = tally.failed_nofail;
    result.inconsistencies = tally.inconsistencies;
    result.exit_code = exit_code_for(state, result.signal);

    events.run_end(state == RunState::COMPLETED || state == RunState::PAUSED,
                   run_state_to_string(state),
                   {{"executed", result.executed.size()},
                    {"skipped", result.skipped.size()},
                    {"inconsistencies", result.inconsistencies},
                    {"exit_code", result.exit_code}});
    return result;
}

} // namespace stagehand::runner
