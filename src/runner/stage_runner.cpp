#include "stagehand/runner/stage_runner.hpp"
#include "stagehand/core/errors.hpp"
#include "stagehand/core/utils.hpp"

#include <algorithm>
#include <csignal>
#include <iostream>
#include <utility>

#include <unistd.h>

namespace stagehand::runner {

using json = nlohmann::json;

StageRunner::StageRunner(CheckpointStore& store, process::ProcessSupervisor& supervisor,
                         CleanupManifest& manifest, RunContext& ctx, core::EventEmitter& events,
                         StageRunnerOptions options)
    : store_(store),
      supervisor_(supervisor),
      manifest_(manifest),
      ctx_(ctx),
      events_(events),
      options_(std::move(options)) {}

void StageRunner::add_hook(ReportHook* hook) {
    if (hook) hooks_.push_back(hook);
}

void StageRunner::check_stop() const {
    if (ctx_.stop_requested()) {
        throw InterruptedExecution(ctx_.stop_signal());
    }
}

std::string StageRunner::missing_target(const Step& step) const {
    for (const auto& t : step.targets) {
        fs::path p(t);
        if (p.is_relative()) p = options_.output_dir / p;
        if (core::expand_path_pattern(p).empty()) {
            return p.string();
        }
    }
    return "";
}

void StageRunner::register_intermediates(const Step& step, const CheckpointKey& key, bool failed) {
    for (const auto& in : step.intermediates) {
        fs::path p(in.pattern);
        if (p.is_relative()) p = options_.output_dir / p;
        CleanupPolicy policy = failed ? CleanupPolicy::ONLY_ON_FAILURE : in.policy;
        manifest_.append(p.lexically_normal().string(), policy, key.to_string());
    }
}

void StageRunner::log_command(const CheckpointKey& key, const process::Command& cmd) {
    if (options_.command_log.empty()) return;
    core::append_text(options_.command_log,
                      "# " + key.to_string() + " " + core::get_iso_timestamp() + "\n" +
                      cmd.to_string() + "\n");
}

void StageRunner::notify_step(const StepReport& report) {
    for (auto* hook : hooks_) {
        hook->on_step(report);
    }
}

bool StageRunner::handle_skip(const Step& step, const StepDecision& decision, Decision& effective) {
    const std::string key = decision.key.to_string();
    std::string missing = missing_target(step);
    if (!missing.empty()) {
        ++tally_.inconsistencies;
        RecoveryInconsistency inconsistency(key, missing);
        std::cerr << "[" << key << "] " << inconsistency.what() << std::endl;
        events_.warning(inconsistency.what(),
                        {{"key", key}, {"missing", missing},
                         {"policy", missing_target_policy_to_string(options_.on_missing_target)}});

        switch (options_.on_missing_target) {
            case MissingTargetPolicy::FAIL:
                throw inconsistency;
            case MissingTargetPolicy::RERUN:
                effective = Decision::FORCE_RERUN;
                return false;
            case MissingTargetPolicy::WARN:
                break;
        }
    }

    register_intermediates(step, decision.key, false);
    events_.step_skipped(key, decision.implicit ? "before_start_checkpoint" : "completed");
    tally_.skipped.push_back(key);

    StepReport report;
    report.key = key;
    report.outcome = "skipped";
    notify_step(report);
    return true;
}

void StageRunner::interrupted(const Step& step, const CheckpointKey& key, StepReport& report) {
    register_intermediates(step, key, true);
    report.outcome = "interrupted";
    events_.step_end(key.to_string(), "interrupted",
                     {{"seconds", report.duration.count()}, {"signal", ctx_.stop_signal()}});
    notify_step(report);
    int sig = ctx_.stop_signal();
    throw InterruptedExecution(sig != 0 ? sig : SIGTERM);
}

bool StageRunner::run_step(const Step& step, const CheckpointKey& key, Decision decision,
                           StageRunResult& result) {
    const std::string label = key.to_string();
    check_stop();

    store_.mark_start(key);
    events_.step_start(label, decision_to_string(decision),
                       {{"commands", step.commands.size()}, {"nofail", step.nofail}});
    tally_.executed.push_back(label);

    StepReport report;
    report.key = label;
    const auto started = Clock::now();

    std::string failure;
    int exit_code = 0;

    for (const auto& cmd : step.commands) {
        if (ctx_.stop_requested()) {
            report.duration = Clock::now() - started;
            interrupted(step, key, report);
        }
        log_command(key, cmd);

        ExitOutcome outcome;
        try {
            outcome = supervisor_.run(cmd, label, [&](pid_t pgid) { store_.mark_running(key, pgid); });
        } catch (const ProcessError& e) {
            failure = e.what();
            exit_code = 127;
            break;
        }
        ++report.commands;
        report.max_rss_kb = std::max(report.max_rss_kb, outcome.max_rss_kb);

        if (outcome.interrupted || ctx_.stop_requested()) {
            report.duration = Clock::now() - started;
            interrupted(step, key, report);
        }
        if (!outcome.ok()) {
            exit_code = outcome.exit_code;
            failure = "command '" + cmd.to_string() + "' ended with " + exit_outcome_to_string(outcome);
            break;
        }
    }

    if (failure.empty() && step.action) {
        if (step.commands.empty()) {
            store_.mark_running(key, ::getpid());
        }
        StepContext sctx{options_.output_dir, key, &ctx_};
        try {
            step.action(sctx);
        } catch (const InterruptedExecution&) {
            report.duration = Clock::now() - started;
            interrupted(step, key, report);
        } catch (const std::exception& e) {
            failure = std::string("action raised: ") + e.what();
            exit_code = 1;
        }
    }

    report.duration = Clock::now() - started;

    if (!failure.empty()) {
        register_intermediates(step, key, true);
        store_.mark_failed(key);
        report.outcome = "failed";
        events_.step_end(label, "failed",
                         {{"seconds", report.duration.count()},
                          {"exit_code", exit_code},
                          {"max_rss_kb", report.max_rss_kb},
                          {"message", failure}});
        notify_step(report);

        StepFailure err(label, failure);
        std::cerr << "[" << label << "] " << err.what() << std::endl;
        if (step.nofail) {
            tally_.failed_nofail.push_back(label);
            events_.warning("nofail step failed, continuing", {{"key", label}});
            return true;
        }
        result.outcome = StageOutcome::FAILED;
        result.failed_key = label;
        result.message = err.what();
        return false;
    }

    register_intermediates(step, key, false);
    store_.mark_complete(key);
    report.outcome = "completed";
    events_.step_end(label, "completed",
                     {{"seconds", report.duration.count()},
                      {"exit_code", 0},
                      {"max_rss_kb", report.max_rss_kb}});
    notify_step(report);
    return true;
}

StageRunResult StageRunner::run_stage(const Stage& stage, const std::vector<StepDecision>& decisions,
                                      bool halt_after) {
    if (decisions.size() != stage.steps.size()) {
        throw PipelineExecutionError("stage '" + stage.name + "' has " +
                                     std::to_string(stage.steps.size()) + " steps but " +
                                     std::to_string(decisions.size()) + " decisions");
    }

    StageRunResult result;
    const CheckpointKey stage_key{stage.name, ""};
    const bool all_implicit = std::all_of(decisions.begin(), decisions.end(),
                                          [](const StepDecision& d) { return d.implicit; });
    const bool write_stage_markers = stage.checkpoint && !(all_implicit && !decisions.empty());
    const auto started = Clock::now();

    check_stop();
    if (write_stage_markers) {
        store_.mark_start(stage_key);
    }

    for (size_t i = 0; i < stage.steps.size(); ++i) {
        const Step& step = stage.steps[i];
        const StepDecision& d = decisions[i];
        check_stop();

        Decision effective = d.decision;
        if (effective == Decision::SKIP && handle_skip(step, d, effective)) {
            continue;
        }
        if (!run_step(step, d.key, effective, result)) {
            break;
        }
    }

    Seconds elapsed = Clock::now() - started;
    if (result.outcome == StageOutcome::FAILED) {
        if (write_stage_markers) store_.mark_failed(stage_key);
    } else {
        if (write_stage_markers) store_.mark_complete(stage_key);
        if (halt_after) result.outcome = StageOutcome::HALTED_AT_CHECKPOINT;
    }

    events_.stage_end(stage.name, stage_outcome_to_string(result.outcome), elapsed.count());
    for (auto* hook : hooks_) {
        hook->on_stage(stage.name, elapsed, result.outcome);
    }
    return result;
}

} // namespace stagehand::runner
