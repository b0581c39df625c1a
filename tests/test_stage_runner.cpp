#include "stagehand/core/errors.hpp"
#include "stagehand/core/events.hpp"
#include "stagehand/core/run_context.hpp"
#include "stagehand/core/utils.hpp"
#include "stagehand/process/supervisor.hpp"
#include "stagehand/runner/checkpoint_store.hpp"
#include "stagehand/runner/cleanup_manifest.hpp"
#include "stagehand/runner/recovery.hpp"
#include "stagehand/runner/reporting.hpp"
#include "stagehand/runner/stage_runner.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using stagehand::CheckpointKey;
using stagehand::CleanupPolicy;
using stagehand::Decision;
using stagehand::MarkerStatus;
using stagehand::MissingTargetPolicy;
using stagehand::RunContext;
using stagehand::RunState;
using stagehand::StageOutcome;
using stagehand::runner::Stage;
using stagehand::runner::StepDecision;
using stagehand::testing::TempDir;
using stagehand::testing::shell_step;
using stagehand::testing::stage_of;
namespace core = stagehand::core;
namespace runner = stagehand::runner;

namespace {

class RecordingHook : public runner::ReportHook {
public:
    void on_step(const runner::StepReport& report) override {
        steps.push_back(report.key + ":" + report.outcome);
    }
    void on_stage(const std::string& stage, stagehand::Seconds, StageOutcome outcome) override {
        stages.push_back(stage + ":" + stagehand::stage_outcome_to_string(outcome));
    }

    std::vector<std::string> steps;
    std::vector<std::string> stages;
};

// Everything a StageRunner needs, rooted in a temp folder.
struct Fixture {
    explicit Fixture(MissingTargetPolicy policy = MissingTargetPolicy::WARN)
        : store(tmp.path(), "demo"), supervisor(ctx, supervisor_options()),
          events("test-run", event_log), runner(store, supervisor, manifest, ctx, events, options(policy)) {
        runner.add_hook(&hook);
    }

    stagehand::process::SupervisorOptions supervisor_options() const {
        stagehand::process::SupervisorOptions opts;
        opts.grace_period = 500ms;
        opts.poll_interval = 5ms;
        opts.working_dir = tmp.path().string();
        return opts;
    }

    runner::StageRunnerOptions options(MissingTargetPolicy policy) const {
        runner::StageRunnerOptions opts;
        opts.output_dir = tmp.path();
        opts.on_missing_target = policy;
        opts.command_log = tmp / "demo_commands.sh";
        return opts;
    }

    std::vector<StepDecision> decide(const Stage& stage, Decision d) const {
        std::vector<StepDecision> out;
        for (const auto& step : stage.steps) {
            StepDecision sd;
            sd.key = {stage.name, step.name};
            sd.decision = d;
            out.push_back(sd);
        }
        return out;
    }

    TempDir tmp;
    RunContext ctx;
    runner::CheckpointStore store;
    stagehand::process::ProcessSupervisor supervisor;
    runner::CleanupManifest manifest;
    std::ostringstream event_log;
    core::EventEmitter events;
    RecordingHook hook;
    runner::StageRunner runner;
};

} // namespace

TEST_CASE("stage_runner_runs_steps_in_order_and_marks_them_completed") {
    Fixture f;
    Stage stage = stage_of("prepare", {shell_step("first", "echo one > order.txt"),
                                       shell_step("second", "echo two >> order.txt")});

    auto result = f.runner.run_stage(stage, f.decide(stage, Decision::RUN));
    REQUIRE(result.outcome == StageOutcome::COMPLETED);
    REQUIRE(core::read_text(f.tmp / "order.txt") == "one\ntwo\n");
    REQUIRE(f.store.status({"prepare", "first"}) == MarkerStatus::COMPLETED);
    REQUIRE(f.store.status({"prepare", "second"}) == MarkerStatus::COMPLETED);
    REQUIRE(f.store.status({"prepare", ""}) == MarkerStatus::COMPLETED);
    REQUIRE(f.runner.tally().executed == std::vector<std::string>{"prepare/first", "prepare/second"});
    REQUIRE(f.hook.steps == std::vector<std::string>{"prepare/first:completed", "prepare/second:completed"});
    REQUIRE(f.hook.stages == std::vector<std::string>{"prepare:completed"});

    std::string log = core::read_text(f.tmp / "demo_commands.sh");
    REQUIRE(log.find("# prepare/first") != std::string::npos);
    REQUIRE(log.find("echo two >> order.txt") != std::string::npos);
    REQUIRE(f.event_log.str().find("\"type\":\"step_start\"") != std::string::npos);
}

TEST_CASE("stage_runner_skips_completed_steps_without_running_them") {
    Fixture f;
    Stage stage = stage_of("prepare", {shell_step("touch", "touch ran.txt")});

    auto result = f.runner.run_stage(stage, f.decide(stage, Decision::SKIP));
    REQUIRE(result.outcome == StageOutcome::COMPLETED);
    REQUIRE_FALSE(fs::exists(f.tmp / "ran.txt"));
    REQUIRE(f.runner.tally().skipped == std::vector<std::string>{"prepare/touch"});
    REQUIRE(f.runner.tally().executed.empty());
    REQUIRE(f.hook.steps == std::vector<std::string>{"prepare/touch:skipped"});
}

TEST_CASE("stage_runner_stops_the_stage_at_a_failing_step") {
    Fixture f;
    runner::Step failing = shell_step("align", "exit 4; true");
    failing.intermediates.push_back({"partial.sam", CleanupPolicy::ALWAYS});
    Stage stage = stage_of("align", {failing, shell_step("index", "touch index.txt")});

    auto result = f.runner.run_stage(stage, f.decide(stage, Decision::RUN));
    REQUIRE(result.outcome == StageOutcome::FAILED);
    REQUIRE(result.failed_key == "align/align");
    REQUIRE(result.message.find("failed(4)") != std::string::npos);
    REQUIRE(f.store.status({"align", "align"}) == MarkerStatus::FAILED);
    REQUIRE(f.store.status({"align", "index"}) == MarkerStatus::ABSENT);
    REQUIRE(f.store.status({"align", ""}) == MarkerStatus::FAILED);
    REQUIRE_FALSE(fs::exists(f.tmp / "index.txt"));

    REQUIRE(f.manifest.entries().size() == 1);
    REQUIRE(f.manifest.entries()[0].policy == CleanupPolicy::ONLY_ON_FAILURE);
    REQUIRE(f.manifest.applicable(RunState::COMPLETED).empty());
}

TEST_CASE("stage_runner_registers_intermediates_before_the_failure_marker") {
    Fixture f;
    runner::Step broken;
    broken.name = "align";
    broken.intermediates.push_back({"partial.sam", CleanupPolicy::ALWAYS});
    fs::path checkpoints = f.store.checkpoint_dir();
    broken.action = [checkpoints](runner::StepContext&) {
        fs::remove_all(checkpoints);
        core::write_text(checkpoints, "not a folder");
        throw std::runtime_error("aligner crashed");
    };
    Stage stage = stage_of("align", {broken});

    REQUIRE_THROWS_AS(f.runner.run_stage(stage, f.decide(stage, Decision::RUN)),
                      stagehand::CheckpointStoreError);

    REQUIRE(f.manifest.entries().size() == 1);
    REQUIRE(f.manifest.entries()[0].key == "align/align");
    REQUIRE(f.manifest.entries()[0].policy == CleanupPolicy::ONLY_ON_FAILURE);
    std::string script = f.manifest.render_script("demo", RunState::FAILED);
    REQUIRE(script.find("partial.sam") != std::string::npos);
}

TEST_CASE("stage_runner_continues_past_a_nofail_step") {
    Fixture f;
    runner::Step align = shell_step("align", "exit 1; true");
    align.nofail = true;
    Stage stage = stage_of("align", {align, shell_step("report", "touch report.txt")});

    auto result = f.runner.run_stage(stage, f.decide(stage, Decision::RUN));
    REQUIRE(result.outcome == StageOutcome::COMPLETED);
    REQUIRE(f.store.status({"align", "align"}) == MarkerStatus::FAILED);
    REQUIRE(f.store.status({"align", "report"}) == MarkerStatus::COMPLETED);
    REQUIRE(fs::exists(f.tmp / "report.txt"));
    REQUIRE(f.runner.tally().failed_nofail == std::vector<std::string>{"align/align"});
}

TEST_CASE("stage_runner_runs_in_process_actions") {
    Fixture f;
    runner::Step step;
    step.name = "summarize";
    step.action = [](runner::StepContext& sc) {
        core::write_text(sc.output_dir / "summary.txt", sc.key.to_string());
    };
    runner::Step broken;
    broken.name = "broken";
    broken.action = [](runner::StepContext&) { throw std::runtime_error("no input"); };
    Stage stage = stage_of("report", {step, broken});

    auto result = f.runner.run_stage(stage, f.decide(stage, Decision::RUN));
    REQUIRE(core::read_text(f.tmp / "summary.txt") == "report/summarize");
    REQUIRE(result.outcome == StageOutcome::FAILED);
    REQUIRE(result.message.find("no input") != std::string::npos);
}

TEST_CASE("stage_runner_halt_after_completes_the_stage_marker") {
    Fixture f;
    Stage stage = stage_of("b", {shell_step("x", "true")});
    auto result = f.runner.run_stage(stage, f.decide(stage, Decision::RUN), true);
    REQUIRE(result.outcome == StageOutcome::HALTED_AT_CHECKPOINT);
    REQUIRE(f.store.status({"b", ""}) == MarkerStatus::COMPLETED);
}

TEST_CASE("stage_runner_without_checkpoint_writes_no_stage_marker") {
    Fixture f;
    Stage stage = stage_of("plain", {shell_step("x", "true")});
    stage.checkpoint = false;
    f.runner.run_stage(stage, f.decide(stage, Decision::RUN));
    REQUIRE(f.store.status({"plain", ""}) == MarkerStatus::ABSENT);
    REQUIRE(f.store.status({"plain", "x"}) == MarkerStatus::COMPLETED);
}

TEST_CASE("stage_runner_missing_target_policies") {
    SECTION("warn keeps the skip and counts the inconsistency") {
        Fixture f(MissingTargetPolicy::WARN);
        runner::Step step = shell_step("fetch", "touch reads.txt");
        step.targets.push_back("reads.txt");
        Stage stage = stage_of("prepare", {step});

        f.runner.run_stage(stage, f.decide(stage, Decision::SKIP));
        REQUIRE(f.runner.tally().inconsistencies == 1);
        REQUIRE_FALSE(fs::exists(f.tmp / "reads.txt"));
        REQUIRE(f.event_log.str().find("\"type\":\"warning\"") != std::string::npos);
    }
    SECTION("rerun executes the step again") {
        Fixture f(MissingTargetPolicy::RERUN);
        runner::Step step = shell_step("fetch", "touch reads.txt");
        step.targets.push_back("reads.txt");
        Stage stage = stage_of("prepare", {step});

        f.runner.run_stage(stage, f.decide(stage, Decision::SKIP));
        REQUIRE(fs::exists(f.tmp / "reads.txt"));
        REQUIRE(f.runner.tally().executed.size() == 1);
    }
    SECTION("fail raises") {
        Fixture f(MissingTargetPolicy::FAIL);
        runner::Step step = shell_step("fetch", "touch reads.txt");
        step.targets.push_back("reads.txt");
        Stage stage = stage_of("prepare", {step});

        REQUIRE_THROWS_AS(f.runner.run_stage(stage, f.decide(stage, Decision::SKIP)),
                          stagehand::RecoveryInconsistency);
    }
    SECTION("present targets are not reported") {
        Fixture f(MissingTargetPolicy::FAIL);
        core::write_text(f.tmp / "reads.txt", "r");
        runner::Step step = shell_step("fetch", "touch reads.txt");
        step.targets.push_back("reads.txt");
        Stage stage = stage_of("prepare", {step});

        REQUIRE_NOTHROW(f.runner.run_stage(stage, f.decide(stage, Decision::SKIP)));
        REQUIRE(f.runner.tally().inconsistencies == 0);
    }
}

TEST_CASE("stage_runner_raises_when_a_stop_was_requested") {
    Fixture f;
    f.ctx.request_stop(SIGINT);
    Stage stage = stage_of("prepare", {shell_step("x", "touch x.txt")});
    REQUIRE_THROWS_AS(f.runner.run_stage(stage, f.decide(stage, Decision::RUN)),
                      stagehand::InterruptedExecution);
    REQUIRE_FALSE(fs::exists(f.tmp / "x.txt"));
}

TEST_CASE("stage_runner_leaves_an_unfinished_marker_when_interrupted_mid_step") {
    Fixture f;
    runner::Step step;
    step.name = "long";
    step.intermediates.push_back({"*.part", CleanupPolicy::ALWAYS});
    step.action = [&f](runner::StepContext&) {
        f.ctx.request_stop(SIGTERM);
        throw stagehand::InterruptedExecution(SIGTERM);
    };
    Stage stage = stage_of("work", {step});

    try {
        f.runner.run_stage(stage, f.decide(stage, Decision::RUN));
        FAIL("expected InterruptedExecution");
    } catch (const stagehand::InterruptedExecution& e) {
        REQUIRE(e.signal() == SIGTERM);
    }
    REQUIRE(f.store.status({"work", "long"}) == MarkerStatus::RUNNING);
    REQUIRE(f.manifest.entries().size() == 1);
    REQUIRE(f.manifest.entries()[0].policy == CleanupPolicy::ONLY_ON_FAILURE);
    REQUIRE(f.hook.steps == std::vector<std::string>{"work/long:interrupted"});
}

TEST_CASE("stage_runner_rejects_mismatched_decisions") {
    Fixture f;
    Stage stage = stage_of("prepare", {shell_step("x", "true")});
    REQUIRE_THROWS_AS(f.runner.run_stage(stage, {}), stagehand::PipelineExecutionError);
}
