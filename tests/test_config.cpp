#include "stagehand/config/configuration.hpp"
#include "stagehand/core/errors.hpp"
#include "stagehand/core/utils.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;
using stagehand::config::Config;
using stagehand::testing::TempDir;

namespace {

const char* kPipelineYaml = R"(
pipeline:
  name: rnaseq
  output_dir: results
supervisor:
  grace_period_ms: 250
  poll_interval_ms: 10
recovery:
  on_missing_target: rerun
cleanup:
  manual: true
stages:
  - name: Prepare
    steps:
      - name: fetch
        command: "echo reads"
        stdout: reads.txt
        targets: [reads.txt]
  - name: align
    checkpoint: false
    steps:
      - name: map
        commands:
          - [sort, reads.txt]
          - command: "wc -l reads.txt"
            stdout: count.txt
            append: true
        nofail: true
        intermediates:
          - "*.tmp"
          - { path: scratch, policy: only_on_failure }
)";

} // namespace

TEST_CASE("config_from_yaml_reads_every_section") {
    Config cfg = Config::from_yaml(YAML::Load(kPipelineYaml));

    REQUIRE(cfg.pipeline.name == "rnaseq");
    REQUIRE(cfg.pipeline.output_dir == "results");
    REQUIRE(cfg.supervisor.grace_period_ms == 250);
    REQUIRE(cfg.supervisor.poll_interval_ms == 10);
    REQUIRE(cfg.supervisor.shell == "/bin/sh");
    REQUIRE(cfg.recovery.on_missing_target == "rerun");
    REQUIRE(cfg.cleanup.manual);
    REQUIRE(cfg.container.runtime == "docker");

    REQUIRE(cfg.stages.size() == 2);
    const auto& fetch = cfg.stages[0].steps[0];
    REQUIRE(cfg.stages[0].checkpoint);
    REQUIRE(fetch.commands.size() == 1);
    REQUIRE(fetch.commands[0].stdout_path == "reads.txt");
    REQUIRE(fetch.targets == std::vector<std::string>{"reads.txt"});

    REQUIRE_FALSE(cfg.stages[1].checkpoint);
    const auto& map = cfg.stages[1].steps[0];
    REQUIRE(map.nofail);
    REQUIRE(map.commands.size() == 2);
    REQUIRE(map.commands[0].argv == std::vector<std::string>{"sort", "reads.txt"});
    REQUIRE(map.commands[1].line == "wc -l reads.txt");
    REQUIRE(map.commands[1].append);
    REQUIRE(map.intermediates.size() == 2);
    REQUIRE(map.intermediates[0].policy == "always");
    REQUIRE(map.intermediates[1].path == "scratch");
    REQUIRE(map.intermediates[1].policy == "only_on_failure");

    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_save_then_load_preserves_content") {
    TempDir tmp;
    Config cfg = Config::from_yaml(YAML::Load(kPipelineYaml));
    cfg.save(tmp / "pipeline.yaml");

    Config again = Config::load(tmp / "pipeline.yaml");
    REQUIRE(again.pipeline.name == cfg.pipeline.name);
    REQUIRE(again.supervisor.grace_period_ms == 250);
    REQUIRE(again.cleanup.manual);
    REQUIRE(again.stages.size() == 2);
    REQUIRE(again.stages[1].steps[0].commands[0].argv == cfg.stages[1].steps[0].commands[0].argv);
    REQUIRE(again.stages[1].steps[0].commands[1].line == "wc -l reads.txt");
    REQUIRE(again.stages[1].steps[0].intermediates[1].policy == "only_on_failure");
    REQUIRE(again.base_dir == fs::absolute(tmp.path()));
}

TEST_CASE("resolved_output_dir_is_relative_to_the_config_file") {
    TempDir tmp;
    stagehand::core::write_text(tmp / "pipeline.yaml", kPipelineYaml);
    Config cfg = Config::load(tmp / "pipeline.yaml");
    REQUIRE(cfg.resolved_output_dir() == (fs::absolute(tmp.path()) / "results").lexically_normal());
}

TEST_CASE("config_load_reports_missing_and_malformed_files") {
    TempDir tmp;
    REQUIRE_THROWS_AS(Config::load(tmp / "absent.yaml"), stagehand::ConfigError);

    stagehand::core::write_text(tmp / "bad.yaml", "stages: [ {name: a\n");
    REQUIRE_THROWS_AS(Config::load(tmp / "bad.yaml"), stagehand::ConfigError);
}

TEST_CASE("config_validate_rejects_bad_values") {
    Config base = Config::from_yaml(YAML::Load(kPipelineYaml));

    Config c = base;
    c.pipeline.name.clear();
    REQUIRE_THROWS_AS(c.validate(), stagehand::ValidationError);

    c = base;
    c.supervisor.poll_interval_ms = 0;
    REQUIRE_THROWS_AS(c.validate(), stagehand::ValidationError);

    c = base;
    c.supervisor.grace_period_ms = -1;
    REQUIRE_THROWS_AS(c.validate(), stagehand::ValidationError);

    c = base;
    c.recovery.on_missing_target = "ignore";
    REQUIRE_THROWS_AS(c.validate(), stagehand::ValidationError);

    c = base;
    c.stages.clear();
    REQUIRE_THROWS_AS(c.validate(), stagehand::ValidationError);

    c = base;
    c.stages[1].steps[0].intermediates[0].policy = "sometimes";
    REQUIRE_THROWS_AS(c.validate(), stagehand::ValidationError);

    c = base;
    c.stages[0].steps[0].name.clear();
    REQUIRE_THROWS_AS(c.validate(), stagehand::ValidationError);
}

TEST_CASE("config_rejects_a_command_that_is_a_map_without_command") {
    const char* yaml = R"(
pipeline: { name: p }
stages:
  - name: s
    steps:
      - name: x
        commands:
          - { stdout: out.txt }
)";
    REQUIRE_THROWS_AS(Config::from_yaml(YAML::Load(yaml)), stagehand::ConfigError);
}
