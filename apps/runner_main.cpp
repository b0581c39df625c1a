#include "stagehand/config/configuration.hpp"
#include "stagehand/core/errors.hpp"
#include "stagehand/core/run_context.hpp"
#include "stagehand/core/types.hpp"
#include "stagehand/runner/controller.hpp"
#include "stagehand/runner/pipeline.hpp"

#include "runner_status.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace {

int run_command(const std::string &config_path, const std::string &output_dir_override,
                stagehand::runner::RunOptions cli, bool quiet) {
  using namespace stagehand;

  config::Config cfg = config::Config::load(config_path);
  cfg.validate();

  fs::path output_dir = output_dir_override.empty() ? cfg.resolved_output_dir()
                                                    : fs::path(output_dir_override);

  runner::PipelineDefinition definition =
      runner::PipelineDefinition::from_config(cfg, fs::absolute(output_dir));

  runner::RunOptions opts = runner::options_from_config(cfg, std::move(cli));
  opts.config_path = config_path;
  if (quiet) {
    opts.echo_events = false;
  }

  RunContext ctx;
  runner::PipelineController controller(std::move(definition), output_dir, opts, ctx);
  runner::RunResult result = controller.run();

  std::cerr << "[stagehand] " << controller.definition().name() << ": "
            << run_state_to_string(result.state) << " (executed "
            << result.executed.size() << ", skipped " << result.skipped.size();
  if (!result.failed_nofail.empty()) {
    std::cerr << ", nofail failures " << result.failed_nofail.size();
  }
  std::cerr << ")" << std::endl;
  if (!result.error.empty() && result.state != RunState::HALTED) {
    std::cerr << "Error: " << result.error << std::endl;
  }
  if (result.state != RunState::COMPLETED) {
    std::cerr << "Cleanup script: " << controller.cleanup_script_path().string() << std::endl;
  }
  return result.exit_code;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"stagehand - checkpointed pipeline runner"};
  app.require_subcommand(1);

  std::string config_path;
  std::string output_dir;
  stagehand::runner::RunOptions cli;
  bool quiet = false;

  auto run_cmd = app.add_subcommand("run", "Run the pipeline");
  run_cmd->add_option("--config", config_path, "Path to pipeline.yaml")->required();
  run_cmd->add_option("--output-dir", output_dir,
                      "Output folder (overrides pipeline.output_dir)");
  run_cmd->add_flag("-R,--recover", cli.recover,
                    "Re-run from the first unfinished step");
  run_cmd->add_flag("-N,--new-start", cli.new_start,
                    "Discard all checkpoints and start over");
  run_cmd->add_option("--start-at", cli.start_at, "First checkpoint stage to run");
  run_cmd->add_option("--stop-at", cli.stop_at, "Last stage to run (inclusive)");
  run_cmd->add_option("--stop-before", cli.stop_before, "Stage to stop in front of");
  run_cmd->add_flag("-D,--dirty", cli.dirty,
                    "Keep intermediates, only write the cleanup script");
  run_cmd->add_option("--container", cli.supervisor.container_name,
                      "Run every command inside this container");
  run_cmd->add_flag("-q,--quiet", quiet, "Do not echo events to stdout");

  std::string status_config;
  std::string status_output_dir;
  auto status_cmd = app.add_subcommand("status", "Show the checkpoint state of a pipeline");
  status_cmd->add_option("--config", status_config, "Path to pipeline.yaml")->required();
  status_cmd->add_option("--output-dir", status_output_dir,
                         "Output folder (overrides pipeline.output_dir)");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int rc = app.exit(e);
    return rc == 0 ? 0 : 2;
  }

  try {
    if (run_cmd->parsed()) {
      return run_command(config_path, output_dir, cli, quiet);
    }
    if (status_cmd->parsed()) {
      return status_command(status_config, status_output_dir);
    }
  } catch (const stagehand::ConfigError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const stagehand::ValidationError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const stagehand::PipelineDefinitionError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const stagehand::PipelineExecutionError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << app.help() << std::endl;
  return 2;
}
