#include "runner_status.hpp"

#include "stagehand/config/configuration.hpp"
#include "stagehand/core/types.hpp"
#include "stagehand/runner/checkpoint_store.hpp"
#include "stagehand/runner/pipeline.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int status_command(const std::string &config_path, const std::string &output_dir_override) {
  using namespace stagehand;

  config::Config cfg = config::Config::load(config_path);
  cfg.validate();

  fs::path output_dir = output_dir_override.empty() ? cfg.resolved_output_dir()
                                                    : fs::path(output_dir_override);
  output_dir = fs::absolute(output_dir);

  runner::PipelineDefinition definition = runner::PipelineDefinition::from_config(cfg, output_dir);
  runner::CheckpointStore store(output_dir, definition.name());

  std::cout << "pipeline: " << definition.name() << std::endl;
  std::cout << "output:   " << output_dir.string() << std::endl;

  auto state = store.run_state();
  if (state) {
    std::cout << "state:    " << run_state_to_string(state->state) << " (pid " << state->pid
              << ")" << std::endl;
  } else {
    std::cout << "state:    never run" << std::endl;
  }
  std::cout << "recover:  "
            << (store.dynamic_recovery_requested() ? "dynamic recovery pending" : "none")
            << std::endl;

  size_t width = 0;
  for (const auto &key : definition.step_keys()) {
    width = std::max(width, key.to_string().size());
  }

  for (const auto &stage : definition.stages()) {
    std::cout << std::endl;
    CheckpointKey stage_key{stage.name, ""};
    std::cout << stage.name;
    if (stage.checkpoint) {
      std::cout << "  [" << marker_status_to_string(store.status(stage_key)) << "]";
    } else {
      std::cout << "  [no checkpoint]";
    }
    std::cout << std::endl;

    for (const auto &step : stage.steps) {
      CheckpointKey key{stage.name, step.name};
      std::cout << "  " << std::left << std::setw(static_cast<int>(width) + 2) << key.to_string()
                << marker_status_to_string(store.status(key));
      if (step.nofail) {
        std::cout << " (nofail)";
      }
      std::cout << std::endl;
    }
  }
  return 0;
}
