#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace stagehand::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  std::string name;
  std::string output_dir = "output"; // relative to the config file
};

struct SupervisorConfig {
  int grace_period_ms = 5000;
  int poll_interval_ms = 20;
  std::string shell = "/bin/sh";
};

struct RecoveryConfig {
  std::string on_missing_target = "warn"; // warn | rerun | fail
};

struct CleanupConfig {
  bool manual = false; // only write the cleanup script, never delete
};

struct ContainerConfig {
  std::string name;
  std::string runtime = "docker";
};

struct LoggingConfig {
  bool events_file = true;
  bool echo_events = true;
};

// A single command: either a shell-style line or an explicit argv.
struct CommandConfig {
  std::string line;
  std::vector<std::string> argv;
  std::string stdin_path;
  std::string stdout_path;
  std::string stderr_path;
  bool append = false;
};

struct IntermediateConfig {
  std::string path;
  std::string policy = "always"; // always | only_on_failure
};

struct StepConfig {
  std::string name;
  std::vector<CommandConfig> commands;
  bool nofail = false;
  std::vector<std::string> targets;
  std::vector<IntermediateConfig> intermediates;
};

struct StageConfig {
  std::string name;
  bool checkpoint = true;
  std::vector<StepConfig> steps;
};

struct Config {
  PipelineConfig pipeline;
  SupervisorConfig supervisor;
  RecoveryConfig recovery;
  CleanupConfig cleanup;
  ContainerConfig container;
  LoggingConfig logging;
  std::vector<StageConfig> stages;

  // Directory of the file this config was loaded from; empty for
  // in-memory configs.
  fs::path base_dir;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  fs::path resolved_output_dir() const;
};

} // namespace stagehand::config
