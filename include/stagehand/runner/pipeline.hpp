#pragma once

#include "stagehand/config/configuration.hpp"
#include "stagehand/core/run_context.hpp"
#include "stagehand/core/types.hpp"
#include "stagehand/process/command.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stagehand::runner {

namespace fs = std::filesystem;

// Handed to in-process step actions.
struct StepContext {
    fs::path output_dir;
    CheckpointKey key;
    const RunContext* run_context = nullptr;

    bool stop_requested() const { return run_context && run_context->stop_requested(); }
};

using StepAction = std::function<void(StepContext&)>;

struct Intermediate {
    std::string pattern;   // relative paths are taken from the output folder
    CleanupPolicy policy = CleanupPolicy::ALWAYS;
};

struct Step {
    std::string name;
    std::vector<process::Command> commands;
    StepAction action;     // runs after the commands, if set
    bool nofail = false;
    std::vector<std::string> targets;
    std::vector<Intermediate> intermediates;
};

struct Stage {
    std::string name;
    bool checkpoint = true;
    std::vector<Step> steps;
};

// Ordered, validated stages. Names are translated on construction
// (lowercase, spaces become '-') and must be unique.
class PipelineDefinition {
public:
    PipelineDefinition(std::string name, std::vector<Stage> stages);

    static PipelineDefinition from_config(const config::Config& cfg, const fs::path& output_dir);

    const std::string& name() const { return name_; }
    const std::vector<Stage>& stages() const { return stages_; }

    std::vector<std::string> stage_names() const;
    std::optional<size_t> find_stage(const std::string& name) const;

    // Throws UnknownStageError listing the defined stages.
    size_t require_stage(const std::string& name) const;

    // Step keys of every stage, in execution order.
    std::vector<CheckpointKey> step_keys() const;

    // Index into step_keys() of the first step of `stage_index`.
    size_t first_key_index(size_t stage_index) const;

private:
    std::string name_;
    std::vector<Stage> stages_;
};

} // namespace stagehand::runner
