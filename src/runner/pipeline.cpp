#include "stagehand/runner/pipeline.hpp"
#include "stagehand/core/errors.hpp"
#include "stagehand/core/utils.hpp"

#include <set>
#include <utility>

namespace stagehand::runner {

namespace {

void check_name(const std::string& what, const std::string& name) {
    if (name.empty()) {
        throw PipelineDefinitionError(what + " name must not be empty");
    }
    for (char c : name) {
        if (c == '.' || c == '/' || c == '\t' || c == '\n' || c == '\r') {
            throw PipelineDefinitionError(what + " name '" + name +
                                          "' must not contain '.', '/' or control whitespace");
        }
    }
}

std::string resolve_in(const fs::path& dir, const std::string& path) {
    if (path.empty()) return path;
    fs::path p(path);
    return p.is_absolute() ? p.string() : (dir / p).string();
}

} // namespace

PipelineDefinition::PipelineDefinition(std::string name, std::vector<Stage> stages)
    : name_(std::move(name)), stages_(std::move(stages)) {
    check_name("pipeline", name_);
    if (stages_.empty()) {
        throw PipelineDefinitionError("pipeline '" + name_ + "' has no stages");
    }

    std::set<std::string> stage_names;
    for (auto& stage : stages_) {
        stage.name = core::translate_name(stage.name);
        check_name("stage", stage.name);
        if (!stage_names.insert(stage.name).second) {
            throw PipelineDefinitionError("duplicate stage name '" + stage.name + "'");
        }

        std::set<std::string> step_names;
        for (auto& step : stage.steps) {
            step.name = core::translate_name(step.name);
            check_name("step", step.name);
            if (!step_names.insert(step.name).second) {
                throw PipelineDefinitionError("duplicate step name '" + step.name +
                                              "' in stage '" + stage.name + "'");
            }
        }
    }
}

PipelineDefinition PipelineDefinition::from_config(const config::Config& cfg,
                                                   const fs::path& output_dir) {
    std::vector<Stage> stages;
    for (const auto& sc : cfg.stages) {
        Stage stage;
        stage.name = sc.name;
        stage.checkpoint = sc.checkpoint;

        for (const auto& stc : sc.steps) {
            Step step;
            step.name = stc.name;
            step.nofail = stc.nofail;
            step.targets = stc.targets;

            for (const auto& cc : stc.commands) {
                process::Command cmd = cc.argv.empty()
                    ? process::Command::from_line(cc.line, cfg.supervisor.shell)
                    : process::Command::from_argv(cc.argv);
                process::Streams streams;
                streams.stdin_path = resolve_in(output_dir, cc.stdin_path);
                streams.stdout_path = resolve_in(output_dir, cc.stdout_path);
                streams.stderr_path = resolve_in(output_dir, cc.stderr_path);
                streams.append = cc.append;
                cmd.redirect(streams);
                step.commands.push_back(std::move(cmd));
            }

            for (const auto& ic : stc.intermediates) {
                auto policy = string_to_cleanup_policy(ic.policy);
                if (!policy) {
                    throw ConfigError("unknown cleanup policy '" + ic.policy + "'");
                }
                step.intermediates.push_back({ic.path, *policy});
            }
            stage.steps.push_back(std::move(step));
        }
        stages.push_back(std::move(stage));
    }
    return PipelineDefinition(cfg.pipeline.name, std::move(stages));
}

std::vector<std::string> PipelineDefinition::stage_names() const {
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& s : stages_) {
        names.push_back(s.name);
    }
    return names;
}

std::optional<size_t> PipelineDefinition::find_stage(const std::string& name) const {
    const std::string wanted = core::translate_name(name);
    for (size_t i = 0; i < stages_.size(); ++i) {
        if (stages_[i].name == wanted) return i;
    }
    return std::nullopt;
}

size_t PipelineDefinition::require_stage(const std::string& name) const {
    auto idx = find_stage(name);
    if (!idx) {
        throw UnknownStageError(name, stage_names());
    }
    return *idx;
}

std::vector<CheckpointKey> PipelineDefinition::step_keys() const {
    std::vector<CheckpointKey> keys;
    for (const auto& stage : stages_) {
        for (const auto& step : stage.steps) {
            keys.push_back({stage.name, step.name});
        }
    }
    return keys;
}

size_t PipelineDefinition::first_key_index(size_t stage_index) const {
    size_t idx = 0;
    for (size_t i = 0; i < stage_index && i < stages_.size(); ++i) {
        idx += stages_[i].steps.size();
    }
    return idx;
}

} // namespace stagehand::runner
