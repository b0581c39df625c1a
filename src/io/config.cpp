#include "stagehand/config/configuration.hpp"
#include "stagehand/core/errors.hpp"
#include "stagehand/core/types.hpp"

#include <fstream>

namespace stagehand::config {

static std::vector<std::string> read_string_list(const YAML::Node& n) {
    std::vector<std::string> out;
    if (!n) return out;
    if (n.IsScalar()) {
        out.push_back(n.as<std::string>());
        return out;
    }
    if (n.IsSequence()) {
        for (const auto& item : n) {
            out.push_back(item.as<std::string>());
        }
    }
    return out;
}

static void read_command_body(const YAML::Node& n, CommandConfig& cmd) {
    if (n.IsScalar()) {
        cmd.line = n.as<std::string>();
    } else if (n.IsSequence()) {
        cmd.argv = read_string_list(n);
    } else {
        throw ConfigError("command must be a string or a list of arguments");
    }
}

static void read_redirects(const YAML::Node& n, CommandConfig& cmd) {
    if (n["stdin"]) cmd.stdin_path = n["stdin"].as<std::string>();
    if (n["stdout"]) cmd.stdout_path = n["stdout"].as<std::string>();
    if (n["stderr"]) cmd.stderr_path = n["stderr"].as<std::string>();
    if (n["append"]) cmd.append = n["append"].as<bool>();
}

static CommandConfig read_command_item(const YAML::Node& n) {
    CommandConfig cmd;
    if (n.IsMap()) {
        if (!n["command"]) {
            throw ConfigError("commands entry is missing 'command'");
        }
        read_command_body(n["command"], cmd);
        read_redirects(n, cmd);
    } else {
        read_command_body(n, cmd);
    }
    return cmd;
}

static StepConfig read_step(const YAML::Node& s) {
    StepConfig step;
    if (s["name"]) step.name = s["name"].as<std::string>();
    if (s["nofail"]) step.nofail = s["nofail"].as<bool>();

    if (s["command"]) {
        CommandConfig cmd;
        read_command_body(s["command"], cmd);
        read_redirects(s, cmd);
        step.commands.push_back(cmd);
    }
    if (s["commands"]) {
        if (!s["commands"].IsSequence()) {
            throw ConfigError("step '" + step.name + "': commands must be a list");
        }
        for (const auto& c : s["commands"]) {
            step.commands.push_back(read_command_item(c));
        }
    }

    step.targets = read_string_list(s["targets"]);

    if (s["intermediates"]) {
        for (const auto& i : s["intermediates"]) {
            IntermediateConfig ic;
            if (i.IsScalar()) {
                ic.path = i.as<std::string>();
            } else {
                if (i["path"]) ic.path = i["path"].as<std::string>();
                if (i["policy"]) ic.policy = i["policy"].as<std::string>();
            }
            step.intermediates.push_back(ic);
        }
    }
    return step;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    Config cfg;
    try {
        YAML::Node node = YAML::LoadFile(path.string());
        cfg = from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
    cfg.base_dir = fs::absolute(path).parent_path();
    return cfg;
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["pipeline"]) {
        auto p = node["pipeline"];
        if (p["name"]) cfg.pipeline.name = p["name"].as<std::string>();
        if (p["output_dir"]) cfg.pipeline.output_dir = p["output_dir"].as<std::string>();
    }

    if (node["supervisor"]) {
        auto s = node["supervisor"];
        if (s["grace_period_ms"]) cfg.supervisor.grace_period_ms = s["grace_period_ms"].as<int>();
        if (s["poll_interval_ms"]) cfg.supervisor.poll_interval_ms = s["poll_interval_ms"].as<int>();
        if (s["shell"]) cfg.supervisor.shell = s["shell"].as<std::string>();
    }

    if (node["recovery"]) {
        auto r = node["recovery"];
        if (r["on_missing_target"]) cfg.recovery.on_missing_target = r["on_missing_target"].as<std::string>();
    }

    if (node["cleanup"]) {
        auto c = node["cleanup"];
        if (c["manual"]) cfg.cleanup.manual = c["manual"].as<bool>();
    }

    if (node["container"]) {
        auto c = node["container"];
        if (c["name"]) cfg.container.name = c["name"].as<std::string>();
        if (c["runtime"]) cfg.container.runtime = c["runtime"].as<std::string>();
    }

    if (node["logging"]) {
        auto l = node["logging"];
        if (l["events_file"]) cfg.logging.events_file = l["events_file"].as<bool>();
        if (l["echo_events"]) cfg.logging.echo_events = l["echo_events"].as<bool>();
    }

    if (node["stages"]) {
        if (!node["stages"].IsSequence()) {
            throw ConfigError("stages must be a list");
        }
        for (const auto& st : node["stages"]) {
            StageConfig stage;
            if (st["name"]) stage.name = st["name"].as<std::string>();
            if (st["checkpoint"]) stage.checkpoint = st["checkpoint"].as<bool>();
            if (st["steps"]) {
                for (const auto& s : st["steps"]) {
                    stage.steps.push_back(read_step(s));
                }
            }
            cfg.stages.push_back(stage);
        }
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["name"] = pipeline.name;
    node["pipeline"]["output_dir"] = pipeline.output_dir;

    node["supervisor"]["grace_period_ms"] = supervisor.grace_period_ms;
    node["supervisor"]["poll_interval_ms"] = supervisor.poll_interval_ms;
    node["supervisor"]["shell"] = supervisor.shell;

    node["recovery"]["on_missing_target"] = recovery.on_missing_target;

    node["cleanup"]["manual"] = cleanup.manual;

    node["container"]["name"] = container.name;
    node["container"]["runtime"] = container.runtime;

    node["logging"]["events_file"] = logging.events_file;
    node["logging"]["echo_events"] = logging.echo_events;

    YAML::Node stages_node(YAML::NodeType::Sequence);
    for (const auto& stage : stages) {
        YAML::Node st;
        st["name"] = stage.name;
        st["checkpoint"] = stage.checkpoint;

        YAML::Node steps_node(YAML::NodeType::Sequence);
        for (const auto& step : stage.steps) {
            YAML::Node s;
            s["name"] = step.name;
            s["nofail"] = step.nofail;

            YAML::Node cmds(YAML::NodeType::Sequence);
            for (const auto& cmd : step.commands) {
                YAML::Node c;
                if (!cmd.argv.empty()) {
                    for (const auto& a : cmd.argv) c["command"].push_back(a);
                } else {
                    c["command"] = cmd.line;
                }
                if (!cmd.stdin_path.empty()) c["stdin"] = cmd.stdin_path;
                if (!cmd.stdout_path.empty()) c["stdout"] = cmd.stdout_path;
                if (!cmd.stderr_path.empty()) c["stderr"] = cmd.stderr_path;
                if (cmd.append) c["append"] = true;
                cmds.push_back(c);
            }
            s["commands"] = cmds;

            if (!step.targets.empty()) {
                for (const auto& t : step.targets) s["targets"].push_back(t);
            }
            if (!step.intermediates.empty()) {
                for (const auto& i : step.intermediates) {
                    YAML::Node in;
                    in["path"] = i.path;
                    in["policy"] = i.policy;
                    s["intermediates"].push_back(in);
                }
            }
            steps_node.push_back(s);
        }
        st["steps"] = steps_node;
        stages_node.push_back(st);
    }
    node["stages"] = stages_node;

    return node;
}

void Config::validate() const {
    if (pipeline.name.empty()) {
        throw ValidationError("pipeline.name must not be empty");
    }
    if (pipeline.name.find('/') != std::string::npos) {
        throw ValidationError("pipeline.name must not contain '/'");
    }
    if (pipeline.output_dir.empty()) {
        throw ValidationError("pipeline.output_dir must not be empty");
    }
    if (supervisor.grace_period_ms < 0) {
        throw ValidationError("supervisor.grace_period_ms must be >= 0");
    }
    if (supervisor.poll_interval_ms < 1 || supervisor.poll_interval_ms > 1000) {
        throw ValidationError("supervisor.poll_interval_ms must be in [1,1000]");
    }
    if (supervisor.shell.empty()) {
        throw ValidationError("supervisor.shell must not be empty");
    }
    if (!string_to_missing_target_policy(recovery.on_missing_target)) {
        throw ValidationError("recovery.on_missing_target must be 'warn', 'rerun' or 'fail'");
    }
    if (!container.name.empty() && container.runtime.empty()) {
        throw ValidationError("container.runtime must be set when container.name is given");
    }
    if (stages.empty()) {
        throw ValidationError("stages must contain at least one stage");
    }

    for (size_t i = 0; i < stages.size(); ++i) {
        const auto& stage = stages[i];
        const std::string where = "stages[" + std::to_string(i) + "]";
        if (stage.name.empty()) {
            throw ValidationError(where + ".name must not be empty");
        }
        for (size_t j = 0; j < stage.steps.size(); ++j) {
            const auto& step = stage.steps[j];
            const std::string swhere = where + ".steps[" + std::to_string(j) + "]";
            if (step.name.empty()) {
                throw ValidationError(swhere + ".name must not be empty");
            }
            for (const auto& cmd : step.commands) {
                if (cmd.line.empty() && cmd.argv.empty()) {
                    throw ValidationError(swhere + " has an empty command");
                }
            }
            for (const auto& t : step.targets) {
                if (t.empty()) {
                    throw ValidationError(swhere + ".targets must not contain empty paths");
                }
            }
            for (const auto& in : step.intermediates) {
                if (in.path.empty()) {
                    throw ValidationError(swhere + ".intermediates entry has an empty path");
                }
                if (!string_to_cleanup_policy(in.policy)) {
                    throw ValidationError(swhere + ".intermediates policy must be 'always' or 'only_on_failure'");
                }
            }
        }
    }
}

fs::path Config::resolved_output_dir() const {
    fs::path out(pipeline.output_dir);
    if (out.is_relative() && !base_dir.empty()) {
        out = base_dir / out;
    }
    return fs::absolute(out).lexically_normal();
}

} // namespace stagehand::config
