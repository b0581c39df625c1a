#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace stagehand {

class StagehandError : public std::runtime_error {
public:
    explicit StagehandError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public StagehandError {
public:
    explicit ConfigError(const std::string& message)
        : StagehandError("Config error: " + message) {}
};

class ValidationError : public StagehandError {
public:
    explicit ValidationError(const std::string& message)
        : StagehandError("Validation error: " + message) {}
};

class IOError : public StagehandError {
public:
    explicit IOError(const std::string& message)
        : StagehandError("I/O error: " + message) {}
};

class CheckpointStoreError : public IOError {
public:
    explicit CheckpointStoreError(const std::string& message)
        : IOError("checkpoint store: " + message) {}
};

class ProcessError : public StagehandError {
public:
    explicit ProcessError(const std::string& message)
        : StagehandError("Process error: " + message) {}
};

class PipelineDefinitionError : public StagehandError {
public:
    explicit PipelineDefinitionError(const std::string& message)
        : StagehandError("Illegal pipeline definition: " + message) {}
};

class PipelineExecutionError : public StagehandError {
public:
    explicit PipelineExecutionError(const std::string& message)
        : StagehandError("Illegal pipeline execution: " + message) {}
};

class UnknownStageError : public PipelineExecutionError {
public:
    UnknownStageError(const std::string& stage_name,
                      const std::vector<std::string>& defined)
        : PipelineExecutionError(describe(stage_name, defined)) {}

private:
    static std::string describe(const std::string& stage_name,
                                const std::vector<std::string>& defined) {
        std::string msg = "unknown stage '" + stage_name + "'";
        if (!defined.empty()) {
            msg += "; defined stages: ";
            for (size_t i = 0; i < defined.size(); ++i) {
                if (i > 0) msg += ", ";
                msg += defined[i];
            }
        }
        return msg;
    }
};

class StepFailure : public StagehandError {
public:
    StepFailure(const std::string& key, const std::string& message)
        : StagehandError("Step '" + key + "' failed: " + message), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class RecoveryInconsistency : public StagehandError {
public:
    RecoveryInconsistency(const std::string& key, const std::string& missing)
        : StagehandError("Recovery inconsistency: step '" + key +
                         "' is marked completed but its target is missing: " + missing) {}
};

class InterruptedExecution : public StagehandError {
public:
    explicit InterruptedExecution(int signal)
        : StagehandError("Interrupted by signal " + std::to_string(signal)),
          signal_(signal) {}

    int signal() const { return signal_; }

private:
    int signal_;
};

} // namespace stagehand
