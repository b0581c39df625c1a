#pragma once

#include "stagehand/core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace stagehand::runner {

namespace fs = std::filesystem;

struct MarkerRecord {
    CheckpointKey key;
    MarkerStatus status = MarkerStatus::ABSENT;
    pid_t pid = 0;
    std::string ts;
    int64_t updated_ns = 0;
    fs::path path;
};

struct RunStateRecord {
    RunState state = RunState::INITIALIZING;
    pid_t pid = 0;
    int64_t updated_ns = 0;
    nlohmann::json data;
};

// On-disk markers for one pipeline inside an output folder.
//
//   <out>/checkpoints/<pipeline>.<stage>[.<step>].<status>.flag
//   <out>/<pipeline>_<state>.flag
//   <out>/<pipeline>_recover.flag
//
// Every write is durable before the call returns. Nothing is cached: the
// files are the only source of truth. Failures raise CheckpointStoreError.
class CheckpointStore {
public:
    CheckpointStore(fs::path output_dir, std::string pipeline);

    const fs::path& output_dir() const { return output_dir_; }
    const std::string& pipeline() const { return pipeline_; }
    fs::path checkpoint_dir() const { return output_dir_ / "checkpoints"; }

    void mark_start(const CheckpointKey& key);
    void mark_running(const CheckpointKey& key, pid_t pid);
    void mark_complete(const CheckpointKey& key);
    void mark_failed(const CheckpointKey& key);

    MarkerStatus status(const CheckpointKey& key) const;
    std::optional<MarkerRecord> record(const CheckpointKey& key) const;

    // Every live marker of the pipeline, one per key.
    std::vector<MarkerRecord> list() const;

    // Removes all markers of the pipeline, its run-state flag and any
    // dynamic-recovery record.
    void clear_all();

    void set_run_state(RunState state, const nlohmann::json& extra = nlohmann::json::object());
    std::optional<RunStateRecord> run_state() const;

    void set_dynamic_recovery(bool requested, const std::string& reason = "");
    bool dynamic_recovery_requested() const;

    fs::path marker_path(const CheckpointKey& key, MarkerStatus status) const;
    fs::path run_state_path(RunState state) const;
    fs::path recover_flag_path() const;

private:
    void transition(const CheckpointKey& key, MarkerStatus status, pid_t pid);
    MarkerRecord read_marker(const fs::path& path, const CheckpointKey& key, MarkerStatus status) const;
    void remove_file(const fs::path& path) const;

    fs::path output_dir_;
    std::string pipeline_;
};

} // namespace stagehand::runner
