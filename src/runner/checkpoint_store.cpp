#include "stagehand/runner/checkpoint_store.hpp"
#include "stagehand/core/errors.hpp"
#include "stagehand/core/utils.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <unistd.h>

namespace stagehand::runner {

using json = nlohmann::json;

namespace {

const std::array<MarkerStatus, 4> kMarkerStatuses = {
    MarkerStatus::INITIALIZING,
    MarkerStatus::RUNNING,
    MarkerStatus::COMPLETED,
    MarkerStatus::FAILED,
};

const std::array<RunState, 6> kRunStates = {
    RunState::INITIALIZING,
    RunState::RUNNING,
    RunState::PAUSED,
    RunState::COMPLETED,
    RunState::FAILED,
    RunState::HALTED,
};

json read_json_file(const fs::path& path) {
    std::string text;
    try {
        text = core::read_text(path);
    } catch (const IOError& e) {
        throw CheckpointStoreError(e.what());
    }
    if (core::trim(text).empty()) {
        return json::object();
    }
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw CheckpointStoreError("unreadable record " + path.string() + ": " + e.what());
    }
}

void write_json_file(const fs::path& path, const json& record) {
    try {
        fs::create_directories(path.parent_path());
        core::write_text_durable(path, record.dump() + "\n");
    } catch (const IOError& e) {
        throw CheckpointStoreError(e.what());
    } catch (const fs::filesystem_error& e) {
        throw CheckpointStoreError(e.what());
    }
}

} // namespace

CheckpointStore::CheckpointStore(fs::path output_dir, std::string pipeline)
    : output_dir_(std::move(output_dir)), pipeline_(std::move(pipeline)) {}

fs::path CheckpointStore::marker_path(const CheckpointKey& key, MarkerStatus status) const {
    std::string name = pipeline_ + "." + key.stage;
    if (!key.step.empty()) {
        name += "." + key.step;
    }
    name += "." + marker_status_to_string(status) + ".flag";
    return checkpoint_dir() / name;
}

fs::path CheckpointStore::run_state_path(RunState state) const {
    return output_dir_ / (pipeline_ + "_" + run_state_to_string(state) + ".flag");
}

fs::path CheckpointStore::recover_flag_path() const {
    return output_dir_ / (pipeline_ + "_recover.flag");
}

void CheckpointStore::remove_file(const fs::path& path) const {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw CheckpointStoreError("cannot remove " + path.string() + ": " + ec.message());
    }
}

void CheckpointStore::transition(const CheckpointKey& key, MarkerStatus status, pid_t pid) {
    json record = {
        {"pipeline", pipeline_},
        {"key", key.to_string()},
        {"status", marker_status_to_string(status)},
        {"pid", static_cast<int>(pid)},
        {"ts", core::get_iso_timestamp()},
        {"updated_ns", core::now_unix_ns()}
    };
    write_json_file(marker_path(key, status), record);

    bool removed = false;
    for (MarkerStatus other : kMarkerStatuses) {
        if (other == status) continue;
        fs::path p = marker_path(key, other);
        std::error_code ec;
        if (fs::exists(p, ec)) {
            remove_file(p);
            removed = true;
        }
    }
    if (removed) {
        try {
            core::fsync_directory(checkpoint_dir());
        } catch (const IOError& e) {
            throw CheckpointStoreError(e.what());
        }
    }
}

void CheckpointStore::mark_start(const CheckpointKey& key) {
    transition(key, MarkerStatus::INITIALIZING, ::getpid());
}

void CheckpointStore::mark_running(const CheckpointKey& key, pid_t pid) {
    transition(key, MarkerStatus::RUNNING, pid);
}

void CheckpointStore::mark_complete(const CheckpointKey& key) {
    transition(key, MarkerStatus::COMPLETED, ::getpid());
}

void CheckpointStore::mark_failed(const CheckpointKey& key) {
    transition(key, MarkerStatus::FAILED, ::getpid());
}

MarkerRecord CheckpointStore::read_marker(const fs::path& path, const CheckpointKey& key,
                                          MarkerStatus status) const {
    MarkerRecord rec;
    rec.key = key;
    rec.status = status;
    rec.path = path;

    json j = read_json_file(path);
    if (j.is_object()) {
        rec.pid = static_cast<pid_t>(j.value("pid", 0));
        rec.ts = j.value("ts", std::string());
        rec.updated_ns = j.value("updated_ns", static_cast<int64_t>(0));
    }
    return rec;
}

std::optional<MarkerRecord> CheckpointStore::record(const CheckpointKey& key) const {
    std::optional<MarkerRecord> best;
    for (MarkerStatus status : kMarkerStatuses) {
        fs::path p = marker_path(key, status);
        std::error_code ec;
        if (!fs::exists(p, ec)) continue;
        MarkerRecord rec = read_marker(p, key, status);
        if (!best || rec.updated_ns >= best->updated_ns) {
            best = rec;
        }
    }
    return best;
}

MarkerStatus CheckpointStore::status(const CheckpointKey& key) const {
    auto rec = record(key);
    return rec ? rec->status : MarkerStatus::ABSENT;
}

std::vector<MarkerRecord> CheckpointStore::list() const {
    std::vector<MarkerRecord> out;
    std::error_code ec;
    if (!fs::is_directory(checkpoint_dir(), ec)) {
        return out;
    }

    const std::string prefix = pipeline_ + ".";
    std::vector<CheckpointKey> keys;
    for (const auto& entry : fs::directory_iterator(checkpoint_dir(), ec)) {
        std::string name = entry.path().filename().string();
        if (!core::starts_with(name, prefix) || !core::ends_with(name, ".flag")) continue;

        std::string body = name.substr(prefix.size(), name.size() - prefix.size() - 5);
        auto parts = core::split(body, '.');
        CheckpointKey key;
        if (parts.size() == 2) {
            key.stage = parts[0];
        } else if (parts.size() == 3) {
            key.stage = parts[0];
            key.step = parts[1];
        } else {
            continue;
        }
        if (string_to_marker_status(parts.back()) == MarkerStatus::ABSENT) continue;

        bool seen = false;
        for (const auto& k : keys) {
            if (k == key) {
                seen = true;
                break;
            }
        }
        if (!seen) keys.push_back(key);
    }
    if (ec) {
        throw CheckpointStoreError("cannot list " + checkpoint_dir().string() + ": " + ec.message());
    }

    for (const auto& key : keys) {
        auto rec = record(key);
        if (rec) out.push_back(*rec);
    }
    std::sort(out.begin(), out.end(), [](const MarkerRecord& a, const MarkerRecord& b) {
        return a.updated_ns < b.updated_ns;
    });
    return out;
}

void CheckpointStore::clear_all() {
    for (const auto& rec : list()) {
        for (MarkerStatus status : kMarkerStatuses) {
            fs::path p = marker_path(rec.key, status);
            std::error_code ec;
            if (fs::exists(p, ec)) remove_file(p);
        }
    }
    for (RunState state : kRunStates) {
        fs::path p = run_state_path(state);
        std::error_code ec;
        if (fs::exists(p, ec)) remove_file(p);
    }
    std::error_code ec;
    if (fs::exists(recover_flag_path(), ec)) remove_file(recover_flag_path());

    try {
        if (fs::is_directory(checkpoint_dir(), ec)) core::fsync_directory(checkpoint_dir());
        if (fs::is_directory(output_dir_, ec)) core::fsync_directory(output_dir_);
    } catch (const IOError& e) {
        throw CheckpointStoreError(e.what());
    }
}

void CheckpointStore::set_run_state(RunState state, const json& extra) {
    json record = {
        {"pipeline", pipeline_},
        {"status", run_state_to_string(state)},
        {"pid", static_cast<int>(::getpid())},
        {"ts", core::get_iso_timestamp()},
        {"updated_ns", core::now_unix_ns()}
    };
    if (extra.is_object()) {
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            record[it.key()] = it.value();
        }
    }
    write_json_file(run_state_path(state), record);

    for (RunState other : kRunStates) {
        if (other == state) continue;
        fs::path p = run_state_path(other);
        std::error_code ec;
        if (fs::exists(p, ec)) remove_file(p);
    }
    try {
        core::fsync_directory(output_dir_);
    } catch (const IOError& e) {
        throw CheckpointStoreError(e.what());
    }
}

std::optional<RunStateRecord> CheckpointStore::run_state() const {
    std::optional<RunStateRecord> best;
    for (RunState state : kRunStates) {
        fs::path p = run_state_path(state);
        std::error_code ec;
        if (!fs::exists(p, ec)) continue;

        RunStateRecord rec;
        rec.state = state;
        rec.data = read_json_file(p);
        if (rec.data.is_object()) {
            rec.pid = static_cast<pid_t>(rec.data.value("pid", 0));
            rec.updated_ns = rec.data.value("updated_ns", static_cast<int64_t>(0));
        }
        if (!best || rec.updated_ns >= best->updated_ns) {
            best = rec;
        }
    }
    return best;
}

void CheckpointStore::set_dynamic_recovery(bool requested, const std::string& reason) {
    fs::path p = recover_flag_path();
    if (requested) {
        json record = {
            {"pipeline", pipeline_},
            {"mode", recover_mode_to_string(RecoverMode::DYNAMIC)},
            {"reason", reason},
            {"ts", core::get_iso_timestamp()}
        };
        write_json_file(p, record);
        return;
    }

    std::error_code ec;
    if (!fs::exists(p, ec)) return;
    remove_file(p);
    try {
        core::fsync_directory(output_dir_);
    } catch (const IOError& e) {
        throw CheckpointStoreError(e.what());
    }
}

bool CheckpointStore::dynamic_recovery_requested() const {
    std::error_code ec;
    return fs::exists(recover_flag_path(), ec);
}

} // namespace stagehand::runner
