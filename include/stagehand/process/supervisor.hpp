#pragma once

#include "stagehand/core/run_context.hpp"
#include "stagehand/core/types.hpp"
#include "stagehand/process/command.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

namespace stagehand::process {

struct SupervisorOptions {
    std::chrono::milliseconds grace_period{5000};
    std::chrono::milliseconds poll_interval{20};
    std::string shell = "/bin/sh";
    std::string working_dir;       // empty: inherit
    std::string container_runtime = "docker";
    std::string container_name;    // empty: run on the host
};

struct SupervisorStats {
    uint64_t spawned = 0;        // processes forked
    uint64_t reaped = 0;         // processes collected by waitpid
    uint64_t terminations = 0;   // graceful termination sequences started
    uint64_t forced_kills = 0;   // groups escalated to SIGKILL
};

class ProcessSupervisor;

// One running process group. Destroying a handle whose processes are still
// alive kills the group and reaps every pid.
class ChildProcessHandle {
public:
    // Constructible only by ProcessSupervisor.
    class Token {
        friend class ProcessSupervisor;
        Token() {}
    };

    ChildProcessHandle(Token, ProcessSupervisor& owner, std::string key);
    ~ChildProcessHandle();

    ChildProcessHandle(const ChildProcessHandle&) = delete;
    ChildProcessHandle& operator=(const ChildProcessHandle&) = delete;

    pid_t pgid() const { return pgid_; }
    const std::vector<pid_t>& pids() const { return pids_; }
    const std::string& key() const { return key_; }
    Clock::time_point started() const { return started_; }
    bool termination_requested() const { return termination_requested_; }
    bool finished() const;

private:
    friend class ProcessSupervisor;

    ProcessSupervisor& owner_;
    std::string key_;
    pid_t pgid_ = 0;
    std::vector<pid_t> pids_;
    std::vector<int> statuses_;
    std::vector<bool> reaped_;
    Clock::time_point started_;
    bool termination_requested_ = false;
    Clock::time_point termination_started_;
    long max_rss_kb_ = 0;
};

class ProcessSupervisor {
public:
    ProcessSupervisor(RunContext& ctx, SupervisorOptions options);

    // Spawns the command group, waits for it and classifies the outcome.
    // `on_spawn` runs with the group id once the group is registered.
    // Throws ProcessError if the group cannot be started.
    ExitOutcome run(const Command& command, const std::string& key,
                    const std::function<void(pid_t)>& on_spawn = {});

    const SupervisorStats& stats() const { return stats_; }
    const SupervisorOptions& options() const { return options_; }

private:
    friend class ChildProcessHandle;

    std::unique_ptr<ChildProcessHandle> spawn(const Command& command, const std::string& key);
    ExitOutcome wait(ChildProcessHandle& handle);
    bool poll_children(ChildProcessHandle& handle);
    void reap_blocking(ChildProcessHandle& handle);
    void start_termination(ChildProcessHandle& handle, bool signal_group);
    void force_kill(ChildProcessHandle& handle);
    void unregister(ChildProcessHandle& handle);
    ExitOutcome classify(const ChildProcessHandle& handle) const;

    RunContext& ctx_;
    SupervisorOptions options_;
    SupervisorStats stats_;
};

// True if a process with this pid exists (EPERM counts as existing).
bool process_alive(pid_t pid);

} // namespace stagehand::process
