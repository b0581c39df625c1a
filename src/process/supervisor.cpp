#include "stagehand/process/supervisor.hpp"
#include "stagehand/core/errors.hpp"
#include "stagehand/process/signals.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace stagehand::process {

namespace {

class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    Fd& operator=(Fd&& o) noexcept {
        if (this != &o) {
            reset();
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

Fd open_redirect(const std::string& path, int flags) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw ProcessError("cannot open '" + path + "': " + std::strerror(errno));
    }
    return Fd(fd);
}

std::vector<char*> to_cargv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        out.push_back(const_cast<char*>(a.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

void child_fail(const char* what, const char* arg) {
    const char* err = std::strerror(errno);
    ssize_t rc = ::write(STDERR_FILENO, what, std::strlen(what));
    rc = ::write(STDERR_FILENO, arg, std::strlen(arg));
    rc = ::write(STDERR_FILENO, ": ", 2);
    rc = ::write(STDERR_FILENO, err, std::strlen(err));
    rc = ::write(STDERR_FILENO, "\n", 1);
    (void)rc;
    _exit(127);
}

// Runs a short helper to completion, e.g. `docker kill`.
int run_helper(const std::vector<std::string>& argv) {
    std::vector<char*> cargv = to_cargv(argv);
    pid_t pid = ::fork();
    if (pid < 0) {
        return -1;
    }
    if (pid == 0) {
        reset_signals_in_child();
        execvp(cargv[0], cargv.data());
        child_fail("exec failed: ", cargv[0]);
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
}

} // namespace

bool process_alive(pid_t pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

ChildProcessHandle::ChildProcessHandle(Token, ProcessSupervisor& owner, std::string key)
    : owner_(owner), key_(std::move(key)), started_(Clock::now()) {}

ChildProcessHandle::~ChildProcessHandle() {
    if (!finished()) {
        owner_.force_kill(*this);
        owner_.reap_blocking(*this);
    }
    owner_.unregister(*this);
}

bool ChildProcessHandle::finished() const {
    return std::all_of(reaped_.begin(), reaped_.end(), [](bool r) { return r; });
}

ProcessSupervisor::ProcessSupervisor(RunContext& ctx, SupervisorOptions options)
    : ctx_(ctx), options_(std::move(options)) {}

ExitOutcome ProcessSupervisor::run(const Command& command, const std::string& key,
                                   const std::function<void(pid_t)>& on_spawn) {
    auto handle = spawn(command, key);
    if (on_spawn) {
        on_spawn(handle->pgid());
    }
    ExitOutcome out = wait(*handle);
    out.duration = Clock::now() - handle->started();
    return out;
}

std::unique_ptr<ChildProcessHandle> ProcessSupervisor::spawn(const Command& command,
                                                             const std::string& key) {
    if (command.empty()) {
        throw ProcessError("empty command for " + key);
    }

    Command effective = options_.container_name.empty()
        ? command
        : command.wrapped_for_container(options_.container_runtime, options_.container_name);

    const auto& segments = effective.segments();
    const auto& streams = effective.streams();
    const size_t n = segments.size();

    const int write_flags = O_WRONLY | O_CREAT | (streams.append ? O_APPEND : O_TRUNC);
    Fd in_fd, out_fd, err_fd;
    if (!streams.stdin_path.empty()) {
        in_fd = open_redirect(streams.stdin_path, O_RDONLY);
    }
    if (!streams.stdout_path.empty()) {
        out_fd = open_redirect(streams.stdout_path, write_flags);
    }
    if (!streams.stderr_path.empty()) {
        if (streams.stderr_path == streams.stdout_path) {
            int dup = ::fcntl(out_fd.get(), F_DUPFD_CLOEXEC, 0);
            if (dup < 0) {
                throw ProcessError(std::string("fcntl failed: ") + std::strerror(errno));
            }
            err_fd = Fd(dup);
        } else {
            err_fd = open_redirect(streams.stderr_path, write_flags);
        }
    }

    std::vector<Fd> pipe_fds;
    for (size_t i = 0; i + 1 < n; ++i) {
        int p[2];
        if (::pipe2(p, O_CLOEXEC) != 0) {
            throw ProcessError(std::string("pipe failed: ") + std::strerror(errno));
        }
        pipe_fds.emplace_back(p[0]);
        pipe_fds.emplace_back(p[1]);
    }

    std::vector<std::vector<char*>> cargvs;
    cargvs.reserve(n);
    for (const auto& argv : segments) {
        cargvs.push_back(to_cargv(argv));
    }

    auto handle = std::make_unique<ChildProcessHandle>(ChildProcessHandle::Token(), *this, key);

    // A signal arriving between fork and registration stays pending until
    // the group id is published.
    SignalBlock block;
    ctx_.termination_sent.store(false);

    for (size_t i = 0; i < n; ++i) {
        pid_t pid = ::fork();
        if (pid < 0) {
            int err = errno;
            if (handle->pgid_ > 0) {
                ctx_.active_pgid.store(handle->pgid_);
            }
            block.release();
            throw ProcessError("fork failed for " + key + ": " + std::strerror(err));
        }
        if (pid == 0) {
            ::setpgid(0, i == 0 ? 0 : handle->pgid_);
            reset_signals_in_child();

            if (!options_.working_dir.empty() && ::chdir(options_.working_dir.c_str()) != 0) {
                child_fail("chdir: ", options_.working_dir.c_str());
            }
            if (i == 0 && in_fd.get() >= 0) {
                if (::dup2(in_fd.get(), STDIN_FILENO) < 0) child_fail("dup2 stdin: ", streams.stdin_path.c_str());
            } else if (i > 0) {
                if (::dup2(pipe_fds[2 * (i - 1)].get(), STDIN_FILENO) < 0) child_fail("dup2 pipe: ", "stdin");
            }
            if (i + 1 == n && out_fd.get() >= 0) {
                if (::dup2(out_fd.get(), STDOUT_FILENO) < 0) child_fail("dup2 stdout: ", streams.stdout_path.c_str());
            } else if (i + 1 < n) {
                if (::dup2(pipe_fds[2 * i + 1].get(), STDOUT_FILENO) < 0) child_fail("dup2 pipe: ", "stdout");
            }
            if (err_fd.get() >= 0) {
                if (::dup2(err_fd.get(), STDERR_FILENO) < 0) child_fail("dup2 stderr: ", streams.stderr_path.c_str());
            }

            execvp(cargvs[i][0], cargvs[i].data());
            child_fail("exec failed: ", cargvs[i][0]);
        }

        if (i == 0) {
            handle->pgid_ = pid;
        }
        // Both sides call setpgid so the group exists before either proceeds.
        ::setpgid(pid, handle->pgid_);
        handle->pids_.push_back(pid);
        handle->statuses_.push_back(0);
        handle->reaped_.push_back(false);
        ++stats_.spawned;
    }

    pipe_fds.clear();

    ctx_.active_pgid.store(handle->pgid_);
    if (ctx_.stop_requested()) {
        start_termination(*handle, true);
    }
    block.release();

    return handle;
}

bool ProcessSupervisor::poll_children(ChildProcessHandle& handle) {
    for (size_t i = 0; i < handle.pids_.size(); ++i) {
        if (handle.reaped_[i]) continue;
        int status = 0;
        struct rusage ru {};
        pid_t r = ::wait4(handle.pids_[i], &status, WNOHANG, &ru);
        if (r == handle.pids_[i]) {
            handle.statuses_[i] = status;
            handle.reaped_[i] = true;
            handle.max_rss_kb_ = std::max(handle.max_rss_kb_, static_cast<long>(ru.ru_maxrss));
            ++stats_.reaped;
        } else if (r < 0 && errno == ECHILD) {
            std::cerr << "[supervisor] pid " << handle.pids_[i] << " of " << handle.key_
                      << " was reaped elsewhere" << std::endl;
            handle.reaped_[i] = true;
        }
    }
    return handle.finished();
}

void ProcessSupervisor::reap_blocking(ChildProcessHandle& handle) {
    for (size_t i = 0; i < handle.pids_.size(); ++i) {
        if (handle.reaped_[i]) continue;
        int status = 0;
        struct rusage ru {};
        pid_t r;
        while ((r = ::wait4(handle.pids_[i], &status, 0, &ru)) < 0 && errno == EINTR) {
        }
        handle.reaped_[i] = true;
        if (r == handle.pids_[i]) {
            handle.statuses_[i] = status;
            handle.max_rss_kb_ = std::max(handle.max_rss_kb_, static_cast<long>(ru.ru_maxrss));
            ++stats_.reaped;
        }
    }
}

void ProcessSupervisor::force_kill(ChildProcessHandle& handle) {
    if (handle.pgid_ <= 0) return;
    std::cerr << "[supervisor] " << handle.key_ << ": grace period expired, sending SIGKILL to group "
              << handle.pgid_ << std::endl;
    ::kill(-handle.pgid_, SIGKILL);
    handle.termination_requested_ = true;
    ++stats_.forced_kills;

    if (!options_.container_name.empty()) {
        int rc = run_helper({options_.container_runtime, "kill", "--signal=KILL", options_.container_name});
        if (rc != 0) {
            std::cerr << "[supervisor] " << options_.container_runtime << " kill "
                      << options_.container_name << " returned " << rc << std::endl;
        }
    }
}

void ProcessSupervisor::unregister(ChildProcessHandle& handle) {
    pid_t expected = handle.pgid_;
    ctx_.active_pgid.compare_exchange_strong(expected, 0);
}

void ProcessSupervisor::start_termination(ChildProcessHandle& handle, bool signal_group) {
    handle.termination_requested_ = true;
    handle.termination_started_ = Clock::now();
    ++stats_.terminations;
    if (!signal_group) return;

    if (!ctx_.termination_sent.exchange(true)) {
        ::kill(-handle.pgid_, SIGTERM);
    }
    std::cerr << "[supervisor] " << handle.key_ << ": terminating process group "
              << handle.pgid_ << std::endl;
}

ExitOutcome ProcessSupervisor::wait(ChildProcessHandle& handle) {
    for (;;) {
        bool done = poll_children(handle);
        // A group the signal handler already terminated may be gone by now.
        if (ctx_.stop_requested() && !handle.termination_requested_) {
            start_termination(handle, !done);
        }
        if (done) break;

        if (handle.termination_requested_ &&
            Clock::now() - handle.termination_started_ >= options_.grace_period) {
            force_kill(handle);
            reap_blocking(handle);
            break;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }

    unregister(handle);
    return classify(handle);
}

ExitOutcome ProcessSupervisor::classify(const ChildProcessHandle& handle) const {
    ExitOutcome out;
    out.interrupted = handle.termination_requested_;
    out.max_rss_kb = handle.max_rss_kb_;

    const size_t n = handle.pids_.size();
    for (size_t i = 0; i < n; ++i) {
        int st = handle.statuses_[i];
        if (!WIFSIGNALED(st)) continue;
        int sig = WTERMSIG(st);
        // Upstream segments of a pipe routinely die of SIGPIPE.
        if (sig == SIGPIPE && i + 1 < n) continue;
        out.kind = ExitKind::KILLED_BY_SIGNAL;
        out.signal = sig;
        out.exit_code = 128 + sig;
        return out;
    }
    for (size_t i = 0; i < n; ++i) {
        int st = handle.statuses_[i];
        if (WIFEXITED(st) && WEXITSTATUS(st) != 0) {
            out.kind = ExitKind::FAILED;
            out.exit_code = WEXITSTATUS(st);
        }
    }
    return out;
}

} // namespace stagehand::process
