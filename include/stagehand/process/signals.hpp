#pragma once

#include "stagehand/core/run_context.hpp"

#include <csignal>

namespace stagehand::process {

// Routes SIGINT/SIGTERM to `ctx` for the guard's lifetime and restores the
// previous dispositions afterwards. Only one guard may be active.
class SignalGuard {
public:
    explicit SignalGuard(RunContext& ctx);
    ~SignalGuard();

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;

private:
    struct sigaction old_int_{};
    struct sigaction old_term_{};
};

// Blocks SIGINT/SIGTERM in the calling thread until destroyed or released.
class SignalBlock {
public:
    SignalBlock();
    ~SignalBlock();

    SignalBlock(const SignalBlock&) = delete;
    SignalBlock& operator=(const SignalBlock&) = delete;

    void release();


private:
    sigset_t old_mask_;
    bool active_ = false;
};

// Called in a freshly forked child before exec: default dispositions and an
// empty signal mask. Async-signal-safe.
void reset_signals_in_child();

bool signal_guard_active();

} // namespace stagehand::process
