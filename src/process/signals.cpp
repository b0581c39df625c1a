#include "stagehand/process/signals.hpp"
#include "stagehand/core/errors.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>

#include <pthread.h>

namespace stagehand::process {

namespace {

std::atomic<RunContext*> g_active_context{nullptr};

extern "C" void stagehand_signal_handler(int sig) {
    int saved_errno = errno;
    RunContext* ctx = g_active_context.load();
    if (ctx) {
        ctx->on_signal(sig);
    }
    errno = saved_errno;
}

void install_handler(int sig, struct sigaction* old) {
    struct sigaction action {};
    action.sa_handler = stagehand_signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (sigaction(sig, &action, old) != 0) {
        throw ProcessError(std::string("sigaction failed: ") + std::strerror(errno));
    }
}

sigset_t termination_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

} // namespace

SignalGuard::SignalGuard(RunContext& ctx) {
    RunContext* expected = nullptr;
    if (!g_active_context.compare_exchange_strong(expected, &ctx)) {
        throw ProcessError("a signal guard is already active");
    }
    try {
        install_handler(SIGINT, &old_int_);
        install_handler(SIGTERM, &old_term_);
    } catch (const ProcessError&) {
        sigaction(SIGINT, &old_int_, nullptr);
        g_active_context.store(nullptr);
        throw;
    }
}

SignalGuard::~SignalGuard() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
    g_active_context.store(nullptr);
}

SignalBlock::SignalBlock() {
    sigset_t set = termination_set();
    int rc = pthread_sigmask(SIG_BLOCK, &set, &old_mask_);
    if (rc != 0) {
        throw ProcessError(std::string("pthread_sigmask failed: ") + std::strerror(rc));
    }
    active_ = true;
}

SignalBlock::~SignalBlock() {
    release();
}

void SignalBlock::release() {
    if (!active_) return;
    pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    active_ = false;
}

void reset_signals_in_child() {
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    sigaction(SIGINT, &dfl, nullptr);
    sigaction(SIGTERM, &dfl, nullptr);
    sigaction(SIGPIPE, &dfl, nullptr);

    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
}

bool signal_guard_active() {
    return g_active_context.load() != nullptr;
}

} // namespace stagehand::process
