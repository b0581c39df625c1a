#pragma once

#include "stagehand/core/types.hpp"

#include <atomic>
#include <sys/types.h>

namespace stagehand {

// State shared between the main path and the SIGINT/SIGTERM handler.
// The atomic members are the only things the handler touches.
struct RunContext {
    std::atomic<int> shutdown_signal{0};
    std::atomic<int> signal_deliveries{0};
    std::atomic<pid_t> active_pgid{0};
    std::atomic<bool> termination_sent{false};

    // Main path only.
    RecoverMode recover_mode = RecoverMode::NONE;

    static_assert(std::atomic<int>::is_always_lock_free, "signal handler needs lock-free int");
    static_assert(std::atomic<pid_t>::is_always_lock_free, "signal handler needs lock-free pid_t");
    static_assert(std::atomic<bool>::is_always_lock_free, "signal handler needs lock-free bool");

    bool stop_requested() const { return shutdown_signal.load() != 0; }
    int stop_signal() const { return shutdown_signal.load(); }

    // Async-signal-safe. Records the first signal, counts every delivery and
    // forwards SIGTERM to the active group at most once per group.
    void on_signal(int sig) noexcept;

    // Main-path equivalent of a delivered signal.
    void request_stop(int sig) noexcept { on_signal(sig); }

    void reset() noexcept;
};

} // namespace stagehand
