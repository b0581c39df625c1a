#include "stagehand/core/run_context.hpp"

#include <csignal>

namespace stagehand {

void RunContext::on_signal(int sig) noexcept {
    int expected = 0;
    shutdown_signal.compare_exchange_strong(expected, sig);
    signal_deliveries.fetch_add(1);

    pid_t pgid = active_pgid.load();
    if (pgid > 0 && !termination_sent.exchange(true)) {
        ::kill(-pgid, SIGTERM);
    }
}

void RunContext::reset() noexcept {
    shutdown_signal.store(0);
    signal_deliveries.store(0);
    active_pgid.store(0);
    termination_sent.store(false);
    recover_mode = RecoverMode::NONE;
}

} // namespace stagehand
