#include "interrupt.hpp"

namespace pagesync::infra {

std::atomic<bool> g_interrupted{false};

namespace {

// Только async-signal-safe операции: сообщение пишет upload loop
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace pagesync::infra
