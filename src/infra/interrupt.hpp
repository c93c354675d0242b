#pragma once

#include <atomic>
#include <csignal>

namespace pagesync::infra {

extern std::atomic<bool> g_interrupted;

// SIGINT/SIGTERM only raise the flag; the upload loop polls it between
// requests and tears the session down.
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

inline void set_interrupted(bool value) {
    g_interrupted.store(value, std::memory_order_relaxed);
}

} // namespace pagesync::infra
