#include "tui/Signal.hpp"

#include <csignal>
#include <initializer_list>

std::atomic_bool g_interrupted{false};

namespace {
void OnInterrupt(int) {
    // Async-signal-safe: only flip the atomic flag.
    g_interrupted.store(true, std::memory_order_relaxed);
}
}

void InstallInterruptHandlers() {
    g_interrupted.store(false, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = OnInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    for (int signum : {SIGINT, SIGTERM}) {
        sigaction(signum, &action, nullptr);
    }
}
