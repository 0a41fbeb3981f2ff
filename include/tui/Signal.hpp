#ifndef TUI_SIGNAL_HPP
#define TUI_SIGNAL_HPP

#include <atomic>

// Set by the SIGINT/SIGTERM handler; the main loop and save prompt poll it.
extern std::atomic_bool g_interrupted;

// Installs handlers for SIGINT and SIGTERM that only set g_interrupted.
void InstallInterruptHandlers();

inline bool InterruptRequested() {
    return g_interrupted.load(std::memory_order_relaxed);
}

#endif // TUI_SIGNAL_HPP
