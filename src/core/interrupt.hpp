#pragma once

#include <atomic>

extern std::atomic<bool> g_interrupted;

// Route SIGINT/SIGTERM into g_interrupted so the job can unwind through its
// normal cleanup path instead of dying mid-transfer.
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Throws NimbusError(Interrupted) once a signal has arrived.
void check_interrupted();
