#include "interrupt.hpp"
#include "errors.hpp"
#include <csignal>

std::atomic<bool> g_interrupted{false};

static void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

void check_interrupted() {
    if (is_interrupted()) {
        throw NimbusError(ErrorKind::Interrupted, "Interrupted by signal");
    }
}
