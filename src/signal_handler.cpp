#include "signal_handler.hpp"
#include <csignal>

namespace {
    volatile std::sig_atomic_t g_signal_status = 0;
}

void signal_handler(int signal) {
    g_signal_status = signal;
}

void setup_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // Writes to a dead peer surface as EPIPE from send(), not as a signal.
    std::signal(SIGPIPE, SIG_IGN);
}

bool shutdown_requested() {
    return g_signal_status != 0;
}
