#include "signal_handler.hpp"

#include <unistd.h>

#include <csignal>

namespace mcprouter {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<int> SignalHandler::last_signal_{0};
std::atomic<bool> SignalHandler::exit_on_repeat_{true};

void SignalHandler::install(bool exit_on_repeat) {
    exit_on_repeat_.store(exit_on_repeat);

    struct sigaction action {};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    // Worker I/O loops retry on EINTR, restart the rest
    action.sa_flags = SA_RESTART;
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

int SignalHandler::last_signal() { return last_signal_.load(); }

std::string SignalHandler::signal_name(int signal) {
    switch (signal) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "signal " + std::to_string(signal);
    }
}

void SignalHandler::reset() {
    shutdown_requested_.store(false);
    last_signal_.store(0);
}

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: only atomic operations and _exit allowed
    last_signal_.store(signal);
    if (shutdown_requested_.exchange(true) && exit_on_repeat_.load()) {
        ::_exit(128 + signal);
    }
}

}  // namespace runtime
}  // namespace mcprouter
