#pragma once

#include <atomic>
#include <string>

namespace mcprouter {
namespace runtime {

/**
 * @brief SIGINT/SIGTERM handling for the router process
 *
 * The first signal sets a flag polled by Runtime::run() and records which
 * signal it was. Shutdown then waits for workers to drain, which can take up
 * to their shutdown timeout; a repeated signal during that time exits at once
 * with 128 + signal.
 */
class SignalHandler {
public:
    static void install(bool exit_on_repeat = true);
    static bool is_shutdown_requested();

    // Most recent signal received (0 if none)
    static int last_signal();
    static std::string signal_name(int signal);

    // Test hook
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
    static std::atomic<int> last_signal_;
    static std::atomic<bool> exit_on_repeat_;
};

}  // namespace runtime
}  // namespace mcprouter
