#pragma once

/**
 * @file event_types.hpp
 * @brief Worker lifecycle events
 *
 * Emitted as worker processes move through their lifecycle and journaled
 * by the EventEmitter, which serves GET /events and the lifecycle counters
 * in GET /stats.
 *
 * - Events are immutable value types (cheap to copy)
 * - timestamp_ms is epoch milliseconds (for display)
 * - `at` is a steady_clock time point (for ordering and durations)
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mcprouter {
namespace events {

// Which supervisor strategy owns the worker
enum class Strategy { PERSISTENT, TRANSIENT };

inline const char *strategy_to_string(Strategy s) {
    switch (s) {
        case Strategy::PERSISTENT:
            return "persistent";
        case Strategy::TRANSIENT:
            return "transient";
        default:
            return "unknown";
    }
}

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief A worker process was created by the OS
 */
struct WorkerSpawnedEvent {
    uint64_t event_id = 0;
    std::string service_id;
    int pid = -1;
    Strategy strategy = Strategy::PERSISTENT;
    int64_t timestamp_ms = 0;
    std::chrono::steady_clock::time_point at;
};

/**
 * @brief A worker was admitted for requests
 *
 * confirmed is false when readiness was assumed: the initialize handshake
 * failed (persistent) or the grace period elapsed without output (transient).
 */
struct WorkerReadyEvent {
    uint64_t event_id = 0;
    std::string service_id;
    int pid = -1;
    Strategy strategy = Strategy::PERSISTENT;
    bool confirmed = false;
    int64_t timestamp_ms = 0;
    std::chrono::steady_clock::time_point at;
};

/**
 * @brief A worker process has been reaped (transition to Dead)
 */
struct WorkerExitedEvent {
    uint64_t event_id = 0;
    std::string service_id;
    int pid = -1;
    Strategy strategy = Strategy::PERSISTENT;
    std::optional<int> exit_code;    // set when the process exited normally
    std::optional<int> term_signal;  // set when it was killed by a signal
    bool requested = false;          // true if the router asked it to terminate
    size_t failed_requests = 0;      // pending requests failed by the exit
    int64_t timestamp_ms = 0;
    std::chrono::steady_clock::time_point at;
};

/**
 * @brief The idle reaper removed a persistent worker
 */
struct WorkerEvictedEvent {
    uint64_t event_id = 0;
    std::string service_id;
    int pid = -1;
    Strategy strategy = Strategy::PERSISTENT;
    int64_t idle_ms = 0;
    size_t pending_requests = 0;
    int64_t timestamp_ms = 0;
    std::chrono::steady_clock::time_point at;
};

using Event = std::variant<WorkerSpawnedEvent, WorkerReadyEvent, WorkerExitedEvent, WorkerEvictedEvent>;

inline uint64_t get_event_id(const Event &event) {
    return std::visit([](auto &&e) { return e.event_id; }, event);
}

inline const std::string &get_service_id(const Event &event) {
    return std::visit([](auto &&e) -> const std::string & { return e.service_id; }, event);
}

inline std::chrono::steady_clock::time_point get_time_point(const Event &event) {
    return std::visit([](auto &&e) { return e.at; }, event);
}

// Fill the common timestamp fields of any event struct
template <typename T>
T &stamp(T &event) {
    event.timestamp_ms = now_epoch_ms();
    event.at = std::chrono::steady_clock::now();
    return event;
}

}  // namespace events
}  // namespace mcprouter
