#pragma once

/**
 * @file event_emitter.hpp
 * @brief Journal of worker lifecycle events
 *
 * Producers (worker read loops, supervisors) call emit(); it never blocks on
 * a reader. Events land in a fixed-size ring (oldest overwritten) and bump
 * per-service counters that survive the ring.
 *
 * Readers never register: an EventCursor remembers the last event id it saw
 * and asks the journal for the next one. A cursor that falls behind the ring
 * skips the overwritten events and counts them as missed.
 *
 * Thread model:
 * - emit() may be called from any thread
 * - Each EventCursor is used by one thread
 * - A cursor must not outlive the EventEmitter it reads
 */

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "event_types.hpp"

namespace mcprouter {
namespace events {

/**
 * @brief Reader-side filter (empty service_id = all services)
 */
struct EventFilter {
    std::string service_id;
    std::optional<Strategy> strategy;

    bool matches(const Event &event) const;

    static EventFilter all();
    static EventFilter for_service(const std::string &service_id);
};

// Lifetime totals for one service
struct ServiceCounters {
    uint64_t spawned = 0;
    uint64_t ready = 0;
    uint64_t exited = 0;
    uint64_t crashed = 0;  // exits the router did not ask for
    uint64_t evicted = 0;
    uint64_t failed_requests = 0;
};

nlohmann::json counters_to_json(const ServiceCounters &counters);
nlohmann::json event_to_json(const Event &event);

class EventEmitter {
public:
    explicit EventEmitter(size_t capacity = 256);

    EventEmitter(const EventEmitter &) = delete;
    EventEmitter &operator=(const EventEmitter &) = delete;

    // Assign the next event_id, append to the ring and update counters
    void emit(Event event);

    /**
     * @brief Events newer than `after_id` still held by the ring, oldest first
     *
     * @param limit Maximum number returned (0 = no limit)
     */
    std::vector<Event> events_since(uint64_t after_id, const EventFilter &filter = EventFilter::all(),
                                    size_t limit = 0) const;

    /**
     * @brief First matching event newer than `after_id`, waiting up to timeout_ms
     *
     * @param scanned_to Set to the id of the last event examined, matching or
     *                   not, so the caller can resume after it
     * @param missed Incremented by the number of events overwritten before
     *               they could be examined
     */
    std::optional<Event> next_after(uint64_t after_id, const EventFilter &filter, int timeout_ms,
                                    uint64_t &scanned_to, uint64_t &missed) const;

    // Id of the most recent event (0 before the first)
    uint64_t last_event_id() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

    ServiceCounters counters(const std::string &service_id) const;
    std::map<std::string, ServiceCounters> all_counters() const;

private:
    void count(const Event &event);

    const size_t capacity_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::deque<Event> ring_;
    uint64_t last_event_id_ = 0;
    std::map<std::string, ServiceCounters> counters_;
};

/**
 * @brief Sequential reader over an EventEmitter
 *
 * Starts after the most recent event at construction, so it only sees what
 * happens from then on.
 */
class EventCursor {
public:
    explicit EventCursor(const EventEmitter &emitter, EventFilter filter = EventFilter::all());

    // Next matching event; waits up to timeout_ms (0 = don't wait)
    std::optional<Event> next(int timeout_ms = 0);

    uint64_t position() const { return position_; }
    uint64_t missed() const { return missed_; }

private:
    const EventEmitter &emitter_;
    EventFilter filter_;
    uint64_t position_;
    uint64_t missed_ = 0;
};

}  // namespace events
}  // namespace mcprouter
