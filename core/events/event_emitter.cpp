#include "event_emitter.hpp"

#include <chrono>
#include <type_traits>
#include <utility>

namespace mcprouter {
namespace events {

bool EventFilter::matches(const Event &event) const {
    if (!service_id.empty() && get_service_id(event) != service_id) {
        return false;
    }
    if (strategy) {
        const Strategy event_strategy = std::visit([](auto &&e) { return e.strategy; }, event);
        if (event_strategy != *strategy) {
            return false;
        }
    }
    return true;
}

EventFilter EventFilter::all() { return EventFilter{}; }

EventFilter EventFilter::for_service(const std::string &service_id) {
    EventFilter filter;
    filter.service_id = service_id;
    return filter;
}

nlohmann::json counters_to_json(const ServiceCounters &counters) {
    return {{"spawned", counters.spawned},         {"ready", counters.ready},
            {"exited", counters.exited},           {"crashed", counters.crashed},
            {"evicted", counters.evicted},         {"failed_requests", counters.failed_requests}};
}

nlohmann::json event_to_json(const Event &event) {
    return std::visit(
        [](auto &&e) {
            using T = std::decay_t<decltype(e)>;
            nlohmann::json j = {{"event_id", e.event_id},
                                {"service_id", e.service_id},
                                {"pid", e.pid},
                                {"strategy", strategy_to_string(e.strategy)},
                                {"timestamp_ms", e.timestamp_ms}};
            if constexpr (std::is_same_v<T, WorkerSpawnedEvent>) {
                j["type"] = "spawned";
            } else if constexpr (std::is_same_v<T, WorkerReadyEvent>) {
                j["type"] = "ready";
                j["confirmed"] = e.confirmed;
            } else if constexpr (std::is_same_v<T, WorkerExitedEvent>) {
                j["type"] = "exited";
                j["exit_code"] = e.exit_code ? nlohmann::json(*e.exit_code) : nlohmann::json();
                j["signal"] = e.term_signal ? nlohmann::json(*e.term_signal) : nlohmann::json();
                j["requested"] = e.requested;
                j["failed_requests"] = e.failed_requests;
            } else if constexpr (std::is_same_v<T, WorkerEvictedEvent>) {
                j["type"] = "evicted";
                j["idle_ms"] = e.idle_ms;
                j["pending_requests"] = e.pending_requests;
            }
            return j;
        },
        event);
}

EventEmitter::EventEmitter(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

void EventEmitter::emit(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t id = ++last_event_id_;
        std::visit([id](auto &&e) { e.event_id = id; }, event);

        count(event);
        if (ring_.size() >= capacity_) {
            ring_.pop_front();
        }
        ring_.push_back(std::move(event));
    }
    cv_.notify_all();
}

// Caller holds mutex_
void EventEmitter::count(const Event &event) {
    ServiceCounters &c = counters_[get_service_id(event)];
    std::visit(
        [&c](auto &&e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, WorkerSpawnedEvent>) {
                ++c.spawned;
            } else if constexpr (std::is_same_v<T, WorkerReadyEvent>) {
                ++c.ready;
            } else if constexpr (std::is_same_v<T, WorkerExitedEvent>) {
                ++c.exited;
                if (!e.requested) {
                    ++c.crashed;
                }
                c.failed_requests += e.failed_requests;
            } else if constexpr (std::is_same_v<T, WorkerEvictedEvent>) {
                ++c.evicted;
            }
        },
        event);
}

std::vector<Event> EventEmitter::events_since(uint64_t after_id, const EventFilter &filter, size_t limit) const {
    std::vector<Event> result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &event : ring_) {
        if (get_event_id(event) <= after_id || !filter.matches(event)) {
            continue;
        }
        result.push_back(event);
        if (limit > 0 && result.size() >= limit) {
            break;
        }
    }
    return result;
}

std::optional<Event> EventEmitter::next_after(uint64_t after_id, const EventFilter &filter, int timeout_ms,
                                              uint64_t &scanned_to, uint64_t &missed) const {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 0);
    scanned_to = after_id;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (!ring_.empty()) {
            const uint64_t oldest = get_event_id(ring_.front());
            if (oldest > scanned_to + 1) {
                missed += oldest - scanned_to - 1;
                scanned_to = oldest - 1;
            }
            // Ring ids are contiguous, so the next unseen event sits at a fixed offset
            for (size_t i = static_cast<size_t>(scanned_to + 1 - oldest); i < ring_.size(); ++i) {
                const Event &event = ring_[i];
                scanned_to = get_event_id(event);
                if (filter.matches(event)) {
                    return event;
                }
            }
        }

        if (timeout_ms <= 0 ||
            !cv_.wait_until(lock, deadline, [this, &scanned_to] { return last_event_id_ > scanned_to; })) {
            return std::nullopt;
        }
    }
}

uint64_t EventEmitter::last_event_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_event_id_;
}

size_t EventEmitter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ring_.size();
}

ServiceCounters EventEmitter::counters(const std::string &service_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(service_id);
    return it != counters_.end() ? it->second : ServiceCounters{};
}

std::map<std::string, ServiceCounters> EventEmitter::all_counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

EventCursor::EventCursor(const EventEmitter &emitter, EventFilter filter)
    : emitter_(emitter), filter_(std::move(filter)), position_(emitter.last_event_id()) {}

std::optional<Event> EventCursor::next(int timeout_ms) {
    uint64_t scanned_to = position_;
    auto event = emitter_.next_after(position_, filter_, timeout_ms, scanned_to, missed_);
    position_ = scanned_to;
    return event;
}

}  // namespace events
}  // namespace mcprouter
