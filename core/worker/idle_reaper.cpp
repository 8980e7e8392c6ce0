#include "idle_reaper.hpp"

#include "logging/logger.hpp"

namespace mcprouter {
namespace worker {

IdleReaper::IdleReaper(PersistentSupervisor &supervisor, int64_t idle_timeout_ms, int64_t sweep_interval_ms)
    : supervisor_(supervisor), idle_timeout_ms_(idle_timeout_ms), sweep_interval_ms_(sweep_interval_ms) {}

IdleReaper::~IdleReaper() { stop(); }

bool IdleReaper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return false;
    }
    running_ = true;
    stop_requested_ = false;
    thread_ = std::thread(&IdleReaper::run, this);
    LOG_INFO("[IdleReaper] Started (idle timeout " << idle_timeout_ms_ << "ms, sweep every " << sweep_interval_ms_
                                                   << "ms)");
    return true;
}

void IdleReaper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    LOG_INFO("[IdleReaper] Stopped after " << sweeps_ << " sweep(s), " << evicted_ << " eviction(s)");
}

bool IdleReaper::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

size_t IdleReaper::sweep_once() {
    const size_t evicted = supervisor_.evict_idle(idle_timeout_ms_);

    std::lock_guard<std::mutex> lock(mutex_);
    ++sweeps_;
    evicted_ += evicted;
    if (evicted > 0) {
        LOG_DEBUG("[IdleReaper] Sweep evicted " << evicted << " worker(s)");
    }
    return evicted;
}

uint64_t IdleReaper::sweep_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweeps_;
}

uint64_t IdleReaper::evicted_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}

void IdleReaper::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, std::chrono::milliseconds(sweep_interval_ms_), [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        sweep_once();
        lock.lock();
    }
}

}  // namespace worker
}  // namespace mcprouter
