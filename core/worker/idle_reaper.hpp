#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "persistent_supervisor.hpp"

namespace mcprouter {
namespace worker {

// IdleReaper periodically evicts persistent workers that have not been used
// for longer than idle_timeout_ms. The sweep runs on its own thread every
// sweep_interval_ms; stop() interrupts the wait immediately.
class IdleReaper {
public:
    IdleReaper(PersistentSupervisor &supervisor, int64_t idle_timeout_ms, int64_t sweep_interval_ms);
    ~IdleReaper();

    IdleReaper(const IdleReaper &) = delete;
    IdleReaper &operator=(const IdleReaper &) = delete;

    // Returns false if already running
    bool start();
    void stop();
    bool is_running() const;

    // One sweep on the caller's thread. Returns the number of workers evicted.
    size_t sweep_once();

    uint64_t sweep_count() const;
    uint64_t evicted_total() const;

private:
    void run();

    PersistentSupervisor &supervisor_;
    const int64_t idle_timeout_ms_;
    const int64_t sweep_interval_ms_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    bool stop_requested_ = false;
    uint64_t sweeps_ = 0;
    uint64_t evicted_ = 0;
    std::thread thread_;
};

}  // namespace worker
}  // namespace mcprouter
