#pragma once

#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "i_worker_strategy.hpp"
#include "worker_process.hpp"

namespace mcprouter {
namespace worker {

struct PersistentOptions {
    int request_timeout_ms = 120000;
    WorkerOptions worker;  // strategy is forced to PERSISTENT
};

// Snapshot of one registered persistent worker
struct PersistentWorkerInfo {
    std::string service_id;
    pid_t pid = -1;
    WorkerState state = WorkerState::STARTING;
    int64_t idle_ms = 0;
    int64_t uptime_ms = 0;
    size_t pending_requests = 0;
};

/**
 * @brief One long-lived worker per service, reused across requests
 *
 * Workers are spawned on first use and complete an `initialize` handshake
 * before being handed out. Concurrent acquires for a service whose worker is
 * still starting share that single spawn. A worker that exits is removed from
 * the registry by its exit callback, so the next acquire spawns a fresh one.
 *
 * Thread Safety:
 * - All public methods may be called concurrently
 * - mutex_ is never held while spawning, handshaking, terminating or waiting
 *   on a worker
 */
class PersistentSupervisor : public IWorkerStrategy {
public:
    struct AcquireResult {
        std::shared_ptr<WorkerProcess> worker;
        jsonrpc::ErrorKind kind = jsonrpc::ErrorKind::OK;
        std::string error;

        bool ok() const { return worker != nullptr; }
    };

    explicit PersistentSupervisor(PersistentOptions options);
    ~PersistentSupervisor() override;

    PersistentSupervisor(const PersistentSupervisor &) = delete;
    PersistentSupervisor &operator=(const PersistentSupervisor &) = delete;

    /**
     * @brief Get the Ready worker for a service, spawning it if absent or dead
     *
     * @return The worker, or a failure (SPAWN_FAILED, PROCESS_EXITED,
     *         SHUTTING_DOWN) with a message
     */
    AcquireResult acquire(const std::shared_ptr<const service::ServiceDefinition> &service);

    // acquire() + WorkerProcess::send_and_await() with the configured timeout
    jsonrpc::RpcOutcome dispatch(const std::shared_ptr<const service::ServiceDefinition> &service,
                                 const nlohmann::json &request) override;

    /**
     * @brief Terminate and unregister workers idle for longer than threshold_ms
     *
     * Pending requests on an evicted worker are not waited for; they fail
     * when the process exits. Emits a WorkerEvictedEvent per worker.
     *
     * @return Number of workers evicted
     */
    size_t evict_idle(int64_t threshold_ms);

    void shutdown() override;

    StrategyStats stats() const override;
    events::Strategy kind() const override { return events::Strategy::PERSISTENT; }

    size_t worker_count() const;
    std::shared_ptr<WorkerProcess> find_worker(const std::string &service_id) const;
    std::vector<PersistentWorkerInfo> workers() const;
    bool is_shutting_down() const;

private:
    AcquireResult start_worker(const std::shared_ptr<const service::ServiceDefinition> &service);
    // Lenient: failures are logged, the outcome tells the caller whether the worker survived
    jsonrpc::RpcOutcome handshake(const std::shared_ptr<WorkerProcess> &worker, int timeout_ms);
    void on_worker_exit(const WorkerProcess &worker);

    PersistentOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable starting_cv_;
    std::unordered_map<std::string, std::shared_ptr<WorkerProcess>> workers_;
    std::unordered_map<std::string, std::shared_future<AcquireResult>> starting_;
    // Terminated but not yet reaped; kept so shutdown() can wait for them
    std::vector<std::shared_ptr<WorkerProcess>> draining_;
    bool shutting_down_ = false;
};

}  // namespace worker
}  // namespace mcprouter
