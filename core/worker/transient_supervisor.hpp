#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "concurrency_gate.hpp"
#include "i_worker_strategy.hpp"
#include "worker_process.hpp"

namespace mcprouter {
namespace worker {

struct TransientOptions {
    size_t max_concurrent = 10;
    int request_timeout_ms = 30000;
    int ready_grace_ms = 1000;
    WorkerOptions worker;  // strategy is forced to TRANSIENT
};

/**
 * @brief One fresh worker process per request
 *
 * Each admitted request spawns a worker, waits for it to be ready (first JSON
 * line on stdout, or ready_grace_ms elapsing), performs exactly one exchange
 * and then terminates the worker. The admission permit is held until the
 * worker has been reaped, so at most max_concurrent transient processes
 * exist at any time.
 */
class TransientSupervisor : public IWorkerStrategy {
public:
    explicit TransientSupervisor(TransientOptions options);
    ~TransientSupervisor() override;

    TransientSupervisor(const TransientSupervisor &) = delete;
    TransientSupervisor &operator=(const TransientSupervisor &) = delete;

    // Exchange `request` (id included) with a fresh worker. Blocks for admission.
    jsonrpc::RpcOutcome dispatch(const std::shared_ptr<const service::ServiceDefinition> &service,
                                 const nlohmann::json &request) override;

    // Build a request with a supervisor-assigned id ("req-N") and dispatch it
    jsonrpc::RpcOutcome submit(const std::shared_ptr<const service::ServiceDefinition> &service,
                               const std::string &method, const nlohmann::json &params);

    // Close admission, terminate running workers and wait for every permit
    void shutdown() override;

    StrategyStats stats() const override;
    events::Strategy kind() const override { return events::Strategy::TRANSIENT; }

    size_t active() const { return gate_.active(); }
    size_t waiting() const { return gate_.waiting(); }

private:
    void on_worker_exit(const WorkerProcess &worker);

    TransientOptions options_;
    ConcurrencyGate gate_;
    std::atomic<uint64_t> next_request_id_{1};

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<WorkerProcess>> running_;
    bool shutting_down_ = false;
};

}  // namespace worker
}  // namespace mcprouter
