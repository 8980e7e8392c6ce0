#include "transient_supervisor.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace mcprouter {
namespace worker {

TransientSupervisor::TransientSupervisor(TransientOptions options)
    : options_(std::move(options)), gate_(options_.max_concurrent) {
    options_.worker.strategy = events::Strategy::TRANSIENT;
}

TransientSupervisor::~TransientSupervisor() { shutdown(); }

jsonrpc::RpcOutcome TransientSupervisor::dispatch(const std::shared_ptr<const service::ServiceDefinition> &service,
                                                  const nlohmann::json &request) {
    const nlohmann::json id = request.value("id", nlohmann::json());

    ConcurrencyGate::Permit permit = gate_.acquire();
    if (!permit) {
        return jsonrpc::make_failure(id, jsonrpc::ErrorKind::SHUTTING_DOWN, "Router is shutting down");
    }

    auto worker = WorkerProcess::create(service, options_.worker);
    worker->set_exit_callback([this](const WorkerProcess &exited) { on_worker_exit(exited); });

    // Registered before spawn() so the exit callback always finds it
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.push_back(worker);
    }

    if (!worker->spawn()) {
        on_worker_exit(*worker);
        return jsonrpc::make_failure(id, jsonrpc::ErrorKind::SPAWN_FAILED,
                                     "Failed to spawn service '" + service->id + "': " + worker->last_error());
    }

    bool shutting_down = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down = shutting_down_;
    }
    if (shutting_down) {
        worker->terminate("router shutdown");
    }

    // Ready probe: first JSON line on stdout, or assume ready after the grace period
    const bool confirmed = worker->wait_for_output(options_.ready_grace_ms);
    if (confirmed) {
        LOG_INFO("[" << service->id << "] Worker initialized successfully (PID=" << worker->pid() << ")");
    } else if (worker->is_alive()) {
        LOG_INFO("[" << service->id << "] Worker assumed ready (no initialization output) (PID=" << worker->pid()
                     << ")");
    }
    worker->mark_ready(confirmed);

    jsonrpc::RpcOutcome outcome = worker->send_and_await(request, options_.request_timeout_ms);

    worker->terminate(outcome.ok() ? "request complete" : "request failed");
    // The slot is only freed once the process is gone
    worker->wait_for_exit(-1);
    return outcome;
}

jsonrpc::RpcOutcome TransientSupervisor::submit(const std::shared_ptr<const service::ServiceDefinition> &service,
                                                const std::string &method, const nlohmann::json &params) {
    const nlohmann::json id = "req-" + std::to_string(next_request_id_++);
    return dispatch(service, jsonrpc::make_request(id, method, params));
}

void TransientSupervisor::shutdown() {
    gate_.close();

    std::vector<std::shared_ptr<WorkerProcess>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!shutting_down_) {
            shutting_down_ = true;
            LOG_INFO("[TransientSupervisor] Shutting down, " << running_.size() << " worker(s) running");
        }
        victims = running_;
    }

    for (const auto &worker : victims) {
        worker->terminate("router shutdown");
    }
    gate_.wait_idle();
}

void TransientSupervisor::on_worker_exit(const WorkerProcess &worker) {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.erase(std::remove_if(running_.begin(), running_.end(),
                                  [&worker](const std::shared_ptr<WorkerProcess> &w) { return w.get() == &worker; }),
                   running_.end());
}

StrategyStats TransientSupervisor::stats() const {
    StrategyStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.live_workers = running_.size();
        for (const auto &worker : running_) {
            stats.in_flight += worker->pending_count();
        }
    }
    stats.waiting = gate_.waiting();
    stats.capacity = gate_.capacity();
    return stats;
}

}  // namespace worker
}  // namespace mcprouter
