#include "persistent_supervisor.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace mcprouter {
namespace worker {

namespace {

constexpr const char *kProtocolVersion = "2024-11-05";

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

}  // namespace

PersistentSupervisor::PersistentSupervisor(PersistentOptions options) : options_(std::move(options)) {
    options_.worker.strategy = events::Strategy::PERSISTENT;
}

PersistentSupervisor::~PersistentSupervisor() { shutdown(); }

PersistentSupervisor::AcquireResult PersistentSupervisor::acquire(
    const std::shared_ptr<const service::ServiceDefinition> &service) {
    std::promise<AcquireResult> promise;
    std::shared_future<AcquireResult> result;
    bool creator = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return AcquireResult{nullptr, jsonrpc::ErrorKind::SHUTTING_DOWN, "Router is shutting down"};
        }

        auto it = workers_.find(service->id);
        if (it != workers_.end()) {
            if (it->second->state() == WorkerState::READY) {
                it->second->touch();
                return AcquireResult{it->second, jsonrpc::ErrorKind::OK, ""};
            }
            // Dead or draining; its exit callback will find nothing to remove
            workers_.erase(it);
        }

        auto pending = starting_.find(service->id);
        if (pending != starting_.end()) {
            result = pending->second;
        } else {
            result = promise.get_future().share();
            starting_.emplace(service->id, result);
            creator = true;
        }
    }

    if (creator) {
        AcquireResult created = start_worker(service);
        bool discard = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            starting_.erase(service->id);
            if (created.ok()) {
                if (shutting_down_) {
                    discard = true;
                } else if (created.worker->state() == WorkerState::READY) {
                    workers_[service->id] = created.worker;
                }
            }
        }
        starting_cv_.notify_all();

        if (discard) {
            created.worker->terminate("router shutdown");
            created.worker->wait_for_exit(-1);
            created = AcquireResult{nullptr, jsonrpc::ErrorKind::SHUTTING_DOWN, "Router is shutting down"};
        } else if (created.ok() && created.worker->state() != WorkerState::READY) {
            created = AcquireResult{nullptr, jsonrpc::ErrorKind::PROCESS_EXITED,
                                    "Worker for '" + service->id + "' exited during startup"};
        }
        promise.set_value(created);
    }

    return result.get();
}

PersistentSupervisor::AcquireResult PersistentSupervisor::start_worker(
    const std::shared_ptr<const service::ServiceDefinition> &service) {
    auto worker = WorkerProcess::create(service, options_.worker);
    worker->set_exit_callback([this](const WorkerProcess &exited) { on_worker_exit(exited); });

    if (!worker->spawn()) {
        return AcquireResult{nullptr, jsonrpc::ErrorKind::SPAWN_FAILED,
                             "Failed to spawn service '" + service->id + "': " + worker->last_error()};
    }

    const jsonrpc::RpcOutcome init = handshake(worker, service->startup_timeout_ms);

    if (init.kind == jsonrpc::ErrorKind::PROCESS_EXITED || !worker->is_alive()) {
        // Dead during the handshake: every waiter on this startup fails.
        // A broken pipe can be seen before the reap, so make sure it is gone.
        worker->terminate("startup failed");
        worker->wait_for_exit(-1);
        std::string message = "Worker for '" + service->id + "' exited during startup";
        if (auto code = worker->exit_code()) {
            message = "Process exited with code " + std::to_string(*code) + " during startup";
        }
        return AcquireResult{nullptr, jsonrpc::ErrorKind::PROCESS_EXITED, message};
    }

    worker->mark_ready(init.ok() && !init.response.contains("error"));
    return AcquireResult{worker, jsonrpc::ErrorKind::OK, ""};
}

jsonrpc::RpcOutcome PersistentSupervisor::handshake(const std::shared_ptr<WorkerProcess> &worker, int timeout_ms) {
    const nlohmann::json id = "auto-init-" + std::to_string(events::now_epoch_ms());
    const nlohmann::json params = {{"protocolVersion", kProtocolVersion}, {"capabilities", nlohmann::json::object()}};

    jsonrpc::RpcOutcome outcome = worker->send_and_await(jsonrpc::make_request(id, "initialize", params), timeout_ms);

    if (!outcome.ok()) {
        LOG_WARN("[" << worker->service_id() << "] Failed to initialize: " << jsonrpc::error_message(outcome.response));
    } else if (outcome.response.contains("error")) {
        LOG_WARN("[" << worker->service_id()
                     << "] Initialize returned an error: " << jsonrpc::error_message(outcome.response));
    } else {
        LOG_INFO("[" << worker->service_id() << "] Successfully initialized (PID=" << worker->pid() << ")");
    }
    return outcome;
}

jsonrpc::RpcOutcome PersistentSupervisor::dispatch(const std::shared_ptr<const service::ServiceDefinition> &service,
                                                   const nlohmann::json &request) {
    const nlohmann::json id = request.value("id", nlohmann::json());

    AcquireResult acquired = acquire(service);
    if (!acquired.ok()) {
        return jsonrpc::make_failure(id, acquired.kind, acquired.error);
    }
    return acquired.worker->send_and_await(request, options_.request_timeout_ms);
}

size_t PersistentSupervisor::evict_idle(int64_t threshold_ms) {
    std::vector<std::shared_ptr<WorkerProcess>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->second->idle_ms() > threshold_ms) {
                victims.push_back(it->second);
                draining_.push_back(it->second);
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto &worker : victims) {
        const int64_t idle = worker->idle_ms();
        const size_t pending = worker->pending_count();
        LOG_INFO("[" << worker->service_id() << "] Evicting idle worker (PID=" << worker->pid() << ", idle "
                     << idle << "ms, pending " << pending << ")");

        if (options_.worker.event_emitter) {
            events::WorkerEvictedEvent event;
            event.service_id = worker->service_id();
            event.pid = worker->pid();
            event.strategy = events::Strategy::PERSISTENT;
            event.idle_ms = idle;
            event.pending_requests = pending;
            options_.worker.event_emitter->emit(events::stamp(event));
        }

        worker->terminate("idle eviction");
    }
    return victims.size();
}

void PersistentSupervisor::shutdown() {
    std::vector<std::shared_ptr<WorkerProcess>> victims;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!shutting_down_) {
            shutting_down_ = true;
            LOG_INFO("[PersistentSupervisor] Shutting down " << workers_.size() << " worker(s)");
        }

        // Startups in progress finish (bounded by their startup timeout) and discard their worker
        starting_cv_.wait(lock, [this] { return starting_.empty(); });

        for (auto &[service_id, worker] : workers_) {
            static_cast<void>(service_id);
            victims.push_back(worker);
        }
        workers_.clear();
        victims.insert(victims.end(), draining_.begin(), draining_.end());
    }

    for (const auto &worker : victims) {
        worker->terminate("router shutdown");
    }
    for (const auto &worker : victims) {
        worker->wait_for_exit(-1);
    }
}

void PersistentSupervisor::on_worker_exit(const WorkerProcess &worker) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(worker.service_id());
    if (it != workers_.end() && it->second.get() == &worker) {
        workers_.erase(it);
    }
    draining_.erase(std::remove_if(draining_.begin(), draining_.end(),
                                   [&worker](const std::shared_ptr<WorkerProcess> &w) { return w.get() == &worker; }),
                    draining_.end());
}

StrategyStats PersistentSupervisor::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StrategyStats stats;
    stats.live_workers = workers_.size();
    stats.waiting = starting_.size();
    for (const auto &[service_id, worker] : workers_) {
        static_cast<void>(service_id);
        stats.in_flight += worker->pending_count();
    }
    return stats;
}

size_t PersistentSupervisor::worker_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

std::shared_ptr<WorkerProcess> PersistentSupervisor::find_worker(const std::string &service_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(service_id);
    return it == workers_.end() ? nullptr : it->second;
}

std::vector<PersistentWorkerInfo> PersistentSupervisor::workers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PersistentWorkerInfo> result;
    result.reserve(workers_.size());
    for (const auto &[service_id, worker] : workers_) {
        PersistentWorkerInfo info;
        info.service_id = service_id;
        info.pid = worker->pid();
        info.state = worker->state();
        info.idle_ms = worker->idle_ms();
        info.uptime_ms = elapsed_ms(worker->spawned_at());
        info.pending_requests = worker->pending_count();
        result.push_back(info);
    }
    std::sort(result.begin(), result.end(),
              [](const PersistentWorkerInfo &a, const PersistentWorkerInfo &b) { return a.service_id < b.service_id; });
    return result;
}

bool PersistentSupervisor::is_shutting_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutting_down_;
}

}  // namespace worker
}  // namespace mcprouter
