#ifndef MCPROUTER_ROUTER_ROUTER_HPP
#define MCPROUTER_ROUTER_ROUTER_HPP

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "jsonrpc/errors.hpp"
#include "service/service_registry.hpp"
#include "worker/i_worker_strategy.hpp"

namespace mcprouter {
namespace router {

struct RouterStats {
    size_t services = 0;
    worker::StrategyStats persistent;
    worker::StrategyStats transient;
};

nlohmann::json stats_to_json(const RouterStats &stats);

// Router - single entry point mapping (service id, request) onto a worker
//
// Two caller contracts:
// - execute():     one-shot request on a fresh worker (transient strategy);
//                  returns the result or throws jsonrpc::RouterError
// - execute_mcp(): JSON-RPC passthrough to the service's long-lived worker
//                  (persistent strategy); never throws, always returns a
//                  response envelope echoing the request id
class Router {
public:
    Router(const service::ServiceRegistry &registry, std::shared_ptr<worker::IWorkerStrategy> persistent,
           std::shared_ptr<worker::IWorkerStrategy> transient);
    ~Router();

    Router(const Router &) = delete;
    Router &operator=(const Router &) = delete;

    /**
     * @brief Run `method` on a fresh worker for `service_id`
     *
     * @return The worker's `result`
     * @throws jsonrpc::RouterError UNKNOWN_SERVICE, INVALID_REQUEST,
     *         SPAWN_FAILED, PROCESS_EXITED, TIMEOUT, WORKER_ERROR, SHUTTING_DOWN
     */
    nlohmann::json execute(const std::string &service_id, const std::string &method,
                           const nlohmann::json &params = nlohmann::json::object());

    /**
     * @brief Forward a JSON-RPC request to the service's persistent worker
     *
     * A request without an id is given a router-assigned one ("router-N"),
     * which the returned envelope carries. prompts/list is answered locally
     * with an empty list.
     */
    nlohmann::json execute_mcp(const std::string &service_id, const nlohmann::json &request);

    // Refuse new work, terminate every worker and wait for them. Idempotent.
    void stop();
    bool is_stopped() const { return stopped_.load(); }

    RouterStats stats() const;

    const service::ServiceRegistry &registry() const { return registry_; }

private:
    const service::ServiceRegistry &registry_;
    std::shared_ptr<worker::IWorkerStrategy> persistent_;
    std::shared_ptr<worker::IWorkerStrategy> transient_;

    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> next_request_id_{1};
    std::atomic<uint64_t> next_router_id_{1};
};

}  // namespace router
}  // namespace mcprouter

#endif  // MCPROUTER_ROUTER_ROUTER_HPP
