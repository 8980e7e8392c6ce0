#include "router.hpp"

#include "jsonrpc/message.hpp"
#include "logging/logger.hpp"

namespace mcprouter {
namespace router {

namespace {
constexpr const char *kPromptsList = "prompts/list";
}  // namespace

nlohmann::json stats_to_json(const RouterStats &stats) {
    return {{"services", stats.services},
            {"active_processes", stats.transient.live_workers},
            {"queue_size", stats.transient.waiting},
            {"max_concurrent_processes", stats.transient.capacity},
            {"pending_requests", stats.persistent.in_flight + stats.transient.in_flight},
            {"persistent_workers", stats.persistent.live_workers},
            {"starting_workers", stats.persistent.waiting}};
}

Router::Router(const service::ServiceRegistry &registry, std::shared_ptr<worker::IWorkerStrategy> persistent,
               std::shared_ptr<worker::IWorkerStrategy> transient)
    : registry_(registry), persistent_(std::move(persistent)), transient_(std::move(transient)) {}

Router::~Router() { stop(); }

nlohmann::json Router::execute(const std::string &service_id, const std::string &method,
                               const nlohmann::json &params) {
    if (stopped_) {
        throw jsonrpc::RouterError(jsonrpc::ErrorKind::SHUTTING_DOWN, "Router is shutting down");
    }

    auto service = registry_.lookup(service_id);
    if (!service) {
        throw jsonrpc::RouterError(jsonrpc::ErrorKind::UNKNOWN_SERVICE, "Service not found: " + service_id);
    }
    if (method.empty()) {
        throw jsonrpc::RouterError(jsonrpc::ErrorKind::INVALID_REQUEST, "Method must be a non-empty string");
    }

    const nlohmann::json id = "req-" + std::to_string(next_request_id_++);
    LOG_DEBUG("[Router] execute " << service_id << "." << method << " id=" << id.dump());

    jsonrpc::RpcOutcome outcome = transient_->dispatch(service, jsonrpc::make_request(id, method, params));
    return jsonrpc::unwrap_result(outcome);
}

nlohmann::json Router::execute_mcp(const std::string &service_id, const nlohmann::json &request) {
    if (!request.is_object()) {
        return jsonrpc::make_error(nullptr, jsonrpc::kInvalidRequest, "Invalid Request: expected a JSON object");
    }

    nlohmann::json id;
    auto id_it = request.find("id");
    if (id_it == request.end() || id_it->is_null()) {
        id = "router-" + std::to_string(next_router_id_++);
    } else if (!jsonrpc::is_valid_id(*id_it)) {
        return jsonrpc::make_error(*id_it, jsonrpc::kInvalidRequest,
                                   "Invalid Request: id must be a string or a number");
    } else {
        id = *id_it;
    }

    auto method_it = request.find("method");
    if (method_it == request.end() || !method_it->is_string() || method_it->get<std::string>().empty()) {
        return jsonrpc::make_error(id, jsonrpc::kInvalidRequest, "Invalid Request: method must be a non-empty string");
    }

    auto service = registry_.lookup(service_id);
    if (!service) {
        LOG_DEBUG("[Router] Unknown service '" << service_id << "'");
        return jsonrpc::make_error(id, jsonrpc::kMethodNotFound, "Service not found: " + service_id);
    }

    if (stopped_) {
        return jsonrpc::make_failure(id, jsonrpc::ErrorKind::SHUTTING_DOWN, "Router is shutting down").response;
    }

    // Many workers never implement prompts; answer without spawning one
    if (*method_it == kPromptsList) {
        LOG_DEBUG("[Router] Answering " << kPromptsList << " for '" << service_id << "' locally");
        return jsonrpc::make_result(id, {{"prompts", nlohmann::json::array()}});
    }

    nlohmann::json forward = request;
    forward["jsonrpc"] = jsonrpc::kVersion;
    forward["id"] = id;

    try {
        jsonrpc::RpcOutcome outcome = persistent_->dispatch(service, forward);
        nlohmann::json response = std::move(outcome.response);
        if (!response.is_object()) {
            return jsonrpc::make_error(id, jsonrpc::kInternalError, "Malformed response from worker");
        }
        response["id"] = id;
        return response;
    } catch (const std::exception &e) {
        LOG_ERROR("[Router] " << service_id << "." << method_it->get<std::string>() << " failed: " << e.what());
        return jsonrpc::make_error(id, jsonrpc::kInternalError, std::string("Internal error: ") + e.what());
    }
}

void Router::stop() {
    bool expected = false;
    if (!stopped_.compare_exchange_strong(expected, true)) {
        return;
    }

    LOG_INFO("[Router] Stopping");
    // Admission closes first so nothing new starts while persistent workers drain
    if (transient_) {
        transient_->shutdown();
    }
    if (persistent_) {
        persistent_->shutdown();
    }
    LOG_INFO("[Router] Stopped");
}

RouterStats Router::stats() const {
    RouterStats stats;
    stats.services = registry_.service_count();
    if (persistent_) {
        stats.persistent = persistent_->stats();
    }
    if (transient_) {
        stats.transient = transient_->stats();
    }
    return stats;
}

}  // namespace router
}  // namespace mcprouter
