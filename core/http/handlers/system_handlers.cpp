#include "../../events/event_emitter.hpp"
#include "../../router/router.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace mcprouter {
namespace http {

namespace {
constexpr size_t kDefaultEventLimit = 100;
}  // namespace

//=============================================================================
// GET /health
//=============================================================================
void HttpServer::handle_get_health(const httplib::Request &, httplib::Response &res) {
    const bool stopped = router_.is_stopped();
    nlohmann::json body = {{"status", stopped ? "stopping" : "ok"}, {"services", router_.registry().service_count()}};
    send_json(res, stopped ? StatusCode::UNAVAILABLE : StatusCode::OK, body);
}

//=============================================================================
// GET /services
//=============================================================================
void HttpServer::handle_get_services(const httplib::Request &, httplib::Response &res) {
    const auto &registry = router_.registry();

    nlohmann::json services = nlohmann::json::array();
    for (const auto &id : registry.service_ids()) {
        auto def = registry.lookup(id);
        if (!def) {
            continue;
        }
        services.push_back({{"id", def->id}, {"command", def->command}, {"args", def->args}, {"cwd", def->cwd}});
    }

    send_json(res, StatusCode::OK, {{"services", services}});
}

//=============================================================================
// GET /stats
//=============================================================================
void HttpServer::handle_get_stats(const httplib::Request &, httplib::Response &res) {
    nlohmann::json body = router::stats_to_json(router_.stats());
    if (events_ != nullptr) {
        nlohmann::json lifecycle = nlohmann::json::object();
        for (const auto &[service_id, counters] : events_->all_counters()) {
            lifecycle[service_id] = events::counters_to_json(counters);
        }
        body["lifecycle"] = lifecycle;
    }
    send_json(res, StatusCode::OK, body);
}

//=============================================================================
// GET /events?since=N&service=ID&limit=N
//=============================================================================
void HttpServer::handle_get_events(const httplib::Request &req, httplib::Response &res) {
    if (events_ == nullptr) {
        send_json(res, StatusCode::UNAVAILABLE,
                  make_error_body(jsonrpc::kInternalError, "Lifecycle events are not recorded", "UNAVAILABLE"));
        return;
    }

    uint64_t since = 0;
    size_t limit = kDefaultEventLimit;
    try {
        if (req.has_param("since")) {
            since = std::stoull(req.get_param_value("since"));
        }
        if (req.has_param("limit")) {
            limit = static_cast<size_t>(std::stoul(req.get_param_value("limit")));
        }
    } catch (const std::exception &) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_body(jsonrpc::kInvalidRequest, "since and limit must be non-negative integers",
                                  "INVALID_REQUEST"));
        return;
    }

    events::EventFilter filter;
    if (req.has_param("service")) {
        filter.service_id = req.get_param_value("service");
    }

    nlohmann::json list = nlohmann::json::array();
    for (const auto &event : events_->events_since(since, filter, limit)) {
        list.push_back(events::event_to_json(event));
    }

    send_json(res, StatusCode::OK, {{"last_event_id", events_->last_event_id()}, {"events", list}});
}

}  // namespace http
}  // namespace mcprouter
