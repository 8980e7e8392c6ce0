#include "server.hpp"

#include "errors.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"

namespace mcprouter {
namespace http {

namespace {
// Tool calls may legitimately run for minutes
constexpr int kReadTimeoutSeconds = 5;
constexpr int kWriteTimeoutSeconds = 300;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, router::Router &router, events::EventEmitter *events)
    : config_(config), router_(router), events_(events) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(kReadTimeoutSeconds, 0);
    server_->set_write_timeout(kWriteTimeoutSeconds, 0);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    setup_routes();

    // JSON bodies for HTTP-level errors (unrouted paths etc.) unless a handler set one
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        std::string message = "Internal server error";
        if (res.status == kStatusNotFound) {
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            message = "Bad request";
        }

        nlohmann::json body = make_error_body(jsonrpc::kInternalError, message, "HTTP_" + std::to_string(res.status));
        res.set_content(body.dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception");
        }

        nlohmann::json body = make_error_body(jsonrpc::kInternalError, msg, "INTERNAL");
        res.status = kStatusInternal;
        res.set_content(body.dump(), "application/json");
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    server_->Get("/health",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_health(req, res); });

    server_->Get("/services",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_services(req, res); });

    server_->Get("/stats", [this](const httplib::Request &req, httplib::Response &res) { handle_get_stats(req, res); });

    server_->Get("/events",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_events(req, res); });

    // POST /mcp/:service - JSON-RPC passthrough to the persistent worker
    server_->Post(R"(/mcp/([^/]+))",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_mcp(req, res); });

    // POST /execute/:service/:method - one-shot call on a fresh worker
    server_->Post(R"(/execute/([^/]+)/([^/]+))",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_execute(req, res); });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET  /health");
    LOG_INFO("[HTTP]   GET  /services");
    LOG_INFO("[HTTP]   GET  /stats");
    LOG_INFO("[HTTP]   GET  /events");
    LOG_INFO("[HTTP]   POST /mcp/{service}");
    LOG_INFO("[HTTP]   POST /execute/{service}/{method}");
}

}  // namespace http
}  // namespace mcprouter
