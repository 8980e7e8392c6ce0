#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace mcprouter {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing mcprouter");

    if (!init_services(error)) {
        return false;
    }

    if (!init_router(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_services(std::string &error) {
    for (const auto &service : config_.services) {
        if (!registry_.add_service(service)) {
            error = "Invalid service definition (empty id)";
            return false;
        }
        LOG_DEBUG("[Runtime] Registered service " << service.id << ": " << service.command);
    }
    LOG_INFO("[Runtime] " << registry_.service_count() << " service(s) registered");
    return true;
}

bool Runtime::init_router(std::string &) {
    // Last 512 lifecycle events are kept for GET /events
    event_emitter_ = std::make_shared<events::EventEmitter>(512);

    worker::WorkerOptions worker_options;
    worker_options.default_env = config_.router.default_env;
    worker_options.shutdown_timeout_ms = config_.router.shutdown_timeout_ms;
    worker_options.event_emitter = event_emitter_;

    worker::PersistentOptions persistent_options;
    persistent_options.request_timeout_ms = config_.router.persistent_request_timeout_ms;
    persistent_options.worker = worker_options;
    persistent_ = std::make_shared<worker::PersistentSupervisor>(persistent_options);

    worker::TransientOptions transient_options;
    transient_options.max_concurrent = static_cast<size_t>(config_.router.max_concurrent_processes);
    transient_options.request_timeout_ms = config_.router.request_timeout_ms;
    transient_options.ready_grace_ms = config_.router.ready_grace_ms;
    transient_options.worker = worker_options;
    transient_ = std::make_shared<worker::TransientSupervisor>(transient_options);

    router_ = std::make_unique<router::Router>(registry_, persistent_, transient_);

    reaper_ = std::make_unique<worker::IdleReaper>(*persistent_, config_.router.idle_timeout_ms,
                                                   config_.router.idle_sweep_interval_ms);

    LOG_INFO("[Runtime] Router created (max " << config_.router.max_concurrent_processes
                                              << " transient process(es))");
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (config_.http.enabled) {
        LOG_INFO("[Runtime] Creating HTTP server");
        http_server_ = std::make_unique<http::HttpServer>(config_.http, *router_, event_emitter_.get());

        std::string http_error;
        if (!http_server_->start(http_error)) {
            error = "HTTP server failed to start: " + http_error;
            return false;
        }
        LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << config_.http.port);
    } else {
        LOG_INFO("[Runtime] HTTP server disabled in config");
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    reaper_->start();

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Received " << SignalHandler::signal_name(SignalHandler::last_signal())
                                           << ", stopping (repeat to exit immediately)");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
}

void Runtime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    running_ = false;

    // Stop HTTP first so no new requests reach the router
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (reaper_) {
        reaper_->stop();
    }

    if (router_) {
        LOG_INFO("[Runtime] Stopping router");
        router_->stop();
    }
}

}  // namespace runtime
}  // namespace mcprouter
