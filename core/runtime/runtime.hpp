#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "events/event_emitter.hpp"
#include "http/server.hpp"
#include "router/router.hpp"
#include "service/service_registry.hpp"
#include "worker/idle_reaper.hpp"
#include "worker/persistent_supervisor.hpp"
#include "worker/transient_supervisor.hpp"

namespace mcprouter {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Build the service registry, strategies, router, reaper and HTTP server
    bool initialize(std::string &error);

    // Main loop (blocking) until stop() or SIGINT/SIGTERM
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop HTTP, the reaper and the router (terminating every worker). Idempotent.
    void shutdown();

    service::ServiceRegistry &get_registry() { return registry_; }
    router::Router &get_router() { return *router_; }
    events::EventEmitter &get_event_emitter() { return *event_emitter_; }

private:
    bool init_services(std::string &error);
    bool init_router(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    service::ServiceRegistry registry_;
    std::shared_ptr<events::EventEmitter> event_emitter_;
    std::shared_ptr<worker::PersistentSupervisor> persistent_;
    std::shared_ptr<worker::TransientSupervisor> transient_;
    std::unique_ptr<router::Router> router_;
    std::unique_ptr<worker::IdleReaper> reaper_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

}  // namespace runtime
}  // namespace mcprouter
