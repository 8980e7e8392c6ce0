#pragma once

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "runtime/config.hpp"

namespace mcprouter {
namespace events {
class EventEmitter;
}
namespace router {
class Router;
}

namespace http {

/**
 * @brief HTTP adapter exposing the router over REST endpoints
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool and call straight
 *   into the Router, which is thread-safe
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    // `events` may be null; /events then answers 503 and /stats omits lifecycle counters
    HttpServer(const runtime::HttpConfig &config, router::Router &router, events::EventEmitter *events = nullptr);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Bind to the configured address/port and start the server thread
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    void setup_routes();

    // Route handlers (handlers/*.cpp)
    void handle_get_health(const httplib::Request &req, httplib::Response &res);
    void handle_get_services(const httplib::Request &req, httplib::Response &res);
    void handle_get_stats(const httplib::Request &req, httplib::Response &res);
    void handle_get_events(const httplib::Request &req, httplib::Response &res);
    void handle_post_mcp(const httplib::Request &req, httplib::Response &res);
    void handle_post_execute(const httplib::Request &req, httplib::Response &res);

    runtime::HttpConfig config_;
    int port_ = 0;
    router::Router &router_;
    events::EventEmitter *events_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace http
}  // namespace mcprouter
