#pragma once

#include <map>
#include <string>
#include <vector>

#include "service/service_definition.hpp"

namespace mcprouter {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct HttpConfig {
    bool enabled = true;             // HTTP server enabled
    std::string bind = "127.0.0.1";  // Bind address
    int port = 3100;                 // HTTP port
    int thread_pool_size = 16;       // Worker thread pool size
};

// router: section. Timeouts in milliseconds.
struct RouterConfig {
    int max_concurrent_processes = 10;           // Transient admission limit
    int request_timeout_ms = 30000;              // Transient exchange timeout
    int persistent_request_timeout_ms = 120000;  // Persistent exchange timeout
    int idle_timeout_ms = 60000;                 // Persistent worker eviction threshold
    int idle_sweep_interval_ms = 30000;          // Idle reaper period
    int ready_grace_ms = 1000;                   // Transient ready probe grace period
    int shutdown_timeout_ms = 2000;              // SIGTERM -> SIGKILL escalation
    std::map<std::string, std::string> default_env{
        {"LANG", "C.UTF-8"}, {"LC_ALL", "C.UTF-8"}, {"PYTHONIOENCODING", "utf-8"}};
};

struct RuntimeConfig {
    HttpConfig http;
    RouterConfig router;
    std::vector<service::ServiceDefinition> services;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Loads configuration from YAML text (same rules as load_config)
bool load_config_from_string(const std::string &yaml_text, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace mcprouter
