#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <set>
#include <sstream>

#include "logging/logger.hpp"

namespace mcprouter {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::vector<std::string> &valid_keys, const std::string &where) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        const std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            LOG_WARN("[Config] Unknown key '" << key << "' in " << where << " (will be ignored)");
        }
    }
}

void load_string_map(const YAML::Node &node, std::map<std::string, std::string> &out) {
    for (const auto &entry : node) {
        // Null values (KEY: ) become empty strings
        out[entry.first.as<std::string>()] = entry.second.IsNull() ? "" : entry.second.as<std::string>();
    }
}

void load_router(const YAML::Node &node, RouterConfig &router) {
    warn_unknown_keys(node,
                      {"max_concurrent_processes", "request_timeout_ms", "persistent_request_timeout_ms",
                       "idle_timeout_ms", "idle_sweep_interval_ms", "ready_grace_ms", "shutdown_timeout_ms",
                       "default_env"},
                      "router");

    if (node["max_concurrent_processes"]) {
        router.max_concurrent_processes = node["max_concurrent_processes"].as<int>();
    }
    if (node["request_timeout_ms"]) {
        router.request_timeout_ms = node["request_timeout_ms"].as<int>();
    }
    if (node["persistent_request_timeout_ms"]) {
        router.persistent_request_timeout_ms = node["persistent_request_timeout_ms"].as<int>();
    }
    if (node["idle_timeout_ms"]) {
        router.idle_timeout_ms = node["idle_timeout_ms"].as<int>();
    }
    if (node["idle_sweep_interval_ms"]) {
        router.idle_sweep_interval_ms = node["idle_sweep_interval_ms"].as<int>();
    }
    if (node["ready_grace_ms"]) {
        router.ready_grace_ms = node["ready_grace_ms"].as<int>();
    }
    if (node["shutdown_timeout_ms"]) {
        router.shutdown_timeout_ms = node["shutdown_timeout_ms"].as<int>();
    }
    if (node["default_env"]) {
        // An explicit map replaces the built-in defaults
        router.default_env.clear();
        load_string_map(node["default_env"], router.default_env);
    }
}

service::ServiceDefinition load_service(const YAML::Node &node) {
    warn_unknown_keys(node, {"id", "command", "args", "cwd", "env", "startup_timeout_ms"}, "services");

    service::ServiceDefinition def;
    if (node["id"]) {
        def.id = node["id"].as<std::string>();
    }
    if (node["command"]) {
        def.command = node["command"].as<std::string>();
    }
    if (node["args"]) {
        for (const auto &arg : node["args"]) {
            def.args.push_back(arg.as<std::string>());
        }
    }
    if (node["cwd"]) {
        def.cwd = node["cwd"].as<std::string>();
    }
    if (node["env"]) {
        load_string_map(node["env"], def.env);
    }
    if (node["startup_timeout_ms"]) {
        def.startup_timeout_ms = node["startup_timeout_ms"].as<int>();
    }
    return def;
}

bool load_from_node(const YAML::Node &yaml, RuntimeConfig &config, std::string &error) {
    if (!yaml.IsMap()) {
        error = "Config root must be a mapping";
        return false;
    }

    warn_unknown_keys(yaml, {"http", "router", "services", "logging"}, "top level");

    // Load HTTP config
    if (yaml["http"]) {
        const auto &http = yaml["http"];
        warn_unknown_keys(http, {"enabled", "bind", "port", "thread_pool_size"}, "http");
        if (http["enabled"]) {
            config.http.enabled = http["enabled"].as<bool>();
        }
        if (http["bind"]) {
            config.http.bind = http["bind"].as<std::string>();
        }
        if (http["port"]) {
            config.http.port = http["port"].as<int>();
        }
        if (http["thread_pool_size"]) {
            config.http.thread_pool_size = http["thread_pool_size"].as<int>();
        }
    }

    if (yaml["router"]) {
        load_router(yaml["router"], config.router);
    }

    // Load services
    if (yaml["services"]) {
        if (!yaml["services"].IsSequence()) {
            error = "'services' must be a list";
            return false;
        }
        config.services.clear();  // Ensure idempotent parsing
        for (const auto &service_node : yaml["services"]) {
            config.services.push_back(load_service(service_node));
        }
    }

    // Load logging config
    if (yaml["logging"] && yaml["logging"]["level"]) {
        config.logging.level = yaml["logging"]["level"].as<std::string>();
    }

    if (!validate_config(config, error)) {
        return false;
    }

    LOG_INFO("[Config] Loaded " << config.services.size() << " service(s)");

    std::stringstream http_msg;
    http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
    if (config.http.enabled) {
        http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
    }
    LOG_INFO(http_msg.str());

    LOG_INFO("[Config] Router: max " << config.router.max_concurrent_processes << " transient process(es), idle timeout "
                                     << config.router.idle_timeout_ms << "ms");
    LOG_INFO("[Config] Log level: " << config.logging.level);
    return true;
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
    }

    // Validate router settings
    const auto &router = config.router;
    if (router.max_concurrent_processes < 1) {
        error = "router.max_concurrent_processes must be at least 1";
        return false;
    }
    const std::vector<std::pair<const char *, int>> timeouts = {
        {"request_timeout_ms", router.request_timeout_ms},
        {"persistent_request_timeout_ms", router.persistent_request_timeout_ms},
        {"idle_timeout_ms", router.idle_timeout_ms},
        {"idle_sweep_interval_ms", router.idle_sweep_interval_ms},
        {"ready_grace_ms", router.ready_grace_ms},
        {"shutdown_timeout_ms", router.shutdown_timeout_ms},
    };
    for (const auto &[name, value] : timeouts) {
        if (value <= 0) {
            error = std::string("router.") + name + " must be positive";
            return false;
        }
    }

    // Validate services
    if (config.services.empty()) {
        error = "Config must specify at least one service";
        return false;
    }

    std::set<std::string> seen;
    for (const auto &service : config.services) {
        if (service.id.empty()) {
            error = "Service missing 'id' field";
            return false;
        }
        if (!seen.insert(service.id).second) {
            error = "Duplicate service id: '" + service.id + "'";
            return false;
        }
        if (service.command.empty()) {
            error = "Service '" + service.id + "' missing 'command' field";
            return false;
        }
        if (service.startup_timeout_ms <= 0) {
            error = "Service '" + service.id + "' startup_timeout_ms must be positive";
            return false;
        }
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        return load_from_node(YAML::LoadFile(config_path), config, error);
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool load_config_from_string(const std::string &yaml_text, RuntimeConfig &config, std::string &error) {
    try {
        return load_from_node(YAML::Load(yaml_text), config, error);
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace mcprouter
