#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>

#include "../errors.hpp"

namespace mcprouter {
namespace http {

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

// Helper: Parse a JSON request body. An empty body parses as `fallback`.
inline bool parse_body(const httplib::Request &req, nlohmann::json &out, const nlohmann::json &fallback,
                       std::string &error) {
    if (req.body.empty()) {
        out = fallback;
        return true;
    }
    try {
        out = nlohmann::json::parse(req.body);
        return true;
    } catch (const nlohmann::json::parse_error &e) {
        error = e.what();
        return false;
    }
}

}  // namespace http
}  // namespace mcprouter
