#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "jsonrpc/errors.hpp"

namespace mcprouter {
namespace http {

/**
 * @brief Adapter status codes mapped to HTTP status codes
 *
 * - OK -> HTTP 200
 * - INVALID_ARGUMENT -> HTTP 400
 * - NOT_FOUND -> HTTP 404
 * - UNAVAILABLE -> HTTP 503
 * - DEADLINE_EXCEEDED -> HTTP 504
 * - INTERNAL -> HTTP 500
 */
enum class StatusCode { OK, INVALID_ARGUMENT, NOT_FOUND, UNAVAILABLE, DEADLINE_EXCEEDED, INTERNAL };

inline int status_code_to_http(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return 200;
        case StatusCode::INVALID_ARGUMENT:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::UNAVAILABLE:
            return 503;
        case StatusCode::DEADLINE_EXCEEDED:
            return 504;
        case StatusCode::INTERNAL:
            return 500;
        default:
            return 500;
    }
}

inline std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::UNAVAILABLE:
            return "UNAVAILABLE";
        case StatusCode::DEADLINE_EXCEEDED:
            return "DEADLINE_EXCEEDED";
        case StatusCode::INTERNAL:
            return "INTERNAL";
        default:
            return "INTERNAL";
    }
}

// Router failure kind -> adapter status
inline StatusCode status_code_for(jsonrpc::ErrorKind kind) {
    switch (kind) {
        case jsonrpc::ErrorKind::OK:
            return StatusCode::OK;
        case jsonrpc::ErrorKind::UNKNOWN_SERVICE:
            return StatusCode::NOT_FOUND;
        case jsonrpc::ErrorKind::INVALID_REQUEST:
            return StatusCode::INVALID_ARGUMENT;
        case jsonrpc::ErrorKind::TIMEOUT:
            return StatusCode::DEADLINE_EXCEEDED;
        case jsonrpc::ErrorKind::SHUTTING_DOWN:
            return StatusCode::UNAVAILABLE;
        default:
            return StatusCode::INTERNAL;
    }
}

/**
 * @brief Build a JSON error body for non-JSON-RPC routes
 *
 * {"error": {"code": <jsonrpc code>, "message": ..., "kind": ...}}
 */
inline nlohmann::json make_error_body(int code, const std::string &message, const std::string &kind) {
    return {{"error", {{"code", code}, {"message", message}, {"kind", kind}}}};
}

}  // namespace http
}  // namespace mcprouter
