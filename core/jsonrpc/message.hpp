#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "errors.hpp"

namespace mcprouter {
namespace jsonrpc {

constexpr const char *kVersion = "2.0";

/**
 * @brief Result of one request/response exchange with a worker
 *
 * `response` is always a complete JSON-RPC response envelope: either the
 * worker's own reply (kind OK, which may itself carry an `error` object) or a
 * router-built error envelope describing why no reply was obtained.
 */
struct RpcOutcome {
    ErrorKind kind = ErrorKind::OK;
    nlohmann::json response;

    bool ok() const { return kind == ErrorKind::OK; }
};

// Envelope builders
nlohmann::json make_request(const nlohmann::json &id, const std::string &method, const nlohmann::json &params);
nlohmann::json make_result(const nlohmann::json &id, const nlohmann::json &result);
nlohmann::json make_error(const nlohmann::json &id, int code, const std::string &message);
RpcOutcome make_failure(const nlohmann::json &id, ErrorKind kind, const std::string &message);

// A usable correlation id is a string or a number.
bool is_valid_id(const nlohmann::json &id);

// Canonical map key for a correlation id. String "1" and number 1 differ;
// integral floats key like the integer.
std::string id_key(const nlohmann::json &id);

// True for objects that carry an id plus exactly one of result / error.
bool is_response(const nlohmann::json &message);

// Message text of an error envelope, or an empty string.
std::string error_message(const nlohmann::json &response);

// The `result` of a successful exchange. Throws RouterError for a failure
// outcome (its kind) or for an error object sent by the worker (WORKER_ERROR
// carrying the worker's code).
nlohmann::json unwrap_result(const RpcOutcome &outcome);

}  // namespace jsonrpc
}  // namespace mcprouter
