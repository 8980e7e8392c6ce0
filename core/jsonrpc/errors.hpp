#pragma once

#include <stdexcept>
#include <string>

namespace mcprouter {
namespace jsonrpc {

// Standard JSON-RPC 2.0 error codes reused by the router
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInternalError = -32603;

/**
 * @brief Router failure taxonomy
 *
 * Every failure inside the router is reduced to one of these kinds before it
 * reaches a caller. Kinds map onto JSON-RPC codes:
 * - UNKNOWN_SERVICE -> -32601
 * - INVALID_REQUEST -> -32600
 * - WORKER_ERROR    -> code reported by the worker
 * - everything else -> -32603
 *
 * Malformed worker output is never surfaced and has no kind.
 */
enum class ErrorKind {
    OK,
    UNKNOWN_SERVICE,
    INVALID_REQUEST,
    SPAWN_FAILED,
    PROCESS_EXITED,
    TIMEOUT,
    WORKER_ERROR,
    SHUTTING_DOWN,
    INTERNAL
};

inline int error_kind_to_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNKNOWN_SERVICE:
            return kMethodNotFound;
        case ErrorKind::INVALID_REQUEST:
            return kInvalidRequest;
        default:
            return kInternalError;
    }
}

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::OK:
            return "OK";
        case ErrorKind::UNKNOWN_SERVICE:
            return "UNKNOWN_SERVICE";
        case ErrorKind::INVALID_REQUEST:
            return "INVALID_REQUEST";
        case ErrorKind::SPAWN_FAILED:
            return "SPAWN_FAILED";
        case ErrorKind::PROCESS_EXITED:
            return "PROCESS_EXITED";
        case ErrorKind::TIMEOUT:
            return "TIMEOUT";
        case ErrorKind::WORKER_ERROR:
            return "WORKER_ERROR";
        case ErrorKind::SHUTTING_DOWN:
            return "SHUTTING_DOWN";
        case ErrorKind::INTERNAL:
            return "INTERNAL";
    }
    return "INTERNAL";
}

/**
 * @brief Exception raised by the throwing caller contract (Router::execute)
 *
 * Carries the failure kind and the JSON-RPC code a client would see.
 */
class RouterError : public std::runtime_error {
public:
    RouterError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind), code_(error_kind_to_code(kind)) {}

    RouterError(ErrorKind kind, const std::string &message, int code)
        : std::runtime_error(message), kind_(kind), code_(code) {}

    ErrorKind kind() const { return kind_; }
    int code() const { return code_; }

private:
    ErrorKind kind_;
    int code_;
};

}  // namespace jsonrpc
}  // namespace mcprouter
