#include "message.hpp"

#include <cmath>
#include <cstdint>

namespace mcprouter {
namespace jsonrpc {

nlohmann::json make_request(const nlohmann::json &id, const std::string &method, const nlohmann::json &params) {
    nlohmann::json request = {{"jsonrpc", kVersion}, {"id", id}, {"method", method}};
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

nlohmann::json make_result(const nlohmann::json &id, const nlohmann::json &result) {
    return {{"jsonrpc", kVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error(const nlohmann::json &id, int code, const std::string &message) {
    return {{"jsonrpc", kVersion}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

RpcOutcome make_failure(const nlohmann::json &id, ErrorKind kind, const std::string &message) {
    RpcOutcome outcome;
    outcome.kind = kind;
    outcome.response = make_error(id, error_kind_to_code(kind), message);
    return outcome;
}

bool is_valid_id(const nlohmann::json &id) { return id.is_string() || id.is_number(); }

std::string id_key(const nlohmann::json &id) {
    // 2.0 and 2 are the same number once a worker has echoed it back
    if (id.is_number_float()) {
        const double value = id.get<double>();
        if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) < 9.0e15) {
            return std::to_string(static_cast<int64_t>(value));
        }
    }
    return id.dump();
}

bool is_response(const nlohmann::json &message) {
    if (!message.is_object() || !message.contains("id")) {
        return false;
    }
    const bool has_result = message.contains("result");
    const bool has_error = message.contains("error");
    return has_result != has_error;
}

std::string error_message(const nlohmann::json &response) {
    if (!response.is_object()) {
        return "";
    }
    auto it = response.find("error");
    if (it == response.end() || !it->is_object()) {
        return "";
    }
    auto msg = it->find("message");
    if (msg == it->end() || !msg->is_string()) {
        return "";
    }
    return msg->get<std::string>();
}

nlohmann::json unwrap_result(const RpcOutcome &outcome) {
    if (!outcome.ok()) {
        std::string message = error_message(outcome.response);
        if (message.empty()) {
            message = "Request failed: " + error_kind_to_string(outcome.kind);
        }
        throw RouterError(outcome.kind, message);
    }

    const nlohmann::json &response = outcome.response;
    auto error = response.find("error");
    if (error != response.end()) {
        int code = kInternalError;
        if (error->is_object()) {
            auto c = error->find("code");
            if (c != error->end() && c->is_number_integer()) {
                code = c->get<int>();
            }
        }
        std::string message = error_message(response);
        if (message.empty()) {
            message = "Worker returned an error";
        }
        throw RouterError(ErrorKind::WORKER_ERROR, message, code);
    }

    return response.value("result", nlohmann::json());
}

}  // namespace jsonrpc
}  // namespace mcprouter
