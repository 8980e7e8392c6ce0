#include "../../jsonrpc/message.hpp"
#include "../../logging/logger.hpp"
#include "../../router/router.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace mcprouter {
namespace http {

//=============================================================================
// POST /mcp/:service
//=============================================================================
void HttpServer::handle_post_mcp(const httplib::Request &req, httplib::Response &res) {
    const std::string service_id = req.matches[1].str();

    nlohmann::json request;
    std::string error;
    if (req.body.empty() || !parse_body(req, request, nullptr, error)) {
        LOG_DEBUG("[HTTP] Malformed JSON-RPC body for " << service_id << ": " << error);
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  jsonrpc::make_error(nullptr, jsonrpc::kParseError, "Parse error"));
        return;
    }

    // JSON-RPC errors travel inside the envelope
    send_json(res, StatusCode::OK, router_.execute_mcp(service_id, request));
}

//=============================================================================
// POST /execute/:service/:method
//=============================================================================
void HttpServer::handle_post_execute(const httplib::Request &req, httplib::Response &res) {
    const std::string service_id = req.matches[1].str();
    const std::string method = req.matches[2].str();

    // Body is {"params": ...}; a missing body or key means no params
    nlohmann::json body;
    std::string error;
    if (!parse_body(req, body, nlohmann::json::object(), error)) {
        nlohmann::json reply = make_error_body(jsonrpc::kParseError, "Invalid JSON body: " + error, "PARSE_ERROR");
        reply["success"] = false;
        send_json(res, StatusCode::INVALID_ARGUMENT, reply);
        return;
    }
    if (!body.is_object()) {
        nlohmann::json reply =
            make_error_body(jsonrpc::kInvalidRequest, "Request body must be a JSON object", "INVALID_REQUEST");
        reply["success"] = false;
        send_json(res, StatusCode::INVALID_ARGUMENT, reply);
        return;
    }
    const nlohmann::json params = body.value("params", nlohmann::json::object());

    try {
        nlohmann::json result = router_.execute(service_id, method, params);
        send_json(res, StatusCode::OK, {{"success", true}, {"result", result}});
    } catch (const jsonrpc::RouterError &e) {
        LOG_DEBUG("[HTTP] execute " << service_id << "." << method << " failed: " << e.what());
        nlohmann::json reply = make_error_body(e.code(), e.what(), jsonrpc::error_kind_to_string(e.kind()));
        reply["success"] = false;
        send_json(res, status_code_for(e.kind()), reply);
    }
}

}  // namespace http
}  // namespace mcprouter
