#include "JsonRpc.hpp"

namespace mcp_relay {

json JsonRpc::make_request(std::int64_t id, const std::string& method, const json& params) {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

json JsonRpc::make_notification(const std::string& method, const json& params) {
    json notification = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

bool JsonRpc::is_notification(const json& message) {
    return message.is_object() && message.contains("method") && !message.contains("id");
}

std::string JsonRpc::validate_envelope(const json& message) {
    if (!message.is_object()) {
        return "Invalid Request: envelope must be a JSON object";
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return "Invalid Request: missing method field";
    }
    if (message.contains("params") && !message["params"].is_object() && !message["params"].is_array()) {
        return "Invalid Request: params must be an object or array";
    }
    if (message.contains("id")) {
        const auto& id = message["id"];
        if (!id.is_number_integer() && !id.is_string() && !id.is_null()) {
            return "Invalid Request: id must be an integer or string";
        }
    }
    return {};
}

} // namespace mcp_relay
