#include "Errors.hpp"

namespace mcp_relay {

const char* to_string(TransportError::Kind kind) {
    switch (kind) {
        case TransportError::Kind::Closed:
            return "closed";
        case TransportError::Kind::NoResponse:
            return "no_response";
        case TransportError::Kind::Malformed:
            return "malformed";
        case TransportError::Kind::Timeout:
            return "timeout";
        default:
            return "unknown";
    }
}

std::string RpcError::describe(const json& error) {
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        return error["message"].get<std::string>();
    }
    if (error.is_string()) {
        return error.get<std::string>();
    }
    return error.dump();
}

} // namespace mcp_relay
