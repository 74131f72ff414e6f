#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_relay {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 envelope helpers
 *
 * Only the generic envelope shape is handled here (jsonrpc/id/method/
 * params); nothing protocol specific.
 */
class JsonRpc {
public:
    /**
     * @brief Build a request envelope
     * @param id Request id
     * @param method Method name
     * @param params Parameters (omitted when null)
     */
    static json make_request(std::int64_t id, const std::string& method, const json& params = json());

    /**
     * @brief Build a notification envelope (no id)
     */
    static json make_notification(const std::string& method, const json& params = json());

    /**
     * @brief true for a message carrying a method but no id
     */
    static bool is_notification(const json& message);

    /**
     * @brief Check the envelope shape of an inbound request or notification
     * @return Empty string when valid, otherwise the reason
     */
    static std::string validate_envelope(const json& message);
};

} // namespace mcp_relay
