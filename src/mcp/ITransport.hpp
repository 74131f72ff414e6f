#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace mcp_relay {

using json = nlohmann::json;

/**
 * @brief Abstract JSON-RPC channel to a child server
 *
 * Implementations deliver a request by some path (stdio, HTTP relay,
 * inspection proxy) and hand back the child's response envelope.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Send a request and wait for its response
     * @param method JSON-RPC method
     * @param params Parameters, or null to omit
     * @return Full JSON-RPC response object
     */
    virtual json call(const std::string& method, const json& params) = 0;

    /**
     * @brief Send a notification (no id, no reply)
     */
    virtual void notify(const std::string& method, const json& params) = 0;

    /**
     * @brief Check if the channel can still carry messages
     */
    virtual bool is_open() const = 0;
};

} // namespace mcp_relay
