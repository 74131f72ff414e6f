#pragma once

#include "mcp/ITransport.hpp"
#include <queue>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_relay {

/**
 * @brief Mock transport for testing components above the channel
 *
 * Returns queued responses in order and records every call without
 * actual I/O.
 */
class MockTransport : public ITransport {
public:
    MockTransport() = default;

    json call(const std::string& method, const json& params) override;
    void notify(const std::string& method, const json& params) override;
    bool is_open() const override;

    /**
     * @brief Queue the response for the next call()
     * @param response JSON-RPC response (id is filled in by call)
     */
    void push_response(const json& response);

    /**
     * @brief Queue {"result": result} for the next call()
     */
    void push_result(const json& result);

    /**
     * @brief Calls seen so far as (method, params)
     */
    const std::vector<std::pair<std::string, json>>& calls() const { return calls_; }

    const std::vector<std::pair<std::string, json>>& notifications() const { return notifications_; }

    /**
     * @brief Close the transport (call() then throws TransportError)
     */
    void close();

private:
    std::queue<json> responses_;
    std::vector<std::pair<std::string, json>> calls_;
    std::vector<std::pair<std::string, json>> notifications_;
    int next_id_ = 1;
    bool open_ = true;
};

} // namespace mcp_relay
