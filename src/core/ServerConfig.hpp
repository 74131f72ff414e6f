#pragma once

#include "ProcessSupervisor.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_relay {

/**
 * @brief host:port of an HTTP endpoint
 */
struct HttpEndpoint {
    std::string host;
    int port = 0;
};

/**
 * @brief Parse "http://host:port" (scheme and port optional, port defaults to 80)
 * @return Endpoint, or nullopt if the URL is unusable
 */
std::optional<HttpEndpoint> parse_http_url(const std::string& url);

/**
 * @brief Default deadlines used across the bridge
 */
struct BridgeTimeouts {
    std::chrono::milliseconds readiness{20000};
    std::chrono::milliseconds notification{5000};
    std::chrono::milliseconds request{30000};
    std::chrono::milliseconds termination_grace{5000};
};

/**
 * @brief Bridge-wide settings collected from the command line
 */
struct BridgeOptions {
    std::string proxy_url = "http://127.0.0.1:8080";
    bool use_inspection_proxy = true;
    bool use_proxychains = false;
    bool bypass_tls = true;
    bool start_relay = false;
    std::string relay_host = "127.0.0.1";
    int relay_port = 3000;
    BridgeTimeouts timeouts;
};

/**
 * @brief Registry of launchable servers from mcp_config.json
 *
 * Expected layout:
 * @code
 * {"mcpServers": {"name": {"command": "npx", "args": ["..."], "env": {"K": "V"}}}}
 * @endcode
 */
class ServerConfig {
public:
    ServerConfig() = default;

    /**
     * @brief Load registry from a file
     * @throws ConfigError if the file is missing or not valid JSON
     */
    static ServerConfig load(const std::filesystem::path& path);

    /**
     * @brief Build registry from already parsed JSON
     * @throws ConfigError on entries without a usable command
     */
    static ServerConfig from_json(const nlohmann::ordered_json& document);

    /**
     * @brief Server names in file order
     */
    std::vector<std::string> list_servers() const;

    std::optional<ServerLaunchSpec> get(const std::string& name) const;

    size_t size() const { return servers_.size(); }
    bool empty() const { return servers_.empty(); }

private:
    std::vector<ServerLaunchSpec> servers_;
};

} // namespace mcp_relay
