#pragma once

#include "ProxyRouter.hpp"
#include "RelayServer.hpp"
#include "SessionContext.hpp"
#include "ToolCatalog.hpp"
#include "core/ProcessSupervisor.hpp"
#include "core/ServerConfig.hpp"

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_relay {

using json = nlohmann::json;

/**
 * @brief One bridged server: child process, relay, router and tool cache
 *
 * open() starts the selected server, waits for readiness, binds it to the
 * shared SessionContext, brings up the relay if requested and runs the MCP
 * handshake. switch_to() replaces the child while keeping the relay
 * listening; the relay simply sees the re-bound context.
 */
class BridgeSession {
public:
    static constexpr const char* PROTOCOL_VERSION = "2025-06-18";
    static constexpr const char* CLIENT_NAME = "mcp-relay";
    static constexpr const char* CLIENT_VERSION = "0.1.0";

    BridgeSession(ServerConfig config, BridgeOptions options);
    ~BridgeSession();

    BridgeSession(const BridgeSession&) = delete;
    BridgeSession& operator=(const BridgeSession&) = delete;

    /**
     * @brief Start and initialize a configured server
     * @param server_name Name from the registry
     * @throws ConfigError for an unknown name, StartFailure if the child
     *         cannot be spawned, does not become ready or rejects initialize
     */
    void open(const std::string& server_name);

    /**
     * @brief Stop the current child and open another one
     */
    void switch_to(const std::string& server_name);

    /**
     * @brief Stop child and relay. Idempotent.
     */
    void close();

    bool is_open() const;
    const std::string& current_server() const { return current_server_; }
    const json& server_info() const { return server_info_; }

    /**
     * @brief Refresh and return the tool list of the current child
     */
    std::vector<ToolDescriptor> list_tools();

    /**
     * @brief Invoke a tool of the current child
     */
    json call_tool(const std::string& name, const json& arguments);

    const ServerConfig& config() const { return config_; }
    const BridgeOptions& options() const { return options_; }
    ToolCatalog& catalog() { return *catalog_; }
    ProxyRouter& router() { return *router_; }
    RelayServer& relay() { return *relay_; }
    std::shared_ptr<SessionContext> context() const { return context_; }
    std::shared_ptr<ManagedProcess> process() const { return process_; }

private:
    void start_relay();
    void initialize();
    void stop_process();

    ServerConfig config_;
    BridgeOptions options_;
    ProcessSupervisor supervisor_;
    std::shared_ptr<SessionContext> context_;
    std::unique_ptr<RelayServer> relay_;
    std::shared_ptr<ProxyRouter> router_;
    std::unique_ptr<ToolCatalog> catalog_;

    std::shared_ptr<ManagedProcess> process_;
    std::string current_server_;
    json server_info_;
};

} // namespace mcp_relay
