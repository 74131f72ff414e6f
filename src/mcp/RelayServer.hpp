#pragma once

#include "SessionContext.hpp"
#include "core/ServerConfig.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace httplib {
class Server;
}

namespace mcp_relay {

using json = nlohmann::json;

/**
 * @brief Listener settings for the relay
 */
struct RelayOptions {
    std::string host = "127.0.0.1";
    int port = 3000;  // 0 picks a free port
    std::string path = "/mcp";
    std::chrono::milliseconds forward_timeout{30000};
};

/**
 * @brief Local HTTP endpoint that forwards JSON-RPC envelopes to the child
 *
 * POST <path> carries one envelope; the response body is the child's reply.
 * OPTIONS <path> answers CORS preflight for browser based clients. Every
 * failure is turned into {"error": ..., "type": ...} with a 4xx/5xx status;
 * nothing thrown while forwarding reaches the listener thread.
 */
class RelayServer {
public:
    /**
     * @brief Outcome of relaying one envelope
     */
    struct Reply {
        int status = 200;
        json body;
    };

    /**
     * @brief Construct relay bound to a session context
     * @param context Shared context naming the active child
     * @param options Listener address and forwarding deadline
     */
    RelayServer(std::shared_ptr<SessionContext> context, RelayOptions options = {});
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /**
     * @brief Bind and start the listener thread
     * @throws RelayError if already running or the address cannot be bound
     */
    void start();

    /**
     * @brief Stop the listener and join its thread (no-op when stopped)
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Port actually bound (0 when stopped)
     */
    int port() const;

    /**
     * @brief Address clients should post to, e.g. 127.0.0.1:3000
     */
    HttpEndpoint endpoint() const;

    const RelayOptions& options() const { return options_; }

    /**
     * @brief Relay one POST body to the active child
     *
     * Shared by the HTTP handler and tests.
     */
    Reply handle_envelope(const std::string& body);

    static json error_body(const std::string& message, const std::string& type);

private:
    void configure_routes(httplib::Server& server);
    void join();

    std::shared_ptr<SessionContext> context_;
    RelayOptions options_;

    mutable std::mutex mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
    std::atomic<int> bound_port_{0};
};

} // namespace mcp_relay
