#pragma once

#include "ITransport.hpp"
#include "SessionContext.hpp"
#include "core/ServerConfig.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcp_relay {

/**
 * @brief Where ProxyRouter sends its traffic
 */
struct RouterOptions {
    bool relay_enabled = true;
    HttpEndpoint relay{"127.0.0.1", 3000};
    std::string relay_path = "/mcp";
    bool use_inspection_proxy = false;
    std::string proxy_url = "http://127.0.0.1:8080";
    std::chrono::milliseconds notification_timeout{5000};
    std::chrono::milliseconds request_timeout{30000};
};

/**
 * @brief Path a call finally took
 */
enum class Route {
    NONE,
    INSPECTION_PROXY,  // HTTP via upstream proxy to the relay
    DIRECT_RELAY,      // HTTP straight to the relay
    STDIO_FALLBACK     // relay unusable, wrote to the child directly
};

std::string_view to_string(Route route);

/**
 * @brief Client side of the relay with stdio fallback
 *
 * Posts JSON-RPC envelopes to the RelayServer, optionally through an
 * upstream inspection proxy. Any HTTP failure (refused connection,
 * timeout, non-2xx status, unparsable body) is logged and the call is
 * repeated directly on the active child's StdioTransport. Only a failure of
 * that fallback reaches the caller.
 */
class ProxyRouter : public ITransport {
public:
    /**
     * @brief Construct router
     * @param context Shared context naming the active child
     * @param options Relay address, proxy and deadlines
     * @throws std::invalid_argument if proxy routing is on and proxy_url is unusable
     */
    ProxyRouter(std::shared_ptr<SessionContext> context, RouterOptions options);

    json call(const std::string& method, const json& params) override;
    void notify(const std::string& method, const json& params) override;
    bool is_open() const override;

    /**
     * @brief Point at a relay whose port was only known after binding
     */
    void set_relay_endpoint(const HttpEndpoint& endpoint);

    void set_relay_enabled(bool enabled);
    void set_use_inspection_proxy(bool enabled);

    Route last_route() const { return last_route_.load(); }

private:
    json post_envelope(const json& envelope, std::chrono::milliseconds timeout, Route& route);
    std::shared_ptr<StdioTransport> require_transport() const;

    std::shared_ptr<SessionContext> context_;

    mutable std::mutex options_mutex_;
    RouterOptions options_;
    std::optional<HttpEndpoint> proxy_;

    std::atomic<Route> last_route_{Route::NONE};
};

} // namespace mcp_relay
