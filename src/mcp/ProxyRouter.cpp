#include "ProxyRouter.hpp"
#include "JsonRpc.hpp"
#include "core/Errors.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_relay {

std::string_view to_string(Route route) {
    switch (route) {
        case Route::INSPECTION_PROXY:
            return "inspection_proxy";
        case Route::DIRECT_RELAY:
            return "direct_relay";
        case Route::STDIO_FALLBACK:
            return "stdio_fallback";
        case Route::NONE:
        default:
            return "none";
    }
}

ProxyRouter::ProxyRouter(std::shared_ptr<SessionContext> context, RouterOptions options)
    : context_(std::move(context)), options_(std::move(options)) {
    if (!context_) {
        throw std::invalid_argument("Session context cannot be null");
    }

    proxy_ = parse_http_url(options_.proxy_url);
    if (options_.use_inspection_proxy && !proxy_) {
        throw std::invalid_argument("Invalid proxy URL: " + options_.proxy_url);
    }
}

void ProxyRouter::set_relay_endpoint(const HttpEndpoint& endpoint) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    options_.relay = endpoint;
}

void ProxyRouter::set_relay_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    options_.relay_enabled = enabled;
}

void ProxyRouter::set_use_inspection_proxy(bool enabled) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    if (enabled && !proxy_) {
        throw std::invalid_argument("Invalid proxy URL: " + options_.proxy_url);
    }
    options_.use_inspection_proxy = enabled;
}

std::shared_ptr<StdioTransport> ProxyRouter::require_transport() const {
    auto transport = context_->transport();
    if (!transport) {
        throw TransportError(TransportError::Kind::Closed, "MCP server not started");
    }
    return transport;
}

json ProxyRouter::post_envelope(const json& envelope, std::chrono::milliseconds timeout, Route& route) {
    RouterOptions options;
    {
        std::lock_guard<std::mutex> lock(options_mutex_);
        options = options_;
    }

    httplib::Client client(options.relay.host, options.relay.port);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    route = Route::DIRECT_RELAY;
    if (options.use_inspection_proxy && proxy_) {
        client.set_proxy(proxy_->host, proxy_->port);
        route = Route::INSPECTION_PROXY;
    }

    const std::string body = envelope.dump();
    spdlog::debug("POST {}:{}{} via {}: {}", options.relay.host, options.relay.port,
                  options.relay_path, to_string(route), body);

    auto res = client.Post(options.relay_path, body, "application/json");
    if (!res) {
        throw RelayError("HTTP request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw RelayError("HTTP request failed with status " + std::to_string(res->status));
    }

    try {
        return json::parse(res->body);
    } catch (const json::parse_error& e) {
        throw RelayError(std::string("Malformed JSON from relay: ") + e.what());
    }
}

json ProxyRouter::call(const std::string& method, const json& params) {
    auto transport = require_transport();

    RequestId id = transport->process()->next_request_id();
    json envelope = JsonRpc::make_request(id, method, params);

    std::chrono::milliseconds timeout;
    bool relay_enabled;
    {
        std::lock_guard<std::mutex> lock(options_mutex_);
        timeout = options_.request_timeout;
        relay_enabled = options_.relay_enabled;
    }

    if (relay_enabled) {
        Route route = Route::NONE;
        try {
            json response = post_envelope(envelope, timeout, route);
            last_route_.store(route);
            return response;
        } catch (const RelayError& e) {
            spdlog::warn("HTTP request failed, falling back to stdio: {}", e.what());
        }
    }

    // The relay may still be holding the child; send_and_await waits for its lock
    auto response = transport->send_and_await(method, params, timeout);
    last_route_.store(Route::STDIO_FALLBACK);
    return response;
}

void ProxyRouter::notify(const std::string& method, const json& params) {
    auto transport = require_transport();
    json envelope = JsonRpc::make_notification(method, params);

    std::chrono::milliseconds timeout;
    bool relay_enabled;
    {
        std::lock_guard<std::mutex> lock(options_mutex_);
        timeout = options_.notification_timeout;
        relay_enabled = options_.relay_enabled;
    }

    if (relay_enabled) {
        Route route = Route::NONE;
        try {
            post_envelope(envelope, timeout, route);
            last_route_.store(route);
            return;
        } catch (const RelayError& e) {
            spdlog::warn("HTTP notification failed, falling back to stdio: {}", e.what());
        }
    }

    transport->notify(method, params);
    last_route_.store(Route::STDIO_FALLBACK);
}

bool ProxyRouter::is_open() const {
    auto transport = context_->transport();
    return transport && transport->is_open();
}

} // namespace mcp_relay
