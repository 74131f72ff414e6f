#include "RelayServer.hpp"
#include "JsonRpc.hpp"
#include "core/Errors.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace mcp_relay {

namespace {

constexpr const char* kJsonContentType = "application/json";

} // namespace

RelayServer::RelayServer(std::shared_ptr<SessionContext> context, RelayOptions options)
    : context_(std::move(context)), options_(std::move(options)) {
    if (!context_) {
        throw std::invalid_argument("Session context cannot be null");
    }
}

RelayServer::~RelayServer() {
    stop();
}

json RelayServer::error_body(const std::string& message, const std::string& type) {
    return {
        {"error", message},
        {"type", type}
    };
}

RelayServer::Reply RelayServer::handle_envelope(const std::string& body) {
    json envelope;
    try {
        envelope = json::parse(body);
    } catch (const json::parse_error& e) {
        spdlog::warn("Relay received invalid JSON: {}", e.what());
        return {400, error_body(std::string("Invalid JSON: ") + e.what(), "invalid_request")};
    }

    auto problem = JsonRpc::validate_envelope(envelope);
    if (!problem.empty()) {
        return {400, error_body(problem, "invalid_request")};
    }

    auto transport = context_->transport();
    if (!transport) {
        return {503, error_body("MCP server not available", "unavailable")};
    }
    if (!transport->is_open()) {
        return {503, error_body("MCP server process has exited", "unavailable")};
    }

    const std::string method = envelope["method"].get<std::string>();
    const bool notification = JsonRpc::is_notification(envelope);
    spdlog::debug("Relaying {} {} to server '{}'", notification ? "notification" : "request", method,
                  transport->process()->name());

    try {
        auto reply = transport->forward(envelope, options_.forward_timeout);
        if (notification || !reply) {
            return {200, {{"jsonrpc", "2.0"}, {"result", "accepted"}}};
        }
        return {200, std::move(*reply)};
    } catch (const TransportError& e) {
        spdlog::error("Relay transport error ({}) for {}: {}", to_string(e.kind()), method, e.what());
        return {500, error_body(e.what(), "transport_error")};
    } catch (const std::exception& e) {
        spdlog::error("Relay error for {}: {}", method, e.what());
        return {500, error_body(e.what(), "relay_error")};
    }
}

void RelayServer::configure_routes(httplib::Server& server) {
    server.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"}
    });

    server.Post(options_.path, [this](const httplib::Request& req, httplib::Response& res) {
        auto reply = handle_envelope(req.body);
        res.status = reply.status;
        res.set_content(reply.body.dump(), kJsonContentType);
    });

    server.Options(options_.path, [](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
    });

    server.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) {
            return;
        }
        if (res.status == 404) {
            spdlog::warn("Relay received request to unknown path: {}", req.path);
            res.set_content(error_body("Path " + req.path + " not found", "not_found").dump(), kJsonContentType);
        } else {
            res.set_content(error_body("HTTP " + std::to_string(res.status), "relay_error").dump(), kJsonContentType);
        }
    });

    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "unknown error";
        try {
            if (ep) {
                std::rethrow_exception(ep);
            }
        } catch (const std::exception& e) {
            message = e.what();
        }
        spdlog::error("Relay handler failed for {}: {}", req.path, message);
        res.status = 500;
        res.set_content(error_body(message, "relay_error").dump(), kJsonContentType);
    });
}

void RelayServer::start() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (server_) {
        throw RelayError("Relay server already running");
    }

    server_ = std::make_unique<httplib::Server>();
    configure_routes(*server_);

    int bound_port = options_.port;
    if (options_.port == 0) {
        bound_port = server_->bind_to_any_port(options_.host);
        if (bound_port < 0) {
            server_.reset();
            throw RelayError("Failed to bind relay on " + options_.host);
        }
    } else if (!server_->bind_to_port(options_.host, options_.port)) {
        server_.reset();
        throw RelayError("Failed to bind relay on " + options_.host + ":" + std::to_string(options_.port) +
                         " (port already in use?)");
    }

    bound_port_.store(bound_port);
    running_.store(true);

    httplib::Server* server = server_.get();
    server_thread_ = std::thread([this, server]() {
        if (!server->listen_after_bind()) {
            spdlog::error("Relay listener stopped with an error");
        }
        running_.store(false);
    });

    server->wait_until_ready();
    spdlog::info("Relay listening on http://{}:{}{}", options_.host, bound_port, options_.path);
}

void RelayServer::stop() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!server_) {
        return;
    }

    server_->stop();
    join();
    server_.reset();
    bound_port_.store(0);
    running_.store(false);
    spdlog::info("Relay server stopped");
}

void RelayServer::join() {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RelayServer::is_running() const {
    return running_.load();
}

int RelayServer::port() const {
    return bound_port_.load();
}

HttpEndpoint RelayServer::endpoint() const {
    return {options_.host, bound_port_.load()};
}

} // namespace mcp_relay
