#include "BridgeSession.hpp"
#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

namespace mcp_relay {

namespace {

SupervisorOptions supervisor_options(const BridgeOptions& options) {
    SupervisorOptions result;
    result.use_proxychains = options.use_proxychains;
    if (auto proxy = parse_http_url(options.proxy_url)) {
        result.proxy_port_hint = std::to_string(proxy->port);
    }
    result.termination_grace = options.timeouts.termination_grace;
    return result;
}

RelayOptions relay_options(const BridgeOptions& options) {
    RelayOptions result;
    result.host = options.relay_host;
    result.port = options.relay_port;
    result.forward_timeout = options.timeouts.request;
    return result;
}

RouterOptions router_options(const BridgeOptions& options) {
    RouterOptions result;
    result.relay_enabled = false;
    result.relay = {options.relay_host, options.relay_port};
    result.use_inspection_proxy = options.use_inspection_proxy;
    result.proxy_url = options.proxy_url;
    result.notification_timeout = options.timeouts.notification;
    result.request_timeout = options.timeouts.request;
    return result;
}

} // namespace

BridgeSession::BridgeSession(ServerConfig config, BridgeOptions options)
    : config_(std::move(config)),
      options_(std::move(options)),
      supervisor_(supervisor_options(options_)),
      context_(std::make_shared<SessionContext>(options_.timeouts.request)),
      relay_(std::make_unique<RelayServer>(context_, relay_options(options_))),
      router_(std::make_shared<ProxyRouter>(context_, router_options(options_))),
      catalog_(std::make_unique<ToolCatalog>(router_)) {}

BridgeSession::~BridgeSession() {
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::error("Error while closing session: {}", e.what());
    }
}

void BridgeSession::open(const std::string& server_name) {
    if (process_) {
        throw std::logic_error("Session already has server '" + current_server_ + "' open");
    }

    auto spec = config_.get(server_name);
    if (!spec) {
        throw ConfigError("Server '" + server_name + "' not found in config");
    }

    EnvironmentOverrides overrides;
    if (options_.bypass_tls) {
        overrides = ProcessSupervisor::tls_bypass_environment();
    }

    auto process = supervisor_.start(*spec, overrides);
    auto report = supervisor_.await_ready(*process, options_.timeouts.readiness);
    if (!report.ok()) {
        supervisor_.stop(*process);
        std::string message = "Server '" + server_name + "' failed to start (" +
                              std::string(to_string(report.outcome)) + ")";
        if (!report.matched_line.empty()) {
            message += ": " + report.matched_line;
        }
        throw StartFailure(message);
    }

    process_ = process;
    current_server_ = server_name;
    context_->bind(process_);

    if (options_.start_relay) {
        start_relay();
    }

    try {
        initialize();
    } catch (const std::exception&) {
        stop_process();
        throw;
    }

    try {
        auto tools = catalog_->refresh();
        spdlog::info("Server '{}' advertises {} tools", server_name, tools.size());
    } catch (const std::exception& e) {
        spdlog::warn("Could not list tools of '{}': {}", server_name, e.what());
    }
}

void BridgeSession::start_relay() {
    if (relay_->is_running()) {
        return;
    }
    try {
        relay_->start();
        router_->set_relay_endpoint(relay_->endpoint());
        router_->set_relay_enabled(true);
    } catch (const RelayError& e) {
        spdlog::error("Failed to start relay, continuing with stdio only: {}", e.what());
        router_->set_relay_enabled(false);
    }
}

void BridgeSession::initialize() {
    json params = {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {{"tools", json::object()}}},
        {"clientInfo", {{"name", CLIENT_NAME}, {"version", CLIENT_VERSION}}}
    };

    json response = router_->call("initialize", params);
    if (response.is_object() && response.contains("error")) {
        throw StartFailure("Initialization of '" + current_server_ + "' failed: " + response["error"].dump());
    }
    if (!response.is_object() || !response.contains("result") || !response["result"].is_object()) {
        throw StartFailure("Initialization of '" + current_server_ + "' failed: " + response.dump());
    }

    server_info_ = response["result"].value("serverInfo", json::object());
    if (!server_info_.is_object()) {
        server_info_ = json::object();
    }
    spdlog::info("Initialized '{}' ({} {})", current_server_,
                 server_info_.value("name", "unknown"), server_info_.value("version", "?"));

    router_->notify("notifications/initialized", json::object());
}

void BridgeSession::stop_process() {
    catalog_->clear();
    if (process_) {
        supervisor_.stop(*process_);
    }
    context_->unbind();
    process_.reset();
    current_server_.clear();
    server_info_ = json();
}

void BridgeSession::switch_to(const std::string& server_name) {
    if (!config_.get(server_name)) {
        throw ConfigError("Server '" + server_name + "' not found in config");
    }
    spdlog::info("Switching from '{}' to '{}'", current_server_, server_name);
    stop_process();
    open(server_name);
}

void BridgeSession::close() {
    // Stopping the child first releases relay handlers blocked on its stdout
    stop_process();
    relay_->stop();
    router_->set_relay_enabled(false);
}

bool BridgeSession::is_open() const {
    return process_ && router_->is_open();
}

std::vector<ToolDescriptor> BridgeSession::list_tools() {
    return catalog_->refresh();
}

json BridgeSession::call_tool(const std::string& name, const json& arguments) {
    if (!catalog_->find(name)) {
        catalog_->refresh();
    }
    return catalog_->invoke(name, arguments);
}

} // namespace mcp_relay
