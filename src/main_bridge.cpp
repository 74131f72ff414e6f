#include "core/Errors.hpp"
#include "core/ServerConfig.hpp"
#include "mcp/BridgeSession.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
    std::atomic<bool> shutdown_requested{false};

    void signal_handler(int) {
        shutdown_requested = true;
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    bool apply_log_level(const std::string& log_level) {
        if (log_level == "trace") {
            spdlog::set_level(spdlog::level::trace);
        } else if (log_level == "debug") {
            spdlog::set_level(spdlog::level::debug);
        } else if (log_level == "info") {
            spdlog::set_level(spdlog::level::info);
        } else if (log_level == "warn") {
            spdlog::set_level(spdlog::level::warn);
        } else if (log_level == "error") {
            spdlog::set_level(spdlog::level::err);
        } else if (log_level == "critical") {
            spdlog::set_level(spdlog::level::critical);
        } else {
            return false;
        }
        return true;
    }

    void print_tools(const std::vector<mcp_relay::ToolDescriptor>& tools) {
        if (tools.empty()) {
            std::cout << "No tools available" << std::endl;
            return;
        }
        std::cout << "Available tools (" << tools.size() << "):" << std::endl;
        for (const auto& tool : tools) {
            std::cout << "  " << tool.name;
            if (!tool.description.empty()) {
                std::cout << " - " << tool.description;
            }
            std::cout << std::endl;
            for (const auto& param : tool.parameters) {
                std::cout << "      " << param.name << " (" << (param.type.empty() ? "any" : param.type)
                          << (param.required ? ", required" : "") << ")";
                if (!param.description.empty()) {
                    std::cout << ": " << param.description;
                }
                std::cout << std::endl;
            }
        }
    }
}

int main(int argc, char** argv) {
    CLI::App app{"MCP stdio bridge with HTTP relay and inspection proxy routing"};

    std::string config_path = "mcp_config.json";
    app.add_option("-c,--config", config_path, "Server registry file")->default_val("mcp_config.json");

    std::string server_name;
    app.add_option("-s,--server", server_name, "Server to launch (lists servers when omitted)");

    mcp_relay::BridgeOptions options;
    app.add_option("--proxy", options.proxy_url, "Upstream inspection proxy URL")
        ->default_val("http://127.0.0.1:8080");

    bool no_proxy = false;
    app.add_flag("--no-proxy", no_proxy, "Post to the relay directly instead of through the proxy");

    bool no_proxychains = false;
    app.add_flag("--no-proxychains", no_proxychains,
                 "Do not wrap the child command with " + mcp_relay::SupervisorOptions().proxychains_command);

    bool no_ssl_bypass = false;
    app.add_flag("--no-ssl-bypass", no_ssl_bypass, "Keep TLS verification enabled in the child");

    app.add_flag("--start-relay", options.start_relay, "Start the local HTTP relay");
    app.add_option("--relay-port", options.relay_port, "Relay port (0 picks a free one)")
        ->default_val(3000)
        ->check(CLI::Range(0, 65535));

    std::string tool_name;
    app.add_option("--call", tool_name, "Tool to invoke");

    std::string tool_args = "{}";
    app.add_option("--args", tool_args, "Tool arguments as a JSON object")->default_val("{}");

    bool serve = false;
    app.add_flag("--serve", serve, "Keep the bridge running until interrupted");

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mcp-relay version " << mcp_relay::BridgeSession::CLIENT_VERSION << std::endl;
        return 0;
    }

    // stdout carries command output; logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("mcp-relay"));
    if (!apply_log_level(log_level)) {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }

    options.use_inspection_proxy = !no_proxy;
    options.use_proxychains = !no_proxychains;
    options.bypass_tls = !no_ssl_bypass;

    try {
        auto config = mcp_relay::ServerConfig::load(config_path);

        if (server_name.empty()) {
            std::cout << "Available servers:" << std::endl;
            for (const auto& name : config.list_servers()) {
                std::cout << "  " << name << std::endl;
            }
            return 0;
        }

        mcp_relay::json arguments;
        try {
            arguments = mcp_relay::json::parse(tool_args);
        } catch (const mcp_relay::json::parse_error& e) {
            std::cerr << "Invalid --args JSON: " << e.what() << std::endl;
            return 1;
        }
        if (!arguments.is_object()) {
            std::cerr << "--args must be a JSON object" << std::endl;
            return 1;
        }

        setup_signal_handlers();

        mcp_relay::BridgeSession session(std::move(config), options);
        session.open(server_name);

        if (!tool_name.empty()) {
            auto result = session.call_tool(tool_name, arguments);
            std::cout << result.dump(2) << std::endl;
        } else {
            print_tools(session.catalog().tools());
        }

        if (serve) {
            spdlog::info("Serving '{}'; press Ctrl+C to stop", server_name);
            while (!shutdown_requested.load()) {
                if (!session.is_open()) {
                    spdlog::error("Server '{}' is no longer running", server_name);
                    session.close();
                    return 1;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            spdlog::info("Shutdown requested");
        }

        session.close();
        spdlog::info("Bridge stopped cleanly");
        return 0;

    } catch (const mcp_relay::UnknownTool& e) {
        spdlog::error("{}", e.what());
        return 2;
    } catch (const mcp_relay::RpcError& e) {
        spdlog::error("{}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
