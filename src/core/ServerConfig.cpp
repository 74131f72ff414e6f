#include "ServerConfig.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace mcp_relay {

std::optional<HttpEndpoint> parse_http_url(const std::string& url) {
    std::string rest = url;

    auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        if (rest.compare(0, scheme, "http") != 0) {
            return std::nullopt;
        }
        rest = rest.substr(scheme + 3);
    }

    // Drop any path component
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    HttpEndpoint endpoint;
    endpoint.port = 80;

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        try {
            size_t consumed = 0;
            endpoint.port = std::stoi(rest.substr(colon + 1), &consumed);
            if (consumed != rest.size() - colon - 1) {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
        rest = rest.substr(0, colon);
    }

    if (rest.empty() || endpoint.port <= 0 || endpoint.port > 65535) {
        return std::nullopt;
    }

    endpoint.host = rest;
    return endpoint;
}

ServerConfig ServerConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Configuration file '" + path.string() + "' not found");
    }

    nlohmann::ordered_json document;
    try {
        document = nlohmann::ordered_json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Invalid JSON in configuration file: ") + e.what());
    }

    auto config = from_json(document);
    spdlog::info("Loaded {} server(s) from {}", config.size(), path.string());
    return config;
}

ServerConfig ServerConfig::from_json(const nlohmann::ordered_json& document) {
    ServerConfig config;

    if (!document.is_object() || !document.contains("mcpServers")) {
        spdlog::warn("Configuration has no mcpServers section");
        return config;
    }

    const auto& servers = document["mcpServers"];
    if (!servers.is_object()) {
        throw ConfigError("mcpServers must be an object");
    }

    for (const auto& [name, entry] : servers.items()) {
        if (!entry.is_object() || !entry.contains("command") || !entry["command"].is_string()) {
            throw ConfigError("Server '" + name + "' has no command");
        }

        ServerLaunchSpec spec;
        spec.name = name;
        spec.command = entry["command"].get<std::string>();

        if (entry.contains("args")) {
            if (!entry["args"].is_array()) {
                throw ConfigError("Server '" + name + "': args must be an array");
            }
            for (const auto& arg : entry["args"]) {
                spec.args.push_back(arg.is_string() ? arg.get<std::string>() : arg.dump());
            }
        }

        if (entry.contains("env") && entry["env"].is_object()) {
            for (const auto& [key, value] : entry["env"].items()) {
                spec.env[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }

        config.servers_.push_back(std::move(spec));
    }

    return config;
}

std::vector<std::string> ServerConfig::list_servers() const {
    std::vector<std::string> names;
    names.reserve(servers_.size());
    for (const auto& spec : servers_) {
        names.push_back(spec.name);
    }
    return names;
}

std::optional<ServerLaunchSpec> ServerConfig::get(const std::string& name) const {
    for (const auto& spec : servers_) {
        if (spec.name == name) {
            return spec;
        }
    }
    return std::nullopt;
}

} // namespace mcp_relay
