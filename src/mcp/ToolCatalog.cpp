#include "ToolCatalog.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>
#include <stdexcept>

namespace mcp_relay {

ToolDescriptor ToolDescriptor::from_json(const json& entry) {
    if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
        throw std::invalid_argument("Tool entry without a name: " + entry.dump());
    }

    ToolDescriptor tool;
    tool.name = entry["name"].get<std::string>();
    if (entry.contains("description") && entry["description"].is_string()) {
        tool.description = entry["description"].get<std::string>();
    }
    tool.input_schema = entry.value("inputSchema", json::object());

    if (!tool.input_schema.is_object()) {
        return tool;
    }

    std::set<std::string> required;
    if (tool.input_schema.contains("required") && tool.input_schema["required"].is_array()) {
        for (const auto& name : tool.input_schema["required"]) {
            if (name.is_string()) {
                required.insert(name.get<std::string>());
            }
        }
    }

    if (tool.input_schema.contains("properties") && tool.input_schema["properties"].is_object()) {
        for (const auto& [name, property] : tool.input_schema["properties"].items()) {
            ToolParameter param;
            param.name = name;
            param.type = "string";
            if (property.is_object()) {
                if (property.contains("type") && property["type"].is_string()) {
                    param.type = property["type"].get<std::string>();
                }
                if (property.contains("description") && property["description"].is_string()) {
                    param.description = property["description"].get<std::string>();
                }
            }
            param.required = required.count(name) > 0;
            tool.parameters.push_back(std::move(param));
        }
    }

    std::stable_partition(tool.parameters.begin(), tool.parameters.end(),
                          [](const ToolParameter& p) { return p.required; });
    return tool;
}

ToolCatalog::ToolCatalog(std::shared_ptr<ITransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
}

std::vector<ToolDescriptor> ToolCatalog::refresh() {
    json response = transport_->call("tools/list", json::object());

    if (response.contains("error")) {
        throw RpcError(response["error"]);
    }
    if (!response.contains("result") || !response["result"].is_object() ||
        !response["result"].contains("tools") || !response["result"]["tools"].is_array()) {
        throw std::runtime_error("Failed to get tools: " + response.dump());
    }

    std::vector<ToolDescriptor> fresh;
    std::map<std::string, size_t> fresh_index;
    for (const auto& entry : response["result"]["tools"]) {
        auto tool = ToolDescriptor::from_json(entry);
        if (fresh_index.count(tool.name) > 0) {
            spdlog::warn("Duplicate tool name '{}' in listing, keeping the first", tool.name);
            continue;
        }
        fresh_index[tool.name] = fresh.size();
        fresh.push_back(std::move(tool));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ordered_ = fresh;
        index_ = std::move(fresh_index);
    }

    spdlog::info("Tool catalog refreshed: {} tool(s)", fresh.size());
    return fresh;
}

json ToolCatalog::invoke(const std::string& name, const json& arguments) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index_.count(name) == 0) {
            throw UnknownTool(name);
        }
    }

    spdlog::debug("Calling tool: {} with args: {}", name, arguments.dump());

    json response = transport_->call("tools/call", {
        {"name", name},
        {"arguments", arguments.is_null() ? json::object() : arguments}
    });

    if (response.contains("error")) {
        throw RpcError(response["error"]);
    }
    if (!response.contains("result")) {
        throw std::runtime_error("Tool call returned no result: " + response.dump());
    }
    return response["result"];
}

std::vector<ToolDescriptor> ToolCatalog::tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ordered_;
}

std::optional<ToolDescriptor> ToolCatalog::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return ordered_[it->second];
}

size_t ToolCatalog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ordered_.size();
}

void ToolCatalog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    ordered_.clear();
    index_.clear();
}

} // namespace mcp_relay
