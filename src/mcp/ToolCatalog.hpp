#pragma once

#include "ITransport.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_relay {

using json = nlohmann::json;

/**
 * @brief One input parameter of a remote tool
 */
struct ToolParameter {
    std::string name;
    std::string type;
    std::string description;
    bool required = false;
};

/**
 * @brief Metadata for a remotely advertised tool
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema as advertised
    std::vector<ToolParameter> parameters;  // required ones first

    /**
     * @brief Build descriptor from a tools/list entry
     * @throws std::invalid_argument if the entry has no name
     */
    static ToolDescriptor from_json(const json& entry);
};

/**
 * @brief Cache of the tools advertised by the active child
 *
 * refresh() replaces the whole cache or leaves it untouched; entries are
 * never merged.
 */
class ToolCatalog {
public:
    /**
     * @brief Construct catalog over a channel
     * @param transport Channel used for tools/list and tools/call
     */
    explicit ToolCatalog(std::shared_ptr<ITransport> transport);

    /**
     * @brief Re-issue tools/list and replace the cache
     * @return Tools in advertised order
     * @throws RpcError if the child answered with an error, TransportError on
     *         channel failure, std::runtime_error on a malformed listing
     */
    std::vector<ToolDescriptor> refresh();

    /**
     * @brief Call a cached tool
     * @param name Tool name (must be in the cache)
     * @param arguments Tool arguments object
     * @return The response's result member
     * @throws UnknownTool if @p name is not cached, RpcError on remote error
     */
    json invoke(const std::string& name, const json& arguments);

    std::vector<ToolDescriptor> tools() const;
    std::optional<ToolDescriptor> find(const std::string& name) const;
    size_t size() const;
    void clear();

private:
    std::shared_ptr<ITransport> transport_;

    mutable std::mutex mutex_;
    std::vector<ToolDescriptor> ordered_;
    std::map<std::string, size_t> index_;
};

} // namespace mcp_relay
