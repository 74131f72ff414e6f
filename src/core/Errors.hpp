#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace mcp_relay {

using json = nlohmann::json;

/**
 * @brief Child process could not be spawned (or never became usable)
 */
class StartFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Failure of a single request on the stdio channel
 *
 * The child process keeps running; only the one request is lost.
 */
class TransportError : public std::runtime_error {
public:
    enum class Kind {
        Closed,      // process has no open stdin/stdout or has exited
        NoResponse,  // end of stream while waiting for a reply
        Malformed,   // reply line is not valid JSON
        Timeout      // no reply within the deadline
    };

    TransportError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

/**
 * @brief HTTP leg of a relay call failed
 */
class RelayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Tool name not present in the cached catalog
 */
class UnknownTool : public std::invalid_argument {
public:
    explicit UnknownTool(const std::string& name)
        : std::invalid_argument("Unknown tool: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/**
 * @brief Child answered with a JSON-RPC error object
 */
class RpcError : public std::runtime_error {
public:
    explicit RpcError(json error)
        : std::runtime_error("Remote error: " + describe(error)), error_(std::move(error)) {}

    const json& error() const { return error_; }

private:
    static std::string describe(const json& error);

    json error_;
};

/**
 * @brief Server registry could not be loaded
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const char* to_string(TransportError::Kind kind);

} // namespace mcp_relay
