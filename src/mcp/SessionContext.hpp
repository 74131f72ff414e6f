#pragma once

#include "StdioTransport.hpp"
#include "core/ProcessSupervisor.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace mcp_relay {

/**
 * @brief The child currently served by the bridge
 *
 * Handed to RelayServer and ProxyRouter at construction. Switching servers
 * re-binds the context; holders always look up the current transport
 * instead of keeping their own reference to a process.
 */
class SessionContext {
public:
    explicit SessionContext(std::chrono::milliseconds request_timeout = std::chrono::seconds(30));

    /**
     * @brief Make @p process the active child
     *
     * A fresh StdioTransport is created for it. Passing nullptr unbinds.
     */
    void bind(std::shared_ptr<ManagedProcess> process);

    void unbind() { bind(nullptr); }

    /**
     * @brief Transport of the active child, or nullptr when unbound
     */
    std::shared_ptr<StdioTransport> transport() const;

    /**
     * @brief Active child, or nullptr when unbound
     */
    std::shared_ptr<ManagedProcess> process() const;

    /**
     * @brief Incremented on every bind()
     */
    unsigned generation() const;

private:
    mutable std::mutex mutex_;
    std::chrono::milliseconds request_timeout_;
    std::shared_ptr<ManagedProcess> process_;
    std::shared_ptr<StdioTransport> transport_;
    unsigned generation_ = 0;
};

} // namespace mcp_relay
