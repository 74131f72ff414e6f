#pragma once

#include "ITransport.hpp"
#include "core/ProcessSupervisor.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace mcp_relay {

using RequestId = std::int64_t;

/**
 * @brief A request written to the child and not yet answered
 */
struct PendingRequest {
    RequestId id = 0;
    std::string method;
    std::chrono::steady_clock::time_point submitted_at;
};

/**
 * @brief Line-delimited JSON-RPC over a child's stdin/stdout
 *
 * One JSON document per line in both directions. Every exchange holds the
 * process's io_mutex from the write until the reply has been read, so the
 * child sees requests in write order and concurrent callers never read
 * each other's replies.
 *
 * While waiting, blank lines and messages initiated by the child (those
 * carrying a method) are skipped, replies to requests abandoned after a
 * timeout are discarded, and replies to other in-flight send() requests
 * are kept for their own await_response().
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct transport bound to one child
     * @param process Running child (shared with supervisor and relay)
     * @param default_timeout Deadline used by call()
     */
    explicit StdioTransport(std::shared_ptr<ManagedProcess> process,
                            std::chrono::milliseconds default_timeout = std::chrono::seconds(30));

    /**
     * @brief Write a request and return its id without waiting
     *
     * Pair with await_response() to collect the reply.
     *
     * @throws TransportError{Closed} if the child is gone
     */
    RequestId send(const std::string& method, const json& params = json());

    /**
     * @brief Collect the reply to a request issued with send()
     * @throws TransportError on timeout, end of stream or malformed output
     */
    json await_response(RequestId id, std::chrono::milliseconds timeout);

    /**
     * @brief Write a request and block for the reply
     *
     * @param method JSON-RPC method
     * @param params Parameters, or null to omit
     * @param timeout Maximum wait for the reply line
     * @return Response object as printed by the child
     * @throws TransportError{Closed|NoResponse|Malformed|Timeout}
     */
    json send_and_await(const std::string& method, const json& params, std::chrono::milliseconds timeout);

    /**
     * @brief Write a caller-built envelope verbatim
     *
     * Used by the relay. Waits for a reply only when the envelope has an id.
     *
     * @return Reply, or nullopt for notifications
     */
    std::optional<json> forward(const json& envelope, std::chrono::milliseconds timeout);

    // ITransport
    json call(const std::string& method, const json& params) override;
    void notify(const std::string& method, const json& params) override;
    bool is_open() const override;

    const std::shared_ptr<ManagedProcess>& process() const { return process_; }

    /**
     * @brief Number of requests written and not yet answered
     */
    size_t pending_count() const;

private:
    void ensure_open_locked() const;
    void write_locked(const json& message);
    json read_response_locked(const json& expected_id, std::chrono::milliseconds timeout);
    void forget_locked(const std::string& key);

    std::shared_ptr<ManagedProcess> process_;
    std::chrono::milliseconds default_timeout_;

    // Guarded by process_->io_mutex()
    std::map<std::string, PendingRequest> pending_;
    std::map<std::string, json> stashed_;
    std::set<std::string> abandoned_;
};

} // namespace mcp_relay
