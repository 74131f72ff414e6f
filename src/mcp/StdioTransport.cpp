#include "StdioTransport.hpp"
#include "JsonRpc.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <mutex>
#include <stdexcept>

namespace mcp_relay {

namespace {

std::string id_key(const json& id) {
    return id.dump();
}

} // namespace

StdioTransport::StdioTransport(std::shared_ptr<ManagedProcess> process,
                               std::chrono::milliseconds default_timeout)
    : process_(std::move(process)), default_timeout_(default_timeout) {
    if (!process_) {
        throw std::invalid_argument("Process cannot be null");
    }
    spdlog::debug("StdioTransport bound to pid {}", process_->pid());
}

void StdioTransport::ensure_open_locked() const {
    if (!process_->has_open_pipes()) {
        throw TransportError(TransportError::Kind::Closed,
                             "Server '" + process_->name() + "' has no open stdio");
    }
    if (!process_->is_alive()) {
        throw TransportError(TransportError::Kind::Closed,
                             "Server '" + process_->name() + "' process has exited");
    }
}

void StdioTransport::write_locked(const json& message) {
    std::string serialized = message.dump();
    if (!process_->write_line(serialized)) {
        throw TransportError(TransportError::Kind::Closed,
                             "Failed to write to server '" + process_->name() + "'");
    }
    spdlog::debug("Wrote message: {}", serialized);
}

void StdioTransport::forget_locked(const std::string& key) {
    pending_.erase(key);
}

json StdioTransport::read_response_locked(const json& expected_id, std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    const auto key = id_key(expected_id);
    const auto deadline = clock::now() + timeout;

    auto stashed = stashed_.find(key);
    if (stashed != stashed_.end()) {
        json response = std::move(stashed->second);
        stashed_.erase(stashed);
        forget_locked(key);
        return response;
    }

    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }

        std::string line;
        auto status = process_->stdout_reader().read_line(line, remaining);

        switch (status) {
            case ReadStatus::Line:
                break;
            case ReadStatus::Timeout:
                forget_locked(key);
                abandoned_.insert(key);
                spdlog::warn("No response for request {} within {} ms", key, timeout.count());
                throw TransportError(TransportError::Kind::Timeout,
                                     "Timed out waiting for response to request " + key);
            case ReadStatus::EndOfStream:
                forget_locked(key);
                throw TransportError(TransportError::Kind::NoResponse,
                                     "No response from server '" + process_->name() + "'");
            case ReadStatus::Cancelled:
            case ReadStatus::Error:
            default:
                forget_locked(key);
                throw TransportError(TransportError::Kind::Closed,
                                     "Server '" + process_->name() + "' stdio closed");
        }

        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        json message;
        try {
            message = json::parse(line);
        } catch (const json::parse_error& e) {
            forget_locked(key);
            spdlog::error("JSON parse error: {}", e.what());
            throw TransportError(TransportError::Kind::Malformed,
                                 std::string("Invalid JSON response: ") + e.what());
        }

        spdlog::debug("Read message: {}", line);

        if (message.is_object() && message.contains("method")) {
            spdlog::debug("Skipping message initiated by server: {}", message["method"].dump());
            continue;
        }

        if (!message.is_object() || !message.contains("id") || message["id"].is_null()) {
            forget_locked(key);
            return message;
        }

        const auto& id = message["id"];
        if (id == expected_id) {
            forget_locked(key);
            return message;
        }

        auto other = id_key(id);
        if (abandoned_.erase(other) > 0) {
            spdlog::debug("Discarding late response to abandoned request {}", other);
            continue;
        }
        if (pending_.count(other) > 0) {
            stashed_[other] = std::move(message);
            continue;
        }

        spdlog::warn("Response id {} does not match request {}", other, key);
        forget_locked(key);
        return message;
    }
}

RequestId StdioTransport::send(const std::string& method, const json& params) {
    std::lock_guard<std::mutex> lock(process_->io_mutex());
    ensure_open_locked();

    RequestId id = process_->next_request_id();
    write_locked(JsonRpc::make_request(id, method, params));
    pending_[id_key(json(id))] = PendingRequest{id, method, std::chrono::steady_clock::now()};
    return id;
}

json StdioTransport::await_response(RequestId id, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(process_->io_mutex());

    const json expected(id);
    const auto key = id_key(expected);
    if (stashed_.count(key) == 0) {
        if (pending_.count(key) == 0) {
            throw std::invalid_argument("No pending request with id " + key);
        }
        ensure_open_locked();
    }
    return read_response_locked(expected, timeout);
}

json StdioTransport::send_and_await(const std::string& method, const json& params,
                                    std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(process_->io_mutex());
    ensure_open_locked();

    RequestId id = process_->next_request_id();
    const json expected(id);
    pending_[id_key(expected)] = PendingRequest{id, method, std::chrono::steady_clock::now()};

    try {
        write_locked(JsonRpc::make_request(id, method, params));
    } catch (const TransportError&) {
        forget_locked(id_key(expected));
        throw;
    }

    return read_response_locked(expected, timeout);
}

std::optional<json> StdioTransport::forward(const json& envelope, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(process_->io_mutex());
    ensure_open_locked();

    if (JsonRpc::is_notification(envelope)) {
        write_locked(envelope);
        return std::nullopt;
    }

    const json& id = envelope["id"];
    std::string method = envelope.value("method", "");
    std::int64_t numeric_id = id.is_number_integer() ? id.get<std::int64_t>() : 0;
    pending_[id_key(id)] = PendingRequest{numeric_id, method, std::chrono::steady_clock::now()};

    try {
        write_locked(envelope);
    } catch (const TransportError&) {
        forget_locked(id_key(id));
        throw;
    }

    return read_response_locked(id, timeout);
}

json StdioTransport::call(const std::string& method, const json& params) {
    return send_and_await(method, params, default_timeout_);
}

void StdioTransport::notify(const std::string& method, const json& params) {
    std::lock_guard<std::mutex> lock(process_->io_mutex());
    ensure_open_locked();
    write_locked(JsonRpc::make_notification(method, params));
}

bool StdioTransport::is_open() const {
    return process_->has_open_pipes() && process_->is_alive();
}

size_t StdioTransport::pending_count() const {
    std::lock_guard<std::mutex> lock(process_->io_mutex());
    return pending_.size();
}

} // namespace mcp_relay
