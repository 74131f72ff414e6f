#include "SessionContext.hpp"
#include <spdlog/spdlog.h>

namespace mcp_relay {

SessionContext::SessionContext(std::chrono::milliseconds request_timeout)
    : request_timeout_(request_timeout) {}

void SessionContext::bind(std::shared_ptr<ManagedProcess> process) {
    std::shared_ptr<StdioTransport> transport;
    if (process) {
        transport = std::make_shared<StdioTransport>(process, request_timeout_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (process) {
        spdlog::info("Session bound to server '{}' (pid {})", process->name(), process->pid());
    } else if (process_) {
        spdlog::info("Session unbound from server '{}'", process_->name());
    }

    process_ = std::move(process);
    transport_ = std::move(transport);
    ++generation_;
}

std::shared_ptr<StdioTransport> SessionContext::transport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_;
}

std::shared_ptr<ManagedProcess> SessionContext::process() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_;
}

unsigned SessionContext::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

} // namespace mcp_relay
