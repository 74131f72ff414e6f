#include "Pipe.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace mcp_relay {

FileDescriptor::~FileDescriptor() {
    close();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_) {
    other.fd_ = -1;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void FileDescriptor::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

namespace {
// Blocking reads wake up this often to notice cancellation
constexpr std::chrono::milliseconds kPollSlice{100};
}

LineReader::LineReader(FileDescriptor fd, const std::atomic<bool>* cancel)
    : fd_(std::move(fd)), cancel_(cancel) {}

bool LineReader::take_buffered_line(std::string& line) {
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos) {
        return false;
    }

    line.assign(buffer_, 0, pos);
    buffer_.erase(0, pos + 1);

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool LineReader::fill(std::chrono::milliseconds timeout, ReadStatus& status) {
    pollfd pfd{};
    pfd.fd = fd_.get();
    pfd.events = POLLIN;

    int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret < 0) {
        if (errno == EINTR) {
            return true;
        }
        spdlog::error("poll failed on fd {}: {}", fd_.get(), std::strerror(errno));
        status = ReadStatus::Error;
        return false;
    }
    if (ret == 0) {
        status = ReadStatus::Timeout;
        return false;
    }

    char chunk[4096];
    auto n = ::read(fd_.get(), chunk, sizeof(chunk));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return true;
        }
        spdlog::error("read failed on fd {}: {}", fd_.get(), std::strerror(errno));
        status = ReadStatus::Error;
        return false;
    }
    if (n == 0) {
        eof_ = true;
        return true;
    }

    buffer_.append(chunk, static_cast<size_t>(n));
    return true;
}

ReadStatus LineReader::read_line(std::string& line, std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    const bool forever = timeout.count() < 0;
    const auto deadline = clock::now() + (forever ? std::chrono::milliseconds(0) : timeout);

    for (;;) {
        if (take_buffered_line(line)) {
            return ReadStatus::Line;
        }

        if (eof_) {
            // A final unterminated line still counts as a line
            if (!buffer_.empty()) {
                line.swap(buffer_);
                buffer_.clear();
                return ReadStatus::Line;
            }
            return ReadStatus::EndOfStream;
        }

        if (cancel_ && cancel_->load()) {
            return ReadStatus::Cancelled;
        }

        if (!fd_.valid()) {
            return ReadStatus::Error;
        }

        auto wait = kPollSlice;
        bool last_slice = false;
        if (!forever) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (remaining.count() < 0) {
                remaining = std::chrono::milliseconds(0);
            }
            if (remaining <= wait) {
                wait = remaining;
                last_slice = true;
            }
        }

        ReadStatus status = ReadStatus::Error;
        if (!fill(wait, status)) {
            if (status == ReadStatus::Timeout && !last_slice) {
                continue;
            }
            return status;
        }
    }
}

std::string LineReader::drain() {
    ReadStatus status = ReadStatus::Error;
    while (!eof_ && fd_.valid() && fill(std::chrono::milliseconds(0), status)) {
    }

    std::string out;
    out.swap(buffer_);
    return out;
}

bool write_all(int fd, std::string_view data) {
    size_t written = 0;
    while (written < data.size()) {
        auto n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::debug("write failed on fd {}: {}", fd, std::strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

bool set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags < 0) {
        return false;
    }
    return ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

} // namespace mcp_relay
