#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>

namespace mcp_relay {

/**
 * @brief Owning wrapper around a POSIX file descriptor
 *
 * Closes the descriptor on destruction. Move-only.
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    /**
     * @brief Close the descriptor (no-op when already closed)
     */
    void close();

private:
    int fd_ = -1;
};

/**
 * @brief Result of a LineReader read attempt
 */
enum class ReadStatus {
    Line,         // a complete line was returned
    Timeout,      // deadline passed before a newline arrived
    EndOfStream,  // writer side closed and buffer is exhausted
    Cancelled,    // owner is shutting the stream down
    Error         // read/poll failure or descriptor closed
};

/**
 * @brief Buffered newline-delimited reader over a pipe
 *
 * Bytes following a newline stay buffered for the next call, so startup
 * log scanning and JSON-RPC reads can share the same stream without
 * losing data.
 */
class LineReader {
public:
    explicit LineReader(FileDescriptor fd, const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Read one line (without the trailing newline)
     * @param line Receives the line on ReadStatus::Line
     * @param timeout Maximum wait; negative waits indefinitely
     * @return Status of the attempt
     */
    ReadStatus read_line(std::string& line, std::chrono::milliseconds timeout);

    /**
     * @brief Return everything buffered or immediately readable, without blocking
     */
    std::string drain();

    bool is_open() const { return fd_.valid(); }
    void close() { fd_.close(); }

private:
    bool take_buffered_line(std::string& line);
    bool fill(std::chrono::milliseconds timeout, ReadStatus& status);

    FileDescriptor fd_;
    const std::atomic<bool>* cancel_;
    std::string buffer_;
    bool eof_ = false;
};

/**
 * @brief Write the whole buffer, retrying on EINTR and short writes
 * @return false when the reader side is gone or the write failed
 */
bool write_all(int fd, std::string_view data);

/**
 * @brief Set FD_CLOEXEC on a descriptor
 */
bool set_cloexec(int fd);

} // namespace mcp_relay
