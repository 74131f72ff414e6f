#pragma once

#include "Pipe.hpp"
#include "ReadinessClassifier.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace mcp_relay {

/**
 * @brief How to launch one configured server
 */
struct ServerLaunchSpec {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

using EnvironmentOverrides = std::map<std::string, std::string>;

/**
 * @brief Lifecycle state of a managed child
 */
enum class ProcessState {
    STARTING,
    READY,
    EXITED,
    FAILED
};

std::string_view to_string(ProcessState state);

/**
 * @brief A running child process and its stdio pipes
 *
 * Shared between the controlling flow and the relay through
 * std::shared_ptr. All stdio traffic must hold io_mutex() for the whole
 * write-then-read sequence. Request ids are allocated per process and
 * start at 1.
 */
class ManagedProcess {
public:
    ManagedProcess(pid_t pid,
                   std::string name,
                   LaunchMechanism mechanism,
                   FileDescriptor stdin_fd,
                   FileDescriptor stdout_fd,
                   FileDescriptor stderr_fd);
    ~ManagedProcess();

    ManagedProcess(const ManagedProcess&) = delete;
    ManagedProcess& operator=(const ManagedProcess&) = delete;

    pid_t pid() const { return pid_; }
    const std::string& name() const { return name_; }
    LaunchMechanism mechanism() const { return mechanism_; }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }

    ProcessState state() const { return state_.load(); }
    void set_state(ProcessState state) { state_.store(state); }

    /**
     * @brief Check liveness, reaping the child if it has exited
     * @return true while the child is running
     */
    bool is_alive();

    /**
     * @brief Exit status once the child has been reaped
     */
    std::optional<int> exit_code() const;

    /**
     * @brief Allocate the next request id (1, 2, 3, ...)
     */
    std::int64_t next_request_id() { return next_id_.fetch_add(1); }

    /**
     * @brief Lock serializing every stdio exchange with this child
     */
    std::mutex& io_mutex() { return io_mutex_; }

    /**
     * @brief Write one line to the child's stdin (caller holds io_mutex)
     * @return false if stdin is closed or the write failed
     */
    bool write_line(std::string_view line);

    LineReader& stdout_reader() { return stdout_; }
    LineReader& stderr_reader() { return stderr_; }

    /**
     * @brief Keep consuming stderr on a background thread
     *
     * Started once the child is ready so that a chatty child never blocks on
     * a full stderr pipe. Each line is logged at debug level. The thread is
     * joined by terminate(). Calling it again is a no-op.
     */
    void start_stderr_drain();

    /**
     * @brief true until terminate() releases the pipes
     */
    bool has_open_pipes() const;

    /**
     * @brief Terminate the child and release its pipes
     *
     * Sends SIGTERM to the child's process group, waits up to @p grace, then
     * SIGKILL. Safe to call repeatedly; only the first call does anything.
     *
     * @param grace Time allowed for a graceful exit
     * @return true if this call released the process
     */
    bool terminate(std::chrono::milliseconds grace);

    bool released() const { return released_.load(); }

private:
    bool reap(int options);
    void signal_group(int signo);
    void drain_stderr();

    const pid_t pid_;
    const std::string name_;
    const LaunchMechanism mechanism_;
    const std::chrono::system_clock::time_point created_at_;

    std::atomic<ProcessState> state_{ProcessState::STARTING};
    std::atomic<std::int64_t> next_id_{1};
    std::atomic<bool> shutting_down_{false};
    std::atomic<bool> released_{false};

    mutable std::mutex lifecycle_mutex_;
    bool reaped_ = false;
    std::optional<int> exit_code_;

    std::mutex io_mutex_;
    FileDescriptor stdin_;
    LineReader stdout_;
    LineReader stderr_;

    std::mutex drain_mutex_;
    std::thread stderr_thread_;
};

/**
 * @brief Outcome of waiting for a child to become ready
 */
enum class ReadinessOutcome {
    READY,              // success indicator seen, or optimistic timeout
    READINESS_TIMEOUT,  // timeout with optimistic default disabled
    PROCESS_EXITED,     // child exited before any verdict
    ERROR_DETECTED      // error indicator seen in startup output
};

std::string_view to_string(ReadinessOutcome outcome);

/**
 * @brief Result of ProcessSupervisor::await_ready with diagnostics
 */
struct ReadinessReport {
    ReadinessOutcome outcome = ReadinessOutcome::READY;
    bool timed_out = false;
    std::string matched_line;
    std::string stdout_text;   // startup output captured from stdout
    std::string stderr_text;   // startup output captured from stderr
    std::optional<int> exit_code;

    bool ok() const { return outcome == ReadinessOutcome::READY; }
};

/**
 * @brief Supervisor behaviour switches
 */
struct SupervisorOptions {
    bool use_proxychains = false;
    std::string proxychains_command = "proxychains";
    std::string proxychains_config = "proxychains.conf";
    std::string proxy_port_hint = "8080";
    bool optimistic_on_timeout = true;
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds termination_grace{5000};
};

/**
 * @brief Launches, watches and stops child servers
 */
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(SupervisorOptions options = {});

    /**
     * @brief Spawn a child with its stdio captured
     *
     * Environment: the bridge's own environment, then spec.env, then
     * @p overrides; later layers win.
     *
     * @param spec Launch command, arguments and environment
     * @param overrides Environment applied last
     * @return Handle to the running child, state STARTING
     * @throws StartFailure if the child cannot be spawned
     */
    std::shared_ptr<ManagedProcess> start(const ServerLaunchSpec& spec,
                                          const EnvironmentOverrides& overrides = {});

    /**
     * @brief Wait until the child looks ready
     *
     * Reads startup output line by line and classifies it with
     * ReadinessClassifier. A silent child still alive at @p timeout is
     * reported READY (timed_out set) unless optimistic_on_timeout is off.
     *
     * @param process Child to watch
     * @param timeout Maximum wait
     * @return Report with outcome and captured output
     */
    ReadinessReport await_ready(ManagedProcess& process, std::chrono::milliseconds timeout);

    /**
     * @brief Stop a child (graceful, then forced). Idempotent.
     */
    void stop(ManagedProcess& process);

    const SupervisorOptions& options() const { return options_; }

    /**
     * @brief Variables that disable TLS verification in common runtimes
     */
    static EnvironmentOverrides tls_bypass_environment();

    /**
     * @brief Merge the current environment with spec env and overrides
     */
    static std::map<std::string, std::string> build_environment(
        const ServerLaunchSpec& spec,
        const EnvironmentOverrides& overrides);

private:
    std::vector<std::string> build_command_line(const ServerLaunchSpec& spec) const;

    SupervisorOptions options_;
};

} // namespace mcp_relay
