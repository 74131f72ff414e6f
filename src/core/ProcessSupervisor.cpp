#include "ProcessSupervisor.hpp"
#include "Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_relay {

namespace {

// Writing to a dead child's stdin must surface as EPIPE, not kill the bridge
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

struct PipePair {
    int read_end = -1;
    int write_end = -1;

    void close_all() {
        if (read_end >= 0) {
            ::close(read_end);
            read_end = -1;
        }
        if (write_end >= 0) {
            ::close(write_end);
            write_end = -1;
        }
    }
};

bool open_pipe(PipePair& pair) {
    int fds[2];
    if (::pipe(fds) != 0) {
        return false;
    }
    pair.read_end = fds[0];
    pair.write_end = fds[1];
    set_cloexec(pair.read_end);
    set_cloexec(pair.write_end);
    return true;
}

bool find_in_path(const std::string& executable) {
    const char* path = std::getenv("PATH");
    if (!path) {
        return false;
    }

    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        auto candidate = std::filesystem::path(dir) / executable;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

} // namespace

std::string_view to_string(ProcessState state) {
    switch (state) {
        case ProcessState::STARTING:
            return "starting";
        case ProcessState::READY:
            return "ready";
        case ProcessState::EXITED:
            return "exited";
        case ProcessState::FAILED:
        default:
            return "failed";
    }
}

std::string_view to_string(ReadinessOutcome outcome) {
    switch (outcome) {
        case ReadinessOutcome::READY:
            return "ready";
        case ReadinessOutcome::READINESS_TIMEOUT:
            return "readiness_timeout";
        case ReadinessOutcome::PROCESS_EXITED:
            return "process_exited";
        case ReadinessOutcome::ERROR_DETECTED:
        default:
            return "error_detected";
    }
}

// ── ManagedProcess ──────────────────────────────────────────────────────

ManagedProcess::ManagedProcess(pid_t pid,
                               std::string name,
                               LaunchMechanism mechanism,
                               FileDescriptor stdin_fd,
                               FileDescriptor stdout_fd,
                               FileDescriptor stderr_fd)
    : pid_(pid),
      name_(std::move(name)),
      mechanism_(mechanism),
      created_at_(std::chrono::system_clock::now()),
      stdin_(std::move(stdin_fd)),
      stdout_(std::move(stdout_fd), &shutting_down_),
      stderr_(std::move(stderr_fd), &shutting_down_) {}

ManagedProcess::~ManagedProcess() {
    terminate(std::chrono::milliseconds(0));
}

bool ManagedProcess::reap(int options) {
    // lifecycle_mutex_ held by caller
    if (reaped_) {
        return true;
    }

    int status = 0;
    pid_t ret;
    do {
        ret = ::waitpid(pid_, &status, options);
    } while (ret < 0 && errno == EINTR);

    if (ret == 0) {
        return false;
    }

    reaped_ = true;
    if (ret < 0) {
        spdlog::warn("waitpid({}) failed: {}", pid_, std::strerror(errno));
        return true;
    }

    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
    return true;
}

void ManagedProcess::signal_group(int signo) {
    if (::kill(-pid_, signo) != 0 && errno == ESRCH) {
        ::kill(pid_, signo);
    }
}

bool ManagedProcess::is_alive() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (reap(WNOHANG)) {
        if (state_.load() != ProcessState::FAILED) {
            state_.store(ProcessState::EXITED);
        }
        return false;
    }
    return true;
}

std::optional<int> ManagedProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return exit_code_;
}

bool ManagedProcess::write_line(std::string_view line) {
    if (!stdin_.valid()) {
        return false;
    }

    std::string framed(line);
    framed += '\n';
    return write_all(stdin_.get(), framed);
}

bool ManagedProcess::has_open_pipes() const {
    return !released_.load();
}

void ManagedProcess::start_stderr_drain() {
    std::lock_guard<std::mutex> lock(drain_mutex_);
    if (released_.load() || stderr_thread_.joinable()) {
        return;
    }
    stderr_thread_ = std::thread([this] { drain_stderr(); });
}

void ManagedProcess::drain_stderr() {
    std::string line;
    for (;;) {
        auto status = stderr_.read_line(line, std::chrono::milliseconds(-1));
        if (status != ReadStatus::Line) {
            spdlog::debug("[{} stderr] closed ({})", name_, status == ReadStatus::EndOfStream ? "eof" : "stopped");
            return;
        }
        spdlog::debug("[{} stderr] {}", name_, line);
    }
}

bool ManagedProcess::terminate(std::chrono::milliseconds grace) {
    if (released_.exchange(true)) {
        return false;
    }

    shutting_down_.store(true);

    std::string exit_description = "unknown";
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!reap(WNOHANG)) {
            spdlog::debug("Sending SIGTERM to process group {}", pid_);
            signal_group(SIGTERM);

            auto deadline = std::chrono::steady_clock::now() + grace;
            while (!reap(WNOHANG) && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }

            if (!reaped_) {
                spdlog::warn("Process {} did not exit within {} ms, sending SIGKILL", pid_, grace.count());
                signal_group(SIGKILL);
                reap(0);
            }
        }
        if (exit_code_) {
            exit_description = std::to_string(*exit_code_);
        }
    }

    if (state_.load() != ProcessState::FAILED) {
        state_.store(ProcessState::EXITED);
    }

    {
        std::lock_guard<std::mutex> lock(drain_mutex_);
        if (stderr_thread_.joinable()) {
            stderr_thread_.join();
        }
    }

    // Readers notice shutting_down_ within one poll slice and drop the lock
    std::lock_guard<std::mutex> io_lock(io_mutex_);
    stdin_.close();
    stdout_.close();
    stderr_.close();

    spdlog::info("Process {} ({}) released, exit code {}", pid_, name_, exit_description);
    return true;
}

// ── ProcessSupervisor ───────────────────────────────────────────────────

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options)
    : options_(std::move(options)) {
    ignore_sigpipe_once();
}

EnvironmentOverrides ProcessSupervisor::tls_bypass_environment() {
    return {
        {"NODE_TLS_REJECT_UNAUTHORIZED", "0"},
        {"PYTHONHTTPSVERIFY", "0"},
        {"REQUESTS_CA_BUNDLE", ""},
        {"SSL_CERT_FILE", ""},
        {"CURL_CA_BUNDLE", ""}
    };
}

std::map<std::string, std::string> ProcessSupervisor::build_environment(
    const ServerLaunchSpec& spec,
    const EnvironmentOverrides& overrides
) {
    std::map<std::string, std::string> env;

    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        env[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
    }

    for (const auto& [key, value] : spec.env) {
        env[key] = value;
    }

    for (const auto& [key, value] : overrides) {
        env[key] = value;
    }

    return env;
}

std::vector<std::string> ProcessSupervisor::build_command_line(const ServerLaunchSpec& spec) const {
    std::vector<std::string> argv;

    if (options_.use_proxychains) {
        if (!find_in_path(options_.proxychains_command)) {
            throw StartFailure(options_.proxychains_command + " is not installed or not on PATH");
        }
        if (!std::filesystem::exists(options_.proxychains_config)) {
            throw StartFailure("proxychains config not found: " + options_.proxychains_config);
        }

        std::ifstream conf(options_.proxychains_config);
        std::string content((std::istreambuf_iterator<char>(conf)), std::istreambuf_iterator<char>());
        if (content.find(options_.proxy_port_hint) == std::string::npos) {
            spdlog::warn("{} does not mention proxy port {}",
                         options_.proxychains_config, options_.proxy_port_hint);
        }

        argv.push_back(options_.proxychains_command);
    }

    argv.push_back(spec.command);
    argv.insert(argv.end(), spec.args.begin(), spec.args.end());
    return argv;
}

std::shared_ptr<ManagedProcess> ProcessSupervisor::start(const ServerLaunchSpec& spec,
                                                         const EnvironmentOverrides& overrides) {
    if (spec.command.empty()) {
        throw StartFailure("Server '" + spec.name + "' has no command");
    }

    auto args = build_command_line(spec);
    auto env = build_environment(spec, overrides);

    if (!spec.env.empty()) {
        std::vector<std::string> keys;
        for (const auto& kv : spec.env) {
            keys.push_back(kv.first);
        }
        spdlog::info("Server '{}' environment from config: {}", spec.name, join_command(keys));
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> env_strings;
    env_strings.reserve(env.size());
    for (const auto& [key, value] : env) {
        env_strings.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    PipePair in_pipe, out_pipe, err_pipe, exec_pipe;
    if (!open_pipe(in_pipe) || !open_pipe(out_pipe) || !open_pipe(err_pipe) || !open_pipe(exec_pipe)) {
        int err = errno;
        in_pipe.close_all();
        out_pipe.close_all();
        err_pipe.close_all();
        exec_pipe.close_all();
        throw StartFailure(std::string("pipe() failed: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        in_pipe.close_all();
        out_pipe.close_all();
        err_pipe.close_all();
        exec_pipe.close_all();
        throw StartFailure(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Own process group so stop() can signal launcher and descendants
        ::setpgid(0, 0);
        std::signal(SIGPIPE, SIG_DFL);

        ::dup2(in_pipe.read_end, STDIN_FILENO);
        ::dup2(out_pipe.write_end, STDOUT_FILENO);
        ::dup2(err_pipe.write_end, STDERR_FILENO);

        environ = envp.data();
        ::execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe.write_end, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // parent
    ::setpgid(pid, pid);
    ::close(in_pipe.read_end);
    ::close(out_pipe.write_end);
    ::close(err_pipe.write_end);
    ::close(exec_pipe.write_end);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.read_end, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe.read_end);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        ::close(in_pipe.write_end);
        ::close(out_pipe.read_end);
        ::close(err_pipe.read_end);
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw StartFailure("Failed to execute '" + args.front() + "': " + std::strerror(exec_errno));
    }

    auto mechanism = ReadinessClassifier::detect_mechanism(spec.command, spec.args);

    spdlog::info("Started server '{}' (pid {}, {} launch): {}",
                 spec.name, pid, ReadinessClassifier::to_string(mechanism), join_command(args));

    return std::make_shared<ManagedProcess>(
        pid,
        spec.name,
        mechanism,
        FileDescriptor(in_pipe.write_end),
        FileDescriptor(out_pipe.read_end),
        FileDescriptor(err_pipe.read_end)
    );
}

ReadinessReport ProcessSupervisor::await_ready(ManagedProcess& process, std::chrono::milliseconds timeout) {
    ReadinessReport report;
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + timeout;
    auto next_progress = start + std::chrono::seconds(10);

    // Returns true once a line settles the outcome
    auto scan = [&](LineReader& reader, std::string& captured, const char* stream_name) {
        std::string line;
        while (reader.read_line(line, std::chrono::milliseconds(0)) == ReadStatus::Line) {
            captured += line;
            captured += '\n';

            auto verdict = ReadinessClassifier::classify(line, process.mechanism());
            if (verdict == ReadinessVerdict::READY) {
                spdlog::info("Server '{}' appears to be ready (from {})", process.name(), stream_name);
                report.outcome = ReadinessOutcome::READY;
                report.matched_line = line;
                return true;
            }
            if (verdict == ReadinessVerdict::FAILED) {
                spdlog::error("Server '{}' error detected (from {}): {}", process.name(), stream_name, line);
                report.outcome = ReadinessOutcome::ERROR_DETECTED;
                report.matched_line = line;
                return true;
            }
            spdlog::debug("[{} {}] {}", process.name(), stream_name, line);
        }
        return false;
    };

    while (std::chrono::steady_clock::now() < deadline) {
        if (!process.is_alive()) {
            report.stdout_text += process.stdout_reader().drain();
            report.stderr_text += process.stderr_reader().drain();
            report.exit_code = process.exit_code();
            report.outcome = ReadinessOutcome::PROCESS_EXITED;
            process.set_state(ProcessState::EXITED);

            spdlog::error("Server '{}' exited during startup (exit code {})", process.name(),
                          report.exit_code ? std::to_string(*report.exit_code) : "unknown");
            if (!report.stdout_text.empty()) {
                spdlog::error("STDOUT: {}", report.stdout_text);
            }
            if (!report.stderr_text.empty()) {
                spdlog::error("STDERR: {}", report.stderr_text);
            }
            return report;
        }

        if (scan(process.stderr_reader(), report.stderr_text, "stderr") ||
            scan(process.stdout_reader(), report.stdout_text, "stdout")) {
            if (report.outcome == ReadinessOutcome::READY) {
                process.set_state(ProcessState::READY);
                process.start_stderr_drain();
            } else {
                process.set_state(ProcessState::FAILED);
            }
            return report;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= next_progress) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start).count();
            spdlog::info("Still waiting for '{}'... ({}s elapsed)", process.name(), elapsed);
            next_progress += std::chrono::seconds(10);
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(options_.poll_interval, std::max(remaining, std::chrono::milliseconds(0))));
    }

    report.timed_out = true;
    spdlog::warn("Timeout reached after {} ms waiting for '{}'", timeout.count(), process.name());

    if (!process.is_alive()) {
        report.outcome = ReadinessOutcome::PROCESS_EXITED;
        report.exit_code = process.exit_code();
        report.stdout_text += process.stdout_reader().drain();
        report.stderr_text += process.stderr_reader().drain();
        spdlog::error("Server '{}' exited during startup", process.name());
        return report;
    }

    if (!options_.optimistic_on_timeout) {
        report.outcome = ReadinessOutcome::READINESS_TIMEOUT;
        return report;
    }

    spdlog::warn("Process is still running but no ready indicator detected, proceeding anyway");
    report.outcome = ReadinessOutcome::READY;
    process.set_state(ProcessState::READY);
    process.start_stderr_drain();
    return report;
}

void ProcessSupervisor::stop(ManagedProcess& process) {
    if (process.released()) {
        spdlog::debug("Process {} already stopped", process.pid());
        return;
    }

    spdlog::info("Stopping server '{}' (pid {})", process.name(), process.pid());
    process.terminate(options_.termination_grace);
}

} // namespace mcp_relay
