#include "core/Errors.hpp"
#include "core/ProcessSupervisor.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <atomic>
#include <cstdlib>
#include <thread>

using namespace mcp_relay;
using namespace std::chrono_literals;

class ProcessSupervisorTest : public ::testing::Test {
protected:
    ProcessSupervisorTest() : supervisor(make_options()) {}

    static SupervisorOptions make_options() {
        SupervisorOptions options;
        options.poll_interval = 20ms;
        options.termination_grace = 1000ms;
        return options;
    }

    static ServerLaunchSpec stub(std::vector<std::string> args) {
        return {"stub", STUB_CHILD_PATH, std::move(args), {}};
    }

    void TearDown() override {
        if (process) {
            supervisor.stop(*process);
        }
    }

    ProcessSupervisor supervisor;
    std::shared_ptr<ManagedProcess> process;
};

TEST_F(ProcessSupervisorTest, ReadyBannerIsDetected) {
    process = supervisor.start(stub({"--banner", "Stub MCP server running on stdio"}));
    ASSERT_NE(process, nullptr);
    EXPECT_GT(process->pid(), 0);
    EXPECT_EQ(process->state(), ProcessState::STARTING);

    auto report = supervisor.await_ready(*process, 5000ms);

    EXPECT_TRUE(report.ok());
    EXPECT_FALSE(report.timed_out);
    EXPECT_EQ(report.matched_line, "Stub MCP server running on stdio");
    EXPECT_EQ(process->state(), ProcessState::READY);
}

TEST_F(ProcessSupervisorTest, ErrorBannerFailsBeforeTimeout) {
    process = supervisor.start(stub({"--banner", "Error: invalid token"}));

    auto begin = std::chrono::steady_clock::now();
    auto report = supervisor.await_ready(*process, 10000ms);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.outcome, ReadinessOutcome::ERROR_DETECTED);
    EXPECT_FALSE(report.timed_out);
    EXPECT_LT(elapsed, 5000ms);
}

TEST_F(ProcessSupervisorTest, EarlyExitIsReported) {
    process = supervisor.start(stub({"--exit-code", "3"}));

    auto report = supervisor.await_ready(*process, 5000ms);

    EXPECT_EQ(report.outcome, ReadinessOutcome::PROCESS_EXITED);
    ASSERT_TRUE(report.exit_code.has_value());
    EXPECT_EQ(*report.exit_code, 3);
    EXPECT_FALSE(process->is_alive());
}

TEST_F(ProcessSupervisorTest, SilentChildIsReadyAfterTimeout) {
    process = supervisor.start(stub({}));

    auto report = supervisor.await_ready(*process, 300ms);

    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.timed_out);
    EXPECT_TRUE(process->is_alive());
}

TEST_F(ProcessSupervisorTest, SilentChildTimesOutWhenNotOptimistic) {
    SupervisorOptions options = make_options();
    options.optimistic_on_timeout = false;
    ProcessSupervisor strict(options);

    process = strict.start(stub({}));
    auto report = strict.await_ready(*process, 300ms);

    EXPECT_EQ(report.outcome, ReadinessOutcome::READINESS_TIMEOUT);
    EXPECT_TRUE(report.timed_out);
}

TEST_F(ProcessSupervisorTest, MissingExecutableThrows) {
    ServerLaunchSpec spec{"missing", "/nonexistent/mcp-server-binary", {}, {}};
    EXPECT_THROW(supervisor.start(spec), StartFailure);
}

TEST_F(ProcessSupervisorTest, EmptyCommandThrows) {
    ServerLaunchSpec spec{"empty", "", {}, {}};
    EXPECT_THROW(supervisor.start(spec), StartFailure);
}

TEST_F(ProcessSupervisorTest, StopIsIdempotent) {
    process = supervisor.start(stub({}));
    ASSERT_TRUE(process->is_alive());

    supervisor.stop(*process);
    EXPECT_TRUE(process->released());
    EXPECT_FALSE(process->is_alive());
    EXPECT_FALSE(process->has_open_pipes());

    EXPECT_NO_THROW(supervisor.stop(*process));
    EXPECT_FALSE(process->terminate(0ms));
}

TEST_F(ProcessSupervisorTest, OpenPipesFollowRelease) {
    process = supervisor.start(stub({}));
    EXPECT_TRUE(process->has_open_pipes());

    // Polled from another thread while stop() closes the descriptors
    std::atomic<bool> done{false};
    std::atomic<bool> saw_closed{false};
    std::thread watcher([&] {
        while (!done.load()) {
            if (!process->has_open_pipes()) {
                saw_closed.store(true);
            }
        }
    });

    supervisor.stop(*process);
    std::this_thread::sleep_for(20ms);
    done.store(true);
    watcher.join();

    EXPECT_FALSE(process->has_open_pipes());
    EXPECT_TRUE(saw_closed.load());
}

TEST_F(ProcessSupervisorTest, StopWhileDrainingStderr) {
    process = supervisor.start(stub({"--banner", "Stub MCP server running on stdio"}));
    ASSERT_TRUE(supervisor.await_ready(*process, 5000ms).ok());

    process->start_stderr_drain();
    supervisor.stop(*process);

    EXPECT_TRUE(process->released());
    EXPECT_NO_THROW(process->start_stderr_drain());
}

TEST_F(ProcessSupervisorTest, RequestIdsStartAtOne) {
    process = supervisor.start(stub({}));
    EXPECT_EQ(process->next_request_id(), 1);
    EXPECT_EQ(process->next_request_id(), 2);
    EXPECT_EQ(process->next_request_id(), 3);
}

TEST(ProcessSupervisorEnvironmentTest, LaterLayersWin) {
    ::setenv("MCP_RELAY_TEST_VAR", "from-parent", 1);

    ServerLaunchSpec spec{"env", "true", {}, {{"MCP_RELAY_TEST_VAR", "from-spec"}, {"ONLY_SPEC", "1"}}};
    auto env = ProcessSupervisor::build_environment(spec, {{"ONLY_SPEC", "2"}});

    EXPECT_EQ(env["MCP_RELAY_TEST_VAR"], "from-spec");
    EXPECT_EQ(env["ONLY_SPEC"], "2");

    ::unsetenv("MCP_RELAY_TEST_VAR");
}

TEST(ProcessSupervisorEnvironmentTest, TlsBypassVariables) {
    auto env = ProcessSupervisor::tls_bypass_environment();
    EXPECT_EQ(env.at("NODE_TLS_REJECT_UNAUTHORIZED"), "0");
    EXPECT_EQ(env.at("PYTHONHTTPSVERIFY"), "0");
    EXPECT_EQ(env.at("REQUESTS_CA_BUNDLE"), "");
    EXPECT_EQ(env.at("SSL_CERT_FILE"), "");
    EXPECT_EQ(env.at("CURL_CA_BUNDLE"), "");
}

TEST(ProcessSupervisorEnvironmentTest, MissingProxychainsNamesCommand) {
    SupervisorOptions options;
    options.use_proxychains = true;
    options.proxychains_command = "mcp-relay-no-such-proxychains";
    ProcessSupervisor supervisor(options);

    ServerLaunchSpec spec{"wrapped", STUB_CHILD_PATH, {}, {}};
    try {
        supervisor.start(spec);
        FAIL() << "Expected StartFailure";
    } catch (const StartFailure& e) {
        EXPECT_NE(std::string(e.what()).find("mcp-relay-no-such-proxychains"), std::string::npos);
    }
}

TEST(ProcessSupervisorEnvironmentTest, DefaultProxychainsCommand) {
    EXPECT_EQ(SupervisorOptions().proxychains_command, "proxychains");
}

TEST(ProcessSupervisorEnvironmentTest, ProxychainsRequiresConfig) {
    SupervisorOptions options;
    options.use_proxychains = true;
    options.proxychains_config = "/nonexistent/proxychains.conf";
    ProcessSupervisor supervisor(options);

    ServerLaunchSpec spec{"wrapped", STUB_CHILD_PATH, {}, {}};
    EXPECT_THROW(supervisor.start(spec), StartFailure);
}
