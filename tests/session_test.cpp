#include <gtest/gtest.h>
#include <thread>
#include "runtime/session.hpp"
#include "runtime/execution_service.hpp"
#include "test_utils.hpp"

using namespace codeloop::runtime;
using codeloop::test::host_shell_adapter;
using codeloop::test::test_session_options;

namespace {

constexpr std::chrono::milliseconds RUN_TIMEOUT{5000};

class SessionTest : public ::testing::Test {
protected:
    SandboxManager sandboxes_;
    SessionManager sessions_{sandboxes_, test_session_options()};

    ExecutionResult run(const std::string& session, const LanguageAdapter& adapter, const std::string& code) {
        return sessions_.execute(session, adapter, code, RUN_TIMEOUT, CancelToken());
    }
};

}

TEST_F(SessionTest, ReusedWorkspaceKeepsFilesAndSandbox) {
    LanguageAdapter adapter = host_shell_adapter(true);

    ExecutionResult first = run("s1", adapter, "echo remembered > note.txt\n");
    ASSERT_TRUE(first.succeeded()) << first.stderr_text << first.error;
    ExecutionResult second = run("s1", adapter, "cat note.txt\n");
    ASSERT_TRUE(second.succeeded()) << second.stderr_text << second.error;

    EXPECT_EQ(second.stdout_text, "remembered\n");
    EXPECT_EQ(first.sandbox_id, second.sandbox_id);
    EXPECT_EQ(sandboxes_.active_count(), 1u);
    EXPECT_EQ(sessions_.step_count("s1"), 2u);
}

TEST_F(SessionTest, FreshWorkspaceForEveryRunWithoutReuse) {
    LanguageAdapter adapter = host_shell_adapter(false);

    ExecutionResult first = run("s1", adapter, "echo gone > note.txt\n");
    ASSERT_TRUE(first.succeeded());
    EXPECT_EQ(sandboxes_.active_count(), 0u);

    ExecutionResult second = run("s1", adapter, "cat note.txt\n");
    EXPECT_EQ(second.outcome, ExecOutcome::EXITED);
    EXPECT_NE(second.exit_code, 0);
    EXPECT_NE(first.sandbox_id, second.sandbox_id);
    EXPECT_EQ(sandboxes_.acquired_total(), 2u);
}

TEST_F(SessionTest, SessionsDoNotShareWorkspaces) {
    LanguageAdapter adapter = host_shell_adapter(true);

    ASSERT_TRUE(run("a", adapter, "echo mine > note.txt\n").succeeded());
    ExecutionResult other = run("b", adapter, "cat note.txt\n");
    EXPECT_NE(other.exit_code, 0);
    EXPECT_EQ(sessions_.session_count(), 2u);
    EXPECT_EQ(sandboxes_.active_count(), 2u);
}

TEST_F(SessionTest, ExecutionsWithinASessionAreSerialized) {
    LanguageAdapter adapter = host_shell_adapter(true);

    auto start = std::chrono::steady_clock::now();
    std::thread other([&] { run("serial", adapter, "sleep 0.3\n"); });
    run("serial", adapter, "sleep 0.3\n");
    other.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(600));
    EXPECT_EQ(sessions_.step_count("serial"), 2u);
    EXPECT_EQ(sandboxes_.active_count(), 1u);
}

TEST_F(SessionTest, SwitchingLanguageDropsWarmSandbox) {
    LanguageAdapter bash = host_shell_adapter(true);
    LanguageAdapter other = host_shell_adapter(true);
    other.name = "posix-sh";

    ExecutionResult first = run("s1", bash, "true\n");
    ExecutionResult second = run("s1", other, "true\n");
    EXPECT_NE(first.sandbox_id, second.sandbox_id);
    EXPECT_EQ(sandboxes_.active_count(), 1u);
}

TEST_F(SessionTest, CloseReleasesSandbox) {
    LanguageAdapter adapter = host_shell_adapter(true);
    ASSERT_TRUE(run("s1", adapter, "true\n").succeeded());
    EXPECT_TRUE(sessions_.has_session("s1"));

    EXPECT_TRUE(sessions_.close("s1"));
    EXPECT_FALSE(sessions_.has_session("s1"));
    EXPECT_EQ(sandboxes_.active_count(), 0u);
    EXPECT_FALSE(sessions_.close("s1"));
    EXPECT_FALSE(sessions_.close("never-seen"));
}

TEST_F(SessionTest, CloseDuringExecutionIsDeferred) {
    LanguageAdapter adapter = host_shell_adapter(true);
    ExecutionResult result;
    std::thread runner([&] { result = run("busy", adapter, "sleep 0.3\necho done\n"); });

    // Wait until the session exists
    for (int i = 0; i < 200 && !sessions_.has_session("busy"); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(sessions_.close("busy"));
    runner.join();

    EXPECT_EQ(result.stdout_text, "done\n");
    EXPECT_FALSE(sessions_.has_session("busy"));
    EXPECT_EQ(sandboxes_.active_count(), 0u);
}

TEST_F(SessionTest, ProvisioningErrorForMissingImage) {
    LanguageAdapter adapter = host_shell_adapter();
    adapter.image = "not-installed";

    ExecutionResult result = run("s1", adapter, "true\n");
    EXPECT_EQ(result.outcome, ExecOutcome::PROVISIONING_ERROR);
    EXPECT_NE(result.error.find("not-installed"), std::string::npos);
}

TEST(SessionReaper, ReapIdleDropsIdleSessions) {
    SandboxManager sandboxes;
    SessionOptions options = test_session_options();
    options.idle_timeout = std::chrono::milliseconds(0);
    SessionManager sessions(sandboxes, options);

    LanguageAdapter adapter = host_shell_adapter(true);
    sessions.execute("a", adapter, "true\n", RUN_TIMEOUT, CancelToken());
    sessions.execute("b", host_shell_adapter(false), "true\n", RUN_TIMEOUT, CancelToken());
    EXPECT_EQ(sessions.session_count(), 2u);

    EXPECT_EQ(sessions.reap_idle(), 2u);
    EXPECT_EQ(sessions.session_count(), 0u);
    EXPECT_EQ(sandboxes.active_count(), 0u);
}

TEST(SessionReaper, BackgroundReaperRuns) {
    SandboxManager sandboxes;
    SessionOptions options = test_session_options();
    options.idle_timeout = std::chrono::milliseconds(50);
    options.reap_interval = std::chrono::milliseconds(20);
    SessionManager sessions(sandboxes, options);

    sessions.execute("a", host_shell_adapter(true), "true\n", RUN_TIMEOUT, CancelToken());
    sessions.start_reaper();

    for (int i = 0; i < 200 && sessions.session_count() > 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    sessions.stop_reaper();
    EXPECT_EQ(sessions.session_count(), 0u);
    EXPECT_EQ(sandboxes.active_count(), 0u);
}

// ============================================================================
// Execution service
// ============================================================================

class ExecutionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(registry_.register_adapter(host_shell_adapter()));
        registry_.freeze();
        service_ = std::make_unique<ExecutionService>(registry_, test_session_options(),
                                                      std::chrono::milliseconds(2000));
    }

    ExecutionRequest request(const std::string& language, const std::string& code) {
        ExecutionRequest req;
        req.language = language;
        req.code = code;
        return req;
    }

    LanguageRegistry registry_;
    std::unique_ptr<ExecutionService> service_;
};

TEST_F(ExecutionServiceTest, UnknownLanguageTouchesNoSandbox) {
    ExecutionResult result = service_->execute(request("cobol", "DISPLAY 'HI'."), CancelToken());
    EXPECT_EQ(result.outcome, ExecOutcome::NOT_SUPPORTED);
    EXPECT_EQ(result.exit_code, EXIT_NOT_RUN);
    EXPECT_EQ(service_->sandboxes().acquired_total(), 0u);
    EXPECT_EQ(service_->sessions().session_count(), 0u);
}

TEST_F(ExecutionServiceTest, ResolvesAliasesCaseInsensitively) {
    ExecutionResult result = service_->execute(request(" SH ", "echo via-alias\n"), CancelToken());
    EXPECT_TRUE(result.succeeded()) << result.error;
    EXPECT_EQ(result.stdout_text, "via-alias\n");
    EXPECT_TRUE(service_->sessions().has_session(DEFAULT_SESSION_ID));
}

TEST_F(ExecutionServiceTest, TimeoutIsClampedToMaximum) {
    const LanguageAdapter* adapter = registry_.resolve("bash");
    ASSERT_NE(adapter, nullptr);

    ExecutionRequest req = request("bash", "true\n");
    EXPECT_EQ(service_->effective_timeout(req, *adapter), std::chrono::milliseconds(2000));

    req.timeout = std::chrono::milliseconds(500);
    EXPECT_EQ(service_->effective_timeout(req, *adapter), std::chrono::milliseconds(500));

    req.timeout = std::chrono::milliseconds(90000);
    EXPECT_EQ(service_->effective_timeout(req, *adapter), std::chrono::milliseconds(2000));
}

TEST_F(ExecutionServiceTest, RequestTimeoutIsEnforced) {
    ExecutionRequest req = request("bash", "sleep 5\n");
    req.timeout = std::chrono::milliseconds(200);

    ExecutionResult result = service_->execute(req, CancelToken());
    EXPECT_EQ(result.outcome, ExecOutcome::TIMEOUT);
    EXPECT_EQ(result.exit_code, EXIT_TIMEOUT);
}

TEST_F(ExecutionServiceTest, CancelledBeforeStart) {
    CancelToken cancel;
    cancel.cancel();
    ExecutionResult result = service_->execute(request("bash", "echo never\n"), cancel);
    EXPECT_EQ(result.outcome, ExecOutcome::CANCELLED);
    EXPECT_EQ(service_->sandboxes().acquired_total(), 0u);
}

TEST(ExecutionServicePython, RunsPythonOnHost) {
    if (!codeloop::test::has_program("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    LanguageRegistry registry;
    LanguageAdapter python;
    python.name = "python";
    python.image = HOST_IMAGE;
    python.command = {"python3", "-u", "{file}"};
    python.file_suffix = ".py";
    ASSERT_TRUE(registry.register_adapter(python));
    registry.freeze();

    ExecutionService service(registry, test_session_options());
    ExecutionRequest req;
    req.code = "import sys\nprint('py-ok')\nsys.exit(5)\n";

    ExecutionResult result = service.execute(req, CancelToken());
    EXPECT_EQ(result.outcome, ExecOutcome::EXITED);
    EXPECT_EQ(result.exit_code, 5);
    EXPECT_EQ(result.stdout_text, "py-ok\n");
}
