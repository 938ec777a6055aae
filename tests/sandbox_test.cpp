#include <gtest/gtest.h>
#include <filesystem>
#include <thread>
#include "runtime/sandbox.hpp"
#include "test_utils.hpp"

using namespace codeloop::runtime;
using codeloop::test::host_sandbox_config;

namespace {

constexpr std::chrono::milliseconds RUN_TIMEOUT{5000};

class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string error;
        sandbox_ = manager_.acquire(host_sandbox_config(), error);
        ASSERT_NE(sandbox_, nullptr) << error;
    }

    ExecutionResult run(const std::string& code, std::chrono::milliseconds timeout = RUN_TIMEOUT) {
        return manager_.run(sandbox_, code, timeout, CancelToken());
    }

    SandboxManager manager_;
    std::shared_ptr<Sandbox> sandbox_;
};

}

TEST_F(SandboxTest, CapturesStdoutAndExitCode) {
    ExecutionResult result = run("echo bash-ok\n");
    EXPECT_EQ(result.outcome, ExecOutcome::EXITED);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "bash-ok\n");
    EXPECT_EQ(result.stderr_text, "");
    EXPECT_EQ(result.sandbox_id, sandbox_->id());
    EXPECT_TRUE(result.succeeded());
}

TEST_F(SandboxTest, ReportsNonZeroExit) {
    ExecutionResult result = run("exit 3\n");
    EXPECT_EQ(result.outcome, ExecOutcome::EXITED);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.succeeded());
}

TEST_F(SandboxTest, CapturesStderrSeparately) {
    ExecutionResult result = run("echo out\necho err >&2\nexit 1\n");
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(SandboxTest, RunsInsideItsWorkingDirectory) {
    ExecutionResult result = run("pwd\n");
    EXPECT_EQ(result.stdout_text, sandbox_->workdir() + "\n");
    EXPECT_TRUE(std::filesystem::is_directory(sandbox_->workdir()));
}

TEST_F(SandboxTest, TimeoutKillsTheProcess) {
    auto start = std::chrono::steady_clock::now();
    ExecutionResult result = run("sleep 5\n", std::chrono::milliseconds(300));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.outcome, ExecOutcome::TIMEOUT);
    EXPECT_EQ(result.exit_code, EXIT_TIMEOUT);
    EXPECT_NE(result.error.find("timeout"), std::string::npos);
    EXPECT_NE(result.stderr_text.find("timed out after 300 ms"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST_F(SandboxTest, OutputCapKillsTheProcess) {
    manager_.release(sandbox_);

    SandboxConfig config = host_sandbox_config();
    config.limits.max_output_bytes = 4096;
    std::string error;
    sandbox_ = manager_.acquire(config, error);
    ASSERT_NE(sandbox_, nullptr) << error;

    ExecutionResult result = run("while true; do echo yyyyyyyyyyyyyyyyyyyyyyyyyyyyyyyy; done\n");
    EXPECT_EQ(result.outcome, ExecOutcome::RESOURCE_EXCEEDED);
    EXPECT_EQ(result.exit_code, EXIT_RESOURCE_KILL);
    EXPECT_LE(result.stdout_text.size(), 4096u);
}

TEST_F(SandboxTest, CancelFromAnotherThread) {
    CancelToken cancel;
    std::thread canceller([cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });

    ExecutionResult result = manager_.run(sandbox_, "sleep 5\n", RUN_TIMEOUT, cancel);
    canceller.join();
    EXPECT_EQ(result.outcome, ExecOutcome::CANCELLED);
}

TEST_F(SandboxTest, WorkspacePersistsBetweenRuns) {
    ASSERT_TRUE(run("echo 42 > state.txt\n").succeeded());
    ExecutionResult result = run("cat state.txt\n");
    EXPECT_EQ(result.stdout_text, "42\n");
}

TEST_F(SandboxTest, ReleaseIsIdempotent) {
    std::string workdir = sandbox_->workdir();
    EXPECT_EQ(manager_.active_count(), 1u);

    manager_.release(sandbox_);
    EXPECT_TRUE(sandbox_->is_terminated());
    EXPECT_EQ(manager_.active_count(), 0u);
    EXPECT_FALSE(std::filesystem::exists(workdir));

    manager_.release(sandbox_);
    EXPECT_EQ(manager_.active_count(), 0u);
}

TEST_F(SandboxTest, RunAfterReleaseIsAnInternalError) {
    manager_.release(sandbox_);
    ExecutionResult result = run("echo never\n");
    EXPECT_EQ(result.outcome, ExecOutcome::INTERNAL_ERROR);
    EXPECT_EQ(result.stdout_text, "");
}

TEST_F(SandboxTest, ManagerTracksSandboxes) {
    EXPECT_EQ(manager_.get_sandbox(sandbox_->id()), sandbox_);
    EXPECT_EQ(manager_.get_sandbox("sb-missing"), nullptr);
    EXPECT_EQ(manager_.acquired_total(), 1u);
    EXPECT_EQ(sandbox_->state(), SandboxState::IDLE);
}

TEST(SandboxManager, MissingImageFailsProvisioning) {
    SandboxManager manager;
    SandboxConfig config = host_sandbox_config();
    config.image = "does-not-exist";

    std::string error;
    EXPECT_EQ(manager.acquire(config, error), nullptr);
    EXPECT_NE(error.find("does-not-exist"), std::string::npos);
    EXPECT_EQ(manager.active_count(), 0u);
    EXPECT_EQ(manager.acquired_total(), 0u);
}

TEST(SandboxManager, ImagePathResolution) {
    EXPECT_EQ(SandboxManager::image_path("/images", HOST_IMAGE), "");
    EXPECT_EQ(SandboxManager::image_path("/images", "alpine-latest"), "/images/alpine-latest");
    EXPECT_EQ(SandboxManager::image_path("/images", "/opt/rootfs"), "/opt/rootfs");
    EXPECT_TRUE(SandboxManager::image_available("/nonexistent", HOST_IMAGE));
    EXPECT_FALSE(SandboxManager::image_available("/nonexistent", "alpine-latest"));
}

TEST(SandboxManager, CleanupAllReleasesEverything) {
    SandboxManager manager;
    std::string error;
    auto a = manager.acquire(host_sandbox_config(), error);
    auto b = manager.acquire(host_sandbox_config(), error);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a->id(), b->id());

    manager.cleanup_all();
    EXPECT_EQ(manager.active_count(), 0u);
    EXPECT_TRUE(a->is_terminated());
    EXPECT_TRUE(b->is_terminated());
}

TEST(ExecutionResult, JsonShape) {
    ExecutionResult result = ExecutionResult::failure(ExecOutcome::NOT_SUPPORTED, "language 'cobol' is not supported");
    auto j = result.to_json();
    EXPECT_EQ(j["outcome"], "not_supported");
    EXPECT_EQ(j["exit_code"], EXIT_NOT_RUN);
    EXPECT_EQ(j["error"], "language 'cobol' is not supported");
}

TEST(ResourceLimits, FromJsonFillsMissingFieldsWithDefaults) {
    ResourceLimits limits = ResourceLimits::from_json({{"max_pids", 16}, {"max_output_bytes", 4096}});
    EXPECT_EQ(limits.max_pids, 16u);
    EXPECT_EQ(limits.max_output_bytes, 4096u);
    EXPECT_EQ(limits.memory_limit_bytes, ResourceLimits().memory_limit_bytes);

    ResourceLimits base;
    base.memory_limit_bytes = 64 * 1024 * 1024;
    ResourceLimits layered = ResourceLimits::from_json({{"max_pids", 8}}, base);
    EXPECT_EQ(layered.memory_limit_bytes, base.memory_limit_bytes);
    EXPECT_EQ(layered.max_pids, 8u);

    EXPECT_EQ(ResourceLimits::from_json(nlohmann::json("not-an-object")).max_pids, ResourceLimits().max_pids);
}
