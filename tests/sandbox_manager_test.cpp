/**
 * @file sandbox_manager_test.cpp
 * @brief 沙箱管理器测试：容器生命周期、退出分类与故障注入
 */

#include <gtest/gtest.h>
#include <csignal>
#include <chrono>
#include <memory>

#include "sandbox/sandbox_manager.h"
#include "sandbox/sweeper.h"
#include "fake_runtime.h"

using namespace sciv;
using namespace sciv::sandbox;
using sciv::fake::FakeBehavior;
using sciv::fake::FakeRuntime;
using sciv::fake::FakeStage;

class SandboxManagerTest : public ::testing::Test {
protected:
    FakeRuntime runtime;
    std::unique_ptr<SandboxManager> manager;

    void SetUp() override {
        default_logger().set_level(LogLevel::OFF);
        SandboxManagerOptions opts;
        opts.teardown_grace_ms = 300;
        opts.remove_backoff_ms = 1;
        manager = std::make_unique<SandboxManager>(runtime, opts);
    }

    void TearDown() override {
        default_logger().set_level(LogLevel::INFO);
    }

    static ExecutionSpec spec(int timeout_sec = 5) {
        ExecutionSpec s;
        s.job_id = "job-sb";
        s.image = "phiacta-verify-runner-python:latest";
        s.command = {"python", "/code/run.py"};
        s.code_files["run.py"] = "print(42)\n";
        s.limits.timeout_sec = timeout_sec;
        s.limits.memory_mb = 512;
        return s;
    }
};

TEST_F(SandboxManagerTest, SuccessfulRun) {
    runtime.responder = [](const ExecutionSpec&) {
        FakeBehavior b = FakeBehavior::ok("42\n");
        b.files["result.json"] = "[1, 2]";
        b.peak_memory_kb = 12000;
        return b;
    };
    auto r = manager->execute(spec());
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, ExitStatus::SUCCESS);
    EXPECT_EQ(r.value().exit_code, 0);
    EXPECT_EQ(r.value().stdout_text, "42\n");
    EXPECT_EQ(r.value().output_files.at("result.json"), "[1, 2]");
    EXPECT_EQ(*r.value().peak_memory_kb, 12000);
    EXPECT_EQ(r.value().image, "phiacta-verify-runner-python:latest");
    EXPECT_EQ(runtime.live(), 0u);
    EXPECT_EQ(runtime.created(), 1u);
    EXPECT_EQ(manager->executions(), 1u);
}

TEST_F(SandboxManagerTest, NonZeroExit) {
    runtime.responder = [](const ExecutionSpec&) { return FakeBehavior::fail(3, "boom"); };
    auto r = manager->execute(spec());
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().status, ExitStatus::NON_ZERO);
    EXPECT_EQ(r.value().exit_code, 3);
    EXPECT_EQ(r.value().stderr_text, "boom");
    EXPECT_EQ(runtime.live(), 0u);
}

TEST_F(SandboxManagerTest, EnvironmentIsSanitized) {
    ExecutionSpec s = spec();
    s.env = {{"LD_PRELOAD", "/tmp/evil.so"}, {"LD_AUDIT", "x"}, {"PATH", "/tmp"},
             {"PYTHONPATH", "/tmp"}, {"MPLBACKEND", "Agg"}};
    ASSERT_TRUE(manager->execute(s).ok());

    const auto &env = runtime.last_spec.env;
    EXPECT_EQ(env.count("LD_PRELOAD"), 0u);
    EXPECT_EQ(env.count("LD_AUDIT"), 0u);
    EXPECT_EQ(env.count("PYTHONPATH"), 0u);
    EXPECT_EQ(env.at("PATH"), CONTAINER_PATH);
    EXPECT_EQ(env.at("HOME"), "/tmp");
    EXPECT_EQ(env.at("MPLBACKEND"), "Agg");
    EXPECT_TRUE(runtime.last_spec.policy.network_disabled);
}

TEST_F(SandboxManagerTest, WatchdogEnforcesTimeout) {
    runtime.responder = [](const ExecutionSpec&) {
        FakeBehavior b;
        b.hang = true;
        return b;
    };
    auto started = std::chrono::steady_clock::now();
    auto r = manager->execute(spec(1));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, ExitStatus::TIMEOUT);
    EXPECT_EQ(r.value().term_signal, SIGKILL);
    EXPECT_GE(elapsed, 1000);
    EXPECT_LT(elapsed, 1000 + 300 + 1000);
    EXPECT_EQ(runtime.live(), 0u);
}

TEST_F(SandboxManagerTest, ResourceClassification) {
    runtime.responder = [](const ExecutionSpec&) {
        FakeBehavior b;
        b.exit_code = -1;
        b.term_signal = SIGKILL;
        b.oom_killed = true;
        return b;
    };
    auto oom = manager->execute(spec());
    ASSERT_TRUE(oom.ok());
    EXPECT_EQ(oom.value().status, ExitStatus::RESOURCE_KILLED);

    runtime.responder = [](const ExecutionSpec&) {
        FakeBehavior b;
        b.term_signal = SIGXCPU;
        return b;
    };
    auto cpu = manager->execute(spec());
    ASSERT_TRUE(cpu.ok());
    EXPECT_EQ(cpu.value().status, ExitStatus::TIMEOUT);

    runtime.responder = [](const ExecutionSpec&) {
        FakeBehavior b;
        b.term_signal = SIGXFSZ;
        return b;
    };
    auto fsz = manager->execute(spec());
    ASSERT_TRUE(fsz.ok());
    EXPECT_EQ(fsz.value().status, ExitStatus::RESOURCE_KILLED);

    runtime.responder = [](const ExecutionSpec&) {
        FakeBehavior b;
        b.term_signal = SIGSEGV;
        return b;
    };
    auto segv = manager->execute(spec());
    ASSERT_TRUE(segv.ok());
    EXPECT_EQ(segv.value().status, ExitStatus::NON_ZERO);
    EXPECT_EQ(runtime.live(), 0u);
}

TEST_F(SandboxManagerTest, MissingImageIsNeverCreated) {
    runtime.images.clear();
    auto r = manager->execute(spec());
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().status, ExitStatus::IMAGE_MISSING);
    EXPECT_EQ(runtime.created(), 0u);
}

TEST_F(SandboxManagerTest, RuntimeFailuresAreErrorsWithoutLeaks) {
    for (FakeStage stage : {FakeStage::CREATE, FakeStage::START, FakeStage::WAIT,
                            FakeStage::COLLECT}) {
        runtime.inject(stage, 1);
        auto r = manager->execute(spec());
        ASSERT_TRUE(r.is_error()) << "stage " << static_cast<int>(stage);
        EXPECT_EQ(r.error().code(), ErrorCode::RUNTIME_UNAVAILABLE);
        EXPECT_TRUE(is_transient(r.error().code()));
        EXPECT_EQ(runtime.live(), 0u) << "stage " << static_cast<int>(stage);
    }
}

TEST_F(SandboxManagerTest, TransientRemoveFailureIsRetried) {
    runtime.inject(FakeStage::REMOVE, 2);
    auto r = manager->execute(spec());
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().status, ExitStatus::SUCCESS);
    EXPECT_EQ(runtime.live(), 0u);
}

TEST_F(SandboxManagerTest, KillFailureDoesNotBlockRemoval) {
    runtime.inject(FakeStage::KILL, 1);
    ASSERT_TRUE(manager->execute(spec()).ok());
    EXPECT_EQ(runtime.live(), 0u);
}

TEST_F(SandboxManagerTest, ThousandRunsWithInjectedFailuresLeakNothing) {
    const FakeStage stages[] = {FakeStage::NONE, FakeStage::CREATE, FakeStage::START,
                                FakeStage::WAIT, FakeStage::KILL, FakeStage::COLLECT,
                                FakeStage::REMOVE};
    runtime.responder = [](const ExecutionSpec &s) {
        return s.code_files.at("run.py").size() % 2 == 0 ? FakeBehavior::ok("ok\n")
                                                         : FakeBehavior::fail(1, "err");
    };

    int ok = 0;
    int failed = 0;
    for (int i = 0; i < 1000; i++) {
        FakeStage stage = stages[i % 7];
        runtime.inject(stage, stage == FakeStage::NONE ? 0 : 1);
        ExecutionSpec s = spec();
        s.code_files["run.py"] = std::string(static_cast<size_t>(i % 3 + 1), 'x');
        auto r = manager->execute(s);
        if (r.ok()) {
            ok++;
        } else {
            failed++;
        }
        ASSERT_EQ(runtime.live(), 0u) << "run " << i << " stage " << static_cast<int>(stage);
    }
    EXPECT_EQ(ok + failed, 1000);
    EXPECT_GT(failed, 0);
    EXPECT_GT(ok, 0);
    EXPECT_EQ(manager->executions(), 1000u);
}

//==============================================================================
// 回收扫描
//==============================================================================

TEST_F(SandboxManagerTest, PersistentRemoveFailureLeavesContainerForSweeper) {
    auto sink = std::make_shared<MemorySink>();
    default_logger().add_sink(sink);
    default_logger().set_level(LogLevel::ERROR);

    runtime.inject(FakeStage::REMOVE, 3);
    auto r = manager->execute(spec());
    default_logger().set_level(LogLevel::OFF);
    ASSERT_TRUE(default_logger().remove_sink(sink));

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(runtime.live(), 1u);
    EXPECT_TRUE(sink->contains("left for the reconciliation sweeper", LogLevel::ERROR));

    ReconciliationSweeper sweeper(runtime, 0);
    auto early = sweeper.sweep(now_ms());
    ASSERT_TRUE(early.ok());
    EXPECT_EQ(early.value(), 0);
    EXPECT_EQ(runtime.live(), 1u);

    auto late = sweeper.sweep(now_ms() + 5000 + 300 + 1);
    ASSERT_TRUE(late.ok());
    EXPECT_EQ(late.value(), 1);
    EXPECT_EQ(runtime.live(), 0u);
}

TEST(ReconciliationSweeperTest, RemovesOnlyExpiredContainers) {
    default_logger().set_level(LogLevel::OFF);
    FakeRuntime runtime;
    int64_t now = 1700000000000;

    ContainerLabels stale;
    stale.job_id = "job-crashed";
    stale.created_at_ms = now - 200000;
    stale.lifetime_ms = 125000;
    runtime.adopt("orphan-1", stale);

    ContainerLabels fresh;
    fresh.job_id = "job-running";
    fresh.created_at_ms = now - 1000;
    fresh.lifetime_ms = 125000;
    runtime.adopt("live-1", fresh);

    ReconciliationSweeper sweeper(runtime, 30000);
    auto removed = sweeper.sweep(now);
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(removed.value(), 1);

    auto left = runtime.list();
    ASSERT_TRUE(left.ok());
    ASSERT_EQ(left.value().size(), 1u);
    EXPECT_EQ(left.value()[0].id, "live-1");
    default_logger().set_level(LogLevel::INFO);
}

TEST(ReconciliationSweeperTest, EmptyRuntime) {
    FakeRuntime runtime;
    ReconciliationSweeper sweeper(runtime, 0);
    auto removed = sweeper.sweep(now_ms());
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(removed.value(), 0);
}

TEST(EnvironmentTest, SanitizeDropsLoaderVariables) {
    auto clean = sanitize_env({{"LD_DEBUG", "all"}, {"R_PROFILE_USER", "/tmp/x"},
                               {"BAD=NAME", "1"}, {"OMP_NUM_THREADS", "1"}});
    EXPECT_EQ(clean.count("LD_DEBUG"), 0u);
    EXPECT_EQ(clean.count("R_PROFILE_USER"), 0u);
    EXPECT_EQ(clean.count("BAD=NAME"), 0u);
    EXPECT_EQ(clean.at("OMP_NUM_THREADS"), "1");
    EXPECT_EQ(clean.at("LANG"), "C.UTF-8");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
