/**
 * @file pipeline_test.cpp
 * @brief 处理流程测试：队列 -> 沙箱 -> 判定 -> 签名 -> 存储
 */

#include <gtest/gtest.h>
#include <csignal>
#include <thread>
#include <chrono>
#include <cstdio>
#include <fstream>

#include "worker/pipeline.h"
#include "worker/worker_pool.h"
#include "fake_runtime.h"
#include "test_util.h"

using namespace sciv;
using namespace sciv::worker;
using sciv::fake::FakeBehavior;
using sciv::fake::FakeRuntime;
using sciv::fake::FakeStage;

class PipelineTest : public ::testing::Test {
protected:
    fake::TempDir dir;
    FakeRuntime runtime;
    std::unique_ptr<sandbox::SandboxManager> manager;
    std::unique_ptr<queue::JobQueue> jobs;
    std::unique_ptr<queue::ResultStore> store;
    std::optional<signing::Signer> signer;
    std::unique_ptr<Pipeline> pipeline;
    PipelineOptions popts;

    void SetUp() override {
        default_logger().set_level(LogLevel::OFF);

        sandbox::SandboxManagerOptions sopts;
        sopts.teardown_grace_ms = 300;
        sopts.remove_backoff_ms = 1;
        manager = std::make_unique<sandbox::SandboxManager>(runtime, sopts);

        QueueSettings qs;
        qs.root = dir.path();
        qs.visibility_timeout_sec = 60;
        qs.max_attempts = 3;
        auto opened = queue::JobQueue::open(qs);
        ASSERT_TRUE(opened.ok()) << opened.error().to_string();
        jobs = std::move(opened).value();

        store = std::make_unique<queue::ResultStore>(dir / "results", 1, jobs.get());
        ASSERT_TRUE(store->init().ok());

        auto generated = signing::Signer::generate();
        ASSERT_TRUE(generated.ok());
        signer.emplace(std::move(generated).value());

        popts.max_attempts = 3;
        popts.retry_backoff_ms = 10;
        popts.max_backoff_ms = 100;
        pipeline = std::make_unique<Pipeline>(*jobs, *store, *manager, *signer,
                                              comparators::ToleranceDefaults(), popts);
    }

    void TearDown() override {
        default_logger().set_level(LogLevel::INFO);
    }

    QueueMessage submit_and_claim(const Job &job, int64_t now = now_ms()) {
        EXPECT_TRUE(jobs->enqueue(job).ok());
        return claim(now);
    }

    QueueMessage claim(int64_t now) {
        auto batch = jobs->claim("worker-test", 1, now);
        EXPECT_TRUE(batch.ok());
        EXPECT_EQ(batch.value().messages.size(), 1u);
        return batch.value().messages.empty() ? QueueMessage() : batch.value().messages[0];
    }

    JobStatus status_of(const std::string &job_id) {
        auto s = jobs->status(job_id);
        EXPECT_TRUE(s.ok() && s.value());
        return s.ok() && s.value() ? *s.value() : JobStatus::QUEUED;
    }

    static Job with_expected(Job job, const std::string &content, ComparatorKind kind) {
        ExpectedOutput exp;
        exp.content = content;
        exp.comparator = kind;
        job.expected = exp;
        return job;
    }
};

//==============================================================================
// 正常路径
//==============================================================================

TEST_F(PipelineTest, MatchingOutputIsL3) {
    runtime.responder = [](const ExecutionSpec&) { return FakeBehavior::ok("42\n"); };
    QueueMessage msg = submit_and_claim(
        with_expected(fake::sample_job("job-l3"), "42\n", ComparatorKind::EXACT));

    Outcome out = pipeline->handle(msg);
    EXPECT_EQ(out.disposition, Disposition::ACKED);
    EXPECT_TRUE(out.executed);
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L3);
    EXPECT_TRUE(out.result->passed);
    EXPECT_EQ(out.result->claim_id, "claim-job-l3");
    EXPECT_EQ(out.result->attempts, 1);
    EXPECT_EQ(status_of("job-l3"), JobStatus::COMPLETED);
    EXPECT_EQ(runtime.live(), 0u);

    // 已 ack 的消息不会再被投递
    auto later = jobs->claim("worker-test", 1, now_ms() + 3600 * 1000);
    ASSERT_TRUE(later.ok());
    EXPECT_TRUE(later.value().empty());
}

TEST_F(PipelineTest, ExecutionWithoutExpectedOutputIsL2) {
    QueueMessage msg = submit_and_claim(fake::sample_job("job-l2"));
    Outcome out = pipeline->handle(msg);
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L2);
    EXPECT_TRUE(out.result->passed);
    EXPECT_FALSE(out.result->comparison);
    ASSERT_TRUE(out.result->sandbox);
    EXPECT_EQ(out.result->sandbox->status, ExitStatus::SUCCESS);
}

TEST_F(PipelineTest, MismatchIsL2AndFails) {
    runtime.responder = [](const ExecutionSpec&) { return FakeBehavior::ok("[1.0, 2.5]\n"); };
    Job job = with_expected(fake::sample_job("job-mismatch"), "[1.0, 2.0]",
                            ComparatorKind::NUMERICAL);
    job.tolerance.abs_tol = 0.01;
    Outcome out = pipeline->handle(submit_and_claim(job));
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L2);
    EXPECT_FALSE(out.result->passed);
    ASSERT_TRUE(out.result->comparison);
    EXPECT_DOUBLE_EQ(out.result->comparison->score, 0.5);
}

TEST_F(PipelineTest, OutputFileComparison) {
    runtime.responder = [](const ExecutionSpec&) {
        FakeBehavior b = FakeBehavior::ok("");
        b.files["samples.json"] = "[1, 2, 3, 4, 5]";
        return b;
    };
    Job job = fake::sample_job("job-stat");
    ExpectedOutput exp;
    exp.name = "samples.json";
    exp.content = "[1, 2, 3, 4, 5]";
    exp.comparator = ComparatorKind::STATISTICAL;
    job.expected = exp;

    Outcome out = pipeline->handle(submit_and_claim(job));
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L4);

    Job missing = job;
    missing.id = "job-stat-missing";
    runtime.responder = [](const ExecutionSpec&) { return FakeBehavior::ok(""); };
    Outcome none = pipeline->handle(submit_and_claim(missing));
    ASSERT_TRUE(none.result && none.result->comparison);
    EXPECT_FALSE(none.result->comparison->matched);
    EXPECT_EQ(none.result->level, VerificationLevel::L2);
}

TEST_F(PipelineTest, LeanProofIsL6) {
    Job job = fake::sample_job("job-lean", RunnerKind::LEAN4, "theorem t : 1 + 1 = 2 := rfl\n");
    Outcome out = pipeline->handle(submit_and_claim(job));
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L6);
    EXPECT_TRUE(out.result->passed);
    EXPECT_EQ(runtime.last_spec.image, "phiacta-verify-runner-lean4:latest");
}

TEST_F(PipelineTest, LeanSorryWarningKeepsL6) {
    runtime.responder = [](const ExecutionSpec&) {
        return FakeBehavior::ok("proof.lean:1:8: warning: declaration uses 'sorry'\n");
    };
    Job job = fake::sample_job("job-sorry", RunnerKind::LEAN4, "theorem t : 1 = 1 := sorry\n");
    Outcome out = pipeline->handle(submit_and_claim(job));
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L6);
    EXPECT_TRUE(out.result->passed);
    EXPECT_NE(out.result->detail.find("sorry"), std::string::npos);
}

TEST_F(PipelineTest, MissingImageIsSignedL0) {
    runtime.images.erase("phiacta-verify-runner-julia:latest");
    Outcome out = pipeline->handle(
        submit_and_claim(fake::sample_job("job-julia", RunnerKind::JULIA, "println(1)\n")));
    EXPECT_EQ(out.disposition, Disposition::ACKED);
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L0);
    EXPECT_EQ(out.result->detail.rfind("image_missing", 0), 0u);
    EXPECT_TRUE(signer->verify(*out.result).ok());
    EXPECT_EQ(runtime.created(), 0u);
}

//==============================================================================
// 幂等与存储
//==============================================================================

TEST_F(PipelineTest, RedeliveryIsAcknowledgedWithoutExecution) {
    QueueMessage msg = submit_and_claim(fake::sample_job("job-once"));
    Outcome first = pipeline->handle(msg);
    ASSERT_TRUE(first.result);
    uint64_t executed = manager->executions();

    QueueMessage again = msg;
    again.delivery_count = 2;
    Outcome second = pipeline->handle(again);
    EXPECT_EQ(second.disposition, Disposition::ACKED);
    EXPECT_FALSE(second.executed);
    ASSERT_TRUE(second.result);
    EXPECT_EQ(second.result->content_address, first.result->content_address);
    EXPECT_EQ(manager->executions(), executed);
}

TEST_F(PipelineTest, StoredResultVerifies) {
    Outcome out = pipeline->handle(submit_and_claim(fake::sample_job("job-stored")));
    ASSERT_TRUE(out.result);

    auto stored = store->get("job-stored");
    ASSERT_TRUE(stored.ok() && stored.value());
    const VerificationResult &r = *stored.value();
    EXPECT_EQ(r.content_address, out.result->content_address);
    EXPECT_EQ(signing::content_address(r), r.content_address);
    EXPECT_EQ(r.public_key_ref, signer->public_key_ref());
    EXPECT_TRUE(signer->verify(r).ok());

    auto found = store->lookup("job-stored");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.value().kind, queue::Lookup::FOUND);
}

//==============================================================================
// 错误分类
//==============================================================================

TEST_F(PipelineTest, MalformedNotebookIsSignedL0) {
    Job job = fake::sample_job("job-nb", RunnerKind::PYTHON, "{\"cells\": 3}");
    job.format = SourceFormat::JUPYTER;
    Outcome out = pipeline->handle(submit_and_claim(job));
    EXPECT_EQ(out.disposition, Disposition::ACKED);
    EXPECT_FALSE(out.executed);
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L0);
    EXPECT_FALSE(out.result->passed);
    EXPECT_EQ(out.result->claim_id, "claim-job-nb");
    EXPECT_TRUE(out.result->is_sealed());
    EXPECT_EQ(runtime.created(), 0u);
    EXPECT_EQ(status_of("job-nb"), JobStatus::COMPLETED);
}

TEST_F(PipelineTest, MissingRecordIsSignedL0) {
    QueueMessage msg = submit_and_claim(fake::sample_job("job-gone"));
    ASSERT_EQ(std::remove((dir / "jobs/job-gone.json").c_str()), 0);

    Outcome out = pipeline->handle(msg);
    EXPECT_EQ(out.disposition, Disposition::ACKED);
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L0);
    EXPECT_EQ(out.result->detail.rfind("malformed job", 0), 0u);
}

TEST_F(PipelineTest, TransientRuntimeFailureIsUncharged) {
    runtime.inject(FakeStage::CREATE, 1);
    int64_t t0 = now_ms();
    QueueMessage msg = submit_and_claim(fake::sample_job("job-flaky"), t0);

    Outcome out = pipeline->handle(msg);
    EXPECT_EQ(out.disposition, Disposition::RETRY_UNCHARGED);
    EXPECT_FALSE(out.result);
    EXPECT_EQ(status_of("job-flaky"), JobStatus::QUEUED);
    EXPECT_FALSE(store->get("job-flaky").value());

    QueueMessage retry = claim(t0 + 1000);
    EXPECT_EQ(retry.job_id, "job-flaky");
    EXPECT_EQ(retry.attempts, 1);

    Outcome done = pipeline->handle(retry);
    EXPECT_EQ(done.disposition, Disposition::ACKED);
    ASSERT_TRUE(done.result);
    EXPECT_EQ(done.result->level, VerificationLevel::L2);
}

TEST_F(PipelineTest, ResourceExhaustionRetriesThenDeadLetters) {
    runtime.responder = [](const ExecutionSpec&) {
        FakeBehavior b;
        b.term_signal = SIGXCPU;
        return b;
    };
    int64_t t0 = now_ms();
    QueueMessage msg = submit_and_claim(fake::sample_job("job-spin"), t0);

    Outcome first = pipeline->handle(msg);
    EXPECT_EQ(first.disposition, Disposition::RETRY_CHARGED);
    EXPECT_TRUE(first.executed);
    EXPECT_EQ(status_of("job-spin"), JobStatus::RETRYING);

    QueueMessage second = claim(t0 + 10000);
    EXPECT_EQ(second.attempts, 2);
    EXPECT_EQ(pipeline->handle(second).disposition, Disposition::RETRY_CHARGED);

    QueueMessage third = claim(t0 + 20000);
    EXPECT_EQ(third.attempts, 3);
    Outcome last = pipeline->handle(third);
    EXPECT_EQ(last.disposition, Disposition::ACKED);
    ASSERT_TRUE(last.result);
    EXPECT_EQ(last.result->level, VerificationLevel::L0);
    EXPECT_EQ(last.result->detail.rfind("retries exhausted", 0), 0u);
    EXPECT_NE(last.result->detail.find("timeout"), std::string::npos);
    EXPECT_EQ(last.result->attempts, 3);
    EXPECT_TRUE(signer->verify(*last.result).ok());
    EXPECT_EQ(status_of("job-spin"), JobStatus::DEAD_LETTERED);
    EXPECT_EQ(manager->executions(), 3u);

    auto dead = jobs->backend().list_dead_letters();
    ASSERT_TRUE(dead.ok());
    ASSERT_EQ(dead.value().size(), 1u);
    EXPECT_EQ(dead.value()[0].job_id, "job-spin");
}

TEST_F(PipelineTest, ExhaustedMessageIsNotExecuted) {
    QueueMessage msg = submit_and_claim(fake::sample_job("job-exhausted"));
    msg.attempts = 3;
    msg.last_error = "L0 resource_killed: memory limit exceeded (512 MB)";
    uint64_t before = manager->executions();

    Outcome out = pipeline->handle_exhausted(msg);
    EXPECT_EQ(out.disposition, Disposition::ACKED);
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L0);
    EXPECT_NE(out.result->detail.find("resource_killed"), std::string::npos);
    EXPECT_EQ(out.result->claim_id, "claim-job-exhausted");
    EXPECT_EQ(manager->executions(), before);
    EXPECT_EQ(status_of("job-exhausted"), JobStatus::DEAD_LETTERED);
}

TEST_F(PipelineTest, ExhaustedDeliveryStaysExhaustedAfterRelease) {
    int64_t t0 = now_ms();
    ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-spent")).ok());
    for (int attempt = 1; attempt <= popts.max_attempts; attempt++) {
        QueueMessage msg = claim(t0);
        ASSERT_TRUE(jobs->release(msg, 0, true, "L0 resource_killed", t0).ok());
    }

    auto claim_exhausted = [&] {
        auto batch = jobs->claim("worker-test", 1, t0);
        EXPECT_TRUE(batch.ok());
        EXPECT_TRUE(batch.value().messages.empty());
        EXPECT_EQ(batch.value().exhausted.size(), 1u);
        return batch.value().exhausted.empty() ? QueueMessage() : batch.value().exhausted[0];
    };

    // 线程池停止时交还未开始的任务
    ASSERT_TRUE(pipeline->defer(claim_exhausted(), true).ok());
    // 死信写入失败时的不计次释放
    ASSERT_TRUE(jobs->release(claim_exhausted(), 0, false, "", t0).ok());

    Outcome out = pipeline->handle_exhausted(claim_exhausted());
    EXPECT_EQ(out.disposition, Disposition::ACKED);
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L0);
    EXPECT_EQ(manager->executions(), 0u);
    EXPECT_EQ(runtime.created(), 0u);
    EXPECT_EQ(status_of("job-spent"), JobStatus::DEAD_LETTERED);
}

TEST_F(PipelineTest, DeferredMessageKeepsItsAttempt) {
    int64_t t0 = now_ms();
    QueueMessage msg = submit_and_claim(fake::sample_job("job-deferred"), t0);
    ASSERT_TRUE(pipeline->defer(msg, false).ok());

    QueueMessage again = claim(t0);
    EXPECT_EQ(again.job_id, "job-deferred");
    EXPECT_EQ(again.attempts, 1);
}

TEST_F(PipelineTest, CorruptStoredResultIsReplaced) {
    QueueMessage msg = submit_and_claim(fake::sample_job("job-torn"));
    std::string path = dir / "results/job-torn.json";
    {
        std::ofstream f(path);
        f << "{\"job_id\": \"job-torn\", \"lev";
    }

    Outcome out = pipeline->handle(msg);
    EXPECT_EQ(out.disposition, Disposition::ACKED);
    EXPECT_TRUE(out.executed);
    ASSERT_TRUE(out.result);
    EXPECT_EQ(out.result->level, VerificationLevel::L2);
    EXPECT_TRUE(file_exists(path + ".corrupt"));

    auto stored = store->get("job-torn");
    ASSERT_TRUE(stored.ok() && stored.value());
    EXPECT_EQ(stored.value()->content_address, out.result->content_address);
    EXPECT_TRUE(signer->verify(*stored.value()).ok());
}

//==============================================================================
// 线程池
//==============================================================================

TEST_F(PipelineTest, WorkerPoolDrainsQueue) {
    runtime.responder = [](const ExecutionSpec&) { return FakeBehavior::ok("42\n"); };
    const int n = 6;
    for (int i = 0; i < n; i++) {
        ASSERT_TRUE(jobs->enqueue(with_expected(fake::sample_job("job-pool-" + std::to_string(i)),
                                                "42\n", ComparatorKind::EXACT)).ok());
    }

    WorkerPoolOptions wopts;
    wopts.concurrency = 3;
    wopts.consumer = "pool-test";
    wopts.poll_interval_ms = 10;
    wopts.retry_backoff_ms = 10;
    wopts.maintenance_interval_ms = 60000;
    WorkerPool pool(*jobs, *pipeline, nullptr, store.get(), wopts);
    ASSERT_TRUE(pool.start().ok());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    int stored = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        stored = 0;
        for (int i = 0; i < n; i++) {
            auto r = store->get("job-pool-" + std::to_string(i));
            if (r.ok() && r.value()) stored++;
        }
        if (stored == n) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    pool.stop();

    EXPECT_EQ(stored, n);
    EXPECT_FALSE(pool.fatal());
    EXPECT_FALSE(pool.running());
    EXPECT_EQ(manager->executions(), static_cast<uint64_t>(n));
    EXPECT_EQ(runtime.live(), 0u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
