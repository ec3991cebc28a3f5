/**
 * @file queue_test.cpp
 * @brief 作业队列与结果存储测试
 */

#include <gtest/gtest.h>
#include <fstream>
#include <set>
#include <thread>
#include <mutex>

#include "queue/job_queue.h"
#include "queue/result_store.h"
#include "signing/signer.h"
#include "test_util.h"

using namespace sciv;
using namespace sciv::queue;

class JobQueueTest : public ::testing::Test {
protected:
    fake::TempDir dir;
    QueueSettings settings;
    std::unique_ptr<JobQueue> jobs;

    static constexpr int64_t T0 = 1700000000000;

    void SetUp() override {
        settings.root = dir.path();
        settings.visibility_timeout_sec = 60;
        settings.max_attempts = 3;
        auto opened = JobQueue::open(settings);
        ASSERT_TRUE(opened.ok()) << opened.error().to_string();
        jobs = std::move(opened).value();
    }

    QueueMessage claim_one(const std::string &consumer, int64_t now) {
        auto batch = jobs->claim(consumer, 1, now);
        EXPECT_TRUE(batch.ok());
        EXPECT_EQ(batch.value().messages.size(), 1u);
        return batch.value().messages.empty() ? QueueMessage() : batch.value().messages[0];
    }
};

TEST_F(JobQueueTest, EnqueueAndClaim) {
    Job job = fake::sample_job("job-1");
    auto id = jobs->enqueue(job);
    ASSERT_TRUE(id.ok()) << id.error().to_string();

    auto status = jobs->status("job-1");
    ASSERT_TRUE(status.ok() && status.value());
    EXPECT_EQ(*status.value(), JobStatus::QUEUED);

    QueueMessage msg = claim_one("worker-a", T0);
    EXPECT_EQ(msg.message_id, id.value());
    EXPECT_EQ(msg.job_id, "job-1");
    EXPECT_EQ(msg.consumer, "worker-a");
    EXPECT_EQ(msg.group, settings.group);
    EXPECT_EQ(msg.attempts, 1);
    EXPECT_EQ(msg.delivery_count, 1);
    EXPECT_EQ(msg.first_delivered_ms, T0);

    auto loaded = jobs->load_job("job-1");
    ASSERT_TRUE(loaded.ok()) << loaded.error().to_string();
    EXPECT_EQ(loaded.value().source, job.source);
    EXPECT_EQ(loaded.value().code_hash, job.code_hash);
    EXPECT_EQ(loaded.value().claim_id, job.claim_id);
}

TEST_F(JobQueueTest, DuplicateIdIsRejected) {
    ASSERT_TRUE(jobs->enqueue(fake::sample_job("dup")).ok());
    auto again = jobs->enqueue(fake::sample_job("dup", RunnerKind::R, "print(1)"));
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code(), ErrorCode::DUPLICATE_JOB);

    // 原记录保持不变
    auto loaded = jobs->load_job("dup");
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded.value().runner, RunnerKind::PYTHON);
}

TEST_F(JobQueueTest, EmptyQueue) {
    auto batch = jobs->claim("worker-a", 4, T0);
    ASSERT_TRUE(batch.ok());
    EXPECT_TRUE(batch.value().empty());
}

TEST_F(JobQueueTest, FifoOrder) {
    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-" + std::to_string(i))).ok());
    }
    auto batch = jobs->claim("worker-a", 3, T0);
    ASSERT_TRUE(batch.ok());
    ASSERT_EQ(batch.value().messages.size(), 3u);
    EXPECT_EQ(batch.value().messages[0].job_id, "job-0");
    EXPECT_EQ(batch.value().messages[2].job_id, "job-2");

    auto rest = jobs->claim("worker-b", 10, T0);
    ASSERT_TRUE(rest.ok());
    ASSERT_EQ(rest.value().messages.size(), 2u);
    EXPECT_EQ(rest.value().messages[0].job_id, "job-3");
}

TEST_F(JobQueueTest, RedeliveredAfterVisibilityTimeout) {
    ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-crash")).ok());
    QueueMessage first = claim_one("worker-a", T0);

    // 可见性超时之前其它消费者看不到
    auto early = jobs->claim("worker-b", 1, T0 + 30000);
    ASSERT_TRUE(early.ok());
    EXPECT_TRUE(early.value().empty());

    QueueMessage second = claim_one("worker-b", T0 + 60000);
    EXPECT_EQ(second.message_id, first.message_id);
    EXPECT_EQ(second.consumer, "worker-b");
    EXPECT_EQ(second.delivery_count, 2);
    EXPECT_EQ(second.attempts, 2);
    EXPECT_EQ(second.first_delivered_ms, T0);
    EXPECT_EQ(second.last_delivered_ms, T0 + 60000);
}

TEST_F(JobQueueTest, AckedMessageIsNotRedelivered) {
    ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-ack")).ok());
    QueueMessage msg = claim_one("worker-a", T0);
    ASSERT_TRUE(jobs->ack(msg.message_id).ok());
    // 重复 ack 无害
    ASSERT_TRUE(jobs->ack(msg.message_id).ok());

    auto later = jobs->claim("worker-b", 1, T0 + 3600000);
    ASSERT_TRUE(later.ok());
    EXPECT_TRUE(later.value().empty());

    auto pending = jobs->backend().list_pending(settings.group);
    ASSERT_TRUE(pending.ok());
    EXPECT_TRUE(pending.value().empty());
}

TEST_F(JobQueueTest, AttemptCeilingMovesToExhausted) {
    ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-ceiling")).ok());
    int64_t now = T0;
    for (int attempt = 1; attempt <= settings.max_attempts; attempt++) {
        QueueMessage msg = claim_one("worker-a", now);
        EXPECT_EQ(msg.attempts, attempt);
        now += 61000;
    }

    auto batch = jobs->claim("worker-b", 1, now);
    ASSERT_TRUE(batch.ok());
    EXPECT_TRUE(batch.value().messages.empty());
    ASSERT_EQ(batch.value().exhausted.size(), 1u);
    EXPECT_EQ(batch.value().exhausted[0].job_id, "job-ceiling");
    EXPECT_EQ(batch.value().exhausted[0].attempts, settings.max_attempts);
}

TEST_F(JobQueueTest, ChargedAndUnchargedRelease) {
    ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-release")).ok());
    QueueMessage msg = claim_one("worker-a", T0);
    ASSERT_EQ(msg.attempts, 1);

    // 不计次：重新 claim 后尝试次数不变
    ASSERT_TRUE(jobs->release(msg, 0, false, "runtime unavailable", T0).ok());
    msg = claim_one("worker-a", T0);
    EXPECT_EQ(msg.attempts, 1);
    EXPECT_EQ(msg.delivery_count, 2);

    // 计次并带延迟
    ASSERT_TRUE(jobs->release(msg, 5000, true, "L0 timeout: wall-clock", T0).ok());
    auto early = jobs->claim("worker-a", 1, T0 + 4000);
    ASSERT_TRUE(early.ok());
    EXPECT_TRUE(early.value().empty());

    msg = claim_one("worker-a", T0 + 5000);
    EXPECT_EQ(msg.attempts, 2);
    EXPECT_EQ(msg.last_error, "L0 timeout: wall-clock");
}

TEST_F(JobQueueTest, ExhaustedDeliveryIsNeverRefunded) {
    ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-spent")).ok());
    for (int attempt = 1; attempt <= settings.max_attempts; attempt++) {
        QueueMessage msg = claim_one("worker-a", T0);
        ASSERT_TRUE(jobs->release(msg, 0, true, "L0 timeout", T0).ok());
    }

    for (bool charge : {false, true, false}) {
        auto batch = jobs->claim("worker-a", 1, T0);
        ASSERT_TRUE(batch.ok());
        EXPECT_TRUE(batch.value().messages.empty());
        ASSERT_EQ(batch.value().exhausted.size(), 1u);
        QueueMessage spent = batch.value().exhausted[0];
        EXPECT_EQ(spent.attempts, settings.max_attempts);
        ASSERT_TRUE(jobs->release(spent, 0, charge, "", T0).ok());
    }

    auto last = jobs->claim("worker-a", 1, T0);
    ASSERT_TRUE(last.ok());
    EXPECT_TRUE(last.value().messages.empty());
    EXPECT_EQ(last.value().exhausted.size(), 1u);
}

TEST_F(JobQueueTest, RepeatedUnchargedReleaseRefundsOnce) {
    ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-twice")).ok());
    QueueMessage first = claim_one("worker-a", T0);
    ASSERT_TRUE(jobs->release(first, 0, true, "", T0).ok());

    QueueMessage second = claim_one("worker-a", T0);
    ASSERT_EQ(second.attempts, 2);
    ASSERT_TRUE(jobs->release(second, 0, false, "", T0).ok());
    ASSERT_TRUE(jobs->release(second, 0, false, "", T0).ok());

    EXPECT_EQ(claim_one("worker-a", T0).attempts, 2);
}

TEST_F(JobQueueTest, ReleaseUnknownMessage) {
    QueueMessage ghost;
    ghost.message_id = "00000000000000000099";
    auto r = jobs->release(ghost, 0, false);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::NOT_FOUND);
}

TEST_F(JobQueueTest, DeadLetterLedger) {
    ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-dead")).ok());
    QueueMessage msg = claim_one("worker-a", T0);
    ASSERT_TRUE(jobs->dead_letter(msg, "retries exhausted", T0).ok());
    ASSERT_TRUE(jobs->ack(msg.message_id).ok());

    auto dead = jobs->backend().list_dead_letters();
    ASSERT_TRUE(dead.ok());
    ASSERT_EQ(dead.value().size(), 1u);
    EXPECT_EQ(dead.value()[0].job_id, "job-dead");
}

TEST_F(JobQueueTest, CorruptPendingEntryIsQuarantined) {
    ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-ok")).ok());
    std::string pending_dir = dir.path() + "/stream/groups/" + settings.group + "/pending";
    ASSERT_TRUE(make_dirs(pending_dir, 0700).ok());
    {
        std::ofstream f(pending_dir + "/00000000000000000000.json");
        f << "{truncated";
    }

    auto batch = jobs->claim("worker-a", 2, T0);
    ASSERT_TRUE(batch.ok()) << batch.error().to_string();
    ASSERT_EQ(batch.value().messages.size(), 1u);
    EXPECT_EQ(batch.value().messages[0].job_id, "job-ok");
    EXPECT_TRUE(file_exists(pending_dir + "/00000000000000000000.json.corrupt"));
}

TEST_F(JobQueueTest, CorruptStreamRecordIsSkipped) {
    auto first = jobs->enqueue(fake::sample_job("job-a"));
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-b")).ok());
    std::string record = dir.path() + "/stream/stream/" + first.value() + ".json";
    {
        std::ofstream f(record, std::ios::trunc);
        f << "{garbage";
    }

    auto batch = jobs->claim("worker-a", 2, T0);
    ASSERT_TRUE(batch.ok()) << batch.error().to_string();
    ASSERT_EQ(batch.value().messages.size(), 1u);
    EXPECT_EQ(batch.value().messages[0].job_id, "job-b");
    EXPECT_TRUE(file_exists(record + ".corrupt"));

    auto after = jobs->claim("worker-a", 2, T0);
    ASSERT_TRUE(after.ok());
    EXPECT_TRUE(after.value().empty());
}

TEST_F(JobQueueTest, MissingAndCorruptRecords) {
    auto missing = jobs->load_job("never-submitted");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code(), ErrorCode::NOT_FOUND);

    {
        std::ofstream f(dir.path() + "/jobs/broken.json");
        f << "[1, 2";
    }
    auto corrupt = jobs->load_job("broken");
    ASSERT_TRUE(corrupt.is_error());
    EXPECT_EQ(corrupt.error().code(), ErrorCode::MALFORMED_JOB);

    auto status = jobs->status("never-submitted");
    ASSERT_TRUE(status.ok());
    EXPECT_FALSE(status.value().has_value());
}

TEST_F(JobQueueTest, ConcurrentConsumersGetDisjointMessages) {
    const int total = 40;
    for (int i = 0; i < total; i++) {
        ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-" + std::to_string(i))).ok());
    }

    std::mutex mutex;
    std::multiset<std::string> seen;
    std::vector<std::thread> consumers;
    for (int c = 0; c < 4; c++) {
        consumers.emplace_back([&, c] {
            while (true) {
                auto batch = jobs->claim("worker-" + std::to_string(c), 3, T0);
                if (batch.is_error() || batch.value().empty()) break;
                std::lock_guard<std::mutex> lock(mutex);
                for (const auto &m : batch.value().messages) seen.insert(m.job_id);
            }
        });
    }
    for (auto &t : consumers) t.join();

    EXPECT_EQ(seen.size(), static_cast<size_t>(total));
    for (const auto &id : seen) {
        EXPECT_EQ(seen.count(id), 1u) << id;
    }
}

//==============================================================================
// 结果存储
//==============================================================================

class ResultStoreTest : public JobQueueTest {
protected:
    std::unique_ptr<ResultStore> store;
    std::optional<signing::Signer> signer;

    void SetUp() override {
        JobQueueTest::SetUp();
        store = std::make_unique<ResultStore>(dir.path() + "/results", 1, jobs.get());
        ASSERT_TRUE(store->init().ok());
        auto generated = signing::Signer::generate();
        ASSERT_TRUE(generated.ok());
        signer.emplace(std::move(generated).value());
    }

    VerificationResult sealed(const std::string &job_id, const std::string &detail, int64_t at) {
        VerificationResult r;
        r.job_id = job_id;
        r.level = VerificationLevel::L2;
        r.passed = true;
        r.detail = detail;
        r.attempts = 1;
        r.completed_at_ms = at;
        EXPECT_TRUE(signer->seal_into(r).ok());
        return r;
    }
};

TEST_F(ResultStoreTest, RejectsUnsignedResult) {
    VerificationResult r;
    r.job_id = "job-unsigned";
    auto put = store->put_if_absent(r);
    ASSERT_TRUE(put.is_error());
    EXPECT_EQ(put.error().code(), ErrorCode::SIGNING_FAILED);
}

TEST_F(ResultStoreTest, FirstResultWins) {
    int64_t now = now_ms();
    auto first = store->put_if_absent(sealed("job-x", "first", now));
    ASSERT_TRUE(first.ok());
    EXPECT_TRUE(first.value());

    auto second = store->put_if_absent(sealed("job-x", "second", now));
    ASSERT_TRUE(second.ok());
    EXPECT_FALSE(second.value());

    auto got = store->get("job-x");
    ASSERT_TRUE(got.ok() && got.value());
    EXPECT_EQ(got.value()->detail, "first");
    EXPECT_TRUE(signer->verify(*got.value()).ok());
}

TEST_F(ResultStoreTest, LookupStates) {
    int64_t now = now_ms();

    auto unknown = store->lookup("job-unknown", now);
    ASSERT_TRUE(unknown.ok());
    EXPECT_EQ(unknown.value().kind, Lookup::NOT_FOUND);

    ASSERT_TRUE(jobs->enqueue(fake::sample_job("job-running")).ok());
    ASSERT_TRUE(jobs->set_status("job-running", JobStatus::RUNNING).ok());
    auto running = store->lookup("job-running", now);
    ASSERT_TRUE(running.ok());
    EXPECT_EQ(running.value().kind, Lookup::PENDING);
    EXPECT_EQ(*running.value().status, JobStatus::RUNNING);

    ASSERT_TRUE(store->put_if_absent(sealed("job-running", "done", now)).ok());
    ASSERT_TRUE(jobs->set_status("job-running", JobStatus::COMPLETED).ok());
    auto done = store->lookup("job-running", now);
    ASSERT_TRUE(done.ok());
    ASSERT_EQ(done.value().kind, Lookup::FOUND);
    EXPECT_EQ(done.value().result->detail, "done");
}

TEST_F(ResultStoreTest, ExpiredResultsAreNotFoundAndPurged) {
    int64_t now = now_ms();
    int64_t hour = 3600 * 1000;
    ASSERT_TRUE(store->put_if_absent(sealed("job-old", "old", now - 2 * hour)).ok());
    ASSERT_TRUE(store->put_if_absent(sealed("job-new", "new", now)).ok());

    auto old = store->lookup("job-old", now);
    ASSERT_TRUE(old.ok());
    EXPECT_EQ(old.value().kind, Lookup::NOT_FOUND);

    auto purged = store->purge_expired(now);
    ASSERT_TRUE(purged.ok());
    EXPECT_EQ(purged.value(), 1);
    EXPECT_FALSE(store->get("job-old").value().has_value());
    EXPECT_TRUE(store->get("job-new").value().has_value());
}

TEST_F(ResultStoreTest, CorruptResultIsQuarantined) {
    std::string path = dir.path() + "/results/job-bad.json";
    {
        std::ofstream f(path);
        f << "{\"job_id\": ";
    }
    auto broken = store->get("job-bad");
    ASSERT_TRUE(broken.is_error());
    EXPECT_EQ(broken.error().code(), ErrorCode::CORRUPT_RECORD);
    EXPECT_FALSE(is_transient(broken.error().code()));

    ASSERT_TRUE(store->quarantine("job-bad").ok());
    EXPECT_TRUE(file_exists(path + ".corrupt"));
    auto cleared = store->get("job-bad");
    ASSERT_TRUE(cleared.ok());
    EXPECT_FALSE(cleared.value().has_value());

    auto put = store->put_if_absent(sealed("job-bad", "replacement", now_ms()));
    ASSERT_TRUE(put.ok());
    EXPECT_TRUE(put.value());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
