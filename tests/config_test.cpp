/**
 * @file config_test.cpp
 * @brief 配置加载、环境变量覆盖与提交准入测试
 */

#include <gtest/gtest.h>
#include <fstream>

#include "core/config.h"
#include "core/json_codec.h"
#include "test_util.h"

using namespace sciv;

class SettingsTest : public ::testing::Test {
protected:
    fake::TempDir dir;

    std::string write_config(const std::string &text) {
        std::string path = dir / "sciverify.yml";
        std::ofstream f(path);
        f << text;
        return path;
    }
};

TEST_F(SettingsTest, DefaultsAreValid) {
    Settings s;
    EXPECT_TRUE(s.validate().ok());
    EXPECT_EQ(s.queue.max_attempts, 3);
    EXPECT_EQ(s.queue.visibility_timeout_sec, 900);
    EXPECT_DOUBLE_EQ(s.comparators.similarity_threshold, 0.95);
    EXPECT_DOUBLE_EQ(s.comparators.stat_tol, 0.05);
    EXPECT_EQ(s.sandbox.images.size(), 5u);
}

TEST_F(SettingsTest, LoadsYamlOverDefaults) {
    std::string path = write_config(
        "queue:\n"
        "  max_attempts: 5\n"
        "  consumer: worker-a\n"
        "comparators:\n"
        "  stat_tol: 0.1\n"
        "limits:\n"
        "  default:\n"
        "    timeout_sec: 60\n"
        "worker:\n"
        "  concurrency: 2\n");
    fake::EnvBlock env({});
    auto s = Settings::load(path, env.get());
    ASSERT_TRUE(s.ok()) << s.error().to_string();
    EXPECT_EQ(s.value().queue.max_attempts, 5);
    EXPECT_EQ(s.value().queue.consumer, "worker-a");
    EXPECT_DOUBLE_EQ(s.value().comparators.stat_tol, 0.1);
    EXPECT_EQ(s.value().limits.defaults.timeout_sec, 60);
    EXPECT_EQ(s.value().limits.defaults.memory_mb, 2048);
    EXPECT_EQ(s.value().worker.concurrency, 2);
}

TEST_F(SettingsTest, EnvironmentOverridesFile) {
    std::string path = write_config("queue:\n  max_attempts: 5\n");
    fake::EnvBlock env({"VERIFY_QUEUE__MAX_ATTEMPTS=7", "VERIFY_LOG__LEVEL=debug",
                        "UNRELATED=1", "VERIFY_SIGNING__EPHEMERAL_DEV_KEY=true"});
    auto s = Settings::load(path, env.get());
    ASSERT_TRUE(s.ok()) << s.error().to_string();
    EXPECT_EQ(s.value().queue.max_attempts, 7);
    EXPECT_EQ(s.value().log.level, "debug");
    EXPECT_TRUE(s.value().signing.ephemeral_dev_key);
}

TEST_F(SettingsTest, EmptyConsumerGetsHostName) {
    fake::EnvBlock env({});
    auto s = Settings::load("", env.get());
    ASSERT_TRUE(s.ok()) << s.error().to_string();
    EXPECT_FALSE(s.value().queue.consumer.empty());
}

TEST_F(SettingsTest, RejectsWrongType) {
    std::string path = write_config("queue:\n  max_attempts: many\n");
    fake::EnvBlock env({});
    auto s = Settings::load(path, env.get());
    ASSERT_TRUE(s.is_error());
    EXPECT_EQ(s.error().code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(SettingsTest, VisibilityMustCoverLongestRun) {
    std::string path = write_config("queue:\n  visibility_timeout_sec: 60\n");
    fake::EnvBlock env({});
    auto s = Settings::load(path, env.get());
    ASSERT_TRUE(s.is_error());
    EXPECT_EQ(s.error().code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(SettingsTest, MissingFileIsReported) {
    fake::EnvBlock env({});
    auto s = Settings::load(dir / "absent.yml", env.get());
    ASSERT_TRUE(s.is_error());
    EXPECT_EQ(s.error().code(), ErrorCode::FILE_NOT_FOUND);
}

//==============================================================================
// 提交准入
//==============================================================================

class AdmitTest : public ::testing::Test {
protected:
    Settings settings;

    JobSubmission python(const std::string &source = "print(1)\n") {
        JobSubmission sub;
        sub.runner = "python";
        sub.source = source;
        sub.claim_id = "claim-1";
        return sub;
    }
};

TEST_F(AdmitTest, AcceptsAndFillsDefaults) {
    auto job = settings.admit(python(), 1234);
    ASSERT_TRUE(job.ok()) << job.error().to_string();
    EXPECT_FALSE(job.value().id.empty());
    EXPECT_EQ(job.value().code_hash, sha256_hex("print(1)\n"));
    EXPECT_EQ(job.value().submitted_at_ms, 1234);
    EXPECT_EQ(job.value().limits.timeout_sec, settings.limits.defaults.timeout_sec);
    EXPECT_EQ(job.value().claim_id, "claim-1");
}

TEST_F(AdmitTest, RunnerDefaultTimeout) {
    JobSubmission sub = python("theorem t : 1 = 1 := rfl\n");
    sub.runner = "lean4";
    auto job = settings.admit(sub);
    ASSERT_TRUE(job.ok()) << job.error().to_string();
    EXPECT_EQ(job.value().limits.timeout_sec, 300);
}

TEST_F(AdmitTest, GeneratedIdsAreUnique) {
    auto a = settings.admit(python());
    auto b = settings.admit(python());
    ASSERT_TRUE(a.ok() && b.ok());
    EXPECT_NE(a.value().id, b.value().id);
}

TEST_F(AdmitTest, RejectsUnknownRunner) {
    JobSubmission sub = python();
    sub.runner = "cobol";
    auto job = settings.admit(sub);
    ASSERT_TRUE(job.is_error());
    EXPECT_EQ(job.error().code(), ErrorCode::INVALID_SUBMISSION);
}

TEST_F(AdmitTest, RejectsLimitAboveMaximum) {
    JobSubmission sub = python();
    sub.limits.memory_mb = settings.limits.max.memory_mb + 1;
    auto job = settings.admit(sub);
    ASSERT_TRUE(job.is_error());
    EXPECT_EQ(job.error().code(), ErrorCode::LIMIT_EXCEEDED);

    sub.limits.memory_mb = 0;
    job = settings.admit(sub);
    ASSERT_TRUE(job.is_error());
    EXPECT_EQ(job.error().code(), ErrorCode::LIMIT_EXCEEDED);
}

TEST_F(AdmitTest, OverrideWithinMaximumIsApplied) {
    JobSubmission sub = python();
    sub.limits.timeout_sec = 30;
    sub.limits.pids = 16;
    auto job = settings.admit(sub);
    ASSERT_TRUE(job.ok());
    EXPECT_EQ(job.value().limits.timeout_sec, 30);
    EXPECT_EQ(job.value().limits.pids, 16);
}

TEST_F(AdmitTest, RejectsOversizedSource) {
    settings.limits.max_code_bytes = 16;
    auto job = settings.admit(python(std::string(17, 'x')));
    ASSERT_TRUE(job.is_error());
    EXPECT_EQ(job.error().code(), ErrorCode::CODE_TOO_LARGE);
}

TEST_F(AdmitTest, RejectsHashMismatch) {
    JobSubmission sub = python();
    sub.code_hash = sha256_hex("something else");
    auto job = settings.admit(sub);
    ASSERT_TRUE(job.is_error());
    EXPECT_EQ(job.error().code(), ErrorCode::CODE_HASH_MISMATCH);

    sub.code_hash = sha256_hex(sub.source);
    EXPECT_TRUE(settings.admit(sub).ok());
}

TEST_F(AdmitTest, RejectsLeanSyntaxOnly) {
    JobSubmission sub = python("theorem t : True := trivial\n");
    sub.runner = "lean4";
    sub.syntax_only = true;
    auto job = settings.admit(sub);
    ASSERT_TRUE(job.is_error());
    EXPECT_EQ(job.error().code(), ErrorCode::INVALID_SUBMISSION);
}

TEST_F(AdmitTest, RejectsFormatRunnerMismatch) {
    JobSubmission sub = python("```{r}\nx <- 1\n```\n");
    sub.format = "rmarkdown";
    EXPECT_TRUE(settings.admit(sub).is_error());
    sub.runner = "r";
    EXPECT_TRUE(settings.admit(sub).ok());
}

TEST_F(AdmitTest, RejectsUnsafeNames) {
    JobSubmission sub = python();
    sub.data_files["../escape.csv"] = "1,2";
    EXPECT_EQ(settings.admit(sub).error().code(), ErrorCode::INVALID_SUBMISSION);

    sub = python();
    sub.id = "../../etc/passwd";
    EXPECT_EQ(settings.admit(sub).error().code(), ErrorCode::INVALID_SUBMISSION);

    sub = python();
    ExpectedOutput exp;
    exp.name = "/abs/path";
    exp.content = "1";
    sub.expected = exp;
    EXPECT_EQ(settings.admit(sub).error().code(), ErrorCode::INVALID_SUBMISSION);
}

TEST_F(AdmitTest, ComparatorNeedsExpectedOutput) {
    JobSubmission sub = python();
    sub.comparator = "numerical";
    EXPECT_EQ(settings.admit(sub).error().code(), ErrorCode::INVALID_SUBMISSION);

    ExpectedOutput exp;
    exp.content = "42\n";
    sub.expected = exp;
    auto job = settings.admit(sub);
    ASSERT_TRUE(job.ok());
    EXPECT_EQ(job.value().expected->comparator, ComparatorKind::NUMERICAL);
}

TEST_F(AdmitTest, RejectsBadTolerance) {
    JobSubmission sub = python();
    sub.tolerance.similarity_threshold = 1.5;
    EXPECT_EQ(settings.admit(sub).error().code(), ErrorCode::INVALID_SUBMISSION);
    sub.tolerance.similarity_threshold.reset();
    sub.tolerance.abs_tol = -1;
    EXPECT_EQ(settings.admit(sub).error().code(), ErrorCode::INVALID_SUBMISSION);
}

TEST_F(AdmitTest, SubmissionFromJson) {
    auto parsed = json::parse(
        R"json({"runner": "python", "source": "print(3)", "claim_id": "c-9",
            "expected": {"content": "3\n", "comparator": "numerical"},
            "tolerance": {"abs_tol": 0.5},
            "limits": {"timeout_sec": 10}})json",
        ErrorCode::INVALID_SUBMISSION);
    ASSERT_TRUE(parsed.ok());
    auto sub = json::submission_from_json(parsed.value());
    ASSERT_TRUE(sub.ok()) << sub.error().to_string();
    auto job = settings.admit(sub.value());
    ASSERT_TRUE(job.ok()) << job.error().to_string();
    EXPECT_EQ(job.value().claim_id, "c-9");
    EXPECT_EQ(job.value().limits.timeout_sec, 10);
    EXPECT_DOUBLE_EQ(*job.value().tolerance.abs_tol, 0.5);
    EXPECT_EQ(job.value().expected->comparator, ComparatorKind::NUMERICAL);
}

TEST_F(AdmitTest, SubmissionJsonStructureErrors) {
    auto parsed = json::parse(R"({"runner": 5, "source": "x"})", ErrorCode::INVALID_SUBMISSION);
    ASSERT_TRUE(parsed.ok());
    auto sub = json::submission_from_json(parsed.value());
    ASSERT_TRUE(sub.is_error());
    EXPECT_EQ(sub.error().code(), ErrorCode::INVALID_SUBMISSION);

    auto broken = json::parse("{not json", ErrorCode::INVALID_SUBMISSION);
    ASSERT_TRUE(broken.is_error());
    EXPECT_EQ(broken.error().code(), ErrorCode::INVALID_SUBMISSION);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
