/**
 * @file pipeline.h
 * @brief 单条消息的处理流程
 *
 * 队列投递 Job -> 运行器构造 ExecutionSpec -> 沙箱执行 -> 运行器解释
 * -> 比较器（若有期望输出）-> 等级判定 -> 签名 -> 存储 -> ack
 *
 * 错误分类：
 * | 类别         | 处理                                               |
 * |--------------|----------------------------------------------------|
 * | 瞬时故障     | 不计次释放，稍后重投                               |
 * | 作业致命     | 签名 L0 并 ack，不重试                             |
 * | 资源耗尽     | 计次释放；达到上限后走死信，签名 L0 "retries exhausted" |
 * | 签名失败     | worker 致命，消息不 ack，留待其它消费者回收        |
 */

#ifndef SCIV_WORKER_PIPELINE_H
#define SCIV_WORKER_PIPELINE_H

#include <string>
#include <optional>
#include <algorithm>

#include "core/error.h"
#include "core/types.h"
#include "core/logger.h"
#include "core/utils.h"
#include "core/config.h"
#include "runners/runner.h"
#include "comparators/comparator.h"
#include "level/level_resolver.h"
#include "sandbox/sandbox_manager.h"
#include "queue/job_queue.h"
#include "queue/result_store.h"
#include "signing/signer.h"

namespace sciv {
namespace worker {

/**
 * @brief 消息处理后的去向
 */
enum class Disposition {
    ACKED,             ///< 已有终态结果并确认
    RETRY_CHARGED,     ///< 资源耗尽，计次释放
    RETRY_UNCHARGED,   ///< 瞬时故障，不计次释放
    WORKER_FATAL       ///< 签名失败，worker 应停止
};

inline const char* disposition_str(Disposition d) {
    switch (d) {
        case Disposition::ACKED: return "acked";
        case Disposition::RETRY_CHARGED: return "retry_charged";
        case Disposition::RETRY_UNCHARGED: return "retry_uncharged";
        case Disposition::WORKER_FATAL: return "worker_fatal";
    }
    return "unknown";
}

struct Outcome {
    Disposition disposition = Disposition::ACKED;
    std::optional<VerificationResult> result;
    std::string detail;
    bool executed = false;   ///< 本次是否真正进入了沙箱
};

struct PipelineOptions {
    int max_attempts = 3;
    int retry_backoff_ms = 1000;
    int max_backoff_ms = 30000;
    size_t excerpt_bytes = 1000;

    static PipelineOptions from(const Settings &s) {
        PipelineOptions o;
        o.max_attempts = s.queue.max_attempts;
        o.retry_backoff_ms = s.queue.retry_backoff_ms;
        o.max_backoff_ms = s.queue.max_backoff_ms;
        return o;
    }
};

class Pipeline {
private:
    queue::JobQueue &queue_;
    queue::ResultStore &store_;
    sandbox::SandboxManager &sandbox_;
    const signing::Signer &signer_;
    comparators::ToleranceDefaults defaults_;
    PipelineOptions opts_;

    //==========================================================================
    // 结果构造
    //==========================================================================

    static VerificationResult l0_result(const std::string &job_id, const std::string &detail) {
        VerificationResult r;
        r.job_id = job_id;
        r.level = VerificationLevel::L0;
        r.passed = false;
        r.detail = detail;
        return r;
    }

    SandboxSummary summarize(const SandboxResult &raw) const {
        SandboxSummary s;
        s.status = raw.status;
        s.exit_code = raw.exit_code;
        s.term_signal = raw.term_signal;
        s.duration_ms = raw.duration_ms;
        s.peak_memory_kb = raw.peak_memory_kb;
        s.image = raw.image;
        s.stdout_excerpt = excerpt(raw.stdout_text, opts_.excerpt_bytes);
        s.stderr_excerpt = excerpt(raw.stderr_text, opts_.excerpt_bytes);
        return s;
    }

    /**
     * @brief 期望输出与实际输出的比较
     */
    ComparisonVerdict compare_expected(const Job &job, const SandboxResult &raw) const {
        const ExpectedOutput &exp = *job.expected;
        if (exp.targets_stdout()) {
            return comparators::compare(raw.stdout_text, exp.content, exp.comparator,
                                        job.tolerance, defaults_);
        }
        auto it = raw.output_files.find(exp.name);
        if (it == raw.output_files.end()) {
            ComparisonVerdict v;
            v.kind = exp.comparator;
            v.matched = false;
            v.score = 0.0;
            v.confidence = exp.comparator == ComparatorKind::EXACT ? Confidence::BINARY
                         : exp.comparator == ComparatorKind::NUMERICAL ? Confidence::BOUNDED
                         : Confidence::APPROXIMATE;
            v.detail = "output file not produced: /output/" + exp.name;
            return v;
        }
        return comparators::compare(it->second, exp.content, exp.comparator,
                                    job.tolerance, defaults_);
    }

    /**
     * @brief 在沙箱中验证一个作业，返回未签名的结果
     *
     * 资源耗尽以 EXECUTION_TIMEOUT / RESOURCE_KILLED 错误返回。
     */
    Result<VerificationResult> verify(const Job &job) {
        runners::Runner runner = runners::make_runner(job.runner);

        auto spec = job.syntax_only ? runners::build_syntax_spec(runner, job)
                                    : runners::build_spec(runner, job);
        if (spec.is_error()) return spec.error();

        SCIV_TRY_UNWRAP(raw, sandbox_.execute(spec.value()));

        if (raw.status == ExitStatus::TIMEOUT) {
            return SCIV_ERROR(ErrorCode::EXECUTION_TIMEOUT, "timeout: " + raw.detail);
        }
        if (raw.status == ExitStatus::RESOURCE_KILLED) {
            return SCIV_ERROR(ErrorCode::RESOURCE_KILLED, "resource_killed: " + raw.detail);
        }

        RunnerVerdict rv = runners::interpret(runner, raw, job.syntax_only);

        std::optional<ComparisonVerdict> comparison;
        if (rv.signal == Signal::EXECUTION_SUCCEEDED && job.expected &&
            job.runner != RunnerKind::LEAN4) {
            comparison = compare_expected(job, raw);
        }

        VerificationResult r;
        r.job_id = job.id;
        r.claim_id = job.claim_id;
        r.code_hash = job.code_hash;
        r.level = resolve_level(rv.signal, comparison, job.runner);
        r.passed = is_passing(rv.signal, comparison);
        r.sandbox = summarize(raw);
        r.comparison = comparison;

        if (!rv.detail.empty()) {
            r.detail = rv.detail;
        } else if (comparison) {
            r.detail = comparison->detail;
        } else if (rv.formally_proven) {
            r.detail = "proof checked";
        } else {
            r.detail = signal_str(rv.signal);
        }
        return r;
    }

    int64_t backoff_ms(int attempts) const {
        int64_t delay = opts_.retry_backoff_ms;
        for (int i = 1; i < attempts && delay < opts_.max_backoff_ms; i++) {
            delay *= 2;
        }
        return std::min<int64_t>(delay, opts_.max_backoff_ms);
    }

    //==========================================================================
    // 终态
    //==========================================================================

    /**
     * @brief 签名、存储、更新状态并 ack
     */
    Outcome finalize(VerificationResult r, const QueueMessage &msg, JobStatus terminal) {
        r.attempts = msg.attempts;
        r.completed_at_ms = now_ms();

        auto sealed = signer_.seal_into(r);
        if (sealed.is_error()) {
            LOG_FATAL << "Job " << msg.job_id << ": signing failed: " << sealed.error().to_string();
            return {Disposition::WORKER_FATAL, std::nullopt, sealed.error().message()};
        }

        auto stored = store_.put_if_absent(r);
        if (stored.is_error()) {
            LOG_ERROR << "Job " << msg.job_id << ": cannot store result: " << stored.error().message();
            return retry_uncharged(msg, stored.error());
        }
        if (!stored.value()) {
            // 并发的另一次投递先写入了结果，以已存结果为准
            auto existing = store_.get(msg.job_id);
            if (existing.ok() && existing.value()) {
                r = *existing.value();
            }
        }

        auto marked = queue_.set_status(msg.job_id, terminal);
        if (marked.is_error()) {
            LOG_WARN << "Job " << msg.job_id << ": cannot record status: " << marked.error().message();
        }
        auto acked = queue_.ack(msg.message_id);
        if (acked.is_error()) {
            // 消息会被重投，届时由结果存储判定为已完成
            LOG_WARN << "Job " << msg.job_id << ": ack failed: " << acked.error().message();
        }

        LOG_INFO << "Job " << msg.job_id << " completed: " << level_str(r.level)
                 << (r.passed ? " passed" : " failed") << " (" << r.content_address << ")";
        return {Disposition::ACKED, r, r.detail};
    }

    Outcome retry_uncharged(const QueueMessage &msg, const Error &err) {
        auto released = queue_.release(msg, opts_.retry_backoff_ms, false, err.message());
        if (released.is_error()) {
            LOG_WARN << "Job " << msg.job_id << ": release failed, waiting for visibility timeout: "
                     << released.error().message();
        }
        auto marked = queue_.set_status(msg.job_id, JobStatus::QUEUED);
        if (marked.is_error()) {
            LOG_WARN << "Job " << msg.job_id << ": cannot record status: " << marked.error().message();
        }
        return {Disposition::RETRY_UNCHARGED, std::nullopt, err.message()};
    }

    Outcome retry_charged(const QueueMessage &msg, const Error &err) {
        std::string last = "L0 " + err.message();
        auto released = queue_.release(msg, backoff_ms(msg.attempts), true, last);
        if (released.is_error()) {
            LOG_WARN << "Job " << msg.job_id << ": release failed, waiting for visibility timeout: "
                     << released.error().message();
        }
        auto marked = queue_.set_status(msg.job_id, JobStatus::RETRYING);
        if (marked.is_error()) {
            LOG_WARN << "Job " << msg.job_id << ": cannot record status: " << marked.error().message();
        }
        LOG_WARN << "Job " << msg.job_id << " attempt " << msg.attempts << "/" << opts_.max_attempts
                 << " exhausted resources: " << err.message();
        return {Disposition::RETRY_CHARGED, std::nullopt, last};
    }

    /**
     * @brief 已有结果时直接确认，不再执行
     *
     * 已存结果损坏时隔离该文件，按未完成处理。
     */
    std::optional<Outcome> already_done(const QueueMessage &msg) {
        auto existing = store_.get(msg.job_id);
        if (existing.is_error() && existing.error().code() == ErrorCode::CORRUPT_RECORD) {
            LOG_ERROR << "Job " << msg.job_id << ": " << existing.error().message();
            auto moved = store_.quarantine(msg.job_id);
            if (moved.is_error()) {
                return retry_uncharged(msg, moved.error());
            }
            return std::nullopt;
        }
        if (existing.is_error()) {
            return retry_uncharged(msg, existing.error());
        }
        if (!existing.value()) {
            return std::nullopt;
        }
        LOG_INFO << "Job " << msg.job_id << " already has a signed result, acknowledging redelivery";
        auto acked = queue_.ack(msg.message_id);
        if (acked.is_error()) {
            LOG_WARN << "Job " << msg.job_id << ": ack failed: " << acked.error().message();
        }
        return Outcome{Disposition::ACKED, *existing.value(), "already completed"};
    }

public:
    Pipeline(queue::JobQueue &queue, queue::ResultStore &store, sandbox::SandboxManager &sandbox,
             const signing::Signer &signer, const comparators::ToleranceDefaults &defaults,
             const PipelineOptions &opts)
        : queue_(queue), store_(store), sandbox_(sandbox), signer_(signer),
          defaults_(defaults), opts_(opts) {}

    /**
     * @brief 处理一条新投递的消息
     */
    Outcome handle(const QueueMessage &msg) {
        if (auto done = already_done(msg)) {
            return *done;
        }

        auto marked = queue_.set_status(msg.job_id, JobStatus::RUNNING);
        if (marked.is_error()) {
            return retry_uncharged(msg, marked.error());
        }

        auto job = queue_.load_job(msg.job_id);
        if (job.is_error()) {
            const Error &e = job.error();
            if (e.code() == ErrorCode::NOT_FOUND || is_job_fatal(e.code())) {
                LOG_ERROR << "Job " << msg.job_id << " is malformed: " << e.message();
                return finalize(l0_result(msg.job_id, "malformed job: " + e.message()),
                                msg, JobStatus::COMPLETED);
            }
            return retry_uncharged(msg, e);
        }

        LOG_INFO << "Job " << msg.job_id << " started (" << runner_kind_str(job.value().runner)
                 << ", attempt " << msg.attempts << "/" << opts_.max_attempts << ")";

        auto verified = verify(job.value());
        if (verified.ok()) {
            VerificationResult r = std::move(verified).value();
            Outcome out = finalize(std::move(r), msg, JobStatus::COMPLETED);
            out.executed = true;
            return out;
        }

        const Error &e = verified.error();
        if (is_job_fatal(e.code())) {
            VerificationResult r = l0_result(msg.job_id, e.message());
            r.claim_id = job.value().claim_id;
            r.code_hash = job.value().code_hash;
            return finalize(r, msg, JobStatus::COMPLETED);
        }
        if (is_resource_exhaustion(e.code())) {
            if (msg.attempts >= opts_.max_attempts) {
                QueueMessage last = msg;
                last.last_error = "L0 " + e.message();
                Outcome out = handle_exhausted(last);
                out.executed = true;
                return out;
            }
            Outcome out = retry_charged(msg, e);
            out.executed = true;
            return out;
        }
        if (is_signing_error(e.code())) {
            LOG_FATAL << "Job " << msg.job_id << ": " << e.to_string();
            return {Disposition::WORKER_FATAL, std::nullopt, e.message()};
        }

        LOG_WARN << "Job " << msg.job_id << ": transient failure: " << e.to_string();
        return retry_uncharged(msg, e);
    }

    /**
     * @brief 把已 claim 但尚未处理的消息交还队列，立即可见
     *
     * 普通消息退还本次尝试；exhausted 消息按计次释放，下次 claim 仍归入 exhausted。
     */
    Result<void> defer(const QueueMessage &msg, bool exhausted) {
        return queue_.release(msg, 0, exhausted);
    }

    /**
     * @brief 处理已达尝试上限的消息：记入死信并签名 L0，不再执行
     */
    Outcome handle_exhausted(const QueueMessage &msg) {
        if (auto done = already_done(msg)) {
            return *done;
        }

        std::string detail = "retries exhausted after " + std::to_string(msg.attempts) + " attempts";
        if (!msg.last_error.empty()) {
            detail += ": " + msg.last_error;
        }
        VerificationResult r = l0_result(msg.job_id, detail);
        auto job = queue_.load_job(msg.job_id);
        if (job.ok()) {
            r.claim_id = job.value().claim_id;
            r.code_hash = job.value().code_hash;
        }

        auto lettered = queue_.dead_letter(msg, detail);
        if (lettered.is_error()) {
            return retry_uncharged(msg, lettered.error());
        }
        LOG_WARN << "Job " << msg.job_id << " dead-lettered: " << detail;
        return finalize(r, msg, JobStatus::DEAD_LETTERED);
    }
};

} // namespace worker
} // namespace sciv

#endif // SCIV_WORKER_PIPELINE_H
