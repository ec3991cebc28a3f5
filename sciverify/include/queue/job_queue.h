/**
 * @file job_queue.h
 * @brief 作业队列
 *
 * 在 StreamBackend 之上维护作业记录与状态：
 *
 *   <records>/<job_id>.json     ← 不可变的作业记录（排他创建）
 *   <records>/<job_id>.status   ← QUEUED / RUNNING / RETRYING / COMPLETED / DEAD_LETTERED
 *
 * 投递语义为至少一次。处理方按 job id 幂等。
 */

#ifndef SCIV_QUEUE_JOB_QUEUE_H
#define SCIV_QUEUE_JOB_QUEUE_H

#include <string>
#include <vector>
#include <memory>
#include <optional>

#include <cerrno>
#include <cstring>

#include <unistd.h>

#include "core/error.h"
#include "core/types.h"
#include "core/logger.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/json_codec.h"
#include "queue/stream_backend.h"

namespace sciv {
namespace queue {

struct JobQueueOptions {
    std::string group = "verify-workers";
    int64_t visibility_ms = 900000;
    int max_attempts = 3;

    static JobQueueOptions from(const QueueSettings &s) {
        JobQueueOptions o;
        o.group = s.group;
        o.visibility_ms = static_cast<int64_t>(s.visibility_timeout_sec) * 1000;
        o.max_attempts = s.max_attempts;
        return o;
    }
};

class JobQueue {
private:
    std::unique_ptr<StreamBackend> backend_;
    std::string records_dir_;
    JobQueueOptions opts_;

    std::string record_path(const std::string &job_id) const {
        return records_dir_ + "/" + job_id + ".json";
    }
    std::string status_path(const std::string &job_id) const {
        return records_dir_ + "/" + job_id + ".status";
    }

public:
    JobQueue(std::unique_ptr<StreamBackend> backend, const std::string &records_dir,
             const JobQueueOptions &opts)
        : backend_(std::move(backend)), records_dir_(records_dir), opts_(opts) {}

    /**
     * @brief 按配置打开文件队列
     *
     * 目录结构：<root>/stream（FileStreamBackend）与 <root>/jobs（作业记录）。
     */
    static Result<std::unique_ptr<JobQueue>> open(const QueueSettings &settings) {
        auto backend = std::make_unique<FileStreamBackend>(settings.root + "/stream");
        SCIV_TRY(backend->init());
        std::string records = settings.root + "/jobs";
        auto made = make_dirs(records, 0700);
        if (made.is_error()) return Error(ErrorCode::QUEUE_UNAVAILABLE, made.error().message());
        return std::make_unique<JobQueue>(std::move(backend), records, JobQueueOptions::from(settings));
    }

    const JobQueueOptions& options() const { return opts_; }
    StreamBackend& backend() { return *backend_; }

    /**
     * @brief 入队
     *
     * 作业记录以排他方式创建，id 已存在时返回 DUPLICATE_JOB。
     * @return 消息 id
     */
    Result<std::string> enqueue(const Job &job) {
        if (!is_safe_relative_name(job.id) || job.id.find('/') != std::string::npos) {
            return SCIV_ERROR(ErrorCode::INVALID_SUBMISSION, "invalid job id: " + job.id);
        }

        auto created = write_file_exclusive(record_path(job.id),
                                            json::write_compact(json::job_to_json(job)), 0600);
        if (created.is_error()) {
            return Error(ErrorCode::QUEUE_UNAVAILABLE, created.error().message());
        }
        if (!created.value()) {
            return SCIV_ERROR(ErrorCode::DUPLICATE_JOB, "job id already exists: " + job.id);
        }

        auto marked = set_status(job.id, JobStatus::QUEUED);
        auto message_id = marked.ok() ? backend_->append(job.id)
                                      : Result<std::string>(marked.error());
        if (message_id.is_error()) {
            // 未进入队列的记录不应占用 id
            for (const auto &path : {status_path(job.id), record_path(job.id)}) {
                if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
                    LOG_WARN << "Cannot remove " << path << ": " << std::strerror(errno);
                }
            }
            return message_id.error();
        }

        LOG_INFO << "Enqueued job " << job.id << " (" << runner_kind_str(job.runner)
                 << ") as message " << message_id.value();
        return message_id.value();
    }

    Result<ClaimBatch> claim(const std::string &consumer, int count, int64_t now = now_ms()) {
        ClaimOptions co;
        co.count = count;
        co.visibility_ms = opts_.visibility_ms;
        co.max_attempts = opts_.max_attempts;
        return backend_->claim(opts_.group, consumer, co, now);
    }

    Result<void> ack(const std::string &message_id) {
        return backend_->ack(opts_.group, message_id);
    }

    Result<void> release(const QueueMessage &msg, int64_t delay_ms, bool charge,
                         const std::string &last_error = "", int64_t now = now_ms()) {
        return backend_->release(opts_.group, msg.message_id, delay_ms, charge, last_error, now);
    }

    Result<void> dead_letter(const QueueMessage &msg, const std::string &reason,
                             int64_t now = now_ms()) {
        return backend_->dead_letter(msg, reason, now);
    }

    /**
     * @brief 读取作业记录
     *
     * 记录不存在返回 NOT_FOUND，记录损坏返回 MALFORMED_JOB。
     */
    Result<Job> load_job(const std::string &job_id) const {
        if (!is_safe_relative_name(job_id) || job_id.find('/') != std::string::npos) {
            return SCIV_ERROR(ErrorCode::MALFORMED_JOB, "invalid job id: " + job_id);
        }
        auto text = read_file(record_path(job_id));
        if (text.is_error()) {
            if (text.error().code() == ErrorCode::FILE_NOT_FOUND) {
                return SCIV_ERROR(ErrorCode::NOT_FOUND, "no job record for " + job_id);
            }
            return Error(ErrorCode::QUEUE_UNAVAILABLE, text.error().message());
        }
        SCIV_TRY_UNWRAP(v, json::parse(text.value(), ErrorCode::MALFORMED_JOB));
        return json::job_from_json(v);
    }

    Result<void> set_status(const std::string &job_id, JobStatus status) {
        auto r = write_file_atomic(status_path(job_id), job_status_str(status), 0600);
        if (r.is_error()) return Error(ErrorCode::QUEUE_UNAVAILABLE, r.error().message());
        return Ok();
    }

    /**
     * @brief 作业状态；作业不存在时为 nullopt
     */
    Result<std::optional<JobStatus>> status(const std::string &job_id) const {
        if (!is_safe_relative_name(job_id) || job_id.find('/') != std::string::npos) {
            return std::optional<JobStatus>();
        }
        auto text = read_file(status_path(job_id));
        if (text.is_error()) {
            if (text.error().code() == ErrorCode::FILE_NOT_FOUND) {
                return std::optional<JobStatus>();
            }
            return Error(ErrorCode::QUEUE_UNAVAILABLE, text.error().message());
        }
        auto s = parse_job_status(text.value());
        if (!s) {
            return SCIV_ERROR(ErrorCode::QUEUE_UNAVAILABLE,
                              "corrupt status record for " + job_id);
        }
        return s;
    }
};

} // namespace queue
} // namespace sciv

#endif // SCIV_QUEUE_JOB_QUEUE_H
