/**
 * @file result_store.h
 * @brief 已签名结果的存储与查询
 *
 * 每个作业至多一个结果文件 <dir>/<job_id>.json，以排他 link 写入，写入后不再修改。
 * 超过保留期的结果视为不存在，由 purge_expired 删除。
 */

#ifndef SCIV_QUEUE_RESULT_STORE_H
#define SCIV_QUEUE_RESULT_STORE_H

#include <string>
#include <optional>
#include <filesystem>
#include <system_error>
#include <cstdio>
#include <cerrno>
#include <cstring>

#include "core/error.h"
#include "core/types.h"
#include "core/logger.h"
#include "core/utils.h"
#include "core/json_codec.h"
#include "queue/job_queue.h"

namespace sciv {
namespace queue {

/**
 * @brief 查询结果：Found(result) | Pending(status) | NotFound
 */
struct Lookup {
    enum Kind { FOUND, PENDING, NOT_FOUND };

    Kind kind = NOT_FOUND;
    std::optional<VerificationResult> result;
    std::optional<JobStatus> status;

    static Lookup found(VerificationResult r) {
        Lookup l;
        l.kind = FOUND;
        l.result = std::move(r);
        return l;
    }
    static Lookup pending(JobStatus s) {
        Lookup l;
        l.kind = PENDING;
        l.status = s;
        return l;
    }
    static Lookup not_found() { return Lookup(); }
};

class ResultStore {
private:
    std::string dir_;
    int64_t retention_ms_;
    const JobQueue *queue_;

    std::string path_for(const std::string &job_id) const {
        return dir_ + "/" + job_id + ".json";
    }

    bool expired(const VerificationResult &r, int64_t now) const {
        return r.completed_at_ms + retention_ms_ <= now;
    }

public:
    /**
     * @param queue 用于回答 Pending 状态，可为空
     */
    ResultStore(const std::string &dir, int retention_hours, const JobQueue *queue = nullptr)
        : dir_(dir), retention_ms_(static_cast<int64_t>(retention_hours) * 3600 * 1000),
          queue_(queue) {}

    Result<void> init() {
        auto r = make_dirs(dir_, 0700);
        if (r.is_error()) return Error(ErrorCode::QUEUE_UNAVAILABLE, r.error().message());
        return Ok();
    }

    const std::string& dir() const { return dir_; }

    /**
     * @brief 写入已签名结果
     * @return false 表示该作业已有结果，未覆盖
     */
    Result<bool> put_if_absent(const VerificationResult &result) {
        if (!result.is_sealed()) {
            return SCIV_ERROR(ErrorCode::SIGNING_FAILED,
                              "refusing to store unsigned result for " + result.job_id);
        }
        auto created = write_file_exclusive(path_for(result.job_id),
                                            json::write_pretty(json::result_to_json(result)), 0644);
        if (created.is_error()) {
            return Error(ErrorCode::QUEUE_UNAVAILABLE, created.error().message());
        }
        if (!created.value()) {
            LOG_WARN << "Result for job " << result.job_id << " already stored, keeping the first";
        }
        return created.value();
    }

    /**
     * @brief 读取已存结果，不考虑保留期
     *
     * 文件无法解析时返回 CORRUPT_RECORD。
     */
    Result<std::optional<VerificationResult>> get(const std::string &job_id) const {
        if (!is_safe_relative_name(job_id) || job_id.find('/') != std::string::npos) {
            return std::optional<VerificationResult>();
        }
        auto text = read_file(path_for(job_id));
        if (text.is_error()) {
            if (text.error().code() == ErrorCode::FILE_NOT_FOUND) {
                return std::optional<VerificationResult>();
            }
            return Error(ErrorCode::QUEUE_UNAVAILABLE, text.error().message());
        }
        auto v = json::parse(text.value(), ErrorCode::CORRUPT_RECORD);
        auto r = v.ok() ? json::result_from_json(v.value()) : Result<VerificationResult>(v.error());
        if (r.is_error()) {
            return SCIV_ERROR(ErrorCode::CORRUPT_RECORD,
                              "corrupt result for " + job_id + ": " + r.error().message());
        }
        return std::optional<VerificationResult>(r.value());
    }

    /**
     * @brief 损坏的结果文件改名为 <job_id>.json.corrupt，之后可重新写入
     */
    Result<void> quarantine(const std::string &job_id) {
        std::string path = path_for(job_id);
        std::string target = path + ".corrupt";
        if (std::rename(path.c_str(), target.c_str()) != 0 && errno != ENOENT) {
            return SCIV_ERROR(ErrorCode::QUEUE_UNAVAILABLE,
                              "quarantine " + path + ": " + std::strerror(errno));
        }
        LOG_ERROR << "Quarantined corrupt result " << target;
        return Ok();
    }

    Result<Lookup> lookup(const std::string &job_id, int64_t now = now_ms()) const {
        SCIV_TRY_UNWRAP(stored, get(job_id));
        if (stored) {
            if (expired(*stored, now)) return Lookup::not_found();
            return Lookup::found(*stored);
        }
        if (queue_) {
            SCIV_TRY_UNWRAP(status, queue_->status(job_id));
            if (status && *status != JobStatus::COMPLETED && *status != JobStatus::DEAD_LETTERED) {
                return Lookup::pending(*status);
            }
        }
        return Lookup::not_found();
    }

    /**
     * @brief 删除超过保留期的结果
     * @return 删除的数量
     */
    Result<int> purge_expired(int64_t now = now_ms()) {
        namespace fs = std::filesystem;
        int removed = 0;
        std::error_code ec;
        fs::directory_iterator it(dir_, ec), end;
        if (ec) {
            return SCIV_ERROR(ErrorCode::QUEUE_UNAVAILABLE, "list " + dir_ + ": " + ec.message());
        }
        for (; it != end; it.increment(ec)) {
            if (ec) break;
            const fs::path &p = it->path();
            if (p.extension() != ".json") continue;

            auto r = get(p.stem().string());
            if (r.is_error()) {
                LOG_WARN << "Skipping unreadable result " << p.string() << ": "
                         << r.error().message();
                continue;
            }
            if (!r.value() || !expired(*r.value(), now)) continue;

            std::error_code rm_ec;
            fs::remove(p, rm_ec);
            if (rm_ec) {
                LOG_WARN << "Cannot remove expired result " << p.string() << ": " << rm_ec.message();
                continue;
            }
            removed++;
        }
        if (ec) {
            return SCIV_ERROR(ErrorCode::QUEUE_UNAVAILABLE, "list " + dir_ + ": " + ec.message());
        }
        if (removed > 0) {
            LOG_INFO << "Purged " << removed << " expired results";
        }
        return removed;
    }
};

} // namespace queue
} // namespace sciv

#endif // SCIV_QUEUE_RESULT_STORE_H
