/**
 * @file stream_backend.h
 * @brief 队列后端：持久、有序、至少一次投递
 *
 * FileStreamBackend 的目录结构：
 *
 *   <root>/
 *   ├── lock                         ← 每次 append / claim / ack / release 持有的排他 flock
 *   ├── seq                          ← 下一个序号
 *   ├── stream/<seq>.json            ← 消息记录（job id、入队时间）
 *   ├── groups/<group>/cursor        ← 已分配给该组的最大序号
 *   ├── groups/<group>/pending/<seq>.json
 *   └── deadletter/<seq>.json
 *
 * 所有写入都是写临时文件再 rename。
 */

#ifndef SCIV_QUEUE_STREAM_BACKEND_H
#define SCIV_QUEUE_STREAM_BACKEND_H

#include <string>
#include <vector>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <cstdio>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>

#include "core/error.h"
#include "core/types.h"
#include "core/logger.h"
#include "core/utils.h"
#include "core/json_codec.h"

namespace sciv {
namespace queue {

namespace fs = std::filesystem;

//==============================================================================
// 后端接口
//==============================================================================

/**
 * @brief 一次 claim 的结果
 *
 * exhausted 中的消息已达尝试上限，不得再执行，只能走死信路径。
 */
struct ClaimBatch {
    std::vector<QueueMessage> messages;
    std::vector<QueueMessage> exhausted;

    bool empty() const { return messages.empty() && exhausted.empty(); }
};

struct ClaimOptions {
    int count = 1;
    int64_t visibility_ms = 900000;
    int max_attempts = 3;
};

class StreamBackend {
public:
    virtual ~StreamBackend() = default;

    /// 追加消息，返回消息 id
    virtual Result<std::string> append(const std::string &job_id) = 0;

    /**
     * @brief 原子地分配未投递消息与可见性超时已过的消息
     */
    virtual Result<ClaimBatch> claim(const std::string &group, const std::string &consumer,
                                     const ClaimOptions &opts, int64_t now) = 0;

    /// 确认；消息不在 pending 中时视为已确认
    virtual Result<void> ack(const std::string &group, const std::string &message_id) = 0;

    /**
     * @brief 让已 claim 的消息在 delay_ms 后重新可见
     * @param charge false 时退还本次尝试；本次投递未计次（exhausted）时不退还
     */
    virtual Result<void> release(const std::string &group, const std::string &message_id,
                                 int64_t delay_ms, bool charge, const std::string &last_error,
                                 int64_t now) = 0;

    /// 记入死信账本（不确认，由调用方随后 ack）
    virtual Result<void> dead_letter(const QueueMessage &msg, const std::string &reason,
                                     int64_t now) = 0;

    virtual Result<std::vector<QueueMessage>> list_pending(const std::string &group) = 0;

    virtual Result<std::vector<QueueMessage>> list_dead_letters() = 0;
};

//==============================================================================
// 文件锁
//==============================================================================

/**
 * @brief flock 排他锁，析构时释放
 */
class FileLock {
private:
    int fd_;

public:
    FileLock() : fd_(-1) {}
    ~FileLock() { unlock(); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    Result<void> acquire(const std::string &path) {
        unlock();
        fd_ = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            return SCIV_ERROR(ErrorCode::QUEUE_UNAVAILABLE,
                              "open lock " + path + ": " + std::strerror(errno));
        }
        while (flock(fd_, LOCK_EX) < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            close(fd_);
            fd_ = -1;
            return SCIV_ERROR(ErrorCode::QUEUE_UNAVAILABLE,
                              "flock " + path + ": " + std::strerror(saved));
        }
        return Ok();
    }

    void unlock() {
        if (fd_ >= 0) {
            flock(fd_, LOCK_UN);
            close(fd_);
            fd_ = -1;
        }
    }
};

//==============================================================================
// 文件后端
//==============================================================================

class FileStreamBackend : public StreamBackend {
private:
    std::string root_;

    static std::string seq_name(uint64_t seq) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(seq));
        return buf;
    }

    std::string group_dir(const std::string &group) const { return root_ + "/groups/" + group; }
    std::string pending_path(const std::string &group, const std::string &id) const {
        return group_dir(group) + "/pending/" + id + ".json";
    }

    Result<void> lock(FileLock &l) const { return l.acquire(root_ + "/lock"); }

    static Result<uint64_t> read_counter(const std::string &path) {
        if (!file_exists(path)) return uint64_t(0);
        SCIV_TRY_UNWRAP(text, read_file(path));
        errno = 0;
        char *end = nullptr;
        unsigned long long v = std::strtoull(text.c_str(), &end, 10);
        if (errno != 0 || end == text.c_str()) {
            return SCIV_ERROR(ErrorCode::QUEUE_UNAVAILABLE, "corrupt counter " + path);
        }
        return static_cast<uint64_t>(v);
    }

    static Result<void> write_counter(const std::string &path, uint64_t v) {
        auto r = write_file_atomic(path, std::to_string(v), 0600);
        if (r.is_error()) return Error(ErrorCode::QUEUE_UNAVAILABLE, r.error().message());
        return Ok();
    }

    /**
     * @brief 按文件名排序列出目录中的 .json 文件
     */
    static Result<std::vector<std::string>> sorted_entries(const std::string &dir) {
        std::vector<std::string> names;
        std::error_code ec;
        fs::directory_iterator it(dir, ec), end;
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory) return names;
            return SCIV_ERROR(ErrorCode::QUEUE_UNAVAILABLE, "list " + dir + ": " + ec.message());
        }
        for (; it != end; it.increment(ec)) {
            if (ec) break;
            std::string name = it->path().filename().string();
            if (name.size() > 5 && name.compare(name.size() - 5, 5, ".json") == 0) {
                names.push_back(name.substr(0, name.size() - 5));
            }
        }
        if (ec) {
            return SCIV_ERROR(ErrorCode::QUEUE_UNAVAILABLE, "list " + dir + ": " + ec.message());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    struct Pending {
        QueueMessage msg;
        int64_t visible_at_ms = 0;
        bool charged = false;   ///< 本次投递是否计入了 attempts
    };

    Result<Pending> read_pending(const std::string &path) const {
        auto text = read_file(path);
        if (text.is_error()) return Error(ErrorCode::QUEUE_UNAVAILABLE, text.error().message());
        SCIV_TRY_UNWRAP(v, json::parse(text.value(), ErrorCode::QUEUE_UNAVAILABLE));
        SCIV_TRY_UNWRAP(msg, json::message_from_json(v));
        Pending p;
        p.msg = msg;
        p.visible_at_ms = v["visible_at_ms"].asInt64();
        p.charged = v.get("charged", false).asBool();
        return p;
    }

    Result<void> write_pending(const Pending &p) const {
        Json::Value v = json::message_to_json(p.msg);
        v["visible_at_ms"] = static_cast<Json::Int64>(p.visible_at_ms);
        v["charged"] = p.charged;
        auto r = write_file_atomic(pending_path(p.msg.group, p.msg.message_id),
                                   json::write_compact(v), 0600);
        if (r.is_error()) return Error(ErrorCode::QUEUE_UNAVAILABLE, r.error().message());
        return Ok();
    }

    /// 损坏的条目改名隔离，避免阻塞后续消息
    static void quarantine(const std::string &path) {
        std::string target = path + ".corrupt";
        if (std::rename(path.c_str(), target.c_str()) != 0) {
            LOG_ERROR << "Cannot quarantine " << path << ": " << std::strerror(errno);
        }
    }

    /**
     * @brief 读取 stream 记录中的 job id
     */
    static Result<std::string> read_stream_record(const std::string &path) {
        SCIV_TRY_UNWRAP(text, read_file(path));
        SCIV_TRY_UNWRAP(v, json::parse(text, ErrorCode::QUEUE_UNAVAILABLE));
        if (!v.isObject() || !v["job_id"].isString() || v["job_id"].asString().empty()) {
            return SCIV_ERROR(ErrorCode::QUEUE_UNAVAILABLE, "missing job_id");
        }
        return v["job_id"].asString();
    }

    void deliver(Pending &p, const std::string &consumer, int64_t visibility_ms, int64_t now) const {
        p.msg.consumer = consumer;
        p.msg.delivery_count++;
        p.msg.last_delivered_ms = now;
        if (p.msg.first_delivered_ms == 0) p.msg.first_delivered_ms = now;
        p.visible_at_ms = now + visibility_ms;
    }

public:
    explicit FileStreamBackend(const std::string &root) : root_(root) {}

    /**
     * @brief 创建目录结构
     */
    Result<void> init() {
        for (const char *sub : {"", "/stream", "/groups", "/deadletter"}) {
            auto r = make_dirs(root_ + sub, 0700);
            if (r.is_error()) return Error(ErrorCode::QUEUE_UNAVAILABLE, r.error().message());
        }
        return Ok();
    }

    const std::string& root() const { return root_; }

    Result<std::string> append(const std::string &job_id) override {
        FileLock l;
        SCIV_TRY(lock(l));

        SCIV_TRY_UNWRAP(seq, read_counter(root_ + "/seq"));
        uint64_t next = seq + 1;
        std::string id = seq_name(next);

        Json::Value v(Json::objectValue);
        v["message_id"] = id;
        v["job_id"] = job_id;
        v["enqueued_at_ms"] = static_cast<Json::Int64>(now_ms());
        auto w = write_file_atomic(root_ + "/stream/" + id + ".json", json::write_compact(v), 0600);
        if (w.is_error()) return Error(ErrorCode::QUEUE_UNAVAILABLE, w.error().message());
        SCIV_TRY(write_counter(root_ + "/seq", next));
        return id;
    }

    Result<ClaimBatch> claim(const std::string &group, const std::string &consumer,
                             const ClaimOptions &opts, int64_t now) override {
        FileLock l;
        SCIV_TRY(lock(l));

        std::string gdir = group_dir(group);
        auto made = make_dirs(gdir + "/pending", 0700);
        if (made.is_error()) return Error(ErrorCode::QUEUE_UNAVAILABLE, made.error().message());

        ClaimBatch batch;
        int remaining = opts.count;

        // 1. 可见性超时已过的 pending 消息
        SCIV_TRY_UNWRAP(pending, sorted_entries(gdir + "/pending"));
        for (const auto &id : pending) {
            if (remaining <= 0) break;
            std::string path = pending_path(group, id);
            auto p = read_pending(path);
            if (p.is_error()) {
                LOG_ERROR << "Corrupt pending entry " << path << ": " << p.error().message();
                quarantine(path);
                continue;
            }
            Pending entry = p.value();
            if (entry.visible_at_ms > now) continue;

            deliver(entry, consumer, opts.visibility_ms, now);
            if (entry.msg.attempts >= opts.max_attempts) {
                entry.charged = false;
                SCIV_TRY(write_pending(entry));
                batch.exhausted.push_back(entry.msg);
            } else {
                entry.msg.attempts++;
                entry.charged = true;
                SCIV_TRY(write_pending(entry));
                batch.messages.push_back(entry.msg);
            }
            remaining--;
        }

        // 2. 从游标之后取新消息
        if (remaining > 0) {
            SCIV_TRY_UNWRAP(cursor, read_counter(gdir + "/cursor"));
            SCIV_TRY_UNWRAP(seq, read_counter(root_ + "/seq"));
            uint64_t pos = cursor;
            while (remaining > 0 && pos < seq) {
                pos++;
                std::string id = seq_name(pos);
                std::string path = root_ + "/stream/" + id + ".json";
                auto job_id = read_stream_record(path);
                if (job_id.is_error()) {
                    // 游标越过损坏的记录，后续消息照常投递
                    LOG_ERROR << "Corrupt stream record " << path << ": " << job_id.error().message();
                    if (job_id.error().code() != ErrorCode::FILE_NOT_FOUND) quarantine(path);
                    continue;
                }

                Pending entry;
                entry.msg.message_id = id;
                entry.msg.job_id = job_id.value();
                entry.msg.group = group;
                deliver(entry, consumer, opts.visibility_ms, now);
                entry.msg.attempts = 1;
                entry.charged = true;
                SCIV_TRY(write_pending(entry));
                batch.messages.push_back(entry.msg);
                remaining--;
            }
            if (pos != cursor) {
                SCIV_TRY(write_counter(gdir + "/cursor", pos));
            }
        }
        return batch;
    }

    Result<void> ack(const std::string &group, const std::string &message_id) override {
        FileLock l;
        SCIV_TRY(lock(l));
        std::string path = pending_path(group, message_id);
        if (::unlink(path.c_str()) < 0 && errno != ENOENT) {
            return SCIV_ERROR(ErrorCode::QUEUE_UNAVAILABLE, "ack " + path + ": " + std::strerror(errno));
        }
        return Ok();
    }

    Result<void> release(const std::string &group, const std::string &message_id,
                         int64_t delay_ms, bool charge, const std::string &last_error,
                         int64_t now) override {
        FileLock l;
        SCIV_TRY(lock(l));
        std::string path = pending_path(group, message_id);
        if (!file_exists(path)) {
            return SCIV_ERROR(ErrorCode::NOT_FOUND, "message not pending: " + message_id);
        }
        SCIV_TRY_UNWRAP(entry, read_pending(path));
        entry.visible_at_ms = now + delay_ms;
        // 只退还本次投递计入的那一次；以 exhausted 投递的消息没有可退的次数
        if (!charge && entry.charged && entry.msg.attempts > 0) {
            entry.msg.attempts--;
        }
        entry.charged = false;
        if (!last_error.empty()) {
            entry.msg.last_error = last_error;
        }
        return write_pending(entry);
    }

    Result<void> dead_letter(const QueueMessage &msg, const std::string &reason, int64_t now) override {
        FileLock l;
        SCIV_TRY(lock(l));
        Json::Value v = json::message_to_json(msg);
        v["reason"] = reason;
        v["dead_lettered_at_ms"] = static_cast<Json::Int64>(now);
        auto r = write_file_atomic(root_ + "/deadletter/" + msg.message_id + ".json",
                                   json::write_compact(v), 0600);
        if (r.is_error()) return Error(ErrorCode::QUEUE_UNAVAILABLE, r.error().message());
        return Ok();
    }

    Result<std::vector<QueueMessage>> list_pending(const std::string &group) override {
        FileLock l;
        SCIV_TRY(lock(l));
        std::vector<QueueMessage> out;
        SCIV_TRY_UNWRAP(ids, sorted_entries(group_dir(group) + "/pending"));
        for (const auto &id : ids) {
            auto p = read_pending(pending_path(group, id));
            if (p.is_error()) {
                LOG_WARN << "Skipping unreadable pending entry " << id << ": " << p.error().message();
                continue;
            }
            out.push_back(p.value().msg);
        }
        return out;
    }

    Result<std::vector<QueueMessage>> list_dead_letters() override {
        FileLock l;
        SCIV_TRY(lock(l));
        std::vector<QueueMessage> out;
        SCIV_TRY_UNWRAP(ids, sorted_entries(root_ + "/deadletter"));
        for (const auto &id : ids) {
            auto text = read_file(root_ + "/deadletter/" + id + ".json");
            auto v = text.ok() ? json::parse(text.value(), ErrorCode::QUEUE_UNAVAILABLE)
                               : Result<Json::Value>(text.error());
            auto m = v.ok() ? json::message_from_json(v.value()) : Result<QueueMessage>(v.error());
            if (m.is_error()) {
                LOG_WARN << "Skipping unreadable dead letter " << id << ": " << m.error().message();
                continue;
            }
            out.push_back(m.value());
        }
        return out;
    }
};

} // namespace queue
} // namespace sciv

#endif // SCIV_QUEUE_STREAM_BACKEND_H
