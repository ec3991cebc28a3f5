/**
 * @file worker_pool.h
 * @brief 工作线程池
 *
 * 线程：
 * - dispatcher：按空闲额度（concurrency - 排队 - 执行中）从队列 claim
 * - worker-N：固定数量，逐条调用 Pipeline
 * - maintenance：周期性回收过期容器、清理过期结果
 *
 * 停止时 dispatcher 不再 claim，尚未开始的消息交还队列（见 Pipeline::defer），
 * 已开始的执行跑完后再 join。
 */

#ifndef SCIV_WORKER_WORKER_POOL_H
#define SCIV_WORKER_WORKER_POOL_H

#include <string>
#include <deque>
#include <vector>
#include <thread>
#include <mutex>
#include <atomic>
#include <chrono>
#include <condition_variable>

#include "core/error.h"
#include "core/logger.h"
#include "core/config.h"
#include "queue/job_queue.h"
#include "queue/result_store.h"
#include "sandbox/sweeper.h"
#include "worker/pipeline.h"

namespace sciv {
namespace worker {

struct WorkerPoolOptions {
    int concurrency = 4;
    std::string consumer;
    int poll_interval_ms = 500;
    int retry_backoff_ms = 1000;
    int max_backoff_ms = 30000;
    int maintenance_interval_ms = 60000;

    static WorkerPoolOptions from(const Settings &s) {
        WorkerPoolOptions o;
        o.concurrency = s.worker.concurrency;
        o.consumer = s.queue.consumer;
        o.poll_interval_ms = s.queue.poll_interval_ms;
        o.retry_backoff_ms = s.queue.retry_backoff_ms;
        o.max_backoff_ms = s.queue.max_backoff_ms;
        o.maintenance_interval_ms = s.sandbox.sweep_interval_sec * 1000;
        return o;
    }
};

class WorkerPool {
private:
    struct Task {
        QueueMessage msg;
        bool exhausted;
    };

    queue::JobQueue &queue_;
    Pipeline &pipeline_;
    sandbox::ReconciliationSweeper *sweeper_;
    queue::ResultStore *store_;
    WorkerPoolOptions opts_;

    std::mutex mutex_;
    std::condition_variable work_cv_;     // 有新任务或停止
    std::condition_variable space_cv_;    // 有空闲额度或停止
    std::deque<Task> tasks_;
    int in_flight_ = 0;
    bool stopping_ = false;

    std::atomic<bool> running_{false};
    std::atomic<bool> fatal_{false};
    std::atomic<uint64_t> processed_{0};

    std::thread dispatcher_;
    std::thread maintenance_;
    std::vector<std::thread> workers_;

    /**
     * @brief 可被 stop() 打断的等待
     * @return true 表示已请求停止
     */
    bool sleep_for(std::chrono::milliseconds d) {
        std::unique_lock<std::mutex> lock(mutex_);
        return space_cv_.wait_for(lock, d, [this] { return stopping_; });
    }

    void dispatch_loop() {
        thread_log_tag() = "dispatcher";
        int64_t backoff = opts_.retry_backoff_ms;

        while (true) {
            int capacity;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                space_cv_.wait(lock, [this] {
                    return stopping_ ||
                           static_cast<int>(tasks_.size()) + in_flight_ < opts_.concurrency;
                });
                if (stopping_) break;
                capacity = opts_.concurrency - static_cast<int>(tasks_.size()) - in_flight_;
            }

            auto batch = queue_.claim(opts_.consumer, capacity);
            if (batch.is_error()) {
                LOG_WARN << "Claim failed, retrying in " << backoff << "ms: "
                         << batch.error().message();
                if (sleep_for(std::chrono::milliseconds(backoff))) break;
                backoff = std::min<int64_t>(backoff * 2, opts_.max_backoff_ms);
                continue;
            }
            backoff = opts_.retry_backoff_ms;

            if (batch.value().empty()) {
                if (sleep_for(std::chrono::milliseconds(opts_.poll_interval_ms))) break;
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto &m : batch.value().messages) {
                    tasks_.push_back({m, false});
                }
                for (const auto &m : batch.value().exhausted) {
                    tasks_.push_back({m, true});
                }
            }
            work_cv_.notify_all();
        }
        LOG_DEBUG << "Dispatcher stopped";
    }

    void worker_loop(int index) {
        thread_log_tag() = "worker-" + std::to_string(index);

        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                work_cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
                if (stopping_) break;
                task = std::move(tasks_.front());
                tasks_.pop_front();
                in_flight_++;
            }

            Outcome out = task.exhausted ? pipeline_.handle_exhausted(task.msg)
                                         : pipeline_.handle(task.msg);
            processed_++;
            LOG_DEBUG << "Message " << task.msg.message_id << " (job " << task.msg.job_id
                      << "): " << disposition_str(out.disposition);

            if (out.disposition == Disposition::WORKER_FATAL) {
                LOG_FATAL << "Worker cannot continue: " << out.detail;
                fatal_ = true;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                in_flight_--;
                if (fatal_) stopping_ = true;
            }
            space_cv_.notify_all();
            if (fatal_) work_cv_.notify_all();
        }
        LOG_DEBUG << "Worker stopped";
    }

    void maintenance_loop() {
        thread_log_tag() = "maintenance";
        auto interval = std::chrono::milliseconds(opts_.maintenance_interval_ms);

        while (true) {
            if (sweeper_) {
                auto swept = sweeper_->sweep();
                if (swept.is_error()) {
                    LOG_WARN << "Container sweep failed: " << swept.error().message();
                } else if (swept.value() > 0) {
                    LOG_INFO << "Container sweep removed " << swept.value() << " container(s)";
                }
            }
            if (store_) {
                auto purged = store_->purge_expired();
                if (purged.is_error()) {
                    LOG_WARN << "Result purge failed: " << purged.error().message();
                }
            }
            if (sleep_for(interval)) break;
        }
    }

    /**
     * @brief 交还尚未开始的消息
     */
    void release_unstarted() {
        std::deque<Task> left;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            left.swap(tasks_);
        }
        for (const auto &t : left) {
            auto r = pipeline_.defer(t.msg, t.exhausted);
            if (r.is_error()) {
                LOG_WARN << "Release of " << t.msg.message_id
                         << " failed, it will return after the visibility timeout: "
                         << r.error().message();
            }
        }
        if (!left.empty()) {
            LOG_INFO << "Released " << left.size() << " unstarted message(s)";
        }
    }

public:
    /**
     * @param sweeper 可为空，为空时不做容器回收
     * @param store 可为空，为空时不清理过期结果
     */
    WorkerPool(queue::JobQueue &queue, Pipeline &pipeline, sandbox::ReconciliationSweeper *sweeper,
               queue::ResultStore *store, const WorkerPoolOptions &opts)
        : queue_(queue), pipeline_(pipeline), sweeper_(sweeper), store_(store), opts_(opts) {}

    ~WorkerPool() { stop(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    Result<void> start() {
        if (running_) {
            return Err(ErrorCode::SYSTEM_ERROR, "worker pool already running");
        }
        if (opts_.concurrency <= 0) {
            return Err(ErrorCode::CONFIG_INVALID_VALUE, "concurrency must be positive");
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = false;
        }
        running_ = true;

        workers_.reserve(opts_.concurrency);
        for (int i = 0; i < opts_.concurrency; i++) {
            workers_.emplace_back(&WorkerPool::worker_loop, this, i);
        }
        dispatcher_ = std::thread(&WorkerPool::dispatch_loop, this);
        maintenance_ = std::thread(&WorkerPool::maintenance_loop, this);

        LOG_INFO << "Worker pool started: " << opts_.concurrency << " workers, consumer "
                 << opts_.consumer;
        return Ok();
    }

    /**
     * @brief 请求停止（可在信号处理之外的任意线程调用）
     */
    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        work_cv_.notify_all();
        space_cv_.notify_all();
    }

    /**
     * @brief 停止并等待所有线程
     */
    void stop() {
        if (!running_) return;
        request_stop();

        if (dispatcher_.joinable()) dispatcher_.join();
        for (auto &t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();
        if (maintenance_.joinable()) maintenance_.join();

        release_unstarted();
        running_ = false;
        LOG_INFO << "Worker pool stopped after " << processed_.load() << " message(s)";
    }

    /**
     * @brief 阻塞直到 stop_flag 为真或出现致命错误
     */
    void run_until(const std::atomic<bool> &stop_flag,
                   std::chrono::milliseconds tick = std::chrono::milliseconds(200)) {
        while (!stop_flag.load() && !fatal_.load()) {
            if (sleep_for(tick)) break;
        }
        stop();
    }

    bool fatal() const { return fatal_.load(); }
    bool running() const { return running_.load(); }
    uint64_t processed() const { return processed_.load(); }
};

} // namespace worker
} // namespace sciv

#endif // SCIV_WORKER_WORKER_POOL_H
