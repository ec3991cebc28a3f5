/**
 * @file watchdog.h
 * @brief 墙钟超时看门狗
 *
 * 一个后台线程维护待触发的任务表，到期后调用回调强制结束容器。
 * disarm() 返回时保证对应回调不会再运行，也不在运行中。
 */

#ifndef SCIV_SANDBOX_WATCHDOG_H
#define SCIV_SANDBOX_WATCHDOG_H

#include <map>
#include <cstdint>
#include <mutex>
#include <thread>
#include <chrono>
#include <functional>
#include <condition_variable>

namespace sciv {
namespace sandbox {

class Watchdog {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;
    using Token = uint64_t;

private:
    struct Entry {
        Clock::time_point deadline;
        Callback callback;
    };

    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<Token, Entry> entries_;
    Token next_token_ = 1;
    Token running_ = 0;              ///< 正在执行回调的 token，0 表示无
    bool stopping_ = false;
    std::thread thread_;

    void loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            auto due = entries_.end();
            for (auto it = entries_.begin(); it != entries_.end(); ++it) {
                if (due == entries_.end() || it->second.deadline < due->second.deadline) {
                    due = it;
                }
            }
            if (due == entries_.end()) {
                cv_.wait(lock);
                continue;
            }
            if (Clock::now() < due->second.deadline) {
                cv_.wait_until(lock, due->second.deadline);
                continue;
            }

            Token token = due->first;
            Callback cb = std::move(due->second.callback);
            entries_.erase(due);
            running_ = token;
            lock.unlock();
            cb();
            lock.lock();
            running_ = 0;
            cv_.notify_all();
        }
    }

public:
    Watchdog() : thread_([this] { loop(); }) {}

    ~Watchdog() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    Token arm(Clock::duration after, Callback cb) {
        std::lock_guard<std::mutex> lock(mutex_);
        Token token = next_token_++;
        entries_[token] = Entry{Clock::now() + after, std::move(cb)};
        cv_.notify_all();
        return token;
    }

    /**
     * @return 回调是否已触发（或正在触发）
     */
    bool disarm(Token token) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (entries_.erase(token) > 0) {
            cv_.notify_all();
            return false;
        }
        cv_.wait(lock, [&] { return running_ != token; });
        return true;
    }

    size_t pending() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }
};

} // namespace sandbox
} // namespace sciv

#endif // SCIV_SANDBOX_WATCHDOG_H
