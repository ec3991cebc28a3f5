/**
 * @file sandbox_manager.h
 * @brief 沙箱管理器
 *
 * execute() 为每次调用创建且只创建一个容器，返回前一定销毁它。
 * 返回时间不超过 timeout + 回收宽限（外加删除重试的有限退避）。
 *
 * 运行时故障（创建、启动、等待、收集失败）以 Error 返回，调用方按瞬时错误处理；
 * 五种退出状态都以 SandboxResult 返回。管理器不解释输出内容。
 */

#ifndef SCIV_SANDBOX_SANDBOX_MANAGER_H
#define SCIV_SANDBOX_SANDBOX_MANAGER_H

#include <string>
#include <atomic>
#include <chrono>
#include <thread>
#include <csignal>

#include "core/error.h"
#include "core/types.h"
#include "core/logger.h"
#include "core/utils.h"
#include "sandbox/container.h"
#include "sandbox/environment.h"
#include "sandbox/watchdog.h"

namespace sciv {
namespace sandbox {

struct SandboxManagerOptions {
    int teardown_grace_ms = 5000;
    int remove_attempts = 3;
    int remove_backoff_ms = 50;
};

/**
 * @brief 容器生命周期守卫：析构时杀死并删除容器
 */
class ContainerGuard {
private:
    ContainerRuntime &runtime_;
    std::string id_;
    int attempts_;
    int backoff_ms_;
    bool done_;

public:
    ContainerGuard(ContainerRuntime &runtime, const std::string &id, int attempts, int backoff_ms)
        : runtime_(runtime), id_(id), attempts_(attempts), backoff_ms_(backoff_ms), done_(false) {}

    ~ContainerGuard() {
        if (!done_ && teardown().is_error()) {
            LOG_DEBUG << "Guard teardown of " << id_ << " incomplete";
        }
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

    /**
     * @brief 杀死并删除，删除失败时退避重试；已完成则直接返回
     */
    Result<void> teardown() {
        if (done_) return Ok();

        auto killed = runtime_.kill(id_);
        if (killed.is_error()) {
            LOG_WARN << "Kill " << id_ << " failed: " << killed.error().message();
        }

        Result<void> removed;
        for (int i = 0; i < attempts_; i++) {
            removed = runtime_.remove(id_);
            if (removed.ok()) {
                done_ = true;
                return Ok();
            }
            LOG_WARN << "Remove " << id_ << " failed (attempt " << (i + 1) << "/" << attempts_
                     << "): " << removed.error().message();
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms_ * (i + 1)));
        }
        // 放弃后交给回收扫描，不再重复尝试
        done_ = true;
        LOG_ERROR << "Container " << id_ << " left for the reconciliation sweeper";
        return removed;
    }

    const std::string& id() const { return id_; }
};

/**
 * @brief 沙箱管理器
 */
class SandboxManager {
private:
    ContainerRuntime &runtime_;
    SandboxManagerOptions opts_;
    Watchdog watchdog_;
    std::atomic<uint64_t> executions_{0};

    static SandboxResult image_missing(const ExecutionSpec &spec, const std::string &detail) {
        SandboxResult r;
        r.status = ExitStatus::IMAGE_MISSING;
        r.image = spec.image;
        r.detail = detail;
        return r;
    }

    /**
     * @brief 退出信息 -> 退出状态
     */
    static void classify(SandboxResult &r, const ContainerExit &ex, bool timed_out,
                         const ResourceLimits &limits) {
        r.exit_code = ex.exit_code;
        r.term_signal = ex.term_signal;
        r.peak_memory_kb = ex.peak_memory_kb;

        if (timed_out) {
            r.status = ExitStatus::TIMEOUT;
            r.detail = "wall-clock timeout after " + std::to_string(limits.timeout_sec) + "s";
        } else if (ex.oom_killed) {
            r.status = ExitStatus::RESOURCE_KILLED;
            r.detail = "memory limit exceeded (" + std::to_string(limits.memory_mb) + " MB)";
        } else if (ex.term_signal == SIGXCPU) {
            r.status = ExitStatus::TIMEOUT;
            r.detail = "CPU time limit exceeded";
        } else if (ex.term_signal == SIGXFSZ) {
            r.status = ExitStatus::RESOURCE_KILLED;
            r.detail = "scratch file size limit exceeded";
        } else if (ex.term_signal == SIGKILL && ex.peak_memory_kb &&
                   *ex.peak_memory_kb >= static_cast<int64_t>(limits.memory_mb) * 1024 * 95 / 100) {
            r.status = ExitStatus::RESOURCE_KILLED;
            r.detail = "killed near memory limit";
        } else if (ex.term_signal == 0 && ex.exit_code == 0) {
            r.status = ExitStatus::SUCCESS;
        } else {
            r.status = ExitStatus::NON_ZERO;
            r.detail = ex.term_signal != 0
                ? "terminated by signal " + std::to_string(ex.term_signal)
                : "exit code " + std::to_string(ex.exit_code);
        }
    }

public:
    SandboxManager(ContainerRuntime &runtime, const SandboxManagerOptions &opts = {})
        : runtime_(runtime), opts_(opts) {}

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    Result<SandboxResult> execute(const ExecutionSpec &spec) {
        executions_++;
        auto started = std::chrono::steady_clock::now();
        auto timeout = std::chrono::milliseconds(static_cast<int64_t>(spec.limits.timeout_sec) * 1000);
        auto grace = std::chrono::milliseconds(opts_.teardown_grace_ms);

        if (!runtime_.has_image(spec.image)) {
            LOG_WARN << "Job " << spec.job_id << ": image not available: " << spec.image;
            return image_missing(spec, "image not available: " + spec.image);
        }

        ExecutionSpec effective = spec;
        effective.env = sanitize_env(spec.env);

        ContainerLabels labels;
        labels.job_id = spec.job_id;
        labels.created_at_ms = now_ms();
        labels.lifetime_ms = timeout.count() + grace.count();

        auto created = runtime_.create(effective, labels);
        if (created.is_error()) {
            if (created.error().code() == ErrorCode::IMAGE_MISSING) {
                return image_missing(spec, created.error().message());
            }
            return created.error();
        }
        ContainerGuard guard(runtime_, created.value(), opts_.remove_attempts, opts_.remove_backoff_ms);
        const std::string &id = guard.id();

        auto run = runtime_.start(id);
        if (run.is_error()) {
            if (run.error().code() == ErrorCode::IMAGE_MISSING) {
                return image_missing(spec, run.error().message());
            }
            return run.error();
        }

        auto token = watchdog_.arm(timeout, [this, &id] {
            auto k = runtime_.kill(id);
            if (k.is_error()) {
                LOG_ERROR << "Watchdog kill of " << id << " failed: " << k.error().message();
            }
        });
        auto waited = runtime_.wait(id, timeout + grace);
        bool timed_out = watchdog_.disarm(token);
        if (waited.is_error()) {
            return waited.error();
        }

        std::optional<ContainerExit> exit = waited.value();
        if (!exit) {
            // 看门狗杀不掉时再补一次，仍未退出就按运行时故障处理
            timed_out = true;
            SCIV_TRY(runtime_.kill(id));
            SCIV_TRY_UNWRAP(second, runtime_.wait(id, grace));
            if (!second) {
                return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE, "container " + id + " did not stop");
            }
            exit = second;
        }
        auto finished = std::chrono::steady_clock::now();

        SCIV_TRY_UNWRAP(output, runtime_.collect(id));

        auto removed = guard.teardown();
        if (removed.is_error()) {
            LOG_ERROR << "Job " << spec.job_id << ": teardown failed: " << removed.error().message();
        }

        SandboxResult result;
        result.image = spec.image;
        result.stdout_text = std::move(output.stdout_text);
        result.stderr_text = std::move(output.stderr_text);
        result.output_files = std::move(output.files);
        result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(finished - started).count();
        classify(result, *exit, timed_out, spec.limits);

        LOG_INFO << "Job " << spec.job_id << " sandbox finished: " << exit_status_str(result.status)
                 << " exit=" << result.exit_code << " signal=" << result.term_signal
                 << " duration=" << result.duration_ms << "ms";
        return result;
    }

    uint64_t executions() const { return executions_.load(); }
};

} // namespace sandbox
} // namespace sciv

#endif // SCIV_SANDBOX_SANDBOX_MANAGER_H
