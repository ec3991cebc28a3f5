/**
 * @file sciverify.h
 * @brief sciverify 主头文件
 *
 * 使用方式：
 *   #include "sciverify.h"
 *   using namespace sciv;
 */

#ifndef SCIV_SCIVERIFY_H
#define SCIV_SCIVERIFY_H

#include <memory>
#include <string>
#include <chrono>

// 核心模块
#include "core/error.h"
#include "core/logger.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/json_codec.h"

// 沙箱
#include "sandbox/native_runtime.h"
#include "sandbox/sandbox_manager.h"
#include "sandbox/sweeper.h"

// 运行器、比较器、等级
#include "runners/runner.h"
#include "comparators/comparator.h"
#include "level/level_resolver.h"

// 队列、签名、worker
#include "queue/job_queue.h"
#include "queue/result_store.h"
#include "signing/signer.h"
#include "worker/pipeline.h"
#include "worker/worker_pool.h"

namespace sciv {

/**
 * @brief 按 log 配置初始化默认日志器
 */
inline Result<void> init_logging(const LogSettings &log) {
    auto level = parse_log_level(log.level);
    if (!level) {
        return Err(ErrorCode::CONFIG_INVALID_VALUE, "unknown log level: " + log.level);
    }
    Logger &logger = default_logger();
    logger.clear_sinks();
    logger.add_console(log.color);
    logger.set_level(*level);
    if (!log.file.empty() && !logger.add_file(log.file)) {
        return Err(ErrorCode::FILE_WRITE_ERROR, "cannot open log file " + log.file);
    }
    return Ok();
}

/**
 * @brief 按配置加载签名密钥
 *
 * 读不到密钥是 worker 致命错误；ephemeral_dev_key 为真时生成临时密钥（仅用于开发）。
 */
inline Result<signing::Signer> load_signer(const SigningSettings &s) {
    if (s.ephemeral_dev_key) {
        LOG_WARN << "Using an ephemeral signing key, results will not verify after restart";
        return signing::Signer::generate();
    }
    return signing::Signer::load(s.key_path);
}

/**
 * @brief worker 上下文
 *
 * 按依赖顺序持有全部组件：运行时 -> 沙箱管理器 -> 队列 / 结果存储 -> 签名器
 * -> 流水线 -> 线程池。
 */
class WorkerContext {
public:
    Settings settings;

    std::unique_ptr<sandbox::NativeRuntime> runtime;
    std::unique_ptr<sandbox::SandboxManager> manager;
    std::unique_ptr<sandbox::ReconciliationSweeper> sweeper;
    std::unique_ptr<queue::JobQueue> jobs;
    std::unique_ptr<queue::ResultStore> results;
    std::unique_ptr<signing::Signer> signer;
    std::unique_ptr<worker::Pipeline> pipeline;
    std::unique_ptr<worker::WorkerPool> pool;

    explicit WorkerContext(const Settings &s) : settings(s) {}

    ~WorkerContext() {
        // 线程池先停，再释放它引用的组件
        pool.reset();
        pipeline.reset();
    }

    WorkerContext(const WorkerContext&) = delete;
    WorkerContext& operator=(const WorkerContext&) = delete;

    Result<void> init() {
        SCIV_TRY_UNWRAP(key, load_signer(settings.signing));
        signer = std::make_unique<signing::Signer>(std::move(key));
        LOG_INFO << "Signing key loaded: " << signer->public_key_ref();

        runtime = std::make_unique<sandbox::NativeRuntime>(
            sandbox::NativeRuntimeOptions::from(settings.sandbox));
        SCIV_TRY(runtime->init());

        sandbox::SandboxManagerOptions mopts;
        mopts.teardown_grace_ms = settings.sandbox.teardown_grace_ms;
        manager = std::make_unique<sandbox::SandboxManager>(*runtime, mopts);
        sweeper = std::make_unique<sandbox::ReconciliationSweeper>(
            *runtime, static_cast<int64_t>(settings.sandbox.sweep_slack_sec) * 1000);

        SCIV_TRY_UNWRAP(q, queue::JobQueue::open(settings.queue));
        jobs = std::move(q);
        results = std::make_unique<queue::ResultStore>(settings.queue.root + "/results",
                                                       settings.results.retention_hours,
                                                       jobs.get());
        SCIV_TRY(results->init());

        pipeline = std::make_unique<worker::Pipeline>(
            *jobs, *results, *manager, *signer,
            comparators::ToleranceDefaults::from(settings.comparators),
            worker::PipelineOptions::from(settings));
        pool = std::make_unique<worker::WorkerPool>(
            *jobs, *pipeline, sweeper.get(), results.get(),
            worker::WorkerPoolOptions::from(settings));
        return Ok();
    }
};

} // namespace sciv

#endif // SCIV_SCIVERIFY_H
