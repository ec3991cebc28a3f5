/**
 * @file sweeper.h
 * @brief 容器回收扫描
 *
 * 由 WorkerPool 的维护线程在热路径之外周期性调用：列出带标签的容器，超过预期寿命 + slack 的
 * 一律杀死并删除。用于回收崩溃 worker 遗留的容器。
 */

#ifndef SCIV_SANDBOX_SWEEPER_H
#define SCIV_SANDBOX_SWEEPER_H

#include "core/error.h"
#include "core/logger.h"
#include "core/utils.h"
#include "sandbox/container.h"

namespace sciv {
namespace sandbox {

class ReconciliationSweeper {
private:
    ContainerRuntime &runtime_;
    int64_t slack_ms_;

public:
    ReconciliationSweeper(ContainerRuntime &runtime, int64_t slack_ms)
        : runtime_(runtime), slack_ms_(slack_ms) {}

    ReconciliationSweeper(const ReconciliationSweeper&) = delete;
    ReconciliationSweeper& operator=(const ReconciliationSweeper&) = delete;

    /**
     * @brief 扫描一次
     * @return 删除的容器数
     */
    Result<int> sweep(int64_t now) {
        SCIV_TRY_UNWRAP(containers, runtime_.list());
        int removed = 0;
        for (const auto &c : containers) {
            if (!c.labels.expired(now, slack_ms_)) continue;

            LOG_WARN << "Sweeping expired container " << c.id << " (job "
                     << (c.labels.job_id.empty() ? "?" : c.labels.job_id) << ")";
            auto k = runtime_.kill(c.id);
            if (k.is_error()) {
                LOG_WARN << "Sweep kill " << c.id << " failed: " << k.error().message();
            }
            auto r = runtime_.remove(c.id);
            if (r.is_error()) {
                LOG_ERROR << "Sweep remove " << c.id << " failed: " << r.error().message();
                continue;
            }
            removed++;
        }
        return removed;
    }

    Result<int> sweep() { return sweep(now_ms()); }
};

} // namespace sandbox
} // namespace sciv

#endif // SCIV_SANDBOX_SWEEPER_H
