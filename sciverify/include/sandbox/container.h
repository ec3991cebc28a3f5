/**
 * @file container.h
 * @brief 容器运行时接口
 *
 * SandboxManager 只通过这个接口操作容器，生产实现为 NativeRuntime，
 * 测试中使用可注入故障的 FakeRuntime。
 */

#ifndef SCIV_SANDBOX_CONTAINER_H
#define SCIV_SANDBOX_CONTAINER_H

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>

#include "core/error.h"
#include "core/types.h"

namespace sciv {
namespace sandbox {

/**
 * @brief 容器标签，供回收扫描判断是否过期
 */
struct ContainerLabels {
    std::string job_id;
    int64_t created_at_ms = 0;
    int64_t lifetime_ms = 0;      ///< 超时 + 回收宽限

    bool expired(int64_t now, int64_t slack_ms) const {
        return now > created_at_ms + lifetime_ms + slack_ms;
    }
};

struct ContainerInfo {
    std::string id;
    ContainerLabels labels;
};

/**
 * @brief 容器退出信息
 */
struct ContainerExit {
    int exit_code = -1;
    int term_signal = 0;
    bool oom_killed = false;
    std::optional<int64_t> peak_memory_kb;
};

/**
 * @brief 收集到的输出（已截断与清洗）
 */
struct ContainerOutput {
    std::string stdout_text;
    std::string stderr_text;
    std::map<std::string, std::string> files;
};

/**
 * @brief 容器运行时
 *
 * 所有操作都以容器 id 为作用域，不同容器之间无需加锁。
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /// 镜像是否在封闭目录中且可用；运行时从不拉取镜像
    virtual bool has_image(const std::string &image) = 0;

    virtual Result<std::string> create(const ExecutionSpec &spec, const ContainerLabels &labels) = 0;

    virtual Result<void> start(const std::string &id) = 0;

    /**
     * @brief 等待退出
     * @return 超时仍在运行时返回 nullopt
     */
    virtual Result<std::optional<ContainerExit>> wait(const std::string &id,
                                                      std::chrono::milliseconds timeout) = 0;

    virtual Result<void> kill(const std::string &id) = 0;

    virtual Result<ContainerOutput> collect(const std::string &id) = 0;

    /// 容器不存在时也返回成功
    virtual Result<void> remove(const std::string &id) = 0;

    virtual Result<std::vector<ContainerInfo>> list() = 0;
};

} // namespace sandbox
} // namespace sciv

#endif // SCIV_SANDBOX_CONTAINER_H
