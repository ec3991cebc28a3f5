/**
 * @file cgroup.h
 * @brief cgroups v2 资源限制
 *
 * 每个容器一个 cgroup，挂在配置的 sandbox.cgroup_root 之下：
 *
 *   /sys/fs/cgroup/sciverify/      ← CgroupHierarchy 负责创建并开启控制器
 *   ├── c-<id>/                     ← 单个容器（CgroupController）
 *   └── ...
 *
 * 遵循 cgroup v2 "no internal processes" 规则：worker 进程本身不进入
 * 该子树，只把沙箱 init 进程写入各自的 cgroup.procs。
 */

#ifndef SCIV_SANDBOX_CGROUP_H
#define SCIV_SANDBOX_CGROUP_H

#include <string>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/vfs.h>
#include <linux/magic.h>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"

namespace sciv {
namespace sandbox {

/**
 * @brief cgroup 资源使用统计
 */
struct CgroupStats {
    uint64_t memory_peak;         ///< 峰值内存 (bytes)
    bool oom_killed;              ///< 是否发生过 OOM kill
    uint64_t cpu_usage_usec;      ///< CPU 使用时间 (微秒)
    uint64_t pids_current;

    CgroupStats()
        : memory_peak(0), oom_killed(false), cpu_usage_usec(0), pids_current(0) {}
};

/**
 * @brief cgroup 资源限制配置
 */
struct CgroupLimits {
    uint64_t memory_max;          ///< 最大内存 (bytes), 0 = 不限制
    uint64_t memory_swap_max;     ///< 最大 swap (bytes), 0 = 禁用 swap
    uint64_t cpu_quota_usec;      ///< CPU 配额 (微秒), 0 = 不限制
    uint64_t cpu_period_usec;     ///< CPU 周期 (微秒)
    uint64_t pids_max;            ///< 最大进程数, 0 = 不限制

    CgroupLimits()
        : memory_max(0), memory_swap_max(0),
          cpu_quota_usec(0), cpu_period_usec(100000), pids_max(0) {}

    /**
     * @brief 由作业资源限制换算
     */
    static CgroupLimits from(const ResourceLimits &l) {
        CgroupLimits c;
        c.memory_max = static_cast<uint64_t>(l.memory_mb) * 1024 * 1024;
        c.memory_swap_max = 0;
        c.cpu_quota_usec = c.cpu_period_usec * static_cast<uint64_t>(l.cpu_percent) / 100;
        c.pids_max = static_cast<uint64_t>(l.pids);
        return c;
    }
};

namespace detail {

/**
 * @brief 从 "key value" 行组成的文件内容中取数值
 */
inline uint64_t parse_stat(const std::string &content, const std::string &key) {
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.compare(0, key.size() + 1, key + " ") == 0) {
            return std::strtoull(line.c_str() + key.size() + 1, nullptr, 10);
        }
    }
    return 0;
}

} // namespace detail

/**
 * @brief 单个 cgroup v2 控制器
 */
class CgroupController {
private:
    std::string cgroup_path_;
    bool created_;

    Result<void> write_control(const std::string &filename, const std::string &content) {
        std::string path = cgroup_path_ + "/" + filename;
        std::ofstream file(path);
        if (!file) {
            return Err(ErrorCode::RUNTIME_UNAVAILABLE, "cannot write to " + path);
        }
        file << content;
        file.flush();
        if (!file) {
            return Err(ErrorCode::RUNTIME_UNAVAILABLE, "write failed: " + path);
        }
        return Ok();
    }

    Result<std::string> read_control(const std::string &filename) const {
        return read_file(cgroup_path_ + "/" + filename);
    }

public:
    /**
     * @param path cgroup 目录的绝对路径
     */
    explicit CgroupController(const std::string &path)
        : cgroup_path_(path), created_(false) {}

    CgroupController(const CgroupController&) = delete;
    CgroupController& operator=(const CgroupController&) = delete;

    CgroupController(CgroupController&& other) noexcept
        : cgroup_path_(std::move(other.cgroup_path_)), created_(other.created_) {
        other.created_ = false;
    }

    Result<void> create() {
        if (mkdir(cgroup_path_.c_str(), 0755) < 0 && errno != EEXIST) {
            return Err(ErrorCode::RUNTIME_UNAVAILABLE,
                       "cannot create cgroup " + cgroup_path_ + ": " + std::strerror(errno));
        }
        created_ = true;
        return Ok();
    }

    /**
     * @brief 杀死剩余进程并删除目录；目录不存在视为成功
     */
    Result<void> destroy() {
        if (!file_exists(cgroup_path_)) {
            created_ = false;
            return Ok();
        }
        auto killed = kill_all();
        if (killed.is_error()) {
            return killed;
        }
        // cgroup.kill 是异步的，等待进程全部退出后才能 rmdir
        for (int i = 0; i < 200; i++) {
            if (rmdir(cgroup_path_.c_str()) == 0 || errno == ENOENT) {
                created_ = false;
                return Ok();
            }
            if (errno != EBUSY) break;
            usleep(5000);
        }
        return Err(ErrorCode::RUNTIME_UNAVAILABLE,
                   "cannot remove cgroup " + cgroup_path_ + ": " + std::strerror(errno));
    }

    Result<void> apply_limits(const CgroupLimits &limits) {
        if (limits.memory_max > 0) {
            SCIV_TRY(write_control("memory.max", std::to_string(limits.memory_max)));
        }
        SCIV_TRY(write_control("memory.swap.max", std::to_string(limits.memory_swap_max)));
        if (limits.cpu_quota_usec > 0) {
            std::ostringstream oss;
            oss << limits.cpu_quota_usec << " " << limits.cpu_period_usec;
            SCIV_TRY(write_control("cpu.max", oss.str()));
        }
        if (limits.pids_max > 0) {
            SCIV_TRY(write_control("pids.max", std::to_string(limits.pids_max)));
        }
        return Ok();
    }

    Result<void> add_process(pid_t pid) {
        return write_control("cgroup.procs", std::to_string(pid));
    }

    /**
     * @brief 读取资源统计；内核不支持的文件保持 0
     */
    CgroupStats get_stats() const {
        CgroupStats stats;

        auto peak = read_control("memory.peak");
        if (peak.ok()) {
            stats.memory_peak = std::strtoull(peak.value().c_str(), nullptr, 10);
        }
        auto events = read_control("memory.events");
        if (events.ok()) {
            stats.oom_killed = detail::parse_stat(events.value(), "oom_kill") > 0;
        }
        auto cpu_stat = read_control("cpu.stat");
        if (cpu_stat.ok()) {
            stats.cpu_usage_usec = detail::parse_stat(cpu_stat.value(), "usage_usec");
        }
        auto pids = read_control("pids.current");
        if (pids.ok()) {
            stats.pids_current = std::strtoull(pids.value().c_str(), nullptr, 10);
        }
        return stats;
    }

    Result<void> kill_all() {
        return write_control("cgroup.kill", "1");
    }

    const std::string& path() const { return cgroup_path_; }
    bool is_created() const { return created_; }
};

/**
 * @brief 检查 cgroups v2 是否可用
 *
 * 使用 statfs 检测文件系统类型，比检查文件存在更健壮。
 */
inline bool is_cgroup_v2_available() {
    struct statfs buf;
    if (statfs("/sys/fs/cgroup", &buf) != 0) {
        return false;
    }
    return buf.f_type == CGROUP2_SUPER_MAGIC;
}

/**
 * @brief 沙箱 cgroup 子树
 */
class CgroupHierarchy {
private:
    std::string root_;
    bool prepared_;

    static bool enable_controllers(const std::string &path) {
        std::ofstream subtree(path + "/cgroup.subtree_control");
        if (!subtree) return false;
        subtree << "+memory +cpu +pids";
        subtree.flush();
        return subtree.good();
    }

public:
    explicit CgroupHierarchy(const std::string &root) : root_(root), prepared_(false) {}

    /**
     * @brief 创建子树根并在父节点与自身开启控制器
     */
    Result<void> prepare() {
        if (prepared_) return Ok();
        if (!is_cgroup_v2_available()) {
            return Err(ErrorCode::RUNTIME_UNAVAILABLE, "cgroup v2 is not mounted at /sys/fs/cgroup");
        }
        std::string parent = root_.substr(0, root_.rfind('/'));
        if (!enable_controllers(parent)) {
            return Err(ErrorCode::RUNTIME_UNAVAILABLE,
                       "cannot enable controllers in " + parent);
        }
        if (mkdir(root_.c_str(), 0755) < 0 && errno != EEXIST) {
            return Err(ErrorCode::RUNTIME_UNAVAILABLE,
                       "cannot create cgroup root " + root_ + ": " + std::strerror(errno));
        }
        if (!enable_controllers(root_)) {
            return Err(ErrorCode::RUNTIME_UNAVAILABLE,
                       "cannot enable controllers in " + root_);
        }
        prepared_ = true;
        return Ok();
    }

    CgroupController controller_for(const std::string &container_id) const {
        return CgroupController(root_ + "/" + container_id);
    }

    const std::string& root() const { return root_; }
};

} // namespace sandbox
} // namespace sciv

#endif // SCIV_SANDBOX_CGROUP_H
