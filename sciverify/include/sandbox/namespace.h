/**
 * @file namespace.h
 * @brief 容器命名空间与挂载计划
 *
 * 容器进程用 clone 进入新的 mount / pid / net / ipc / uts 命名空间，
 * 然后在新 mount 命名空间内按 MountPlan 搭建根文件系统：
 *
 *   <state>/<id>/root      ← 镜像 rootfs 的只读绑定
 *   ├── code               ← 只读，提交的代码
 *   ├── data               ← 只读，数据文件
 *   ├── tmp                ← 可写，宿主侧 tmpfs 的子目录
 *   ├── output             ← 可写，同上
 *   ├── proc
 *   └── dev                ← 小 tmpfs，只绑定 null / zero / random / urandom
 *
 * 子进程是在多线程 worker 中 fork 出来的，fork 之后只允许调用
 * async-signal-safe 的函数，所以所有路径字符串都在父进程里准备好，
 * 子进程侧的 apply() 只做系统调用，失败时返回阶段号并保留 errno。
 */

#ifndef SCIV_SANDBOX_NAMESPACE_H
#define SCIV_SANDBOX_NAMESPACE_H

#include <string>
#include <vector>

#include <sched.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/syscall.h>

namespace sciv {
namespace sandbox {

//==============================================================================
// 命名空间标志
//==============================================================================

/// 容器使用的命名空间：不含 user namespace，容器内以 nobody 身份运行
constexpr int CONTAINER_CLONE_FLAGS =
    CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS;

//==============================================================================
// 挂载点
//==============================================================================

enum class MountType {
    BIND_RO,    ///< 只读绑定挂载
    BIND_RW,    ///< 可写绑定挂载（nosuid, nodev）
    TMPFS,      ///< 临时文件系统
    PROC,       ///< /proc
    DEV_NODE,   ///< 绑定单个宿主设备文件
};

/**
 * @brief 挂载点配置，target 为容器内路径
 */
struct MountPoint {
    MountType type;
    std::string source;
    std::string target;
    std::string options;

    MountPoint(MountType t, const std::string &src, const std::string &tgt,
               const std::string &opts = "")
        : type(t), source(src), target(tgt), options(opts) {}

    static MountPoint bind_ro(const std::string &src, const std::string &tgt) {
        return {MountType::BIND_RO, src, tgt};
    }

    static MountPoint bind_rw(const std::string &src, const std::string &tgt) {
        return {MountType::BIND_RW, src, tgt};
    }

    static MountPoint tmpfs(const std::string &tgt, const std::string &opts = "size=1m,mode=755") {
        return {MountType::TMPFS, "tmpfs", tgt, opts};
    }

    static MountPoint proc(const std::string &tgt = "/proc") {
        return {MountType::PROC, "proc", tgt};
    }

    static MountPoint dev_node(const std::string &name) {
        return {MountType::DEV_NODE, "/dev/" + name, "/dev/" + name};
    }
};

//==============================================================================
// 子进程侧设置阶段
//==============================================================================

enum class SetupStage : int {
    NONE = 0,
    MOUNT_PRIVATE,
    MOUNT_ROOT,
    MOUNT,
    PIVOT_ROOT,
    HOSTNAME,
    CHDIR,
    STDIO,
    RLIMIT,
    DROP_CAPS,
    SET_IDS,
    SECCOMP,
    EXEC,
};

inline const char* setup_stage_str(SetupStage s) {
    switch (s) {
        case SetupStage::NONE:          return "none";
        case SetupStage::MOUNT_PRIVATE: return "mount_private";
        case SetupStage::MOUNT_ROOT:    return "mount_root";
        case SetupStage::MOUNT:         return "mount";
        case SetupStage::PIVOT_ROOT:    return "pivot_root";
        case SetupStage::HOSTNAME:      return "hostname";
        case SetupStage::CHDIR:         return "chdir";
        case SetupStage::STDIO:         return "stdio";
        case SetupStage::RLIMIT:        return "rlimit";
        case SetupStage::DROP_CAPS:     return "drop_caps";
        case SetupStage::SET_IDS:       return "set_ids";
        case SetupStage::SECCOMP:       return "seccomp";
        case SetupStage::EXEC:          return "exec";
    }
    return "unknown";
}

/**
 * @brief 子进程通过错误管道回报的失败信息
 */
struct SetupFailure {
    int stage;
    int err;
};

//==============================================================================
// 挂载计划
//==============================================================================

/**
 * @brief 预先算好绝对路径的挂载计划
 */
class MountPlan {
private:
    struct Step {
        MountType type;
        std::string source;
        std::string target;       ///< newroot 下的绝对路径
        std::string options;
    };

    std::string rootfs_;
    std::string newroot_;
    std::string hostname_;
    std::string workdir_;
    std::vector<Step> steps_;

    static unsigned long ro_remount_flags() {
        return MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV;
    }

    static int mount_step(const Step &s) {
        const char *src = s.source.c_str();
        const char *tgt = s.target.c_str();
        const char *data = s.options.empty() ? nullptr : s.options.c_str();

        switch (s.type) {
            case MountType::BIND_RO:
                if (mount(src, tgt, nullptr, MS_BIND | MS_REC, nullptr) < 0) return -1;
                return mount(nullptr, tgt, nullptr, ro_remount_flags(), nullptr);

            case MountType::BIND_RW:
                if (mount(src, tgt, nullptr, MS_BIND | MS_REC, nullptr) < 0) return -1;
                return mount(nullptr, tgt, nullptr,
                             MS_BIND | MS_REMOUNT | MS_NOSUID | MS_NODEV, nullptr);

            case MountType::TMPFS:
                return mount("tmpfs", tgt, "tmpfs", MS_NOSUID | MS_NOEXEC, data);

            case MountType::PROC:
                return mount("proc", tgt, "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr);

            case MountType::DEV_NODE: {
                // 目标在 /dev tmpfs 中，先建一个空文件作为挂载点
                int fd = open(tgt, O_WRONLY | O_CREAT | O_CLOEXEC, 0666);
                if (fd < 0) return -1;
                close(fd);
                if (mount(src, tgt, nullptr, MS_BIND, nullptr) < 0) return -1;
                return mount(nullptr, tgt, nullptr,
                             MS_BIND | MS_REMOUNT | MS_NOSUID | MS_NOEXEC, nullptr);
            }
        }
        errno = EINVAL;
        return -1;
    }

public:
    /**
     * @param rootfs  镜像根文件系统（宿主路径）
     * @param newroot 容器根的挂载点（宿主路径，空目录）
     */
    MountPlan(const std::string &rootfs, const std::string &newroot)
        : rootfs_(rootfs), newroot_(newroot), hostname_("sandbox"), workdir_("/tmp") {}

    MountPlan& add(const MountPoint &mp) {
        steps_.push_back({mp.type, mp.source, newroot_ + mp.target, mp.options});
        return *this;
    }

    MountPlan& set_hostname(const std::string &name) {
        hostname_ = name;
        return *this;
    }

    MountPlan& set_workdir(const std::string &dir) {
        workdir_ = dir;
        return *this;
    }

    const std::string& rootfs() const { return rootfs_; }
    const std::string& newroot() const { return newroot_; }
    size_t size() const { return steps_.size(); }

    /**
     * @brief 在子进程内执行：挂载、切换根、设置主机名与工作目录
     * @return 成功返回 NONE，否则返回失败阶段，errno 保留
     */
    SetupStage apply() const {
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) < 0) {
            return SetupStage::MOUNT_PRIVATE;
        }

        if (mount(rootfs_.c_str(), newroot_.c_str(), nullptr, MS_BIND | MS_REC, nullptr) < 0 ||
            mount(nullptr, newroot_.c_str(), nullptr, ro_remount_flags(), nullptr) < 0) {
            return SetupStage::MOUNT_ROOT;
        }

        for (const auto &s : steps_) {
            if (mount_step(s) < 0) {
                return SetupStage::MOUNT;
            }
        }

        // pivot_root(".", ".") 后旧根叠在新根之上，分离卸载即可
        if (chdir(newroot_.c_str()) < 0 ||
            syscall(SYS_pivot_root, ".", ".") < 0 ||
            umount2(".", MNT_DETACH) < 0) {
            return SetupStage::PIVOT_ROOT;
        }

        if (sethostname(hostname_.c_str(), hostname_.size()) < 0) {
            return SetupStage::HOSTNAME;
        }

        if (chdir(workdir_.c_str()) < 0) {
            return SetupStage::CHDIR;
        }
        return SetupStage::NONE;
    }
};

/**
 * @brief 镜像 rootfs 中必须存在的挂载点目录
 */
inline const std::vector<std::string>& required_mountpoints() {
    static const std::vector<std::string> dirs = {
        "/code", "/data", "/tmp", "/output", "/proc", "/dev",
    };
    return dirs;
}

/**
 * @brief 标准容器挂载计划
 *
 * @param code_dir    宿主侧代码目录
 * @param data_dir    宿主侧数据目录
 * @param scratch_dir 宿主侧 tmpfs，内含 tmp/ 与 output/
 */
inline MountPlan create_container_plan(const std::string &rootfs,
                                       const std::string &newroot,
                                       const std::string &code_dir,
                                       const std::string &data_dir,
                                       const std::string &scratch_dir) {
    MountPlan plan(rootfs, newroot);
    plan.add(MountPoint::bind_ro(code_dir, "/code"))
        .add(MountPoint::bind_ro(data_dir, "/data"))
        .add(MountPoint::bind_rw(scratch_dir + "/tmp", "/tmp"))
        .add(MountPoint::bind_rw(scratch_dir + "/output", "/output"))
        .add(MountPoint::proc())
        .add(MountPoint::tmpfs("/dev"))
        .add(MountPoint::dev_node("null"))
        .add(MountPoint::dev_node("zero"))
        .add(MountPoint::dev_node("random"))
        .add(MountPoint::dev_node("urandom"));
    return plan;
}

} // namespace sandbox
} // namespace sciv

#endif // SCIV_SANDBOX_NAMESPACE_H
