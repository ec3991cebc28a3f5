/**
 * @file seccomp.h
 * @brief seccomp-bpf 系统调用过滤
 *
 * 科学计算运行时（Python / R / Julia / Lean）需要的系统调用面很宽，
 * 因此这里采用黑名单：默认放行，只对危险调用返回错误码。
 *
 * 被拒绝的类别：
 * - 内核模块、kexec、reboot
 * - 挂载与根切换
 * - ptrace 与跨进程内存访问
 * - bpf / perf
 * - 命名空间（unshare、setns、带 CLONE_NEW* 标志的 clone）
 * - 内核 keyring
 */

#ifndef SCIV_SANDBOX_SECCOMP_H
#define SCIV_SANDBOX_SECCOMP_H

#include <vector>
#include <map>
#include <cstdint>
#include <cerrno>
#include <cstddef>

#include <sched.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <linux/seccomp.h>
#include <linux/filter.h>
#include <linux/audit.h>

namespace sciv {
namespace sandbox {

/**
 * @brief BPF 指令生成辅助
 */
struct BPF {
    static sock_filter stmt(uint16_t code, uint32_t k) {
        return {code, 0, 0, k};
    }

    static sock_filter jump(uint16_t code, uint32_t k, uint8_t jt, uint8_t jf) {
        return {code, jt, jf, k};
    }

    static sock_filter load_syscall_nr() {
        return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr));
    }

    static sock_filter load_arch() {
        return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch));
    }

    // 参数低 32 位（小端）
    static sock_filter load_arg_lo(int arg) {
        return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args) + arg * 8);
    }

    static sock_filter ret(uint32_t action) {
        return stmt(BPF_RET | BPF_K, action);
    }
};

/**
 * @brief 所有 CLONE_NEW* 标志
 */
constexpr uint32_t CLONE_NAMESPACE_FLAGS =
    CLONE_NEWNS | CLONE_NEWUTS | CLONE_NEWIPC | CLONE_NEWUSER |
    CLONE_NEWPID | CLONE_NEWNET | CLONE_NEWCGROUP;

/**
 * @brief Seccomp 黑名单过滤器
 */
class SeccompFilter {
private:
    std::vector<sock_filter> program_;
    std::map<int, int> denied_;          ///< syscall -> errno
    bool deny_namespace_clone_;

#if defined(__x86_64__)
    static constexpr uint32_t NATIVE_AUDIT_ARCH = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
    static constexpr uint32_t NATIVE_AUDIT_ARCH = AUDIT_ARCH_AARCH64;
#else
    #error "Unsupported architecture"
#endif

public:
    SeccompFilter() : deny_namespace_clone_(false) {}

    SeccompFilter& deny(int syscall_nr, int errno_val = EPERM) {
        denied_[syscall_nr] = errno_val;
        program_.clear();
        return *this;
    }

    SeccompFilter& deny(std::initializer_list<int> syscalls, int errno_val = EPERM) {
        for (int nr : syscalls) {
            denied_[nr] = errno_val;
        }
        program_.clear();
        return *this;
    }

    /**
     * @brief clone 的 flags 含 CLONE_NEW* 时返回 EPERM
     */
    SeccompFilter& deny_namespace_clone(bool deny = true) {
        deny_namespace_clone_ = deny;
        program_.clear();
        return *this;
    }

    bool denies(int syscall_nr) const {
        return denied_.count(syscall_nr) != 0;
    }

    /**
     * @brief 构建 BPF 程序
     *
     * 布局：架构检查；每条规则两条指令（匹配 / 返回 errno）；
     * clone 参数检查；最后默认放行。
     */
    void build() {
        program_.clear();

        program_.push_back(BPF::load_arch());
        program_.push_back(BPF::jump(BPF_JMP | BPF_JEQ | BPF_K, NATIVE_AUDIT_ARCH, 1, 0));
        program_.push_back(BPF::ret(SECCOMP_RET_KILL_PROCESS));

        program_.push_back(BPF::load_syscall_nr());

        for (const auto &rule : denied_) {
            program_.push_back(BPF::jump(BPF_JMP | BPF_JEQ | BPF_K,
                                         static_cast<uint32_t>(rule.first), 0, 1));
            program_.push_back(BPF::ret(SECCOMP_RET_ERRNO | (rule.second & SECCOMP_RET_DATA)));
        }

        if (deny_namespace_clone_) {
            program_.push_back(BPF::jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_clone, 0, 3));
            program_.push_back(BPF::load_arg_lo(0));
            program_.push_back(BPF::jump(BPF_JMP | BPF_JSET | BPF_K, CLONE_NAMESPACE_FLAGS, 0, 1));
            program_.push_back(BPF::ret(SECCOMP_RET_ERRNO | EPERM));
        }

        program_.push_back(BPF::ret(SECCOMP_RET_ALLOW));
    }

    /**
     * @brief 应用到当前进程（调用前必须已 fork，且之后只能 exec）
     */
    bool apply() {
        if (program_.empty()) {
            build();
        }
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
            return false;
        }
        struct sock_fprog prog;
        prog.len = static_cast<unsigned short>(program_.size());
        prog.filter = program_.data();
        return prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) == 0;
    }

    const std::vector<sock_filter>& program() {
        if (program_.empty()) {
            build();
        }
        return program_;
    }

    size_t size() const { return program_.size(); }
};

/**
 * @brief 沙箱标准过滤器
 */
inline SeccompFilter create_sandbox_filter() {
    SeccompFilter filter;

    // 内核模块 / kexec / 重启
    filter.deny({
        __NR_init_module,
        __NR_finit_module,
        __NR_delete_module,
        __NR_kexec_load,
#ifdef __NR_kexec_file_load
        __NR_kexec_file_load,
#endif
        __NR_reboot,
        __NR_swapon,
        __NR_swapoff,
        __NR_acct,
    });

    // 挂载
    filter.deny({
        __NR_mount,
        __NR_umount2,
        __NR_pivot_root,
        __NR_chroot,
#ifdef __NR_open_tree
        __NR_open_tree,
        __NR_move_mount,
        __NR_fsopen,
        __NR_fsconfig,
        __NR_fsmount,
        __NR_fspick,
#endif
#ifdef __NR_mount_setattr
        __NR_mount_setattr,
#endif
        __NR_open_by_handle_at,
    });

    // 调试与跨进程访问
    filter.deny({
        __NR_ptrace,
        __NR_process_vm_readv,
        __NR_process_vm_writev,
        __NR_bpf,
        __NR_perf_event_open,
        __NR_userfaultfd,
    });

    // 命名空间
    filter.deny({
        __NR_unshare,
        __NR_setns,
    });
    filter.deny_namespace_clone(true);
#ifdef __NR_clone3
    // clone3 的 flags 在用户内存里，BPF 读不到；返回 ENOSYS 让 libc 回退到 clone
    filter.deny(__NR_clone3, ENOSYS);
#endif

    // keyring
    filter.deny({
        __NR_add_key,
        __NR_request_key,
        __NR_keyctl,
    });

    return filter;
}

} // namespace sandbox
} // namespace sciv

#endif // SCIV_SANDBOX_SECCOMP_H
