/**
 * @file native_runtime.h
 * @brief 基于 Linux 原生机制的容器运行时
 *
 * 整合 namespaces、pivot_root、cgroups v2、seccomp-bpf 和 rlimit。
 * 需要以 root 运行，且 /sys/fs/cgroup 为 cgroup v2。
 *
 * 每个容器在 state_dir 下有一个目录：
 *
 *   <state_dir>/<id>/
 *   ├── meta.json    ← 标签，供回收扫描使用
 *   ├── root/        ← 容器根的挂载点（只在容器自己的 mount 命名空间内有挂载）
 *   ├── code/
 *   ├── data/
 *   └── scratch/     ← 宿主侧 tmpfs，大小即 scratch 上限
 *       ├── tmp/
 *       └── output/
 *
 * 所有路径都只由 id 决定，worker 崩溃后扫描器仍可按 id 清理。
 */

#ifndef SCIV_SANDBOX_NATIVE_RUNTIME_H
#define SCIV_SANDBOX_NATIVE_RUNTIME_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <algorithm>

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <grp.h>
#include <sys/wait.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/syscall.h>

#include "core/error.h"
#include "core/types.h"
#include "core/logger.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/json_codec.h"
#include "sandbox/container.h"
#include "sandbox/cgroup.h"
#include "sandbox/seccomp.h"
#include "sandbox/namespace.h"
#include "sandbox/environment.h"

namespace sciv {
namespace sandbox {

namespace fs = std::filesystem;

//==============================================================================
// 运行时选项
//==============================================================================

struct NativeRuntimeOptions {
    std::string state_dir;
    std::string cgroup_root;
    std::map<std::string, std::string> images;   ///< 镜像名 -> rootfs
    uid_t run_uid = 65534;
    gid_t run_gid = 65534;
    size_t stdout_cap = 65536;
    size_t output_files_cap = 32 * 1024 * 1024;

    static NativeRuntimeOptions from(const SandboxSettings &s) {
        NativeRuntimeOptions o;
        o.state_dir = s.state_dir;
        o.cgroup_root = s.cgroup_root;
        o.images = s.images;
        o.run_uid = static_cast<uid_t>(s.run_uid);
        o.run_gid = static_cast<gid_t>(s.run_gid);
        o.stdout_cap = static_cast<size_t>(s.stdout_cap_bytes);
        o.output_files_cap = static_cast<size_t>(s.output_files_cap_bytes);
        return o;
    }
};

//==============================================================================
// 原生运行时
//==============================================================================

class NativeRuntime : public ContainerRuntime {
private:
    /**
     * @brief 子进程需要的全部数据，clone 之前在父进程中准备好
     */
    struct LaunchPlan {
        MountPlan mounts;
        std::vector<std::string> argv_storage;
        std::vector<std::string> env_storage;
        std::vector<std::string> exec_candidates;
        std::vector<char*> argv;
        std::vector<char*> envp;
        rlim_t cpu_seconds = 0;
        rlim_t fsize_bytes = 0;
        int cap_last = 40;
        uid_t uid = 65534;
        gid_t gid = 65534;

        explicit LaunchPlan(MountPlan plan) : mounts(std::move(plan)) {}

        /// 存储定型之后再取指针
        void bind_pointers() {
            argv.clear();
            envp.clear();
            for (auto &a : argv_storage) argv.push_back(&a[0]);
            argv.push_back(nullptr);
            for (auto &e : env_storage) envp.push_back(&e[0]);
            envp.push_back(nullptr);
        }
    };

    struct Container {
        std::string id;
        ExecutionSpec spec;
        ContainerLabels labels;
        std::string rootfs;
        pid_t pid = -1;
        std::atomic<bool> reaped{false};
        std::thread stdout_reader;
        std::thread stderr_reader;
        std::string stdout_raw;
        std::string stderr_raw;
        std::optional<ContainerExit> exit;
    };

    NativeRuntimeOptions opts_;
    CgroupHierarchy cgroups_;
    SeccompFilter filter_;
    int cap_last_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Container>> containers_;

    std::string dir_of(const std::string &id) const { return opts_.state_dir + "/" + id; }
    std::string scratch_of(const std::string &id) const { return dir_of(id) + "/scratch"; }

    std::shared_ptr<Container> find(const std::string &id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = containers_.find(id);
        return it == containers_.end() ? nullptr : it->second;
    }

    static int read_cap_last() {
        auto content = read_file("/proc/sys/kernel/cap_last_cap");
        if (content.ok()) {
            int v = std::atoi(content.value().c_str());
            if (v > 0) return v;
        }
        return 40;
    }

    /**
     * @brief 读取管道直到 EOF，只保留前 cap + 1 字节（多出的一字节用于判定截断）
     */
    static void drain(int fd, std::string *out, size_t cap) {
        char buf[8192];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            size_t room = cap + 1 > out->size() ? cap + 1 - out->size() : 0;
            out->append(buf, std::min(room, static_cast<size_t>(n)));
        }
        close(fd);
    }

    static int64_t mtime_ms(const std::string &path) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) return 0;
        return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 + st.st_mtim.tv_nsec / 1000000;
    }

    Result<void> write_meta(const Container &c) {
        Json::Value m(Json::objectValue);
        m["id"] = c.id;
        m["job_id"] = c.labels.job_id;
        m["created_at_ms"] = Json::Int64(c.labels.created_at_ms);
        m["lifetime_ms"] = Json::Int64(c.labels.lifetime_ms);
        m["image"] = c.spec.image;
        m["pid"] = c.pid;
        return write_file_atomic(dir_of(c.id) + "/meta.json", json::write_compact(m), 0600);
    }

    Result<void> mount_scratch(const std::string &id, int scratch_mb) {
        std::string scratch = scratch_of(id);
        std::string opts = "size=" + std::to_string(scratch_mb) + "m,mode=0755";
        if (mount("tmpfs", scratch.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, opts.c_str()) < 0) {
            return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE,
                              "mount scratch " + scratch + ": " + std::strerror(errno));
        }
        for (const char *sub : {"/tmp", "/output"}) {
            std::string path = scratch + sub;
            if (mkdir(path.c_str(), 0755) < 0 ||
                chown(path.c_str(), opts_.run_uid, opts_.run_gid) < 0 ||
                chmod(path.c_str(), std::string(sub) == "/tmp" ? 01777 : 0755) < 0) {
                return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE,
                                  "prepare " + path + ": " + std::strerror(errno));
            }
        }
        return Ok();
    }

    static Result<void> write_inputs(const std::string &dir, const std::map<std::string, std::string> &files) {
        SCIV_TRY(make_dirs(dir, 0755));
        for (const auto &f : files) {
            SCIV_TRY(write_file_atomic(dir + "/" + f.first, f.second, 0644));
        }
        return Ok();
    }

    static Result<void> check_input_names(const std::map<std::string, std::string> &files) {
        for (const auto &f : files) {
            if (!is_safe_relative_name(f.first) || f.first.find('/') != std::string::npos) {
                return SCIV_ERROR(ErrorCode::PATH_TRAVERSAL, "unsafe input file name: " + f.first);
            }
        }
        return Ok();
    }

    /**
     * @brief 按 id 清理宿主侧资源：cgroup、scratch 挂载、状态目录
     */
    Result<void> teardown_paths(const std::string &id) {
        auto cg = cgroups_.controller_for(id);
        SCIV_TRY(cg.destroy());

        std::string scratch = scratch_of(id);
        if (umount2(scratch.c_str(), MNT_DETACH) < 0 && errno != EINVAL && errno != ENOENT) {
            return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE,
                              "umount " + scratch + ": " + std::strerror(errno));
        }

        std::error_code ec;
        fs::remove_all(dir_of(id), ec);
        if (ec) {
            return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE,
                              "remove " + dir_of(id) + ": " + ec.message());
        }
        return Ok();
    }

    LaunchPlan prepare_launch(const Container &c) const {
        std::string dir = dir_of(c.id);
        LaunchPlan lp(create_container_plan(c.rootfs, dir + "/root", dir + "/code",
                                            dir + "/data", dir + "/scratch"));

        lp.argv_storage = c.spec.command;
        lp.env_storage = env_to_strings(sanitize_env(c.spec.env));

        const std::string &program = c.spec.command.front();
        if (program.find('/') != std::string::npos) {
            lp.exec_candidates.push_back(program);
        } else {
            for (const char *d : {"/usr/local/bin/", "/usr/bin/", "/bin/"}) {
                lp.exec_candidates.push_back(std::string(d) + program);
            }
        }

        lp.cpu_seconds = static_cast<rlim_t>(c.spec.limits.timeout_sec) + 1;
        lp.fsize_bytes = static_cast<rlim_t>(c.spec.limits.scratch_mb) * 1024 * 1024;
        lp.cap_last = cap_last_;
        lp.uid = opts_.run_uid;
        lp.gid = opts_.run_gid;
        return lp;
    }

    /**
     * @brief 子进程入口，只做系统调用，不返回
     */
    [[noreturn]] static void child_main(LaunchPlan &lp, SeccompFilter &filter,
                                        int sync_fd, int report_fd, int out_fd, int err_fd) {
        auto fail = [report_fd](SetupStage stage) {
            SetupFailure f{static_cast<int>(stage), errno};
            ssize_t w = write(report_fd, &f, sizeof(f));
            (void)w;
            _exit(127);
        };

        char c;
        if (read(sync_fd, &c, 1) != 1) {
            _exit(127);
        }
        close(sync_fd);
        prctl(PR_SET_PDEATHSIG, SIGKILL);

        SetupStage stage = lp.mounts.apply();
        if (stage != SetupStage::NONE) {
            fail(stage);
        }

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0 ||
            dup2(out_fd, STDOUT_FILENO) < 0 || dup2(err_fd, STDERR_FILENO) < 0) {
            fail(SetupStage::STDIO);
        }
        close(null_fd);

        struct rlimit rl;
        rl.rlim_cur = lp.cpu_seconds;
        rl.rlim_max = lp.cpu_seconds + 1;
        if (setrlimit(RLIMIT_CPU, &rl) < 0) fail(SetupStage::RLIMIT);
        rl.rlim_cur = rl.rlim_max = lp.fsize_bytes;
        if (setrlimit(RLIMIT_FSIZE, &rl) < 0) fail(SetupStage::RLIMIT);
        rl.rlim_cur = rl.rlim_max = 0;
        if (setrlimit(RLIMIT_CORE, &rl) < 0) fail(SetupStage::RLIMIT);

        for (int cap = 0; cap <= lp.cap_last; cap++) {
            if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) < 0 && errno != EINVAL) {
                fail(SetupStage::DROP_CAPS);
            }
        }

        if (setgroups(0, nullptr) < 0 ||
            setresgid(lp.gid, lp.gid, lp.gid) < 0 ||
            setresuid(lp.uid, lp.uid, lp.uid) < 0) {
            fail(SetupStage::SET_IDS);
        }

        if (!filter.apply()) {
            fail(SetupStage::SECCOMP);
        }

        for (const auto &path : lp.exec_candidates) {
            execve(path.c_str(), lp.argv.data(), lp.envp.data());
            if (errno != ENOENT) break;
        }
        fail(SetupStage::EXEC);
        _exit(127);
    }

    ContainerExit build_exit(const std::string &id, int status) const {
        ContainerExit ex;
        if (WIFEXITED(status)) {
            ex.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            ex.term_signal = WTERMSIG(status);
        }
        auto stats = cgroups_.controller_for(id).get_stats();
        ex.oom_killed = stats.oom_killed;
        if (stats.memory_peak > 0) {
            ex.peak_memory_kb = static_cast<int64_t>(stats.memory_peak / 1024);
        }
        return ex;
    }

    std::map<std::string, std::string> collect_files(const std::string &id) const {
        std::map<std::string, std::string> files;
        std::string root = scratch_of(id) + "/output";
        size_t total = 0;

        std::error_code ec;
        fs::recursive_directory_iterator it(root, fs::directory_options::none, ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            auto st = it->symlink_status(ec);
            if (ec || !fs::is_regular_file(st)) continue;

            std::string rel = fs::relative(it->path(), root, ec).generic_string();
            if (ec || !is_safe_relative_name(rel)) continue;

            auto size = it->file_size(ec);
            if (ec) continue;
            if (total + size > opts_.output_files_cap) {
                LOG_WARN << "Output file skipped, collection cap reached: " << rel;
                continue;
            }
            auto content = read_file(it->path().string());
            if (content.is_error()) {
                LOG_WARN << "Cannot read output file " << rel << ": " << content.error().message();
                continue;
            }
            total += content.value().size();
            files[rel] = std::move(content.value());
        }
        if (ec) {
            LOG_WARN << "Output directory walk stopped: " << ec.message();
        }
        return files;
    }

public:
    explicit NativeRuntime(const NativeRuntimeOptions &opts)
        : opts_(opts), cgroups_(opts.cgroup_root), filter_(create_sandbox_filter()),
          cap_last_(read_cap_last()) {
        filter_.build();
    }

    ~NativeRuntime() override {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &kv : containers_) ids.push_back(kv.first);
        }
        for (const auto &id : ids) {
            auto removed = remove(id);
            if (removed.is_error()) {
                LOG_ERROR << "Container " << id << " not removed at shutdown: "
                          << removed.error().message();
            }
        }
    }

    NativeRuntime(const NativeRuntime&) = delete;
    NativeRuntime& operator=(const NativeRuntime&) = delete;

    /**
     * @brief 创建状态目录与 cgroup 子树
     */
    Result<void> init() {
        SCIV_TRY(make_dirs(opts_.state_dir, 0700));
        return cgroups_.prepare();
    }

    bool has_image(const std::string &image) override {
        auto it = opts_.images.find(image);
        if (it == opts_.images.end() || !is_directory(it->second)) {
            return false;
        }
        for (const auto &mp : required_mountpoints()) {
            if (!is_directory(it->second + mp)) {
                return false;
            }
        }
        return true;
    }

    Result<std::string> create(const ExecutionSpec &spec, const ContainerLabels &labels) override {
        if (!has_image(spec.image)) {
            return SCIV_ERROR(ErrorCode::IMAGE_MISSING, "image not in catalog: " + spec.image);
        }
        if (spec.command.empty()) {
            return SCIV_ERROR(ErrorCode::MALFORMED_JOB, "empty command");
        }
        SCIV_TRY(check_input_names(spec.code_files));
        SCIV_TRY(check_input_names(spec.data_files));
        SCIV_TRY(cgroups_.prepare());

        SCIV_TRY_UNWRAP(uuid, generate_uuid());
        auto c = std::make_shared<Container>();
        c->id = "sciv-" + uuid;
        c->spec = spec;
        c->labels = labels;
        c->rootfs = opts_.images.at(spec.image);

        std::string dir = dir_of(c->id);
        auto built = [&]() -> Result<void> {
            SCIV_TRY(make_dirs(dir, 0700));
            SCIV_TRY(write_meta(*c));
            SCIV_TRY(make_dirs(dir + "/root", 0755));
            SCIV_TRY(make_dirs(dir + "/scratch", 0755));
            SCIV_TRY(write_inputs(dir + "/code", spec.code_files));
            SCIV_TRY(write_inputs(dir + "/data", spec.data_files));
            SCIV_TRY(mount_scratch(c->id, spec.limits.scratch_mb));
            auto cg = cgroups_.controller_for(c->id);
            SCIV_TRY(cg.create());
            return cg.apply_limits(CgroupLimits::from(spec.limits));
        }();

        if (built.is_error()) {
            auto cleaned = teardown_paths(c->id);
            if (cleaned.is_error()) {
                LOG_WARN << "Partial container " << c->id << " left for sweeper: "
                         << cleaned.error().message();
            }
            return built.error();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            containers_[c->id] = c;
        }
        LOG_DEBUG << "Container " << c->id << " created for job " << labels.job_id
                  << " image=" << spec.image;
        return c->id;
    }

    Result<void> start(const std::string &id) override {
        auto c = find(id);
        if (!c) {
            return SCIV_ERROR(ErrorCode::NOT_FOUND, "no container " + id);
        }
        if (c->pid > 0) {
            return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE, "container already started: " + id);
        }

        LaunchPlan lp = prepare_launch(*c);
        lp.bind_pointers();

        int out_pipe[2], err_pipe[2], sync_pipe[2], report_pipe[2];
        if (pipe2(out_pipe, O_CLOEXEC) < 0) {
            return SCIV_ERROR(ErrorCode::PIPE_FAILED, std::strerror(errno));
        }
        if (pipe2(err_pipe, O_CLOEXEC) < 0) {
            close(out_pipe[0]); close(out_pipe[1]);
            return SCIV_ERROR(ErrorCode::PIPE_FAILED, std::strerror(errno));
        }
        if (pipe2(sync_pipe, O_CLOEXEC) < 0) {
            close(out_pipe[0]); close(out_pipe[1]);
            close(err_pipe[0]); close(err_pipe[1]);
            return SCIV_ERROR(ErrorCode::PIPE_FAILED, std::strerror(errno));
        }
        if (pipe2(report_pipe, O_CLOEXEC) < 0) {
            close(out_pipe[0]); close(out_pipe[1]);
            close(err_pipe[0]); close(err_pipe[1]);
            close(sync_pipe[0]); close(sync_pipe[1]);
            return SCIV_ERROR(ErrorCode::PIPE_FAILED, std::strerror(errno));
        }

        pid_t pid = static_cast<pid_t>(syscall(SYS_clone, CONTAINER_CLONE_FLAGS | SIGCHLD,
                                               nullptr, nullptr, nullptr, nullptr));
        if (pid < 0) {
            int saved = errno;
            for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1],
                           sync_pipe[0], sync_pipe[1], report_pipe[0], report_pipe[1]}) {
                close(fd);
            }
            return SCIV_ERROR(ErrorCode::FORK_FAILED, std::string("clone: ") + std::strerror(saved));
        }

        if (pid == 0) {
            close(out_pipe[0]);
            close(err_pipe[0]);
            close(sync_pipe[1]);
            close(report_pipe[0]);
            child_main(lp, filter_, sync_pipe[0], report_pipe[1], out_pipe[1], err_pipe[1]);
        }

        close(out_pipe[1]);
        close(err_pipe[1]);
        close(sync_pipe[0]);
        close(report_pipe[1]);
        c->pid = pid;

        // 先进 cgroup 再放行，保证容器内每个进程都受限制
        auto added = cgroups_.controller_for(id).add_process(pid);
        if (added.ok()) {
            ssize_t w = write(sync_pipe[1], "x", 1);
            if (w != 1) {
                added = SCIV_ERROR(ErrorCode::PIPE_FAILED, "cannot release container process");
            }
        }
        close(sync_pipe[1]);

        SetupFailure failure{0, 0};
        ssize_t n = -1;
        if (added.ok()) {
            do {
                n = read(report_pipe[0], &failure, sizeof(failure));
            } while (n < 0 && errno == EINTR);
        }
        close(report_pipe[0]);

        if (added.is_error() || n != 0) {
            ::kill(pid, SIGKILL);
            int status;
            waitpid(pid, &status, 0);
            c->reaped = true;
            close(out_pipe[0]);
            close(err_pipe[0]);
            if (added.is_error()) {
                return added.error();
            }
            auto stage = static_cast<SetupStage>(failure.stage);
            std::string msg = std::string("container setup failed at ") + setup_stage_str(stage) +
                              ": " + std::strerror(failure.err);
            if (stage == SetupStage::EXEC && failure.err == ENOENT) {
                return SCIV_ERROR(ErrorCode::IMAGE_MISSING, msg);
            }
            return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE, msg);
        }

        size_t cap = opts_.stdout_cap;
        c->stdout_reader = std::thread(drain, out_pipe[0], &c->stdout_raw, cap);
        c->stderr_reader = std::thread(drain, err_pipe[0], &c->stderr_raw, cap);

        auto meta = write_meta(*c);
        if (meta.is_error()) {
            LOG_WARN << "Cannot update meta for " << id << ": " << meta.error().message();
        }
        LOG_DEBUG << "Container " << id << " started, pid=" << pid;
        return Ok();
    }

    Result<std::optional<ContainerExit>> wait(const std::string &id,
                                              std::chrono::milliseconds timeout) override {
        auto c = find(id);
        if (!c) {
            return SCIV_ERROR(ErrorCode::NOT_FOUND, "no container " + id);
        }
        if (c->exit) {
            return c->exit;
        }
        if (c->pid <= 0) {
            return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE, "container not started: " + id);
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            int status = 0;
            pid_t ret = waitpid(c->pid, &status, WNOHANG);
            if (ret == c->pid) {
                c->reaped = true;
                c->exit = build_exit(id, status);
                return c->exit;
            }
            if (ret < 0) {
                if (errno == EINTR) continue;
                return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE,
                                  std::string("waitpid: ") + std::strerror(errno));
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return std::optional<ContainerExit>();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    Result<void> kill(const std::string &id) override {
        auto cg = cgroups_.controller_for(id);
        if (file_exists(cg.path())) {
            SCIV_TRY(cg.kill_all());
        }
        auto c = find(id);
        if (c && c->pid > 0 && !c->reaped) {
            if (::kill(c->pid, SIGKILL) < 0 && errno != ESRCH) {
                return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE,
                                  std::string("kill: ") + std::strerror(errno));
            }
        }
        return Ok();
    }

    Result<ContainerOutput> collect(const std::string &id) override {
        auto c = find(id);
        if (!c) {
            return SCIV_ERROR(ErrorCode::NOT_FOUND, "no container " + id);
        }
        if (!c->reaped) {
            return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE, "container still running: " + id);
        }
        if (c->stdout_reader.joinable()) c->stdout_reader.join();
        if (c->stderr_reader.joinable()) c->stderr_reader.join();

        ContainerOutput out;
        out.stdout_text = sanitize_output(truncate_output(c->stdout_raw, opts_.stdout_cap));
        out.stderr_text = sanitize_output(truncate_output(c->stderr_raw, opts_.stdout_cap));
        out.files = collect_files(id);
        return out;
    }

    Result<void> remove(const std::string &id) override {
        auto c = find(id);
        SCIV_TRY(kill(id));

        if (c) {
            if (c->pid > 0 && !c->reaped) {
                int status;
                if (waitpid(c->pid, &status, 0) == c->pid || errno == ECHILD) {
                    c->reaped = true;
                }
            }
            if (c->stdout_reader.joinable()) c->stdout_reader.join();
            if (c->stderr_reader.joinable()) c->stderr_reader.join();
        }

        SCIV_TRY(teardown_paths(id));

        std::lock_guard<std::mutex> lock(mutex_);
        containers_.erase(id);
        LOG_DEBUG << "Container " << id << " removed";
        return Ok();
    }

    Result<std::vector<ContainerInfo>> list() override {
        std::vector<ContainerInfo> out;
        std::error_code ec;
        fs::directory_iterator it(opts_.state_dir, ec), end;
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory) return out;
            return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE,
                              "list " + opts_.state_dir + ": " + ec.message());
        }
        for (; it != end; it.increment(ec)) {
            if (ec) break;
            if (!it->is_directory(ec)) continue;

            ContainerInfo info;
            info.id = it->path().filename().string();

            // 元数据缺失或损坏时（包括仍在 create 中）以目录 mtime 作为创建时间，
            // 寿命按 0 计，超过扫描器的宽限期后才会被回收
            info.labels.created_at_ms = mtime_ms(it->path().string());
            auto text = read_file(it->path().string() + "/meta.json");
            if (text.ok()) {
                auto meta = json::parse(text.value(), ErrorCode::RUNTIME_UNAVAILABLE);
                if (meta.ok() && meta.value().isObject()) {
                    const auto &m = meta.value();
                    info.labels.job_id = m.get("job_id", "").asString();
                    info.labels.created_at_ms =
                        m.get("created_at_ms", Json::Int64(info.labels.created_at_ms)).asInt64();
                    info.labels.lifetime_ms = m.get("lifetime_ms", 0).asInt64();
                }
            }
            out.push_back(std::move(info));
        }
        if (ec) {
            return SCIV_ERROR(ErrorCode::RUNTIME_UNAVAILABLE,
                              "list " + opts_.state_dir + ": " + ec.message());
        }
        return out;
    }

    const NativeRuntimeOptions& options() const { return opts_; }
};

} // namespace sandbox
} // namespace sciv

#endif // SCIV_SANDBOX_NATIVE_RUNTIME_H
