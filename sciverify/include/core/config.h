/**
 * @file config.h
 * @brief 配置系统
 *
 * 从 YAML 文件加载类型化的 Settings，再叠加 VERIFY_ 前缀的环境变量覆盖。
 * 环境变量名为点分路径大写后把 '.' 换成 "__"，例如
 * VERIFY_QUEUE__MAX_ATTEMPTS=5 覆盖 queue.max_attempts。
 *
 * 同时负责提交准入（Settings::admit）：把 JobSubmission 校验为 Job。
 */

#ifndef SCIV_CORE_CONFIG_H
#define SCIV_CORE_CONFIG_H

#include <string>
#include <map>
#include <vector>
#include <algorithm>
#include <cstdlib>

#include "core/error.h"
#include "core/logger.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/yaml_config.h"

extern char **environ;

namespace sciv {

//==============================================================================
// 配置分节
//==============================================================================

struct LogSettings {
    std::string level = "info";
    std::string file;
    bool color = true;
};

struct QueueSettings {
    std::string root = "/var/lib/sciverify/queue";
    std::string group = "verify-workers";
    std::string consumer;              ///< 为空时取 hostname-pid
    int visibility_timeout_sec = 900;
    int max_attempts = 3;
    int poll_interval_ms = 500;
    int retry_backoff_ms = 1000;
    int max_backoff_ms = 30000;
};

struct ResultSettings {
    int retention_hours = 168;
};

struct SandboxSettings {
    std::string state_dir = "/var/lib/sciverify/containers";
    std::string cgroup_root = "/sys/fs/cgroup/sciverify";
    int teardown_grace_ms = 5000;
    int sweep_interval_sec = 60;
    int sweep_slack_sec = 30;
    int64_t stdout_cap_bytes = 65536;
    int64_t output_files_cap_bytes = 33554432;
    int run_uid = 65534;
    int run_gid = 65534;
    std::map<std::string, std::string> images;   ///< 镜像名 -> rootfs 目录
};

struct LimitSettings {
    ResourceLimits defaults;
    ResourceLimits max{400, 8192, 1024, 600, 256};
    int64_t max_code_bytes = 1048576;
    std::map<std::string, int> runner_timeout_sec{{"lean4", 300}, {"symbolic", 60}};
};

struct ComparatorSettings {
    double abs_tol = 1e-12;
    double rel_tol = 1e-10;
    double stat_tol = 0.05;
    double similarity_threshold = 0.95;
};

struct SigningSettings {
    std::string key_path = "keys/ed25519.pem";
    bool ephemeral_dev_key = false;
};

struct WorkerSettings {
    int concurrency = 4;
};

//==============================================================================
// 读取辅助
//==============================================================================

namespace detail {

template<typename T>
inline Result<void> read_into(const yaml::Node &root, const std::string &path, T &out);

template<>
inline Result<void> read_into<int>(const yaml::Node &root, const std::string &path, int &out) {
    auto node = root.at_path(path);
    if (!node || node->is_null()) return Ok();
    auto v = node->as_int();
    if (v.is_error()) return Error(v.error().code(), path + ": " + v.error().message());
    out = static_cast<int>(v.value());
    return Ok();
}

template<>
inline Result<void> read_into<int64_t>(const yaml::Node &root, const std::string &path, int64_t &out) {
    auto node = root.at_path(path);
    if (!node || node->is_null()) return Ok();
    auto v = node->as_int();
    if (v.is_error()) return Error(v.error().code(), path + ": " + v.error().message());
    out = v.value();
    return Ok();
}

template<>
inline Result<void> read_into<double>(const yaml::Node &root, const std::string &path, double &out) {
    auto node = root.at_path(path);
    if (!node || node->is_null()) return Ok();
    auto v = node->as_double();
    if (v.is_error()) return Error(v.error().code(), path + ": " + v.error().message());
    out = v.value();
    return Ok();
}

template<>
inline Result<void> read_into<bool>(const yaml::Node &root, const std::string &path, bool &out) {
    auto node = root.at_path(path);
    if (!node || node->is_null()) return Ok();
    auto v = node->as_bool();
    if (v.is_error()) return Error(v.error().code(), path + ": " + v.error().message());
    out = v.value();
    return Ok();
}

template<>
inline Result<void> read_into<std::string>(const yaml::Node &root, const std::string &path,
                                           std::string &out) {
    auto node = root.at_path(path);
    if (!node || node->is_null()) return Ok();
    out = node->as_string();
    return Ok();
}

inline Result<void> read_limits(const yaml::Node &root, const std::string &prefix,
                                ResourceLimits &out) {
    SCIV_TRY(read_into(root, prefix + ".cpu_percent", out.cpu_percent));
    SCIV_TRY(read_into(root, prefix + ".memory_mb", out.memory_mb));
    SCIV_TRY(read_into(root, prefix + ".scratch_mb", out.scratch_mb));
    SCIV_TRY(read_into(root, prefix + ".timeout_sec", out.timeout_sec));
    SCIV_TRY(read_into(root, prefix + ".pids", out.pids));
    return Ok();
}

/**
 * @brief VERIFY_QUEUE__MAX_ATTEMPTS -> queue.max_attempts
 */
inline std::string env_name_to_path(const std::string &name) {
    std::string rest = name.substr(7);  // 去掉 "VERIFY_"
    std::string path;
    for (size_t i = 0; i < rest.size(); i++) {
        if (rest[i] == '_' && i + 1 < rest.size() && rest[i + 1] == '_') {
            path += '.';
            i++;
        } else {
            path += static_cast<char>(::tolower(static_cast<unsigned char>(rest[i])));
        }
    }
    return path;
}

} // namespace detail

//==============================================================================
// Settings
//==============================================================================

/**
 * @brief 全部配置
 */
class Settings {
public:
    LogSettings log;
    QueueSettings queue;
    ResultSettings results;
    SandboxSettings sandbox;
    LimitSettings limits;
    ComparatorSettings comparators;
    SigningSettings signing;
    WorkerSettings worker;

    Settings() {
        sandbox.images = {
            {"phiacta-verify-runner-python:latest", "/var/lib/sciverify/images/python"},
            {"phiacta-verify-runner-r:latest", "/var/lib/sciverify/images/r"},
            {"phiacta-verify-runner-julia:latest", "/var/lib/sciverify/images/julia"},
            {"phiacta-verify-runner-lean4:latest", "/var/lib/sciverify/images/lean4"},
            {"phiacta-verify-runner-symbolic:latest", "/var/lib/sciverify/images/symbolic"},
        };
    }

    /**
     * @brief 把环境变量覆盖写入 YAML 树
     * @param env 形如 environ 的以 nullptr 结尾的数组
     */
    static void apply_env_overrides(yaml::Node &root, char **env) {
        if (!env) return;
        for (char **p = env; *p; ++p) {
            std::string entry(*p);
            if (entry.compare(0, 7, "VERIFY_") != 0) continue;
            size_t eq = entry.find('=');
            if (eq == std::string::npos || eq <= 7) continue;
            std::string path = detail::env_name_to_path(entry.substr(0, eq));
            root.set_path(path, yaml::Parser::parse_scalar(entry.substr(eq + 1)));
        }
    }

    /**
     * @brief 从 YAML 树构造（未出现的键保留默认值）
     */
    static Result<Settings> from_yaml(const yaml::Node &root) {
        Settings s;

        SCIV_TRY(detail::read_into(root, "log.level", s.log.level));
        SCIV_TRY(detail::read_into(root, "log.file", s.log.file));
        SCIV_TRY(detail::read_into(root, "log.color", s.log.color));

        SCIV_TRY(detail::read_into(root, "queue.root", s.queue.root));
        SCIV_TRY(detail::read_into(root, "queue.group", s.queue.group));
        SCIV_TRY(detail::read_into(root, "queue.consumer", s.queue.consumer));
        SCIV_TRY(detail::read_into(root, "queue.visibility_timeout_sec", s.queue.visibility_timeout_sec));
        SCIV_TRY(detail::read_into(root, "queue.max_attempts", s.queue.max_attempts));
        SCIV_TRY(detail::read_into(root, "queue.poll_interval_ms", s.queue.poll_interval_ms));
        SCIV_TRY(detail::read_into(root, "queue.retry_backoff_ms", s.queue.retry_backoff_ms));
        SCIV_TRY(detail::read_into(root, "queue.max_backoff_ms", s.queue.max_backoff_ms));

        SCIV_TRY(detail::read_into(root, "results.retention_hours", s.results.retention_hours));

        SCIV_TRY(detail::read_into(root, "sandbox.state_dir", s.sandbox.state_dir));
        SCIV_TRY(detail::read_into(root, "sandbox.cgroup_root", s.sandbox.cgroup_root));
        SCIV_TRY(detail::read_into(root, "sandbox.teardown_grace_ms", s.sandbox.teardown_grace_ms));
        SCIV_TRY(detail::read_into(root, "sandbox.sweep_interval_sec", s.sandbox.sweep_interval_sec));
        SCIV_TRY(detail::read_into(root, "sandbox.sweep_slack_sec", s.sandbox.sweep_slack_sec));
        SCIV_TRY(detail::read_into(root, "sandbox.stdout_cap_bytes", s.sandbox.stdout_cap_bytes));
        SCIV_TRY(detail::read_into(root, "sandbox.output_files_cap_bytes", s.sandbox.output_files_cap_bytes));
        SCIV_TRY(detail::read_into(root, "sandbox.run_uid", s.sandbox.run_uid));
        SCIV_TRY(detail::read_into(root, "sandbox.run_gid", s.sandbox.run_gid));
        if (auto images = root.at_path("sandbox.images")) {
            if (!images->is_map()) {
                return Err<Settings>(ErrorCode::CONFIG_INVALID_VALUE,
                                     "sandbox.images must be a map of image name to rootfs");
            }
            s.sandbox.images.clear();
            for (const auto &kv : images->as_map()) {
                s.sandbox.images[kv.first] = kv.second->as_string();
            }
        }

        SCIV_TRY(detail::read_limits(root, "limits.default", s.limits.defaults));
        SCIV_TRY(detail::read_limits(root, "limits.max", s.limits.max));
        SCIV_TRY(detail::read_into(root, "limits.max_code_bytes", s.limits.max_code_bytes));
        if (auto rt = root.at_path("limits.runner_timeout_sec")) {
            for (const auto &kv : rt->as_map()) {
                auto v = kv.second->as_int();
                if (v.is_error()) {
                    return Err<Settings>(ErrorCode::CONFIG_INVALID_VALUE,
                                         "limits.runner_timeout_sec." + kv.first + ": " +
                                         v.error().message());
                }
                s.limits.runner_timeout_sec[kv.first] = static_cast<int>(v.value());
            }
        }

        SCIV_TRY(detail::read_into(root, "comparators.abs_tol", s.comparators.abs_tol));
        SCIV_TRY(detail::read_into(root, "comparators.rel_tol", s.comparators.rel_tol));
        SCIV_TRY(detail::read_into(root, "comparators.stat_tol", s.comparators.stat_tol));
        SCIV_TRY(detail::read_into(root, "comparators.similarity_threshold",
                                   s.comparators.similarity_threshold));

        SCIV_TRY(detail::read_into(root, "signing.key_path", s.signing.key_path));
        SCIV_TRY(detail::read_into(root, "signing.ephemeral_dev_key", s.signing.ephemeral_dev_key));

        SCIV_TRY(detail::read_into(root, "worker.concurrency", s.worker.concurrency));

        if (s.queue.consumer.empty()) {
            s.queue.consumer = default_consumer_name();
        }

        SCIV_TRY(s.validate());
        return s;
    }

    /**
     * @brief 加载配置文件并叠加环境变量
     * @param path 为空时只使用默认值与环境变量
     */
    static Result<Settings> load(const std::string &path, char **env = environ) {
        yaml::NodePtr root = std::make_shared<yaml::Node>(yaml::NodeMap{});
        if (!path.empty()) {
            SCIV_TRY_UNWRAP(loaded, yaml::load_yaml(path));
            root = loaded;
        }
        apply_env_overrides(*root, env);
        return from_yaml(*root);
    }

    /**
     * @brief 检查配置一致性
     */
    Result<void> validate() const {
        auto positive = [](const ResourceLimits &l) {
            return l.cpu_percent > 0 && l.memory_mb > 0 && l.scratch_mb > 0 &&
                   l.timeout_sec > 0 && l.pids > 0;
        };
        SCIV_ENSURE(positive(limits.defaults), ErrorCode::CONFIG_INVALID_VALUE,
                    "limits.default values must be positive");
        SCIV_ENSURE(positive(limits.max), ErrorCode::CONFIG_INVALID_VALUE,
                    "limits.max values must be positive");
        SCIV_ENSURE(within(limits.defaults, limits.max), ErrorCode::CONFIG_INVALID_VALUE,
                    "limits.default exceeds limits.max");
        for (const auto &kv : limits.runner_timeout_sec) {
            SCIV_ENSURE(parse_runner_kind(kv.first).has_value(), ErrorCode::CONFIG_INVALID_VALUE,
                        "limits.runner_timeout_sec: unknown runner " + kv.first);
            SCIV_ENSURE(kv.second > 0 && kv.second <= limits.max.timeout_sec,
                        ErrorCode::CONFIG_INVALID_VALUE,
                        "limits.runner_timeout_sec." + kv.first + " out of range");
        }
        SCIV_ENSURE(limits.max_code_bytes > 0, ErrorCode::CONFIG_INVALID_VALUE,
                    "limits.max_code_bytes must be positive");

        SCIV_ENSURE(queue.max_attempts > 0, ErrorCode::CONFIG_INVALID_VALUE,
                    "queue.max_attempts must be positive");
        SCIV_ENSURE(!queue.group.empty(), ErrorCode::CONFIG_INVALID_VALUE,
                    "queue.group must not be empty");
        SCIV_ENSURE(queue.poll_interval_ms > 0 && queue.retry_backoff_ms > 0 &&
                    queue.max_backoff_ms >= queue.retry_backoff_ms,
                    ErrorCode::CONFIG_INVALID_VALUE, "queue backoff settings are inconsistent");
        int64_t longest_ms = static_cast<int64_t>(limits.max.timeout_sec) * 1000 +
                             sandbox.teardown_grace_ms;
        SCIV_ENSURE(static_cast<int64_t>(queue.visibility_timeout_sec) * 1000 > longest_ms,
                    ErrorCode::CONFIG_INVALID_VALUE,
                    "queue.visibility_timeout_sec must exceed limits.max.timeout_sec plus "
                    "sandbox.teardown_grace_ms");

        SCIV_ENSURE(results.retention_hours > 0, ErrorCode::CONFIG_INVALID_VALUE,
                    "results.retention_hours must be positive");

        SCIV_ENSURE(sandbox.teardown_grace_ms > 0 && sandbox.sweep_interval_sec > 0 &&
                    sandbox.sweep_slack_sec >= 0,
                    ErrorCode::CONFIG_INVALID_VALUE, "sandbox timing settings are inconsistent");
        SCIV_ENSURE(sandbox.stdout_cap_bytes > 0 && sandbox.output_files_cap_bytes > 0,
                    ErrorCode::CONFIG_INVALID_VALUE, "sandbox output caps must be positive");

        SCIV_ENSURE(comparators.abs_tol >= 0 && comparators.rel_tol >= 0 &&
                    comparators.stat_tol >= 0,
                    ErrorCode::CONFIG_INVALID_VALUE, "comparator tolerances must be non-negative");
        SCIV_ENSURE(comparators.similarity_threshold >= 0 && comparators.similarity_threshold <= 1,
                    ErrorCode::CONFIG_INVALID_VALUE,
                    "comparators.similarity_threshold must be within [0, 1]");

        SCIV_ENSURE(worker.concurrency > 0, ErrorCode::CONFIG_INVALID_VALUE,
                    "worker.concurrency must be positive");
        SCIV_ENSURE(parse_log_level(log.level).has_value(), ErrorCode::CONFIG_INVALID_VALUE,
                    "log.level is not a known level: " + log.level);
        return Ok();
    }

    /**
     * @brief 提交准入：校验并补全为不可变的 Job
     *
     * 覆盖值超过上限时拒绝而不是截断。重复 id 由队列在入队时检查。
     */
    Result<Job> admit(const JobSubmission &sub, int64_t now = now_ms()) const {
        Job job;

        auto runner = parse_runner_kind(sub.runner);
        if (!runner) {
            return Err<Job>(ErrorCode::INVALID_SUBMISSION, "unknown runner: " + sub.runner);
        }
        job.runner = *runner;

        auto format = parse_source_format(sub.format);
        if (!format) {
            return Err<Job>(ErrorCode::INVALID_SUBMISSION, "unknown source format: " + sub.format);
        }
        job.format = *format;
        if (job.format == SourceFormat::JUPYTER &&
            !(job.runner == RunnerKind::PYTHON || job.runner == RunnerKind::R ||
              job.runner == RunnerKind::JULIA)) {
            return Err<Job>(ErrorCode::INVALID_SUBMISSION,
                            std::string("jupyter source is not valid for runner ") +
                            runner_kind_str(job.runner));
        }
        if (job.format == SourceFormat::RMARKDOWN && job.runner != RunnerKind::R) {
            return Err<Job>(ErrorCode::INVALID_SUBMISSION, "rmarkdown source requires runner r");
        }
        if (sub.syntax_only && job.runner == RunnerKind::LEAN4) {
            return Err<Job>(ErrorCode::INVALID_SUBMISSION,
                            "syntax-only mode is not available for lean4");
        }

        if (sub.source.empty()) {
            return Err<Job>(ErrorCode::INVALID_SUBMISSION, "source must not be empty");
        }
        if (static_cast<int64_t>(sub.source.size()) > limits.max_code_bytes) {
            return Err<Job>(ErrorCode::CODE_TOO_LARGE,
                            "source is " + std::to_string(sub.source.size()) +
                            " bytes, limit is " + std::to_string(limits.max_code_bytes));
        }
        job.source = sub.source;
        job.code_hash = sha256_hex(sub.source);
        if (sub.code_hash && *sub.code_hash != job.code_hash) {
            return Err<Job>(ErrorCode::CODE_HASH_MISMATCH,
                            "code_hash does not match source (expected " + job.code_hash + ")");
        }

        for (const auto &kv : sub.data_files) {
            if (!is_safe_relative_name(kv.first) || kv.first.find('/') != std::string::npos) {
                return Err<Job>(ErrorCode::INVALID_SUBMISSION,
                                "invalid data file name: " + kv.first);
            }
        }
        job.data_files = sub.data_files;

        if (sub.expected) {
            ExpectedOutput exp = *sub.expected;
            if (!exp.targets_stdout() &&
                (!is_safe_relative_name(exp.name) || exp.name.find('/') != std::string::npos)) {
                return Err<Job>(ErrorCode::INVALID_SUBMISSION,
                                "invalid expected output name: " + exp.name);
            }
            if (sub.comparator) {
                auto kind = parse_comparator_kind(*sub.comparator);
                if (!kind) {
                    return Err<Job>(ErrorCode::INVALID_SUBMISSION,
                                    "unknown comparator: " + *sub.comparator);
                }
                exp.comparator = *kind;
            }
            job.expected = exp;
        } else if (sub.comparator) {
            return Err<Job>(ErrorCode::INVALID_SUBMISSION,
                            "comparator given without expected output");
        }

        const Tolerance &t = sub.tolerance;
        if ((t.abs_tol && *t.abs_tol < 0) || (t.rel_tol && *t.rel_tol < 0) ||
            (t.stat_tol && *t.stat_tol < 0)) {
            return Err<Job>(ErrorCode::INVALID_SUBMISSION, "tolerances must be non-negative");
        }
        if (t.similarity_threshold &&
            (*t.similarity_threshold < 0 || *t.similarity_threshold > 1)) {
            return Err<Job>(ErrorCode::INVALID_SUBMISSION,
                            "similarity_threshold must be within [0, 1]");
        }
        job.tolerance = t;

        SCIV_TRY_UNWRAP(resolved, resolve_limits(job.runner, sub.limits));
        job.limits = resolved;

        if (sub.id) {
            if (sub.id->empty() || !is_safe_relative_name(*sub.id) ||
                sub.id->find('/') != std::string::npos) {
                return Err<Job>(ErrorCode::INVALID_SUBMISSION, "invalid job id");
            }
            job.id = *sub.id;
        } else {
            SCIV_TRY_UNWRAP(uuid, generate_uuid());
            job.id = uuid;
        }

        job.syntax_only = sub.syntax_only;
        job.claim_id = sub.claim_id;
        job.submitted_by = sub.submitted_by;
        job.submitted_at_ms = now;
        return job;
    }

    /**
     * @brief 默认值 + 运行器默认超时 + 覆盖值，超过上限报错
     */
    Result<ResourceLimits> resolve_limits(RunnerKind runner, const ResourceOverrides &o) const {
        ResourceLimits l = limits.defaults;
        auto rt = limits.runner_timeout_sec.find(runner_kind_str(runner));
        if (rt != limits.runner_timeout_sec.end()) {
            l.timeout_sec = rt->second;
        }

        struct Field { const char *name; const std::optional<int> &value; int &target; int max; };
        Field fields[] = {
            {"cpu_percent", o.cpu_percent, l.cpu_percent, limits.max.cpu_percent},
            {"memory_mb", o.memory_mb, l.memory_mb, limits.max.memory_mb},
            {"scratch_mb", o.scratch_mb, l.scratch_mb, limits.max.scratch_mb},
            {"timeout_sec", o.timeout_sec, l.timeout_sec, limits.max.timeout_sec},
            {"pids", o.pids, l.pids, limits.max.pids},
        };
        for (auto &f : fields) {
            if (!f.value) continue;
            if (*f.value <= 0) {
                return Err<ResourceLimits>(ErrorCode::LIMIT_EXCEEDED,
                                           std::string(f.name) + " must be positive");
            }
            if (*f.value > f.max) {
                return Err<ResourceLimits>(ErrorCode::LIMIT_EXCEEDED,
                                           std::string(f.name) + "=" + std::to_string(*f.value) +
                                           " exceeds maximum " + std::to_string(f.max));
            }
            f.target = *f.value;
        }
        return l;
    }

    const std::string& rootfs_for(const std::string &image) const {
        static const std::string none;
        auto it = sandbox.images.find(image);
        return it != sandbox.images.end() ? it->second : none;
    }

private:
    static bool within(const ResourceLimits &l, const ResourceLimits &max) {
        return l.cpu_percent <= max.cpu_percent && l.memory_mb <= max.memory_mb &&
               l.scratch_mb <= max.scratch_mb && l.timeout_sec <= max.timeout_sec &&
               l.pids <= max.pids;
    }
};

} // namespace sciv

#endif // SCIV_CORE_CONFIG_H
