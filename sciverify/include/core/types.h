/**
 * @file types.h
 * @brief 核心数据结构定义
 *
 * 包含验证引擎使用的所有基础数据结构：
 * - Job / JobSubmission: 作业与提交请求
 * - ExecutionSpec / SandboxResult: 单次沙箱执行的输入与输出
 * - RunnerVerdict / ComparisonVerdict: 运行器与比较器的判定
 * - VerificationResult: 签名后的最终结果
 * - QueueMessage: 队列投递元数据
 */

#ifndef SCIV_CORE_TYPES_H
#define SCIV_CORE_TYPES_H

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace sciv {

//==============================================================================
// 枚举
//==============================================================================

/**
 * @brief 运行器种类（封闭集合）
 */
enum class RunnerKind {
    PYTHON,
    R,
    JULIA,
    LEAN4,
    SYMBOLIC_MATH
};

/**
 * @brief 源码格式
 */
enum class SourceFormat {
    SCRIPT,     ///< 普通脚本或证明文本
    JUPYTER,    ///< .ipynb，抽取 code cell
    RMARKDOWN   ///< .Rmd，抽取 ```{r} 代码块
};

enum class ComparatorKind {
    EXACT,
    NUMERICAL,
    STATISTICAL,
    BYTE_SIMILARITY
};

/**
 * @brief 比较结论的置信度类别
 */
enum class Confidence {
    BINARY,      ///< 精确比较，非此即彼
    BOUNDED,     ///< 数值比较，误差有界
    APPROXIMATE  ///< 统计摘要或字节相似度，仅为近似
};

/**
 * @brief 沙箱退出状态
 */
enum class ExitStatus {
    SUCCESS,
    NON_ZERO,
    TIMEOUT,          ///< watchdog 触发
    RESOURCE_KILLED,  ///< OOM 等资源终止
    IMAGE_MISSING     ///< 镜像不存在，不重试
};

/**
 * @brief 运行器对原始结果的解释
 */
enum class Signal {
    PARSE_FAILED,
    PARSE_SUCCEEDED,
    EXECUTION_FAILED,
    EXECUTION_SUCCEEDED
};

/**
 * @brief 验证等级 L0 ~ L6（L5 永不产生）
 */
enum class VerificationLevel {
    L0 = 0,
    L1 = 1,
    L2 = 2,
    L3 = 3,
    L4 = 4,
    L5 = 5,
    L6 = 6
};

enum class JobStatus {
    QUEUED,
    RUNNING,
    RETRYING,
    COMPLETED,
    DEAD_LETTERED
};

//==============================================================================
// 枚举与字符串互转
//==============================================================================

inline const char* runner_kind_str(RunnerKind kind) {
    switch (kind) {
        case RunnerKind::PYTHON: return "python";
        case RunnerKind::R: return "r";
        case RunnerKind::JULIA: return "julia";
        case RunnerKind::LEAN4: return "lean4";
        case RunnerKind::SYMBOLIC_MATH: return "symbolic";
    }
    return "unknown";
}

inline std::optional<RunnerKind> parse_runner_kind(const std::string &s) {
    if (s == "python") return RunnerKind::PYTHON;
    if (s == "r") return RunnerKind::R;
    if (s == "julia") return RunnerKind::JULIA;
    if (s == "lean4") return RunnerKind::LEAN4;
    if (s == "symbolic" || s == "symbolic_math") return RunnerKind::SYMBOLIC_MATH;
    return std::nullopt;
}

inline const char* source_format_str(SourceFormat f) {
    switch (f) {
        case SourceFormat::SCRIPT: return "script";
        case SourceFormat::JUPYTER: return "jupyter";
        case SourceFormat::RMARKDOWN: return "rmarkdown";
    }
    return "unknown";
}

inline std::optional<SourceFormat> parse_source_format(const std::string &s) {
    if (s == "script") return SourceFormat::SCRIPT;
    if (s == "jupyter") return SourceFormat::JUPYTER;
    if (s == "rmarkdown") return SourceFormat::RMARKDOWN;
    return std::nullopt;
}

inline const char* comparator_kind_str(ComparatorKind kind) {
    switch (kind) {
        case ComparatorKind::EXACT: return "exact";
        case ComparatorKind::NUMERICAL: return "numerical";
        case ComparatorKind::STATISTICAL: return "statistical";
        case ComparatorKind::BYTE_SIMILARITY: return "byte_similarity";
    }
    return "unknown";
}

inline std::optional<ComparatorKind> parse_comparator_kind(const std::string &s) {
    if (s == "exact") return ComparatorKind::EXACT;
    if (s == "numerical") return ComparatorKind::NUMERICAL;
    if (s == "statistical") return ComparatorKind::STATISTICAL;
    if (s == "byte_similarity") return ComparatorKind::BYTE_SIMILARITY;
    return std::nullopt;
}

inline const char* confidence_str(Confidence c) {
    switch (c) {
        case Confidence::BINARY: return "binary";
        case Confidence::BOUNDED: return "bounded";
        case Confidence::APPROXIMATE: return "approximate";
    }
    return "unknown";
}

inline std::optional<Confidence> parse_confidence(const std::string &s) {
    if (s == "binary") return Confidence::BINARY;
    if (s == "bounded") return Confidence::BOUNDED;
    if (s == "approximate") return Confidence::APPROXIMATE;
    return std::nullopt;
}

inline const char* exit_status_str(ExitStatus s) {
    switch (s) {
        case ExitStatus::SUCCESS: return "success";
        case ExitStatus::NON_ZERO: return "non_zero";
        case ExitStatus::TIMEOUT: return "timeout";
        case ExitStatus::RESOURCE_KILLED: return "resource_killed";
        case ExitStatus::IMAGE_MISSING: return "image_missing";
    }
    return "unknown";
}

inline std::optional<ExitStatus> parse_exit_status(const std::string &s) {
    if (s == "success") return ExitStatus::SUCCESS;
    if (s == "non_zero") return ExitStatus::NON_ZERO;
    if (s == "timeout") return ExitStatus::TIMEOUT;
    if (s == "resource_killed") return ExitStatus::RESOURCE_KILLED;
    if (s == "image_missing") return ExitStatus::IMAGE_MISSING;
    return std::nullopt;
}

inline const char* signal_str(Signal s) {
    switch (s) {
        case Signal::PARSE_FAILED: return "parse_failed";
        case Signal::PARSE_SUCCEEDED: return "parse_succeeded";
        case Signal::EXECUTION_FAILED: return "execution_failed";
        case Signal::EXECUTION_SUCCEEDED: return "execution_succeeded";
    }
    return "unknown";
}

inline std::string level_str(VerificationLevel level) {
    return "L" + std::to_string(static_cast<int>(level));
}

inline std::optional<VerificationLevel> parse_level(const std::string &s) {
    if (s.size() != 2 || s[0] != 'L' || s[1] < '0' || s[1] > '6') {
        return std::nullopt;
    }
    return static_cast<VerificationLevel>(s[1] - '0');
}

inline const char* job_status_str(JobStatus s) {
    switch (s) {
        case JobStatus::QUEUED: return "QUEUED";
        case JobStatus::RUNNING: return "RUNNING";
        case JobStatus::RETRYING: return "RETRYING";
        case JobStatus::COMPLETED: return "COMPLETED";
        case JobStatus::DEAD_LETTERED: return "DEAD_LETTERED";
    }
    return "UNKNOWN";
}

inline std::optional<JobStatus> parse_job_status(const std::string &s) {
    if (s == "QUEUED") return JobStatus::QUEUED;
    if (s == "RUNNING") return JobStatus::RUNNING;
    if (s == "RETRYING") return JobStatus::RETRYING;
    if (s == "COMPLETED") return JobStatus::COMPLETED;
    if (s == "DEAD_LETTERED") return JobStatus::DEAD_LETTERED;
    return std::nullopt;
}

//==============================================================================
// 作业
//==============================================================================

/**
 * @brief 资源限制配置
 */
struct ResourceLimits {
    int cpu_percent;  ///< CPU 份额，100 表示一个核
    int memory_mb;    ///< 内存上限（MB）
    int scratch_mb;   ///< 可写 scratch 挂载大小（MB）
    int timeout_sec;  ///< 墙钟超时（秒）
    int pids;         ///< 进程数上限

    ResourceLimits()
        : cpu_percent(100), memory_mb(2048), scratch_mb(256), timeout_sec(120), pids(64) {}

    ResourceLimits(int _cpu, int _memory, int _scratch, int _timeout, int _pids)
        : cpu_percent(_cpu), memory_mb(_memory), scratch_mb(_scratch),
          timeout_sec(_timeout), pids(_pids) {}
};

/**
 * @brief 提交时的资源覆盖项，未给出的字段取默认值
 */
struct ResourceOverrides {
    std::optional<int> cpu_percent;
    std::optional<int> memory_mb;
    std::optional<int> scratch_mb;
    std::optional<int> timeout_sec;
    std::optional<int> pids;
};

/**
 * @brief 比较器容差参数，未给出的取配置默认值
 */
struct Tolerance {
    std::optional<double> abs_tol;
    std::optional<double> rel_tol;
    std::optional<double> stat_tol;
    std::optional<double> similarity_threshold;
};

/**
 * @brief 期望输出
 *
 * name 为空或 "stdout" 时与标准输出比较，否则与程序写出的 /output/<name> 比较。
 */
struct ExpectedOutput {
    std::string name;
    std::string content;
    ComparatorKind comparator = ComparatorKind::EXACT;

    bool targets_stdout() const { return name.empty() || name == "stdout"; }
};

/**
 * @brief 验证作业，入队后不可变
 */
struct Job {
    std::string id;
    RunnerKind runner = RunnerKind::PYTHON;
    SourceFormat format = SourceFormat::SCRIPT;
    std::string source;
    std::map<std::string, std::string> data_files;  ///< 文件名 -> 内容，挂载到 /data
    std::optional<ExpectedOutput> expected;
    Tolerance tolerance;
    ResourceLimits limits;
    bool syntax_only = false;
    std::string claim_id;
    std::string submitted_by;
    std::string code_hash;         ///< 源码 SHA-256 十六进制
    int64_t submitted_at_ms = 0;
};

/**
 * @brief 提交请求，经 Settings::admit 校验后变为 Job
 */
struct JobSubmission {
    std::optional<std::string> id;
    std::string runner;
    std::string format = "script";
    std::string source;
    std::map<std::string, std::string> data_files;
    std::optional<ExpectedOutput> expected;
    std::optional<std::string> comparator;
    Tolerance tolerance;
    ResourceOverrides limits;
    bool syntax_only = false;
    std::string claim_id;
    std::string submitted_by;
    std::optional<std::string> code_hash;
};

//==============================================================================
// 沙箱执行
//==============================================================================

/**
 * @brief 沙箱安全策略，对所有运行器一致
 */
struct SecurityPolicy {
    bool network_disabled = true;
    bool read_only_root = true;
    bool drop_capabilities = true;
    bool no_new_privileges = true;
};

/**
 * @brief 一次执行的完整描述，由运行器产生
 */
struct ExecutionSpec {
    std::string job_id;                              ///< 用作容器标签
    std::string image;
    std::vector<std::string> command;
    std::map<std::string, std::string> code_files;   ///< 只读挂载到 /code
    std::map<std::string, std::string> data_files;   ///< 只读挂载到 /data
    std::map<std::string, std::string> env;
    SecurityPolicy policy;
    ResourceLimits limits;
};

/**
 * @brief 单次执行的原始结果，产生后不再修改
 */
struct SandboxResult {
    ExitStatus status = ExitStatus::NON_ZERO;
    int exit_code = -1;
    int term_signal = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::map<std::string, std::string> output_files;
    int64_t duration_ms = 0;
    std::optional<int64_t> peak_memory_kb;
    std::string image;
    std::string detail;   ///< 管理器附加说明（如超时、镜像缺失）

    bool is_success() const { return status == ExitStatus::SUCCESS; }
};

struct RunnerVerdict {
    Signal signal = Signal::EXECUTION_FAILED;
    bool formally_proven = false;
    std::string detail;
};

/**
 * @brief 比较结论，每个作业至多一个
 */
struct ComparisonVerdict {
    ComparatorKind kind = ComparatorKind::EXACT;
    bool matched = false;
    double score = 0.0;
    Confidence confidence = Confidence::BINARY;
    std::string detail;
};

//==============================================================================
// 验证结果
//==============================================================================

/**
 * @brief 签名结果中的沙箱摘要
 */
struct SandboxSummary {
    ExitStatus status = ExitStatus::NON_ZERO;
    int exit_code = -1;
    int term_signal = 0;
    int64_t duration_ms = 0;
    std::optional<int64_t> peak_memory_kb;
    std::string image;
    std::string stdout_excerpt;   ///< 前 1000 字节
    std::string stderr_excerpt;
};

/**
 * @brief 最终验证结果，签名后不可变
 */
struct VerificationResult {
    std::string job_id;
    std::string claim_id;
    std::string code_hash;
    VerificationLevel level = VerificationLevel::L0;
    bool passed = false;
    std::string detail;
    int attempts = 0;
    std::optional<SandboxSummary> sandbox;
    std::optional<ComparisonVerdict> comparison;
    int64_t completed_at_ms = 0;

    // 签名后填入
    std::string content_address;
    std::string signature;
    std::string public_key_ref;

    bool is_sealed() const { return !content_address.empty() && !signature.empty(); }
};

//==============================================================================
// 队列
//==============================================================================

/**
 * @brief 一次投递的元数据
 */
struct QueueMessage {
    std::string message_id;
    std::string job_id;
    std::string group;
    std::string consumer;
    int delivery_count = 0;     ///< 被 claim 的总次数
    int attempts = 0;           ///< 计入上限的尝试次数
    int64_t first_delivered_ms = 0;
    int64_t last_delivered_ms = 0;
    std::string last_error;
};

} // namespace sciv

#endif // SCIV_CORE_TYPES_H
