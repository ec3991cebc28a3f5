/**
 * @file error.h
 * @brief 错误码、故障分类与 Result<T>
 *
 * 错误码按百位区间归入故障类别，处理流程只看类别：
 *
 * | 区间 | 类别        | 处理                                 |
 * |------|-------------|--------------------------------------|
 * | 1xx  | TRANSIENT   | 本地文件 IO，退避重试                |
 * | 2xx  | CONFIG      | 启动时报告并退出                     |
 * | 3xx  | SUBMISSION  | 入队前拒绝，不产生签名结果           |
 * | 4xx  | JOB_FATAL   | 签发 L0 并确认，永不重试             |
 * | 5xx  | RESOURCE    | 计次重投，达到上限后死信             |
 * | 6xx  | SIGNING     | worker 致命                          |
 * | 9xx  | TRANSIENT   | 基础设施故障，不计次重投             |
 */

#ifndef SCIV_CORE_ERROR_H
#define SCIV_CORE_ERROR_H

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <ostream>

namespace sciv {

//==============================================================================
// 错误码
//==============================================================================

enum class ErrorCode {
    OK = 0,

    FILE_NOT_FOUND = 100,
    FILE_READ_ERROR = 101,
    FILE_WRITE_ERROR = 102,
    FILE_PERMISSION_DENIED = 103,

    CONFIG_PARSE_ERROR = 200,
    CONFIG_MISSING_KEY = 201,
    CONFIG_INVALID_VALUE = 202,

    INVALID_SUBMISSION = 300,
    LIMIT_EXCEEDED = 301,
    CODE_TOO_LARGE = 302,
    CODE_HASH_MISMATCH = 303,
    DUPLICATE_JOB = 304,

    MALFORMED_JOB = 400,
    MALFORMED_NOTEBOOK = 401,
    IMAGE_MISSING = 402,
    UNSUPPORTED_MODE = 403,
    PATH_TRAVERSAL = 404,
    CORRUPT_RECORD = 405,

    EXECUTION_TIMEOUT = 500,
    RESOURCE_KILLED = 501,

    KEY_UNAVAILABLE = 600,
    SIGNING_FAILED = 601,
    VERIFY_FAILED = 602,

    SYSTEM_ERROR = 900,
    FORK_FAILED = 901,
    EXEC_FAILED = 902,
    PIPE_FAILED = 903,
    QUEUE_UNAVAILABLE = 904,
    RUNTIME_UNAVAILABLE = 905,
    NOT_FOUND = 906,
    UNKNOWN_ERROR = 999
};

enum class FaultClass {
    NONE,
    TRANSIENT,
    CONFIG,
    SUBMISSION,
    JOB_FATAL,
    RESOURCE,
    SIGNING
};

namespace detail {

struct ErrorCodeName {
    ErrorCode code;
    const char *name;
};

constexpr ErrorCodeName ERROR_CODE_NAMES[] = {
    {ErrorCode::OK, "OK"},
    {ErrorCode::FILE_NOT_FOUND, "FILE_NOT_FOUND"},
    {ErrorCode::FILE_READ_ERROR, "FILE_READ_ERROR"},
    {ErrorCode::FILE_WRITE_ERROR, "FILE_WRITE_ERROR"},
    {ErrorCode::FILE_PERMISSION_DENIED, "FILE_PERMISSION_DENIED"},
    {ErrorCode::CONFIG_PARSE_ERROR, "CONFIG_PARSE_ERROR"},
    {ErrorCode::CONFIG_MISSING_KEY, "CONFIG_MISSING_KEY"},
    {ErrorCode::CONFIG_INVALID_VALUE, "CONFIG_INVALID_VALUE"},
    {ErrorCode::INVALID_SUBMISSION, "INVALID_SUBMISSION"},
    {ErrorCode::LIMIT_EXCEEDED, "LIMIT_EXCEEDED"},
    {ErrorCode::CODE_TOO_LARGE, "CODE_TOO_LARGE"},
    {ErrorCode::CODE_HASH_MISMATCH, "CODE_HASH_MISMATCH"},
    {ErrorCode::DUPLICATE_JOB, "DUPLICATE_JOB"},
    {ErrorCode::MALFORMED_JOB, "MALFORMED_JOB"},
    {ErrorCode::MALFORMED_NOTEBOOK, "MALFORMED_NOTEBOOK"},
    {ErrorCode::IMAGE_MISSING, "IMAGE_MISSING"},
    {ErrorCode::UNSUPPORTED_MODE, "UNSUPPORTED_MODE"},
    {ErrorCode::PATH_TRAVERSAL, "PATH_TRAVERSAL"},
    {ErrorCode::CORRUPT_RECORD, "CORRUPT_RECORD"},
    {ErrorCode::EXECUTION_TIMEOUT, "EXECUTION_TIMEOUT"},
    {ErrorCode::RESOURCE_KILLED, "RESOURCE_KILLED"},
    {ErrorCode::KEY_UNAVAILABLE, "KEY_UNAVAILABLE"},
    {ErrorCode::SIGNING_FAILED, "SIGNING_FAILED"},
    {ErrorCode::VERIFY_FAILED, "VERIFY_FAILED"},
    {ErrorCode::SYSTEM_ERROR, "SYSTEM_ERROR"},
    {ErrorCode::FORK_FAILED, "FORK_FAILED"},
    {ErrorCode::EXEC_FAILED, "EXEC_FAILED"},
    {ErrorCode::PIPE_FAILED, "PIPE_FAILED"},
    {ErrorCode::QUEUE_UNAVAILABLE, "QUEUE_UNAVAILABLE"},
    {ErrorCode::RUNTIME_UNAVAILABLE, "RUNTIME_UNAVAILABLE"},
    {ErrorCode::NOT_FOUND, "NOT_FOUND"},
    {ErrorCode::UNKNOWN_ERROR, "UNKNOWN_ERROR"},
};

} // namespace detail

inline const char* error_code_str(ErrorCode code) {
    for (const auto &entry : detail::ERROR_CODE_NAMES) {
        if (entry.code == code) return entry.name;
    }
    return "UNKNOWN_ERROR";
}

inline std::ostream& operator<<(std::ostream &os, ErrorCode code) {
    return os << error_code_str(code);
}

//==============================================================================
// 故障分类
//==============================================================================

inline FaultClass fault_class(ErrorCode code) {
    switch (static_cast<int>(code) / 100) {
        case 0: return FaultClass::NONE;
        case 1: return FaultClass::TRANSIENT;
        case 2: return FaultClass::CONFIG;
        case 3: return FaultClass::SUBMISSION;
        case 4: return FaultClass::JOB_FATAL;
        case 5: return FaultClass::RESOURCE;
        case 6: return FaultClass::SIGNING;
        default: return FaultClass::TRANSIENT;
    }
}

/// 重试不会改变结果
inline bool is_job_fatal(ErrorCode code) { return fault_class(code) == FaultClass::JOB_FATAL; }

inline bool is_resource_exhaustion(ErrorCode code) { return fault_class(code) == FaultClass::RESOURCE; }

inline bool is_signing_error(ErrorCode code) { return fault_class(code) == FaultClass::SIGNING; }

inline bool is_transient(ErrorCode code) { return fault_class(code) == FaultClass::TRANSIENT; }

//==============================================================================
// Error
//==============================================================================

/**
 * @brief 错误码 + 消息，可附带上下文与产生位置
 */
class Error {
private:
    ErrorCode code_ = ErrorCode::OK;
    std::string message_;
    std::string context_;
    const char *file_ = nullptr;
    int line_ = 0;

public:
    Error() = default;

    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, const char *file, int line)
        : code_(code), message_(std::move(message)), file_(file), line_(line) {}

    /// 附加上下文（如 job id），可链式调用
    Error& with_context(const std::string &ctx) {
        context_ = context_.empty() ? ctx : ctx + ": " + context_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    FaultClass fault() const { return fault_class(code_); }
    const std::string& message() const { return message_; }
    const std::string& context() const { return context_; }

    /// 形如 "EXECUTION_TIMEOUT job-1: wall-clock timeout (sandbox_manager.h:42)"
    std::string to_string() const {
        std::ostringstream oss;
        oss << error_code_str(code_);
        if (!context_.empty()) oss << " " << context_ << ":";
        if (!message_.empty()) oss << " " << message_;
        if (file_ && line_ > 0) {
            std::string path(file_);
            auto slash = path.find_last_of('/');
            oss << " (" << (slash == std::string::npos ? path : path.substr(slash + 1))
                << ":" << line_ << ")";
        }
        return oss.str();
    }
};

//==============================================================================
// Result<T>
//==============================================================================

/**
 * @brief 成功值或 Error
 *
 *   auto job = queue.load_job(id);
 *   if (job.is_error()) {
 *       LOG_WARN << job.error().to_string();
 *   }
 */
template<typename T>
class Result {
private:
    std::variant<T, Error> state_;

    void throw_if_error() const {
        if (auto err = std::get_if<Error>(&state_)) {
            throw std::runtime_error(err->to_string());
        }
    }

public:
    Result(const T &value) : state_(std::in_place_index<0>, value) {}
    Result(T &&value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(const Error &err) : state_(std::in_place_index<1>, err) {}
    Result(Error &&err) : state_(std::in_place_index<1>, std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "") : state_(std::in_place_index<1>, code, msg) {}

    bool ok() const { return state_.index() == 0; }
    bool is_error() const { return state_.index() == 1; }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<0>(state_); }
    const T& value() const & { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }

    Error& error() & { return std::get<1>(state_); }
    const Error& error() const & { return std::get<1>(state_); }

    /// 出错时抛 std::runtime_error，只用于进程入口
    T& unwrap() & {
        throw_if_error();
        return value();
    }
    const T& unwrap() const & {
        throw_if_error();
        return value();
    }
};

template<>
class Result<void> {
private:
    std::optional<Error> error_;

public:
    Result() = default;
    Result(const Error &err) : error_(err) {}
    Result(Error &&err) : error_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "") : error_(Error(code, msg)) {}

    bool ok() const { return !error_; }
    bool is_error() const { return error_.has_value(); }
    explicit operator bool() const { return ok(); }

    Error& error() { return *error_; }
    const Error& error() const { return *error_; }

    void unwrap() const {
        if (error_) throw std::runtime_error(error_->to_string());
    }
};

template<typename T>
Result<std::decay_t<T>> Ok(T &&value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> Ok() { return {}; }

template<typename T = void>
Result<T> Err(ErrorCode code, const std::string &message = "") {
    return Result<T>(Error(code, message));
}

template<typename T = void>
Result<T> Err(const Error &err) {
    return Result<T>(err);
}

//==============================================================================
// 传播宏
//==============================================================================

/// 带产生位置的 Error
#define SCIV_ERROR(code, msg) \
    sciv::Error((code), (msg), __FILE__, __LINE__)

/// expr 出错时原样向上返回
#define SCIV_TRY(expr) \
    do { \
        auto &&sciv_try_result_ = (expr); \
        if (sciv_try_result_.is_error()) { \
            return sciv_try_result_.error(); \
        } \
    } while (0)

/// expr 出错时向上返回，否则把值移入 var
#define SCIV_TRY_UNWRAP(var, expr) \
    auto sciv_unwrap_##var = (expr); \
    if (sciv_unwrap_##var.is_error()) { \
        return sciv_unwrap_##var.error(); \
    } \
    auto var = std::move(sciv_unwrap_##var).value()

#define SCIV_ENSURE(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return SCIV_ERROR(code, msg); \
        } \
    } while (0)

} // namespace sciv

#endif // SCIV_CORE_ERROR_H
