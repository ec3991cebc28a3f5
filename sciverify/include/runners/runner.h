/**
 * @file runner.h
 * @brief 运行器集合
 *
 * 每种运行器把 Job 翻译成 ExecutionSpec，并把 SandboxResult 解释为信号：
 *
 * | 运行器       | 镜像                                  | 命令                      |
 * |--------------|---------------------------------------|---------------------------|
 * | python       | phiacta-verify-runner-python:latest   | python /code/run.py       |
 * | r            | phiacta-verify-runner-r:latest        | Rscript /code/script.R    |
 * | julia        | phiacta-verify-runner-julia:latest    | julia /code/script.jl     |
 * | lean4        | phiacta-verify-runner-lean4:latest    | lean /code/proof.lean     |
 * | symbolic     | phiacta-verify-runner-symbolic:latest | python /code/symbolic.py  |
 *
 * 运行器无状态，按 RunnerKind 选择，以 std::variant 承载。
 */

#ifndef SCIV_RUNNERS_RUNNER_H
#define SCIV_RUNNERS_RUNNER_H

#include <string>
#include <vector>
#include <map>
#include <variant>

#include "core/error.h"
#include "core/types.h"
#include "runners/notebook.h"

namespace sciv {
namespace runners {

//==============================================================================
// 公共部分
//==============================================================================

namespace detail {

inline bool contains_any(const std::string &text, const std::vector<std::string> &markers,
                         std::string *hit = nullptr) {
    for (const auto &m : markers) {
        if (text.find(m) != std::string::npos) {
            if (hit) *hit = m;
            return true;
        }
    }
    return false;
}

/**
 * @brief 按 source_format 取出要执行的代码
 */
inline Result<std::string> prepare_source(const Job &job) {
    switch (job.format) {
        case SourceFormat::SCRIPT:    return job.source;
        case SourceFormat::JUPYTER:   return extract_ipynb(job.source);
        case SourceFormat::RMARKDOWN: return extract_rmarkdown(job.source);
    }
    return SCIV_ERROR(ErrorCode::MALFORMED_JOB, "unknown source format");
}

/**
 * @brief 非成功的沙箱状态统一视为执行失败
 */
inline RunnerVerdict abnormal_verdict(const SandboxResult &raw) {
    RunnerVerdict v;
    v.signal = Signal::EXECUTION_FAILED;
    v.detail = std::string(exit_status_str(raw.status));
    if (!raw.detail.empty()) {
        v.detail += ": " + raw.detail;
    }
    return v;
}

inline ExecutionSpec base_spec(const Job &job, const std::string &image) {
    ExecutionSpec spec;
    spec.job_id = job.id;
    spec.image = image;
    spec.data_files = job.data_files;
    spec.limits = job.limits;
    return spec;
}

} // namespace detail

/**
 * @brief 解释型运行器的描述
 */
struct ScriptProfile {
    RunnerKind kind;
    std::string image;
    std::string interpreter;
    std::string code_file;                       ///< /code 下的文件名
    std::vector<std::string> parse_markers;      ///< stderr 中出现即视为解析失败
    std::vector<std::string> syntax_command;     ///< 只做解析检查的命令
    std::map<std::string, std::string> env;
};

/**
 * @brief Python / R / Julia / SymbolicMath 的共同实现
 */
class ScriptRunner {
protected:
    ScriptProfile profile_;

    explicit ScriptRunner(ScriptProfile profile) : profile_(std::move(profile)) {}

    Result<ExecutionSpec> make_spec(const Job &job, std::vector<std::string> command) const {
        SCIV_TRY_UNWRAP(code, detail::prepare_source(job));
        ExecutionSpec spec = detail::base_spec(job, profile_.image);
        spec.command = std::move(command);
        spec.code_files[profile_.code_file] = std::move(code);
        spec.env = profile_.env;
        return spec;
    }

public:
    RunnerKind kind() const { return profile_.kind; }
    const std::string& image() const { return profile_.image; }
    const std::vector<std::string>& parse_markers() const { return profile_.parse_markers; }

    Result<ExecutionSpec> build_spec(const Job &job) const {
        return make_spec(job, {profile_.interpreter, "/code/" + profile_.code_file});
    }

    Result<ExecutionSpec> build_syntax_spec(const Job &job) const {
        return make_spec(job, profile_.syntax_command);
    }

    RunnerVerdict interpret(const SandboxResult &raw, bool syntax_only) const {
        if (raw.status != ExitStatus::SUCCESS && raw.status != ExitStatus::NON_ZERO) {
            return detail::abnormal_verdict(raw);
        }

        RunnerVerdict v;
        if (raw.status == ExitStatus::SUCCESS) {
            v.signal = syntax_only ? Signal::PARSE_SUCCEEDED : Signal::EXECUTION_SUCCEEDED;
            return v;
        }

        std::string marker;
        if (detail::contains_any(raw.stderr_text, profile_.parse_markers, &marker)) {
            v.signal = Signal::PARSE_FAILED;
            v.detail = "parse error (" + marker + ")";
        } else {
            v.signal = Signal::EXECUTION_FAILED;
            v.detail = raw.term_signal != 0
                ? "terminated by signal " + std::to_string(raw.term_signal)
                : "exit code " + std::to_string(raw.exit_code);
        }
        return v;
    }
};

//==============================================================================
// 具体运行器
//==============================================================================

namespace detail {

inline std::vector<std::string> python_syntax_command(const std::string &file) {
    return {"python", "-c",
            "import ast, sys; ast.parse(open(sys.argv[1]).read(), sys.argv[1])",
            "/code/" + file};
}

inline std::vector<std::string> python_markers() {
    return {"SyntaxError", "IndentationError", "TabError"};
}

inline std::map<std::string, std::string> python_env() {
    return {{"PYTHONDONTWRITEBYTECODE", "1"}, {"PYTHONUNBUFFERED", "1"}, {"MPLBACKEND", "Agg"}};
}

} // namespace detail

class PythonRunner : public ScriptRunner {
public:
    PythonRunner()
        : ScriptRunner({RunnerKind::PYTHON, "phiacta-verify-runner-python:latest", "python",
                        "run.py", detail::python_markers(),
                        detail::python_syntax_command("run.py"), detail::python_env()}) {}
};

class RRunner : public ScriptRunner {
public:
    RRunner()
        : ScriptRunner({RunnerKind::R, "phiacta-verify-runner-r:latest", "Rscript",
                        "script.R", {"Error in parse", "unexpected"},
                        {"Rscript", "-e", "invisible(parse(file = '/code/script.R'))"},
                        {{"R_LIBS_USER", "/tmp/Rlib"}}}) {}
};

class JuliaRunner : public ScriptRunner {
public:
    JuliaRunner()
        : ScriptRunner({RunnerKind::JULIA, "phiacta-verify-runner-julia:latest", "julia",
                        "script.jl", {"ParseError", "syntax:"},
                        {"julia", "--startup-file=no", "-e",
                         "ex = Meta.parseall(read(\"/code/script.jl\", String)); "
                         "for a in ex.args; if a isa Expr && a.head in (:error, :incomplete); "
                         "println(stderr, \"ParseError: \", a); exit(1); end; end"},
                        {{"JULIA_NUM_THREADS", "1"}}}) {}
};

class SymbolicMathRunner : public ScriptRunner {
public:
    SymbolicMathRunner()
        : ScriptRunner({RunnerKind::SYMBOLIC_MATH, "phiacta-verify-runner-symbolic:latest", "python",
                        "symbolic.py", detail::python_markers(),
                        detail::python_syntax_command("symbolic.py"), detail::python_env()}) {}
};

/**
 * @brief Lean 4 证明检查
 *
 * 检查通过即形式化证明。输出含 "declaration uses 'sorry'" 时仍判为通过，
 * 只在 detail 中注明。不支持只做语法检查。
 */
class Lean4Runner {
private:
    std::string image_ = "phiacta-verify-runner-lean4:latest";
    std::vector<std::string> markers_ = {"error: unexpected token", "error: unexpected end of input",
                                        "expected term"};

public:
    static constexpr const char* SORRY_WARNING = "declaration uses 'sorry'";

    RunnerKind kind() const { return RunnerKind::LEAN4; }
    const std::string& image() const { return image_; }
    const std::vector<std::string>& parse_markers() const { return markers_; }

    Result<ExecutionSpec> build_spec(const Job &job) const {
        if (job.format != SourceFormat::SCRIPT) {
            return SCIV_ERROR(ErrorCode::UNSUPPORTED_MODE, "lean4 accepts plain proof text only");
        }
        ExecutionSpec spec = detail::base_spec(job, image_);
        spec.command = {"lean", "/code/proof.lean"};
        spec.code_files["proof.lean"] = job.source;
        return spec;
    }

    Result<ExecutionSpec> build_syntax_spec(const Job&) const {
        return SCIV_ERROR(ErrorCode::UNSUPPORTED_MODE, "lean4 has no syntax-only mode");
    }

    RunnerVerdict interpret(const SandboxResult &raw, bool) const {
        if (raw.status != ExitStatus::SUCCESS && raw.status != ExitStatus::NON_ZERO) {
            return detail::abnormal_verdict(raw);
        }

        // Lean 把诊断写到 stdout
        std::string output = raw.stdout_text + "\n" + raw.stderr_text;
        RunnerVerdict v;
        if (raw.status == ExitStatus::SUCCESS) {
            v.signal = Signal::EXECUTION_SUCCEEDED;
            v.formally_proven = true;
            if (output.find(SORRY_WARNING) != std::string::npos) {
                v.detail = "proof checked with warning: declaration uses 'sorry'";
            }
            return v;
        }

        std::string marker;
        if (detail::contains_any(output, markers_, &marker)) {
            v.signal = Signal::PARSE_FAILED;
            v.detail = "parse error (" + marker + ")";
        } else {
            v.signal = Signal::EXECUTION_FAILED;
            v.detail = "proof check failed, exit code " + std::to_string(raw.exit_code);
        }
        return v;
    }
};

//==============================================================================
// 选择与分派
//==============================================================================

using Runner = std::variant<PythonRunner, RRunner, JuliaRunner, Lean4Runner, SymbolicMathRunner>;

inline Runner make_runner(RunnerKind kind) {
    switch (kind) {
        case RunnerKind::PYTHON:        return PythonRunner();
        case RunnerKind::R:             return RRunner();
        case RunnerKind::JULIA:         return JuliaRunner();
        case RunnerKind::LEAN4:         return Lean4Runner();
        case RunnerKind::SYMBOLIC_MATH: return SymbolicMathRunner();
    }
    return PythonRunner();
}

inline RunnerKind runner_kind(const Runner &r) {
    return std::visit([](const auto &x) { return x.kind(); }, r);
}

inline std::string runner_image(const Runner &r) {
    return std::visit([](const auto &x) { return x.image(); }, r);
}

inline Result<ExecutionSpec> build_spec(const Runner &r, const Job &job) {
    return std::visit([&](const auto &x) { return x.build_spec(job); }, r);
}

inline Result<ExecutionSpec> build_syntax_spec(const Runner &r, const Job &job) {
    return std::visit([&](const auto &x) { return x.build_syntax_spec(job); }, r);
}

inline RunnerVerdict interpret(const Runner &r, const SandboxResult &raw, bool syntax_only) {
    return std::visit([&](const auto &x) { return x.interpret(raw, syntax_only); }, r);
}

} // namespace runners
} // namespace sciv

#endif // SCIV_RUNNERS_RUNNER_H
