/**
 * @file json_codec.h
 * @brief JSON 编解码（jsoncpp）
 *
 * 覆盖作业记录、提交请求、验证结果与队列元数据。
 * 二进制内容统一以 base64 存放在 *_base64 字段。
 */

#ifndef SCIV_CORE_JSON_CODEC_H
#define SCIV_CORE_JSON_CODEC_H

#include <string>
#include <memory>
#include <sstream>

#include <json/json.h>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"

namespace sciv {
namespace json {

//==============================================================================
// 基础读写
//==============================================================================

inline Result<Json::Value> parse(const std::string &text, ErrorCode on_error = ErrorCode::MALFORMED_JOB) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        return Err<Json::Value>(on_error, "invalid JSON: " + errs);
    }
    return root;
}

inline std::string write_compact(const Json::Value &v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, v);
}

inline std::string write_pretty(const Json::Value &v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, v);
}

namespace detail {

inline Result<std::string> get_string(const Json::Value &obj, const char *key, ErrorCode code,
                                      bool required = true, const std::string &def = "") {
    const Json::Value &v = obj[key];
    if (v.isNull()) {
        if (required) return Err<std::string>(code, std::string("missing field: ") + key);
        return def;
    }
    if (!v.isString()) {
        return Err<std::string>(code, std::string("field must be a string: ") + key);
    }
    return v.asString();
}

inline Result<std::optional<int>> get_opt_int(const Json::Value &obj, const char *key, ErrorCode code) {
    const Json::Value &v = obj[key];
    if (v.isNull()) return std::optional<int>();
    if (!v.isInt()) {
        return Err<std::optional<int>>(code, std::string("field must be an integer: ") + key);
    }
    return std::optional<int>(v.asInt());
}

inline Result<std::optional<double>> get_opt_double(const Json::Value &obj, const char *key,
                                                    ErrorCode code) {
    const Json::Value &v = obj[key];
    if (v.isNull()) return std::optional<double>();
    if (!v.isNumeric()) {
        return Err<std::optional<double>>(code, std::string("field must be a number: ") + key);
    }
    return std::optional<double>(v.asDouble());
}

inline Json::Value files_to_json(const std::map<std::string, std::string> &files) {
    Json::Value out(Json::objectValue);
    for (const auto &kv : files) {
        out[kv.first] = base64_encode(kv.second);
    }
    return out;
}

inline Result<std::map<std::string, std::string>> files_from_json(const Json::Value &v,
                                                                  ErrorCode code) {
    std::map<std::string, std::string> out;
    if (v.isNull()) return out;
    if (!v.isObject()) {
        return Err<std::map<std::string, std::string>>(code, "file map must be an object");
    }
    for (const auto &name : v.getMemberNames()) {
        if (!v[name].isString()) {
            return Err<std::map<std::string, std::string>>(code, "file content must be base64: " + name);
        }
        auto bytes = base64_decode(v[name].asString());
        if (bytes.is_error()) {
            return Err<std::map<std::string, std::string>>(code, "bad base64 in file " + name);
        }
        out[name] = bytes.value();
    }
    return out;
}

inline Json::Value tolerance_to_json(const Tolerance &t) {
    Json::Value out(Json::objectValue);
    if (t.abs_tol) out["abs_tol"] = *t.abs_tol;
    if (t.rel_tol) out["rel_tol"] = *t.rel_tol;
    if (t.stat_tol) out["stat_tol"] = *t.stat_tol;
    if (t.similarity_threshold) out["similarity_threshold"] = *t.similarity_threshold;
    return out;
}

inline Result<Tolerance> tolerance_from_json(const Json::Value &v, ErrorCode code) {
    Tolerance t;
    if (v.isNull()) return t;
    if (!v.isObject()) return Err<Tolerance>(code, "tolerance must be an object");
    SCIV_TRY_UNWRAP(abs_tol, get_opt_double(v, "abs_tol", code));
    SCIV_TRY_UNWRAP(rel_tol, get_opt_double(v, "rel_tol", code));
    SCIV_TRY_UNWRAP(stat_tol, get_opt_double(v, "stat_tol", code));
    SCIV_TRY_UNWRAP(sim, get_opt_double(v, "similarity_threshold", code));
    t.abs_tol = abs_tol;
    t.rel_tol = rel_tol;
    t.stat_tol = stat_tol;
    t.similarity_threshold = sim;
    return t;
}

inline Json::Value limits_to_json(const ResourceLimits &l) {
    Json::Value out(Json::objectValue);
    out["cpu_percent"] = l.cpu_percent;
    out["memory_mb"] = l.memory_mb;
    out["scratch_mb"] = l.scratch_mb;
    out["timeout_sec"] = l.timeout_sec;
    out["pids"] = l.pids;
    return out;
}

inline Result<ResourceOverrides> overrides_from_json(const Json::Value &v, ErrorCode code) {
    ResourceOverrides o;
    if (v.isNull()) return o;
    if (!v.isObject()) return Err<ResourceOverrides>(code, "limits must be an object");
    SCIV_TRY_UNWRAP(cpu, get_opt_int(v, "cpu_percent", code));
    SCIV_TRY_UNWRAP(mem, get_opt_int(v, "memory_mb", code));
    SCIV_TRY_UNWRAP(scratch, get_opt_int(v, "scratch_mb", code));
    SCIV_TRY_UNWRAP(timeout, get_opt_int(v, "timeout_sec", code));
    SCIV_TRY_UNWRAP(pids, get_opt_int(v, "pids", code));
    o.cpu_percent = cpu;
    o.memory_mb = mem;
    o.scratch_mb = scratch;
    o.timeout_sec = timeout;
    o.pids = pids;
    return o;
}

/**
 * @brief 期望输出：content（文本）与 content_base64（二进制）二选一
 */
inline Result<std::optional<ExpectedOutput>> expected_from_json(const Json::Value &v, ErrorCode code) {
    using Out = std::optional<ExpectedOutput>;
    if (v.isNull()) return Out();
    if (!v.isObject()) return Err<Out>(code, "expected must be an object");
    ExpectedOutput exp;
    SCIV_TRY_UNWRAP(name, get_string(v, "name", code, false));
    exp.name = name;
    if (v["content_base64"].isString()) {
        auto bytes = base64_decode(v["content_base64"].asString());
        if (bytes.is_error()) return Err<Out>(code, "bad base64 in expected.content_base64");
        exp.content = bytes.value();
    } else if (v["content"].isString()) {
        exp.content = v["content"].asString();
    } else {
        return Err<Out>(code, "expected needs content or content_base64");
    }
    if (v["comparator"].isString()) {
        auto kind = parse_comparator_kind(v["comparator"].asString());
        if (!kind) return Err<Out>(code, "unknown comparator: " + v["comparator"].asString());
        exp.comparator = *kind;
    }
    return Out(exp);
}

} // namespace detail

//==============================================================================
// 提交请求
//==============================================================================

/**
 * @brief 解析提交请求
 *
 * 结构上的问题报 INVALID_SUBMISSION，语义校验交给 Settings::admit。
 */
inline Result<JobSubmission> submission_from_json(const Json::Value &v) {
    const ErrorCode code = ErrorCode::INVALID_SUBMISSION;
    if (!v.isObject()) return Err<JobSubmission>(code, "submission must be a JSON object");

    JobSubmission sub;
    if (!v["id"].isNull()) {
        if (!v["id"].isString()) return Err<JobSubmission>(code, "id must be a string");
        sub.id = v["id"].asString();
    }
    SCIV_TRY_UNWRAP(runner, detail::get_string(v, "runner", code));
    sub.runner = runner;
    SCIV_TRY_UNWRAP(format, detail::get_string(v, "format", code, false, "script"));
    sub.format = format;

    if (v["source_base64"].isString()) {
        auto bytes = base64_decode(v["source_base64"].asString());
        if (bytes.is_error()) return Err<JobSubmission>(code, "bad base64 in source_base64");
        sub.source = bytes.value();
    } else {
        SCIV_TRY_UNWRAP(source, detail::get_string(v, "source", code));
        sub.source = source;
    }

    SCIV_TRY_UNWRAP(files, detail::files_from_json(v["data_files_base64"], code));
    sub.data_files = files;

    SCIV_TRY_UNWRAP(expected, detail::expected_from_json(v["expected"], code));
    sub.expected = expected;
    if (!v["comparator"].isNull()) {
        if (!v["comparator"].isString()) return Err<JobSubmission>(code, "comparator must be a string");
        sub.comparator = v["comparator"].asString();
    }
    SCIV_TRY_UNWRAP(tol, detail::tolerance_from_json(v["tolerance"], code));
    sub.tolerance = tol;
    SCIV_TRY_UNWRAP(limits, detail::overrides_from_json(v["limits"], code));
    sub.limits = limits;

    if (!v["syntax_only"].isNull()) {
        if (!v["syntax_only"].isBool()) return Err<JobSubmission>(code, "syntax_only must be a boolean");
        sub.syntax_only = v["syntax_only"].asBool();
    }
    SCIV_TRY_UNWRAP(claim_id, detail::get_string(v, "claim_id", code, false));
    sub.claim_id = claim_id;
    SCIV_TRY_UNWRAP(submitted_by, detail::get_string(v, "submitted_by", code, false));
    sub.submitted_by = submitted_by;
    if (!v["code_hash"].isNull()) {
        if (!v["code_hash"].isString()) return Err<JobSubmission>(code, "code_hash must be a string");
        sub.code_hash = v["code_hash"].asString();
    }
    return sub;
}

//==============================================================================
// 作业记录
//==============================================================================

inline Json::Value job_to_json(const Job &job) {
    Json::Value v(Json::objectValue);
    v["id"] = job.id;
    v["runner"] = runner_kind_str(job.runner);
    v["format"] = source_format_str(job.format);
    v["source_base64"] = base64_encode(job.source);
    v["data_files_base64"] = detail::files_to_json(job.data_files);
    if (job.expected) {
        Json::Value exp(Json::objectValue);
        exp["name"] = job.expected->name;
        exp["content_base64"] = base64_encode(job.expected->content);
        exp["comparator"] = comparator_kind_str(job.expected->comparator);
        v["expected"] = exp;
    }
    v["tolerance"] = detail::tolerance_to_json(job.tolerance);
    v["limits"] = detail::limits_to_json(job.limits);
    v["syntax_only"] = job.syntax_only;
    v["claim_id"] = job.claim_id;
    v["submitted_by"] = job.submitted_by;
    v["code_hash"] = job.code_hash;
    v["submitted_at_ms"] = static_cast<Json::Int64>(job.submitted_at_ms);
    return v;
}

/**
 * @brief 读回作业记录；记录损坏属于作业致命错误
 */
inline Result<Job> job_from_json(const Json::Value &v) {
    const ErrorCode code = ErrorCode::MALFORMED_JOB;
    if (!v.isObject()) return Err<Job>(code, "job record must be an object");

    Job job;
    SCIV_TRY_UNWRAP(id, detail::get_string(v, "id", code));
    job.id = id;
    SCIV_TRY_UNWRAP(runner_name, detail::get_string(v, "runner", code));
    auto runner = parse_runner_kind(runner_name);
    if (!runner) return Err<Job>(code, "unknown runner: " + runner_name);
    job.runner = *runner;
    SCIV_TRY_UNWRAP(format_name, detail::get_string(v, "format", code, false, "script"));
    auto format = parse_source_format(format_name);
    if (!format) return Err<Job>(code, "unknown format: " + format_name);
    job.format = *format;

    SCIV_TRY_UNWRAP(source_b64, detail::get_string(v, "source_base64", code));
    auto source = base64_decode(source_b64);
    if (source.is_error()) return Err<Job>(code, "bad base64 in source_base64");
    job.source = source.value();

    SCIV_TRY_UNWRAP(files, detail::files_from_json(v["data_files_base64"], code));
    job.data_files = files;
    SCIV_TRY_UNWRAP(expected, detail::expected_from_json(v["expected"], code));
    job.expected = expected;
    SCIV_TRY_UNWRAP(tol, detail::tolerance_from_json(v["tolerance"], code));
    job.tolerance = tol;

    const Json::Value &l = v["limits"];
    if (!l.isObject()) return Err<Job>(code, "limits missing from job record");
    job.limits = ResourceLimits(l["cpu_percent"].asInt(), l["memory_mb"].asInt(),
                                l["scratch_mb"].asInt(), l["timeout_sec"].asInt(),
                                l["pids"].asInt());

    job.syntax_only = v["syntax_only"].asBool();
    job.claim_id = v["claim_id"].asString();
    job.submitted_by = v["submitted_by"].asString();
    job.code_hash = v["code_hash"].asString();
    job.submitted_at_ms = v["submitted_at_ms"].asInt64();
    return job;
}

//==============================================================================
// 验证结果
//==============================================================================

inline Json::Value result_to_json(const VerificationResult &r) {
    Json::Value v(Json::objectValue);
    v["job_id"] = r.job_id;
    v["claim_id"] = r.claim_id;
    v["code_hash"] = r.code_hash;
    v["level"] = level_str(r.level);
    v["passed"] = r.passed;
    v["detail"] = r.detail;
    v["attempts"] = r.attempts;
    if (r.sandbox) {
        const SandboxSummary &s = *r.sandbox;
        Json::Value sb(Json::objectValue);
        sb["status"] = exit_status_str(s.status);
        sb["exit_code"] = s.exit_code;
        sb["signal"] = s.term_signal;
        sb["duration_ms"] = static_cast<Json::Int64>(s.duration_ms);
        if (s.peak_memory_kb) sb["peak_memory_kb"] = static_cast<Json::Int64>(*s.peak_memory_kb);
        sb["image"] = s.image;
        sb["stdout_excerpt"] = s.stdout_excerpt;
        sb["stderr_excerpt"] = s.stderr_excerpt;
        v["sandbox"] = sb;
    }
    if (r.comparison) {
        const ComparisonVerdict &c = *r.comparison;
        Json::Value cv(Json::objectValue);
        cv["kind"] = comparator_kind_str(c.kind);
        cv["matched"] = c.matched;
        cv["score"] = c.score;
        cv["confidence"] = confidence_str(c.confidence);
        cv["detail"] = c.detail;
        v["comparison"] = cv;
    }
    v["completed_at"] = format_iso8601(r.completed_at_ms);
    v["completed_at_ms"] = static_cast<Json::Int64>(r.completed_at_ms);
    v["content_address"] = r.content_address;
    v["signature"] = r.signature;
    v["public_key_ref"] = r.public_key_ref;
    return v;
}

inline Result<VerificationResult> result_from_json(const Json::Value &v) {
    const ErrorCode code = ErrorCode::FILE_READ_ERROR;
    if (!v.isObject()) return Err<VerificationResult>(code, "result record must be an object");

    VerificationResult r;
    SCIV_TRY_UNWRAP(job_id, detail::get_string(v, "job_id", code));
    r.job_id = job_id;
    r.claim_id = v["claim_id"].asString();
    r.code_hash = v["code_hash"].asString();
    auto level = parse_level(v["level"].asString());
    if (!level) return Err<VerificationResult>(code, "bad level in result " + job_id);
    r.level = *level;
    r.passed = v["passed"].asBool();
    r.detail = v["detail"].asString();
    r.attempts = v["attempts"].asInt();

    const Json::Value &sb = v["sandbox"];
    if (sb.isObject()) {
        SandboxSummary s;
        auto status = parse_exit_status(sb["status"].asString());
        if (!status) return Err<VerificationResult>(code, "bad sandbox status in result " + job_id);
        s.status = *status;
        s.exit_code = sb["exit_code"].asInt();
        s.term_signal = sb["signal"].asInt();
        s.duration_ms = sb["duration_ms"].asInt64();
        if (!sb["peak_memory_kb"].isNull()) s.peak_memory_kb = sb["peak_memory_kb"].asInt64();
        s.image = sb["image"].asString();
        s.stdout_excerpt = sb["stdout_excerpt"].asString();
        s.stderr_excerpt = sb["stderr_excerpt"].asString();
        r.sandbox = s;
    }

    const Json::Value &cv = v["comparison"];
    if (cv.isObject()) {
        ComparisonVerdict c;
        auto kind = parse_comparator_kind(cv["kind"].asString());
        auto confidence = parse_confidence(cv["confidence"].asString());
        if (!kind || !confidence) {
            return Err<VerificationResult>(code, "bad comparison in result " + job_id);
        }
        c.kind = *kind;
        c.confidence = *confidence;
        c.matched = cv["matched"].asBool();
        c.score = cv["score"].asDouble();
        c.detail = cv["detail"].asString();
        r.comparison = c;
    }

    r.completed_at_ms = v["completed_at_ms"].asInt64();
    r.content_address = v["content_address"].asString();
    r.signature = v["signature"].asString();
    r.public_key_ref = v["public_key_ref"].asString();
    return r;
}

//==============================================================================
// 队列元数据
//==============================================================================

inline Json::Value message_to_json(const QueueMessage &m) {
    Json::Value v(Json::objectValue);
    v["message_id"] = m.message_id;
    v["job_id"] = m.job_id;
    v["group"] = m.group;
    v["consumer"] = m.consumer;
    v["delivery_count"] = m.delivery_count;
    v["attempts"] = m.attempts;
    v["first_delivered_ms"] = static_cast<Json::Int64>(m.first_delivered_ms);
    v["last_delivered_ms"] = static_cast<Json::Int64>(m.last_delivered_ms);
    v["last_error"] = m.last_error;
    return v;
}

inline Result<QueueMessage> message_from_json(const Json::Value &v) {
    if (!v.isObject() || !v["message_id"].isString() || !v["job_id"].isString()) {
        return Err<QueueMessage>(ErrorCode::QUEUE_UNAVAILABLE, "corrupt queue entry");
    }
    QueueMessage m;
    m.message_id = v["message_id"].asString();
    m.job_id = v["job_id"].asString();
    m.group = v["group"].asString();
    m.consumer = v["consumer"].asString();
    m.delivery_count = v["delivery_count"].asInt();
    m.attempts = v["attempts"].asInt();
    m.first_delivered_ms = v["first_delivered_ms"].asInt64();
    m.last_delivered_ms = v["last_delivered_ms"].asInt64();
    m.last_error = v["last_error"].asString();
    return m;
}

} // namespace json
} // namespace sciv

#endif // SCIV_CORE_JSON_CODEC_H
