/**
 * @file canonical.h
 * @brief 验证结果的规范编码
 *
 * 签名前字段按固定顺序逐一编码，每个字段一行：
 *
 *   <name>:<length>:<bytes>\n     ← 存在的字段
 *   <name>:-\n                     ← 缺省的可选字段
 *
 * 浮点数用定点小数，时间戳用 ISO-8601 UTC（毫秒）。相同字段总是产生相同字节。
 */

#ifndef SCIV_SIGNING_CANONICAL_H
#define SCIV_SIGNING_CANONICAL_H

#include <string>
#include <optional>

#include "core/types.h"
#include "core/utils.h"

namespace sciv {
namespace signing {

class CanonicalWriter {
private:
    std::string out_;

public:
    CanonicalWriter& field(const std::string &name, const std::string &value) {
        out_ += name;
        out_ += ':';
        out_ += std::to_string(value.size());
        out_ += ':';
        out_ += value;
        out_ += '\n';
        return *this;
    }

    CanonicalWriter& field(const std::string &name, int64_t value) {
        return field(name, std::to_string(value));
    }

    CanonicalWriter& field(const std::string &name, bool value) {
        return field(name, std::string(value ? "true" : "false"));
    }

    CanonicalWriter& real(const std::string &name, double value) {
        return field(name, format_fixed(value));
    }

    CanonicalWriter& absent(const std::string &name) {
        out_ += name;
        out_ += ":-\n";
        return *this;
    }

    const std::string& bytes() const { return out_; }
};

/**
 * @brief 规范编码签名前的字段（不含 content_address / signature / public_key_ref）
 */
inline std::string canonical_bytes(const VerificationResult &r) {
    CanonicalWriter w;
    w.field("version", std::string("sciverify-result-v1"));
    w.field("job_id", r.job_id);
    w.field("claim_id", r.claim_id);
    w.field("code_hash", r.code_hash);
    w.field("level", level_str(r.level));
    w.field("passed", r.passed);
    w.field("detail", r.detail);
    w.field("attempts", static_cast<int64_t>(r.attempts));

    if (r.sandbox) {
        const SandboxSummary &s = *r.sandbox;
        w.field("sandbox", std::string("present"));
        w.field("sandbox.status", std::string(exit_status_str(s.status)));
        w.field("sandbox.exit_code", static_cast<int64_t>(s.exit_code));
        w.field("sandbox.signal", static_cast<int64_t>(s.term_signal));
        w.field("sandbox.duration_ms", s.duration_ms);
        if (s.peak_memory_kb) {
            w.field("sandbox.peak_memory_kb", *s.peak_memory_kb);
        } else {
            w.absent("sandbox.peak_memory_kb");
        }
        w.field("sandbox.image", s.image);
        w.field("sandbox.stdout_excerpt", s.stdout_excerpt);
        w.field("sandbox.stderr_excerpt", s.stderr_excerpt);
    } else {
        w.absent("sandbox");
    }

    if (r.comparison) {
        const ComparisonVerdict &c = *r.comparison;
        w.field("comparison", std::string("present"));
        w.field("comparison.kind", std::string(comparator_kind_str(c.kind)));
        w.field("comparison.matched", c.matched);
        w.real("comparison.score", c.score);
        w.field("comparison.confidence", std::string(confidence_str(c.confidence)));
        w.field("comparison.detail", c.detail);
    } else {
        w.absent("comparison");
    }

    w.field("completed_at", format_iso8601(r.completed_at_ms));
    return w.bytes();
}

/**
 * @brief 内容地址：sha256:<hex>
 */
inline std::string content_address(const VerificationResult &r) {
    return "sha256:" + sha256_hex(canonical_bytes(r));
}

} // namespace signing
} // namespace sciv

#endif // SCIV_SIGNING_CANONICAL_H
