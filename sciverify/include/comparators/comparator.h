/**
 * @file comparator.h
 * @brief 输出比较器
 *
 * 四种比较方式，全部是纯函数，对任意字节输入都有定义：
 * - exact:           逐字节相等
 * - numerical:       数值序列逐对容差比较
 * - statistical:     五个汇总统计量（均值、总体标准差、最小、最大、中位数）
 * - byte_similarity: 相同位置相同字节的比例
 */

#ifndef SCIV_COMPARATORS_COMPARATOR_H
#define SCIV_COMPARATORS_COMPARATOR_H

#include <string>
#include <vector>
#include <memory>
#include <sstream>
#include <algorithm>
#include <limits>
#include <cmath>
#include <cctype>
#include <cstdio>
#include <cstdlib>

#include <json/json.h>

#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"

namespace sciv {
namespace comparators {

/**
 * @brief 作业未给出容差时使用的默认值
 */
struct ToleranceDefaults {
    double abs_tol = 1e-12;
    double rel_tol = 1e-10;
    double stat_tol = 0.05;
    double similarity_threshold = 0.95;

    static ToleranceDefaults from(const ComparatorSettings &s) {
        ToleranceDefaults d;
        d.abs_tol = s.abs_tol;
        d.rel_tol = s.rel_tol;
        d.stat_tol = s.stat_tol;
        d.similarity_threshold = s.similarity_threshold;
        return d;
    }
};

//==============================================================================
// 数值解析
//==============================================================================

namespace detail {

inline std::string fmt(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.12g", v);
    return buf;
}

inline bool iequal_at(const std::string &s, size_t i, const char *word) {
    for (size_t k = 0; word[k]; k++) {
        if (i + k >= s.size() ||
            std::tolower(static_cast<unsigned char>(s[i + k])) != word[k]) {
            return false;
        }
    }
    return true;
}

inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

/**
 * @brief 从 i 开始尝试匹配一个数，返回匹配长度（0 表示不匹配）
 *
 * 接受：可选符号；inf / infinity / nan（不区分大小写）；
 * 整数、小数，以及 e/E/d/D 指数。
 */
inline size_t match_number(const std::string &s, size_t i) {
    size_t j = i;
    if (j < s.size() && (s[j] == '+' || s[j] == '-')) j++;

    if (iequal_at(s, j, "infinity")) return j + 8 - i;
    if (iequal_at(s, j, "inf")) return j + 3 - i;
    if (iequal_at(s, j, "nan")) return j + 3 - i;

    size_t k = j;
    if (k < s.size() && is_digit(s[k])) {
        while (k < s.size() && is_digit(s[k])) k++;
        if (k < s.size() && s[k] == '.') {
            k++;
            while (k < s.size() && is_digit(s[k])) k++;
        }
    } else if (k + 1 < s.size() && s[k] == '.' && is_digit(s[k + 1])) {
        k++;
        while (k < s.size() && is_digit(s[k])) k++;
    } else {
        return 0;
    }

    // 指数部分必须完整才计入
    if (k < s.size() && (s[k] == 'e' || s[k] == 'E' || s[k] == 'd' || s[k] == 'D')) {
        size_t e = k + 1;
        if (e < s.size() && (s[e] == '+' || s[e] == '-')) e++;
        if (e < s.size() && is_digit(s[e])) {
            while (e < s.size() && is_digit(s[e])) e++;
            k = e;
        }
    }
    return k - i;
}

inline double token_to_double(std::string token) {
    for (auto &c : token) {
        if (c == 'd' || c == 'D') c = 'e';
    }
    return std::strtod(token.c_str(), nullptr);
}

inline void collect_json_numbers(const Json::Value &v, std::vector<double> &out) {
    if (v.isNumeric() && !v.isBool()) {
        out.push_back(v.asDouble());
    } else if (v.isArray()) {
        for (const auto &item : v) collect_json_numbers(item, out);
    } else if (v.isObject()) {
        // getMemberNames 按键排序
        for (const auto &key : v.getMemberNames()) collect_json_numbers(v[key], out);
    }
}

inline bool parse_json_strict(const std::string &text, Json::Value &root) {
    Json::CharReaderBuilder builder;
    builder["failIfExtra"] = true;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    return reader->parse(text.data(), text.data() + text.size(), &root, &errs);
}

} // namespace detail

/**
 * @brief 提取有序数值序列：先按 JSON 解析，没有数值时退回文本扫描
 */
inline std::vector<double> parse_numbers(const std::string &text) {
    std::vector<double> values;

    Json::Value root;
    if (detail::parse_json_strict(text, root)) {
        detail::collect_json_numbers(root, values);
        if (!values.empty()) return values;
    }

    size_t i = 0;
    while (i < text.size()) {
        size_t n = detail::match_number(text, i);
        if (n == 0) {
            i++;
            continue;
        }
        values.push_back(detail::token_to_double(text.substr(i, n)));
        i += n;
    }
    return values;
}

//==============================================================================
// 比较器
//==============================================================================

class ExactComparator {
public:
    ComparisonVerdict compare(const std::string &actual, const std::string &expected) const {
        ComparisonVerdict v;
        v.kind = ComparatorKind::EXACT;
        v.confidence = Confidence::BINARY;
        v.matched = actual == expected;
        v.score = v.matched ? 1.0 : 0.0;
        if (v.matched) {
            v.detail = "outputs are identical (" + std::to_string(actual.size()) + " bytes)";
        } else {
            size_t n = std::min(actual.size(), expected.size());
            size_t pos = 0;
            while (pos < n && actual[pos] == expected[pos]) pos++;
            v.detail = "first difference at byte " + std::to_string(pos) +
                       " (actual " + std::to_string(actual.size()) +
                       " bytes, expected " + std::to_string(expected.size()) + " bytes)";
        }
        return v;
    }
};

class NumericalComparator {
private:
    double abs_tol_;
    double rel_tol_;

public:
    NumericalComparator(double abs_tol, double rel_tol) : abs_tol_(abs_tol), rel_tol_(rel_tol) {}

    /**
     * @brief |a-e| <= abs_tol 或 |a-e| <= rel_tol*|e|；NaN 与 NaN 相等，同号无穷相等
     */
    bool pair_matches(double a, double e) const {
        if (std::isnan(a) || std::isnan(e)) return std::isnan(a) && std::isnan(e);
        if (std::isinf(a) || std::isinf(e)) return a == e;
        double diff = std::fabs(a - e);
        return diff <= abs_tol_ || diff <= rel_tol_ * std::fabs(e);
    }

    ComparisonVerdict compare(const std::string &actual, const std::string &expected) const {
        ComparisonVerdict v;
        v.kind = ComparatorKind::NUMERICAL;
        v.confidence = Confidence::BOUNDED;

        auto a = parse_numbers(actual);
        auto e = parse_numbers(expected);
        if (a.empty() || e.empty()) {
            v.matched = false;
            v.score = 0.0;
            v.detail = "no numbers found in " +
                       std::string(a.empty() && e.empty() ? "either output"
                                   : a.empty() ? "actual output" : "expected output");
            return v;
        }

        size_t pairs = std::min(a.size(), e.size());
        size_t total = std::max(a.size(), e.size());
        size_t matched = 0;
        double max_abs = 0.0;
        long first_bad = -1;
        for (size_t i = 0; i < pairs; i++) {
            if (pair_matches(a[i], e[i])) {
                matched++;
            } else if (first_bad < 0) {
                first_bad = static_cast<long>(i);
            }
            if (std::isfinite(a[i]) && std::isfinite(e[i])) {
                max_abs = std::max(max_abs, std::fabs(a[i] - e[i]));
            }
        }

        v.score = static_cast<double>(matched) / static_cast<double>(total);
        v.matched = matched == pairs && a.size() == e.size();

        std::ostringstream oss;
        oss << matched << "/" << total << " values within tolerance (abs_tol="
            << detail::fmt(abs_tol_) << ", rel_tol=" << detail::fmt(rel_tol_)
            << "); max abs error " << detail::fmt(max_abs);
        if (a.size() != e.size()) {
            oss << "; length mismatch: actual " << a.size() << ", expected " << e.size();
        }
        if (first_bad >= 0) {
            oss << "; first mismatch at index " << first_bad << ": actual "
                << detail::fmt(a[first_bad]) << " vs expected " << detail::fmt(e[first_bad]);
        }
        v.detail = oss.str();
        return v;
    }
};

/**
 * @brief 汇总统计量
 */
struct Summary {
    double mean = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double median = 0.0;

    /// values 非空
    static Summary of(std::vector<double> values) {
        Summary s;
        size_t n = values.size();
        std::sort(values.begin(), values.end());
        double sum = 0.0;
        for (double x : values) sum += x;
        s.mean = sum / static_cast<double>(n);
        double sq = 0.0;
        for (double x : values) sq += (x - s.mean) * (x - s.mean);
        s.stddev = std::sqrt(sq / static_cast<double>(n));
        s.min = values.front();
        s.max = values.back();
        s.median = n % 2 == 1 ? values[n / 2] : (values[n / 2 - 1] + values[n / 2]) / 2.0;
        return s;
    }
};

class StatisticalComparator {
private:
    double tolerance_;

    /// |e-a| / max(|e|, |a|, 1)
    static double deviation(double a, double e) {
        if (a == e) return 0.0;
        double scale = std::max({std::fabs(e), std::fabs(a), 1.0});
        return std::fabs(e - a) / scale;
    }

    static std::vector<double> finite_numbers(const std::string &text) {
        auto all = parse_numbers(text);
        std::vector<double> out;
        out.reserve(all.size());
        for (double x : all) {
            if (std::isfinite(x)) out.push_back(x);
        }
        return out;
    }

public:
    explicit StatisticalComparator(double tolerance) : tolerance_(tolerance) {}

    ComparisonVerdict compare(const std::string &actual, const std::string &expected) const {
        ComparisonVerdict v;
        v.kind = ComparatorKind::STATISTICAL;
        v.confidence = Confidence::APPROXIMATE;

        auto a = finite_numbers(actual);
        auto e = finite_numbers(expected);
        // 两侧都没有有限数值同样算不匹配：解析不出数值的输入一律给出 non-match
        if (a.empty() || e.empty()) {
            v.matched = false;
            v.score = std::numeric_limits<double>::max();
            v.detail = "no finite numbers found in " +
                       std::string(a.empty() && e.empty() ? "either output"
                                   : a.empty() ? "actual output" : "expected output");
            return v;
        }

        Summary sa = Summary::of(a);
        Summary se = Summary::of(e);
        const std::pair<const char*, double> devs[] = {
            {"mean", deviation(sa.mean, se.mean)},
            {"std", deviation(sa.stddev, se.stddev)},
            {"min", deviation(sa.min, se.min)},
            {"max", deviation(sa.max, se.max)},
            {"median", deviation(sa.median, se.median)},
        };

        double worst = 0.0;
        const char *worst_name = "mean";
        bool all_within = true;
        for (const auto &d : devs) {
            // 溢出得到的非有限偏差一律视为超限
            if (!std::isfinite(d.second) || d.second > tolerance_) all_within = false;
            if (!std::isfinite(d.second) || d.second > worst) {
                worst = d.second;
                worst_name = d.first;
            }
        }

        v.matched = all_within;
        v.score = std::isfinite(worst) ? worst : std::numeric_limits<double>::max();

        std::ostringstream oss;
        oss << "max deviation " << detail::fmt(worst) << " (" << worst_name << "), tolerance "
            << detail::fmt(tolerance_) << "; n=" << a.size() << "/" << e.size()
            << "; mean " << detail::fmt(sa.mean) << " vs " << detail::fmt(se.mean)
            << ", std " << detail::fmt(sa.stddev) << " vs " << detail::fmt(se.stddev);
        v.detail = oss.str();
        return v;
    }
};

class ByteSimilarityComparator {
private:
    double threshold_;

public:
    explicit ByteSimilarityComparator(double threshold) : threshold_(threshold) {}

    static double similarity(const std::string &a, const std::string &b) {
        if (a.empty() && b.empty()) return 1.0;
        if (sha256_raw(a) == sha256_raw(b)) return 1.0;
        size_t n = std::min(a.size(), b.size());
        size_t same = 0;
        for (size_t i = 0; i < n; i++) {
            if (a[i] == b[i]) same++;
        }
        return static_cast<double>(same) / static_cast<double>(std::max(a.size(), b.size()));
    }

    ComparisonVerdict compare(const std::string &actual, const std::string &expected) const {
        ComparisonVerdict v;
        v.kind = ComparatorKind::BYTE_SIMILARITY;
        v.confidence = Confidence::APPROXIMATE;
        v.score = similarity(actual, expected);
        v.matched = v.score >= threshold_;
        v.detail = "byte similarity " + detail::fmt(v.score) + ", threshold " +
                   detail::fmt(threshold_);
        return v;
    }
};

//==============================================================================
// 分派
//==============================================================================

inline ComparisonVerdict compare(const std::string &actual, const std::string &expected,
                                 ComparatorKind kind, const Tolerance &tol,
                                 const ToleranceDefaults &defaults = ToleranceDefaults()) {
    switch (kind) {
        case ComparatorKind::EXACT:
            return ExactComparator().compare(actual, expected);
        case ComparatorKind::NUMERICAL:
            return NumericalComparator(tol.abs_tol.value_or(defaults.abs_tol),
                                       tol.rel_tol.value_or(defaults.rel_tol))
                .compare(actual, expected);
        case ComparatorKind::STATISTICAL:
            return StatisticalComparator(tol.stat_tol.value_or(defaults.stat_tol))
                .compare(actual, expected);
        case ComparatorKind::BYTE_SIMILARITY:
            return ByteSimilarityComparator(
                       tol.similarity_threshold.value_or(defaults.similarity_threshold))
                .compare(actual, expected);
    }
    return ExactComparator().compare(actual, expected);
}

} // namespace comparators
} // namespace sciv

#endif // SCIV_COMPARATORS_COMPARATOR_H
