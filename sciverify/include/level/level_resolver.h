/**
 * @file level_resolver.h
 * @brief 验证等级判定
 *
 * | 条件                                                       | 等级 |
 * |------------------------------------------------------------|------|
 * | ParseFailed / ExecutionFailed                              | L0   |
 * | ParseSucceeded（只做语法检查）                             | L1   |
 * | ExecutionSucceeded，无期望输出或未匹配                     | L2   |
 * | ExecutionSucceeded，exact / numerical / byte_similarity 匹配 | L3   |
 * | ExecutionSucceeded，statistical 匹配                       | L4   |
 * | ExecutionSucceeded，运行器为 lean4                         | L6   |
 *
 * L5 永不产生。
 */

#ifndef SCIV_LEVEL_LEVEL_RESOLVER_H
#define SCIV_LEVEL_LEVEL_RESOLVER_H

#include <optional>

#include "core/types.h"

namespace sciv {

inline VerificationLevel resolve_level(Signal signal,
                                       const std::optional<ComparisonVerdict> &verdict,
                                       RunnerKind runner) {
    switch (signal) {
        case Signal::PARSE_FAILED:
        case Signal::EXECUTION_FAILED:
            return VerificationLevel::L0;
        case Signal::PARSE_SUCCEEDED:
            return VerificationLevel::L1;
        case Signal::EXECUTION_SUCCEEDED:
            break;
    }

    if (runner == RunnerKind::LEAN4) {
        return VerificationLevel::L6;
    }
    if (!verdict || !verdict->matched) {
        return VerificationLevel::L2;
    }
    return verdict->kind == ComparatorKind::STATISTICAL ? VerificationLevel::L4
                                                        : VerificationLevel::L3;
}

/**
 * @brief 成功执行且比较（若有）匹配，或语法检查通过
 */
inline bool is_passing(Signal signal, const std::optional<ComparisonVerdict> &verdict) {
    if (signal == Signal::PARSE_SUCCEEDED) return true;
    if (signal != Signal::EXECUTION_SUCCEEDED) return false;
    return !verdict || verdict->matched;
}

} // namespace sciv

#endif // SCIV_LEVEL_LEVEL_RESOLVER_H
