/**
 * @file level_resolver_test.cpp
 * @brief 验证等级判定测试
 */

#include <gtest/gtest.h>

#include "level/level_resolver.h"

using namespace sciv;

namespace {

ComparisonVerdict verdict(ComparatorKind kind, bool matched) {
    ComparisonVerdict v;
    v.kind = kind;
    v.matched = matched;
    v.score = matched ? 1.0 : 0.0;
    return v;
}

const RunnerKind ALL_RUNNERS[] = {RunnerKind::PYTHON, RunnerKind::R, RunnerKind::JULIA,
                                  RunnerKind::LEAN4, RunnerKind::SYMBOLIC_MATH};
const ComparatorKind ALL_COMPARATORS[] = {ComparatorKind::EXACT, ComparatorKind::NUMERICAL,
                                          ComparatorKind::STATISTICAL,
                                          ComparatorKind::BYTE_SIMILARITY};

} // namespace

TEST(LevelResolverTest, FailuresAreL0) {
    for (RunnerKind r : ALL_RUNNERS) {
        EXPECT_EQ(resolve_level(Signal::PARSE_FAILED, std::nullopt, r), VerificationLevel::L0);
        EXPECT_EQ(resolve_level(Signal::EXECUTION_FAILED, std::nullopt, r), VerificationLevel::L0);
        // 比较结论不能把失败提升
        EXPECT_EQ(resolve_level(Signal::EXECUTION_FAILED,
                                verdict(ComparatorKind::EXACT, true), r),
                  VerificationLevel::L0);
    }
}

TEST(LevelResolverTest, SyntaxCheckIsL1) {
    EXPECT_EQ(resolve_level(Signal::PARSE_SUCCEEDED, std::nullopt, RunnerKind::PYTHON),
              VerificationLevel::L1);
    EXPECT_EQ(resolve_level(Signal::PARSE_SUCCEEDED, std::nullopt, RunnerKind::R),
              VerificationLevel::L1);
}

TEST(LevelResolverTest, ExecutionWithoutMatchIsL2) {
    EXPECT_EQ(resolve_level(Signal::EXECUTION_SUCCEEDED, std::nullopt, RunnerKind::PYTHON),
              VerificationLevel::L2);
    for (ComparatorKind c : ALL_COMPARATORS) {
        EXPECT_EQ(resolve_level(Signal::EXECUTION_SUCCEEDED, verdict(c, false), RunnerKind::JULIA),
                  VerificationLevel::L2);
    }
}

TEST(LevelResolverTest, DeterministicMatchIsL3) {
    for (ComparatorKind c : {ComparatorKind::EXACT, ComparatorKind::NUMERICAL,
                             ComparatorKind::BYTE_SIMILARITY}) {
        EXPECT_EQ(resolve_level(Signal::EXECUTION_SUCCEEDED, verdict(c, true), RunnerKind::PYTHON),
                  VerificationLevel::L3);
    }
}

TEST(LevelResolverTest, StatisticalMatchIsL4) {
    EXPECT_EQ(resolve_level(Signal::EXECUTION_SUCCEEDED,
                            verdict(ComparatorKind::STATISTICAL, true), RunnerKind::R),
              VerificationLevel::L4);
}

TEST(LevelResolverTest, LeanSuccessIsAlwaysL6) {
    EXPECT_EQ(resolve_level(Signal::EXECUTION_SUCCEEDED, std::nullopt, RunnerKind::LEAN4),
              VerificationLevel::L6);
    for (ComparatorKind c : ALL_COMPARATORS) {
        for (bool matched : {true, false}) {
            EXPECT_EQ(resolve_level(Signal::EXECUTION_SUCCEEDED, verdict(c, matched),
                                    RunnerKind::LEAN4),
                      VerificationLevel::L6);
        }
    }
}

TEST(LevelResolverTest, L5IsNeverProduced) {
    const Signal signals[] = {Signal::PARSE_FAILED, Signal::PARSE_SUCCEEDED,
                              Signal::EXECUTION_FAILED, Signal::EXECUTION_SUCCEEDED};
    for (Signal s : signals) {
        for (RunnerKind r : ALL_RUNNERS) {
            EXPECT_NE(resolve_level(s, std::nullopt, r), VerificationLevel::L5);
            for (ComparatorKind c : ALL_COMPARATORS) {
                for (bool matched : {true, false}) {
                    EXPECT_NE(resolve_level(s, verdict(c, matched), r), VerificationLevel::L5);
                }
            }
        }
    }
}

TEST(LevelResolverTest, Passing) {
    EXPECT_TRUE(is_passing(Signal::PARSE_SUCCEEDED, std::nullopt));
    EXPECT_TRUE(is_passing(Signal::EXECUTION_SUCCEEDED, std::nullopt));
    EXPECT_TRUE(is_passing(Signal::EXECUTION_SUCCEEDED, verdict(ComparatorKind::EXACT, true)));
    EXPECT_FALSE(is_passing(Signal::EXECUTION_SUCCEEDED, verdict(ComparatorKind::EXACT, false)));
    EXPECT_FALSE(is_passing(Signal::EXECUTION_FAILED, std::nullopt));
    EXPECT_FALSE(is_passing(Signal::PARSE_FAILED, std::nullopt));
}

TEST(LevelResolverTest, LevelNames) {
    EXPECT_EQ(level_str(VerificationLevel::L0), "L0");
    EXPECT_EQ(level_str(VerificationLevel::L6), "L6");
    EXPECT_TRUE(parse_level("L4") == VerificationLevel::L4);
    EXPECT_FALSE(parse_level("L7").has_value());
    EXPECT_FALSE(parse_level("4").has_value());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
