#include "gtest/gtest.h"
#include "judge/verdict.hpp"

using namespace std;
using namespace codejudge;

class VerdictTest : public ::testing::Test {
protected:
    execution_result run(run_outcome outcome, const string &output = "") {
        execution_result result;
        result.sub_id = "verdict-test";
        result.outcome = outcome;
        result.output = output;
        return result;
    }
};

TEST_F(VerdictTest, TrailingNewlineIsAccepted) {
    EXPECT_EQ(evaluate(run(run_outcome::COMPLETED, "Hello, world\n"), "Hello, world"), verdict::ACCEPTED);
    EXPECT_EQ(evaluate(run(run_outcome::COMPLETED, "Hello, world"), "Hello, world\n"), verdict::ACCEPTED);
    EXPECT_EQ(evaluate(run(run_outcome::COMPLETED, "Hello, world\n\n\n"), "Hello, world"), verdict::ACCEPTED);
}

TEST_F(VerdictTest, TrailingSpaceIsWrongAnswer) {
    EXPECT_EQ(evaluate(run(run_outcome::COMPLETED, "Hello, world \n"), "Hello, world"), verdict::WRONG_ANSWER);
    EXPECT_EQ(evaluate(run(run_outcome::COMPLETED, "Hello world"), "Hello, world"), verdict::WRONG_ANSWER);
    EXPECT_EQ(evaluate(run(run_outcome::COMPLETED, ""), "Hello, world"), verdict::WRONG_ANSWER);
}

TEST_F(VerdictTest, CarriageReturnsAreNormalized) {
    EXPECT_EQ(evaluate(run(run_outcome::COMPLETED, "1\r\n2\r\n"), "1\n2"), verdict::ACCEPTED);
    EXPECT_EQ(evaluate(run(run_outcome::COMPLETED, "1\r\n2\r\n"), "1\n2", compare_policy::EXACT), verdict::WRONG_ANSWER);
}

TEST_F(VerdictTest, OutcomeTakesPrecedenceOverOutput) {
    EXPECT_EQ(evaluate(run(run_outcome::TIMED_OUT, "42"), "42"), verdict::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(evaluate(run(run_outcome::MEMORY_EXCEEDED, "42"), "42"), verdict::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(evaluate(run(run_outcome::CRASHED, "42"), "42"), verdict::RUNTIME_ERROR);
    EXPECT_EQ(evaluate(run(run_outcome::COMPILE_ERROR), "42"), verdict::COMPILATION_ERROR);
}

TEST_F(VerdictTest, ComparePolicies) {
    EXPECT_TRUE(outputs_match("a b\nc", "a b\nc", compare_policy::EXACT));
    EXPECT_FALSE(outputs_match("a b\nc", "a b\nc\n", compare_policy::EXACT));

    EXPECT_TRUE(outputs_match("a b\nc", "a b\nc\n", compare_policy::IGNORE_TRAILING_NEWLINES));
    EXPECT_FALSE(outputs_match("a b\nc", "a b \nc\n", compare_policy::IGNORE_TRAILING_NEWLINES));

    EXPECT_TRUE(outputs_match("a b\nc", "a b \t\nc  \n\n", compare_policy::IGNORE_TRAILING_WHITESPACE));
    EXPECT_FALSE(outputs_match("a b\nc", " a b\nc", compare_policy::IGNORE_TRAILING_WHITESPACE));
    EXPECT_FALSE(outputs_match("a b\nc", "a  b\nc", compare_policy::IGNORE_TRAILING_WHITESPACE));

    EXPECT_TRUE(outputs_match("a b\nc", "\n  a b\nc \n", compare_policy::IGNORE_SURROUNDING_WHITESPACE));
    EXPECT_FALSE(outputs_match("a b\nc", "a b \nc", compare_policy::IGNORE_SURROUNDING_WHITESPACE));
}

TEST_F(VerdictTest, ParseComparePolicy) {
    EXPECT_EQ(parse_compare_policy("exact"), compare_policy::EXACT);
    EXPECT_EQ(parse_compare_policy("ignore_trailing_newlines"), compare_policy::IGNORE_TRAILING_NEWLINES);
    EXPECT_EQ(parse_compare_policy("ignore_trailing_whitespace"), compare_policy::IGNORE_TRAILING_WHITESPACE);
    EXPECT_EQ(parse_compare_policy("ignore_surrounding_whitespace"), compare_policy::IGNORE_SURROUNDING_WHITESPACE);
    EXPECT_THROW(parse_compare_policy("diff"), invalid_argument);
    EXPECT_STREQ(get_display_message(compare_policy::EXACT), "exact");
}

TEST_F(VerdictTest, TruncatedOutputIsWrongAnswer) {
    execution_result truncated = run(run_outcome::COMPLETED, "42\n");
    truncated.output_truncated = true;
    // 截断后剩下的部分恰好等于期望输出，后面的输出被丢弃了
    EXPECT_EQ(evaluate(truncated, "42"), verdict::WRONG_ANSWER);
    EXPECT_EQ(evaluate(truncated, "42", compare_policy::IGNORE_SURROUNDING_WHITESPACE), verdict::WRONG_ANSWER);

    truncated.outcome = run_outcome::TIMED_OUT;
    EXPECT_EQ(evaluate(truncated, "42"), verdict::TIME_LIMIT_EXCEEDED);
}
