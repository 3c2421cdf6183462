#include "gtest/gtest.h"
#include "common/status.hpp"
#include "server/state_store.hpp"

using namespace std;
using namespace codejudge;
using namespace nlohmann;

class StatusTest : public ::testing::Test {
};

TEST_F(StatusTest, VerdictWireNames) {
    EXPECT_STREQ(get_wire_name(verdict::ACCEPTED), "AC");
    EXPECT_STREQ(get_wire_name(verdict::WRONG_ANSWER), "WA");
    EXPECT_STREQ(get_wire_name(verdict::TIME_LIMIT_EXCEEDED), "TLE");
    EXPECT_STREQ(get_wire_name(verdict::MEMORY_LIMIT_EXCEEDED), "MLE");
    EXPECT_STREQ(get_wire_name(verdict::RUNTIME_ERROR), "RE");
    EXPECT_STREQ(get_wire_name(verdict::COMPILATION_ERROR), "CE");
    EXPECT_STREQ(get_wire_name(verdict::INTERNAL_ERROR), "IE");
    EXPECT_STREQ(get_display_message(verdict::MEMORY_LIMIT_EXCEEDED), "Memory Limit Exceeded");

    EXPECT_EQ(parse_verdict("TLE"), verdict::TIME_LIMIT_EXCEEDED);
    EXPECT_THROW(parse_verdict("Accepted"), invalid_argument);
}

TEST_F(StatusTest, StatusJson) {
    json j = submission_status::RUNNING;
    EXPECT_EQ(j, "RUNNING");
    EXPECT_EQ(json("FAILED").get<submission_status>(), submission_status::FAILED);
    EXPECT_THROW(json("DONE").get<submission_status>(), invalid_argument);

    json v = verdict::WRONG_ANSWER;
    EXPECT_EQ(v, "WA");
}

TEST_F(StatusTest, Transitions) {
    EXPECT_TRUE(is_valid_transition(submission_status::QUEUED, submission_status::RUNNING));
    EXPECT_TRUE(is_valid_transition(submission_status::RUNNING, submission_status::COMPLETED));
    EXPECT_TRUE(is_valid_transition(submission_status::RUNNING, submission_status::FAILED));

    EXPECT_FALSE(is_valid_transition(submission_status::QUEUED, submission_status::COMPLETED));
    EXPECT_FALSE(is_valid_transition(submission_status::RUNNING, submission_status::QUEUED));
    EXPECT_FALSE(is_valid_transition(submission_status::RUNNING, submission_status::RUNNING));
    EXPECT_FALSE(is_valid_transition(submission_status::COMPLETED, submission_status::RUNNING));
    EXPECT_FALSE(is_valid_transition(submission_status::FAILED, submission_status::COMPLETED));

    EXPECT_FALSE(is_terminal(submission_status::QUEUED));
    EXPECT_FALSE(is_terminal(submission_status::RUNNING));
    EXPECT_TRUE(is_terminal(submission_status::COMPLETED));
    EXPECT_TRUE(is_terminal(submission_status::FAILED));
}

TEST_F(StatusTest, TerminalTransitionRequiresVerdict) {
    using server::check_transition;
    using server::completion;
    EXPECT_NO_THROW(check_transition(submission_status::QUEUED, submission_status::RUNNING, nullopt));
    EXPECT_THROW(check_transition(submission_status::RUNNING, submission_status::COMPLETED, nullopt), invalid_argument);
    EXPECT_NO_THROW(check_transition(submission_status::RUNNING, submission_status::COMPLETED, completion{verdict::ACCEPTED, "", 0.1, 1024}));
    EXPECT_THROW(check_transition(submission_status::COMPLETED, submission_status::FAILED, completion{verdict::ACCEPTED, "", 0.1, 1024}), invalid_argument);
}
