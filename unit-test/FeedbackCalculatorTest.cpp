#include "grading/feedback.hpp"
#include "gtest/gtest.h"
#include "test/project_files.hpp"
#include "test/temp_dir.hpp"

using namespace std;
using namespace grader;

class FeedbackCalculatorTest : public ::testing::Test {
protected:
    test::temp_dir dir;
    test::memory_project_file_store files;
    test_command command;

    void SetUp() override {
        command.id = 5;
        command.name = "sum";
        command.invocation = raw_command{{"./sum"}};
        command.expected_return_code = return_code_expectation::zero;
        command.expected_stdout = {text_source_type::text, "3\n", ""};
        command.expected_stderr = {text_source_type::text, "", ""};
        command.points_for_correct_return_code = 1;
        command.points_for_correct_stdout = 4;
        command.points_for_correct_stderr = 2;
        command.deduction_for_wrong_stderr = -1;
    }

    recorded_command_result record(optional<int> exit_code, const string &out, const string &err, bool timed_out = false) {
        command_result result;
        result.exit_code = exit_code;
        result.stdout_content = out;
        result.stderr_content = err;
        result.timed_out = timed_out;
        return result_recorder(dir.path, files).record(9, command, result);
    }
};

TEST_F(FeedbackCalculatorTest, MaxFeedbackTest) {
    auto result = record(0, "4\n", "oops\n");
    feedback_calculator fdbk(result, command, feedback_category::max, files);

    EXPECT_EQ(fdbk.timed_out(), false);
    EXPECT_EQ(fdbk.return_code_correct(), true);
    EXPECT_EQ(fdbk.expected_return_code(), return_code_expectation::zero);
    EXPECT_EQ(fdbk.actual_return_code(), 0);
    EXPECT_EQ(fdbk.return_code_points(), 1);
    EXPECT_EQ(fdbk.return_code_points_possible(), 1);

    EXPECT_EQ(fdbk.stdout_correct(), false);
    EXPECT_EQ(fdbk.stdout_content(), "4\n");
    vector<string> diff = {"- 3\n", "+ 4\n"};
    EXPECT_EQ(fdbk.stdout_diff(), diff);
    EXPECT_EQ(fdbk.stdout_points(), 0);
    EXPECT_EQ(fdbk.stdout_points_possible(), 4);

    EXPECT_EQ(fdbk.stderr_correct(), false);
    EXPECT_EQ(fdbk.stderr_points(), -1);
    EXPECT_EQ(fdbk.stderr_points_possible(), 2);

    EXPECT_EQ(fdbk.total_points(), 0);
    EXPECT_EQ(fdbk.total_points_possible(), 7);
}

TEST_F(FeedbackCalculatorTest, NoFeedbackTest) {
    auto result = record(0, "3\n", "");
    feedback_calculator fdbk(result, command, feedback_category::normal, files);

    EXPECT_FALSE(fdbk.timed_out());
    EXPECT_FALSE(fdbk.return_code_correct());
    EXPECT_FALSE(fdbk.expected_return_code());
    EXPECT_FALSE(fdbk.actual_return_code());
    EXPECT_FALSE(fdbk.stdout_correct());
    EXPECT_FALSE(fdbk.stdout_content());
    EXPECT_FALSE(fdbk.stdout_diff());
    EXPECT_FALSE(fdbk.stderr_correct());
    EXPECT_FALSE(fdbk.stderr_content());
    EXPECT_EQ(fdbk.total_points(), 0);
    EXPECT_EQ(fdbk.total_points_possible(), 0);
}

TEST_F(FeedbackCalculatorTest, CorrectOrIncorrectTest) {
    command.normal_fdbk_config.return_code_fdbk_level = value_feedback_level::correct_or_incorrect;
    command.normal_fdbk_config.stdout_fdbk_level = value_feedback_level::correct_or_incorrect;
    command.normal_fdbk_config.show_points = true;
    auto result = record(0, "3\n", "");
    feedback_calculator fdbk(result, command, feedback_category::normal, files);

    EXPECT_EQ(fdbk.return_code_correct(), true);
    EXPECT_FALSE(fdbk.expected_return_code());
    EXPECT_FALSE(fdbk.actual_return_code());
    EXPECT_EQ(fdbk.stdout_correct(), true);
    EXPECT_FALSE(fdbk.stdout_content());
    EXPECT_FALSE(fdbk.stdout_diff());
    // stderr 没有反馈，因此不计入分数
    EXPECT_FALSE(fdbk.stderr_correct());
    EXPECT_EQ(fdbk.total_points(), 5);
    EXPECT_EQ(fdbk.total_points_possible(), 5);
}

TEST_F(FeedbackCalculatorTest, ShowActualWithoutCorrectnessTest) {
    command.past_limit_submission_fdbk_config.show_actual_stdout = true;
    command.past_limit_submission_fdbk_config.show_actual_return_code = true;
    command.past_limit_submission_fdbk_config.show_whether_timed_out = true;
    auto result = record(2, "3\n", "");
    feedback_calculator fdbk(result, command, feedback_category::past_limit_submission, files);

    EXPECT_EQ(fdbk.actual_return_code(), 2);
    EXPECT_FALSE(fdbk.return_code_correct());
    EXPECT_EQ(fdbk.stdout_content(), "3\n");
    EXPECT_FALSE(fdbk.stdout_correct());
    EXPECT_EQ(fdbk.timed_out(), false);
}

TEST_F(FeedbackCalculatorTest, CategorySelectionTest) {
    command.ultimate_submission_fdbk_config.show_points = true;
    command.ultimate_submission_fdbk_config.return_code_fdbk_level = value_feedback_level::correct_or_incorrect;
    auto result = record(0, "3\n", "");

    EXPECT_EQ(feedback_calculator(result, command, feedback_category::ultimate_submission, files).total_points(), 1);
    EXPECT_EQ(feedback_calculator(result, command, feedback_category::normal, files).total_points(), 0);
    EXPECT_EQ(feedback_calculator(result, command, feedback_category::staff_viewer, files).total_points(), 7);
}

TEST_F(FeedbackCalculatorTest, TimedOutTest) {
    auto result = record({}, "", "", true);
    feedback_calculator fdbk(result, command, feedback_category::max, files);
    EXPECT_EQ(fdbk.timed_out(), true);
    EXPECT_EQ(fdbk.return_code_correct(), false);
    EXPECT_FALSE(fdbk.actual_return_code());
    EXPECT_EQ(fdbk.return_code_points(), 0);
}

TEST_F(FeedbackCalculatorTest, NoExpectationTest) {
    command.expected_return_code = return_code_expectation::none;
    command.expected_stdout = text_source();
    auto result = record(1, "whatever\n", "");
    feedback_calculator fdbk(result, command, feedback_category::max, files);
    EXPECT_FALSE(fdbk.return_code_correct());
    EXPECT_EQ(fdbk.return_code_points_possible(), 0);
    EXPECT_FALSE(fdbk.stdout_correct());
    EXPECT_FALSE(fdbk.stdout_diff());
    EXPECT_EQ(fdbk.stdout_content(), "whatever\n");
}

TEST_F(FeedbackCalculatorTest, ToJsonTest) {
    command.normal_fdbk_config.stdout_fdbk_level = value_feedback_level::correct_or_incorrect;
    command.normal_fdbk_config.show_points = true;
    auto result = record(0, "3\n", "");
    feedback_calculator fdbk(result, command, feedback_category::normal, files);
    auto j = fdbk.to_json();

    EXPECT_EQ(j["pk"], 9);
    EXPECT_EQ(j["ag_test_command_pk"], 5);
    EXPECT_EQ(j["ag_test_command_name"], "sum");
    EXPECT_TRUE(j["timed_out"].is_null());
    EXPECT_TRUE(j["return_code_correct"].is_null());
    EXPECT_EQ(j["stdout_correct"], true);
    EXPECT_EQ(j["stdout_points"], 4);
    EXPECT_EQ(j["total_points"], 4);
    EXPECT_EQ(j["fdbk_settings"]["stdout_fdbk_level"], "correct_or_incorrect");

    // 计算没有副作用，重复计算结果相同
    EXPECT_EQ(fdbk.to_json(), j);
}
