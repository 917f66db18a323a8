#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "grading/result_recorder.hpp"
#include "gtest/gtest.h"
#include "test/project_files.hpp"
#include "test/temp_dir.hpp"

using namespace std;
using namespace grader;

class ResultRecorderTest : public ::testing::Test {
protected:
    test::temp_dir dir;
    test::memory_project_file_store files;

    static test_command make_command() {
        test_command command;
        command.id = 3;
        command.name = "hello";
        command.invocation = raw_command{{"echo", "hello"}};
        return command;
    }

    static command_result make_result(optional<int> exit_code, const string &out, const string &err = "") {
        command_result result;
        result.exit_code = exit_code;
        result.stdout_content = out;
        result.stderr_content = err;
        return result;
    }
};

TEST_F(ResultRecorderTest, WritesOutputFilesTest) {
    result_recorder recorder(dir.path / "submission", files);
    auto recorded = recorder.record(12, make_command(), make_result(0, "out\n", "err\n"));
    EXPECT_EQ(recorded.id, 12);
    EXPECT_EQ(recorded.command_id, 3);
    EXPECT_EQ(recorded.stdout_filename, dir.path / "submission" / "cmd_result_12_stdout");
    EXPECT_EQ(recorded.stderr_filename, dir.path / "submission" / "cmd_result_12_stderr");
    EXPECT_EQ(read_file_content(recorded.stdout_filename), "out\n");
    EXPECT_EQ(read_file_content(recorded.stderr_filename), "err\n");
}

TEST_F(ResultRecorderTest, NoExpectationsTest) {
    result_recorder recorder(dir.path, files);
    auto recorded = recorder.record(1, make_command(), make_result(1, "anything"));
    EXPECT_FALSE(recorded.return_code_correct);
    EXPECT_FALSE(recorded.stdout_correct);
    EXPECT_FALSE(recorded.stderr_correct);
    EXPECT_EQ(recorded.return_code, 1);
}

TEST_F(ResultRecorderTest, ReturnCodeTest) {
    result_recorder recorder(dir.path, files);
    auto command = make_command();

    command.expected_return_code = return_code_expectation::zero;
    EXPECT_EQ(recorder.record(1, command, make_result(0, "")).return_code_correct, true);
    EXPECT_EQ(recorder.record(1, command, make_result(2, "")).return_code_correct, false);

    command.expected_return_code = return_code_expectation::nonzero;
    EXPECT_EQ(recorder.record(1, command, make_result(0, "")).return_code_correct, false);
    EXPECT_EQ(recorder.record(1, command, make_result(2, "")).return_code_correct, true);
    EXPECT_EQ(recorder.record(1, command, make_result(-11, "")).return_code_correct, true);
}

TEST_F(ResultRecorderTest, TimedOutIsIncorrectTest) {
    result_recorder recorder(dir.path, files);
    auto command = make_command();
    command.expected_return_code = return_code_expectation::nonzero;
    auto result = make_result({}, "partial");
    result.timed_out = true;
    auto recorded = recorder.record(1, command, result);
    EXPECT_EQ(recorded.return_code_correct, false);
    EXPECT_TRUE(recorded.timed_out);
    EXPECT_FALSE(recorded.return_code);
}

TEST_F(ResultRecorderTest, ExpectedTextTest) {
    result_recorder recorder(dir.path, files);
    auto command = make_command();
    command.expected_stdout = {text_source_type::text, "hello\n", ""};
    command.expected_stderr = {text_source_type::text, "", ""};
    auto recorded = recorder.record(1, command, make_result(0, "hello\n", "warning\n"));
    EXPECT_EQ(recorded.stdout_correct, true);
    EXPECT_EQ(recorded.stderr_correct, false);

    command.flags.ignore_case = true;
    EXPECT_EQ(recorder.record(1, command, make_result(0, "HELLO\n")).stdout_correct, true);
}

TEST_F(ResultRecorderTest, ExpectedProjectFileTest) {
    files.files["expected.out"] = "42\n";
    result_recorder recorder(dir.path, files);
    auto command = make_command();
    command.expected_stdout = {text_source_type::project_file, "", "expected.out"};
    EXPECT_EQ(recorder.record(1, command, make_result(0, "42\n")).stdout_correct, true);
    EXPECT_EQ(recorder.record(1, command, make_result(0, "41\n")).stdout_correct, false);
}

TEST_F(ResultRecorderTest, MissingProjectFileTest) {
    result_recorder recorder(dir.path, files);
    auto command = make_command();
    command.expected_stdout = {text_source_type::project_file, "", "missing.out"};
    EXPECT_THROW(recorder.record(1, command, make_result(0, "")), configuration_error);
}

TEST_F(ResultRecorderTest, DirectoryProjectFileStoreTest) {
    write_file_content(dir.path / "expected.out", "content\n");
    directory_project_file_store store(dir.path);
    EXPECT_EQ(store.read("expected.out"), "content\n");
    EXPECT_THROW(store.read("missing.out"), configuration_error);
}

TEST_F(ResultRecorderTest, TruncationFlagsTest) {
    result_recorder recorder(dir.path, files);
    auto result = make_result(0, "abc");
    result.stdout_truncated = true;
    auto recorded = recorder.record(1, make_command(), result);
    EXPECT_TRUE(recorded.stdout_truncated);
    EXPECT_FALSE(recorded.stderr_truncated);

    nlohmann::json j = recorded;
    EXPECT_EQ(j["stdout_truncated"], true);
    EXPECT_EQ(j["return_code"], 0);
    EXPECT_TRUE(j["stdout_correct"].is_null());
}
