#include "common/exceptions.hpp"
#include "grading/command.hpp"
#include "grading/test_command.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

class CommandTest : public ::testing::Test {
};

TEST_F(CommandTest, RawCommandTest) {
    auto plan = build_argv(raw_command{{"echo", "hello"}});
    EXPECT_FALSE(plan.compilation);
    vector<string> expected = {"echo", "hello"};
    EXPECT_EQ(plan.execution, expected);
}

TEST_F(CommandTest, CompiledProgramTest) {
    compiled_program prog;
    prog.compiler = "g++";
    prog.compiler_flags = {"-O2", "-std=c++17"};
    prog.files_to_compile = {"main.cpp", "util.cpp"};
    prog.args = {"input.txt"};
    auto plan = build_argv(prog);
    ASSERT_TRUE(plan.compilation);
    vector<string> compilation = {"g++", "-O2", "-std=c++17", "main.cpp", "util.cpp", "-o", "prog"};
    EXPECT_EQ(*plan.compilation, compilation);
    vector<string> execution = {"./prog", "input.txt"};
    EXPECT_EQ(plan.execution, execution);
}

TEST_F(CommandTest, InterpretedProgramTest) {
    interpreted_program prog;
    prog.interpreter = "python3";
    prog.interpreter_flags = {"-B"};
    prog.entry_point_filename = "main.py";
    prog.args = {"--fast"};
    auto plan = build_argv(prog);
    EXPECT_FALSE(plan.compilation);
    vector<string> execution = {"python3", "-B", "main.py", "--fast"};
    EXPECT_EQ(plan.execution, execution);
}

TEST_F(CommandTest, ValidateInvocationTest) {
    EXPECT_THROW(validate_invocation(raw_command{}), configuration_error);

    compiled_program prog;
    prog.compiler = "tcc";
    prog.files_to_compile = {"main.c"};
    EXPECT_THROW(validate_invocation(prog), configuration_error);
    prog.compiler = "gcc";
    EXPECT_NO_THROW(validate_invocation(prog));
    prog.files_to_compile = {"../main.c"};
    EXPECT_THROW(validate_invocation(prog), configuration_error);

    interpreted_program script;
    script.interpreter = "ruby";
    script.entry_point_filename = "main.rb";
    EXPECT_THROW(validate_invocation(script), configuration_error);
    script.interpreter = "bash";
    script.entry_point_filename = "/etc/passwd";
    EXPECT_THROW(validate_invocation(script), configuration_error);
}

static const char *TEST_COMMAND = R"({
    "id": 7,
    "name": "sum",
    "invocation": {"type": "interpreted", "interpreter": "python3", "entry_point_filename": "sum.py"},
    "stdin": {"source": "project_file", "project_file": "sum.in"},
    "timeout": 5,
    "limits": {"max_stack_size": 20000000},
    "expected_return_code": "zero",
    "expected_stdout": {"source": "text", "text": "3\n"},
    "ignore_whitespace": true,
    "points_for_correct_return_code": 1,
    "points_for_correct_stdout": 2,
    "deduction_for_wrong_stdout": -1,
    "normal_fdbk_config": {"stdout_fdbk_level": "correct_or_incorrect", "show_points": true}
})";

TEST_F(CommandTest, TestCommandFromJsonTest) {
    auto command = nlohmann::json::parse(TEST_COMMAND).get<test_command>();
    EXPECT_EQ(command.id, 7);
    EXPECT_EQ(command.name, "sum");
    ASSERT_TRUE(holds_alternative<interpreted_program>(command.invocation));
    EXPECT_EQ(get<interpreted_program>(command.invocation).entry_point_filename, "sum.py");
    EXPECT_EQ(command.stdin_source.source, text_source_type::project_file);
    EXPECT_EQ(command.stdin_source.project_file, "sum.in");
    EXPECT_EQ(command.timeout, chrono::seconds(5));
    EXPECT_EQ(command.limits.max_stack_size, 20000000);
    EXPECT_FALSE(command.limits.max_virtual_memory);
    EXPECT_EQ(command.expected_return_code, return_code_expectation::zero);
    EXPECT_EQ(command.expected_stdout.text, "3\n");
    EXPECT_EQ(command.expected_stderr.source, text_source_type::none);
    EXPECT_TRUE(command.flags.ignore_whitespace);
    EXPECT_FALSE(command.flags.ignore_case);
    EXPECT_EQ(command.points_for_correct_stdout, 2);
    EXPECT_EQ(command.deduction_for_wrong_stdout, -1);
    EXPECT_EQ(command.normal_fdbk_config.stdout_fdbk_level, value_feedback_level::correct_or_incorrect);
    EXPECT_EQ(command.normal_fdbk_config.return_code_fdbk_level, value_feedback_level::no_feedback);
    EXPECT_TRUE(command.normal_fdbk_config.show_points);
    EXPECT_TRUE(command.staff_viewer_fdbk_config.show_actual_stdout);
}

TEST_F(CommandTest, InvalidTestCommandTest) {
    auto j = nlohmann::json::parse(TEST_COMMAND);

    auto too_long = j;
    too_long["timeout"] = 61;
    EXPECT_THROW(too_long.get<test_command>(), configuration_error);

    auto positive_deduction = j;
    positive_deduction["deduction_for_wrong_stdout"] = 1;
    EXPECT_THROW(positive_deduction.get<test_command>(), configuration_error);

    auto too_many_processes = j;
    too_many_processes["limits"] = {{"max_num_processes", 11}};
    EXPECT_THROW(too_many_processes.get<test_command>(), configuration_error);

    auto unknown_invocation = j;
    unknown_invocation["invocation"] = {{"type", "jit"}};
    EXPECT_THROW(unknown_invocation.get<test_command>(), configuration_error);
}
