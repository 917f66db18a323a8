#include "grading/test_command.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

command_feedback_config command_feedback_config::max() {
    command_feedback_config config;
    config.return_code_fdbk_level = value_feedback_level::expected_and_actual;
    config.stdout_fdbk_level = value_feedback_level::expected_and_actual;
    config.stderr_fdbk_level = value_feedback_level::expected_and_actual;
    config.show_points = true;
    config.show_actual_return_code = true;
    config.show_actual_stdout = true;
    config.show_actual_stderr = true;
    config.show_whether_timed_out = true;
    return config;
}

void validate_test_command(const test_command &command) {
    if (command.timeout.count() <= 0 || command.timeout > MAX_SUBPROCESS_TIMEOUT)
        throw configuration_error("Timeout of command " + command.name + " must be between 1 and " + to_string(MAX_SUBPROCESS_TIMEOUT.count()) + " seconds");
    validate_resource_limits(command.limits);
    validate_invocation(command.invocation);

    if (command.points_for_correct_return_code < 0 ||
        command.points_for_correct_stdout < 0 ||
        command.points_for_correct_stderr < 0)
        throw configuration_error("Points for command " + command.name + " must be non-negative");
    if (command.deduction_for_wrong_return_code > 0 ||
        command.deduction_for_wrong_stdout > 0 ||
        command.deduction_for_wrong_stderr > 0)
        throw configuration_error("Deductions for command " + command.name + " must be non-positive");

    for (const text_source *source : {&command.stdin_source, &command.expected_stdout, &command.expected_stderr})
        if (source->source == text_source_type::project_file)
            assert_safe_path(source->project_file);
}

template <typename T>
static void get_optional(const json &j, const char *key, T &value) {
    if (j.count(key)) j.at(key).get_to(value);
}

void from_json(const json &j, text_source &source) {
    j.at("source").get_to(source.source);
    get_optional(j, "text", source.text);
    get_optional(j, "project_file", source.project_file);
}

void to_json(json &j, const text_source &source) {
    j = json{{"source", source.source}};
    if (source.source == text_source_type::text) j["text"] = source.text;
    if (source.source == text_source_type::project_file) j["project_file"] = source.project_file;
}

void from_json(const json &j, command_feedback_config &config) {
    get_optional(j, "return_code_fdbk_level", config.return_code_fdbk_level);
    get_optional(j, "stdout_fdbk_level", config.stdout_fdbk_level);
    get_optional(j, "stderr_fdbk_level", config.stderr_fdbk_level);
    get_optional(j, "show_points", config.show_points);
    get_optional(j, "show_actual_return_code", config.show_actual_return_code);
    get_optional(j, "show_actual_stdout", config.show_actual_stdout);
    get_optional(j, "show_actual_stderr", config.show_actual_stderr);
    get_optional(j, "show_whether_timed_out", config.show_whether_timed_out);
}

void to_json(json &j, const command_feedback_config &config) {
    j = json{
        {"return_code_fdbk_level", config.return_code_fdbk_level},
        {"stdout_fdbk_level", config.stdout_fdbk_level},
        {"stderr_fdbk_level", config.stderr_fdbk_level},
        {"show_points", config.show_points},
        {"show_actual_return_code", config.show_actual_return_code},
        {"show_actual_stdout", config.show_actual_stdout},
        {"show_actual_stderr", config.show_actual_stderr},
        {"show_whether_timed_out", config.show_whether_timed_out}};
}

void from_json(const json &j, resource_limits &limits) {
    if (j.count("max_num_processes")) limits.max_num_processes = j.at("max_num_processes").get<long>();
    if (j.count("max_stack_size")) limits.max_stack_size = j.at("max_stack_size").get<long>();
    if (j.count("max_virtual_memory")) limits.max_virtual_memory = j.at("max_virtual_memory").get<long>();
}

void from_json(const json &j, comparison_flags &flags) {
    get_optional(j, "ignore_case", flags.ignore_case);
    get_optional(j, "ignore_whitespace", flags.ignore_whitespace);
    get_optional(j, "ignore_whitespace_changes", flags.ignore_whitespace_changes);
    get_optional(j, "ignore_blank_lines", flags.ignore_blank_lines);
}

void from_json(const json &j, program_invocation &invocation) {
    string type = j.at("type").get<string>();
    if (type == "raw") {
        raw_command cmd;
        j.at("argv").get_to(cmd.argv);
        invocation = move(cmd);
    } else if (type == "compiled") {
        compiled_program prog;
        j.at("compiler").get_to(prog.compiler);
        get_optional(j, "compiler_flags", prog.compiler_flags);
        j.at("files_to_compile").get_to(prog.files_to_compile);
        get_optional(j, "executable_name", prog.executable_name);
        get_optional(j, "args", prog.args);
        invocation = move(prog);
    } else if (type == "interpreted") {
        interpreted_program prog;
        j.at("interpreter").get_to(prog.interpreter);
        get_optional(j, "interpreter_flags", prog.interpreter_flags);
        j.at("entry_point_filename").get_to(prog.entry_point_filename);
        get_optional(j, "args", prog.args);
        invocation = move(prog);
    } else {
        throw configuration_error("Unrecognized invocation type " + type);
    }
}

void from_json(const json &j, test_command &command) {
    j.at("id").get_to(command.id);
    j.at("name").get_to(command.name);
    j.at("invocation").get_to(command.invocation);
    get_optional(j, "stdin", command.stdin_source);
    if (j.count("timeout")) command.timeout = chrono::seconds(j.at("timeout").get<long>());
    get_optional(j, "limits", command.limits);

    get_optional(j, "expected_return_code", command.expected_return_code);
    get_optional(j, "expected_stdout", command.expected_stdout);
    get_optional(j, "expected_stderr", command.expected_stderr);
    j.get_to(command.flags);

    get_optional(j, "points_for_correct_return_code", command.points_for_correct_return_code);
    get_optional(j, "points_for_correct_stdout", command.points_for_correct_stdout);
    get_optional(j, "points_for_correct_stderr", command.points_for_correct_stderr);
    get_optional(j, "deduction_for_wrong_return_code", command.deduction_for_wrong_return_code);
    get_optional(j, "deduction_for_wrong_stdout", command.deduction_for_wrong_stdout);
    get_optional(j, "deduction_for_wrong_stderr", command.deduction_for_wrong_stderr);

    get_optional(j, "normal_fdbk_config", command.normal_fdbk_config);
    get_optional(j, "ultimate_submission_fdbk_config", command.ultimate_submission_fdbk_config);
    get_optional(j, "past_limit_submission_fdbk_config", command.past_limit_submission_fdbk_config);
    get_optional(j, "staff_viewer_fdbk_config", command.staff_viewer_fdbk_config);

    validate_test_command(command);
}

}  // namespace grader
