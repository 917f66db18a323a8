#include "grading/feedback.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static command_feedback_config select_config(const test_command &command, feedback_category category) {
    switch (category) {
        case feedback_category::normal:
            return command.normal_fdbk_config;
        case feedback_category::ultimate_submission:
            return command.ultimate_submission_fdbk_config;
        case feedback_category::past_limit_submission:
            return command.past_limit_submission_fdbk_config;
        case feedback_category::staff_viewer:
            return command.staff_viewer_fdbk_config;
        case feedback_category::max:
            return command_feedback_config::max();
    }
    return command_feedback_config::max();
}

template <typename T>
static json nullable(const optional<T> &value) {
    return value ? json(*value) : json(nullptr);
}

feedback_calculator::feedback_calculator(const recorded_command_result &result, const test_command &command,
                                         feedback_category category, const project_file_store &files)
    : result(result), command(command), files(files), fdbk(select_config(command, category)) {}

const command_feedback_config &feedback_calculator::config() const {
    return fdbk;
}

optional<bool> feedback_calculator::timed_out() const {
    if (fdbk.show_whether_timed_out)
        return result.timed_out;
    return {};
}

optional<bool> feedback_calculator::return_code_correct() const {
    if (command.expected_return_code == return_code_expectation::none ||
        fdbk.return_code_fdbk_level == value_feedback_level::no_feedback)
        return {};
    return result.return_code_correct;
}

optional<return_code_expectation> feedback_calculator::expected_return_code() const {
    if (fdbk.return_code_fdbk_level != value_feedback_level::expected_and_actual)
        return {};
    return command.expected_return_code;
}

optional<int> feedback_calculator::actual_return_code() const {
    if (fdbk.show_actual_return_code ||
        fdbk.return_code_fdbk_level == value_feedback_level::expected_and_actual)
        return result.return_code;
    return {};
}

int feedback_calculator::return_code_points() const {
    auto correct = return_code_correct();
    if (!correct) return 0;
    return *correct ? command.points_for_correct_return_code : command.deduction_for_wrong_return_code;
}

int feedback_calculator::return_code_points_possible() const {
    if (!return_code_correct()) return 0;
    return command.points_for_correct_return_code;
}

/**
 * @brief stdout 和 stderr 的反馈规则相同，这里统一处理
 */
struct stream_feedback {
    const text_source &expected;
    value_feedback_level level;
    bool show_actual;
    const optional<bool> &correct;
    const filesystem::path &filename;
    int points_for_correct;
    int deduction_for_wrong;

    optional<bool> visible_correct() const {
        if (expected.source == text_source_type::none || level == value_feedback_level::no_feedback)
            return {};
        return correct;
    }

    optional<string> content() const {
        if (show_actual || level == value_feedback_level::expected_and_actual)
            return read_file_content(filename);
        return {};
    }

    optional<vector<string>> diff(const comparison_flags &flags, const project_file_store &files) const {
        if (expected.source == text_source_type::none || level != value_feedback_level::expected_and_actual)
            return {};
        optional<string> expected_text = resolve_text(expected, files);
        return diff_lines(expected_text.value_or(""), read_file_content(filename), flags);
    }

    int points() const {
        auto c = visible_correct();
        if (!c) return 0;
        return *c ? points_for_correct : deduction_for_wrong;
    }

    int points_possible() const {
        if (!visible_correct()) return 0;
        return points_for_correct;
    }
};

static stream_feedback stdout_feedback(const test_command &command, const command_feedback_config &fdbk,
                                       const recorded_command_result &result) {
    return {command.expected_stdout, fdbk.stdout_fdbk_level, fdbk.show_actual_stdout,
            result.stdout_correct, result.stdout_filename,
            command.points_for_correct_stdout, command.deduction_for_wrong_stdout};
}

static stream_feedback stderr_feedback(const test_command &command, const command_feedback_config &fdbk,
                                       const recorded_command_result &result) {
    return {command.expected_stderr, fdbk.stderr_fdbk_level, fdbk.show_actual_stderr,
            result.stderr_correct, result.stderr_filename,
            command.points_for_correct_stderr, command.deduction_for_wrong_stderr};
}

optional<bool> feedback_calculator::stdout_correct() const {
    return stdout_feedback(command, fdbk, result).visible_correct();
}

optional<string> feedback_calculator::stdout_content() const {
    return stdout_feedback(command, fdbk, result).content();
}

optional<vector<string>> feedback_calculator::stdout_diff() const {
    return stdout_feedback(command, fdbk, result).diff(command.flags, files);
}

int feedback_calculator::stdout_points() const {
    return stdout_feedback(command, fdbk, result).points();
}

int feedback_calculator::stdout_points_possible() const {
    return stdout_feedback(command, fdbk, result).points_possible();
}

optional<bool> feedback_calculator::stderr_correct() const {
    return stderr_feedback(command, fdbk, result).visible_correct();
}

optional<string> feedback_calculator::stderr_content() const {
    return stderr_feedback(command, fdbk, result).content();
}

optional<vector<string>> feedback_calculator::stderr_diff() const {
    return stderr_feedback(command, fdbk, result).diff(command.flags, files);
}

int feedback_calculator::stderr_points() const {
    return stderr_feedback(command, fdbk, result).points();
}

int feedback_calculator::stderr_points_possible() const {
    return stderr_feedback(command, fdbk, result).points_possible();
}

int feedback_calculator::total_points() const {
    if (!fdbk.show_points) return 0;
    return return_code_points() + stdout_points() + stderr_points();
}

int feedback_calculator::total_points_possible() const {
    if (!fdbk.show_points) return 0;
    return return_code_points_possible() + stdout_points_possible() + stderr_points_possible();
}

json feedback_calculator::to_json() const {
    json j;
    j["pk"] = result.id;
    j["ag_test_command_pk"] = command.id;
    j["ag_test_command_name"] = command.name;
    j["fdbk_settings"] = fdbk;

    j["timed_out"] = nullable(timed_out());

    j["return_code_correct"] = nullable(return_code_correct());
    j["expected_return_code"] = nullable(expected_return_code());
    j["actual_return_code"] = nullable(actual_return_code());
    j["return_code_points"] = return_code_points();
    j["return_code_points_possible"] = return_code_points_possible();

    j["stdout_correct"] = nullable(stdout_correct());
    j["stdout_points"] = stdout_points();
    j["stdout_points_possible"] = stdout_points_possible();

    j["stderr_correct"] = nullable(stderr_correct());
    j["stderr_points"] = stderr_points();
    j["stderr_points_possible"] = stderr_points_possible();

    j["total_points"] = total_points();
    j["total_points_possible"] = total_points_possible();
    return j;
}

}  // namespace grader
