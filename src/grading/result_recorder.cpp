#include "grading/result_recorder.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const recorded_command_result &result) {
    j = json::object();
    j["id"] = result.id;
    j["command_id"] = result.command_id;
    j["return_code"] = result.return_code ? json(*result.return_code) : json(nullptr);
    j["timed_out"] = result.timed_out;
    j["stdout_truncated"] = result.stdout_truncated;
    j["stderr_truncated"] = result.stderr_truncated;
    j["return_code_correct"] = result.return_code_correct ? json(*result.return_code_correct) : json(nullptr);
    j["stdout_correct"] = result.stdout_correct ? json(*result.stdout_correct) : json(nullptr);
    j["stderr_correct"] = result.stderr_correct ? json(*result.stderr_correct) : json(nullptr);
    j["stdout_filename"] = result.stdout_filename.string();
    j["stderr_filename"] = result.stderr_filename.string();
}

optional<string> resolve_text(const text_source &source, const project_file_store &files) {
    switch (source.source) {
        case text_source_type::none:
            return {};
        case text_source_type::text:
            return source.text;
        case text_source_type::project_file:
            return files.read(source.project_file);
    }
    return {};
}

static optional<bool> check_return_code(return_code_expectation expected, const command_result &result) {
    if (expected == return_code_expectation::none)
        return {};
    // 超时的命令没有返回值，视为不正确
    if (result.timed_out || !result.exit_code)
        return false;
    if (expected == return_code_expectation::zero)
        return *result.exit_code == 0;
    else
        return *result.exit_code != 0;
}

static optional<bool> check_stream(const text_source &expected, const string &actual,
                                   const comparison_flags &flags, const project_file_store &files) {
    optional<string> expected_text = resolve_text(expected, files);
    if (!expected_text) return {};
    return outputs_equal(*expected_text, actual, flags);
}

result_recorder::result_recorder(const filesystem::path &output_dir, const project_file_store &files)
    : output_dir(output_dir), files(files) {}

filesystem::path result_recorder::stdout_filename(int result_id) const {
    return output_dir / ("cmd_result_" + to_string(result_id) + "_stdout");
}

filesystem::path result_recorder::stderr_filename(int result_id) const {
    return output_dir / ("cmd_result_" + to_string(result_id) + "_stderr");
}

recorded_command_result result_recorder::record(int result_id, const test_command &command, const command_result &result) const {
    recorded_command_result recorded;
    recorded.id = result_id;
    recorded.command_id = command.id;
    recorded.return_code = result.exit_code;
    recorded.timed_out = result.timed_out;
    recorded.stdout_truncated = result.stdout_truncated;
    recorded.stderr_truncated = result.stderr_truncated;

    recorded.return_code_correct = check_return_code(command.expected_return_code, result);
    recorded.stdout_correct = check_stream(command.expected_stdout, result.stdout_content, command.flags, files);
    recorded.stderr_correct = check_stream(command.expected_stderr, result.stderr_content, command.flags, files);

    filesystem::create_directories(output_dir);
    recorded.stdout_filename = stdout_filename(result_id);
    recorded.stderr_filename = stderr_filename(result_id);
    write_file_content(recorded.stdout_filename, result.stdout_content);
    write_file_content(recorded.stderr_filename, result.stderr_content);

    DLOG(INFO) << "Recorded result " << result_id << " of command " << command.name;
    return recorded;
}

}  // namespace grader
