#include "grading/grader.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, grading_step &step) {
    j.at("result_id").get_to(step.result_id);
    j.at("command").get_to(step.command);
}

void from_json(const json &j, submission_context &context) {
    j.at("submission_id").get_to(context.submission_id);
    if (j.count("output_dir"))
        context.output_dir = j.at("output_dir").get<string>();
    else
        context.output_dir = RESULT_DIR / context.submission_id;
    if (j.count("files"))
        for (auto &file : j.at("files")) context.files.emplace_back(file.get<string>());
    j.at("steps").get_to(context.steps);
}

/**
 * @brief 编译命令的资源限制：编译器需要创建子进程和较多的内存
 */
static resource_limits compilation_limits(const test_command &command) {
    resource_limits limits = command.limits;
    limits.max_num_processes = MAX_PROCESS_LIMIT;
    limits.max_virtual_memory = MAX_VIRTUAL_MEM_LIMIT;
    return limits;
}

static command_result run_step(const grading_step &step, sandbox &box, const project_file_store &files) {
    const test_command &command = step.command;
    invocation_plan plan = build_argv(command.invocation);

    if (plan.compilation) {
        command_request compile;
        compile.argv = *plan.compilation;
        compile.timeout = command.timeout;
        compile.limits = compilation_limits(command);
        command_result compiled = box.run_command(compile);
        if (compiled.timed_out || compiled.exit_code != 0) {
            LOG(INFO) << "Compilation of command " << command.name << " failed: " << join_args(compile.argv);
            return compiled;
        }
    }

    command_request request;
    request.argv = plan.execution;
    request.stdin_content = resolve_text(command.stdin_source, files);
    request.timeout = command.timeout;
    request.limits = command.limits;
    return box.run_command(request);
}

vector<recorded_command_result> run(const submission_context &context, sandbox &box) {
    if (!context.project_files)
        throw internal_error("No project file store for submission " + context.submission_id);
    const project_file_store &files = *context.project_files;

    for (auto &step : context.steps)
        validate_test_command(step.command);

    if (!context.files.empty())
        box.add_files(context.files);

    result_recorder recorder(context.output_dir, files);
    vector<recorded_command_result> results;
    for (auto &step : context.steps) {
        LOG(INFO) << "Submission " << context.submission_id << ": running command " << step.command.name;
        command_result result = run_step(step, box, files);
        results.push_back(recorder.record(step.result_id, step.command, result));
    }
    return results;
}

}  // namespace grader
