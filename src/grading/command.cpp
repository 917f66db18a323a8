#include "grading/command.hpp"
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;

const vector<string> SUPPORTED_COMPILERS = {"g++", "clang++", "gcc", "clang"};
const vector<string> SUPPORTED_INTERPRETERS = {"python", "python3", "bash"};

static bool contains(const vector<string> &list, const string &value) {
    return find(list.begin(), list.end(), value) != list.end();
}

struct invocation_validator {
    void operator()(const raw_command &cmd) const {
        if (cmd.argv.empty() || cmd.argv[0].empty())
            throw configuration_error("Command must not be empty");
    }

    void operator()(const compiled_program &prog) const {
        if (!contains(SUPPORTED_COMPILERS, prog.compiler))
            throw configuration_error("Unsupported compiler " + prog.compiler);
        if (prog.files_to_compile.empty())
            throw configuration_error("No files to compile");
        for (auto &file : prog.files_to_compile) assert_safe_path(file);
        assert_safe_path(prog.executable_name);
    }

    void operator()(const interpreted_program &prog) const {
        if (!contains(SUPPORTED_INTERPRETERS, prog.interpreter))
            throw configuration_error("Unsupported interpreter " + prog.interpreter);
        assert_safe_path(prog.entry_point_filename);
    }
};

void validate_invocation(const program_invocation &invocation) {
    visit(invocation_validator(), invocation);
}

struct argv_builder {
    invocation_plan operator()(const raw_command &cmd) const {
        invocation_plan plan;
        plan.execution = cmd.argv;
        return plan;
    }

    invocation_plan operator()(const compiled_program &prog) const {
        invocation_plan plan;
        vector<string> compilation = {prog.compiler};
        compilation.insert(compilation.end(), prog.compiler_flags.begin(), prog.compiler_flags.end());
        compilation.insert(compilation.end(), prog.files_to_compile.begin(), prog.files_to_compile.end());
        compilation.insert(compilation.end(), {"-o", prog.executable_name});
        plan.compilation = move(compilation);

        plan.execution = {"./" + prog.executable_name};
        plan.execution.insert(plan.execution.end(), prog.args.begin(), prog.args.end());
        return plan;
    }

    invocation_plan operator()(const interpreted_program &prog) const {
        invocation_plan plan;
        plan.execution = {prog.interpreter};
        plan.execution.insert(plan.execution.end(), prog.interpreter_flags.begin(), prog.interpreter_flags.end());
        plan.execution.push_back(prog.entry_point_filename);
        plan.execution.insert(plan.execution.end(), prog.args.begin(), prog.args.end());
        return plan;
    }
};

invocation_plan build_argv(const program_invocation &invocation) {
    return visit(argv_builder(), invocation);
}

}  // namespace grader
