#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace grader {

/**
 * @brief 直接执行的命令
 */
struct raw_command {
    std::vector<std::string> argv;
};

/**
 * @brief 需要先编译再运行的程序
 * 编译命令为 compiler + compiler_flags + files_to_compile + ["-o", executable_name]，
 * 运行命令为 ["./" + executable_name] + args
 */
struct compiled_program {
    std::string compiler;
    std::vector<std::string> compiler_flags;
    std::vector<std::string> files_to_compile;
    std::string executable_name = "prog";
    std::vector<std::string> args;
};

/**
 * @brief 通过解释器运行的程序
 * 运行命令为 interpreter + interpreter_flags + [entry_point_filename] + args
 */
struct interpreted_program {
    std::string interpreter;
    std::vector<std::string> interpreter_flags;
    std::string entry_point_filename;
    std::vector<std::string> args;
};

using program_invocation = std::variant<raw_command, compiled_program, interpreted_program>;

/**
 * @brief 执行一个 program_invocation 需要的命令
 */
struct invocation_plan {
    /**
     * @brief 编译命令，只有 compiled_program 有
     */
    std::optional<std::vector<std::string>> compilation;

    /**
     * @brief 运行命令
     */
    std::vector<std::string> execution;
};

extern const std::vector<std::string> SUPPORTED_COMPILERS;
extern const std::vector<std::string> SUPPORTED_INTERPRETERS;

/**
 * @brief 检查编译器、解释器是否受支持，文件名是否安全
 * @throw configuration_error 如果配置不合法
 */
void validate_invocation(const program_invocation &invocation);

/**
 * @brief 生成执行 invocation 需要的命令
 */
invocation_plan build_argv(const program_invocation &invocation);

}  // namespace grader
