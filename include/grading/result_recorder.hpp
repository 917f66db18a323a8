#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "grading/project_files.hpp"
#include "grading/test_command.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 保存下来的命令执行结果和正确性判定
 */
struct recorded_command_result {
    int id = 0;
    int command_id = 0;

    std::optional<int> return_code;
    bool timed_out = false;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief 正确性判定，没有对应的期望值时为空
     */
    std::optional<bool> return_code_correct;
    std::optional<bool> stdout_correct;
    std::optional<bool> stderr_correct;

    std::filesystem::path stdout_filename;
    std::filesystem::path stderr_filename;
};

void to_json(nlohmann::json &j, const recorded_command_result &result);

/**
 * @brief 读取 source 对应的文本
 * @return source 为 none 时返回空
 * @throw configuration_error 如果项目文件无法读取
 */
std::optional<std::string> resolve_text(const text_source &source, const project_file_store &files);

/**
 * @brief 根据测试命令的期望判断命令结果的正确性，并将输出保存到提交的输出目录中
 * 输出文件名为 cmd_result_<id>_stdout 和 cmd_result_<id>_stderr
 */
struct result_recorder {
    result_recorder(const std::filesystem::path &output_dir, const project_file_store &files);

    /**
     * @brief 记录一条命令的结果
     * @param result_id 结果的编号，决定输出文件名
     * @param command 命令的评分策略
     * @param result 命令的执行结果
     * @throw configuration_error 如果期望输出引用的项目文件无法读取
     */
    recorded_command_result record(int result_id, const test_command &command, const command_result &result) const;

    std::filesystem::path stdout_filename(int result_id) const;
    std::filesystem::path stderr_filename(int result_id) const;

private:
    std::filesystem::path output_dir;
    const project_file_store &files;
};

}  // namespace grader
