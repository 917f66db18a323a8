#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "grading/project_files.hpp"
#include "grading/result_recorder.hpp"
#include "grading/test_command.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 评分中的一步：运行一条测试命令并把结果记录为 result_id
 */
struct grading_step {
    int result_id = 0;
    test_command command;
};

/**
 * @brief 一个提交的评分任务
 */
struct submission_context {
    std::string submission_id;

    /**
     * @brief 命令输出的保存目录，默认为 RESULT_DIR/<submission_id>
     */
    std::filesystem::path output_dir;

    /**
     * @brief 运行命令前复制到沙箱中的文件（学生文件和项目文件）
     */
    std::vector<std::filesystem::path> files;

    /**
     * @brief 按顺序运行的命令
     */
    std::vector<grading_step> steps;

    /**
     * @brief 期望输出和 stdin 引用的项目文件
     */
    const project_file_store *project_files = nullptr;
};

/**
 * @brief 从 JSON 读取评分任务，不包括 project_files
 * 字段：submission_id, output_dir（可选）, files, steps: [{result_id, command}]
 */
void from_json(const nlohmann::json &j, grading_step &step);
void from_json(const nlohmann::json &j, submission_context &context);

/**
 * @brief 在已启动的沙箱中依次运行提交的所有测试命令并记录结果
 * 命令的失败和超时只会记录在结果中，不会中断后续命令。
 * 需要编译的程序会先运行编译命令，编译失败或者超时时，编译的结果作为这条命令的结果，不再运行程序。
 * @param context 提交的评分任务
 * @param box 已经启动的沙箱，由调用方通过 sandbox_guard 管理
 * @return 每条命令的记录结果，顺序与 context.steps 一致
 * @throw configuration_error 如果测试配置有误，比如期望输出引用的项目文件不存在
 */
std::vector<recorded_command_result> run(const submission_context &context, sandbox &box);

}  // namespace grader
