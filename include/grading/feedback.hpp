#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "grading/project_files.hpp"
#include "grading/result_recorder.hpp"
#include "grading/test_command.hpp"

namespace grader {

/**
 * @brief 查看结果的场景，决定使用测试命令的哪一套反馈配置
 */
enum class feedback_category {
    normal,
    ultimate_submission,
    past_limit_submission,
    staff_viewer,
    max
};

NLOHMANN_JSON_SERIALIZE_ENUM(feedback_category, {
    {feedback_category::normal, "normal"},
    {feedback_category::ultimate_submission, "ultimate_submission"},
    {feedback_category::past_limit_submission, "past_limit_submission"},
    {feedback_category::staff_viewer, "staff_viewer"},
    {feedback_category::max, "max"},
})

/**
 * @brief 根据反馈类别计算一条命令结果中哪些内容可见、得多少分
 * 所有函数都只依赖构造时传入的结果、命令配置和反馈类别，
 * 同样的输入总是得到同样的输出。
 */
struct feedback_calculator {
    feedback_calculator(const recorded_command_result &result, const test_command &command,
                        feedback_category category, const project_file_store &files);

    const command_feedback_config &config() const;

    std::optional<bool> timed_out() const;

    std::optional<bool> return_code_correct() const;
    std::optional<return_code_expectation> expected_return_code() const;
    std::optional<int> actual_return_code() const;
    int return_code_points() const;
    int return_code_points_possible() const;

    std::optional<bool> stdout_correct() const;
    std::optional<std::string> stdout_content() const;
    std::optional<std::vector<std::string>> stdout_diff() const;
    int stdout_points() const;
    int stdout_points_possible() const;

    std::optional<bool> stderr_correct() const;
    std::optional<std::string> stderr_content() const;
    std::optional<std::vector<std::string>> stderr_diff() const;
    int stderr_points() const;
    int stderr_points_possible() const;

    /**
     * @brief 总分，反馈配置不显示分数时为 0
     */
    int total_points() const;
    int total_points_possible() const;

    /**
     * @brief 序列化为 JSON，只包含固定的一组字段，不包含输出内容和差异
     */
    nlohmann::json to_json() const;

private:
    const recorded_command_result &result;
    const test_command &command;
    const project_file_store &files;
    command_feedback_config fdbk;
};

}  // namespace grader
