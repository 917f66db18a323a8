#pragma once

#include <string>
#include <vector>

namespace grader {

/**
 * @brief 比较期望输出和实际输出时忽略的差异
 */
struct comparison_flags {
    /**
     * @brief 忽略大小写
     */
    bool ignore_case = false;

    /**
     * @brief 忽略所有空白字符
     */
    bool ignore_whitespace = false;

    /**
     * @brief 忽略空白字符数量上的差异，连续的空白字符视为一个空格，忽略行末空白
     */
    bool ignore_whitespace_changes = false;

    /**
     * @brief 忽略空行
     */
    bool ignore_blank_lines = false;
};

/**
 * @brief 在 flags 指定的忽略规则下，比较期望输出和实际输出是否相同
 */
bool outputs_equal(const std::string &expected, const std::string &actual, const comparison_flags &flags);

/**
 * @brief 按行比较期望输出和实际输出
 * 每一行以两个字符的前缀开头："  " 表示相同，"- " 表示只在期望输出中，"+ " 表示只在实际输出中。
 * 行保留原始的换行符。
 * @return 差异结果，当且仅当两者相同时不包含 "- " 和 "+ " 行
 */
std::vector<std::string> diff_lines(const std::string &expected, const std::string &actual, const comparison_flags &flags);

}  // namespace grader
