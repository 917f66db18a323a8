#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 * @throw std::system_error 如果文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 * @throw std::system_error 如果文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录或者绝对路径的情况
 * 项目文件名、编译文件名都来自测试配置，拼接路径前必须经过检查，
 * 否则有可能读取或者覆盖到输出目录之外的文件。
 * @param subpath 被检查的文件名
 * @throw configuration_error 如果文件名不安全
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace grader
