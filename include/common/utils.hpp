#pragma once

#include <glog/logging.h>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 生成一个随机 uuid 的 16 进制表示（不含短横线）
 * 用于沙箱名、镜像标签和默认镜像名
 */
std::string random_hex();

/**
 * @brief 将命令参数用空格连接，仅用于日志输出
 */
std::string join_args(const std::vector<std::string> &args);

}  // namespace grader
