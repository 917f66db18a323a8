#pragma once

namespace grader {

/**
 * @brief 从环境变量读取配置，覆盖 config.hpp 中的默认值
 * 命令行参数在此之后处理，因此命令行参数的优先级更高
 * @throw configuration_error 如果环境变量的值不合法
 */
void load_environment();

}  // namespace grader
