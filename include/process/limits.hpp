#pragma once

#include <optional>

namespace grader {

/**
 * @brief 命令的资源限制，未设置的项表示不限制
 */
struct resource_limits {
    /**
     * @brief 命令可以额外创建的进程数，0 表示不能 fork
     */
    std::optional<long> max_num_processes;

    /**
     * @brief 栈大小限制，单位为字节
     */
    std::optional<long> max_stack_size;

    /**
     * @brief 虚拟内存限制，单位为字节
     */
    std::optional<long> max_virtual_memory;
};

/**
 * @brief 沙箱的默认资源限制
 */
resource_limits default_resource_limits();

/**
 * @brief 用 overrides 中设置了的项覆盖 base
 * 用于单条命令覆盖沙箱的默认限制，只对这一条命令生效
 */
resource_limits merge_limits(const resource_limits &base, const resource_limits &overrides);

/**
 * @brief 检查资源限制是否在允许的范围内
 * 进程数在 [0, MAX_PROCESS_LIMIT]，栈大小在 (0, MAX_STACK_SIZE_LIMIT]，
 * 虚拟内存在 (0, MAX_VIRTUAL_MEM_LIMIT]
 * @throw configuration_error 如果有限制超出范围
 */
void validate_resource_limits(const resource_limits &limits);

/**
 * @brief 在当前进程上设置 RLIMIT_STACK 和 RLIMIT_AS，如果 apply_process_limit 为真，
 * 还会设置 RLIMIT_NPROC 为 max_num_processes + 1（命令本身也算一个进程）
 * 这个函数只会在 fork 之后的子进程中调用，只使用 async-signal-safe 的系统调用
 * @return 是否全部设置成功
 */
bool apply_rlimits(const resource_limits &limits, bool apply_process_limit) noexcept;

}  // namespace grader
