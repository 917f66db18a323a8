#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "process/limits.hpp"
#include "process/process.hpp"

namespace grader {

/**
 * @brief 在沙箱中执行一条命令的请求
 */
struct command_request {
    /**
     * @brief 命令参数，argv[0] 为要执行的程序
     */
    std::vector<std::string> argv;

    /**
     * @brief 写入命令 stdin 的内容
     */
    std::optional<std::string> stdin_content;

    /**
     * @brief 命令的超时时间
     */
    std::chrono::milliseconds timeout = DEFAULT_SUBPROCESS_TIMEOUT;

    /**
     * @brief 只对这条命令生效的资源限制，未设置的项使用沙箱的默认限制
     */
    resource_limits limits;
};

/**
 * @brief 命令在沙箱中的执行结果，由沙箱构造后不再修改
 */
using command_result = process_result;

enum class sandbox_state {
    not_started,
    active,
    torn_down
};

/**
 * @brief 资源受限的隔离执行环境
 * 生命周期为 not_started -> active -> torn_down，只有 active 状态下可以执行命令。
 * 同一个沙箱内的命令顺序执行，共享同一个文件系统，因此编译产生的文件可以被之后的命令使用。
 * 不同沙箱之间互不影响，可以并发使用。
 */
struct sandbox {
    explicit sandbox(const resource_limits &default_limits);
    virtual ~sandbox();

    sandbox(const sandbox &) = delete;
    sandbox &operator=(const sandbox &) = delete;

    /**
     * @brief 沙箱的唯一名称
     */
    const std::string &name() const;

    sandbox_state state() const;

    const resource_limits &default_limits() const;

    /**
     * @brief 启动沙箱
     * @throw internal_error 如果沙箱已经启动过，或者启动失败
     */
    void start();

    /**
     * @brief 销毁沙箱，释放沙箱占用的所有资源，可以重复调用
     */
    void destroy();

    /**
     * @brief 将文件或者文件夹复制到沙箱的工作目录中
     */
    void add_files(const std::vector<std::filesystem::path> &files);

    /**
     * @brief 在沙箱中执行一条命令
     * 命令的失败（非零返回值、超时、超出资源限制被杀死）记录在结果中，不会抛出异常
     * @throw internal_error 如果沙箱不在 active 状态
     */
    command_result run_command(const command_request &request);

protected:
    virtual void do_start() = 0;
    virtual void do_destroy() = 0;
    virtual void do_add_files(const std::vector<std::filesystem::path> &files) = 0;
    virtual command_result do_run_command(const command_request &request, const resource_limits &limits) = 0;

    std::string sandbox_name;

private:
    resource_limits limits;
    sandbox_state current_state = sandbox_state::not_started;
};

/**
 * @brief 在作用域内持有一个已启动的沙箱
 * 构造时启动沙箱，析构时销毁沙箱，无论作用域以何种方式退出
 */
struct sandbox_guard {
    explicit sandbox_guard(sandbox &box);
    ~sandbox_guard();

    sandbox_guard(const sandbox_guard &) = delete;
    sandbox_guard &operator=(const sandbox_guard &) = delete;

    sandbox &operator*() const;
    sandbox *operator->() const;

private:
    sandbox &box;
};

}  // namespace grader
