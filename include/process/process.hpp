#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "process/limits.hpp"

namespace grader {

/**
 * @brief 启动外部程序的参数
 */
struct process_options {
    /**
     * @brief 外部程序的路径 (argv[0]) 和参数，argv[0] 会在 PATH 中查找
     */
    std::vector<std::string> argv;

    /**
     * @brief 写入程序 stdin 的内容，为空时 stdin 为 /dev/null
     */
    std::optional<std::string> stdin_content;

    /**
     * @brief 程序的工作目录，为空时继承当前工作目录
     */
    std::filesystem::path working_directory;

    /**
     * @brief 额外的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 在子进程中设置的资源限制
     */
    resource_limits limits;

    /**
     * @brief 是否设置 RLIMIT_NPROC
     * RLIMIT_NPROC 按真实用户统计进程数，只有以独立用户运行时才有意义
     */
    bool limit_processes = false;

    /**
     * @brief 如果设置，stdout 和 stderr 都重定向到这个文件，不再捕获输出
     */
    std::optional<std::filesystem::path> output_file;

    /**
     * @brief 子进程是否通过 setsid 成为新的进程组组长
     * 这样 terminate 和 kill 可以通过进程组杀死程序创建的所有子进程
     */
    bool new_session = true;

    /**
     * @brief stdout 和 stderr 各自最多保存的字节数
     */
    std::size_t max_output_length = MAX_OUTPUT_LENGTH;
};

/**
 * @brief 外部程序的运行结果
 */
struct process_result {
    /**
     * @brief 程序的返回值
     * 如果程序因为信号退出，为负的信号值；如果程序超时被杀死，则没有返回值
     */
    std::optional<int> exit_code;

    std::string stdout_content;
    std::string stderr_content;

    bool timed_out = false;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

/**
 * @brief 外部程序的句柄
 * 构造时启动程序，析构时如果程序仍在运行，则杀死整个进程组并回收，
 * 保证不会遗留僵尸进程和文件描述符。
 * terminate、kill 可以在其他线程调用 wait_for 的同时调用。
 */
class subprocess {
public:
    /**
     * @brief 启动外部程序
     * @throw std::system_error 如果 fork 失败，或者程序无法执行（比如不存在）
     */
    explicit subprocess(const process_options &options);
    ~subprocess();

    subprocess(const subprocess &) = delete;
    subprocess &operator=(const subprocess &) = delete;

    pid_t pid() const noexcept;

    /**
     * @brief 向程序所在进程组发送 SIGTERM，如果程序已经退出则什么都不做
     */
    void terminate();

    /**
     * @brief 向程序所在进程组发送 SIGKILL，如果程序已经退出则什么都不做
     */
    void kill();

    /**
     * @brief 等待程序退出，最多等待 timeout
     * @return 程序退出时返回返回值（因信号退出时为负的信号值），超时返回空
     */
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    /**
     * @brief 等待程序退出
     * @return 程序的返回值（因信号退出时为负的信号值）
     */
    int wait();

    /**
     * @brief 写入 stdin，读取 stdout 和 stderr 直到程序退出或者超时
     * 超时后杀死整个进程组，此时结果中没有返回值。
     * 只能调用一次。
     * @param timeout 超时时间，为空表示不限时
     */
    process_result communicate(std::optional<std::chrono::milliseconds> timeout);

private:
    void signal_group(int sig);
    bool poll_exit_locked();
    bool pump_pipes(process_result &result, std::optional<std::chrono::steady_clock::time_point> deadline);
    void close_pipes() noexcept;

    pid_t child_pid = -1;
    bool new_session;
    std::size_t max_output_length;
    std::string stdin_content;
    std::size_t stdin_written = 0;

    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;

    std::mutex mut;
    bool reaped = false;
    int exit_status = 0;
};

/**
 * @brief 运行外部程序直到结束或者超时
 * 命令失败（返回值非零、超时、被信号杀死）不会抛出异常，而是记录在结果中。
 * @throw std::system_error 如果程序无法启动
 */
process_result run_process(const process_options &options, std::optional<std::chrono::milliseconds> timeout);

/**
 * @brief 运行一个必须成功的外部程序，返回程序的 stdout
 * @throw command_error 如果程序的返回值不为零，异常中保存 stdout 和 stderr
 */
std::string check_output(const std::vector<std::string> &argv);

}  // namespace grader
