#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 命令 stdout 和 stderr 各自最多保存的字节数，超出部分被丢弃并标记为截断
 * 截断不会留下半个 UTF-8 字符，因此保存的内容可能略短于这个长度
 */
constexpr std::size_t MAX_OUTPUT_LENGTH = 8000000;

/**
 * @brief 测试命令的默认超时时间和允许配置的最大超时时间
 */
constexpr std::chrono::seconds DEFAULT_SUBPROCESS_TIMEOUT{10};
constexpr std::chrono::seconds MAX_SUBPROCESS_TIMEOUT{60};

/**
 * @brief 栈大小限制（字节）
 */
constexpr long DEFAULT_STACK_SIZE_LIMIT = 10000000;
constexpr long MAX_STACK_SIZE_LIMIT = 100000000;

/**
 * @brief 虚拟内存限制（字节）
 */
constexpr long DEFAULT_VIRTUAL_MEM_LIMIT = 500000000;
constexpr long MAX_VIRTUAL_MEM_LIMIT = 1000000000;

/**
 * @brief 命令可以额外创建的进程数
 */
constexpr long DEFAULT_PROCESS_LIMIT = 0;
constexpr long MAX_PROCESS_LIMIT = 10;

/**
 * @brief 镜像构建时的 CPU 配额：每 100ms 周期最多使用 50ms，即半个 CPU
 */
constexpr long IMAGE_BUILD_CPU_PERIOD = 100000;
constexpr long IMAGE_BUILD_CPU_QUOTA = 50000;

/**
 * @brief 构建监督循环检查取消请求的间隔
 */
constexpr std::chrono::seconds BUILD_POLL_INTERVAL{1};

/**
 * @brief 取消构建时，发送 SIGTERM 后等待构建进程退出的时间，超时后发送 SIGKILL
 */
constexpr std::chrono::seconds CANCEL_GRACE_PERIOD{3};

/**
 * @brief 构建镜像时 docker build 的内存限制，传给 --memory 和 --memory-swap
 * 环境变量 IMAGE_BUILD_MEMORY_LIMIT
 */
extern std::string IMAGE_BUILD_MEMORY_LIMIT;

/**
 * @brief 构建镜像时的进程数限制，传给 --ulimit nproc
 * 环境变量 IMAGE_BUILD_NPROC_LIMIT
 */
extern int IMAGE_BUILD_NPROC_LIMIT;

/**
 * @brief 构建镜像的超时时间
 * 环境变量 IMAGE_BUILD_TIMEOUT，单位为秒
 */
extern std::chrono::seconds IMAGE_BUILD_TIMEOUT;

/**
 * @brief 镜像仓库的主机名，为空时镜像标签不带仓库前缀，也不推送
 * 环境变量 SANDBOX_IMAGE_REGISTRY_HOST
 */
extern std::string REGISTRY_HOST;

/**
 * @brief 镜像仓库的端口
 * 环境变量 SANDBOX_IMAGE_REGISTRY_PORT
 */
extern int REGISTRY_PORT;

/**
 * @brief 测试命令输出的保存目录
 * 
 * RESULT_DIR
 * ├── 5100001 // submission id
 * │   ├── cmd_result_1_stdout // 命令结果 1 的 stdout
 * │   ├── cmd_result_1_stderr // 命令结果 1 的 stderr
 * │   └── ...
 * └── ...
 */
extern std::filesystem::path RESULT_DIR;

/**
 * @brief 本地沙箱的工作目录根目录，每个沙箱在其中有一个以沙箱名命名的子目录
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief docker 命令行程序
 */
extern std::string DOCKER;

/**
 * @brief 默认的沙箱镜像
 */
extern std::string SANDBOX_IMAGE;

/**
 * @brief docker 沙箱中执行命令的用户和工作目录
 */
extern std::string SANDBOX_USER;
extern std::string SANDBOX_WORKING_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，本地沙箱不会删除工作目录，以便手动检查命令产生的文件，
 * 并且会在日志中输出所有执行的外部命令。
 */
extern bool DEBUG;

}  // namespace grader
