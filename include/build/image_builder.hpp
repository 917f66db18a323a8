#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include "build/container_runtime.hpp"
#include "common/concurrent_queue.hpp"

namespace grader {

/**
 * @brief 构建程序结束（正常退出、超时被杀死或者被取消）
 */
struct build_completed {
    /**
     * @brief 构建程序的返回值，因信号退出时为负的信号值
     */
    std::optional<int> return_code;
    bool timed_out = false;
    bool cancelled = false;
};

/**
 * @brief 构建线程内部出错，构建程序可能根本没有启动
 */
struct build_failed {
    std::string diagnostic;
};

/**
 * @brief 进程内的取消请求，让监督循环不必等到下一次轮询
 */
struct cancel_requested {};

using build_event = std::variant<build_completed, build_failed, cancel_requested>;

/**
 * @brief 在独立线程中运行镜像构建
 * 构建线程只通过事件队列向监督循环报告结果：构建结束时发送 build_completed，
 * 出错时发送 build_failed，每次构建恰好发送一个事件。
 * cancel 和 kill 可以在构建线程运行时从监督循环调用。
 */
class image_builder {
public:
    image_builder(container_runtime &runtime, std::filesystem::path build_dir,
                  std::filesystem::path output_file, std::string tag,
                  concurrent_queue<build_event> &events,
                  std::chrono::milliseconds timeout = IMAGE_BUILD_TIMEOUT);

    /**
     * @brief 等待构建线程退出，如果构建程序仍在运行则杀死它
     */
    ~image_builder();

    image_builder(const image_builder &) = delete;
    image_builder &operator=(const image_builder &) = delete;

    /**
     * @brief 启动构建线程
     */
    void start();

    /**
     * @brief 请求构建程序优雅退出（SIGTERM）
     * 如果构建程序还没有启动，则不会再启动。
     * 构建程序在宽限期内没有退出时，由调用方调用 kill。
     */
    void cancel();

    /**
     * @brief 强制杀死构建程序（SIGKILL）
     */
    void kill();

    void join();

    const std::string &tag() const;

private:
    void run();
    void build();

    container_runtime &runtime;
    std::filesystem::path build_dir;
    std::filesystem::path output_file;
    std::string image_tag;
    concurrent_queue<build_event> &events;
    std::chrono::milliseconds timeout;

    std::mutex mut;
    std::unique_ptr<subprocess> process;
    bool cancelled = false;
    std::thread worker;
};

}  // namespace grader
