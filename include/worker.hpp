#pragma once

#include <functional>
#include <thread>
#include "build/build_orchestrator.hpp"
#include "common/concurrent_queue.hpp"
#include "server/rabbitmq.hpp"

/**
 * 构建服务相关函数
 * 拉取线程从消息队列中接收构建请求，放入 request_queue；
 * 每个 worker 线程从 request_queue 中取出构建请求，交给 build_orchestrator 执行，
 * 构建任务进入终止状态后才确认消息，因此 worker 崩溃时构建请求会被重新投递。
 */
namespace grader {

/**
 * @brief 一个待执行的构建请求
 */
struct build_request {
    int task_id = 0;

    /**
     * @brief 构建结束后调用，用于确认消息
     */
    std::function<void()> on_finished;
};

/**
 * @brief 停止所有的 worker 和拉取线程
 * 调用该函数后，拉取线程不再接收新的构建请求，worker 在完成当前构建、
 * 且队列为空时退出。
 */
void stop_workers();

/**
 * @brief 是否已经调用了 stop_workers
 */
bool workers_stopped();

/**
 * @brief 启动从消息队列拉取构建请求的线程
 * 格式错误的消息会被直接确认丢弃
 */
std::thread start_fetcher(server::rabbitmq &mq, concurrent_queue<build_request> &request_queue);

/**
 * @brief 启动构建 worker 线程
 * @param worker_id worker 编号，仅用于日志
 */
std::thread start_worker(std::size_t worker_id, build_orchestrator &orchestrator, concurrent_queue<build_request> &request_queue);

}  // namespace grader
