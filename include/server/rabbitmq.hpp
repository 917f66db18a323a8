#pragma once

#include <SimpleAmqpClient/SimpleAmqpClient.h>
#include <chrono>
#include <mutex>
#include <optional>
#include "server/config.hpp"

namespace grader::server {

/**
 * @brief 从消息队列接收构建请求
 * 消息内容为 {"build_task_id": 123}。
 * 消息在构建完成后才会被确认，worker 崩溃时未完成的构建请求会被重新投递。
 */
struct rabbitmq {
    /**
     * @param prefetch_count 最多同时持有的未确认消息数，通常等于 worker 数
     */
    rabbitmq(const amqp &amqp, int prefetch_count = 1);

    /**
     * @brief 从队列中获取一条消息，最多等待 timeout
     * 连接断开时会重连，至多尝试 5 次
     * @return 是否获取到消息
     */
    bool fetch(AmqpClient::Envelope::ptr_t &envelope, std::chrono::milliseconds timeout);
    void ack(const AmqpClient::Envelope::ptr_t &envelope);

    /**
     * @brief 解析构建请求消息
     * @return 构建任务编号，消息格式错误时为空
     */
    static std::optional<int> parse_build_request(const std::string &body);

private:
    void connect();

    AmqpClient::Channel::ptr_t channel;
    grader::server::amqp queue;
    int prefetch_count;
    std::mutex mut;
};

}  // namespace grader::server
