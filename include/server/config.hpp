#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace grader::server {

/**
 * @brief 描述一个 AMQP 消息队列的配置数据结构
 */
struct amqp {
    /**
     * @brief AMQP 消息队列的主机地址
     */
    std::string hostname;

    /**
     * @brief AMQP 消息队列的主机端口
     */
    int port = 5672;

    /**
     * @brief 构建请求发送到的 Exchange 名
     */
    std::string exchange;

    /**
     * @brief Exchange 类型，可选 direct, topic, fanout
     */
    std::string exchange_type;

    /**
     * @brief 构建请求队列的队列名
     */
    std::string queue;

    /**
     * @brief AMQP 消息队列的 Routing Key
     */
    std::string routing_key;
};

void from_json(const nlohmann::json &j, amqp &mq);

/**
 * @brief 描述一个 MySQL 数据库连接信息
 */
struct database {
    /**
     * @brief 数据库服务器的地址
     */
    std::string host;

    /**
     * @brief 数据库服务器的账号
     */
    std::string user;

    /**
     * @brief 数据库服务器的密码
     */
    std::string password;

    /**
     * @brief 使用连接到的数据库服务器的哪一个数据库
     */
    std::string database;
};

void from_json(const nlohmann::json &j, database &db);

/**
 * @brief 镜像仓库的地址，覆盖环境变量中的配置
 */
struct registry {
    std::string host;
    int port = 5001;
};

void from_json(const nlohmann::json &j, registry &reg);

/**
 * @brief worker 的配置文件
 * {
 *     "amqp": {...},      // 可选，没有时不从消息队列接收构建请求
 *     "database": {...},
 *     "registry": {...}   // 可选
 * }
 */
struct worker_config {
    std::optional<amqp> build_queue;
    database db;
    std::optional<registry> image_registry;
};

void from_json(const nlohmann::json &j, worker_config &config);

}  // namespace grader::server
