#include "server/rabbitmq.hpp"
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <thread>

namespace grader::server {
using namespace std;

rabbitmq::rabbitmq(const amqp &amqp, int prefetch_count) : queue(amqp), prefetch_count(prefetch_count) {
    connect();
}

void rabbitmq::connect() {
    LOG(INFO) << "RabbitMQ: connecting to " << queue.hostname << ":" << queue.port << ", queue " << queue.queue;
    channel = AmqpClient::Channel::Create(queue.hostname, queue.port);
    channel->DeclareQueue(queue.queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    channel->DeclareExchange(queue.exchange, queue.exchange_type, /* passive */ false, /* durable */ true);
    channel->BindQueue(queue.queue, queue.exchange, queue.routing_key);
    // 未确认的构建请求不超过 worker 数，其余的留给其他 worker 进程
    channel->BasicConsume(queue.queue, /* consumer tag */ "", /* no_local */ true, /* no_ack */ false, /* exclusive */ false, prefetch_count);
}

bool rabbitmq::fetch(AmqpClient::Envelope::ptr_t &envelope, chrono::milliseconds timeout) {
    scoped_lock guard(mut);
    for (int fail = 0;; ++fail) {
        try {
            return channel->BasicConsumeMessage(envelope, (int)timeout.count());
        } catch (std::exception &e) {
            if (fail + 1 >= 5) throw;
            LOG(WARNING) << "RabbitMQ: lost connection, trying to reconnect: " << e.what();
            this_thread::sleep_for(chrono::seconds(5));
            connect();
        }
    }
}

void rabbitmq::ack(const AmqpClient::Envelope::ptr_t &envelope) {
    scoped_lock guard(mut);
    channel->BasicAck(envelope);
}

optional<int> rabbitmq::parse_build_request(const string &body) {
    try {
        auto j = nlohmann::json::parse(body);
        return j.at("build_task_id").get<int>();
    } catch (nlohmann::json::exception &ex) {
        LOG(ERROR) << "RabbitMQ: malformed build request " << body << ": " << ex.what();
        return {};
    }
}

}  // namespace grader::server
