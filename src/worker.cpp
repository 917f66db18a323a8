#include "worker.hpp"
#include <glog/logging.h>
#include <atomic>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

// 停止 worker 的标记
static atomic<bool> stop{false};

void stop_workers() {
    stop = true;
}

bool workers_stopped() {
    return stop;
}

static void fetch_loop(server::rabbitmq &mq, concurrent_queue<build_request> &request_queue) {
    while (!stop) {
        try {
            AmqpClient::Envelope::ptr_t envelope;
            if (!mq.fetch(envelope, chrono::seconds(1)))
                continue;

            string body = envelope->Message()->Body();
            optional<int> task_id = server::rabbitmq::parse_build_request(body);
            if (!task_id) {
                mq.ack(envelope);
                continue;
            }

            LOG(INFO) << "Received build task " << *task_id;
            request_queue.push(build_request{*task_id, [&mq, envelope] { mq.ack(envelope); }});
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to fetch build requests: " << describe_exception(ex);
            this_thread::sleep_for(chrono::seconds(5));
        }
    }
    LOG(INFO) << "Build request fetcher stopped";
}

static void worker_loop(size_t worker_id, build_orchestrator &orchestrator, concurrent_queue<build_request> &request_queue) {
    LOG(INFO) << "Worker " << worker_id << " started";
    while (true) {
        build_request request;
        if (!request_queue.try_pop_for(request, chrono::milliseconds(100))) {
            // 停止时在队列为空的情况下自然退出，拉取线程此时不会再放入新的构建请求
            if (stop) break;
            continue;
        }

        LOG(INFO) << "Worker " << worker_id << " is building task " << request.task_id;
        orchestrator.run(request.task_id);

        if (request.on_finished) {
            try {
                request.on_finished();
            } catch (std::exception &ex) {
                LOG(ERROR) << "Worker " << worker_id << " is unable to acknowledge build task "
                           << request.task_id << ": " << describe_exception(ex);
            }
        }
    }
    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_fetcher(server::rabbitmq &mq, concurrent_queue<build_request> &request_queue) {
    return thread([&mq, &request_queue] { fetch_loop(mq, request_queue); });
}

thread start_worker(size_t worker_id, build_orchestrator &orchestrator, concurrent_queue<build_request> &request_queue) {
    return thread([worker_id, &orchestrator, &request_queue] {
        worker_loop(worker_id, orchestrator, request_queue);
    });
}

}  // namespace grader
