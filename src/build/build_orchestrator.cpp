#include "build/build_orchestrator.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <glog/logging.h>
#include <fmt/core.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/retry.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

/**
 * @brief 将镜像仓库的主机名解析为 IPv4 地址
 */
static string resolve_ipv4(const string &host) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    int err = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (err != 0)
        throw internal_error("Unable to resolve registry host " + host + ": " + gai_strerror(err));
    defer { freeaddrinfo(res); };

    char buf[INET_ADDRSTRLEN];
    auto addr = reinterpret_cast<sockaddr_in *>(res->ai_addr);
    if (!inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf)))
        throw system_error(errno, system_category(), "inet_ntop");
    return buf;
}

build_orchestrator::build_orchestrator(build_task_store &store, container_runtime &runtime)
    : store(store), runtime(runtime) {}

string build_orchestrator::make_tag(int task_id) {
    string name = fmt::format("build{}_result{}", task_id, random_hex());
    if (REGISTRY_HOST.empty()) return name;
    return fmt::format("{}:{}/{}", resolve_ipv4(REGISTRY_HOST), REGISTRY_PORT, name);
}

string build_orchestrator::validate_image_config(const nlohmann::json &config) {
    string error_msg;
    if (config.contains("Entrypoint") && !config.at("Entrypoint").is_null())
        error_msg += "Custom images may not use the ENTRYPOINT directive.\n";

    nlohmann::json cmd = config.contains("Cmd") ? config.at("Cmd") : nlohmann::json();
    if (cmd != nlohmann::json::array({"/bin/bash"}) && cmd != nlohmann::json::array({"/bin/sh"}))
        error_msg += "Custom images may not use the CMD directive. Expected [\"/bin/bash\"] but was \"" + cmd.dump() + "\".\n";
    return error_msg;
}

bool build_orchestrator::request_cancel(int task_id) {
    bool cancelled = request_cancellation(store, task_id);
    if (cancelled) {
        scoped_lock guard(mut);
        auto it = running.find(task_id);
        if (it != running.end()) it->second->push(cancel_requested{});
    }
    return cancelled;
}

void build_orchestrator::run(int task_id) {
    try {
        build(task_id);
    } catch (std::exception &ex) {
        string diagnostic = describe_exception(ex);
        LOG(ERROR) << "Build task " << task_id << " failed with internal error: " << diagnostic;
        try {
            transition(store, task_id, build_status::internal_error, [&](build_task &task) {
                task.internal_error_msg = diagnostic;
            });
        } catch (std::exception &inner) {
            LOG(ERROR) << "Unable to save internal error of build task " << task_id << ": " << describe_exception(inner);
        }
    }
}

void build_orchestrator::build(int task_id) {
    build_task task = retry_on_transient([&] { return store.load(task_id); });
    if (task.status == build_status::cancelled) {
        LOG(INFO) << "Build task " << task_id << " was cancelled before it started";
        return;
    }

    if (task.status == build_status::in_progress) {
        // 消息在上一个 worker 确认前被重新投递，上一次构建已经丢失，接管任务重新构建
        LOG(WARNING) << "Build task " << task_id << " is already in progress, previous worker was lost, rebuilding";
        retry_on_transient([&] {
            store.update(task_id, [&](build_task &current) {
                if (current.status != build_status::in_progress) return false;
                current.return_code.reset();
                current.timed_out = false;
                return true;
            });
        });
    } else if (!transition(store, task_id, build_status::in_progress)) {
        return;
    }

    string tag = make_tag(task_id);

    concurrent_queue<build_event> events;
    {
        scoped_lock guard(mut);
        running[task_id] = &events;
    }
    defer {
        scoped_lock guard(mut);
        running.erase(task_id);
    };

    build_event result;
    {
        image_builder builder(runtime, task.build_dir, task.output_filename, tag, events);
        builder.start();
        supervise(task_id, builder, events, result);
        builder.join();
    }

    if (auto failed = get_if<build_failed>(&result)) {
        transition(store, task_id, build_status::internal_error, [&](build_task &task) {
            task.internal_error_msg = failed->diagnostic;
        });
        return;
    }

    complete(task_id, tag, get<build_completed>(result));
}

void build_orchestrator::supervise(int task_id, image_builder &builder, concurrent_queue<build_event> &events, build_event &result) {
    optional<chrono::steady_clock::time_point> kill_deadline;
    bool killed = false;

    auto begin_cancel = [&] {
        if (kill_deadline) return;
        LOG(INFO) << "Build task " << task_id << " was cancelled, terminating build";
        builder.cancel();
        kill_deadline = chrono::steady_clock::now() + CANCEL_GRACE_PERIOD;
    };

    while (true) {
        build_event event;
        if (events.try_pop_for(event, BUILD_POLL_INTERVAL)) {
            if (holds_alternative<cancel_requested>(event)) {
                begin_cancel();
                continue;
            }
            result = move(event);
            return;
        }

        if (kill_deadline) {
            if (!killed && chrono::steady_clock::now() >= *kill_deadline) {
                LOG(WARNING) << "Build task " << task_id << " did not exit within grace period, killing build";
                builder.kill();
                killed = true;
            }
            continue;
        }

        build_task current = retry_on_transient([&] { return store.load(task_id); });
        if (current.status == build_status::cancelled)
            begin_cancel();
    }
}

void build_orchestrator::complete(int task_id, const string &tag, const build_completed &completed) {
    retry_on_transient([&] {
        store.update(task_id, [&](build_task &task) {
            task.return_code = completed.return_code;
            task.timed_out = completed.timed_out;
            return true;
        });
    });

    if (completed.cancelled) {
        LOG(INFO) << "Build task " << task_id << " stopped after cancellation";
        return;
    }

    if (completed.timed_out || completed.return_code != 0) {
        LOG(INFO) << "Build task " << task_id << " failed, return code "
                  << (completed.return_code ? to_string(*completed.return_code) : "none")
                  << (completed.timed_out ? ", timed out" : "");
        transition(store, task_id, build_status::failed);
        return;
    }

    string error_msg = validate_image_config(runtime.inspect_config(tag));
    if (!error_msg.empty()) {
        LOG(INFO) << "Image " << tag << " of build task " << task_id << " is invalid: " << error_msg;
        transition(store, task_id, build_status::image_invalid, [&](build_task &task) {
            task.validation_error_msg = error_msg;
        });
        return;
    }

    if (REGISTRY_HOST.empty())
        LOG(INFO) << "No image registry configured, image " << tag << " of build task " << task_id << " is kept locally";
    else
        runtime.push(tag);

    if (retry_on_transient([&] { return store.finish(task_id, tag); }))
        LOG(INFO) << "Build task " << task_id << " is now done, image " << tag;
    else
        LOG(INFO) << "Build task " << task_id << " was no longer in progress, image " << tag << " discarded";
}

}  // namespace grader
