#pragma once

#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include "build/build_task_store.hpp"
#include "build/container_runtime.hpp"
#include "build/image_builder.hpp"

namespace grader {

/**
 * @brief 执行沙箱镜像构建任务
 * 同一个 build_orchestrator 可以被多个 worker 线程同时使用，每次 run 独立运行一个构建任务。
 */
class build_orchestrator {
public:
    build_orchestrator(build_task_store &store, container_runtime &runtime);

    /**
     * @brief 执行构建任务直到任务进入终止状态
     * 1. 任务已经被取消时直接返回；
     * 2. 将任务标记为 in_progress，任务已经是 in_progress 时（消息被重新投递）接管任务重新构建；
     * 3. 生成带随机串的镜像 tag；
     * 4. 在独立线程中启动构建；
     * 5. 每隔 BUILD_POLL_INTERVAL 检查任务是否被取消，被取消时先 SIGTERM，
     *    宽限期 CANCEL_GRACE_PERIOD 后 SIGKILL；
     * 6. 构建结束后保存返回值，构建超时或失败时标记为 failed；
     * 7. 检查镜像的运行配置，不合法时标记为 image_invalid；
     * 8. 配置了镜像仓库时推送镜像；
     * 9. 创建或更新镜像并标记为 done。
     * 任何异常都会被转换为 internal_error 并保存诊断信息，不会抛出。
     */
    void run(int task_id);

    /**
     * @brief 取消构建任务，如果任务正在本进程中构建，立即通知监督循环
     * @return 是否成功标记为 cancelled
     */
    bool request_cancel(int task_id);

    /**
     * @brief 检查镜像的运行配置
     * 自定义镜像只能修改文件系统，不能使用 ENTRYPOINT，CMD 只能是 /bin/bash 或 /bin/sh
     * @return 错误信息，镜像合法时为空
     */
    static std::string validate_image_config(const nlohmann::json &config);

    /**
     * @brief 生成构建结果的镜像 tag
     * 配置了镜像仓库时为 <仓库 IP>:<端口>/build<任务编号>_result<随机串>，
     * 否则为 build<任务编号>_result<随机串>
     */
    static std::string make_tag(int task_id);

private:
    void build(int task_id);
    void supervise(int task_id, image_builder &builder, concurrent_queue<build_event> &events, build_event &result);
    void complete(int task_id, const std::string &tag, const build_completed &completed);

    build_task_store &store;
    container_runtime &runtime;

    std::mutex mut;
    std::map<int, concurrent_queue<build_event> *> running;
};

}  // namespace grader
