#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "build/build_task.hpp"

namespace grader {

/**
 * @brief 构建任务的持久化存储
 * 构建任务是构建线程和取消请求之间唯一共享的可变状态，所有修改都必须通过
 * update 完成：在行锁内读取最新的任务、修改、写回。
 * 暂时性的存储错误抛出 database_error，由调用方通过 retry_on_transient 重试。
 */
struct build_task_store {
    virtual ~build_task_store();

    /**
     * @brief 读取构建任务的最新状态
     * @throw internal_error 如果任务不存在
     */
    virtual build_task load(int task_id) = 0;

    /**
     * @brief 在行锁内读取任务并交给 mutator 修改
     * @param mutator 返回 true 时写回修改后的任务，返回 false 时放弃修改
     * @return 修改后的任务（放弃修改时为当前任务）
     */
    virtual build_task update(int task_id, const std::function<bool(build_task &)> &mutator) = 0;

    /**
     * @brief 在同一个事务内创建或更新镜像，并将任务标记为 done
     * 任务没有关联镜像时，创建名为 "New Image <随机串>" 的新镜像并关联到任务；
     * 否则只更新已有镜像的 tag，保留镜像的其他属性。
     * @return 是否成功，如果任务已经不能转换到 done（比如被取消），不做任何修改并返回 false
     */
    virtual bool finish(int task_id, const std::string &tag) = 0;

    virtual std::optional<sandbox_image> load_image(int image_id) = 0;
};

/**
 * @brief 在行锁内按状态机转换任务状态
 * @param extra 转换时同时对任务做的修改（比如记录错误信息）
 * @return 是否转换成功，状态机不允许的转换（比如已经被取消）不会写入
 */
bool transition(build_task_store &store, int task_id, build_status to,
                const std::function<void(build_task &)> &extra = {});

/**
 * @brief 用户取消构建任务
 * 已经结束的任务不受影响
 * @return 是否成功标记为 cancelled
 */
bool request_cancellation(build_task_store &store, int task_id);

/**
 * @brief 保存在内存中的构建任务存储
 * 用于测试和不需要数据库的本地构建
 */
struct memory_build_task_store : public build_task_store {
    /**
     * @brief 添加一个任务，任务编号由存储分配
     * @return 任务编号
     */
    int add(build_task task);

    int add_image(sandbox_image image);

    build_task load(int task_id) override;
    build_task update(int task_id, const std::function<bool(build_task &)> &mutator) override;
    bool finish(int task_id, const std::string &tag) override;
    std::optional<sandbox_image> load_image(int image_id) override;

    std::size_t image_count();

private:
    std::mutex mut;
    std::map<int, build_task> tasks;
    std::map<int, sandbox_image> images;
    int next_task_id = 1;
    int next_image_id = 1;
};

}  // namespace grader
