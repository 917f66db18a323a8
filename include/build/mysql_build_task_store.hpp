#pragma once

#include <ormpp/dbng.hpp>
#include <ormpp/mysql.hpp>
#include "build/build_task_store.hpp"
#include "server/config.hpp"

namespace grader {

/**
 * @brief 保存在 MySQL 数据库中的构建任务存储
 * 表结构见 script/schema.sql。
 * 每次 update 和 finish 都在一个事务内通过 SELECT ... FOR UPDATE 锁住任务行，
 * 因此和其他进程（比如处理取消请求的网页后端）的并发修改是安全的。
 * MySQL 的错误统一转换为 database_error。
 */
struct mysql_build_task_store : public build_task_store {
    explicit mysql_build_task_store(const server::database &dbcfg);

    build_task load(int task_id) override;
    build_task update(int task_id, const std::function<bool(build_task &)> &mutator) override;
    bool finish(int task_id, const std::string &tag) override;
    std::optional<sandbox_image> load_image(int image_id) override;

private:
    void connect();
    void commit();
    build_task select_task(int task_id, bool for_update);
    void save_task(const build_task &task);

    /**
     * @brief 在事务中执行 func，func 抛出异常时回滚
     */
    template <typename Func>
    auto transaction(Func &&func) -> decltype(func());

    server::database dbcfg;
    ormpp::dbng<ormpp::mysql> db;
    std::mutex mut;
};

}  // namespace grader
