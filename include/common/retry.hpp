#pragma once

#include <glog/logging.h>
#include <chrono>
#include <thread>
#include "common/exceptions.hpp"

namespace grader {

/**
 * @brief 执行 func，遇到 database_error 时以指数退避的方式重试
 * 其他异常直接向上抛出，不会重试
 * @param func 要执行的操作，可能被执行多次，因此必须是可以重复执行的（比如一个完整的事务）
 * @param max_attempts 最多执行的次数
 * @param interval 第一次重试前的等待时间，之后每次翻倍
 * @return func 的返回值
 */
template <typename Func>
auto retry_on_transient(Func &&func, int max_attempts = 5,
                        std::chrono::milliseconds interval = std::chrono::milliseconds(100)) -> decltype(func()) {
    for (int fail = 0;; ++fail) {
        try {
            return func();
        } catch (database_error &ex) {
            if (fail + 1 >= max_attempts) throw;
            LOG(WARNING) << "Transient database error, retrying (" << fail + 1 << "/" << max_attempts << "): " << ex.what();
            std::this_thread::sleep_for(interval * (1 << fail));
        }
    }
}

}  // namespace grader
