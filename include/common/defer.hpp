#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = grader::scoped_guard() + [&]

namespace grader {

/**
 * @brief 在作用域结束时执行清理函数
 * 配合 defer 宏使用，也可以直接构造来获得可撤销的清理动作
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 取消清理动作，析构时不再调用 f
     */
    void dismiss();
};

}  // namespace grader
