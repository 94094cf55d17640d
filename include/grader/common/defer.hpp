#pragma once

#include <functional>

#define GRADER_DEFER_1(x, y) x##y
#define GRADER_DEFER_2(x, y) GRADER_DEFER_1(x, y)
#define GRADER_DEFER_0(x) GRADER_DEFER_2(x, __COUNTER__)
#define defer auto GRADER_DEFER_0(_defered_option) = scoped_guard() + [&]

/**
 * @brief 作用域结束时执行回调
 * 配合 defer 宏使用，无论作用域是正常结束还是因为异常退出，回调都会被执行
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};
