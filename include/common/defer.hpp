#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = runbox::scoped_guard() + [&]

namespace runbox {

/**
 * @brief 作用域守卫，离开作用域时执行回调
 * 用于保证释放并发槽位、安排工作区删除等收尾动作在任何退出路径上都会执行，
 * 包括抛出异常的情况。回调本身不应当抛出异常。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace runbox
