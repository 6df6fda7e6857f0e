#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = runner::scoped_guard() + [&]

namespace runner {

/**
 * @brief 作用域结束时执行回调，用于保证清理代码在所有退出路径上都会执行
 * 配合 defer 宏使用：
 * @code{.cpp}
 *     defer { workspace.release(); };
 * @endcode
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;

private:
    std::function<void()> f;
};

}  // namespace runner
