#pragma once

#include <functional>

#define SOLBUILD_DEFER_1(x, y) x##y
#define SOLBUILD_DEFER_2(x, y) SOLBUILD_DEFER_1(x, y)
#define SOLBUILD_DEFER_0(x) SOLBUILD_DEFER_2(x, __COUNTER__)

/**
 * @brief 在离开当前作用域时执行代码块，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     int fd = open(path, O_RDONLY);
 *     defer { close(fd); };
 * @endcode
 */
#define defer auto SOLBUILD_DEFER_0(_deferred_action) = ::solbuild::scoped_guard() + [&]

namespace solbuild {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    ~scoped_guard();

    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace solbuild
