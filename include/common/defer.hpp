#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在离开当前作用域时执行代码块，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     int fd = open(...);
 *     defer { close(fd); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = scoped_guard() + [&]

struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other);
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(std::function<void()> f) const;

    /**
     * @brief 放弃执行清理代码，比如资源的所有权已经被转移出去
     */
    void release();

private:
    std::function<void()> f;
};
