#pragma once

#include <utility>

/**
 * @brief 离开作用域时执行 f，f 不应抛出异常
 * @code{.cpp}
 *     int fd = open(path, O_RDONLY);
 *     defer { close(fd); };
 * @endcode
 */
template <typename F>
struct scoped_guard {
    explicit scoped_guard(F f) : f(std::move(f)) {}
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;

    ~scoped_guard() {
        f();
    }

private:
    F f;
};

struct scoped_guard_maker {
    template <typename F>
    scoped_guard<F> operator+(F f) const {
        return scoped_guard<F>(std::move(f));
    }
};

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_deferred_guard) = scoped_guard_maker() + [&]()
