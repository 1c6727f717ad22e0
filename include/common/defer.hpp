#pragma once

#include <utility>

template <typename F>
struct deferred_call {
    explicit deferred_call(F &&f) : f(std::forward<F>(f)) {}
    deferred_call(const deferred_call &) = delete;
    ~deferred_call() { f(); }

private:
    F f;
};

struct defer_helper {
    template <typename F>
    deferred_call<F> operator+(F &&f) {
        return deferred_call<F>(std::forward<F>(f));
    }
};

#define DEFER_CONCAT_IMPL(a, b) a##b
#define DEFER_CONCAT(a, b) DEFER_CONCAT_IMPL(a, b)

/**
 * @brief 作用域结束时执行代码块
 * defer { cleanup(); };
 */
#define defer auto DEFER_CONCAT(__defer_, __LINE__) = defer_helper() + [&]()
