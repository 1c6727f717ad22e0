#pragma once

#include <deque>
#include <mutex>

namespace grader {

/**
 * @brief 线程安全的队列
 * worker 通过 try_pop 轮询任务
 */
template <typename T>
struct concurrent_queue {
    void push(const T &value) {
        std::scoped_lock guard(mut);
        data.push_back(value);
    }

    void push(T &&value) {
        std::scoped_lock guard(mut);
        data.push_back(std::move(value));
    }

    bool try_pop(T &value) {
        std::scoped_lock guard(mut);
        if (data.empty()) return false;
        value = std::move(data.front());
        data.pop_front();
        return true;
    }

    size_t size() const {
        std::scoped_lock guard(mut);
        return data.size();
    }

private:
    mutable std::mutex mut;
    std::deque<T> data;
};

}  // namespace grader
