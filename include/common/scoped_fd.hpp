#pragma once

#include <unistd.h>

#include <utility>

namespace grader {

/**
 * @brief 自动关闭的文件描述符，用于连接子进程的管道
 */
class scoped_fd {
public:
    scoped_fd() = default;
    explicit scoped_fd(int fd) : fd(fd) {}
    scoped_fd(scoped_fd &&other) : fd(std::exchange(other.fd, -1)) {}
    scoped_fd(const scoped_fd &) = delete;
    scoped_fd &operator=(const scoped_fd &) = delete;

    scoped_fd &operator=(scoped_fd &&other) {
        reset(std::exchange(other.fd, -1));
        return *this;
    }

    ~scoped_fd() {
        reset();
    }

    /**
     * @brief 关闭当前持有的文件描述符，并改为持有 value
     */
    void reset(int value = -1) {
        if (fd == value) return;
        if (fd >= 0) close(fd);
        fd = value;
    }

    int get() const { return fd; }
    bool is_open() const { return fd >= 0; }

private:
    int fd = -1;
};

}  // namespace grader
