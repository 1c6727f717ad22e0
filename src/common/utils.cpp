#include "common/utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <mutex>
#include <system_error>

#include "common/exceptions.hpp"
#include "common/scoped_fd.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace grader {
using namespace std;

process_builder &process_builder::directory(const filesystem::path &path) {
    this->epath = true;
    this->path = path;
    return *this;
}

process_builder &process_builder::environment(const string &key, const string &value) {
    env[key] = value;
    return *this;
}

process_builder &process_builder::input(const string &data) {
    stdin_data = data;
    return *this;
}

process_builder &process_builder::timeout(double seconds) {
    time_limit = seconds;
    return *this;
}

process_builder &process_builder::output_limit(long bytes) {
    max_output = bytes;
    return *this;
}

process_builder &process_builder::on_timeout(function<void()> callback) {
    timeout_callback = callback;
    return *this;
}

static void make_pipe(scoped_fd &read_end, scoped_fd &write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1)
        BOOST_THROW_EXCEPTION(system_error(errno, system_category(), "pipe2"));
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

/**
 * @brief 从 fd 中读取所有当前可读的数据，超出 limit 的部分读出后丢弃
 * @param truncated 丢弃过数据时置为 true
 * @return false 如果读到了 EOF
 */
static bool drain(int fd, string &buffer, long limit, bool &truncated) {
    char chunk[4096];
    while (true) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            size_t keep = n;
            if (limit >= 0) keep = (size_t)max<long>(0, min<long>(n, limit - (long)buffer.size()));
            buffer.append(chunk, keep);
            if (keep < (size_t)n) truncated = true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

process_result process_builder::exec_program(const vector<string> &args) {
    // 向已经退出的子进程写入 stdin 时会收到 SIGPIPE，我们需要忽略它
    static once_flag ignore_sigpipe;
    call_once(ignore_sigpipe, []() { signal(SIGPIPE, SIG_IGN); });

    if (args.empty())
        BOOST_THROW_EXCEPTION(invalid_argument("empty command line"));

    scoped_fd in_read, in_write, out_read, out_write, err_read, err_write;
    make_pipe(in_read, in_write);
    make_pipe(out_read, out_write);
    make_pipe(err_read, err_write);

    vector<const char *> argv;
    for (auto &arg : args) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            BOOST_THROW_EXCEPTION(system_error(errno, system_category(), "fork"));
        case 0:  // 子进程
            // 放到新的进程组中，以便超时时杀死选手程序创建的所有进程
            setpgid(0, 0);
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            signal(SIGPIPE, SIG_DFL);
            dup2(in_read.get(), STDIN_FILENO);
            dup2(out_write.get(), STDOUT_FILENO);
            dup2(err_write.get(), STDERR_FILENO);
            for (auto &[key, value] : env) {
                setenv(key.c_str(), value.c_str(), 1);
            }
            if (epath && chdir(path.c_str()) == -1) _exit(126);
            execvp(argv[0], (char **)argv.data());
            _exit(127);
        default:  // 父进程
            break;
    }

    setpgid(pid, pid);
    in_read.reset();
    out_write.reset();
    err_write.reset();
    set_nonblocking(in_write.get());
    set_nonblocking(out_read.get());
    set_nonblocking(err_read.get());

    process_result result;
    auto start = chrono::steady_clock::now();
    auto deadline = start + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(time_limit));
    size_t written = 0;
    bool out_open = true, err_open = true;
    if (stdin_data.empty()) in_write.reset();

    auto kill_group = [&]() {
        if (!result.timed_out) {
            LOG_DEBUG << "Watchdog fired, killing process group " << pid;
            result.timed_out = true;
            kill(-pid, SIGKILL);
            if (timeout_callback) timeout_callback();
        }
    };

    // 看门狗杀死进程组后，仍然可能有逃逸的进程持有管道，最多再等待 1 秒
    chrono::steady_clock::time_point drain_deadline;

    while (out_open || err_open) {
        auto now = chrono::steady_clock::now();
        if (time_limit > 0 && now >= deadline && !result.timed_out) {
            kill_group();
            drain_deadline = now + chrono::seconds(1);
        }
        if (result.timed_out && now >= drain_deadline) break;

        vector<pollfd> fds;
        if (in_write.is_open()) fds.push_back({in_write.get(), POLLOUT, 0});
        if (out_open) fds.push_back({out_read.get(), POLLIN, 0});
        if (err_open) fds.push_back({err_read.get(), POLLIN, 0});

        int wait_ms = 100;
        if (time_limit > 0 && !result.timed_out) {
            auto remain = chrono::duration_cast<chrono::milliseconds>(deadline - now).count();
            wait_ms = (int)max<long>(1, min<long>(wait_ms, remain));
        }
        int ret = poll(fds.data(), fds.size(), wait_ms);
        if (ret == -1) {
            if (errno == EINTR) continue;
            BOOST_THROW_EXCEPTION(system_error(errno, system_category(), "poll"));
        }

        for (auto &p : fds) {
            if (!p.revents) continue;
            if (p.fd == in_write.get()) {
                ssize_t n = write(in_write.get(), stdin_data.data() + written, stdin_data.size() - written);
                if (n > 0) written += n;
                if ((n < 0 && errno != EAGAIN && errno != EINTR) || written >= stdin_data.size())
                    in_write.reset();
            } else if (p.fd == out_read.get()) {
                out_open = drain(out_read.get(), result.output, max_output, result.output_truncated);
            } else if (p.fd == err_read.get()) {
                err_open = drain(err_read.get(), result.error, max_output, result.error_truncated);
            }
        }
    }
    in_write.reset();

    int status = 0;
    while (true) {
        int ret = waitpid(pid, &status, WNOHANG);
        if (ret == -1) {
            if (errno == EINTR) continue;
            BOOST_THROW_EXCEPTION(system_error(errno, system_category(), "waitpid"));
        }
        if (ret != 0) break;
        if (time_limit > 0 && chrono::steady_clock::now() >= deadline) kill_group();
        usleep(10 * 1000);  // 10ms
    }
    // 清理选手程序留在后台的进程
    kill(-pid, SIGKILL);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -1;
        result.signal = WTERMSIG(status);
    }
    LOG_DEBUG << "Process " << args[0] << " exited with code " << result.exit_code
              << " signal " << result.signal << " timed_out " << result.timed_out;
    if (result.output_truncated) result.output += TRUNCATED_MARK;
    if (result.error_truncated) result.error += TRUNCATED_MARK;
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace grader
