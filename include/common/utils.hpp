#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 外部程序的执行结果
 */
struct process_result {
    /**
     * @brief 程序的退出码，若程序被信号杀死则为 -1
     */
    int exit_code = 0;

    /**
     * @brief 杀死程序的信号，程序正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 程序向 stdout 输出的内容
     */
    std::string output;

    /**
     * @brief 程序向 stderr 输出的内容
     */
    std::string error;

    /**
     * @brief 程序是否因为超过时间限制被看门狗杀死
     */
    bool timed_out = false;

    /**
     * @brief 输出超过 output_limit 而被截断，截断后的内容末尾追加 TRUNCATED_MARK
     */
    bool output_truncated = false;
    bool error_truncated = false;
};

/**
 * @brief 启动外部程序
 * 子进程会被放入单独的进程组，看门狗超时时会杀死整个进程组，
 * 避免选手程序 fork 出的子进程逃逸
 *
 * 使用方法：
 * auto result = process_builder().directory(dir).timeout(5).run("sh", "-c", "echo 1");
 */
struct process_builder {
    process_builder &directory(const std::filesystem::path &path);
    process_builder &environment(const std::string &key, const std::string &value);

    /**
     * @brief 喂给子进程 stdin 的数据
     */
    process_builder &input(const std::string &data);

    /**
     * @brief 墙上时间限制（单位为秒），小于等于 0 表示不限制
     */
    process_builder &timeout(double seconds);

    /**
     * @brief 读取 stdout、stderr 的最大字节数，超出部分会被丢弃
     */
    process_builder &output_limit(long bytes);

    /**
     * @brief 看门狗超时后调用，用于清理进程组以外的资源（比如 docker 容器）
     */
    process_builder &on_timeout(std::function<void()> callback);

    template <typename... Args>
    process_result run(Args... args) {
        std::vector<std::string> argv = {args...};
        return exec_program(argv);
    }

    process_result exec_program(const std::vector<std::string> &argv);

private:
    bool epath = false;
    std::filesystem::path path;
    std::map<std::string, std::string> env;
    std::string stdin_data;
    double time_limit = 0;
    long max_output = -1;
    std::function<void()> timeout_callback;
};

std::string get_env(const std::string &key, const std::string &def_value = "");
void set_env(const std::string &key, const std::string &value, bool replace = true);

struct elapsed_time {
    elapsed_time();

    template <typename Duration>
    Duration duration() const {
        return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
