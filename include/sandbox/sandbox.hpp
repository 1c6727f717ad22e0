#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "executor/registry.hpp"
#include "sandbox/environment.hpp"

namespace grader::sandbox {

/**
 * @brief 一次独立的代码执行请求
 */
struct execution_request {
    /**
     * @brief 执行器 id，格式为 {language}-{version}
     */
    std::string executor_id;

    /**
     * @brief 选手代码
     */
    std::string source;

    /**
     * @brief 输入数据文件，为空表示从 stdin 读入空数据
     */
    std::optional<std::filesystem::path> input_file;

    /**
     * @brief 墙上时间限制（单位为秒）
     */
    double time_limit = 5;

    /**
     * @brief 工作目录名，为空时自动生成
     */
    std::string token;
};

/**
 * @brief 代码执行结果
 * 以下三种情况只会出现一种：
 * 1. 程序正常结束，output 为标准输出
 * 2. 程序向 stderr 输出了内容，error 为 stderr
 * 3. 程序超时，timed_out 为 true，error 为 "Time limit exceeded"
 */
struct execution_outcome {
    std::string output;
    std::string error;
    bool timed_out = false;
};

/**
 * @brief 生成唯一的工作目录名 auto_generated_code_file_<uuid>
 */
std::string generate_token();

/**
 * @brief 一个提交的执行会话
 * 拥有独立的工作目录和隔离环境，析构时销毁
 * 同一个提交只编译一次，之后可以多次运行不同的测试数据
 *
 * 会话不是线程安全的，同一个会话的所有运行必须顺序进行
 */
struct sandbox_session {
    sandbox_session(const executor::code_executor &executor,
                    std::unique_ptr<sandbox_environment> &&environment,
                    const std::string &source,
                    const std::string &token);
    sandbox_session(const sandbox_session &) = delete;
    ~sandbox_session();

    const std::string &token() const;
    const std::filesystem::path &workdir() const;
    const executor::code_executor &executor() const;

    /**
     * @brief 写入源代码并编译
     * 只会编译一次，重复调用直接返回
     * @throw compilation_error 如果编译器输出了诊断信息、编译失败或编译超时
     */
    void prepare();

    /**
     * @brief 运行一次选手程序，返回运行阶段的结果
     * @param input_file 输入数据文件，为空时以 stdin 模式运行
     * @param time_limit 时间限制（单位为秒）
     * @return run_outcome 或 timeout_outcome
     */
    stage_outcome run(const std::optional<std::filesystem::path> &input_file, double time_limit);

    /**
     * @brief 运行一次选手程序并返回标准输出
     * @throw time_limit_exceeded 如果程序超时
     * @throw execution_error 如果程序向 stderr 输出了内容
     */
    std::string execute(const std::optional<std::filesystem::path> &input_file, double time_limit);

private:
    stage_outcome compile();

    const executor::code_executor &exe;
    std::unique_ptr<sandbox_environment> environment;
    std::string source;
    std::string name;
    std::filesystem::path dir;
    bool prepared = false;
};

/**
 * @brief 创建执行会话
 * 可以在多个 worker 之间共享
 */
struct sandbox_runner {
    sandbox_runner(const executor::executor_registry &registry, const sandbox_options &options);

    const executor::executor_registry &registry() const;

    /**
     * @brief 为一个提交创建执行会话
     * @param executor_id 执行器 id
     * @param source 选手代码
     * @param token 工作目录名，为空时自动生成
     * @throw unknown_executor 如果执行器不存在
     */
    std::unique_ptr<sandbox_session> open(const std::string &executor_id, const std::string &source, const std::string &token = "") const;

    /**
     * @brief 执行一次代码，创建的会话在返回前销毁
     * @throw compilation_error 如果编译失败
     */
    execution_outcome execute(const execution_request &request) const;

private:
    const executor::executor_registry &executors;
    sandbox_options options;
};

}  // namespace grader::sandbox
