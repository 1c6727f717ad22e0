#pragma once

#include <filesystem>
#include <optional>

#include "common/json_utils.hpp"
#include "sandbox/environment.hpp"

namespace grader::server {

/**
 * @brief 评测请求队列或评测报告队列的连接配置
 * 对应配置文件中的 submissionQueue 和 reportQueue
 */
struct amqp {
    std::string uri;

    std::string exchange;

    /**
     * @brief direct, topic 或 fanout
     */
    std::string exchange_type = "direct";

    std::string queue;

    /**
     * @brief 默认与队列名相同
     */
    std::string routing_key;

    /**
     * @brief 评测请求队列一次最多预取多少条未确认的请求
     */
    int concurrency = 4;
};

void from_json(const nlohmann::json &j, amqp &mq);

/**
 * @brief 时间限制配置
 */
struct time_limit_config {
    /**
     * @brief 普通测试点的运行时间限制（单位为秒）
     */
    double test_case = 5;

    /**
     * @brief 设计题的运行时间限制（单位为秒）
     */
    double design = 15;

    /**
     * @brief 编译时间限制（单位为秒）
     */
    double compile = 30;
};

void from_json(const nlohmann::json &j, time_limit_config &limit);

/**
 * @brief 评测策略配置
 */
struct grading_config {
    /**
     * @brief 测试点运行错误或超时后是否继续评测
     */
    bool continue_after_error = false;

    /**
     * @brief 查询评测结果时是否展示 staff 测试数据的输出和错误信息
     */
    bool disclose_private_results = false;

    /**
     * @brief 异步评测是否评测 staff 测试数据
     */
    bool include_staff = true;

    /**
     * @brief 后台任务状态未知时，在多长时间内仍然认为评测正在进行（单位为秒）
     */
    long pending_grace_seconds = 600;
};

void from_json(const nlohmann::json &j, grading_config &config);

/**
 * @brief 评测结束后的 HTTP 回调
 */
struct callback_config {
    std::string url;

    /**
     * @brief 请求超时时间（单位为秒）
     */
    double timeout = 5;
};

void from_json(const nlohmann::json &j, callback_config &config);

/**
 * @brief 评测系统的配置文件
 */
struct grader_config {
    sandbox::sandbox_options sandbox;

    time_limit_config time_limit;

    grading_config grading;

    /**
     * @brief 额外的执行器定义
     */
    nlohmann::json executors = nlohmann::json::array();

    /**
     * @brief 是否使用配置文件中的执行器替换内置执行器
     */
    bool replace_builtin_executors = false;

    /**
     * @brief 接收评测请求的消息队列
     */
    std::optional<amqp> submission_queue;

    /**
     * @brief 发送评测报告的消息队列
     */
    std::optional<amqp> report_queue;

    std::optional<callback_config> callback;
};

void from_json(const nlohmann::json &j, grader_config &config);

/**
 * @brief 读取配置文件
 * @throw config_error 如果配置文件不存在或格式错误
 */
grader_config load_config(const std::filesystem::path &path);

/**
 * @brief 将配置中的时间限制等写入全局配置
 */
void apply_config(const grader_config &config);

}  // namespace grader::server
