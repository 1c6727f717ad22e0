#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "jobs/job_orchestrator.hpp"
#include "server/config.hpp"
#include "server/rabbitmq.hpp"

/**
 * 这个头文件包含评测系统与外部系统的接口
 * 1. 从消息队列接收评测请求
 * 2. 评测结束后通过消息队列或 HTTP 回调发送评测报告
 */
namespace grader::server {

/**
 * @brief 消息队列中的评测请求
 * {"context", "user", "language", "version", "submission", "problem_id", "include_staff"}
 */
struct grading_request_message {
    std::string context;
    std::string user;
    judge::grade_request request;
};

void from_json(const nlohmann::json &j, grading_request_message &message);

/**
 * @brief 处理一条评测请求消息
 * @param orchestrator 异步评测管理
 * @param body 消息内容
 * @param default_include_staff 消息中未指定 include_staff 时是否评测 staff 测试数据
 * @return 发起评测的结果，消息格式错误时 success 为 false
 */
jobs::submit_result handle_grading_request(jobs::job_orchestrator &orchestrator, const std::string &body, bool default_include_staff);

/**
 * @brief 生成评测结束的报告消息
 * {"context", "user", "job_id", "status", "report"}
 * @param disclose_staff 为 false 时 staff 测试数据只保留统计信息
 */
nlohmann::json make_report_message(const jobs::grading_job &job, const std::optional<judge::grade_report> &report, bool disclose_staff);

/**
 * @brief 从 AMQP 消息队列接收评测请求，并将评测报告发送到另一个队列
 */
struct amqp_gateway {
    amqp_gateway(jobs::job_orchestrator &orchestrator,
                 const amqp &submission_queue,
                 const std::optional<amqp> &report_queue,
                 bool default_include_staff,
                 bool disclose_staff);
    ~amqp_gateway();

    /**
     * @brief 启动接收评测请求的线程，并注册评测结束的回调
     */
    void start();

    void stop();

private:
    void fetch_loop();

    jobs::job_orchestrator &orchestrator;
    amqp submission_queue;
    std::optional<amqp> report_queue;
    bool default_include_staff;
    bool disclose_staff;
    std::unique_ptr<rabbitmq_channel> report_channel;
    std::atomic<bool> stopping{false};
    std::thread fetch_thread;
};

/**
 * @brief 评测结束后将评测报告 POST 到指定地址
 */
struct http_callback {
    http_callback(const callback_config &config, bool disclose_staff);

    void operator()(const jobs::grading_job &job, const std::optional<judge::grade_report> &report) const;

private:
    callback_config config;
    bool disclose_staff;
};

}  // namespace grader::server
