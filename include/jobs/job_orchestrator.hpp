#pragma once

#include <ctime>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "judge/grader.hpp"
#include "jobs/grading_job.hpp"
#include "jobs/task_queue.hpp"
#include "store/result_store.hpp"

namespace grader::jobs {

/**
 * @brief 发起评测的结果
 */
struct submit_result {
    bool success = false;
    std::string message;

    /**
     * @brief 新建的评测任务，发起失败时为空
     */
    std::optional<grading_job> job;
};

/**
 * @brief 查询评测状态的结果
 */
struct poll_result {
    /**
     * @brief running, failure, success 或 none（从未发起过评测）
     */
    std::string execution_state = "none";

    /**
     * @brief 最近一次的评测报告
     */
    std::optional<judge::grade_report> report;

    /**
     * @brief 是否展示 staff 测试数据的输出和错误信息
     */
    bool disclose_staff = false;
};

/**
 * @brief 序列化为 {"execution_state", "success", "message", "output": {"public", "private"}}
 * 不展示 staff 测试数据时，private 中只保留统计信息
 */
void to_json(nlohmann::json &j, const poll_result &result);

/**
 * @brief 管理异步评测任务的生命周期
 * queued -> running -> succeeded | failed
 * 请求线程只检查语言并将任务放入队列，评测在任务队列的 worker 中进行，
 * 两者之间只通过 job_store 和 result_store 共享数据
 */
struct job_orchestrator {
    using clock_type = std::function<time_t()>;
    using finish_listener = std::function<void(const grading_job &, const std::optional<judge::grade_report> &)>;

    /**
     * @brief 任务队列中的任务名
     */
    static const std::string GRADE_TASK;

    job_orchestrator(task_queue &queue,
                     job_store &jobs,
                     store::result_store &results,
                     const judge::code_grader &grader,
                     clock_type clock = default_clock);

    /**
     * @brief 向任务队列注册评测任务，必须在发起评测前调用
     */
    void register_tasks();

    /**
     * @brief 发起异步评测
     * 若 (context, user) 已有未结束的评测任务，该任务会被取代：
     * 尝试撤销其后台任务，若已经开始执行，则其评测结果会被丢弃
     */
    submit_result start_async_grading(const std::string &context,
                                      const std::string &user,
                                      const std::string &language,
                                      const std::string &version,
                                      const std::string &source,
                                      const std::string &problem_id,
                                      bool include_staff);

    /**
     * @brief 查询评测状态
     * @param disclose_staff 是否展示 staff 测试数据的输出和错误信息
     */
    poll_result poll(const std::string &context, const std::string &user, bool disclose_staff) const;

    /**
     * @brief 同步评测，只评测 sample 测试数据
     */
    judge::grade_report submit(const std::string &language,
                               const std::string &version,
                               const std::string &source,
                               const std::string &problem_id) const;

    /**
     * @brief 评测任务是否仍在进行
     * 后台任务未结束，或者后台任务状态未知但距离发起评测不超过宽限期
     */
    bool is_in_progress(const grading_job &job) const;

    /**
     * @brief 评测任务结束后调用，用于发送评测报告
     * 被取代的评测任务不会触发
     */
    void on_job_finished(finish_listener listener);

    /**
     * @brief worker 中执行的评测任务
     */
    void execute(const nlohmann::json &args);

    static time_t default_clock();

private:
    bool is_current(const grading_job &job) const;
    void notify(const grading_job &job, const std::optional<judge::grade_report> &report);

    task_queue &queue;
    job_store &jobs;
    store::result_store &results;
    const judge::code_grader &grader;
    clock_type clock;
    std::vector<finish_listener> listeners;

    /**
     * @brief 保护 job_store 中评测任务记录的读-改-写
     */
    mutable std::mutex mut;
};

}  // namespace grader::jobs
