#pragma once

#include <functional>
#include <memory>
#include <string>

#include "jobs/grading_job.hpp"

namespace grader {

enum class worker_state {
    START = 0,    // worker 刚启动
    RUNNING = 1,  // worker 正在执行任务
    IDLE = 2,     // worker 空闲
    CRASHED = 3,  // worker 执行任务时出现了未处理的异常
    STOPPED = 4   // worker 已经退出
};

/**
 * @brief 监控评测系统的运行状态
 * 所有回调都可能在多个 worker 线程中并发调用
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 评测任务被 worker 领取
     */
    virtual void start_job(const jobs::grading_job &job);

    /**
     * @brief 评测任务结束
     * @param seconds 评测用时（单位为秒）
     */
    virtual void end_job(const jobs::grading_job &job, double seconds);

    /**
     * @brief 评测任务被新的评测请求取代
     */
    virtual void supersede_job(const jobs::grading_job &job);

    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &info);

    /**
     * @brief 收到中断信号，输出正在评测的任务
     */
    virtual void interrupt_jobs();
};

void register_monitor(std::unique_ptr<monitor> &&monitor);

/**
 * @brief 调用所有注册的监控器，监控器抛出的异常会被记录并忽略
 */
void call_monitor(std::function<void(monitor &)> callback);

/**
 * @brief 删除所有注册的监控器
 */
void clear_monitors();

}  // namespace grader
