#pragma once

#include <chrono>
#include <map>
#include <mutex>

#include "monitor/monitor.hpp"

namespace grader {

/**
 * @brief 记录正在评测的任务，收到中断信号时输出，便于排查被中断的评测
 */
struct interrupt_monitor : public monitor {
    void start_job(const jobs::grading_job &job) override;

    void end_job(const jobs::grading_job &job, double seconds) override;

    void interrupt_jobs() override;

    /**
     * @brief 正在评测的任务数
     */
    size_t running_count();

private:
    std::mutex mut;

    std::map<std::string, std::pair<jobs::grading_job, std::chrono::steady_clock::time_point>> running_jobs;
};

}  // namespace grader
