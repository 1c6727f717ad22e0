#pragma once

#include "metrics.hpp"
#include "monitor/monitor.hpp"

namespace grader {

/**
 * @brief 通过 Prometheus 暴露评测系统的运行状态
 */
struct prometheus_monitor : public monitor {
    prometheus::Family<prometheus::Counter> &job_started, &job_ended, &job_superseded;
    prometheus::Family<prometheus::Gauge> &worker_status, &grading_time;
    prometheus_monitor(std::shared_ptr<prometheus::Registry> registry);

    void start_job(const jobs::grading_job &job) override;
    void end_job(const jobs::grading_job &job, double seconds) override;
    void supersede_job(const jobs::grading_job &job) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &info) override;
};

}  // namespace grader
