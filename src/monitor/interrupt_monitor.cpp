#include "monitor/interrupt_monitor.hpp"

#include <fmt/core.h>

#include "logging.hpp"

namespace grader {
using namespace std;

void interrupt_monitor::start_job(const jobs::grading_job &job) {
    scoped_lock guard(mut);
    running_jobs[job.job_id] = {job, chrono::steady_clock::now()};
}

void interrupt_monitor::end_job(const jobs::grading_job &job, double) {
    scoped_lock guard(mut);
    running_jobs.erase(job.job_id);
}

void interrupt_monitor::interrupt_jobs() {
    scoped_lock guard(mut);
    if (running_jobs.empty()) {
        LOG_WARN << "Interrupted with no job under grading";
        return;
    }
    auto now = chrono::steady_clock::now();
    LOG_ERROR << "Interrupted with " << running_jobs.size() << " jobs under grading, their reports will be lost";
    for (auto &[job_id, entry] : running_jobs) {
        auto &[job, started] = entry;
        double seconds = chrono::duration<double>(now - started).count();
        LOG_ERROR << fmt::format("{}/{} problem {} job {} has run for {:.1f}s", job.context, job.user, job.problem_id, job_id, seconds);
    }
}

size_t interrupt_monitor::running_count() {
    scoped_lock guard(mut);
    return running_jobs.size();
}

}  // namespace grader
