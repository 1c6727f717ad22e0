#include "monitor/prometheus.hpp"

namespace grader {
using namespace std;

prometheus_monitor::prometheus_monitor(std::shared_ptr<prometheus::Registry> registry) : job_started(prometheus::BuildCounter()
                                                                                                         .Name("code_grader_jobs_started")
                                                                                                         .Help("The number of grading jobs that has started")
                                                                                                         .Register(*registry)),
                                                                                         job_ended(prometheus::BuildCounter()
                                                                                                       .Name("code_grader_jobs_ended")
                                                                                                       .Help("The number of grading jobs that has finished")
                                                                                                       .Register(*registry)),
                                                                                         job_superseded(prometheus::BuildCounter()
                                                                                                            .Name("code_grader_jobs_superseded")
                                                                                                            .Help("The number of grading jobs superseded by a newer submission")
                                                                                                            .Register(*registry)),
                                                                                         worker_status(prometheus::BuildGauge()
                                                                                                           .Name("code_grader_workers_status")
                                                                                                           .Help("Show status of each worker (0:START   ; 1:RUNNING   ; 2:IDLE   ; 3:CRASHED   ; 4:STOPPED)")
                                                                                                           .Register(*registry)),
                                                                                         grading_time(prometheus::BuildGauge()
                                                                                                          .Name("code_grader_grading_time")
                                                                                                          .Help("The time used to grade the latest job of a problem (/ms)")
                                                                                                          .Register(*registry)) {}

void prometheus_monitor::start_job(const jobs::grading_job &job) {
    job_started.Add({{"staff", job.include_staff ? "true" : "false"}}).Increment();
}

void prometheus_monitor::end_job(const jobs::grading_job &job, double seconds) {
    job_ended.Add({{"status", jobs::to_string(job.status)}}).Increment();
    grading_time.Add({{"problem", job.problem_id}}).Set(seconds * 1000);
}

void prometheus_monitor::supersede_job(const jobs::grading_job &) {
    job_superseded.Add({}).Increment();
}

void prometheus_monitor::worker_state_changed(int worker_id, worker_state state, const std::string & /* info */) {
    worker_status.Add({{"worker_id", std::to_string(worker_id)}}).Set(static_cast<int>(state));
}

}  // namespace grader
