#include "jobs/job_orchestrator.hpp"

#include <boost/exception/diagnostic_information.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>

#include "common/defer.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "monitor/monitor.hpp"

namespace grader::jobs {
using namespace std;
using namespace nlohmann;

const string job_orchestrator::GRADE_TASK = "grade";

void to_json(json &j, const poll_result &result) {
    json output = {{"public", nullptr}, {"private", nullptr}};
    if (result.report) {
        json report = *result.report;
        auto &report_output = report.at("output");
        if (exists(report_output, "sample")) {
            json sample = report_output.at("sample");
            sample.erase("run_type");
            output["public"] = sample;
        }
        if (exists(report_output, "staff")) {
            json staff = report_output.at("staff");
            staff.erase("run_type");
            if (!result.disclose_staff) {
                staff.erase("output");
                staff.erase("error");
                staff.erase("aborted_test");
            }
            output["private"] = staff;
        }
    }
    j = {{"execution_state", result.execution_state},
         {"success", result.report ? result.report->success : false},
         {"message", result.report ? result.report->message : ""},
         {"output", output}};
}

time_t job_orchestrator::default_clock() {
    return chrono::system_clock::to_time_t(chrono::system_clock::now());
}

job_orchestrator::job_orchestrator(task_queue &queue,
                                   job_store &jobs,
                                   store::result_store &results,
                                   const judge::code_grader &grader,
                                   clock_type clock)
    : queue(queue), jobs(jobs), results(results), grader(grader), clock(clock) {}

void job_orchestrator::register_tasks() {
    queue.register_task(GRADE_TASK, [this](const json &args) { execute(args); });
}

void job_orchestrator::on_job_finished(finish_listener listener) {
    listeners.push_back(listener);
}

submit_result job_orchestrator::start_async_grading(const string &context,
                                                    const string &user,
                                                    const string &language,
                                                    const string &version,
                                                    const string &source,
                                                    const string &problem_id,
                                                    bool include_staff) {
    submit_result result;
    string invalid = grader.validate(language, version);
    if (!invalid.empty()) {
        result.success = false;
        result.message = invalid;
        return result;
    }

    thread_local boost::uuids::random_generator generator;
    grading_job job;
    job.context = context;
    job.user = user;
    job.job_id = boost::uuids::to_string(generator());
    job.status = job_status::QUEUED;
    job.last_attempt = clock();
    job.problem_id = problem_id;
    job.include_staff = include_staff;

    {
        scoped_lock guard(mut);
        auto previous = jobs.get(context, user);
        if (previous && !previous->is_terminal()) {
            LOG_INFO << "Superseding job " << previous->job_id << " of " << context << "/" << user;
            if (!previous->task_handle.empty()) {
                try {
                    queue.revoke(previous->task_handle);
                } catch (std::exception &e) {
                    LOG_WARN << "Unable to revoke task " << previous->task_handle << ": " << e.what();
                }
            }
            call_monitor([&](monitor &m) { m.supersede_job(*previous); });
        }

        // 先保存评测任务，worker 领取任务时需要检查 job_id
        jobs.put(job);
        results.clear(context, user);
    }

    judge::grade_request request{problem_id, language, version, source, include_staff};
    json args = {{"context", context},
                 {"user", user},
                 {"job_id", job.job_id},
                 {"request", request}};

    string handle;
    try {
        handle = queue.enqueue(GRADE_TASK, args);
    } catch (std::exception &e) {
        LOG_ERROR << "Unable to enqueue job " << job.job_id << ": " << boost::diagnostic_information(e);
        scoped_lock guard(mut);
        job.status = job_status::FAILED;
        jobs.put(job);
        result.success = false;
        result.message = "Unable to start execution task.";
        return result;
    }

    {
        // worker 可能已经修改了评测任务的状态，因此重新读取
        scoped_lock guard(mut);
        auto current = jobs.get(context, user);
        if (current && current->job_id == job.job_id) {
            current->task_handle = handle;
            jobs.put(*current);
            job = *current;
        } else {
            job.task_handle = handle;
        }
    }

    LOG_INFO << "Started job " << job.job_id << " of " << context << "/" << user << " with task " << handle;
    result.success = true;
    result.message = "Execution task started.";
    result.job = job;
    return result;
}

bool job_orchestrator::is_current(const grading_job &job) const {
    auto current = jobs.get(job.context, job.user);
    return current && current->job_id == job.job_id;
}

void job_orchestrator::execute(const json &args) {
    string context = args.at("context").get<string>();
    string user = args.at("user").get<string>();
    string job_id = args.at("job_id").get<string>();
    auto request = args.at("request").get<judge::grade_request>();

    LOG_BEGIN(context + "/" + user);
    defer { LOG_END(); };

    grading_job job;
    {
        scoped_lock guard(mut);
        auto current = jobs.get(context, user);
        if (!current || current->job_id != job_id) {
            LOG_INFO << "Job " << job_id << " has been superseded, skipping";
            return;
        }
        current->status = job_status::RUNNING;
        jobs.put(*current);
        job = *current;
    }

    call_monitor([&](monitor &m) { m.start_job(job); });
    elapsed_time timer;

    optional<judge::grade_report> report;
    exception_ptr failure;
    try {
        report = grader.grade(request);
    } catch (std::exception &e) {
        LOG_ERROR << "Job " << job_id << " failed: " << boost::diagnostic_information(e);
        failure = current_exception();
    }

    {
        scoped_lock guard(mut);
        auto current = jobs.get(context, user);
        if (!current || current->job_id != job_id) {
            LOG_INFO << "Job " << job_id << " has been superseded, discarding its result";
            return;
        }
        if (report) {
            results.put(context, user, *report);
            current->status = job_status::SUCCEEDED;
        } else {
            current->status = job_status::FAILED;
        }
        jobs.put(*current);
        job = *current;
    }

    double seconds = timer.duration<chrono::milliseconds>().count() / 1000.0;
    LOG_INFO << "Job " << job_id << " finished with status " << to_string(job.status) << " in " << seconds << "s";
    call_monitor([&](monitor &m) { m.end_job(job, seconds); });
    notify(job, report);

    if (failure) rethrow_exception(failure);
}

void job_orchestrator::notify(const grading_job &job, const optional<judge::grade_report> &report) {
    for (auto &listener : listeners) {
        try {
            listener(job, report);
        } catch (std::exception &e) {
            LOG_ERROR << "Unable to report job " << job.job_id << ": " << e.what();
        }
    }
}

bool job_orchestrator::is_in_progress(const grading_job &job) const {
    task_state state = job.task_handle.empty() ? task_state::UNKNOWN : queue.state(job.task_handle);
    if (state == task_state::RUNNING) return true;
    if (state == task_state::PENDING || state == task_state::UNKNOWN) {
        // 任务队列已经忘记了这个任务，以保存的状态为准
        if (state == task_state::UNKNOWN && job.is_terminal()) return false;
        return clock() - job.last_attempt < PENDING_GRACE_SECONDS;
    }
    return false;
}

poll_result job_orchestrator::poll(const string &context, const string &user, bool disclose_staff) const {
    poll_result result;
    result.disclose_staff = disclose_staff;

    auto job = jobs.get(context, user);
    result.report = results.get(context, user);
    if (!job) {
        result.execution_state = "none";
    } else if (is_in_progress(*job)) {
        result.execution_state = "running";
    } else if (job->status == job_status::SUCCEEDED) {
        result.execution_state = "success";
    } else {
        result.execution_state = "failure";
    }

    if (result.report && result.report->staff && !disclose_staff) {
        result.report->staff->output.clear();
        result.report->staff->error.reset();
        result.report->staff->aborted_test.reset();
    }
    return result;
}

judge::grade_report job_orchestrator::submit(const string &language,
                                             const string &version,
                                             const string &source,
                                             const string &problem_id) const {
    return grader.grade(problem_id, language, version, source, false);
}

}  // namespace grader::jobs
