#include "jobs/grading_job.hpp"

#include <fmt/core.h>

#include "common/exceptions.hpp"
#include "logging.hpp"

namespace grader::jobs {
using namespace std;
using namespace nlohmann;

string to_string(job_status status) {
    switch (status) {
        case job_status::QUEUED:
            return "queued";
        case job_status::RUNNING:
            return "running";
        case job_status::SUCCEEDED:
            return "succeeded";
        case job_status::FAILED:
            return "failed";
    }
    return "unknown";
}

job_status parse_job_status(const string &status) {
    if (status == "queued") return job_status::QUEUED;
    if (status == "running") return job_status::RUNNING;
    if (status == "succeeded") return job_status::SUCCEEDED;
    if (status == "failed") return job_status::FAILED;
    BOOST_THROW_EXCEPTION(grader_exception(fmt::format("unrecognized job status {}", status)));
}

bool grading_job::is_terminal() const {
    return status == job_status::SUCCEEDED || status == job_status::FAILED;
}

void to_json(json &j, const grading_job &job) {
    j = {{"context", job.context},
         {"user", job.user},
         {"job_id", job.job_id},
         {"task_handle", job.task_handle},
         {"status", to_string(job.status)},
         {"last_attempt", job.last_attempt},
         {"problem_id", job.problem_id},
         {"include_staff", job.include_staff}};
}

void from_json(const json &j, grading_job &job) {
    j.at("context").get_to(job.context);
    j.at("user").get_to(job.user);
    j.at("job_id").get_to(job.job_id);
    job.task_handle = get_value<string>(j, "task_handle", "");
    job.status = parse_job_status(j.at("status").get<string>());
    j.at("last_attempt").get_to(job.last_attempt);
    job.problem_id = get_value<string>(j, "problem_id", "");
    job.include_staff = get_value<bool>(j, "include_staff", false);
}

job_store::job_store(store::blob_store &blobs) : blobs(blobs) {}

string job_store::key_of(const string &context, const string &user) {
    return store::make_key("jobs", context, user);
}

void job_store::put(const grading_job &job) {
    json j = job;
    blobs.persist(key_of(job.context, job.user), j.dump());
}

optional<grading_job> job_store::get(const string &context, const string &user) const {
    auto data = blobs.read(key_of(context, user));
    if (!data) return nullopt;
    try {
        return json::parse(*data).get<grading_job>();
    } catch (std::exception &e) {
        LOG_ERROR << "Stored job of " << context << "/" << user << " is malformed: " << e.what();
        return nullopt;
    }
}

}  // namespace grader::jobs
