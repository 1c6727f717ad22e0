#include "server/gateway.hpp"

#include <sys/prctl.h>

#include <boost/exception/diagnostic_information.hpp>

#include "common/net_utils.hpp"
#include "logging.hpp"

namespace grader::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, grading_request_message &message) {
    j.at("context").get_to(message.context);
    j.at("user").get_to(message.user);
    j.get_to(message.request);
}

jobs::submit_result handle_grading_request(jobs::job_orchestrator &orchestrator, const string &body, bool default_include_staff) {
    grading_request_message message;
    try {
        json j = json::parse(body);
        message = j.get<grading_request_message>();
        if (!exists(j, "include_staff")) message.request.include_staff = default_include_staff;
    } catch (json::exception &e) {
        LOG_WARN << "Malformed grading request: " << e.what();
        jobs::submit_result result;
        result.success = false;
        result.message = string("Malformed grading request: ") + e.what();
        return result;
    }

    auto &request = message.request;
    auto result = orchestrator.start_async_grading(message.context, message.user, request.language, request.version,
                                                   request.source, request.problem_id, request.include_staff);
    if (!result.success)
        LOG_INFO << "Grading request of " << message.context << "/" << message.user << " rejected: " << result.message;
    return result;
}

json make_report_message(const jobs::grading_job &job, const optional<judge::grade_report> &report, bool disclose_staff) {
    json message = {{"context", job.context},
                    {"user", job.user},
                    {"job_id", job.job_id},
                    {"status", jobs::to_string(job.status)},
                    {"report", nullptr}};
    if (report) {
        judge::grade_report copy = *report;
        if (copy.staff && !disclose_staff) {
            copy.staff->output.clear();
            copy.staff->error.reset();
            copy.staff->aborted_test.reset();
        }
        message["report"] = copy;
    }
    return message;
}

amqp_gateway::amqp_gateway(jobs::job_orchestrator &orchestrator,
                           const amqp &submission_queue,
                           const optional<amqp> &report_queue,
                           bool default_include_staff,
                           bool disclose_staff)
    : orchestrator(orchestrator),
      submission_queue(submission_queue),
      report_queue(report_queue),
      default_include_staff(default_include_staff),
      disclose_staff(disclose_staff) {}

amqp_gateway::~amqp_gateway() {
    stop();
}

void amqp_gateway::start() {
    if (report_queue) {
        report_channel = make_unique<rabbitmq_channel>(*report_queue, true);
        orchestrator.on_job_finished([this](const jobs::grading_job &job, const optional<judge::grade_report> &report) {
            report_channel->publish(make_report_message(job, report, disclose_staff).dump());
        });
    }

    stopping = false;
    fetch_thread = thread([this]() {
        prctl(PR_SET_NAME, "mq fetch loop", 0, 0, 0);
        fetch_loop();
    });
}

void amqp_gateway::stop() {
    stopping = true;
    if (fetch_thread.joinable()) fetch_thread.join();
}

void amqp_gateway::fetch_loop() {
    LOG_INFO << "Start fetching grading requests from queue " << submission_queue.queue;
    unique_ptr<rabbitmq_channel> channel;
    while (!stopping) {
        try {
            if (!channel) channel = make_unique<rabbitmq_channel>(submission_queue);

            rabbitmq_channel::envelope_type envelope;
            if (!channel->fetch(envelope, 100)) continue;

            // 请求线程只检查语言并放入任务队列，可以立即确认消息
            auto result = handle_grading_request(orchestrator, envelope.body(), default_include_staff);
            if (!result.success && result.message.rfind("Malformed", 0) == 0)
                envelope.reject(/* requeue */ false);
            else
                envelope.ack();
        } catch (std::exception &e) {
            LOG_ERROR << "Unable to fetch grading request: " << boost::diagnostic_information(e);
            channel.reset();
            this_thread::sleep_for(chrono::seconds(1));
        }
    }
    LOG_INFO << "Stopped fetching grading requests";
}

http_callback::http_callback(const callback_config &config, bool disclose_staff)
    : config(config), disclose_staff(disclose_staff) {}

void http_callback::operator()(const jobs::grading_job &job, const optional<judge::grade_report> &report) const {
    LOG_DEBUG << "Posting report of job " << job.job_id << " to " << config.url;
    net::post_json(config.url, make_report_message(job, report, disclose_staff), config.timeout);
}

}  // namespace grader::server
