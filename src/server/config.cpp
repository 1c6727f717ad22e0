#include "server/config.hpp"

#include <fmt/core.h>

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace grader::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, amqp &mq) {
    j.at("uri").get_to(mq.uri);
    j.at("exchange").get_to(mq.exchange);
    j.at("queue").get_to(mq.queue);
    assign_optional(j, mq.exchange_type, "exchangeType");
    // 未配置 routing key 时按队列名投递
    mq.routing_key = get_value(j, "routingKey", mq.queue);
    assign_optional(j, mq.concurrency, "concurrency");
    if (mq.concurrency < 1)
        BOOST_THROW_EXCEPTION(config_error(fmt::format("Queue {} must allow at least 1 unacknowledged message", mq.queue)));
}

void from_json(const json &j, time_limit_config &limit) {
    assign_optional(j, limit.test_case, "testCase");
    assign_optional(j, limit.design, "design");
    assign_optional(j, limit.compile, "compile");
}

void from_json(const json &j, grading_config &config) {
    assign_optional(j, config.continue_after_error, "continueAfterError");
    assign_optional(j, config.disclose_private_results, "disclosePrivateResults");
    assign_optional(j, config.include_staff, "includeStaff");
    assign_optional(j, config.pending_grace_seconds, "pendingGraceSeconds");
}

void from_json(const json &j, callback_config &config) {
    j.at("url").get_to(config.url);
    assign_optional(j, config.timeout, "timeout");
}

void from_json(const json &j, grader_config &config) {
    assign_optional(j, config.sandbox, "sandbox");
    assign_optional(j, config.time_limit, "timeLimit");
    assign_optional(j, config.grading, "grading");
    if (exists(j, "executors")) config.executors = j.at("executors");
    assign_optional(j, config.replace_builtin_executors, "replaceBuiltinExecutors");
    assign_optional(j, config.submission_queue, "submissionQueue");
    assign_optional(j, config.report_queue, "reportQueue");
    assign_optional(j, config.callback, "callback");
}

grader_config load_config(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        BOOST_THROW_EXCEPTION(config_error(fmt::format("Configuration file {} does not exist", path.string())));
    try {
        return json::parse(read_file_content(path)).get<grader_config>();
    } catch (json::exception &e) {
        BOOST_THROW_EXCEPTION(config_error(fmt::format("Configuration file {} is malformed: {}", path.string(), e.what())));
    }
}

void apply_config(const grader_config &config) {
    TEST_CASE_TIME_LIMIT = config.time_limit.test_case;
    DESIGN_TIME_LIMIT = config.time_limit.design;
    COMPILE_TIME_LIMIT = config.time_limit.compile;
    PENDING_GRACE_SECONDS = config.grading.pending_grace_seconds;
    LOG_DEBUG << "Time limits: test case " << TEST_CASE_TIME_LIMIT << "s, design " << DESIGN_TIME_LIMIT
              << "s, compile " << COMPILE_TIME_LIMIT << "s";
}

}  // namespace grader::server
