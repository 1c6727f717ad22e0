#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "env.hpp"
#include "gtest/gtest.h"
#include "judge/test_harness.hpp"
#include "server/config.hpp"

using namespace std;
using namespace grader;
using namespace grader::server;

class ConfigTest : public ::testing::Test {
protected:
    ConfigTest() : dir("config") {}

    void TearDown() override {
        apply_config(grader_config());
    }

    test::scoped_test_dir dir;
};

TEST_F(ConfigTest, Defaults) {
    auto config = nlohmann::json::object().get<grader_config>();
    EXPECT_EQ(config.sandbox.type, "docker");
    EXPECT_EQ(config.time_limit.test_case, 5);
    EXPECT_EQ(config.time_limit.design, 15);
    EXPECT_EQ(config.time_limit.compile, 30);
    EXPECT_FALSE(config.grading.continue_after_error);
    EXPECT_FALSE(config.grading.disclose_private_results);
    EXPECT_TRUE(config.grading.include_staff);
    EXPECT_TRUE(config.executors.empty());
    EXPECT_FALSE(config.submission_queue);
    EXPECT_FALSE(config.report_queue);
    EXPECT_FALSE(config.callback);
}

TEST_F(ConfigTest, ExampleConfig) {
    auto config = load_config("config/grader.example.json");
    EXPECT_EQ(config.sandbox.memory, "512m");
    EXPECT_EQ(config.sandbox.pids_limit, 64);
    ASSERT_TRUE(config.submission_queue);
    EXPECT_EQ(config.submission_queue->queue, "CodeSubmission");
    EXPECT_EQ(config.submission_queue->concurrency, 4);
    ASSERT_TRUE(config.report_queue);
    EXPECT_EQ(config.report_queue->concurrency, 4);
    ASSERT_TRUE(config.callback);
    EXPECT_EQ(config.callback->timeout, 5);
    EXPECT_EQ(config.executors.size(), 1u);

    auto registry = executor::make_builtin_registry();
    registry->load(config.executors, config.replace_builtin_executors);
    EXPECT_EQ(registry->resolve("python", "3.11").definition().image, "python:3.11-slim");
    EXPECT_EQ(registry->resolve("python", "").id(), "python-3.12");
}

TEST_F(ConfigTest, ApplyTimeLimits) {
    write_file_content(dir.root / "grader.json", R"({
        "timeLimit": {"testCase": 2.5, "compile": 60},
        "grading": {"pendingGraceSeconds": 30}
    })");
    auto config = load_config(dir.root / "grader.json");
    apply_config(config);
    EXPECT_EQ(TEST_CASE_TIME_LIMIT, 2.5);
    EXPECT_EQ(DESIGN_TIME_LIMIT, 15);
    EXPECT_EQ(COMPILE_TIME_LIMIT, 60);
    EXPECT_EQ(PENDING_GRACE_SECONDS, 30);

    auto options = judge::default_harness_options();
    EXPECT_EQ(options.time_limit, 2.5);
}

TEST_F(ConfigTest, MissingFile) {
    EXPECT_THROW(load_config(dir.root / "missing.json"), config_error);
}

TEST_F(ConfigTest, MalformedFile) {
    write_file_content(dir.root / "broken.json", "{\"timeLimit\": ");
    EXPECT_THROW(load_config(dir.root / "broken.json"), config_error);

    write_file_content(dir.root / "queue.json", R"({"submissionQueue": {"uri": "amqp://localhost"}})");
    EXPECT_THROW(load_config(dir.root / "queue.json"), config_error);
}

TEST_F(ConfigTest, QueueDefaults) {
    auto mq = nlohmann::json{{"uri", "amqp://localhost"}, {"exchange", "CodeSubmission"}, {"queue", "CodeSubmission"}}.get<amqp>();
    EXPECT_EQ(mq.exchange_type, "direct");
    EXPECT_EQ(mq.routing_key, "CodeSubmission");
    EXPECT_EQ(mq.concurrency, 4);

    nlohmann::json j = {{"uri", "amqp://localhost"}, {"exchange", "e"}, {"queue", "q"}, {"routingKey", "r"}, {"concurrency", 0}};
    EXPECT_THROW(j.get<amqp>(), config_error);
    j["concurrency"] = 2;
    EXPECT_EQ(j.get<amqp>().routing_key, "r");
}
