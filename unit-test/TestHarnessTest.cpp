#include "env.hpp"
#include "gtest/gtest.h"
#include "judge/test_harness.hpp"

using namespace std;
using namespace grader;
using namespace grader::judge;

// 读入一个整数并输出它的两倍，输入 err 时运行错误，输入 slow 时超时
static const string DOUBLE_IT = R"(read n < "$1"
if [ "$n" = "err" ]; then echo "bad input" >&2; exit 1; fi
if [ "$n" = "slow" ]; then sleep 10; fi
echo $((n * 2))
)";

class TestHarnessTest : public ::testing::Test {
protected:
    TestHarnessTest()
        : dir("harness"),
          registry(test::make_test_registry()),
          runner(*registry, test::local_sandbox()),
          provider(dir.data_dir()) {
        options.time_limit = 1;
        options.design_time_limit = 2;
        options.continue_after_error = false;
    }

    run_report run(const string &problem, const string &run_type, const string &source = DOUBLE_IT) {
        test_harness harness(provider, options);
        auto session = runner.open("shell-posix", source);
        return harness.run(problem, run_type, *session);
    }

    test::scoped_test_dir dir;
    unique_ptr<executor::executor_registry> registry;
    sandbox::sandbox_runner runner;
    directory_test_case_provider provider;
    harness_options options;
};

TEST_F(TestHarnessTest, AllCorrect) {
    dir.add_case("Double", "sample", 1, "1\n", "2\n");
    dir.add_case("Double", "sample", 2, "5\n", "10");
    auto report = run("Double", "sample");
    EXPECT_EQ(report.run_type, "sample");
    EXPECT_EQ(report.total_tests, 2);
    EXPECT_EQ(report.correct, 2);
    EXPECT_EQ(report.incorrect, 0);
    EXPECT_FALSE(report.error);
    ASSERT_EQ(report.output.size(), 2u);
    EXPECT_EQ(report.output[1].test_input, "1\n");
    EXPECT_EQ(report.output[1].expected_output, "2");
    EXPECT_EQ(report.output[1].actual_output, "2");
    EXPECT_TRUE(report.output[2].correct);
}

TEST_F(TestHarnessTest, WrongAnswerDoesNotAbort) {
    dir.add_case("Double", "sample", 1, "1\n", "3\n");
    dir.add_case("Double", "sample", 2, "2\n", "4\n");
    auto report = run("Double", "sample");
    EXPECT_EQ(report.total_tests, 2);
    EXPECT_EQ(report.correct, 1);
    EXPECT_EQ(report.incorrect, 1);
    EXPECT_FALSE(report.error);
    EXPECT_FALSE(report.output[1].correct);
    EXPECT_EQ(report.output[1].actual_output, "2");
    EXPECT_EQ(report.output[1].expected_output, "3");
}

TEST_F(TestHarnessTest, RuntimeErrorAbortsRun) {
    dir.add_case("Double", "staff", 1, "1\n", "2\n");
    dir.add_case("Double", "staff", 2, "err\n", "0\n");
    dir.add_case("Double", "staff", 3, "3\n", "6\n");
    auto report = run("Double", "staff");
    EXPECT_EQ(report.total_tests, 3);
    EXPECT_EQ(report.correct, 1);
    EXPECT_EQ(report.incorrect, 0);
    ASSERT_TRUE(report.error);
    EXPECT_EQ(*report.error, "bad input\n");
    ASSERT_TRUE(report.aborted_test);
    EXPECT_EQ(*report.aborted_test, 2);
    EXPECT_EQ(report.output.size(), 1u);
    EXPECT_EQ(report.output.count(3), 0u);
}

TEST_F(TestHarnessTest, TimeLimitAbortsRun) {
    dir.add_case("Double", "sample", 1, "slow\n", "0\n");
    dir.add_case("Double", "sample", 2, "1\n", "2\n");
    auto report = run("Double", "sample");
    EXPECT_EQ(report.total_tests, 2);
    EXPECT_EQ(report.correct + report.incorrect, 0);
    ASSERT_TRUE(report.error);
    EXPECT_EQ(*report.error, "Time limit exceeded");
    ASSERT_TRUE(report.aborted_test);
    EXPECT_EQ(*report.aborted_test, 1);
    EXPECT_TRUE(report.output.empty());

    nlohmann::json j = report;
    EXPECT_EQ(j["aborted_test"], 1);
    EXPECT_EQ(*j.get<run_report>().aborted_test, 1);
}

TEST_F(TestHarnessTest, ContinueAfterError) {
    options.continue_after_error = true;
    dir.add_case("Double", "sample", 1, "err\n", "0\n");
    dir.add_case("Double", "sample", 2, "2\n", "4\n");
    auto report = run("Double", "sample");
    EXPECT_EQ(report.total_tests, 2);
    EXPECT_EQ(report.correct, 1);
    EXPECT_EQ(report.incorrect, 1);
    EXPECT_FALSE(report.error);
    EXPECT_FALSE(report.output[1].correct);
    EXPECT_EQ(report.output[1].actual_output, "bad input\n");
    EXPECT_EQ(report.output[1].expected_output, "0");
    EXPECT_FALSE(report.aborted_test);
}

TEST_F(TestHarnessTest, NoTestCases) {
    auto report = run("Missing", "sample");
    EXPECT_EQ(report.total_tests, 0);
    EXPECT_EQ(report.correct, 0);
    EXPECT_FALSE(report.error);

    nlohmann::json j = report;
    EXPECT_TRUE(j["output"].is_null());
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_FALSE(j.contains("aborted_test"));
}

TEST_F(TestHarnessTest, TestCasesSortedNumerically) {
    dir.add_case("Order", "sample", 10, "10\n", "20\n");
    dir.add_case("Order", "sample", 2, "2\n", "4\n");
    dir.add_case("Order", "sample", 1, "1\n", "2\n");
    filesystem::create_directories(dir.data_dir() / "Order" / "sample" / "README");

    auto cases = provider.glob("Order", "sample");
    ASSERT_EQ(cases.size(), 3u);
    EXPECT_EQ(cases[0].index, 1);
    EXPECT_EQ(cases[1].index, 2);
    EXPECT_EQ(cases[2].index, 10);
    EXPECT_EQ(cases[2].input_file, dir.data_dir() / "Order" / "sample" / "10" / "input.in");

    auto report = run("Order", "sample");
    EXPECT_EQ(report.total_tests, 3);
    EXPECT_EQ(report.correct, 3);
}

TEST_F(TestHarnessTest, DesignProblem) {
    test_harness harness(provider, options);
    auto session = runner.open("shell-posix", "echo 'Account opened'");
    auto report = harness.run_design(*session);
    EXPECT_EQ(report.run_type, "sample");
    ASSERT_TRUE(report.output);
    EXPECT_EQ(*report.output, "Account opened\n");
    EXPECT_FALSE(report.error);

    nlohmann::json j = report;
    EXPECT_TRUE(j["is_design_problem"].get<bool>());
}

TEST_F(TestHarnessTest, DesignProblemError) {
    test_harness harness(provider, options);
    auto session = runner.open("shell-posix", "echo 'NullPointerException' >&2");
    auto report = harness.run_design(*session);
    EXPECT_FALSE(report.output);
    ASSERT_TRUE(report.error);
    EXPECT_EQ(*report.error, "NullPointerException\n");
}

TEST_F(TestHarnessTest, RepeatedRunsGiveIdenticalResults) {
    dir.add_case("Double", "sample", 1, "1\n", "2\n");
    dir.add_case("Double", "sample", 2, "3\n", "7\n");
    dir.add_case("Double", "sample", 3, "4\n", "8\n");
    test_harness harness(provider, options);
    string source = "#!/bin/sh\n" + DOUBLE_IT;

    auto session = runner.open("fakecc-1.0", source);
    auto first = harness.run("Double", "sample", *session);
    EXPECT_EQ(first.correct, 2);
    EXPECT_EQ(first.incorrect, 1);
    EXPECT_FALSE(first.error);

    // 删除源文件后重新编译会失败，第二次运行只能复用已经编译好的程序
    filesystem::remove(session->workdir() / (session->token() + ".src"));
    auto second = harness.run("Double", "sample", *session);
    EXPECT_FALSE(second.error);
    EXPECT_EQ(nlohmann::json(first), nlohmann::json(second));

    auto other = runner.open("fakecc-1.0", source);
    auto third = harness.run("Double", "sample", *other);
    EXPECT_EQ(nlohmann::json(first), nlohmann::json(third));
}
