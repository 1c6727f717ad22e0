#include <chrono>

#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "env.hpp"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"

using namespace std;
using namespace grader;
using namespace grader::sandbox;

class SandboxTest : public ::testing::Test {
protected:
    SandboxTest() : dir("sandbox"), registry(test::make_test_registry()), runner(*registry, test::local_sandbox()) {}

    execution_request request(const string &executor_id, const string &source, double time_limit = 5) {
        execution_request req;
        req.executor_id = executor_id;
        req.source = source;
        req.time_limit = time_limit;
        return req;
    }

    test::scoped_test_dir dir;
    unique_ptr<executor::executor_registry> registry;
    sandbox_runner runner;
};

TEST_F(SandboxTest, TokenFormat) {
    string a = generate_token(), b = generate_token();
    EXPECT_EQ(a.rfind("auto_generated_code_file_", 0), 0u);
    EXPECT_EQ(a.size(), string("auto_generated_code_file_").size() + 32);
    EXPECT_EQ(a.find('-'), string::npos);
    EXPECT_NE(a, b);
}

TEST_F(SandboxTest, RunScript) {
    auto outcome = runner.execute(request("shell-posix", "echo hello"));
    EXPECT_EQ(outcome.output, "hello\n");
    EXPECT_EQ(outcome.error, "");
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_TRUE(dir.run_dir_empty());
}

TEST_F(SandboxTest, RunWithInputFile) {
    auto input = dir.root / "input.in";
    write_file_content(input, "1 2\n");
    auto req = request("shell-posix", "read a b < \"$1\"; echo $((a + b))");
    req.input_file = input;
    auto outcome = runner.execute(req);
    EXPECT_EQ(outcome.output, "3\n");
}

TEST_F(SandboxTest, StderrIsReported) {
    auto outcome = runner.execute(request("shell-posix", "echo partial; echo boom >&2"));
    EXPECT_EQ(outcome.output, "partial\n");
    EXPECT_EQ(outcome.error, "boom\n");
    EXPECT_FALSE(outcome.timed_out);
}

TEST_F(SandboxTest, TimeLimitKillsProcessGroup) {
    elapsed_time timer;
    auto outcome = runner.execute(request("shell-posix", "sleep 30 & sleep 30", 1));
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(outcome.error, "Time limit exceeded");
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
    EXPECT_TRUE(dir.run_dir_empty());
}

TEST_F(SandboxTest, CompiledExecutor) {
    auto outcome = runner.execute(request("fakecc-1.0", "#!/bin/sh\necho compiled"));
    EXPECT_EQ(outcome.output, "compiled\n");
}

TEST_F(SandboxTest, CompilationError) {
    try {
        runner.execute(request("fakecc-1.0", "#!/bin/sh\n#error\necho never"));
        FAIL() << "compilation should fail";
    } catch (compilation_error &e) {
        EXPECT_STREQ(e.what(), "Compilation error");
        EXPECT_NE(e.error_log.find("error: syntax error"), string::npos);
    }
    EXPECT_TRUE(dir.run_dir_empty());
}

TEST_F(SandboxTest, UnknownExecutor) {
    EXPECT_THROW(runner.execute(request("cobol-85", "DISPLAY 'HELLO'.")), unknown_executor);
}

TEST_F(SandboxTest, SessionCompilesOnceAndRunsManyTimes) {
    auto session = runner.open("fakecc-1.0", "#!/bin/sh\ncat \"$1\"", "fixed_token");
    EXPECT_EQ(session->token(), "fixed_token");
    EXPECT_EQ(session->workdir(), dir.root / "run" / "fixed_token");
    session->prepare();
    EXPECT_TRUE(filesystem::exists(session->workdir() / "fixed_token.out"));

    // 删除源文件后仍然可以运行，说明不会重新编译
    filesystem::remove(session->workdir() / "fixed_token.src");
    session->prepare();

    for (int i = 0; i < 3; ++i) {
        auto input = dir.root / ("input" + to_string(i));
        write_file_content(input, to_string(i));
        EXPECT_EQ(session->execute(input, 5), to_string(i));
    }

    session.reset();
    EXPECT_TRUE(dir.run_dir_empty());
}

TEST_F(SandboxTest, SessionExecuteThrows) {
    auto session = runner.open("shell-posix", "if [ -n \"$1\" ]; then sleep 10; fi; echo err >&2");
    EXPECT_THROW(session->execute(nullopt, 5), execution_error);

    auto input = dir.root / "input.in";
    write_file_content(input, "");
    try {
        session->execute(input, 0.5);
        FAIL() << "should time out";
    } catch (time_limit_exceeded &e) {
        EXPECT_STREQ(e.what(), "Time limit exceeded");
    }
}

TEST_F(SandboxTest, StageOutcomes) {
    auto session = runner.open("shell-posix", "exit 3");
    auto outcome = session->run(nullopt, 5);
    ASSERT_TRUE(holds_alternative<run_outcome>(outcome));
    EXPECT_EQ(get<run_outcome>(outcome).exit_code, 3);
}

TEST_F(SandboxTest, PythonHelloWorld) {
    if (!filesystem::exists("/usr/bin/python3")) GTEST_SKIP() << "python3 is not installed";

    auto builtin = executor::make_builtin_registry();
    sandbox_runner python_runner(*builtin, test::local_sandbox());
    auto outcome = python_runner.execute(request("python-3.12", "print(1+1)"));
    EXPECT_EQ(outcome.output, "2\n");
    EXPECT_EQ(outcome.error, "");
}

TEST_F(SandboxTest, SandboxOptionsFromJson) {
    auto options = nlohmann::json::parse(R"({"type": "docker", "memory": "256m", "pidsLimit": 32})").get<sandbox_options>();
    EXPECT_EQ(options.type, "docker");
    EXPECT_EQ(options.memory, "256m");
    EXPECT_EQ(options.pids_limit, 32);
    EXPECT_EQ(options.network, "none");

    EXPECT_THROW(nlohmann::json::parse(R"({"type": "vm"})").get<sandbox_options>(), config_error);
}

TEST_F(SandboxTest, DefaultOutputLimitIsBounded) {
    EXPECT_EQ(MAX_IO_SIZE, 64 * 1024 * 1024);
}

TEST_F(SandboxTest, FloodingOutputIsCapped) {
    auto result = process_builder().timeout(1).output_limit(4096).run("/bin/sh", "-c", "yes xxxxxxxxxxxxxxxx");
    EXPECT_TRUE(result.timed_out);
    EXPECT_TRUE(result.output_truncated);
    EXPECT_FALSE(result.error_truncated);
    EXPECT_EQ(result.output.size(), 4096 + TRUNCATED_MARK.size());
    EXPECT_EQ(result.output.substr(4096), TRUNCATED_MARK);
}

TEST_F(SandboxTest, SubmissionOutputIsCappedByMaxIoSize) {
    long saved = MAX_IO_SIZE;
    MAX_IO_SIZE = 100;
    defer { MAX_IO_SIZE = saved; };

    auto outcome = runner.execute(request("shell-posix", "head -c 5000 /dev/zero | tr '\\0' a"));
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.error, "");
    EXPECT_EQ(outcome.output, string(100, 'a') + TRUNCATED_MARK);

    auto small = runner.execute(request("shell-posix", "echo ok"));
    EXPECT_EQ(small.output, "ok\n");
}
