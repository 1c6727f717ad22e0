#include <atomic>
#include <chrono>
#include <thread>

#include "gtest/gtest.h"
#include "jobs/task_queue.hpp"
#include "monitor/interrupt_monitor.hpp"
#include "monitor/monitor.hpp"

using namespace std;
using namespace grader;
using namespace grader::jobs;

namespace {

struct counting_monitor : public monitor {
    atomic<int> &crashed;
    explicit counting_monitor(atomic<int> &crashed) : crashed(crashed) {}

    void worker_state_changed(int, worker_state state, const string &) override {
        if (state == worker_state::CRASHED) ++crashed;
    }
};

}  // namespace

class TaskQueueTest : public ::testing::Test {
protected:
    void TearDown() override {
        clear_monitors();
    }
};

TEST_F(TaskQueueTest, RunsTasksInWorkers) {
    local_task_queue queue(2);
    atomic<int> sum{0};
    queue.register_task("add", [&](const nlohmann::json &args) { sum += args.at("n").get<int>(); });
    queue.start();

    vector<string> handles;
    for (int i = 1; i <= 10; ++i)
        handles.push_back(queue.enqueue("add", {{"n", i}}));
    queue.drain();

    EXPECT_EQ(sum, 55);
    for (auto &handle : handles)
        EXPECT_EQ(queue.state(handle), task_state::SUCCEEDED);
    queue.stop();
}

TEST_F(TaskQueueTest, FailedTask) {
    atomic<int> crashed{0};
    register_monitor(make_unique<counting_monitor>(crashed));

    local_task_queue queue(1);
    queue.register_task("fail", [](const nlohmann::json &) { throw runtime_error("boom"); });
    queue.start();
    string handle = queue.enqueue("fail", nlohmann::json::object());
    queue.drain();

    EXPECT_EQ(queue.state(handle), task_state::FAILED);
    EXPECT_TRUE(is_ready(queue.state(handle)));
    EXPECT_EQ(crashed, 1);
}

TEST_F(TaskQueueTest, UnregisteredTask) {
    local_task_queue queue(1);
    EXPECT_THROW(queue.enqueue("missing", nlohmann::json::object()), std::exception);
    EXPECT_EQ(queue.state("no-such-handle"), task_state::UNKNOWN);
}

TEST_F(TaskQueueTest, RevokePendingTask) {
    local_task_queue queue(1);
    atomic<int> runs{0};
    queue.register_task("count", [&](const nlohmann::json &) { ++runs; });

    // worker 未启动，任务保持 PENDING
    string handle = queue.enqueue("count", nlohmann::json::object());
    EXPECT_EQ(queue.state(handle), task_state::PENDING);
    EXPECT_FALSE(is_ready(task_state::PENDING));
    queue.revoke(handle);
    EXPECT_EQ(queue.state(handle), task_state::REVOKED);

    string other = queue.enqueue("count", nlohmann::json::object());
    queue.start();
    queue.drain();
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(queue.state(handle), task_state::REVOKED);
    EXPECT_EQ(queue.state(other), task_state::SUCCEEDED);
}

TEST_F(TaskQueueTest, RunningTaskCannotBeRevoked) {
    local_task_queue queue(1);
    atomic<bool> started{false}, release{false};
    queue.register_task("block", [&](const nlohmann::json &) {
        started = true;
        while (!release) this_thread::sleep_for(chrono::milliseconds(5));
    });
    queue.start();
    string handle = queue.enqueue("block", nlohmann::json::object());
    while (!started) this_thread::sleep_for(chrono::milliseconds(5));

    EXPECT_EQ(queue.state(handle), task_state::RUNNING);
    queue.revoke(handle);
    EXPECT_EQ(queue.state(handle), task_state::RUNNING);
    release = true;
    queue.drain();
    EXPECT_EQ(queue.state(handle), task_state::SUCCEEDED);
}

TEST_F(TaskQueueTest, ForgetsOldTasks) {
    local_task_queue queue(1, 2);
    queue.register_task("noop", [](const nlohmann::json &) {});
    queue.start();
    string first = queue.enqueue("noop", nlohmann::json::object());
    queue.drain();
    queue.enqueue("noop", nlohmann::json::object());
    queue.enqueue("noop", nlohmann::json::object());
    queue.drain();
    EXPECT_EQ(queue.state(first), task_state::UNKNOWN);
}

TEST_F(TaskQueueTest, StateNames) {
    EXPECT_EQ(to_string(task_state::PENDING), "PENDING");
    EXPECT_EQ(to_string(task_state::REVOKED), "REVOKED");
}

TEST_F(TaskQueueTest, InterruptMonitorTracksRunningJobs) {
    interrupt_monitor m;
    grading_job job;
    job.job_id = "job-1";
    job.context = "unit1";
    job.user = "alice";
    m.start_job(job);
    EXPECT_EQ(m.running_count(), 1u);
    m.interrupt_jobs();
    m.end_job(job, 1.5);
    EXPECT_EQ(m.running_count(), 0u);
}
