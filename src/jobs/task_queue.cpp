#include "jobs/task_queue.hpp"

#include <sys/prctl.h>
#include <unistd.h>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>

#include "common/exceptions.hpp"
#include "logging.hpp"
#include "monitor/monitor.hpp"

namespace grader::jobs {
using namespace std;

string to_string(task_state state) {
    switch (state) {
        case task_state::PENDING:
            return "PENDING";
        case task_state::RUNNING:
            return "RUNNING";
        case task_state::SUCCEEDED:
            return "SUCCEEDED";
        case task_state::FAILED:
            return "FAILED";
        case task_state::REVOKED:
            return "REVOKED";
        case task_state::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

bool is_ready(task_state state) {
    return state == task_state::SUCCEEDED || state == task_state::FAILED || state == task_state::REVOKED;
}

task_queue::~task_queue() {}

local_task_queue::local_task_queue(int workers, size_t max_history)
    : workers(workers), max_history(max_history) {}

local_task_queue::~local_task_queue() {
    stop();
}

void local_task_queue::register_task(const string &name, task_function function) {
    tasks[name] = function;
    LOG_INFO << "Register task " << name;
}

string local_task_queue::enqueue(const string &name, const nlohmann::json &args) {
    if (!tasks.count(name))
        BOOST_THROW_EXCEPTION(internal_error(fmt::format("task {} is not registered", name)));

    thread_local boost::uuids::random_generator generator;
    string handle = boost::uuids::to_string(generator());
    {
        scoped_lock guard(mut);
        states[handle] = task_state::PENDING;
    }
    queue.push({handle, name, args});
    LOG_DEBUG << "Enqueued task " << name << " with handle " << handle;
    return handle;
}

task_state local_task_queue::state(const string &handle) const {
    scoped_lock guard(mut);
    auto it = states.find(handle);
    return it == states.end() ? task_state::UNKNOWN : it->second;
}

void local_task_queue::revoke(const string &handle) {
    scoped_lock guard(mut);
    auto it = states.find(handle);
    if (it == states.end()) return;
    if (it->second == task_state::PENDING) {
        LOG_INFO << "Revoked task " << handle;
        it->second = task_state::REVOKED;
        finished.push_back(handle);
    } else if (it->second == task_state::RUNNING) {
        LOG_INFO << "Task " << handle << " is running and cannot be revoked";
    }
}

void local_task_queue::set_state(const string &handle, task_state state) {
    scoped_lock guard(mut);
    states[handle] = state;
    if (is_ready(state)) {
        finished.push_back(handle);
        while (finished.size() > max_history) {
            states.erase(finished.front());
            finished.pop_front();
        }
    }
}

void local_task_queue::start() {
    stopping = false;
    for (int i = 0; i < workers; ++i) {
        threads.emplace_back([this, i]() {
            string thread_name = "grade worker " + std::to_string(i);
            prctl(PR_SET_NAME, thread_name.c_str(), 0, 0, 0);
            worker_loop(i);
        });
    }
    LOG_INFO << "Started " << workers << " workers";
}

void local_task_queue::stop() {
    stopping = true;
    for (auto &th : threads)
        if (th.joinable()) th.join();
    threads.clear();
}

void local_task_queue::drain() {
    if (threads.empty())
        BOOST_THROW_EXCEPTION(internal_error("cannot drain a task queue without workers"));
    while (true) {
        if (queue.size() == 0) {
            scoped_lock guard(mut);
            bool running = false;
            for (auto &[handle, state] : states)
                if (state == task_state::RUNNING || state == task_state::PENDING) running = true;
            if (!running) return;
        }
        usleep(10 * 1000);  // 10ms
    }
}

void local_task_queue::worker_loop(int worker_id) {
    call_monitor([&](monitor &m) { m.worker_state_changed(worker_id, worker_state::START, ""); });

    pending_task task;
    while (!stopping) {
        if (!queue.try_pop(task)) {
            usleep(10 * 1000);  // 10ms
            continue;
        }

        {
            scoped_lock guard(mut);
            auto it = states.find(task.handle);
            if (it != states.end() && it->second == task_state::REVOKED) {
                LOG_DEBUG << "Skipping revoked task " << task.handle;
                continue;
            }
            states[task.handle] = task_state::RUNNING;
        }

        call_monitor([&](monitor &m) { m.worker_state_changed(worker_id, worker_state::RUNNING, task.name); });
        try {
            tasks.at(task.name)(task.args);
            set_state(task.handle, task_state::SUCCEEDED);
            call_monitor([&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });
        } catch (std::exception &e) {
            LOG_ERROR << "Task " << task.name << " " << task.handle << " failed: " << boost::diagnostic_information(e);
            set_state(task.handle, task_state::FAILED);
            call_monitor([&](monitor &m) { m.worker_state_changed(worker_id, worker_state::CRASHED, e.what()); });
        }
    }

    call_monitor([&](monitor &m) { m.worker_state_changed(worker_id, worker_state::STOPPED, ""); });
}

}  // namespace grader::jobs
