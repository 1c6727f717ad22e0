#include "monitor/monitor.hpp"

#include <mutex>
#include <vector>

#include "logging.hpp"

namespace grader {
using namespace std;

monitor::~monitor() {}

void monitor::start_job(const jobs::grading_job &) {}

void monitor::end_job(const jobs::grading_job &, double) {}

void monitor::supersede_job(const jobs::grading_job &) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::interrupt_jobs() {}

static mutex monitors_mutex;
static vector<unique_ptr<monitor>> monitors;

void register_monitor(unique_ptr<monitor> &&monitor) {
    scoped_lock guard(monitors_mutex);
    monitors.push_back(move(monitor));
    LOG_INFO << "Register monitor.";
}

void call_monitor(function<void(monitor &)> callback) {
    scoped_lock guard(monitors_mutex);
    for (auto &monitor : monitors) {
        try {
            callback(*monitor);
        } catch (std::exception &ex) {
            LOG_ERROR << "Monitor has crashed when reporting monitoring information, " << ex.what();
        }
    }
}

void clear_monitors() {
    scoped_lock guard(monitors_mutex);
    monitors.clear();
}

}  // namespace grader
