#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/concurrent_queue.hpp"
#include "common/json_utils.hpp"

namespace grader::jobs {

enum class task_state {
    PENDING,    // 排队中
    RUNNING,    // 正在执行
    SUCCEEDED,  // 执行成功
    FAILED,     // 执行时抛出了异常
    REVOKED,    // 开始执行前被撤销
    UNKNOWN     // 任务队列不知道这个任务，可能已经被清理或者任务队列重启过
};

std::string to_string(task_state state);

/**
 * @brief 任务是否已经结束
 */
bool is_ready(task_state state);

/**
 * @brief 后台任务队列
 * 请求线程只负责将任务放入队列，耗时的评测在后台执行
 */
struct task_queue {
    using task_function = std::function<void(const nlohmann::json &)>;

    virtual ~task_queue();

    /**
     * @brief 注册任务类型，必须在 enqueue 之前调用
     */
    virtual void register_task(const std::string &name, task_function function) = 0;

    /**
     * @brief 将任务放入队列
     * @return 任务句柄
     */
    virtual std::string enqueue(const std::string &name, const nlohmann::json &args) = 0;

    virtual task_state state(const std::string &handle) const = 0;

    /**
     * @brief 尽力撤销任务，已经开始执行的任务无法撤销
     */
    virtual void revoke(const std::string &handle) = 0;
};

/**
 * @brief 在本进程的 worker 线程中执行任务
 * 每个 worker 同时只执行一个任务
 */
struct local_task_queue : public task_queue {
    /**
     * @param workers worker 线程数
     * @param max_history 最多记住多少个已结束任务的状态，超出后最早结束的任务状态变为 UNKNOWN
     */
    explicit local_task_queue(int workers, size_t max_history = 10000);
    ~local_task_queue();

    void register_task(const std::string &name, task_function function) override;
    std::string enqueue(const std::string &name, const nlohmann::json &args) override;
    task_state state(const std::string &handle) const override;
    void revoke(const std::string &handle) override;

    /**
     * @brief 启动 worker 线程
     */
    void start();

    /**
     * @brief 通知 worker 停止，不再领取新任务，并等待正在执行的任务结束
     * 队列中尚未执行的任务会保持 PENDING 状态
     */
    void stop();

    /**
     * @brief 等待队列中所有任务执行完毕，用于测试
     * @throw internal_error 若 worker 未启动
     */
    void drain();

private:
    struct pending_task {
        std::string handle;
        std::string name;
        nlohmann::json args;
    };

    void worker_loop(int worker_id);
    void set_state(const std::string &handle, task_state state);

    int workers;
    size_t max_history;
    std::map<std::string, task_function> tasks;
    concurrent_queue<pending_task> queue;

    mutable std::mutex mut;
    std::map<std::string, task_state> states;
    std::deque<std::string> finished;

    std::vector<std::thread> threads;
    std::atomic<bool> stopping{false};
};

}  // namespace grader::jobs
