#pragma once

#include <ctime>
#include <optional>
#include <string>

#include "common/json_utils.hpp"
#include "store/blob_store.hpp"

namespace grader::jobs {

enum class job_status {
    QUEUED,     // 已经进入任务队列，等待 worker 领取
    RUNNING,    // worker 正在评测
    SUCCEEDED,  // 评测完成，评测报告已经写入
    FAILED      // 评测过程中出现了无法转换为评测报告的错误
};

std::string to_string(job_status status);
job_status parse_job_status(const std::string &status);

/**
 * @brief 一次评测尝试
 * 每个 (context, user) 最多只有一个未结束的评测任务，
 * 新的评测请求会取代之前未结束的评测任务
 */
struct grading_job {
    /**
     * @brief 提交所在的上下文，比如课程中的某个题目
     */
    std::string context;

    std::string user;

    /**
     * @brief 本次评测尝试的唯一标识
     * worker 写入评测报告前会检查该标识，被取代的评测任务不会写入评测报告
     */
    std::string job_id;

    /**
     * @brief 任务队列返回的任务句柄
     */
    std::string task_handle;

    job_status status = job_status::QUEUED;

    /**
     * @brief 最近一次发起评测的时间
     */
    time_t last_attempt = 0;

    std::string problem_id;

    bool include_staff = false;

    bool is_terminal() const;
};

void to_json(nlohmann::json &j, const grading_job &job);
void from_json(const nlohmann::json &j, grading_job &job);

/**
 * @brief 以 (context, user) 为键保存评测任务
 */
struct job_store {
    explicit job_store(store::blob_store &blobs);

    void put(const grading_job &job);
    std::optional<grading_job> get(const std::string &context, const std::string &user) const;

    static std::string key_of(const std::string &context, const std::string &user);

private:
    store::blob_store &blobs;
};

}  // namespace grader::jobs
