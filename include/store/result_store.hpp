#pragma once

#include <optional>
#include <string>

#include "judge/report.hpp"
#include "store/blob_store.hpp"

namespace grader::store {

/**
 * @brief 以 (context, user) 为键保存评测报告
 * context 一般为题目所在的课程单元
 */
struct result_store {
    explicit result_store(blob_store &blobs);

    void put(const std::string &context, const std::string &user, const judge::grade_report &report);

    /**
     * @return 评测报告，不存在时返回 std::nullopt
     */
    std::optional<judge::grade_report> get(const std::string &context, const std::string &user) const;

    /**
     * @brief 清除之前的评测报告，新的评测开始时调用
     */
    void clear(const std::string &context, const std::string &user);

    static std::string key_of(const std::string &context, const std::string &user);

private:
    blob_store &blobs;
};

}  // namespace grader::store
