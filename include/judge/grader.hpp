#pragma once

#include <functional>
#include <string>

#include "judge/report.hpp"
#include "judge/test_harness.hpp"
#include "sandbox/sandbox.hpp"

namespace grader::judge {

/**
 * @brief 一个评测请求
 */
struct grade_request {
    std::string problem_id;

    /**
     * @brief 提交的语言，支持别名，不区分大小写
     */
    std::string language;

    /**
     * @brief 语言版本，为空时使用该语言的默认版本
     */
    std::string version;

    /**
     * @brief 选手代码
     */
    std::string source;

    /**
     * @brief 是否评测隐藏的 staff 测试数据
     */
    bool include_staff = false;
};

void from_json(const nlohmann::json &j, grade_request &request);
void to_json(nlohmann::json &j, const grade_request &request);

/**
 * @brief 评测一个提交
 * 检查语言，创建执行会话并编译一次，然后依次评测 sample 和 staff 测试数据
 * 所有异常都会被转换为评测报告中的错误信息，不会抛出
 */
struct code_grader {
    using design_predicate = std::function<bool(const std::string &)>;

    code_grader(const sandbox::sandbox_runner &runner,
                const test_case_provider &provider,
                const harness_options &options,
                design_predicate is_design = is_design_problem);

    grade_report grade(const std::string &problem_id,
                       const std::string &language,
                       const std::string &version,
                       const std::string &source,
                       bool include_staff) const;

    grade_report grade(const grade_request &request) const;

    /**
     * @brief 检查语言和版本是否被支持
     * @return 错误信息，支持时返回空字符串
     */
    std::string validate(const std::string &language, const std::string &version) const;

private:
    const sandbox::sandbox_runner &runner;
    test_harness harness;
    design_predicate is_design;
};

}  // namespace grader::judge
