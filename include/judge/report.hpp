#pragma once

#include <map>
#include <optional>
#include <string>

#include "common/json_utils.hpp"

/**
 * 这个头文件包含评测报告
 * 包含：
 * 1. test_case_result 类（一个测试点的评测结果）
 * 2. run_report 类（一组测试数据 sample 或 staff 的评测结果）
 * 3. design_report 类（设计题的运行结果）
 * 4. grade_report 类（一个提交的完整评测报告）
 */
namespace grader::judge {

/**
 * @brief 一个测试点的评测结果
 */
struct test_case_result {
    /**
     * @brief 测试点的输入数据
     */
    std::string test_input;

    /**
     * @brief 去除末尾空白后的标准输出
     */
    std::string expected_output;

    /**
     * @brief 去除末尾空白后的选手程序输出
     */
    std::string actual_output;

    bool correct = false;
};

/**
 * @brief 一组测试数据的评测结果
 * 满足 correct + incorrect <= total_tests，评测中止时 error 不为空
 */
struct run_report {
    /**
     * @brief sample 或 staff
     */
    std::string run_type;

    int total_tests = 0;
    int correct = 0;
    int incorrect = 0;

    /**
     * @brief 测试点编号到评测结果的映射，按编号升序
     */
    std::map<int, test_case_result> output;

    /**
     * @brief 导致评测中止的错误信息
     */
    std::optional<std::string> error;

    /**
     * @brief 导致评测中止的测试点编号，编译错误等与测试点无关的错误为空
     */
    std::optional<int> aborted_test;
};

/**
 * @brief 设计题没有测试数据，只运行一次选手程序并返回输出
 */
struct design_report {
    std::string run_type = "sample";
    std::optional<std::string> output;
    std::optional<std::string> error;
};

/**
 * @brief 一个提交的评测报告
 */
struct grade_report {
    /**
     * @brief 评测是否正常完成
     * 选手程序编译错误、运行错误也属于正常完成，只有不支持的语言等请求错误为 false
     */
    bool success = true;

    /**
     * @brief 附加信息
     */
    std::string message;

    bool is_design_problem = false;

    /**
     * @brief sample 测试数据的评测结果，设计题为空
     */
    std::optional<run_report> sample;

    /**
     * @brief staff 测试数据的评测结果，只有要求评测 staff 数据时才有
     */
    std::optional<run_report> staff;

    /**
     * @brief 设计题的运行结果
     */
    std::optional<design_report> design;
};

/**
 * @brief 生成评测中止时的报告，total_tests 为 0
 */
run_report make_error_report(const std::string &run_type, const std::string &error);

void to_json(nlohmann::json &j, const test_case_result &result);
void from_json(const nlohmann::json &j, test_case_result &result);
void to_json(nlohmann::json &j, const run_report &report);
void from_json(const nlohmann::json &j, run_report &report);
void to_json(nlohmann::json &j, const design_report &report);
void from_json(const nlohmann::json &j, design_report &report);

/**
 * @brief 序列化为 {"success": ..., "message": ..., "output": {"sample": ..., "staff": ...}}
 * 设计题的 output.sample 为 design_report
 */
void to_json(nlohmann::json &j, const grade_report &report);
void from_json(const nlohmann::json &j, grade_report &report);

}  // namespace grader::judge
