#include "judge/report.hpp"

#include <boost/lexical_cast.hpp>

#include "common/io_utils.hpp"

namespace grader::judge {
using namespace std;
using namespace nlohmann;

run_report make_error_report(const string &run_type, const string &error) {
    run_report report;
    report.run_type = run_type;
    report.error = error;
    return report;
}

void to_json(json &j, const test_case_result &result) {
    j = {{"test_input", utf8_sanitize(result.test_input)},
         {"expected_output", utf8_sanitize(result.expected_output)},
         {"actual_output", utf8_sanitize(result.actual_output)},
         {"correct", result.correct}};
}

void from_json(const json &j, test_case_result &result) {
    j.at("test_input").get_to(result.test_input);
    j.at("expected_output").get_to(result.expected_output);
    j.at("actual_output").get_to(result.actual_output);
    j.at("correct").get_to(result.correct);
}

void to_json(json &j, const run_report &report) {
    j = {{"run_type", report.run_type},
         {"total_tests", report.total_tests},
         {"correct", report.correct},
         {"incorrect", report.incorrect},
         {"output", nullptr},
         {"error", nullptr}};
    // 中止于第一个测试点之前的报告，output 为 null
    if (report.total_tests > 0 || !report.output.empty()) {
        json output = json::object();
        for (auto &[index, result] : report.output)
            output[to_string(index)] = result;
        j["output"] = output;
    }
    if (report.error) j["error"] = utf8_sanitize(*report.error);
    if (report.aborted_test) j["aborted_test"] = *report.aborted_test;
}

void from_json(const json &j, run_report &report) {
    j.at("run_type").get_to(report.run_type);
    j.at("total_tests").get_to(report.total_tests);
    j.at("correct").get_to(report.correct);
    j.at("incorrect").get_to(report.incorrect);
    report.output.clear();
    if (exists(j, "output")) {
        for (auto &[key, value] : j.at("output").items())
            report.output[boost::lexical_cast<int>(key)] = value.get<test_case_result>();
    }
    assign_optional(j, report.error, "error");
    assign_optional(j, report.aborted_test, "aborted_test");
}

void to_json(json &j, const design_report &report) {
    j = {{"is_design_problem", true},
         {"run_type", report.run_type},
         {"output", nullptr},
         {"error", nullptr}};
    if (report.output) j["output"] = utf8_sanitize(*report.output);
    if (report.error) j["error"] = utf8_sanitize(*report.error);
}

void from_json(const json &j, design_report &report) {
    report.run_type = get_value<string>(j, "run_type", "sample");
    assign_optional(j, report.output, "output");
    assign_optional(j, report.error, "error");
}

void to_json(json &j, const grade_report &report) {
    json output = json::object();
    if (report.is_design_problem && report.design) {
        output["sample"] = *report.design;
    } else if (report.sample) {
        output["sample"] = *report.sample;
    }
    if (report.staff) output["staff"] = *report.staff;
    j = {{"success", report.success},
         {"message", report.message},
         {"output", output}};
}

void from_json(const json &j, grade_report &report) {
    report.success = get_value<bool>(j, "success", true);
    report.message = get_value<string>(j, "message", "");
    report.is_design_problem = false;
    report.sample.reset();
    report.staff.reset();
    report.design.reset();
    if (!exists(j, "output")) return;

    auto &output = j.at("output");
    if (exists(output, "sample")) {
        auto &sample = output.at("sample");
        if (get_value<bool>(sample, "is_design_problem", false)) {
            report.is_design_problem = true;
            report.design = sample.get<design_report>();
        } else {
            report.sample = sample.get<run_report>();
        }
    }
    if (exists(output, "staff"))
        report.staff = output.at("staff").get<run_report>();
}

}  // namespace grader::judge
