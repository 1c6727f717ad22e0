#include "judge/grader.hpp"

#include <boost/exception/diagnostic_information.hpp>

#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "logging.hpp"

namespace grader::judge {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, grade_request &request) {
    j.at("problem_id").get_to(request.problem_id);
    j.at("language").get_to(request.language);
    request.version = get_value<string>(j, "version", "");
    j.at("submission").get_to(request.source);
    request.include_staff = get_value<bool>(j, "include_staff", false);
}

void to_json(json &j, const grade_request &request) {
    j = {{"problem_id", request.problem_id},
         {"language", request.language},
         {"version", request.version},
         {"submission", request.source},
         {"include_staff", request.include_staff}};
}

code_grader::code_grader(const sandbox::sandbox_runner &runner,
                         const test_case_provider &provider,
                         const harness_options &options,
                         design_predicate is_design)
    : runner(runner), harness(provider, options), is_design(is_design) {}

string code_grader::validate(const string &language, const string &version) const {
    try {
        runner.registry().resolve(language, version);
        return "";
    } catch (unsupported_language &e) {
        return e.what();
    } catch (unknown_executor &e) {
        return e.what();
    }
}

grade_report code_grader::grade(const grade_request &request) const {
    return grade(request.problem_id, request.language, request.version, request.source, request.include_staff);
}

/**
 * @brief 编译失败或者其他异常导致所有测试数据都无法评测
 */
static void fail_all(grade_report &report, bool include_staff, const string &error) {
    if (report.is_design_problem) {
        report.design = design_report();
        report.design->error = error;
        return;
    }
    report.sample = make_error_report("sample", error);
    if (include_staff)
        report.staff = make_error_report("staff", error);
}

grade_report code_grader::grade(const string &problem_id,
                                const string &language,
                                const string &version,
                                const string &source,
                                bool include_staff) const {
    grade_report report;

    // 不支持的语言在分配任何资源之前就返回
    string invalid = validate(language, version);
    if (!invalid.empty()) {
        LOG_INFO << "Rejecting submission of problem " << problem_id << ": " << invalid;
        report.success = false;
        report.message = invalid;
        report.sample = make_error_report("sample", invalid);
        return report;
    }

    auto &executor = runner.registry().resolve(language, version);
    report.is_design_problem = is_design(problem_id);

    try {
        auto session = runner.open(executor.id(), source);
        LOG_BEGIN(session->token());
        defer { LOG_END(); };
        LOG_INFO << "Grading problem " << problem_id << " with executor " << executor.id()
                 << (report.is_design_problem ? " (design problem)" : "");

        try {
            session->prepare();
        } catch (compilation_error &e) {
            LOG_INFO << "Compilation failed";
            fail_all(report, include_staff, describe_error(e));
            return report;
        }

        if (report.is_design_problem) {
            report.design = harness.run_design(*session);
            return report;
        }

        // sample 和 staff 测试数据依次评测，共用同一个编译结果
        report.sample = harness.run(problem_id, "sample", *session);
        if (include_staff) {
            try {
                report.staff = harness.run(problem_id, "staff", *session);
            } catch (std::exception &e) {
                LOG_ERROR << "Unable to grade staff test cases: " << boost::diagnostic_information(e);
                report.staff = make_error_report("staff", describe_error(e));
            }
        }
    } catch (std::exception &e) {
        LOG_ERROR << "Unable to grade problem " << problem_id << ": " << boost::diagnostic_information(e);
        string error = describe_error(e);
        if (report.sample && !report.is_design_problem) {
            if (include_staff) report.staff = make_error_report("staff", error);
        } else {
            fail_all(report, include_staff, error);
        }
    }
    return report;
}

}  // namespace grader::judge
