#include "judge/test_harness.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace grader::judge {
using namespace std;

string rstrip(const string &str) {
    return boost::algorithm::trim_right_copy(str);
}

bool compare_outputs(const string &expected, const string &actual) {
    vector<string> expected_lines, actual_lines;
    boost::split(expected_lines, rstrip(expected), boost::is_any_of("\n"));
    boost::split(actual_lines, rstrip(actual), boost::is_any_of("\n"));
    return expected_lines == actual_lines;
}

bool is_design_problem(const string &problem_id) {
    return boost::algorithm::iends_with(problem_id, "design problem");
}

harness_options default_harness_options() {
    harness_options options;
    options.time_limit = TEST_CASE_TIME_LIMIT;
    options.design_time_limit = DESIGN_TIME_LIMIT;
    options.continue_after_error = false;
    return options;
}

string describe_error(const std::exception &e) {
    if (auto compile_error = dynamic_cast<const compilation_error *>(&e))
        return truncate_error_output(compile_error->error_log);
    return truncate_error_output(e.what());
}

test_harness::test_harness(const test_case_provider &provider, const harness_options &options)
    : provider(provider), opts(options) {}

const harness_options &test_harness::options() const {
    return opts;
}

run_report test_harness::run(const string &problem_id, const string &run_type, sandbox::sandbox_session &session) const {
    return run(run_type, session, provider.glob(problem_id, run_type));
}

test_case_result test_harness::run_case(sandbox::sandbox_session &session, const test_case &test) const {
    try {
        test_case_result result;
        string output = session.execute(test.input_file, opts.time_limit);
        result.test_input = read_file_content(test.input_file, MAX_IO_SIZE);
        string expected = read_file_content(test.output_file, MAX_IO_SIZE);
        result.correct = compare_outputs(expected, output);
        result.expected_output = rstrip(expected);
        result.actual_output = rstrip(output);
        return result;
    } catch (execution_error &e) {
        BOOST_THROW_EXCEPTION(harness_abort(describe_error(e), test.index, true));
    } catch (time_limit_exceeded &e) {
        BOOST_THROW_EXCEPTION(harness_abort(describe_error(e), test.index, true));
    } catch (grader_exception &e) {
        BOOST_THROW_EXCEPTION(harness_abort(describe_error(e), test.index));
    } catch (std::exception &e) {
        LOG_ERROR << "Unexpected error in test case " << test.index << ": " << boost::diagnostic_information(e);
        BOOST_THROW_EXCEPTION(harness_abort(describe_error(e), test.index));
    }
}

run_report test_harness::run(const string &run_type, sandbox::sandbox_session &session, const vector<test_case> &cases) const {
    run_report report;
    report.run_type = run_type;
    report.total_tests = cases.size();

    for (auto &test : cases) {
        LOG_BEGIN(run_type + "-" + to_string(test.index));
        defer { LOG_END(); };
        try {
            auto result = run_case(session, test);
            if (result.correct)
                ++report.correct;
            else
                ++report.incorrect;
            report.output[test.index] = result;
            LOG_DEBUG << "Test case finished, correct: " << result.correct;
        } catch (harness_abort &e) {
            if (opts.continue_after_error && e.recoverable) {
                LOG_INFO << "Test case failed, continuing: " << e.what();
                test_case_result result;
                result.test_input = read_file_content(test.input_file, "", MAX_IO_SIZE);
                result.expected_output = rstrip(read_file_content(test.output_file, "", MAX_IO_SIZE));
                result.actual_output = e.what();
                result.correct = false;
                ++report.incorrect;
                report.output[test.index] = result;
            } else {
                LOG_INFO << "Test case " << e.test_index << " aborted the run: " << e.what();
                report.error = e.what();
                report.aborted_test = e.test_index;
                break;
            }
        }
    }
    return report;
}

design_report test_harness::run_design(sandbox::sandbox_session &session) const {
    design_report report;
    try {
        report.output = session.execute(nullopt, opts.design_time_limit);
    } catch (grader_exception &e) {
        LOG_INFO << "Design problem run failed: " << e.what();
        report.error = describe_error(e);
    } catch (std::exception &e) {
        LOG_ERROR << "Unexpected error in design problem run: " << boost::diagnostic_information(e);
        report.error = describe_error(e);
    }
    return report;
}

}  // namespace grader::judge
