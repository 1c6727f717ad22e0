#include "logging.hpp"

#include <boost/log/attributes.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <vector>
using namespace std;

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

/**
 * @brief 当前线程正在处理的对象，例如 "unit1/alice-sample-3"
 * 每一段对应一次 LOG_BEGIN
 */
static thread_local vector<size_t> scope_offsets;
static thread_local string scope;

string LOG_PREFIX(const char *file, int line, const char *function) {
    const char *base = strrchr(file, '/');
    string prefix = "[";
    if (!scope.empty()) prefix += scope + " ";
    prefix += (base ? base + 1 : file);
    prefix += ":" + to_string(line) + " " + function + "] ";
    return prefix;
}

void LOG_BEGIN(const string &name) {
    scope_offsets.push_back(scope.size());
    scope += scope.empty() ? name : "-" + name;
}

void LOG_END() {
    if (scope_offsets.empty()) {
        BOOST_LOG_TRIVIAL(error) << "LOG_END without paired LOG_BEGIN";
        return;
    }
    scope.resize(scope_offsets.back());
    scope_offsets.pop_back();
}

void init_boost_log(const string &log_dir, bool debug) {
    logging::add_common_attributes();

    // clang-format off
    auto format = (expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " " << std::left << std::setw(7) << logging::trivial::severity
        << " <" << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "> "
        << expr::smessage);

    if (!log_dir.empty()) {
        logging::add_file_log(
            keywords::target = log_dir,
            keywords::file_name = log_dir + "/code-grader_%Y%m%d_%N.log",
            keywords::rotation_size = 10 * 1024 * 1024,
            keywords::time_based_rotation = logging::sinks::file::rotation_at_time_point(0, 0, 0),
            keywords::max_size = 200 * 1024 * 1024,  // 日志目录最多占用 200M
            keywords::scan_method = logging::sinks::file::scan_matching,
            keywords::format = format,
            keywords::auto_flush = true);
    }
    // clang-format on

    // 标准输出留给 --submit 打印评测报告
    logging::add_console_log(std::clog, keywords::format = format);

    logging::core::get()->set_filter(logging::trivial::severity >= (debug ? logging::trivial::debug : logging::trivial::info));
}
