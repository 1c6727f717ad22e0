#pragma once

#include <boost/log/trivial.hpp>
#include <string>

/**
 * @brief 生成日志前缀，包含当前线程的处理对象以及源码位置
 */
std::string LOG_PREFIX(const char *file, int line, const char *function);

/**
 * @brief 进入一个处理对象，此后本线程输出的日志都会带上该对象的名字
 * 必须和 LOG_END 成对使用，一般写作 LOG_BEGIN(name); defer { LOG_END(); };
 */
void LOG_BEGIN(const std::string &name);
void LOG_END();

/**
 * @brief 初始化日志系统
 * @param log_dir 日志文件目录，为空时只输出到标准错误
 * @param debug 是否输出 debug 级别的日志
 */
void init_boost_log(const std::string &log_dir, bool debug);

#define LOG_DEBUG BOOST_LOG_TRIVIAL(debug) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_INFO BOOST_LOG_TRIVIAL(info) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_WARN BOOST_LOG_TRIVIAL(warning) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_ERROR BOOST_LOG_TRIVIAL(error) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_FATAL BOOST_LOG_TRIVIAL(fatal) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
