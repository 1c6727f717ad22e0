#pragma once

#include <boost/exception/all.hpp>
#include <boost/throw_exception.hpp>
#include <exception>
#include <string>

namespace grader {

/**
 * @brief 评测系统所有异常的基类
 * 使用 BOOST_THROW_EXCEPTION 抛出以便携带抛出位置
 */
struct grader_exception : virtual std::exception, virtual boost::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    const char *what() const noexcept override;

protected:
    std::string message;
};

/**
 * @brief 评测系统内部错误，通常是环境问题
 */
struct internal_error : grader_exception {
    using grader_exception::grader_exception;
};

/**
 * @brief 网络请求失败
 */
struct network_error : grader_exception {
    using grader_exception::grader_exception;
};

/**
 * @brief 配置文件格式错误或缺少必要字段
 */
struct config_error : grader_exception {
    using grader_exception::grader_exception;
};

/**
 * @brief 执行器注册表中找不到 (language, version) 对应的执行器
 */
struct unknown_executor : grader_exception {
    using grader_exception::grader_exception;
};

/**
 * @brief 提交的语言不被支持
 */
struct unsupported_language : grader_exception {
    using grader_exception::grader_exception;
};

/**
 * @brief 编译失败，error_log 中保存编译器输出
 */
struct compilation_error : grader_exception {
    std::string error_log;

    compilation_error(const std::string &what, const std::string &error_log);
};

/**
 * @brief 选手程序运行时向 stderr 输出了信息
 */
struct execution_error : grader_exception {
    using grader_exception::grader_exception;
};

/**
 * @brief 选手程序运行超时，被看门狗杀死
 */
struct time_limit_exceeded : grader_exception {
    using grader_exception::grader_exception;
};

/**
 * @brief 测试点执行异常，导致本轮评测中止
 */
struct harness_abort : grader_exception {
    /**
     * @brief 导致中止的测试点编号
     */
    int test_index;

    /**
     * @brief 运行错误和超时只影响当前测试点，可以继续评测之后的测试点
     */
    bool recoverable;

    harness_abort(const std::string &what, int test_index, bool recoverable = false);
};

}  // namespace grader
