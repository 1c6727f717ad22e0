#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "executor/executor.hpp"

namespace grader::executor {

/**
 * @brief 执行器注册表
 * 以 {language}-{version} 为键保存所有执行器
 * 注册表只在服务启动时修改，之后只读，因此可以在多个 worker 间共享而无需加锁
 */
struct executor_registry {
    /**
     * @brief 注册执行器
     * @throw config_error 如果 (language, version) 已经注册过
     */
    void register_executor(const executor_definition &def);

    /**
     * @brief 根据语言和版本查找执行器
     * @throw unknown_executor 如果没有对应的执行器
     */
    const code_executor &lookup(const std::string &language, const std::string &version) const;

    /**
     * @brief 根据执行器 id 查找执行器
     * @throw unknown_executor 如果没有对应的执行器
     */
    const code_executor &lookup(const std::string &id) const;

    /**
     * @brief 将用户提交的语言名转换为注册表中的语言名
     * 不区分大小写，支持别名，比如 C++ 会被转换为 cpp
     * @return 语言名，如果不支持该语言则返回空字符串
     */
    std::string normalize_language(const std::string &language) const;

    /**
     * @brief 查找用户提交对应的执行器
     * 语言支持别名，版本为空时使用该语言的默认版本
     * @throw unsupported_language 如果不支持该语言
     * @throw unknown_executor 如果不支持该版本
     */
    const code_executor &resolve(const std::string &language, const std::string &version) const;

    bool supports_language(const std::string &language) const;

    /**
     * @brief 支持的语言的展示名称，用于错误信息
     */
    std::vector<std::string> display_languages() const;

    std::vector<std::string> ids() const;

    /**
     * @brief 从配置文件加载执行器定义
     * @param j 执行器定义数组
     * @param replace 是否清空已有的执行器
     */
    void load(const nlohmann::json &j, bool replace);

private:
    std::map<std::string, std::unique_ptr<code_executor>> executors;
    std::map<std::string, std::string> aliases;
    std::map<std::string, std::string> default_versions;
};

/**
 * @brief 内置的 C++、Java、Python、JavaScript 执行器
 */
std::vector<executor_definition> builtin_executors();

/**
 * @brief 使用内置执行器初始化的注册表
 */
std::unique_ptr<executor_registry> make_builtin_registry();

}  // namespace grader::executor
