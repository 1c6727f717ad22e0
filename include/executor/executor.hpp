#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/json_utils.hpp"

/**
 * 这个头文件包含执行器的定义
 * 包含：
 * 1. executor_definition 类（描述一种语言的一个版本如何编译和运行）
 * 2. code_executor 类（根据 executor_definition 生成编译、运行命令）
 * 3. compiled_executor、scripted_executor（编译型语言和解释型语言）
 */
namespace grader::executor {

/**
 * @brief 描述一种语言的一个版本的执行环境
 * 以 (language, version) 唯一确定，注册后不可修改
 *
 * 命令模板中可以使用以下占位符：
 * {source_file} 源文件名
 * {executable_file} 可执行文件名
 * {input_file} 输入数据文件路径
 * {name} 工作目录名
 */
struct executor_definition {
    /**
     * @brief 语言名，比如 cpp、java、python、javascript
     */
    std::string language;

    /**
     * @brief 语言版本，比如 g++-12.2
     */
    std::string version;

    /**
     * @brief 展示给用户的名称
     */
    std::string display_name;

    /**
     * @brief 运行该语言的 docker 镜像
     */
    std::string image;

    /**
     * @brief 源文件名模板，比如 {name}.cpp
     */
    std::string source_file;

    /**
     * @brief 可执行文件名模板，解释型语言可以为空
     */
    std::string executable_file;

    /**
     * @brief 编译命令模板，为空表示该语言不需要编译
     */
    std::string compile_command;

    /**
     * @brief 从 stdin 读入数据时的运行命令模板
     */
    std::string run_command;

    /**
     * @brief 从文件读入数据时的运行命令模板，输入文件路径作为命令行参数
     */
    std::string run_with_input_command;

    /**
     * @brief 若非空，写入源文件时将第一个 public class 重命名为该类名
     * Java 要求 public class 与文件名一致
     */
    std::string entry_class;

    /**
     * @brief 该语言的别名，比如 c++ 是 cpp 的别名
     */
    std::vector<std::string> aliases;

    /**
     * @brief 请求没有指定版本时，是否使用该版本
     */
    bool is_default = false;
};

void from_json(const nlohmann::json &j, executor_definition &def);
void to_json(nlohmann::json &j, const executor_definition &def);

/**
 * @brief 生成执行器 id，格式为 {language}-{version}
 */
std::string create_id(const std::string &language, const std::string &version);

/**
 * @brief 将字符串用单引号包裹，以便安全地拼接到 shell 命令中
 */
std::string shell_quote(const std::string &str);

/**
 * @brief 执行器，根据定义生成源文件、编译命令和运行命令
 * 编译型语言和解释型语言的区别在子类中实现
 */
struct code_executor {
    explicit code_executor(const executor_definition &def);
    virtual ~code_executor();

    const executor_definition &definition() const;
    std::string id() const;

    /**
     * @brief 是否需要编译
     */
    virtual bool needs_compile() const = 0;

    std::string source_file(const std::string &name) const;
    virtual std::string executable_file(const std::string &name) const = 0;

    /**
     * @brief 将选手代码写入工作目录
     * @param dir 工作目录
     * @param name 工作目录名
     * @param source 选手代码
     * @return 源文件路径
     */
    std::filesystem::path build_source(const std::filesystem::path &dir, const std::string &name, const std::string &source) const;

    /**
     * @brief 生成编译命令
     * @return 编译命令，解释型语言返回 std::nullopt
     */
    virtual std::optional<std::string> build_compile_command(const std::string &name) const = 0;

    /**
     * @brief 生成运行命令
     * @param name 工作目录名
     * @param input_file 输入数据文件路径，为空表示从 stdin 读入数据
     */
    std::string build_run_command(const std::string &name, const std::optional<std::string> &input_file) const;

protected:
    std::string expand(const std::string &tmpl, const std::string &name, const std::string &input_file) const;

    executor_definition def;
};

/**
 * @brief 编译型语言，比如 C++、Java
 */
struct compiled_executor : public code_executor {
    explicit compiled_executor(const executor_definition &def);

    bool needs_compile() const override;
    std::string executable_file(const std::string &name) const override;
    std::optional<std::string> build_compile_command(const std::string &name) const override;
};

/**
 * @brief 解释型语言，比如 Python、JavaScript
 * 直接运行源文件
 */
struct scripted_executor : public code_executor {
    explicit scripted_executor(const executor_definition &def);

    bool needs_compile() const override;
    std::string executable_file(const std::string &name) const override;
    std::optional<std::string> build_compile_command(const std::string &name) const override;
};

/**
 * @brief 根据定义选择执行器类型
 * 定义了编译命令的为编译型语言
 */
std::unique_ptr<code_executor> make_executor(const executor_definition &def);

}  // namespace grader::executor
