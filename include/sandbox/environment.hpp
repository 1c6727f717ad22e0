#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "executor/executor.hpp"

namespace grader::sandbox {

/**
 * @brief 编译阶段结束
 */
struct compile_outcome {
    /**
     * @brief 编译器的退出码
     */
    int exit_code = 0;

    /**
     * @brief 编译器输出的诊断信息（stderr），为空表示编译成功
     */
    std::string diagnostics;
};

/**
 * @brief 运行阶段结束
 */
struct run_outcome {
    int exit_code = 0;

    /**
     * @brief 选手程序的标准输出
     */
    std::string output;

    /**
     * @brief 选手程序的标准错误输出
     */
    std::string error;
};

/**
 * @brief 看门狗超时杀死了程序
 */
struct timeout_outcome {
    /**
     * @brief 时间限制（单位为秒）
     */
    double time_limit = 0;
};

/**
 * @brief 编译或运行一个阶段的结果，使用 std::visit 处理
 */
using stage_outcome = std::variant<compile_outcome, run_outcome, timeout_outcome>;

/**
 * @brief 隔离环境的配置
 */
struct sandbox_options {
    /**
     * @brief 隔离环境类型，可选 docker, local
     * local 直接在本机运行，只能在开发环境中使用
     */
    std::string type = "docker";

    /**
     * @brief docker 可执行文件
     */
    std::string docker = "docker";

    /**
     * @brief 容器网络，默认禁止访问网络
     */
    std::string network = "none";

    /**
     * @brief 容器内存限制，比如 512m
     */
    std::string memory = "512m";

    /**
     * @brief 容器可以使用的 CPU 核数
     */
    double cpus = 1;

    /**
     * @brief 容器内最多的进程数，防止 fork 炸弹
     */
    int pids_limit = 64;
};

void from_json(const nlohmann::json &j, sandbox_options &options);

/**
 * @brief 隔离环境，选手程序的编译和运行都在隔离环境中进行
 * 每个提交拥有自己的隔离环境，提交评测结束后销毁
 */
struct sandbox_environment {
    virtual ~sandbox_environment();

    virtual std::string type() const = 0;

    /**
     * @brief 在隔离环境中执行 shell 命令
     * @param workdir 工作目录，命令在该目录下执行
     * @param command shell 命令
     * @param input_file 需要在隔离环境中可见的输入数据文件
     * @param time_limit 时间限制（单位为秒），超时后杀死命令
     * @param stdin_data 喂给 stdin 的数据
     */
    virtual process_result exec(const std::filesystem::path &workdir,
                                const std::string &command,
                                const std::optional<std::filesystem::path> &input_file,
                                double time_limit,
                                const std::string &stdin_data) = 0;

    /**
     * @brief 输入数据文件在隔离环境中的路径
     */
    virtual std::string visible_path(const std::filesystem::path &input_file) const = 0;

    /**
     * @brief 销毁隔离环境中残留的资源
     */
    virtual void teardown() = 0;
};

/**
 * @brief 直接在本机运行命令
 */
struct local_environment : public sandbox_environment {
    std::string type() const override;
    process_result exec(const std::filesystem::path &workdir,
                        const std::string &command,
                        const std::optional<std::filesystem::path> &input_file,
                        double time_limit,
                        const std::string &stdin_data) override;
    std::string visible_path(const std::filesystem::path &input_file) const override;
    void teardown() override;
};

/**
 * @brief 在 docker 容器中运行命令
 * 工作目录挂载到容器的 /sandbox，输入数据所在目录只读挂载到 /input
 */
struct docker_environment : public sandbox_environment {
    docker_environment(const sandbox_options &options, const std::string &image, const std::string &token);

    std::string type() const override;
    process_result exec(const std::filesystem::path &workdir,
                        const std::string &command,
                        const std::optional<std::filesystem::path> &input_file,
                        double time_limit,
                        const std::string &stdin_data) override;
    std::string visible_path(const std::filesystem::path &input_file) const override;
    void teardown() override;

private:
    sandbox_options options;
    std::string image;
    std::string token;
    int counter = 0;

    /**
     * @brief 被看门狗杀死的容器，销毁环境时需要确保删除
     */
    std::vector<std::string> killed_containers;
};

std::unique_ptr<sandbox_environment> make_environment(const sandbox_options &options, const executor::executor_definition &def, const std::string &token);

}  // namespace grader::sandbox
