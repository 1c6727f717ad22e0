#pragma once

#include <unistd.h>

#include <filesystem>
#include <string>

#include "common/io_utils.hpp"
#include "config.hpp"
#include "executor/registry.hpp"
#include "sandbox/environment.hpp"

/**
 * 单元测试共用的测试环境
 * 所有测试都在本机直接运行 sh 脚本，不依赖 docker 和各语言的编译器
 */
namespace grader::test {

/**
 * @brief 直接运行 sh 脚本的解释型执行器
 * 输入数据文件路径作为 $1 传入
 */
inline executor::executor_definition shell_executor() {
    executor::executor_definition def;
    def.language = "shell";
    def.version = "posix";
    def.display_name = "Shell (POSIX)";
    def.image = "busybox";
    def.source_file = "{name}.sh";
    def.run_command = "sh {source_file}";
    def.run_with_input_command = "sh {source_file} {input_file}";
    def.aliases = {"sh"};
    def.is_default = true;
    return def;
}

/**
 * @brief 模拟编译型语言的执行器
 * 源代码中包含 #error 时编译失败，否则将源文件复制为可执行文件
 */
inline executor::executor_definition fake_compiled_executor() {
    executor::executor_definition def;
    def.language = "fakecc";
    def.version = "1.0";
    def.display_name = "FakeCC 1.0";
    def.image = "busybox";
    def.source_file = "{name}.src";
    def.executable_file = "{name}.out";
    def.compile_command = "if grep -q '#error' {source_file}; then echo 'error: syntax error' >&2; exit 1; fi; cp {source_file} {executable_file} && chmod +x {executable_file}";
    def.run_command = "./{executable_file}";
    def.run_with_input_command = "./{executable_file} {input_file}";
    def.is_default = true;
    return def;
}

inline std::unique_ptr<executor::executor_registry> make_test_registry() {
    auto registry = std::make_unique<executor::executor_registry>();
    registry->register_executor(shell_executor());
    registry->register_executor(fake_compiled_executor());
    return registry;
}

inline sandbox::sandbox_options local_sandbox() {
    sandbox::sandbox_options options;
    options.type = "local";
    return options;
}

/**
 * @brief 为每个测试创建独立的临时目录，并将 RUN_DIR 指向其中
 */
struct scoped_test_dir {
    std::filesystem::path root;
    std::filesystem::path old_run_dir;

    explicit scoped_test_dir(const std::string &name) {
        root = std::filesystem::temp_directory_path() / ("grader-test-" + name + "-" + std::to_string(::getpid()));
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root / "run");
        std::filesystem::create_directories(root / "data");
        old_run_dir = RUN_DIR;
        RUN_DIR = root / "run";
    }

    ~scoped_test_dir() {
        RUN_DIR = old_run_dir;
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::filesystem::path data_dir() const {
        return root / "data";
    }

    /**
     * @brief 写入一个测试点 data/<problem>/<run_type>/<index>/{input.in, output.out}
     */
    void add_case(const std::string &problem, const std::string &run_type, int index, const std::string &input, const std::string &output) const {
        auto dir = data_dir() / problem / run_type / std::to_string(index);
        std::filesystem::create_directories(dir);
        write_file_content(dir / INPUT_FILENAME, input);
        write_file_content(dir / OUTPUT_FILENAME, output);
    }

    /**
     * @brief 运行目录中是否还有残留的工作目录
     */
    bool run_dir_empty() const {
        return std::filesystem::is_empty(root / "run");
    }
};

}  // namespace grader::test
