#include "common/exceptions.hpp"
#include "env.hpp"
#include "executor/registry.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;
using namespace grader::executor;

class ExecutorRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = make_builtin_registry();
    }

    unique_ptr<executor_registry> registry;
};

TEST_F(ExecutorRegistryTest, BuiltinExecutors) {
    auto ids = registry->ids();
    EXPECT_EQ(ids.size(), 4u);
    EXPECT_EQ(registry->lookup("cpp", "g++-12.2").id(), "cpp-g++-12.2");
    EXPECT_EQ(registry->lookup("java-openjdk-19").definition().image, "litmustest/code-executor-openjdk:19");
    EXPECT_TRUE(registry->lookup("cpp-g++-12.2").needs_compile());
    EXPECT_FALSE(registry->lookup("python-3.12").needs_compile());
}

TEST_F(ExecutorRegistryTest, LanguageAliases) {
    EXPECT_EQ(registry->normalize_language("C++"), "cpp");
    EXPECT_EQ(registry->normalize_language(" Python3 "), "python");
    EXPECT_EQ(registry->normalize_language("JS"), "javascript");
    EXPECT_EQ(registry->normalize_language("Java"), "java");
    EXPECT_EQ(registry->normalize_language("ruby"), "");
    EXPECT_TRUE(registry->supports_language("py"));
    EXPECT_FALSE(registry->supports_language("rust"));
}

TEST_F(ExecutorRegistryTest, ResolveDefaultVersion) {
    EXPECT_EQ(registry->resolve("Python", "").id(), "python-3.12");
    EXPECT_EQ(registry->resolve("c++", "g++-12.2").id(), "cpp-g++-12.2");
}

TEST_F(ExecutorRegistryTest, UnsupportedLanguage) {
    try {
        registry->resolve("ruby", "");
        FAIL() << "ruby should not be supported";
    } catch (unsupported_language &e) {
        string message = e.what();
        EXPECT_EQ(message.rfind("Language can only be ", 0), 0u);
        EXPECT_NE(message.find("Python 3.12"), string::npos);
        EXPECT_NE(message.find("C++ 20 (g++ 12.2)"), string::npos);
    }
}

TEST_F(ExecutorRegistryTest, UnknownVersion) {
    EXPECT_THROW(registry->resolve("python", "2.7"), unknown_executor);
    try {
        registry->lookup("python-2.7");
    } catch (unknown_executor &e) {
        EXPECT_STREQ(e.what(), "No executor found for python-2.7");
    }
}

TEST_F(ExecutorRegistryTest, DuplicateRegistration) {
    auto def = builtin_executors().front();
    EXPECT_THROW(registry->register_executor(def), config_error);
}

TEST_F(ExecutorRegistryTest, CompileAndRunCommands) {
    auto &cpp = registry->lookup("cpp-g++-12.2");
    EXPECT_EQ(cpp.source_file("tok"), "tok.cpp");
    EXPECT_EQ(cpp.executable_file("tok"), "tok.out");
    EXPECT_EQ(*cpp.build_compile_command("tok"), "g++-12 -o 'tok.out' -std=gnu++2a 'tok.cpp' $CPP_LD_FLAGS");
    EXPECT_EQ(cpp.build_run_command("tok", nullopt), "./'tok.out'");
    EXPECT_EQ(cpp.build_run_command("tok", "/input/input.in"), "./'tok.out' '/input/input.in'");

    auto &python = registry->lookup("python-3.12");
    EXPECT_FALSE(python.build_compile_command("tok"));
    EXPECT_EQ(python.build_run_command("tok", nullopt), "python3 'tok.py'");
}

TEST_F(ExecutorRegistryTest, ShellQuote) {
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST_F(ExecutorRegistryTest, JavaEntryClassRenamed) {
    test::scoped_test_dir dir("java-entry");
    auto &java = registry->lookup("java-openjdk-19");
    auto path = java.build_source(dir.root, "tok", "public class Solution {\n    public static void main(String[] args) {}\n}\npublic class Other {}\n");
    EXPECT_EQ(path.filename().string(), "Main.java");
    string content = read_file_content(path);
    EXPECT_NE(content.find("public class Main {"), string::npos);
    EXPECT_NE(content.find("public class Other {}"), string::npos);
    EXPECT_EQ(content.find("Solution"), string::npos);
}

TEST_F(ExecutorRegistryTest, LoadFromConfig) {
    auto j = nlohmann::json::parse(R"([
        {
            "language": "ruby",
            "version": "3.2",
            "displayName": "Ruby 3.2",
            "image": "ruby:3.2",
            "sourceFile": "{name}.rb",
            "runCommand": "ruby {source_file}",
            "runWithInputCommand": "ruby {source_file} {input_file}",
            "aliases": ["rb"]
        }
    ])");
    registry->load(j, false);
    EXPECT_EQ(registry->resolve("rb", "").id(), "ruby-3.2");
    EXPECT_EQ(registry->ids().size(), 5u);

    registry->load(j, true);
    EXPECT_EQ(registry->ids().size(), 1u);
    EXPECT_FALSE(registry->supports_language("cpp"));

    EXPECT_THROW(registry->load(nlohmann::json::object(), false), config_error);
}

TEST_F(ExecutorRegistryTest, ExplicitDefaultVersion) {
    executor_registry reg;
    auto older = test::shell_executor();
    older.version = "old";
    older.is_default = false;
    reg.register_executor(older);
    EXPECT_EQ(reg.resolve("shell", "").id(), "shell-old");

    reg.register_executor(test::shell_executor());
    EXPECT_EQ(reg.resolve("sh", "").id(), "shell-posix");
}

TEST_F(ExecutorRegistryTest, MalformedTemplate) {
    auto def = test::shell_executor();
    def.run_command = "sh {unknown_placeholder}";
    executor_registry reg;
    reg.register_executor(def);
    EXPECT_THROW(reg.lookup("shell-posix").build_run_command("tok", nullopt), config_error);
}
