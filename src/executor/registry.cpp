#include "executor/registry.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/core.h>

#include "common/exceptions.hpp"
#include "logging.hpp"

namespace grader::executor {
using namespace std;

void executor_registry::register_executor(const executor_definition &def) {
    string id = create_id(def.language, def.version);
    if (executors.count(id))
        BOOST_THROW_EXCEPTION(config_error(fmt::format("executor {} has been registered", id)));

    string language = boost::algorithm::to_lower_copy(def.language);
    executors[id] = make_executor(def);
    aliases[language] = def.language;
    for (auto &alias : def.aliases)
        aliases[boost::algorithm::to_lower_copy(alias)] = def.language;
    // 第一个注册的版本作为默认版本，除非之后有版本显式声明为默认
    if (!default_versions.count(def.language) || def.is_default)
        default_versions[def.language] = def.version;

    LOG_INFO << "Register executor " << id << " (" << (def.compile_command.empty() ? "scripted" : "compiled") << ", image " << def.image << ")";
}

const code_executor &executor_registry::lookup(const string &language, const string &version) const {
    return lookup(create_id(language, version));
}

const code_executor &executor_registry::lookup(const string &id) const {
    auto it = executors.find(id);
    if (it == executors.end())
        BOOST_THROW_EXCEPTION(unknown_executor(fmt::format("No executor found for {}", id)));
    return *it->second;
}

string executor_registry::normalize_language(const string &language) const {
    auto it = aliases.find(boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(language)));
    return it == aliases.end() ? "" : it->second;
}

const code_executor &executor_registry::resolve(const string &language, const string &version) const {
    string name = normalize_language(language);
    if (name.empty())
        BOOST_THROW_EXCEPTION(unsupported_language(fmt::format("Language can only be {}", boost::algorithm::join(display_languages(), ", "))));
    if (version.empty())
        return lookup(name, default_versions.at(name));
    return lookup(name, version);
}

bool executor_registry::supports_language(const string &language) const {
    return !normalize_language(language).empty();
}

vector<string> executor_registry::display_languages() const {
    vector<string> result;
    for (auto &[language, version] : default_versions)
        result.push_back(lookup(language, version).definition().display_name);
    return result;
}

vector<string> executor_registry::ids() const {
    vector<string> result;
    for (auto &[id, executor] : executors)
        result.push_back(id);
    return result;
}

void executor_registry::load(const nlohmann::json &j, bool replace) {
    if (!j.is_array())
        BOOST_THROW_EXCEPTION(config_error("executors should be an array"));
    if (replace) {
        executors.clear();
        aliases.clear();
        default_versions.clear();
    }
    for (auto &item : j) {
        register_executor(item.get<executor_definition>());
    }
}

vector<executor_definition> builtin_executors() {
    vector<executor_definition> result;

    executor_definition cpp;
    cpp.language = "cpp";
    cpp.version = "g++-12.2";
    cpp.display_name = "C++ 20 (g++ 12.2)";
    cpp.image = "litmustest/code-executor-gpp:12.2";
    cpp.source_file = "{name}.cpp";
    cpp.executable_file = "{name}.out";
    cpp.compile_command = "g++-12 -o {executable_file} -std=gnu++2a {source_file} $CPP_LD_FLAGS";
    cpp.run_command = "./{executable_file}";
    cpp.run_with_input_command = "./{executable_file} {input_file}";
    cpp.aliases = {"c++", "cxx"};
    cpp.is_default = true;
    result.push_back(cpp);

    executor_definition java;
    java.language = "java";
    java.version = "openjdk-19";
    java.display_name = "Java 19 (openjdk 19)";
    java.image = "litmustest/code-executor-openjdk:19";
    java.source_file = "Main.java";
    java.executable_file = "Main";
    java.compile_command = "javac {source_file}";
    java.run_command = "java {executable_file}";
    java.run_with_input_command = "java {executable_file} {input_file}";
    java.entry_class = "Main";
    java.is_default = true;
    result.push_back(java);

    executor_definition python;
    python.language = "python";
    python.version = "3.12";
    python.display_name = "Python 3.12";
    python.image = "litmustest/code-executor-python:3.12";
    python.source_file = "{name}.py";
    python.run_command = "python3 {source_file}";
    python.run_with_input_command = "python3 {source_file} {input_file}";
    python.aliases = {"python3", "py"};
    python.is_default = true;
    result.push_back(python);

    executor_definition javascript;
    javascript.language = "javascript";
    javascript.version = "nodejs-18.12";
    javascript.display_name = "Javascript (NodeJS 18.12)";
    javascript.image = "litmustest/code-executor-node:18.12";
    javascript.source_file = "{name}.js";
    javascript.run_command = "node {source_file}";
    javascript.run_with_input_command = "node {source_file} {input_file}";
    javascript.aliases = {"js", "node"};
    javascript.is_default = true;
    result.push_back(javascript);

    return result;
}

unique_ptr<executor_registry> make_builtin_registry() {
    auto registry = make_unique<executor_registry>();
    for (auto &def : builtin_executors())
        registry->register_executor(def);
    return registry;
}

}  // namespace grader::executor
