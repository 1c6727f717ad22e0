#include "executor/executor.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <regex>

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "logging.hpp"

namespace grader::executor {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, executor_definition &def) {
    j.at("language").get_to(def.language);
    j.at("version").get_to(def.version);
    def.display_name = get_value<string>(j, "displayName", def.language + " " + def.version);
    j.at("image").get_to(def.image);
    j.at("sourceFile").get_to(def.source_file);
    assign_optional(j, def.executable_file, "executableFile");
    assign_optional(j, def.compile_command, "compileCommand");
    j.at("runCommand").get_to(def.run_command);
    j.at("runWithInputCommand").get_to(def.run_with_input_command);
    assign_optional(j, def.entry_class, "entryClass");
    assign_optional(j, def.aliases, "aliases");
    assign_optional(j, def.is_default, "default");
}

void to_json(json &j, const executor_definition &def) {
    j = {{"language", def.language},
         {"version", def.version},
         {"displayName", def.display_name},
         {"image", def.image},
         {"sourceFile", def.source_file},
         {"executableFile", def.executable_file},
         {"compileCommand", def.compile_command},
         {"runCommand", def.run_command},
         {"runWithInputCommand", def.run_with_input_command},
         {"entryClass", def.entry_class},
         {"aliases", def.aliases},
         {"default", def.is_default}};
}

string create_id(const string &language, const string &version) {
    return language + "-" + version;
}

string shell_quote(const string &str) {
    string result = "'";
    for (char c : str) {
        if (c == '\'')
            result += "'\\''";
        else
            result += c;
    }
    return result + "'";
}

code_executor::code_executor(const executor_definition &def) : def(def) {}

code_executor::~code_executor() {}

const executor_definition &code_executor::definition() const {
    return def;
}

string code_executor::id() const {
    return create_id(def.language, def.version);
}

string code_executor::expand(const string &tmpl, const string &name, const string &input_file) const {
    // 文件名模板中只能使用 {name}
    auto file_name = [&](const string &t) {
        return fmt::format(fmt::runtime(t), fmt::arg("name", name));
    };
    try {
        string source = file_name(def.source_file);
        string executable = def.executable_file.empty() ? source : file_name(def.executable_file);
        return fmt::format(fmt::runtime(tmpl),
                           fmt::arg("name", shell_quote(name)),
                           fmt::arg("source_file", shell_quote(source)),
                           fmt::arg("executable_file", shell_quote(executable)),
                           fmt::arg("input_file", shell_quote(input_file)));
    } catch (fmt::format_error &e) {
        BOOST_THROW_EXCEPTION(config_error(fmt::format("malformed command template \"{}\" of executor {}: {}", tmpl, id(), e.what())));
    }
}

string code_executor::source_file(const string &name) const {
    try {
        return assert_safe_path(fmt::format(fmt::runtime(def.source_file), fmt::arg("name", name)));
    } catch (fmt::format_error &e) {
        BOOST_THROW_EXCEPTION(config_error(fmt::format("malformed source file template of executor {}: {}", id(), e.what())));
    }
}

filesystem::path code_executor::build_source(const filesystem::path &dir, const string &name, const string &source) const {
    filesystem::path path = dir / source_file(name);
    if (def.entry_class.empty()) {
        write_file_content(path, source);
    } else {
        static const regex public_class("public\\s+class\\s+[A-Za-z_$][A-Za-z0-9_$]*");
        write_file_content(path, regex_replace(source, public_class, "public class " + def.entry_class, regex_constants::format_first_only));
    }
    return path;
}

string code_executor::build_run_command(const string &name, const optional<string> &input_file) const {
    if (input_file)
        return expand(def.run_with_input_command, name, *input_file);
    else
        return expand(def.run_command, name, "");
}

compiled_executor::compiled_executor(const executor_definition &def) : code_executor(def) {}

bool compiled_executor::needs_compile() const {
    return true;
}

string compiled_executor::executable_file(const string &name) const {
    return fmt::format(fmt::runtime(def.executable_file), fmt::arg("name", name));
}

optional<string> compiled_executor::build_compile_command(const string &name) const {
    return expand(def.compile_command, name, "");
}

scripted_executor::scripted_executor(const executor_definition &def) : code_executor(def) {}

bool scripted_executor::needs_compile() const {
    return false;
}

string scripted_executor::executable_file(const string &name) const {
    return source_file(name);
}

optional<string> scripted_executor::build_compile_command(const string &) const {
    return nullopt;
}

unique_ptr<code_executor> make_executor(const executor_definition &def) {
    if (def.compile_command.empty())
        return make_unique<scripted_executor>(def);
    if (def.executable_file.empty())
        BOOST_THROW_EXCEPTION(config_error(fmt::format("compiled executor {} requires an executable file template", create_id(def.language, def.version))));
    return make_unique<compiled_executor>(def);
}

}  // namespace grader::executor
