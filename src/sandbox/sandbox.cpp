#include "sandbox/sandbox.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/algorithm/string/erase.hpp>
#include <fmt/core.h>

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace grader::sandbox {
using namespace std;

string generate_token() {
    // random_generator 不是线程安全的
    thread_local boost::uuids::random_generator generator;
    return WORKDIR_PREFIX + boost::algorithm::erase_all_copy(boost::uuids::to_string(generator()), "-");
}

sandbox_session::sandbox_session(const executor::code_executor &executor,
                                 unique_ptr<sandbox_environment> &&environment,
                                 const string &source,
                                 const string &token)
    : exe(executor), environment(move(environment)), source(source), name(token) {
    dir = RUN_DIR / assert_safe_path(name);
    filesystem::create_directories(dir);
    LOG_DEBUG << "Created work directory " << dir << " for executor " << executor.id();
}

sandbox_session::~sandbox_session() {
    try {
        environment->teardown();
    } catch (std::exception &e) {
        LOG_ERROR << "Unable to tear down sandbox environment of " << name << ": " << e.what();
    }
    if (DEBUG) {
        LOG_DEBUG << "Keeping work directory " << dir << " in debug mode";
        return;
    }
    error_code ec;
    filesystem::remove_all(dir, ec);
    if (ec) LOG_ERROR << "Unable to delete work directory " << dir << ": " << ec.message();
}

const string &sandbox_session::token() const {
    return name;
}

const filesystem::path &sandbox_session::workdir() const {
    return dir;
}

const executor::code_executor &sandbox_session::executor() const {
    return exe;
}

stage_outcome sandbox_session::compile() {
    auto command = exe.build_compile_command(name);
    if (!command) return compile_outcome{};

    auto result = environment->exec(dir, *command, nullopt, COMPILE_TIME_LIMIT, "");
    if (result.timed_out) return timeout_outcome{COMPILE_TIME_LIMIT};

    compile_outcome outcome;
    outcome.exit_code = result.exit_code;
    outcome.diagnostics = result.error;
    // 部分编译器把错误信息输出到 stdout
    if (outcome.exit_code != 0 && outcome.diagnostics.empty())
        outcome.diagnostics = result.output.empty() ? fmt::format("Compiler exited with code {}", result.exit_code) : result.output;
    return outcome;
}

void sandbox_session::prepare() {
    if (prepared) return;

    exe.build_source(dir, name, source);
    visit(overloaded{
              [&](const compile_outcome &outcome) {
                  if (!outcome.diagnostics.empty())
                      BOOST_THROW_EXCEPTION(compilation_error("Compilation error", outcome.diagnostics));
              },
              [&](const timeout_outcome &outcome) {
                  BOOST_THROW_EXCEPTION(compilation_error("Compilation error", fmt::format("Compilation time limit exceeded ({}s)", outcome.time_limit)));
              },
              [&](const run_outcome &) {
                  BOOST_THROW_EXCEPTION(internal_error("unexpected run outcome during compilation"));
              }},
          compile());
    prepared = true;
}

stage_outcome sandbox_session::run(const optional<filesystem::path> &input_file, double time_limit) {
    prepare();

    optional<string> visible_input;
    if (input_file) visible_input = environment->visible_path(*input_file);
    string command = exe.build_run_command(name, visible_input);

    auto result = environment->exec(dir, command, input_file, time_limit, "");
    if (result.timed_out) return timeout_outcome{time_limit};
    return run_outcome{result.exit_code, result.output, result.error};
}

string sandbox_session::execute(const optional<filesystem::path> &input_file, double time_limit) {
    return visit(overloaded{
                     [&](const run_outcome &outcome) -> string {
                         if (!outcome.error.empty())
                             BOOST_THROW_EXCEPTION(execution_error(outcome.error));
                         return outcome.output;
                     },
                     [&](const timeout_outcome &) -> string {
                         BOOST_THROW_EXCEPTION(time_limit_exceeded("Time limit exceeded"));
                     },
                     [&](const compile_outcome &) -> string {
                         BOOST_THROW_EXCEPTION(internal_error("unexpected compile outcome during execution"));
                     }},
                 run(input_file, time_limit));
}

sandbox_runner::sandbox_runner(const executor::executor_registry &registry, const sandbox_options &options)
    : executors(registry), options(options) {}

const executor::executor_registry &sandbox_runner::registry() const {
    return executors;
}

unique_ptr<sandbox_session> sandbox_runner::open(const string &executor_id, const string &source, const string &token) const {
    auto &executor = executors.lookup(executor_id);
    string name = token.empty() ? generate_token() : token;
    return make_unique<sandbox_session>(executor, make_environment(options, executor.definition(), name), source, name);
}

execution_outcome sandbox_runner::execute(const execution_request &request) const {
    auto session = open(request.executor_id, request.source, request.token);
    session->prepare();

    execution_outcome outcome;
    visit(overloaded{
              [&](const run_outcome &run) {
                  outcome.output = run.output;
                  outcome.error = run.error;
              },
              [&](const timeout_outcome &) {
                  outcome.timed_out = true;
                  outcome.error = "Time limit exceeded";
              },
              [&](const compile_outcome &) {}},
          session->run(request.input_file, request.time_limit));
    return outcome;
}

}  // namespace grader::sandbox
