#include "sandbox/environment.hpp"

#include <fmt/core.h>

#include "common/exceptions.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace grader::sandbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, sandbox_options &options) {
    assign_optional(j, options.type, "type");
    assign_optional(j, options.docker, "docker");
    assign_optional(j, options.network, "network");
    assign_optional(j, options.memory, "memory");
    assign_optional(j, options.cpus, "cpus");
    assign_optional(j, options.pids_limit, "pidsLimit");
    if (options.type != "docker" && options.type != "local")
        BOOST_THROW_EXCEPTION(config_error(fmt::format("unrecognized sandbox type {}", options.type)));
}

sandbox_environment::~sandbox_environment() {}

string local_environment::type() const {
    return "local";
}

process_result local_environment::exec(const filesystem::path &workdir,
                                       const string &command,
                                       const optional<filesystem::path> &,
                                       double time_limit,
                                       const string &stdin_data) {
    LOG_DEBUG << "Running " << command << " in " << workdir;
    return process_builder()
        .directory(workdir)
        .timeout(time_limit)
        .input(stdin_data)
        .output_limit(MAX_IO_SIZE)
        .run("/bin/sh", "-c", command);
}

string local_environment::visible_path(const filesystem::path &input_file) const {
    return filesystem::absolute(input_file).string();
}

void local_environment::teardown() {
}

docker_environment::docker_environment(const sandbox_options &options, const string &image, const string &token)
    : options(options), image(image), token(token) {}

string docker_environment::type() const {
    return "docker";
}

process_result docker_environment::exec(const filesystem::path &workdir,
                                        const string &command,
                                        const optional<filesystem::path> &input_file,
                                        double time_limit,
                                        const string &stdin_data) {
    string container = fmt::format("{}-{}", token, counter++);
    vector<string> args = {
        options.docker, "run", "--rm", "-i",
        "--name", container,
        "--network", options.network,
        "--memory", options.memory,
        "--cpus", fmt::format("{}", options.cpus),
        "--pids-limit", to_string(options.pids_limit),
        "-v", filesystem::absolute(workdir).string() + ":/sandbox",
        "-w", "/sandbox"};
    if (input_file) {
        args.push_back("-v");
        args.push_back(filesystem::absolute(*input_file).parent_path().string() + ":/input:ro");
    }
    for (auto &env : {"CPP_LD_FLAGS"}) {
        if (getenv(env)) {
            args.push_back("-e");
            args.push_back(env);
        }
    }
    args.insert(args.end(), {image, "sh", "-c", command});

    LOG_DEBUG << "Running " << command << " in container " << container << " of image " << image;

    // 杀死 docker 客户端并不会停止容器，需要显式 kill
    auto result = process_builder()
                      .timeout(time_limit)
                      .input(stdin_data)
                      .output_limit(MAX_IO_SIZE)
                      .on_timeout([&]() {
                          auto killed = process_builder().timeout(10).run(options.docker, "kill", container);
                          if (killed.exit_code != 0)
                              LOG_WARN << "Unable to kill container " << container << ": " << killed.error;
                          killed_containers.push_back(container);
                      })
                      .exec_program(args);

    // docker 自身的错误（比如镜像不存在）以 125 退出
    if (!result.timed_out && result.exit_code == 125)
        BOOST_THROW_EXCEPTION(internal_error(fmt::format("unable to start container of image {}: {}", image, result.error)));
    return result;
}

string docker_environment::visible_path(const filesystem::path &input_file) const {
    return "/input/" + input_file.filename().string();
}

void docker_environment::teardown() {
    for (auto &container : killed_containers) {
        auto result = process_builder().timeout(30).run(options.docker, "rm", "-f", container);
        if (result.exit_code != 0 && result.error.find("No such container") == string::npos)
            LOG_WARN << "Unable to remove container " << container << ": " << result.error;
    }
    killed_containers.clear();
}

unique_ptr<sandbox_environment> make_environment(const sandbox_options &options, const executor::executor_definition &def, const string &token) {
    if (options.type == "local")
        return make_unique<local_environment>();
    return make_unique<docker_environment>(options, def.image, token);
}

}  // namespace grader::sandbox
