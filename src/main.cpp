#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <thread>

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "executor/registry.hpp"
#include "jobs/job_orchestrator.hpp"
#include "jobs/task_queue.hpp"
#include "judge/grader.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "monitor/interrupt_monitor.hpp"
#include "monitor/prometheus.hpp"
#include "sandbox/sandbox.hpp"
#include "server/config.hpp"
#include "server/gateway.hpp"
#include "store/blob_store.hpp"
#include "store/result_store.hpp"
using namespace std;

static volatile sig_atomic_t sigint = 0;

void sigintHandler(int signum) {
    // 第一次收到信号时通知主线程停止，第二次直接退出
    if (sigint > 0) _exit(130);
    sigint = signum;
}

/**
 * @brief 从命令行参数或者环境变量中读取路径
 */
static filesystem::path path_option(const boost::program_options::variables_map &vm, const string &option, const char *env, const filesystem::path &def) {
    if (vm.count(option)) return filesystem::path(vm.at(option).as<string>());
    if (getenv(env)) return filesystem::path(getenv(env));
    return def;
}

int main(int argc, char *argv[]) {
    /*** handle options ***/

    namespace po = boost::program_options;
    po::options_description desc("code-grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load grader configuration (sandbox, time limits, executors, queues) from the given JSON file. You can either pass it from environ CONFIG")
        ("run-dir", po::value<string>(), "set the directory to create submission work directories in. You can either pass it from environ RUNDIR")
        ("data-dir", po::value<string>(), "set the directory where test data <problem>/<sample|staff>/<n>/ is stored. You can either pass it from environ DATADIR")
        ("state-dir", po::value<string>(), "set the directory to persist grading jobs and reports. You can either pass it from environ STATEDIR")
        ("workers", po::value<int>(), "set the number of grading workers, default to the number of CPU cores. You can either pass it from environ WORKERS")
        ("max-io-size", po::value<long>(), "set the maximum bytes to be read from the output of a program, default to 64MiB, negative for unlimited. You can either pass it from environ MAXIOSIZE")
        ("local-sandbox", "run submissions directly on this host instead of docker containers, for development only")
        ("log-dir", po::value<string>(), "set the directory to write rotated log files to. You can either pass it from environ BOOST_log_dir")
        ("metric-addr", po::value<string>(), "set the address that Prometheus-metrics exposed. Fomat x.x.x.x:x")
        ("submit", po::value<string>(), "grade the given source file once, print the report and exit")
        ("language", po::value<string>(), "language of the source file given by --submit")
        ("version", po::value<string>()->default_value(""), "language version of the source file given by --submit")
        ("problem", po::value<string>(), "problem of the source file given by --submit")
        ("staff", "also grade staff test cases for --submit")
        ("debug", "turn on the debug mode to print debug logs and not to delete submission directories. You can either pass it from environ DEBUG")
        ("help", "display this help text");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "CodeGrader: Compile and run submissions in isolated environments, grade them against test cases" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        grader::DEBUG = true;
    }

    string log_dir = vm.count("log-dir") ? vm.at("log-dir").as<string>() : grader::get_env("BOOST_log_dir");
    init_boost_log(log_dir, grader::DEBUG);

    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    grader::server::grader_config config;
    string config_file = vm.count("config") ? vm.at("config").as<string>() : grader::get_env("CONFIG");
    try {
        if (!config_file.empty()) {
            LOG_INFO << "Enable config file " << config_file;
            config = grader::server::load_config(config_file);
        }
    } catch (std::exception &e) {
        LOG_FATAL << e.what();
        return EXIT_FAILURE;
    }
    if (vm.count("local-sandbox")) config.sandbox.type = "local";
    grader::server::apply_config(config);

    grader::RUN_DIR = path_option(vm, "run-dir", "RUNDIR", grader::RUN_DIR);
    grader::DATA_DIR = path_option(vm, "data-dir", "DATADIR", grader::DATA_DIR);
    grader::STATE_DIR = path_option(vm, "state-dir", "STATEDIR", grader::STATE_DIR);

    if (vm.count("max-io-size")) {
        grader::MAX_IO_SIZE = vm["max-io-size"].as<long>();
    } else if (getenv("MAXIOSIZE")) {
        grader::MAX_IO_SIZE = boost::lexical_cast<long>(getenv("MAXIOSIZE"));
    }

    if (!filesystem::exists(grader::RUN_DIR) && !filesystem::create_directories(grader::RUN_DIR)) {
        LOG_FATAL << "Run directory " << grader::RUN_DIR << " cannot be created";
        return EXIT_FAILURE;
    }
    if (!filesystem::is_directory(grader::DATA_DIR))
        LOG_WARN << "Data directory " << grader::DATA_DIR << " does not exist, every problem will have no test cases";

    LOG_DEBUG << "RUN_DIR = " << grader::RUN_DIR << ", DATA_DIR = " << grader::DATA_DIR << ", STATE_DIR = " << grader::STATE_DIR;

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    /*** executors ***/

    unique_ptr<grader::executor::executor_registry> registry;
    try {
        if (config.replace_builtin_executors)
            registry = make_unique<grader::executor::executor_registry>();
        else
            registry = grader::executor::make_builtin_registry();
        if (!config.executors.empty())
            registry->load(config.executors, false);
    } catch (std::exception &e) {
        LOG_FATAL << "Unable to load executors: " << e.what();
        return EXIT_FAILURE;
    }

    grader::sandbox::sandbox_runner runner(*registry, config.sandbox);
    grader::judge::directory_test_case_provider provider(grader::DATA_DIR);
    auto options = grader::judge::default_harness_options();
    options.continue_after_error = config.grading.continue_after_error;
    grader::judge::code_grader code_grader(runner, provider, options);

    /*** one-shot grading ***/

    if (vm.count("submit")) {
        if (!vm.count("language") || !vm.count("problem")) {
            cerr << "--submit requires --language and --problem" << endl;
            return EXIT_FAILURE;
        }
        try {
            string source = grader::read_file_content(vm["submit"].as<string>());
            auto report = code_grader.grade(vm["problem"].as<string>(), vm["language"].as<string>(),
                                            vm["version"].as<string>(), source, vm.count("staff") > 0);
            nlohmann::json j = report;
            cout << j.dump(4) << endl;
            return report.success ? EXIT_SUCCESS : EXIT_FAILURE;
        } catch (std::exception &e) {
            LOG_FATAL << boost::diagnostic_information(e);
            return EXIT_FAILURE;
        }
    }

    /*** monitor ***/

    grader::register_monitor(make_unique<grader::interrupt_monitor>());

    /*** metrics ***/

    std::string metric_addr = "0.0.0.0:9090";
    if (getenv("METRIC_ADDR")) {
        metric_addr = getenv("METRIC_ADDR");
    }
    if (vm.count("metric-addr")) {
        metric_addr = vm["metric-addr"].as<string>();
    }

    grader::metrics::service_metrics service(metric_addr);
    grader::register_monitor(make_unique<grader::prometheus_monitor>(grader::metrics::global_registry()));

    /*** worker ***/

    int workers = thread::hardware_concurrency();
    if (vm.count("workers")) {
        workers = vm["workers"].as<int>();
    } else if (getenv("WORKERS")) {
        workers = boost::lexical_cast<int>(getenv("WORKERS"));
    }
    if (workers <= 0) workers = 1;

    grader::store::file_blob_store blobs(grader::STATE_DIR);
    grader::store::result_store results(blobs);
    grader::jobs::job_store jobs(blobs);
    grader::jobs::local_task_queue queue(workers);
    grader::jobs::job_orchestrator orchestrator(queue, jobs, results, code_grader);
    orchestrator.register_tasks();

    if (config.callback) {
        orchestrator.on_job_finished(grader::server::http_callback(*config.callback, config.grading.disclose_private_results));
    }

    unique_ptr<grader::server::amqp_gateway> gateway;
    if (config.submission_queue) {
        gateway = make_unique<grader::server::amqp_gateway>(orchestrator, *config.submission_queue, config.report_queue,
                                                              config.grading.include_staff, config.grading.disclose_private_results);
        gateway->start();
    } else {
        LOG_WARN << "No submission queue configured, no grading request will be received";
    }

    queue.start();
    service.serving(workers);

    while (!sigint) {
        this_thread::sleep_for(chrono::milliseconds(100));
    }

    LOG_ERROR << "Received " << (sigint == SIGINT ? "SIGINT" : "SIGTERM") << ", stopping workers (Press Ctrl+C again to terminate this app)";
    grader::call_monitor([](grader::monitor &m) { m.interrupt_jobs(); });
    service.stopping();
    if (gateway) gateway->stop();
    queue.stop();
    LOG_INFO << "Stopped";
    return 0;
}
