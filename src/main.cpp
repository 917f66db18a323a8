#include <glog/logging.h>
#include <signal.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>
#include "build/build_orchestrator.hpp"
#include "build/container_runtime.hpp"
#include "build/mysql_build_task_store.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "env.hpp"
#include "grading/grader.hpp"
#include "sandbox/docker_sandbox.hpp"
#include "sandbox/local_sandbox.hpp"
#include "server/config.hpp"
#include "server/rabbitmq.hpp"
#include "worker.hpp"
using namespace std;

grader::concurrent_queue<grader::build_request> request_queue;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, stopping workers";
    grader::stop_workers();
}

/**
 * @brief 在沙箱中运行一个评分任务，结果以 JSON 输出到 stdout
 */
static int grade(const filesystem::path &request_file, const optional<filesystem::path> &project_dir, bool use_local_sandbox) {
    auto j = nlohmann::json::parse(grader::read_file_content(request_file));
    auto context = j.get<grader::submission_context>();

    // 没有指定项目文件目录时，使用评分任务文件所在的目录
    grader::directory_project_file_store project_files(
        project_dir.value_or(filesystem::absolute(request_file).parent_path()));
    context.project_files = &project_files;

    unique_ptr<grader::sandbox> box;
    if (use_local_sandbox)
        box = make_unique<grader::local_sandbox>();
    else
        box = make_unique<grader::docker_sandbox>();

    vector<grader::recorded_command_result> results;
    {
        grader::sandbox_guard guard(*box);
        results = grader::run(context, *box);
    }

    cout << nlohmann::json(results).dump(4) << endl;
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, sigintHandler);

    namespace po = boost::program_options;
    po::options_description desc("grader-worker options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "configuration file with amqp, database and registry settings, in JSON format.")
        ("workers", po::value<unsigned>()->default_value(1), "number of image builds running concurrently.")
        ("cancel", po::value<int>(), "mark the build task with given id cancelled and exit.")
        ("grade", po::value<string>(), "run the grading request in given JSON file in a sandbox, print command results and exit.")
        ("project-dir", po::value<string>(), "directory containing project files referenced by the grading request.")
        ("local-sandbox", "run graded commands in a local directory instead of a docker container.")
        ("debug", "turn on the debug mode to keep sandbox directories after grading.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader-worker: build sandbox images requested from the message queue, run graded commands in sandboxes" << endl
             << "Optional Environment Variables:" << endl
             << "\tIMAGE_BUILD_MEMORY_LIMIT, IMAGE_BUILD_NPROC_LIMIT, IMAGE_BUILD_TIMEOUT" << endl
             << "\tSANDBOX_IMAGE_REGISTRY_HOST, SANDBOX_IMAGE_REGISTRY_PORT" << endl
             << "\tRESULT_DIR, RUN_DIR, DOCKER, SANDBOX_IMAGE, DEBUG" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader-worker 1.0" << endl;
        return EXIT_SUCCESS;
    }

    try {
        grader::load_environment();
    } catch (grader::configuration_error& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug")) grader::DEBUG = true;

    if (vm.count("grade")) {
        optional<filesystem::path> project_dir;
        if (vm.count("project-dir")) project_dir = vm.at("project-dir").as<string>();
        try {
            return grade(vm.at("grade").as<string>(), project_dir, vm.count("local-sandbox") > 0);
        } catch (std::exception& e) {
            LOG(ERROR) << "Unable to grade " << vm.at("grade").as<string>() << ": " << grader::describe_exception(e);
            return EXIT_FAILURE;
        }
    }

    CHECK(vm.count("config")) << "--config is required unless --grade is given";
    string config_file = vm.at("config").as<string>();
    CHECK(filesystem::is_regular_file(config_file))
        << "Configuration file " << config_file << " does not exist";

    grader::server::worker_config config;
    try {
        config = nlohmann::json::parse(grader::read_file_content(config_file)).get<grader::server::worker_config>();
    } catch (std::exception& e) {
        LOG(FATAL) << "Configuration file " << config_file << " is malformed: " << e.what();
    }

    if (config.image_registry) {
        grader::REGISTRY_HOST = config.image_registry->host;
        grader::REGISTRY_PORT = config.image_registry->port;
    }

    grader::mysql_build_task_store store(config.db);
    grader::docker_runtime runtime;
    grader::build_orchestrator orchestrator(store, runtime);

    if (vm.count("cancel")) {
        int task_id = vm.at("cancel").as<int>();
        if (orchestrator.request_cancel(task_id)) {
            cout << "Build task " << task_id << " cancelled" << endl;
            return EXIT_SUCCESS;
        } else {
            cerr << "Build task " << task_id << " has already finished" << endl;
            return EXIT_FAILURE;
        }
    }

    CHECK(config.build_queue) << "Configuration file " << config_file << " has no amqp section";
    unsigned workers = vm.at("workers").as<unsigned>();
    CHECK(workers > 0) << "--workers must be positive";

    grader::server::rabbitmq mq(*config.build_queue, (int)workers);

    vector<thread> worker_threads;
    worker_threads.push_back(grader::start_fetcher(mq, request_queue));
    for (unsigned i = 0; i < workers; ++i)
        worker_threads.push_back(grader::start_worker(i, orchestrator, request_queue));

    for (auto& th : worker_threads)
        th.join();

    return 0;
}
