#include "sandbox/docker_sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <csignal>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

docker_sandbox::docker_sandbox(const string &image, const resource_limits &default_limits)
    : sandbox(default_limits), image_name(image) {}

docker_sandbox::~docker_sandbox() {
    try {
        destroy();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to remove container " << sandbox_name << ": " << boost::diagnostic_information(ex);
    }
}

const string &docker_sandbox::image() const {
    return image_name;
}

vector<string> docker_sandbox::exec_command(const vector<string> &argv, const resource_limits &limits, bool interactive) const {
    vector<string> cmd = {DOCKER, "exec"};
    if (interactive) cmd.push_back("--interactive");
    cmd.insert(cmd.end(), {"--user", SANDBOX_USER, "--workdir", SANDBOX_WORKING_DIR, sandbox_name, "prlimit"});
    // 容器内只有命令本身以 SANDBOX_USER 运行，因此进程数上限为可额外创建的进程数加一
    if (limits.max_num_processes)
        cmd.push_back(fmt::format("--nproc={0}:{0}", *limits.max_num_processes + 1));
    if (limits.max_stack_size)
        cmd.push_back(fmt::format("--stack={0}:{0}", *limits.max_stack_size));
    if (limits.max_virtual_memory)
        cmd.push_back(fmt::format("--as={0}:{0}", *limits.max_virtual_memory));
    cmd.push_back("--");
    cmd.insert(cmd.end(), argv.begin(), argv.end());
    return cmd;
}

void docker_sandbox::do_start() {
    check_output({DOCKER, "run",
                  "--detach", "--interactive",
                  "--name", sandbox_name,
                  "--hostname", "sandbox",
                  "--network", "none",
                  image_name});

    // 容器已经创建，之后的步骤失败时沙箱仍是 not_started，destroy 不会删除容器
    scoped_guard remove_container([this] {
        try {
            check_output({DOCKER, "rm", "--force", sandbox_name});
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to remove container " << sandbox_name << ": " << boost::diagnostic_information(ex);
        }
    });
    check_output({DOCKER, "exec", "--user", "root", sandbox_name,
                  "mkdir", "-p", SANDBOX_WORKING_DIR});
    check_output({DOCKER, "exec", "--user", "root", sandbox_name,
                  "chown", "-R", SANDBOX_USER, SANDBOX_WORKING_DIR});
    remove_container.dismiss();
}

void docker_sandbox::do_destroy() {
    check_output({DOCKER, "rm", "--force", sandbox_name});
}

void docker_sandbox::do_add_files(const vector<filesystem::path> &files) {
    for (auto &file : files)
        check_output({DOCKER, "cp", file.string(), sandbox_name + ":" + SANDBOX_WORKING_DIR});
    check_output({DOCKER, "exec", "--user", "root", sandbox_name,
                  "chown", "-R", SANDBOX_USER, SANDBOX_WORKING_DIR});
}

command_result docker_sandbox::do_run_command(const command_request &request, const resource_limits &limits) {
    process_options options;
    options.argv = exec_command(request.argv, limits, request.stdin_content.has_value());
    options.stdin_content = request.stdin_content;
    command_result result = run_process(options, request.timeout);

    // docker exec 以 128 + 信号值报告被信号杀死的命令，统一为负的信号值
    if (result.exit_code && *result.exit_code > 128 && *result.exit_code < 128 + NSIG)
        result.exit_code = 128 - *result.exit_code;

    if (result.timed_out) {
        // 杀死 docker exec 客户端不会杀死容器中的命令
        process_options kill_options;
        kill_options.argv = {DOCKER, "exec", "--user", SANDBOX_USER, sandbox_name, "kill", "-KILL", "-1"};
        process_result killed = run_process(kill_options, DEFAULT_SUBPROCESS_TIMEOUT);
        if (killed.timed_out)
            LOG(WARNING) << "Timed out killing processes in container " << sandbox_name;
    }
    return result;
}

}  // namespace grader
