#include "sandbox/local_sandbox.hpp"
#include <glog/logging.h>
#include <system_error>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

local_sandbox::local_sandbox(const resource_limits &default_limits, const fs::path &root)
    : sandbox(default_limits), root(root) {}

local_sandbox::~local_sandbox() {
    destroy();
}

fs::path local_sandbox::working_directory() const {
    return root / sandbox_name;
}

void local_sandbox::do_start() {
    fs::create_directories(working_directory());
}

void local_sandbox::do_destroy() {
    if (DEBUG) {
        LOG(INFO) << "Debug mode, keeping sandbox directory " << working_directory();
        return;
    }
    error_code ec;
    fs::remove_all(working_directory(), ec);
    if (ec)
        LOG(WARNING) << "Unable to remove sandbox directory " << working_directory() << ": " << ec.message();
}

void local_sandbox::do_add_files(const vector<fs::path> &files) {
    for (auto &file : files) {
        fs::copy(file, working_directory() / file.filename(),
                 fs::copy_options::recursive | fs::copy_options::overwrite_existing);
    }
}

command_result local_sandbox::do_run_command(const command_request &request, const resource_limits &limits) {
    process_options options;
    options.argv = request.argv;
    options.stdin_content = request.stdin_content;
    options.working_directory = working_directory();
    options.limits = limits;
    options.limit_processes = false;
    options.new_session = true;
    return run_process(options, request.timeout);
}

}  // namespace grader
