#include "sandbox/sandbox.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

sandbox::sandbox(const resource_limits &default_limits)
    : sandbox_name(random_hex()), limits(default_limits) {
    validate_resource_limits(limits);
}

sandbox::~sandbox() {}

const string &sandbox::name() const {
    return sandbox_name;
}

sandbox_state sandbox::state() const {
    return current_state;
}

const resource_limits &sandbox::default_limits() const {
    return limits;
}

void sandbox::start() {
    if (current_state != sandbox_state::not_started)
        throw internal_error("Sandbox " + sandbox_name + " has already been started");
    do_start();
    current_state = sandbox_state::active;
    LOG(INFO) << "Sandbox " << sandbox_name << " started";
}

void sandbox::destroy() {
    if (current_state != sandbox_state::active) {
        current_state = sandbox_state::torn_down;
        return;
    }
    current_state = sandbox_state::torn_down;
    do_destroy();
    LOG(INFO) << "Sandbox " << sandbox_name << " destroyed";
}

void sandbox::add_files(const vector<filesystem::path> &files) {
    if (current_state != sandbox_state::active)
        throw internal_error("Sandbox " + sandbox_name + " is not active");
    do_add_files(files);
}

command_result sandbox::run_command(const command_request &request) {
    if (current_state != sandbox_state::active)
        throw internal_error("Sandbox " + sandbox_name + " is not active");
    if (request.argv.empty())
        throw internal_error("Empty command");

    resource_limits effective = merge_limits(limits, request.limits);
    validate_resource_limits(effective);
    return do_run_command(request, effective);
}

sandbox_guard::sandbox_guard(sandbox &box) : box(box) {
    box.start();
}

sandbox_guard::~sandbox_guard() {
    try {
        box.destroy();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to destroy sandbox " << box.name() << ": " << boost::diagnostic_information(ex);
    }
}

sandbox &sandbox_guard::operator*() const {
    return box;
}

sandbox *sandbox_guard::operator->() const {
    return &box;
}

}  // namespace grader
