#include "build/build_task.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<build_status, const char *> status_string = boost::assign::map_list_of
    (build_status::queued, "queued")
    (build_status::in_progress, "in_progress")
    (build_status::done, "done")
    (build_status::failed, "failed")
    (build_status::image_invalid, "image_invalid")
    (build_status::internal_error, "internal_error")
    (build_status::cancelled, "cancelled");
// clang-format on

string status_name(build_status status) {
    return status_string.at(status);
}

build_status build_status_from_string(const string &str) {
    for (auto &[status, name] : status_string)
        if (str == name) return status;
    throw invalid_argument("Unrecognized build status " + str);
}

bool is_terminal(build_status status) {
    return status != build_status::queued && status != build_status::in_progress;
}

bool can_transition(build_status from, build_status to) {
    switch (from) {
        case build_status::queued:
            return to == build_status::in_progress || to == build_status::cancelled;
        case build_status::in_progress:
            return to != build_status::queued && to != build_status::in_progress;
        default:
            return false;
    }
}

}  // namespace grader
