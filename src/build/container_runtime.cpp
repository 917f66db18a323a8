#include "build/container_runtime.hpp"
#include <glog/logging.h>
#include "common/utils.hpp"

namespace grader {
using namespace std;

container_runtime::~container_runtime() {}

docker_runtime::docker_runtime(string docker) : docker(move(docker)) {}

vector<string> docker_runtime::build_command(const filesystem::path &build_dir, const string &tag) const {
    return {
        docker, "build",
        "--no-cache",
        "--pull",
        "--memory", IMAGE_BUILD_MEMORY_LIMIT,
        "--memory-swap", IMAGE_BUILD_MEMORY_LIMIT,
        "--ulimit", "nproc=" + to_string(IMAGE_BUILD_NPROC_LIMIT) + ":" + to_string(IMAGE_BUILD_NPROC_LIMIT),
        "--cpu-period=" + to_string(IMAGE_BUILD_CPU_PERIOD),
        "--cpu-quota=" + to_string(IMAGE_BUILD_CPU_QUOTA),
        "-t", tag,
        build_dir.string()};
}

unique_ptr<subprocess> docker_runtime::spawn_build(const filesystem::path &build_dir, const string &tag,
                                                   const filesystem::path &output_file) {
    process_options options;
    options.argv = build_command(build_dir, tag);
    options.output_file = output_file;
    LOG(INFO) << "Building image: " << join_args(options.argv);
    return make_unique<subprocess>(options);
}

nlohmann::json docker_runtime::inspect_config(const string &tag) {
    string output = check_output({docker, "inspect", "--format", "{{json .Config}}", tag});
    return nlohmann::json::parse(output);
}

void docker_runtime::push(const string &tag) {
    LOG(INFO) << "Pushing image " << tag;
    check_output({docker, "push", tag});
}

}  // namespace grader
