#include "env.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

template <typename T>
static T parse_env(const char *key, const T &def_value) {
    const char *value = getenv(key);
    if (!value) return def_value;
    try {
        return boost::lexical_cast<T>(value);
    } catch (boost::bad_lexical_cast &) {
        throw configuration_error(string("Environment variable ") + key + " has invalid value " + value);
    }
}

void load_environment() {
    IMAGE_BUILD_MEMORY_LIMIT = get_env("IMAGE_BUILD_MEMORY_LIMIT", IMAGE_BUILD_MEMORY_LIMIT);
    IMAGE_BUILD_NPROC_LIMIT = parse_env<int>("IMAGE_BUILD_NPROC_LIMIT", IMAGE_BUILD_NPROC_LIMIT);
    IMAGE_BUILD_TIMEOUT = chrono::seconds(parse_env<long>("IMAGE_BUILD_TIMEOUT", IMAGE_BUILD_TIMEOUT.count()));
    REGISTRY_HOST = get_env("SANDBOX_IMAGE_REGISTRY_HOST", REGISTRY_HOST);
    REGISTRY_PORT = parse_env<int>("SANDBOX_IMAGE_REGISTRY_PORT", REGISTRY_PORT);
    RESULT_DIR = get_env("RESULT_DIR", RESULT_DIR.string());
    RUN_DIR = get_env("RUN_DIR", RUN_DIR.string());
    DOCKER = get_env("DOCKER", DOCKER);
    SANDBOX_IMAGE = get_env("SANDBOX_IMAGE", SANDBOX_IMAGE);
    if (getenv("DEBUG")) DEBUG = true;

    if (IMAGE_BUILD_NPROC_LIMIT <= 0)
        throw configuration_error("IMAGE_BUILD_NPROC_LIMIT must be positive");
    if (IMAGE_BUILD_TIMEOUT.count() <= 0)
        throw configuration_error("IMAGE_BUILD_TIMEOUT must be positive");

    LOG(INFO) << "Image build limits: memory=" << IMAGE_BUILD_MEMORY_LIMIT
              << ", nproc=" << IMAGE_BUILD_NPROC_LIMIT
              << ", timeout=" << IMAGE_BUILD_TIMEOUT.count() << "s";
}

}  // namespace grader
