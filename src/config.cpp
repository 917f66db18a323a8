#include "config.hpp"

namespace grader {
using namespace std;

string IMAGE_BUILD_MEMORY_LIMIT = "4g";
int IMAGE_BUILD_NPROC_LIMIT = 1000;
chrono::seconds IMAGE_BUILD_TIMEOUT{600};
string REGISTRY_HOST;
int REGISTRY_PORT = 5001;
filesystem::path RESULT_DIR = "/tmp/grader/results";
filesystem::path RUN_DIR = "/tmp/grader/run";
string DOCKER = "docker";
string SANDBOX_IMAGE = "jameslp/autograder-sandbox";
string SANDBOX_USER = "autograder";
string SANDBOX_WORKING_DIR = "/home/autograder/working_dir";
bool DEBUG = false;

}  // namespace grader
