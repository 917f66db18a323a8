#include "grading/project_files.hpp"
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;

project_file_store::~project_file_store() {}

directory_project_file_store::directory_project_file_store(const filesystem::path &directory)
    : dir(directory) {}

string directory_project_file_store::read(const string &name) const {
    filesystem::path path = dir / assert_safe_path(name);
    if (!filesystem::is_regular_file(path))
        throw configuration_error("Project file " + name + " does not exist");
    try {
        return read_file_content(path);
    } catch (system_error &ex) {
        throw configuration_error("Unable to read project file " + name + ": " + ex.what());
    }
}

const filesystem::path &directory_project_file_store::directory() const {
    return dir;
}

}  // namespace grader
