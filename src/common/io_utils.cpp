#include "common/io_utils.hpp"
#include <fstream>
#include <iterator>
#include <system_error>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

string read_file_content(const filesystem::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    filesystem::path p(subpath);
    if (subpath.empty() || p.is_absolute())
        throw configuration_error("path is not safe: " + subpath);
    for (auto &part : p)
        if (part == "..")
            throw configuration_error("path is not safe: " + subpath);
    return subpath;
}

}  // namespace grader
