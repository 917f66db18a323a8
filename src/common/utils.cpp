#include "common/utils.hpp"
#include <boost/algorithm/string/erase.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdlib>
#include <mutex>

namespace grader {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string random_hex() {
    // random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    boost::uuids::uuid id;
    {
        scoped_lock guard(generator_mutex);
        id = generator();
    }
    return boost::algorithm::erase_all_copy(boost::uuids::to_string(id), "-");
}

string join_args(const vector<string> &args) {
    return boost::algorithm::join(args, " ");
}

}  // namespace grader
