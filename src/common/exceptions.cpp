#include "common/exceptions.hpp"
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

string grader_exception::diagnostic() const {
    stringstream ss;
    ss << *this;
    return ss.str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : grader_exception() {}

internal_error::internal_error(const string &message)
    : grader_exception(message) {}

database_error::database_error()
    : grader_exception() {}

database_error::database_error(const string &message)
    : grader_exception(message) {}

configuration_error::configuration_error()
    : grader_exception() {}

configuration_error::configuration_error(const string &message)
    : grader_exception(message) {}

command_error::command_error(const vector<string> &argv, int exit_code, const string &output)
    : grader_exception("Command '" + boost::algorithm::join(argv, " ") + "' returned non-zero exit status " + to_string(exit_code)),
      argv(argv), code(exit_code), command_output(output) {}

const vector<string> &command_error::command() const noexcept {
    return argv;
}

int command_error::exit_code() const noexcept {
    return code;
}

const string &command_error::output() const noexcept {
    return command_output;
}

string describe_exception(const exception &ex) {
    string result;
    if (auto grader_ex = dynamic_cast<const grader_exception *>(&ex))
        result = grader_ex->diagnostic();
    else
        result = boost::diagnostic_information(ex);

    if (auto cmd_ex = dynamic_cast<const command_error *>(&ex))
        result += "\n" + cmd_ex->output();
    return result;
}

}  // namespace grader
