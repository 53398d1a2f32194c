#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace solbuild {
using namespace std;

build_exception::build_exception()
    : build_exception("") {}

build_exception::build_exception(const string &message, int exit_code)
    : message(message), code(exit_code), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *build_exception::what() const noexcept {
    return message.c_str();
}

int build_exception::exit_code() const noexcept {
    return code;
}

std::ostream &operator<<(std::ostream &os, const build_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

argument_error::argument_error(const string &message)
    : build_exception(message, E_ARGUMENT_ERROR) {}

configuration_error::configuration_error(const string &message)
    : build_exception(message, E_CONFIGURATION_ERROR) {}

unsupported_language_error::unsupported_language_error(const string &extension)
    : build_exception("Unknown solution extension: " + extension, E_CONFIGURATION_ERROR) {}

unsupported_grader_error::unsupported_grader_error(const string &message)
    : build_exception(message, E_CONFIGURATION_ERROR) {}

compilation_error::compilation_error(const string &what, int tool_exit_code, const string &error_log)
    : build_exception(what, tool_exit_code), error_log(error_log) {}

artifact_not_produced::artifact_not_produced(const string &message)
    : build_exception(message, E_CONFIGURATION_ERROR) {}

interpreter_not_found::interpreter_not_found(const string &message)
    : build_exception(message, E_CONFIGURATION_ERROR) {}

template_not_found::template_not_found(const string &message)
    : build_exception(message, E_CONFIGURATION_ERROR) {}

io_error::io_error(const string &message)
    : build_exception(message, E_CONFIGURATION_ERROR) {}

manager_build_error::manager_build_error(const string &message, int exit_code)
    : build_exception(message, exit_code) {}

hook_error::hook_error(const string &message, int exit_code)
    : build_exception(message, exit_code) {}

illegal_state_error::illegal_state_error(const string &message)
    : build_exception("Illegal state; " + message, E_ILLEGAL_STATE) {}

int tool_exit_code(int ret) noexcept {
    return ret > 0 ? ret : E_CONFIGURATION_ERROR;
}

}  // namespace solbuild
