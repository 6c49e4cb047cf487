#include "common/exceptions.hpp"
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

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

configuration_error::configuration_error()
    : grader_exception() {}

configuration_error::configuration_error(const string &message)
    : grader_exception(message) {}

rejection_error::rejection_error(reason why, const string &message)
    : grader_exception(message), why_(why) {}

rejection_error::reason rejection_error::why() const noexcept {
    return why_;
}

sandbox_error::sandbox_error()
    : grader_exception() {}

sandbox_error::sandbox_error(const string &message)
    : grader_exception(message) {}

}  // namespace grader
