#include "grader/common/exceptions.hpp"
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

internal_error::internal_error()
    : grader_exception() {}

internal_error::internal_error(const string &message)
    : grader_exception(message) {}

submission_format_error::submission_format_error()
    : grader_exception() {}

submission_format_error::submission_format_error(const string &message)
    : grader_exception(message) {}

interrupted_error::interrupted_error()
    : grader_exception() {}

interrupted_error::interrupted_error(const string &message)
    : grader_exception(message) {}

}  // namespace grader
