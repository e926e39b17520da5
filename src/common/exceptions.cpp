#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : grader_exception(message) {}

network_error::network_error(const string &message)
    : grader_exception(message) {}

schema_validation_error::schema_validation_error(const string &message)
    : grader_exception(message) {}

malformed_trailer_error::malformed_trailer_error(const string &message)
    : grader_exception(message) {}

delivery_error::delivery_error(const string &message, long status_code)
    : grader_exception(message), status_code(status_code) {}

queue_unavailable::queue_unavailable(const string &message)
    : grader_exception(message) {}

authentication_error::authentication_error(const string &message)
    : grader_exception(message) {}

}  // namespace grader
