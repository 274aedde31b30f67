#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace sandbox {
using namespace std;

sandbox_exception::sandbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *sandbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : sandbox_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : sandbox_exception("Unsupported language for grading: " + language), language(language) {}

evaluator_protocol_error::evaluator_protocol_error(const string &message)
    : sandbox_exception(message) {}

challenge_not_found::challenge_not_found(const string &id)
    : sandbox_exception("Challenge not found: " + id), id(id) {}

}  // namespace sandbox
