#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::SECURITY_REJECTED, "Security Rejected")
    (status::BINARY_UNAVAILABLE, "Binary Unavailable")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::EVALUATOR_PROTOCOL_ERROR, "Evaluator Protocol Error")
    (status::UNSUPPORTED_LANGUAGE, "Unsupported Language")
    (status::CHALLENGE_NOT_FOUND, "Challenge Not Found")
    (status::SYSTEM_ERROR, "System Error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

}  // namespace sandbox
