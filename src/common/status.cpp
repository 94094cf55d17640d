#include "grader/common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<error_kind, const char *> error_names = boost::assign::map_list_of
    (error_kind::WRONG_OUTPUT, "WrongOutput")
    (error_kind::WRONG_STDOUT, "WrongStdout")
    (error_kind::TIMEOUT, "Timeout")
    (error_kind::EVALUATION_ERROR, "EvaluationError");
// clang-format on

const char *get_error_name(error_kind kind) {
    return error_names.at(kind);
}

}  // namespace grader
