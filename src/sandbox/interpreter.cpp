#include "grader/sandbox/interpreter.hpp"

namespace grader::sandbox {
using namespace std;

candidate_error::candidate_error(const string &kind, const string &message, const string &traceback)
    : runtime_error(message), kind(kind), traceback(traceback) {}

program::~program() = default;

interruptible::~interruptible() = default;

}  // namespace grader::sandbox
