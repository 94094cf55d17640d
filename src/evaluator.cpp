#include "grader/evaluator.hpp"
#include <glog/logging.h>
#include "grader/config.hpp"
#include "grader/sandbox/python_interpreter.hpp"

namespace grader {
using namespace std;

evaluator::~evaluator() = default;

sandbox_evaluator::sandbox_evaluator(unique_ptr<sandbox::interpreter> interp, chrono::milliseconds timeout)
    : interp(move(interp)), executor(*this->interp, timeout) {}

bool sandbox_evaluator::syntax_valid(const candidate_submission &submission) {
    return interp->check_syntax(submission.candidate_code);
}

execution_result sandbox_evaluator::evaluate(const candidate_submission &submission, bool syntax_valid) {
    if (!submission.valid()) {
        LOG(WARNING) << submission << " has an invalid test specification: " << submission.invalid_reason;
        return execution_result::evaluation_error(submission.task_id, syntax_valid, submission.invalid_reason);
    }

    return execution_result::from_outcome(submission.task_id, syntax_valid, submission.spec.cases.size(),
                                          executor.execute(submission.candidate_code, submission.spec));
}

evaluator_factory python_evaluator_factory() {
    return [] {
        auto interp = make_unique<sandbox::python_interpreter>();
        LOG(INFO) << "Initialized " << interp->language() << " interpreter";
        return make_unique<sandbox_evaluator>(move(interp), CASE_TIMEOUT);
    };
}

}  // namespace grader
