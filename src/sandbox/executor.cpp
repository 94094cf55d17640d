#include "grader/sandbox/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "grader/common/status.hpp"
#include "grader/sandbox/deadline.hpp"

namespace grader::sandbox {
using namespace std;
using namespace nlohmann;

sandbox_executor::sandbox_executor(interpreter &interp, chrono::milliseconds timeout)
    : interp(interp), timeout(timeout) {}

sandbox_outcome sandbox_executor::execute(const string &code, const test_spec &spec) {
    if (!scoped_deadline::supported())
        LOG_FIRST_N(WARNING, 1) << "SIGALRM is not available on this platform, test cases will not be interrupted on timeout";

    sandbox_outcome outcome;

    // 脚本模式的程序在顶层读取输入，加载时使用第一个数据点的输入
    json load_input;
    if (!spec.entry_point && !spec.cases.empty())
        load_input = spec.cases.front().input;

    unique_ptr<program> prog;
    {
        scoped_deadline deadline(timeout, interp);
        try {
            prog = interp.load(code, load_input);
        } catch (candidate_error &e) {
            outcome.load_failed = true;
            if (deadline.expired())
                outcome.verdicts.push_back(case_verdict::failed(get_error_name(error_kind::TIMEOUT), e.what()));
            else
                outcome.verdicts.push_back(case_verdict::failed(e.kind, e.what()));
            return outcome;
        }
    }

    for (auto &current : spec.cases)
        outcome.verdicts.push_back(run_case(*prog, spec, current));
    return outcome;
}

case_verdict sandbox_executor::run_case(program &prog, const test_spec &spec, const test_case &current) {
    scoped_deadline deadline(timeout, interp);
    try {
        invocation_result result = spec.entry_point
            ? prog.call(*spec.entry_point, current.input, current.expected_output)
            : prog.run_script(current.input, current.expected_output);

        // 选手程序吞掉了超时异常
        if (deadline.expired())
            return case_verdict::failed(get_error_name(error_kind::TIMEOUT), fmt::format("test case exceeded {} ms", timeout.count()));
        if (result.matched)
            return case_verdict::accepted();
        return case_verdict::failed(get_error_name(spec.entry_point ? error_kind::WRONG_OUTPUT : error_kind::WRONG_STDOUT), result.actual);
    } catch (candidate_error &e) {
        if (deadline.expired())
            return case_verdict::failed(get_error_name(error_kind::TIMEOUT), e.traceback);
        return case_verdict::failed(e.kind, e.traceback);
    }
}

}  // namespace grader::sandbox
