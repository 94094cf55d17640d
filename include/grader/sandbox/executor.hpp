#pragma once

#include <chrono>
#include <string>
#include "grader/result.hpp"
#include "grader/sandbox/interpreter.hpp"
#include "grader/submission.hpp"

namespace grader::sandbox {

/**
 * @brief 在沙箱中针对测试规格运行一个候选程序
 *
 * 先将程序加载到全新的命名空间中，加载失败时返回只包含一个结果的占位结果；
 * 否则按顺序运行每个数据点，每个数据点单独计时，选手程序抛出的异常在数据点内被捕获并记录，
 * 不会影响后续数据点。
 * 只有评测系统自身的错误（不是 candidate_error 的异常）会抛出给调用方
 */
struct sandbox_executor {
    /**
     * @param interp 用于加载和运行程序的解释器
     * @param timeout 单个数据点的时间限制
     */
    sandbox_executor(interpreter &interp, std::chrono::milliseconds timeout);

    sandbox_outcome execute(const std::string &code, const test_spec &spec);

private:
    case_verdict run_case(program &prog, const test_spec &spec, const test_case &current);

    interpreter &interp;
    std::chrono::milliseconds timeout;
};

}  // namespace grader::sandbox
