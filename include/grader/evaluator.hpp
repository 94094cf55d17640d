#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include "grader/result.hpp"
#include "grader/sandbox/executor.hpp"
#include "grader/submission.hpp"

namespace grader {

/**
 * @brief 评测一个提交
 * worker 进程在 fork 之后通过 evaluator_factory 创建自己的 evaluator，
 * 因此实现可以持有进程内唯一的资源（比如嵌入式解释器）
 */
struct evaluator {
    virtual ~evaluator();

    /**
     * @brief 静态检查提交的源代码能否通过语法分析
     */
    virtual bool syntax_valid(const candidate_submission &submission) = 0;

    /**
     * @brief 运行提交的所有数据点
     * @param syntax_valid syntax_valid 的结果，原样记录在评测结果中
     */
    virtual execution_result evaluate(const candidate_submission &submission, bool syntax_valid) = 0;
};

typedef std::function<std::unique_ptr<evaluator>()> evaluator_factory;

/**
 * @brief 使用解释器和沙箱运行提交的 evaluator
 * 测试规格不合法的提交不会被运行，直接得到 EvaluationError
 */
struct sandbox_evaluator : public evaluator {
    sandbox_evaluator(std::unique_ptr<sandbox::interpreter> interp, std::chrono::milliseconds timeout);

    bool syntax_valid(const candidate_submission &submission) override;

    execution_result evaluate(const candidate_submission &submission, bool syntax_valid) override;

private:
    std::unique_ptr<sandbox::interpreter> interp;
    sandbox::sandbox_executor executor;
};

/**
 * @brief 创建使用嵌入式 Python 解释器的 evaluator
 * 单个数据点的时间限制在调用工厂时从 CASE_TIMEOUT 读取
 */
evaluator_factory python_evaluator_factory();

}  // namespace grader
