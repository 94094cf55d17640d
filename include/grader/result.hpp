#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 数据点的错误描述
 * 在结果文件中保存为 {name, value}
 */
struct case_error {
    /**
     * @brief 错误类型
     * WrongOutput、WrongStdout、Timeout、EvaluationError，或者选手程序抛出的异常的类型名
     */
    std::string name;

    /**
     * @brief 错误详情
     * 答案错误时为选手程序的实际输出，异常时为完整的调用栈
     */
    std::string value;
};

void to_json(nlohmann::json &j, const case_error &error);
void from_json(const nlohmann::json &j, case_error &error);

/**
 * @brief 单个数据点的评测结果
 */
struct case_verdict {
    bool passed = false;

    /**
     * @brief 通过时为空
     */
    std::optional<case_error> error;

    static case_verdict accepted();
    static case_verdict failed(const std::string &name, const std::string &value);
};

/**
 * @brief 沙箱对一个候选程序的执行结果
 * 要么包含和数据点一一对应的所有结果，要么 load_failed 为真且只包含一个表示加载失败的结果
 */
struct sandbox_outcome {
    bool load_failed = false;
    std::vector<case_verdict> verdicts;
};

/**
 * @brief 一个提交的评测结果
 * 由 worker 创建一次之后不再修改，统计时只读取
 */
struct execution_result {
    std::string task_id;

    /**
     * @brief 源代码能否通过语法检查，与执行结果无关
     */
    bool syntax_valid = false;

    /**
     * @brief 是否为加载失败（或者评测系统错误）的占位结果
     * 此时 verdicts 只包含一个元素，不和数据点一一对应
     */
    bool load_failed = false;

    std::vector<case_verdict> verdicts;

    std::size_t num_tests = 0;

    std::size_t num_passed = 0;

    /**
     * @brief 所有数据点是否都通过
     * 没有数据点时为真（空集上的与运算）
     */
    bool passed() const;

    /**
     * @brief 按数据点顺序找到的第一个错误的类型
     * 用于错误类型直方图，通过的提交返回空
     */
    std::optional<std::string> first_error_name() const;

    /**
     * @brief 根据沙箱的执行结果构造评测结果
     * @param num_cases 测试规格中的数据点数量。加载失败时所有数据点都视为未通过
     */
    static execution_result from_outcome(const std::string &task_id, bool syntax_valid, std::size_t num_cases, sandbox_outcome &&outcome);

    /**
     * @brief 构造评测系统错误的结果
     * 只包含一个 EvaluationError，且数据点数量记为 0
     */
    static execution_result evaluation_error(const std::string &task_id, bool syntax_valid, const std::string &message);
};

void to_json(nlohmann::json &j, const execution_result &result);
void from_json(const nlohmann::json &j, execution_result &result);

}  // namespace grader
