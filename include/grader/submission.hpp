#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 一个数据点
 * 输入和标准答案保持 JSON 的原始结构，由解释器转换为目标语言的值
 */
struct test_case {
    /**
     * @brief 数据点的输入
     * 函数模式下，若为数组，则数组元素按顺序作为入口函数的参数，否则整个值作为唯一的参数；
     * 脚本模式下，作为程序的标准输入（字符串原样输入，其他值转换为字符串）
     */
    nlohmann::json input;

    /**
     * @brief 标准答案
     * 函数模式下与返回值比较是否相等；脚本模式下转换为字符串后与标准输出比较
     */
    nlohmann::json expected_output;
};

/**
 * @brief 一个提交的测试规格
 */
struct test_spec {
    /**
     * @brief 入口函数名
     * 存在时为函数模式，否则为脚本模式
     */
    std::optional<std::string> entry_point;

    /**
     * @brief 按顺序排列的所有数据点
     */
    std::vector<test_case> cases;
};

/**
 * @brief 从 {inputs: [...], outputs: [...], fn_name?: string} 格式中读取测试规格
 * @throw std::invalid_argument 若 inputs/outputs 不是等长的数组，或者 fn_name 不是字符串
 */
void from_json(const nlohmann::json &j, test_spec &spec);

/**
 * @brief 从 input_output 字符串中读取测试规格
 * @throw std::invalid_argument 若字符串不是合法的 JSON，或者测试规格格式不合法
 */
test_spec parse_test_spec(const std::string &input_output);

/**
 * @brief 一个待评测的候选程序
 * 加载之后不再修改
 */
struct candidate_submission {
    /**
     * @brief 提交的 id，用于在乱序返回的结果中识别提交
     */
    std::string task_id;

    /**
     * @brief 候选程序的源代码
     */
    std::string candidate_code;

    /**
     * @brief 测试规格
     */
    test_spec spec;

    /**
     * @brief 测试规格不合法的原因，合法时为空
     * 不合法的提交不会被执行，而是直接得到 EvaluationError
     */
    std::string invalid_reason;

    bool valid() const;
};

template <typename T>
T &operator<<(T &os, const candidate_submission &submit) {
    os << "Submission[" << submit.task_id << "]";
    return os;
}

}  // namespace grader
