#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "grader/result.hpp"

namespace grader::metrics {

/**
 * @brief 一次评测的统计指标
 */
struct evaluation_summary {
    std::size_t total_problems = 0;
    std::size_t passed_problems = 0;
    std::size_t failed_problems = 0;

    /**
     * @brief 通过的提交占所有提交的比例，没有提交时为 0
     */
    double pass_at_1 = 0;

    /**
     * @brief 通过的数据点占所有数据点的比例，没有数据点时为 0
     */
    double test_case_accuracy = 0;

    /**
     * @brief 能通过语法检查的提交占所有提交的比例，没有提交时为 0
     */
    double syntax_validity_rate = 0;

    std::size_t total_test_cases = 0;
    std::size_t passed_test_cases = 0;
    std::size_t syntax_valid_count = 0;

    /**
     * @brief 错误类型直方图
     * 每个未通过的提交只统计按数据点顺序的第一个错误，通过的提交不计入
     */
    std::map<std::string, std::size_t> error_histogram;
};

/**
 * @brief 统计所有的评测结果
 * 结果的顺序不影响统计结果
 */
evaluation_summary summarize(const std::vector<execution_result> &results);

/**
 * @brief 保留 4 位小数
 */
double round_rate(double rate);

/**
 * @brief 生成 <run>_summary.json 的内容
 * 比例保留 4 位小数
 */
nlohmann::json summary_json(const std::string &model, const evaluation_summary &summary);

/**
 * @brief 在控制台打印评测报告
 * 包括总数、三个关键指标、失败数量以及最常见的 5 种错误类型
 */
void print_report(std::ostream &os, const std::string &model, const evaluation_summary &summary);

}  // namespace grader::metrics
