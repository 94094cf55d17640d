#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "grader/metrics/summary.hpp"
#include "grader/result.hpp"

namespace grader::metrics {

/**
 * @brief <run>_data.json 中的一行
 * {task_id, passed, syntax_valid, error: [{name, value} | null, ...], num_tests, num_passed}
 */
struct result_record {
    std::string task_id;
    bool passed = false;
    bool syntax_valid = false;

    /**
     * @brief 和数据点一一对应的错误，通过的数据点为空；加载失败时只有一个元素
     */
    std::vector<std::optional<case_error>> error;

    std::size_t num_tests = 0;
    std::size_t num_passed = 0;

    static result_record from_result(const execution_result &result);
};

void to_json(nlohmann::json &j, const result_record &record);
void from_json(const nlohmann::json &j, result_record &record);

/**
 * @brief 将评测结果写入输出文件夹
 *
 * output_dir
 * ├── <run_name>_data.json // 每行一个 result_record
 * ├── <run_name>_errors.json // 错误类型直方图
 * └── <run_name>_summary.json // 统计指标
 *
 * @param run_name 评测名，必须是单个文件名
 * @throw std::runtime_error 评测名不安全
 * @throw std::system_error 无法写入文件
 */
void write_results(const std::filesystem::path &output_dir, const std::string &run_name, const std::vector<execution_result> &results, const evaluation_summary &summary);

/**
 * @brief 读取 <run>_data.json
 * @throw std::system_error 无法读取文件
 * @throw nlohmann::json::exception 文件格式不合法
 */
std::vector<result_record> load_results(const std::filesystem::path &path);

}  // namespace grader::metrics
