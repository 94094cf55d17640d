#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <vector>
#include "grader/submission.hpp"

namespace grader {

/**
 * @brief 从生成结果的一行中读取提交
 * 兼容以下字段：
 * 1. id 为 task_id，其次为 id，都不存在时为 "unknown"；
 * 2. 源代码为 candidate_code，其次为 deal_response、solutions，
 *    若为数组则取第一个元素，若不是字符串则转换为 JSON 文本；
 * 3. input_output 可以是 JSON 字符串或者对象。
 * 测试规格不合法时不会抛出异常，而是记录在 invalid_reason 中
 */
candidate_submission parse_submission(const nlohmann::json &j);

/**
 * @brief 读取 JSONL 格式的生成结果文件
 * 忽略空行，跳过格式不合法的行并输出警告
 * @throw submission_format_error 文件不存在或者无法读取
 */
std::vector<candidate_submission> load_submissions(const std::filesystem::path &path);

}  // namespace grader
