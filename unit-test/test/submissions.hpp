#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "grader/loader.hpp"
#include "grader/submission.hpp"

/**
 * @brief 构造函数模式的提交
 */
inline grader::candidate_submission function_submission(const std::string &task_id, const std::string &code, const std::string &fn_name, const nlohmann::json &inputs, const nlohmann::json &outputs) {
    return grader::parse_submission({{"task_id", task_id},
                                     {"candidate_code", code},
                                     {"input_output", nlohmann::json{{"inputs", inputs}, {"outputs", outputs}, {"fn_name", fn_name}}.dump()}});
}

/**
 * @brief 构造脚本模式的提交
 */
inline grader::candidate_submission script_submission(const std::string &task_id, const std::string &code, const nlohmann::json &inputs, const nlohmann::json &outputs) {
    return grader::parse_submission({{"task_id", task_id},
                                     {"candidate_code", code},
                                     {"input_output", nlohmann::json{{"inputs", inputs}, {"outputs", outputs}}.dump()}});
}
