#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 覆盖写入文本文件，必要时创建父文件夹
 * @throw std::system_error 文件无法打开或写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 是单个文件名，不会出现返回上一层目录的情况
 * 评测名会被用来拼接输出文件的路径，如果评测名包含 "../" 或者 "/"，
 * 那么最后有可能导致输出目录以外的文件被覆盖。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace grader
