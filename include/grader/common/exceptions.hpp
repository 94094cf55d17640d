#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是评测系统自身的问题（比如 worker 协议被破坏、解释器无法初始化），
 * 和选手程序在沙箱内抛出的错误无关
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示整个评测输入文件无法读取
 * 这是唯一会终止整个评测的错误，单行格式错误不会抛出该异常
 */
struct submission_format_error : public grader_exception {
    submission_format_error();
    explicit submission_format_error(const std::string &message);
};

/**
 * @brief 表示评测被操作者中断（比如 SIGINT）
 * 抛出该异常时所有 worker 已经被终止，调用方不应该发布不完整的统计结果
 */
struct interrupted_error : public grader_exception {
    interrupted_error();
    explicit interrupted_error(const std::string &message);
};

}  // namespace grader
