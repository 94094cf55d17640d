#pragma once

namespace grader {

/**
 * @brief 评测系统自己产生的错误类型
 * 选手程序抛出的异常直接使用异常自身的类型名（比如 ZeroDivisionError），不在此列
 */
enum class error_kind {
    /**
     * @brief 函数模式下，入口函数的返回值和标准答案不相等
     */
    WRONG_OUTPUT = 0,

    /**
     * @brief 脚本模式下，程序的标准输出和标准答案不一致（忽略首尾空白字符）
     */
    WRONG_STDOUT = 1,

    /**
     * @brief 单个数据点的运行时间超过了限制
     */
    TIMEOUT = 2,

    /**
     * @brief 评测系统无法完成该提交的评测
     * 比如 worker 进程崩溃、worker 超过了整个提交的硬性时间限制、
     * 测试数据格式不合法，与选手程序在沙箱内正常产生的错误相区分
     */
    EVALUATION_ERROR = 3
};

/**
 * @brief 获得错误类型在结果文件中的名字
 */
const char *get_error_name(error_kind);

}  // namespace grader
