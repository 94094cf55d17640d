#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * 这个头文件包含程序解释器的抽象
 * 评测核心（executor、worker、scheduler）与语言无关，只有解释器的实现会动态执行选手代码。
 * 对于每种目标语言，需要实现 interpreter 和 program 两个接口。
 */
namespace grader::sandbox {

/**
 * @brief 表示选手程序在沙箱内抛出的错误
 * 比如语法错误、运行时异常、超时中断。评测系统自身的错误不使用这个类型
 */
struct candidate_error : public std::runtime_error {
public:
    /**
     * @brief 错误类型，为目标语言中异常的类型名，比如 ZeroDivisionError
     */
    const std::string kind;

    /**
     * @brief 完整的调用栈
     */
    const std::string traceback;

    candidate_error(const std::string &kind, const std::string &message, const std::string &traceback);
};

/**
 * @brief 一次调用的结果
 */
struct invocation_result {
    /**
     * @brief 实际输出是否与标准答案相等
     */
    bool matched;

    /**
     * @brief 实际输出
     * 函数模式下为返回值的字符串表示，脚本模式下为捕获的标准输出
     */
    std::string actual;
};

/**
 * @brief 表示一个已经加载到独立命名空间内的选手程序
 */
struct program {
    virtual ~program();

    /**
     * @brief 函数模式：调用程序中的入口函数并与标准答案比较
     * @param entry_point 入口函数名，每次调用时重新查找
     * @param input 若为数组，则按顺序展开为位置参数，否则作为唯一的参数
     * @param expected 标准答案，使用目标语言的相等比较
     * @throw candidate_error 入口函数不存在或者调用时抛出异常
     */
    virtual invocation_result call(const std::string &entry_point, const nlohmann::json &input, const nlohmann::json &expected) = 0;

    /**
     * @brief 脚本模式：在同一个命名空间内重新执行整个程序，捕获标准输出并与标准答案比较
     * 比较时忽略首尾空白字符
     * @param input 作为程序的标准输入
     * @param expected 标准答案，转换为字符串后比较
     * @throw candidate_error 程序执行时抛出异常
     */
    virtual invocation_result run_script(const nlohmann::json &input, const nlohmann::json &expected) = 0;
};

/**
 * @brief 可以被抢占式打断的执行环境
 * interrupt 会在信号处理函数中被调用，实现必须是异步信号安全的
 */
struct interruptible {
    virtual ~interruptible();

    virtual void interrupt() noexcept = 0;

    /**
     * @brief 丢弃尚未处理的中断请求
     * 在设置新的时间限制之前调用，上一个时间限制迟到的信号不会打断新的执行
     */
    virtual void reset() noexcept = 0;
};

/**
 * @brief 程序解释器
 * 每个 worker 进程持有一个解释器，解释器只能在创建它的线程（主线程）上使用
 */
struct interpreter : public interruptible {
    /**
     * @brief 目标语言的名称，用于日志
     */
    virtual std::string language() const = 0;

    /**
     * @brief 静态检查源代码能否通过语法分析，不执行代码
     */
    virtual bool check_syntax(const std::string &source) = 0;

    /**
     * @brief 将源代码加载到一个全新的独立命名空间中
     * 加载时程序的输出会被丢弃
     * @param input 加载时作为标准输入的数据，为 null 时标准输入为空。
     *        脚本模式的程序在顶层读取输入，因此加载时需要提供第一个数据点的输入
     * @throw candidate_error 加载时出现语法错误或者顶层代码抛出异常
     */
    virtual std::unique_ptr<program> load(const std::string &source, const nlohmann::json &input) = 0;
};

}  // namespace grader::sandbox
