#pragma once

#include <boost/python.hpp>
#include "grader/sandbox/interpreter.hpp"

namespace grader::sandbox {

/**
 * @brief 替换 sys.stdout 和 sys.stdin 的作用域对象
 * 构造时将标准输出重定向到私有的 io.StringIO，并以 input 作为标准输入；
 * 析构时恢复原来的流，已经设置的 Python 错误会被保留
 */
struct stream_capture {
    explicit stream_capture(const std::string &input);
    ~stream_capture();

    stream_capture(const stream_capture &) = delete;
    stream_capture &operator=(const stream_capture &) = delete;

    /**
     * @brief 到目前为止捕获的标准输出
     */
    std::string output() const;

private:
    boost::python::object sys;
    boost::python::object saved_stdout;
    boost::python::object saved_stdin;
    boost::python::object buffer;
};

/**
 * @brief 基于嵌入式 CPython 的解释器
 * 同一个进程内的所有实例共享同一个 CPython 解释器，必须在主线程上创建和使用（Python 只在主线程上处理信号）。
 * 超时通过 SIGALRM 实现：interrupt 会让解释器在下一条字节码处抛出 Timeout 异常，
 * 该异常继承自 BaseException，因此不会被选手程序的 except Exception 捕获
 */
struct python_interpreter : public interpreter {
    python_interpreter();

    std::string language() const override;

    bool check_syntax(const std::string &source) override;

    std::unique_ptr<program> load(const std::string &source, const nlohmann::json &input) override;

    void interrupt() noexcept override;

    void reset() noexcept override;
};

}  // namespace grader::sandbox
