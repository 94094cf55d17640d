#pragma once

#include <chrono>
#include <csignal>
#include "grader/sandbox/interpreter.hpp"

#ifdef SIGALRM
#define GRADER_HAS_ALARM 1
#endif

namespace grader::sandbox {

/**
 * @brief 单个数据点的墙钟时间限制
 * 构造时先丢弃 target 上迟到的中断请求，再通过 setitimer(ITIMER_REAL) 设置定时器，到期时在 SIGALRM 处理函数中打断 target；
 * 析构时取消定时器并恢复原来的信号处理函数。
 * 同一时刻只能存在一个 scoped_deadline
 */
struct scoped_deadline {
    /**
     * @param timeout 时间限制，不大于 0 时不设置定时器
     * @param target 到期时被打断的执行环境
     * @throw std::system_error 无法设置信号处理函数或者定时器
     */
    scoped_deadline(std::chrono::milliseconds timeout, interruptible &target);
    ~scoped_deadline();

    scoped_deadline(const scoped_deadline &) = delete;
    scoped_deadline &operator=(const scoped_deadline &) = delete;

    /**
     * @brief 定时器是否已经到期
     */
    bool expired() const;

    /**
     * @brief 当前平台是否支持抢占式的超时
     * 不支持时 scoped_deadline 不做任何事情，超时只能依赖调度器的硬性时间限制
     */
    static bool supported();

private:
    bool armed = false;
#ifdef GRADER_HAS_ALARM
    struct sigaction previous;
#endif
};

}  // namespace grader::sandbox
