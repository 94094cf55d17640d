#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <sys/types.h>
#include <vector>
#include "grader/common/pipe.hpp"
#include "grader/common/utils.hpp"
#include "grader/evaluator.hpp"
#include "grader/result.hpp"
#include "grader/submission.hpp"

/**
 * 评测调度相关函数
 *
 * 调度器在父进程中运行，维护固定数量的 worker 进程，每个 worker 同一时刻只评测一个提交。
 * 父进程不会初始化解释器，所有选手程序都只在 worker 进程中运行，
 * 因此选手程序导致的崩溃（比如段错误、os._exit）只会影响当前评测的提交。
 */
namespace grader {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，正在运行的 worker_pool::run 会终止所有 worker 并抛出 interrupted_error。
 * 这个函数是异步信号安全的，可以在 SIGINT 的处理函数中调用
 */
void stop_workers();

/**
 * @brief 清除 stop_workers 设置的停止标记
 */
void resume_workers();

/**
 * @brief 将 worker 数量限制在 [1, max(1, hardware - 1)] 之间
 * 保留一个 CPU 核心给父进程
 * @param requested 请求的 worker 数量
 * @param hardware CPU 核心数，为 0 时表示未知
 */
unsigned clamp_workers(unsigned requested, unsigned hardware);

/**
 * @brief 评测进度
 */
struct progress {
    std::size_t completed;
    std::size_t total;
};

/**
 * @brief 每收到一个评测结果时调用的回调函数，按结果到达的顺序调用
 */
typedef std::function<void(const execution_result &, const progress &)> result_callback;

/**
 * @brief 父进程中记录的一个 worker 进程的状态
 */
struct worker_slot {
    int id = 0;
    pid_t pid = -1;

    /**
     * @brief 父进程写入任务的管道
     */
    int task_fd = -1;

    /**
     * @brief 父进程读取结果的管道
     */
    int result_fd = -1;

    line_buffer buffer;

    /**
     * @brief 正在评测的提交的下标，空闲时为空
     */
    std::optional<std::size_t> in_flight;

    /**
     * @brief worker 通过 accepted 消息报告的语法检查结果
     */
    bool syntax_valid = false;

    /**
     * @brief 从派发当前提交开始计时
     */
    elapsed_time started;

    /**
     * @brief 当前提交的硬性时间限制
     */
    std::chrono::milliseconds deadline{0};
};

/**
 * @brief worker 进程池
 *
 * 每次 run 时 fork 出 worker 进程，run 结束时回收所有 worker。
 * 父进程使用 poll 同时等待所有 worker 的结果，worker 出现以下情况时，
 * 当前提交得到 EvaluationError，且 worker 被杀死后重新启动：
 * 1. 管道被关闭（worker 崩溃或者退出）；
 * 2. 返回的消息格式不合法；
 * 3. 评测时间超过硬性时间限制 (数据点数 + 1) * CASE_TIMEOUT + HARD_DEADLINE_GRACE。
 */
struct worker_pool {
    /**
     * @param workers 请求的 worker 数量，会被 clamp_workers 限制
     * @param factory worker 进程创建 evaluator 的工厂，在 fork 之后的子进程中调用
     */
    worker_pool(unsigned workers, evaluator_factory factory);

    /**
     * @brief 评测所有的提交
     * 阻塞直到所有提交都评测完成
     * @param submissions 所有的提交
     * @param callback 每收到一个评测结果时调用
     * @return 所有的评测结果，按结果到达的顺序排列，和 submissions 一一对应（通过 task_id 识别）
     * @throw interrupted_error 调用了 stop_workers，此时所有 worker 已经被终止
     * @throw std::system_error 无法创建管道或者 worker 进程
     */
    std::vector<execution_result> run(const std::vector<candidate_submission> &submissions, const result_callback &callback = nullptr);

    /**
     * @brief 实际使用的 worker 数量
     */
    unsigned size() const;

private:
    void spawn(worker_slot &slot);
    void dispatch(worker_slot &slot);
    void receive(worker_slot &slot);
    void handle_message(worker_slot &slot, const std::string &line);
    void complete(worker_slot &slot, execution_result &&result);
    void fail(worker_slot &slot, const std::string &reason);
    void reap(worker_slot &slot, bool force);
    void terminate_all();
    void shutdown();

    unsigned workers;
    evaluator_factory factory;

    // 以下状态只在 run 期间有效
    const std::vector<candidate_submission> *submissions = nullptr;
    const result_callback *callback = nullptr;
    std::vector<worker_slot> slots;
    std::vector<execution_result> results;
    std::size_t next = 0;
};

}  // namespace grader
