#pragma once

#include <string>
#include <vector>
#include "grader/evaluator.hpp"
#include "grader/submission.hpp"

/**
 * worker 进程相关函数
 *
 * worker 进程由调度器 fork 产生，通过一对管道和父进程通信，每条消息为一行 JSON：
 * 父进程 -> worker：{"index": i}，要求评测第 i 个提交
 * worker -> 父进程：{"type": "accepted", "index": i, "syntax_valid": bool}，开始评测前发送，
 *                   这样 worker 崩溃时父进程仍然知道语法检查的结果
 *                   {"type": "result", "index": i, "result": {...}}，评测结束后发送
 *
 * 提交列表在 fork 时复制到 worker 的地址空间，因此管道中只需要传递下标。
 */
namespace grader {

/**
 * @brief worker 进程的主循环
 * 先通过 factory 创建 evaluator（比如初始化嵌入式解释器），然后不断读取任务直到父进程关闭任务管道。
 * evaluator 抛出的异常会被转换为 EvaluationError 结果，不会导致 worker 退出
 *
 * @param worker_id worker 的编号，用于日志
 * @param task_fd 读取任务的文件描述符
 * @param result_fd 发送结果的文件描述符
 * @param submissions 所有的提交
 * @param factory 创建 evaluator 的工厂
 * @throw internal_error 父进程发送的任务格式不合法
 * @throw std::system_error 无法和父进程通信
 */
void worker_main(int worker_id, int task_fd, int result_fd, const std::vector<candidate_submission> &submissions, const evaluator_factory &factory);

}  // namespace grader
