#pragma once

#include <chrono>
#include <filesystem>

#define GRADER_VERSION "1.0"

namespace grader {

/**
 * @brief 单个数据点的时间限制（墙钟时间）
 * @defaultValue 10 秒，可以通过 --timeout 或者环境变量 CASETIMEOUT（秒）修改
 */
extern std::chrono::milliseconds CASE_TIMEOUT;

/**
 * @brief 整个提交的硬性时间限制的余量
 * 一个 worker 评测一个提交的时间上限为 (数据点数 + 1) * CASE_TIMEOUT + HARD_DEADLINE_GRACE，
 * 超过该时间的 worker 将被 SIGKILL 杀死，用于处理无法被解释器打断的选手程序
 * （比如阻塞在原生调用中，或者吞掉了超时异常）
 */
extern std::chrono::milliseconds HARD_DEADLINE_GRACE;

/**
 * @brief 未指定 --workers 时使用的 worker 进程数
 * 实际数量仍然会被限制在 [1, CPU 核心数 - 1] 之间
 */
extern unsigned DEFAULT_WORKERS;

/**
 * @brief 存放评测结果的文件夹
 *
 * OUTPUT_DIR
 * ├── <run>_data.json // 每行一个提交的评测结果
 * ├── <run>_errors.json // 错误类型直方图
 * └── <run>_summary.json // 统计指标
 */
extern std::filesystem::path OUTPUT_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，worker 会在日志中记录每个提交的评测结果
 */
extern bool DEBUG;

}  // namespace grader
