#pragma once

#include <chrono>
#include <string>

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 将以秒为单位的时间转换为毫秒
 * @param seconds 命令行或者环境变量中读取的秒数
 * @throw std::out_of_range 若 seconds 不是有限值，或者绝对值超过 MAX_SECONDS
 */
std::chrono::milliseconds seconds_to_milliseconds(double seconds);

/**
 * @brief seconds_to_milliseconds 接受的最大秒数
 * 保证乘以数据点数量之后仍然不会溢出
 */
constexpr double MAX_SECONDS = 1e9;

/**
 * @brief 计时器，从构造开始计时
 * 使用单调时钟，不受系统时间调整影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};
