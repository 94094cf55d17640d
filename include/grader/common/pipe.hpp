#pragma once

#include <string>
#include <vector>

/**
 * 这个头文件包含父进程和 worker 进程之间基于管道的通信工具
 * 通信内容为按行分隔的文本（一般是单行 JSON），因此消息本身不能包含换行符
 */
namespace grader {

/**
 * @brief 将一行消息完整写入文件描述符，自动追加换行符
 * 被信号打断（EINTR）时会继续写入
 * @throw std::system_error 写入失败，比如对端已经关闭（EPIPE）
 */
void write_line(int fd, const std::string &line);

/**
 * @brief 关闭文件描述符，忽略已经关闭的文件描述符（-1）
 * @throw std::system_error 关闭失败
 */
void close_fd(int &fd);

/**
 * @brief 行缓冲区
 * 将从管道中读到的任意大小的数据块拼接成完整的行
 */
struct line_buffer {
    /**
     * @brief 追加读到的数据
     * @return 本次拼接出的所有完整的行（不含换行符）
     */
    std::vector<std::string> feed(const char *data, std::size_t len);

private:
    std::string pending;
};

/**
 * @brief 阻塞地从文件描述符中按行读取
 * worker 进程用这个类读取父进程派发的任务
 */
struct line_reader {
    explicit line_reader(int fd);

    /**
     * @brief 读取下一行
     * @param line 读到的行（不含换行符）
     * @return false 若对端已经关闭且没有剩余的完整行
     */
    bool read_line(std::string &line);

private:
    int fd;
    line_buffer buffer;
    std::vector<std::string> ready;
    std::size_t next = 0;
};

}  // namespace grader
