#include "grader/common/pipe.hpp"
#include <errno.h>
#include <unistd.h>
#include <system_error>

namespace grader {
using namespace std;

const int BUF_SIZE = 4096;

void write_line(int fd, const string &line) {
    string data = line + '\n';
    size_t written = 0;
    while (written < data.size()) {
        ssize_t ret = write(fd, data.data() + written, data.size() - written);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "writing to pipe");
        }
        written += ret;
    }
}

void close_fd(int &fd) {
    if (fd < 0) return;
    int ret = close(fd);
    fd = -1;
    if (ret != 0 && errno != EINTR)
        throw system_error(errno, system_category(), "closing pipe");
}

vector<string> line_buffer::feed(const char *data, size_t len) {
    vector<string> lines;
    pending.append(data, len);
    size_t begin = 0, end;
    while ((end = pending.find('\n', begin)) != string::npos) {
        lines.push_back(pending.substr(begin, end - begin));
        begin = end + 1;
    }
    pending.erase(0, begin);
    return lines;
}

line_reader::line_reader(int fd) : fd(fd) {}

bool line_reader::read_line(string &line) {
    char buf[BUF_SIZE];
    while (next >= ready.size()) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "reading from pipe");
        }
        if (nread == 0) return false;
        ready = buffer.feed(buf, nread);
        next = 0;
    }
    line = move(ready[next++]);
    return true;
}

}  // namespace grader
