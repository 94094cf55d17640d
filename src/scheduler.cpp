#include "grader/scheduler.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <boost/exception/diagnostic_information.hpp>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>
#include "grader/common/defer.hpp"
#include "grader/common/exceptions.hpp"
#include "grader/config.hpp"
#include "grader/worker.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

// 停止 worker 的标记
static volatile sig_atomic_t stop = 0;

void stop_workers() {
    stop = 1;
}

void resume_workers() {
    stop = 0;
}

unsigned clamp_workers(unsigned requested, unsigned hardware) {
    unsigned cap = hardware > 1 ? hardware - 1 : 1;
    return clamp(requested, 1u, cap);
}

// poll 的最长等待时间，保证及时检查停止标记和硬性时间限制
static const chrono::milliseconds POLL_INTERVAL(100);

static const size_t BUF_SIZE = 4096;

worker_pool::worker_pool(unsigned workers, evaluator_factory factory)
    : workers(clamp_workers(workers, thread::hardware_concurrency())), factory(move(factory)) {
    if (this->workers != workers)
        LOG(INFO) << "Requested " << workers << " workers, using " << this->workers;
}

unsigned worker_pool::size() const {
    return workers;
}

vector<execution_result> worker_pool::run(const vector<candidate_submission> &submissions, const result_callback &callback) {
    // worker 崩溃后写入任务管道不应该导致父进程退出
    signal(SIGPIPE, SIG_IGN);

    this->submissions = &submissions;
    this->callback = &callback;
    results.clear();
    next = 0;
    if (submissions.empty()) return {};

    slots = vector<worker_slot>(min<size_t>(workers, submissions.size()));
    defer { shutdown(); };

    for (size_t i = 0; i < slots.size(); ++i) {
        slots[i].id = i;
        spawn(slots[i]);
    }
    for (auto &slot : slots)
        dispatch(slot);

    vector<pollfd> fds;
    vector<worker_slot *> polled;
    while (results.size() < submissions.size()) {
        if (stop) {
            LOG(WARNING) << "Evaluation interrupted, terminating " << slots.size() << " workers";
            terminate_all();
            throw interrupted_error(fmt::format("evaluation interrupted after {} of {} submissions", results.size(), submissions.size()));
        }

        fds.clear();
        polled.clear();
        chrono::milliseconds wait = POLL_INTERVAL;
        for (auto &slot : slots) {
            if (!slot.in_flight) continue;
            fds.push_back({slot.result_fd, POLLIN, 0});
            polled.push_back(&slot);
            auto remaining = slot.deadline - slot.started.duration<chrono::milliseconds>();
            wait = max(chrono::milliseconds(0), min(wait, remaining));
        }

        if (poll(fds.data(), fds.size(), wait.count()) < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "waiting for workers");
        }

        for (size_t i = 0; i < fds.size(); ++i)
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR))
                receive(*polled[i]);

        for (auto &slot : slots) {
            if (!slot.in_flight) continue;
            if (slot.started.duration<chrono::milliseconds>() > slot.deadline) {
                LOG(WARNING) << "Worker " << slot.id << " exceeded the hard deadline on " << submissions[*slot.in_flight] << ", killing";
                fail(slot, fmt::format("worker exceeded the hard deadline of {} ms", slot.deadline.count()));
            }
        }
    }

    return move(results);
}

void worker_pool::spawn(worker_slot &slot) {
    int task_pipe[2], result_pipe[2];
    if (pipe(task_pipe) != 0)
        throw system_error(errno, system_category(), "creating task pipe");
    if (pipe(result_pipe) != 0) {
        int err = errno;
        close(task_pipe[0]);
        close(task_pipe[1]);
        throw system_error(err, system_category(), "creating result pipe");
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {task_pipe[0], task_pipe[1], result_pipe[0], result_pipe[1]}) close(fd);
        throw system_error(err, system_category(), "forking worker");
    }

    if (pid == 0) {
        // 子进程：SIGINT 由父进程处理
        signal(SIGINT, SIG_IGN);
        close(task_pipe[1]);
        close(result_pipe[0]);
        // 关闭其他 worker 的管道，否则其他 worker 无法收到 EOF
        for (auto &other : slots) {
            if (&other == &slot) continue;
            if (other.task_fd >= 0) close(other.task_fd);
            if (other.result_fd >= 0) close(other.result_fd);
        }
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        int code = EXIT_SUCCESS;
        try {
            worker_main(slot.id, task_pipe[0], result_pipe[1], *submissions, factory);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << slot.id << " has crashed, " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            code = EXIT_FAILURE;
        }
        google::FlushLogFiles(google::GLOG_INFO);
        _exit(code);
    }

    close(task_pipe[0]);
    close(result_pipe[1]);
    slot.pid = pid;
    slot.task_fd = task_pipe[1];
    slot.result_fd = result_pipe[0];
    slot.buffer = line_buffer();
    slot.in_flight.reset();
    slot.syntax_valid = false;
    DLOG(INFO) << "Worker " << slot.id << " started with pid " << pid;
}

void worker_pool::dispatch(worker_slot &slot) {
    if (next >= submissions->size()) return;

    size_t index = next++;
    const candidate_submission &submission = (*submissions)[index];
    slot.in_flight = index;
    slot.syntax_valid = false;
    slot.started = elapsed_time();
    slot.deadline = (static_cast<chrono::milliseconds::rep>(submission.spec.cases.size()) + 1) * CASE_TIMEOUT + HARD_DEADLINE_GRACE;

    try {
        write_line(slot.task_fd, json{{"index", index}}.dump());
    } catch (system_error &ex) {
        // worker 已经退出，poll 会读到 EOF 并记录 EvaluationError
        LOG(WARNING) << "Unable to dispatch " << submission << " to worker " << slot.id << ": " << ex.what();
    }
}

void worker_pool::receive(worker_slot &slot) {
    char buf[BUF_SIZE];
    ssize_t nread = read(slot.result_fd, buf, BUF_SIZE);
    if (nread < 0) {
        if (errno == EINTR) return;
        fail(slot, fmt::format("reading from worker failed: {}", strerror(errno)));
        return;
    }
    if (nread == 0) {
        fail(slot, "worker exited unexpectedly");
        return;
    }

    pid_t pid = slot.pid;
    for (auto &line : slot.buffer.feed(buf, nread)) {
        // 前一条消息可能已经导致 worker 被重启，剩余的消息属于已经被杀死的 worker
        if (slot.pid != pid || !slot.in_flight) break;
        handle_message(slot, line);
    }
}

void worker_pool::handle_message(worker_slot &slot, const string &line) {
    size_t index = *slot.in_flight;
    optional<execution_result> result;
    try {
        json message = json::parse(line);
        if (message.at("index").get<size_t>() != index)
            throw internal_error(fmt::format("expected a reply for task {}", index));

        string type = message.at("type").get<string>();
        if (type == "accepted")
            slot.syntax_valid = message.at("syntax_valid").get<bool>();
        else if (type == "result")
            result = message.at("result").get<execution_result>();
        else
            throw internal_error("unknown message type " + type);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Worker " << slot.id << " sent a malformed reply for " << (*submissions)[index] << ": " << ex.what();
        fail(slot, string("malformed reply from worker: ") + ex.what());
        return;
    }

    if (result) complete(slot, move(*result));
}

void worker_pool::complete(worker_slot &slot, execution_result &&result) {
    slot.in_flight.reset();
    results.push_back(move(result));
    if (*callback) (*callback)(results.back(), progress{results.size(), submissions->size()});
    dispatch(slot);
}

void worker_pool::fail(worker_slot &slot, const string &reason) {
    const candidate_submission &submission = (*submissions)[*slot.in_flight];
    LOG(WARNING) << "Worker " << slot.id << " failed on " << submission << ": " << reason;

    execution_result result = execution_result::evaluation_error(submission.task_id, slot.syntax_valid, reason);
    reap(slot, true);
    if (next < submissions->size()) spawn(slot);
    complete(slot, move(result));
}

void worker_pool::reap(worker_slot &slot, bool force) {
    close_fd(slot.task_fd);
    close_fd(slot.result_fd);
    if (slot.pid <= 0) return;

    if (force && kill(slot.pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to kill worker " << slot.id << ": " << strerror(errno);

    int status = 0;
    while (waitpid(slot.pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOG(WARNING) << "Unable to wait for worker " << slot.id << ": " << strerror(errno);
            break;
        }
    }
    if (WIFSIGNALED(status) && WTERMSIG(status) != SIGKILL)
        LOG(WARNING) << "Worker " << slot.id << " was terminated by signal " << WTERMSIG(status);
    slot.pid = -1;
    slot.in_flight.reset();
}

void worker_pool::terminate_all() {
    // 先尝试正常结束 worker，再强制杀死
    for (auto &slot : slots)
        if (slot.pid > 0 && kill(slot.pid, SIGTERM) != 0 && errno != ESRCH)
            LOG(WARNING) << "Unable to terminate worker " << slot.id << ": " << strerror(errno);
    this_thread::sleep_for(chrono::milliseconds(100));
    for (auto &slot : slots) reap(slot, true);
}

void worker_pool::shutdown() {
    // 关闭任务管道后空闲的 worker 会自然退出，仍在评测的 worker 被强制杀死
    for (auto &slot : slots) {
        try {
            reap(slot, slot.in_flight.has_value());
        } catch (system_error &ex) {
            LOG(WARNING) << "Unable to shut down worker " << slot.id << ": " << ex.what();
        }
    }
    slots.clear();
    submissions = nullptr;
    callback = nullptr;
}

}  // namespace grader
