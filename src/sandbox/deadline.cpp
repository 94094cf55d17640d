#include "grader/sandbox/deadline.hpp"
#include <glog/logging.h>
#include <sys/time.h>
#include <cerrno>
#include <system_error>

namespace grader::sandbox {
using namespace std;

static volatile sig_atomic_t deadline_expired = 0;
static interruptible *volatile deadline_target = nullptr;

#ifdef GRADER_HAS_ALARM
static void on_alarm(int) {
    deadline_expired = 1;
    if (deadline_target) deadline_target->interrupt();
}

static void set_timer(chrono::milliseconds timeout) {
    struct itimerval itimer;
    itimer.it_interval.tv_sec = 0;
    itimer.it_interval.tv_usec = 0;
    itimer.it_value.tv_sec = timeout.count() / 1000;
    itimer.it_value.tv_usec = (timeout.count() % 1000) * 1000;
    if (setitimer(ITIMER_REAL, &itimer, nullptr) != 0)
        throw system_error(errno, system_category(), "setting timer");
}
#endif

scoped_deadline::scoped_deadline(chrono::milliseconds timeout, interruptible &target) {
    deadline_expired = 0;
    target.reset();
#ifdef GRADER_HAS_ALARM
    if (timeout.count() <= 0) return;

    deadline_target = &target;

    struct sigaction sigact;
    sigact.sa_handler = on_alarm;
    sigact.sa_flags = SA_RESTART;
    sigemptyset(&sigact.sa_mask);
    if (sigaction(SIGALRM, &sigact, &previous) != 0) {
        deadline_target = nullptr;
        throw system_error(errno, system_category(), "installing signal handler");
    }

    try {
        set_timer(timeout);
    } catch (system_error &) {
        sigaction(SIGALRM, &previous, nullptr);
        deadline_target = nullptr;
        throw;
    }
    armed = true;
#else
    (void)timeout;
#endif
}

scoped_deadline::~scoped_deadline() {
#ifdef GRADER_HAS_ALARM
    if (!armed) return;

    struct itimerval itimer = {};
    if (setitimer(ITIMER_REAL, &itimer, nullptr) != 0)
        LOG(WARNING) << "could not disarm timer";
    if (sigaction(SIGALRM, &previous, nullptr) != 0)
        LOG(WARNING) << "could not restore signal handler";
    deadline_target = nullptr;
#endif
}

bool scoped_deadline::expired() const {
    return deadline_expired != 0;
}

bool scoped_deadline::supported() {
#ifdef GRADER_HAS_ALARM
    return true;
#else
    return false;
#endif
}

}  // namespace grader::sandbox
