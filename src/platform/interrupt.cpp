#include "interrupt.hpp"

#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace platform {

static std::atomic<int> g_interrupt_fd{-1};

static void sigint_handler(int) {
    int fd = g_interrupt_fd.load();
    if (fd >= 0) {
        int saved = errno;
        char b = 1;
        ssize_t ignored = write(fd, &b, 1);
        (void)ignored;
        errno = saved;
    }
}

static void close_pair(int p[2]) {
    for (int i = 0; i < 2; ++i) {
        if (p[i] >= 0) close(p[i]);
        p[i] = -1;
    }
}

InterruptListener::InterruptListener(Callback on_interrupt) {
    if (pipe2(sig_pipe_, O_CLOEXEC | O_NONBLOCK) != 0) return;
    if (pipe2(stop_pipe_, O_CLOEXEC) != 0) {
        close_pair(sig_pipe_);
        return;
    }

    int expected = -1;
    if (!g_interrupt_fd.compare_exchange_strong(expected, sig_pipe_[1])) {
        close_pair(sig_pipe_);
        close_pair(stop_pipe_);
        return;
    }

    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (sigaction(SIGINT, &sa, &old_sa_) != 0) {
        g_interrupt_fd.store(-1);
        close_pair(sig_pipe_);
        close_pair(stop_pipe_);
        return;
    }

    installed_ = true;
    thread_ = std::thread(&InterruptListener::wait_loop, this, std::move(on_interrupt));
}

InterruptListener::~InterruptListener() {
    if (!installed_) return;

    sigaction(SIGINT, &old_sa_, nullptr);
    g_interrupt_fd.store(-1);

    char b = 1;
    ssize_t ignored = write(stop_pipe_[1], &b, 1);
    (void)ignored;
    if (thread_.joinable()) thread_.join();

    close_pair(sig_pipe_);
    close_pair(stop_pipe_);
}

void InterruptListener::wait_loop(Callback on_interrupt) {
    struct pollfd fds[2] = {
        {sig_pipe_[0], POLLIN, 0},
        {stop_pipe_[0], POLLIN, 0},
    };

    while (true) {
        int ret = poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return;
        }
        if (fds[1].revents) return;
        if (fds[0].revents & POLLIN) {
            char buf[16];
            while (read(sig_pipe_[0], buf, sizeof(buf)) > 0) {}
            if (on_interrupt) on_interrupt();
            return;
        }
    }
}

} // namespace platform
