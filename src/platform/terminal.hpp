#pragma once

#include <signal.h>
#include <termios.h>

namespace platform {

struct TermSize {
    int cols = 80;
    int rows = 24;
};

// Window size of the terminal on fd; 80x24 when fd is not a terminal.
TermSize terminal_size(int fd);

bool stdin_is_tty();

// Puts the terminal on fd into raw mode for the guard's lifetime.
// No-op when fd is not a terminal.
class RawModeGuard {
public:
    explicit RawModeGuard(int fd);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    bool active() const { return active_; }

private:
    int fd_;
    bool active_ = false;
    struct termios saved_;
};

// Records SIGWINCH while alive. Only one watcher may exist at a time.
class ResizeWatcher {
public:
    ResizeWatcher();
    ~ResizeWatcher();

    ResizeWatcher(const ResizeWatcher&) = delete;
    ResizeWatcher& operator=(const ResizeWatcher&) = delete;

    // True once per batch of resizes since the last call.
    bool consume();

private:
    struct sigaction old_sa_;
    bool installed_ = false;
};

} // namespace platform
