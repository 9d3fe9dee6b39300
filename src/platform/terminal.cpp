#include "terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

namespace platform {

TermSize terminal_size(int fd) {
    TermSize size;
    struct winsize ws;
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0) {
        if (ws.ws_col > 0) size.cols = ws.ws_col;
        if (ws.ws_row > 0) size.rows = ws.ws_row;
    }
    return size;
}

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) == 1;
}

// ── RawModeGuard ─────────────────────────────────────────────

RawModeGuard::RawModeGuard(int fd) : fd_(fd) {
    if (fd_ < 0 || !isatty(fd_)) return;
    if (tcgetattr(fd_, &saved_) != 0) return;

    struct termios raw = saved_;
    cfmakeraw(&raw);
    active_ = tcsetattr(fd_, TCSADRAIN, &raw) == 0;
}

RawModeGuard::~RawModeGuard() {
    if (active_) tcsetattr(fd_, TCSADRAIN, &saved_);
}

// ── ResizeWatcher ────────────────────────────────────────────

static volatile sig_atomic_t g_resized = 0;

static void on_sigwinch(int) {
    g_resized = 1;
}

ResizeWatcher::ResizeWatcher() {
    g_resized = 0;
    struct sigaction sa;
    sa.sa_handler = on_sigwinch;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    installed_ = sigaction(SIGWINCH, &sa, &old_sa_) == 0;
}

ResizeWatcher::~ResizeWatcher() {
    if (installed_) sigaction(SIGWINCH, &old_sa_, nullptr);
}

bool ResizeWatcher::consume() {
    if (!g_resized) return false;
    g_resized = 0;
    return true;
}

} // namespace platform
