#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <sys/ioctl.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

#include <fmt/format.h>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

bool ProcessHandle::wait_exited() const {
    if (pid_ <= 0) return false;
    siginfo_t info{};
    int ret;
    do {
        ret = waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
    } while (ret < 0 && errno == EINTR);
    return ret == 0;
}

bool ProcessHandle::send_signal(int sig) const {
    if (pid_ <= 0) return false;
    return kill(pid_, sig) == 0;
}

// ── spawn ────────────────────────────────────────────────────

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options,
                            ChildPipes& pipes) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // CLOEXEC: closes silently on successful exec

    auto cleanup = [&]() {
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
    };

    if (options.capture_stdout && pipe2(out_pipe, O_CLOEXEC) != 0) {
        return Result<ProcessHandle>::Err(
            fmt::format("stdout pipe failed: {}", std::strerror(errno)), ErrorKind::Resource);
    }
    if (options.capture_stderr && pipe2(err_pipe, O_CLOEXEC) != 0) {
        int e = errno;
        cleanup();
        return Result<ProcessHandle>::Err(
            fmt::format("stderr pipe failed: {}", std::strerror(e)), ErrorKind::Resource);
    }
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int e = errno;
        cleanup();
        return Result<ProcessHandle>::Err(
            fmt::format("exec status pipe failed: {}", std::strerror(e)), ErrorKind::Resource);
    }

    // Build argv before fork: only async-signal-safe calls in the child.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        cleanup();
        return Result<ProcessHandle>::Err(
            fmt::format("fork failed: {}", std::strerror(e)), ErrorKind::ProcessStart);
    }

    if (pid == 0) {
        // Child process
        if (options.controlling_tty >= 0) {
            setsid();
            ioctl(options.controlling_tty, TIOCSCTTY, 0);
            dup2(options.controlling_tty, STDIN_FILENO);
        } else if (options.stdin_fd >= 0) {
            dup2(options.stdin_fd, STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }
        }
        if (out_pipe[1] >= 0) dup2(out_pipe[1], STDOUT_FILENO);
        if (err_pipe[1] >= 0) dup2(err_pipe[1], STDERR_FILENO);

        // The client ignores SIGPIPE; ignored dispositions survive exec.
        signal(SIGPIPE, SIG_DFL);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        int e = errno;
        ssize_t ignored = write(exec_pipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    ProcessHandle handle;
    handle.pid_ = pid;

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        handle.wait();
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        return Result<ProcessHandle>::Err(
            fmt::format("exec {} failed: {}", program, std::strerror(child_errno)),
            ErrorKind::ProcessStart);
    }

    pipes.out = out_pipe[0];
    pipes.err = err_pipe[0];
    return Result<ProcessHandle>::Ok(std::move(handle));
}

} // namespace platform
