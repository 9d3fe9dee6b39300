#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

struct SpawnOptions {
    int stdin_fd = -1;            // -1 → /dev/null
    bool capture_stdout = false;
    bool capture_stderr = false;
    // Slave side of a pty. The child starts a new session and makes it the
    // controlling terminal (and its stdin).
    int controlling_tty = -1;
};

// Read ends of captured output, owned by the caller. -1 when not captured.
struct ChildPipes {
    int out = -1;
    int err = -1;
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Block until the process exits without reaping it. The pid stays
    // reserved (a zombie) until wait() is called. False if not valid.
    bool wait_exited() const;

    // Block until the process exits and reap it. Returns the exit code,
    // 128 + signal number if it was killed, -1 if not valid.
    // Must be called from one thread only.
    int wait();

    // Deliver sig to the process. False if not valid or kill() failed.
    bool send_signal(int sig) const;

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;

    friend Result<ProcessHandle> spawn(const std::string& program,
                                       const std::vector<std::string>& args,
                                       const SpawnOptions& options,
                                       ChildPipes& pipes);
};

// Spawn program with args (argv[0] is program). Exec failures in the child
// are reported back as ProcessStart errors.
Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options,
                            ChildPipes& pipes);

} // namespace platform
