#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <platform/process.hpp>

class HostConfig;
class ShutdownRegistry;

// One supervised background "ssh" that becomes (or attaches to) the
// control master for a destination.
//
// Lifecycle:
//   start()  spawns the child and races three events: the readiness token
//            on stdout, the child exiting, and SIGINT. Exactly one wins.
//   quit()   SIGINT, then SIGKILL after QUIT_GRACE_MS, then waits for exit.
//
// Helper threads (exit watcher, stdout/stderr readers) are joined by the
// destructor, which first quits a child that is still running. start()
// registers a shared quit action, so create instances with std::make_shared.
class ControlMaster : public std::enable_shared_from_this<ControlMaster> {
public:
    ControlMaster(std::string path, std::vector<std::string> args);
    ~ControlMaster();

    ControlMaster(const ControlMaster&) = delete;
    ControlMaster& operator=(const ControlMaster&) = delete;

    // Spawn and wait for the readiness token. With expect.count > 0 the
    // child gets a pty as controlling terminal and a PtyPrompter answers
    // its prompts. On success a quit action is added to on_exit; on any
    // failure the child is shut down before returning.
    Result<void> start(const CtrlExpectConfig& expect,
                       const std::string& destination,
                       ShutdownRegistry& on_exit);

    // Graceful-then-forced shutdown. No-op once the child has exited.
    void quit();

    bool exited() const { return exited_.load(); }
    bool logging_in() const { return logging_in_.load(); }
    bool has_pty() const { return ptmx_.load() >= 0; }
    int pid() const { return proc_.native_handle(); }

    const std::string& path() const { return path_; }
    const std::vector<std::string>& args() const { return args_; }

private:
    struct StartRace;

    std::string path_;
    std::vector<std::string> args_;
    platform::ProcessHandle proc_;
    std::atomic<int> ptmx_{-1};
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::atomic<bool> logging_in_{false};
    std::atomic<bool> exited_{false};   // written by the exit watcher only
    std::atomic<bool> stopping_{false};
    std::mutex exit_mutex_;             // held while reaping and signalling
    std::condition_variable exit_cv_;

    std::thread stdout_thread_;
    std::thread stderr_thread_;
    std::thread exit_thread_;

    void handle_stderr();
    void handle_stdout(std::shared_ptr<StartRace> race);
    void check_exit(std::shared_ptr<StartRace> race);
    void close_ptmx();
};

// Path of the system ssh client. Fails with a Config error when it resolves
// to the running program.
Result<std::string> find_openssh(const std::string& candidate);

// Arguments for the control master child (everything after argv[0]).
std::vector<std::string> build_control_master_args(const HostConfig& host,
                                                   const std::string& socket);

// Build, spawn and wait for a control master for host. On success its
// shutdown is registered with on_exit.
Result<void> start_control_master(const HostConfig& host,
                                  const std::string& socket,
                                  ShutdownRegistry& on_exit);
