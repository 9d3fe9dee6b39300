#include "control_master.hpp"
#include "pty_prompter.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/shutdown_registry.hpp>
#include <core/utils.hpp>
#include <platform/interrupt.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <optional>
#include <thread>
#include <pty.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

// First-event-wins latch shared by the start() waiter and its helpers.
struct ControlMaster::StartRace {
    enum Kind { kStdout, kExited, kInterrupted };

    struct Event {
        Kind kind;
        Result<void> stdout_result;
    };

    std::mutex mutex;
    std::condition_variable cv;
    std::optional<Event> event;

    void fire(Kind kind, Result<void> stdout_result = Result<void>::Ok()) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (event) return;
            event = Event{kind, std::move(stdout_result)};
        }
        cv.notify_all();
    }

    Event wait() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return event.has_value(); });
        return *event;
    }
};

// ── ControlMaster ─────────────────────────────────────────────

ControlMaster::ControlMaster(std::string path, std::vector<std::string> args)
    : path_(std::move(path)), args_(std::move(args)) {
}

ControlMaster::~ControlMaster() {
    quit();
    stopping_.store(true);
    for (auto* t : {&stdout_thread_, &stderr_thread_, &exit_thread_}) {
        if (t->joinable()) t->join();
    }
    close_ptmx();
    if (stdout_fd_ >= 0) close(stdout_fd_);
    if (stderr_fd_ >= 0) close(stderr_fd_);
}

void ControlMaster::close_ptmx() {
    int fd = ptmx_.exchange(-1);
    if (fd >= 0) close(fd);
}

// Pass the child's stderr through while the login is in progress, so
// prompts and errors from ssh reach the user.
void ControlMaster::handle_stderr() {
    int fd = stderr_fd_;
    stderr_fd_ = -1;
    stderr_thread_ = std::thread([this, fd]() {
        char buf[STDERR_BUF_SIZE];
        while (logging_in_.load() && !stopping_.load()) {
            if (platform::poll_socket(fd, POLLIN, IO_POLL_INTERVAL_MS) == 0) continue;
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n > 0) {
                std::cerr.write(buf, n);
                std::cerr.flush();
            }
            if (n <= 0) break;
        }
        close(fd);
    });
}

// One read: the readiness token is the first thing the child prints.
void ControlMaster::handle_stdout(std::shared_ptr<StartRace> race) {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    stdout_thread_ = std::thread([this, fd, race]() {
        char buf[STDOUT_BUF_SIZE];
        ssize_t n = 0;
        bool readable = false;
        while (!stopping_.load()) {
            if (platform::poll_socket(fd, POLLIN, IO_POLL_INTERVAL_MS) == 0) continue;
            n = read(fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            readable = true;
            break;
        }
        int read_errno = errno;
        close(fd);
        if (!readable) return;

        if (n < 0) {
            race->fire(StartRace::kStdout, Result<void>::Err(
                fmt::format("read stdout failed: {}", std::strerror(read_errno)),
                ErrorKind::Protocol));
            return;
        }
        if (n == 0) {
            race->fire(StartRace::kStdout, Result<void>::Err(
                "read stdout failed: EOF", ErrorKind::Protocol));
            return;
        }
        std::string out(buf, static_cast<size_t>(n));
        if (trimmed(out) != CONTROL_READY_TOKEN) {
            race->fire(StartRace::kStdout, Result<void>::Err(
                fmt::format("control master stdout invalid: [{}]", out.substr(0, 200)),
                ErrorKind::Protocol));
            return;
        }
        race->fire(StartRace::kStdout);
    });
}

// The child is reaped under exit_mutex_, so quit() never signals a pid
// that has already been released.
void ControlMaster::check_exit(std::shared_ptr<StartRace> race) {
    exit_thread_ = std::thread([this, race]() {
        if (!proc_.wait_exited()) {
            ctlssh_log(fmt::format("control master pid {}: waitid failed: {}",
                                   pid(), std::strerror(errno)));
        }
        close_ptmx();
        int code;
        {
            std::lock_guard<std::mutex> lock(exit_mutex_);
            code = proc_.wait();
            exited_.store(true);
        }
        ctlssh_log(fmt::format("control master pid {} exited with {}", pid(), code));
        exit_cv_.notify_all();
        race->fire(StartRace::kExited);
    });
}

Result<void> ControlMaster::start(const CtrlExpectConfig& expect,
                                  const std::string& destination,
                                  ShutdownRegistry& on_exit) {
    platform::SpawnOptions options;
    options.capture_stdout = true;
    options.capture_stderr = true;

    int tty = -1;
    if (expect.count > 0) {
        int master = -1;
        if (openpty(&master, &tty, nullptr, nullptr, nullptr) != 0) {
            return Result<void>::Err(
                fmt::format("open pty failed: {}", std::strerror(errno)), ErrorKind::Resource);
        }
        fcntl(master, F_SETFD, FD_CLOEXEC);
        fcntl(tty, F_SETFD, FD_CLOEXEC);
        ptmx_.store(master);
        options.controlling_tty = tty;
    }

    platform::ChildPipes pipes;
    auto spawned = platform::spawn(path_, args_, options, pipes);
    if (tty >= 0) close(tty);
    if (spawned.is_err()) {
        close_ptmx();
        return Result<void>::Err(
            fmt::format("control master start failed: {}", spawned.error), spawned.kind);
    }
    proc_ = std::move(spawned.value);
    stdout_fd_ = pipes.out;
    stderr_fd_ = pipes.err;

    std::unique_ptr<PtyPrompter> prompter;
    if (has_pty()) {
        prompter = std::make_unique<PtyPrompter>(ptmx_.load(), expect, destination);
        prompter->start();
    }

    logging_in_.store(true);

    auto race = std::make_shared<StartRace>();
    Result<void> result = Result<void>::Ok();
    {
        platform::InterruptListener interrupts([race]() {
            race->fire(StartRace::kInterrupted);
        });
        if (!interrupts.active()) {
            debug("control master: interrupt listener unavailable");
        }

        handle_stderr();
        check_exit(race);
        handle_stdout(race);

        auto event = race->wait();
        switch (event.kind) {
        case StartRace::kStdout:
            result = event.stdout_result;
            break;
        case StartRace::kExited:
            result = Result<void>::Err("control master process exited", ErrorKind::PrematureExit);
            break;
        case StartRace::kInterrupted:
            quit();
            result = Result<void>::Err("user interrupt control master", ErrorKind::UserInterrupt);
            break;
        }
    }

    if (prompter) prompter->cancel();
    logging_in_.store(false);

    if (!exited_.load()) {
        if (result.is_ok()) {
            auto self = shared_from_this();
            on_exit.add([self]() { self->quit(); });
        } else {
            quit();
        }
    }
    return result;
}

void ControlMaster::quit() {
    std::unique_lock<std::mutex> lock(exit_mutex_);
    if (exited_.load() || !proc_.valid() || !exit_thread_.joinable()) return;

    proc_.send_signal(SIGINT);
    bool exited = exit_cv_.wait_for(lock, std::chrono::milliseconds(QUIT_GRACE_MS),
                                    [this] { return exited_.load(); });
    if (!exited) {
        ctlssh_log(fmt::format("control master pid {} ignored SIGINT, killing", pid()));
        proc_.send_signal(SIGKILL);
        exit_cv_.wait(lock, [this] { return exited_.load(); });
    }
}

// ── Launch helpers ────────────────────────────────────────────

Result<std::string> find_openssh(const std::string& candidate) {
    auto self = platform::self_executable();
    if (self.empty()) {
        return Result<std::string>::Err("cannot resolve the current program", ErrorKind::Config);
    }
    if (platform::real_path(self) == platform::real_path(candidate)) {
        return Result<std::string>::Err(
            fmt::format("{} is the current program", candidate), ErrorKind::Config);
    }
    return Result<std::string>::Ok(candidate);
}

std::vector<std::string> build_control_master_args(const HostConfig& host,
                                                   const std::string& socket) {
    const auto& args = host.args();
    std::vector<std::string> cmd{
        "-T", "-oRemoteCommand=none",
        fmt::format("-oConnectTimeout={}", CONTROL_CONNECT_TIMEOUT_SECS)};

    if (args.debug) cmd.push_back("-v");
    if (host.forward_agent()) cmd.push_back("-A");
    if (!args.login_name.empty()) { cmd.push_back("-l"); cmd.push_back(args.login_name); }
    if (args.port != 0) { cmd.push_back("-p"); cmd.push_back(std::to_string(args.port)); }
    if (!args.config_file.empty()) { cmd.push_back("-F"); cmd.push_back(args.config_file); }
    if (!args.proxy_jump.empty()) { cmd.push_back("-J"); cmd.push_back(args.proxy_jump); }

    for (const auto& identity : args.identities) { cmd.push_back("-i"); cmd.push_back(identity); }
    for (const auto& b : args.dynamic_forwards) { cmd.push_back("-D"); cmd.push_back(b); }
    for (const auto& f : args.local_forwards) { cmd.push_back("-L"); cmd.push_back(f); }
    for (const auto& f : args.remote_forwards) { cmd.push_back("-R"); cmd.push_back(f); }

    for (const auto& [key, values] : args.options) {
        if (key == OPT_REMOTE_COMMAND || key == OPT_CTRL_EXPECT_COUNT ||
            key == OPT_CTRL_EXPECT_TIMEOUT) {
            continue;
        }
        for (const auto& value : values) {
            cmd.push_back(fmt::format("-o{}={}", key, value));
        }
    }

    // Multiplexing settings that came from the config file rather than -o:
    // the child reads only its own ssh_config, so spell them out.
    if (!args.options.count("controlmaster")) {
        auto mode = host.get("ControlMaster");
        if (!mode.empty()) cmd.push_back("-oControlMaster=" + mode);
    }
    if (!args.options.count("controlpath") && !socket.empty()) {
        cmd.push_back("-oControlPath=" + socket);
    }
    if (!args.options.count("controlpersist")) {
        auto persist = host.get("ControlPersist");
        if (!persist.empty()) cmd.push_back("-oControlPersist=" + persist);
    }

    cmd.push_back(args.original_dest.empty() ? args.destination : args.original_dest);
    cmd.push_back(CONTROL_READY_COMMAND);
    return cmd;
}

Result<void> start_control_master(const HostConfig& host,
                                  const std::string& socket,
                                  ShutdownRegistry& on_exit) {
    auto ssh = find_openssh(OPENSSH_PATH);
    if (ssh.is_err()) {
        return Result<void>::Err("can't find openssh program: " + ssh.error, ssh.kind);
    }

    auto args = build_control_master_args(host, socket);
    debug(fmt::format("control master: {} {}", ssh.value, fmt::join(args, " ")));

    auto master = std::make_shared<ControlMaster>(ssh.value, std::move(args));
    auto result = master->start(host.ctrl_expect(), host.args().destination, on_exit);
    if (result.is_err()) return result;

    debug("start control master success");
    return Result<void>::Ok();
}
