#include "session.hpp"
#include "agent_client.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <unistd.h>
#include <cstring>
#include <optional>
#include <cerrno>

// Run a libssh2 call under the session lock until it stops saying EAGAIN.
template <typename F>
static int retry_eagain(SessionLock& lock, F&& fn) {
    while (true) {
        int rc;
        {
            std::lock_guard<std::recursive_mutex> guard(lock.mutex);
            if (!lock.alive) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        platform::sleep_ms(IO_POLL_INTERVAL_MS);
    }
}

static bool channel_write_all(SessionLock& lock, LIBSSH2_CHANNEL* ch,
                              const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t w;
        {
            std::lock_guard<std::recursive_mutex> guard(lock.mutex);
            if (!lock.alive) return false;
            w = libssh2_channel_write(ch, data + sent, len - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(IO_POLL_INTERVAL_MS);
            continue;
        }
        if (w < 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}

// ── Libssh2Channel ────────────────────────────────────────────

// A channel the server opened towards us (agent forwarding).
class Libssh2Channel : public ForwardChannel {
public:
    Libssh2Channel(LIBSSH2_CHANNEL* ch, std::shared_ptr<SessionLock> lock)
        : ch_(ch), lock_(std::move(lock)) {}

    ~Libssh2Channel() override { close(); }

    ssize_t read(char* buf, size_t len) override {
        while (true) {
            ssize_t n;
            {
                std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
                if (!lock_->alive || !ch_) return -1;
                n = libssh2_channel_read(ch_, buf, len);
                if (n == LIBSSH2_ERROR_EAGAIN && libssh2_channel_eof(ch_)) n = 0;
            }
            if (n != LIBSSH2_ERROR_EAGAIN) return n;
            platform::sleep_ms(IO_POLL_INTERVAL_MS);
        }
    }

    bool write(const char* data, size_t len) override {
        if (!ch_) return false;
        return channel_write_all(*lock_, ch_, data, len);
    }

    void close_write() override {
        if (!ch_) return;
        retry_eagain(*lock_, [this] { return libssh2_channel_send_eof(ch_); });
    }

    // Forget the channel without touching libssh2; the session frees it.
    void abandon() {
        std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
        ch_ = nullptr;
    }

    void close() override {
        std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
        if (!ch_) return;
        // Once the session is gone its channels went with it.
        if (lock_->alive) {
            libssh2_channel_close(ch_);
            libssh2_channel_free(ch_);
        }
        ch_ = nullptr;
    }

private:
    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<SessionLock> lock_;
};

// ── DirectSession ─────────────────────────────────────────────

DirectSession::DirectSession(const HostConfig& host, AgentClientHolder& agent)
    : host_(host), agent_(agent), lock_(std::make_shared<SessionLock>()) {
    target_ = fmt::format("{}@{}:{}", host_.user(), host_.hostname(), host_.port());
}

DirectSession::~DirectSession() {
    close();
}

std::string DirectSession::describe() const {
    return target_;
}

Result<void> DirectSession::open_socket() {
    auto hostname = host_.hostname();
    auto port = std::to_string(host_.port());
    int timeout_secs = safe_stoi(host_.get("ConnectTimeout"), DIRECT_CONNECT_TIMEOUT_SECS);
    if (timeout_secs <= 0) timeout_secs = DIRECT_CONNECT_TIMEOUT_SECS;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(hostname.c_str(), port.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<void>::Err(
            fmt::format("Failed to resolve host {}: {}", hostname, gai_strerror(gai)),
            ErrorKind::Dial);
    }

    std::string last_error = "no addresses";
    for (auto* ai = res; ai; ai = ai->ai_next) {
        int sock = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (sock < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        platform::set_nonblocking(sock);
        int ret = ::connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            platform::close_socket(sock);
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            int revents = platform::poll_socket(sock, POLLOUT, timeout_secs * 1000);
            if (revents == 0) {
                last_error = "timed out";
                platform::close_socket(sock);
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                last_error = std::strerror(sock_err);
                platform::close_socket(sock);
                continue;
            }
        }

        sock_ = sock;
        break;
    }
    freeaddrinfo(res);

    if (sock_ < 0) {
        return Result<void>::Err(
            fmt::format("Failed to connect to {}:{}: {}", hostname, port, last_error),
            ErrorKind::Dial);
    }

    int keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    int nodelay = 1;
    setsockopt(sock_, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
    return Result<void>::Ok();
}

Result<void> DirectSession::connect(StatusCallback callback) {
    if (callback) callback("Connecting to " + target_ + "...");

    if (libssh2_init(0) != 0) {
        return Result<void>::Err("Failed to initialize libssh2", ErrorKind::Resource);
    }

    if (!host_.args().proxy_jump.empty() || !host_.get("ProxyJump").empty()) {
        warning("ProxyJump is only supported through a control master, connecting directly");
    }

    auto sock = open_socket();
    if (sock.is_err()) return sock;

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, this);
    if (!session_) {
        close();
        return Result<void>::Err("Failed to create SSH session", ErrorKind::Resource);
    }
    libssh2_session_set_blocking(session_, 0);
    libssh2_session_callback_set(session_, LIBSSH2_CALLBACK_AUTHAGENT,
                                 reinterpret_cast<void*>(&DirectSession::agent_channel_callback));

    int rc = retry_eagain(*lock_, [this] { return libssh2_session_handshake(session_, sock_); });
    if (rc != 0) {
        close();
        return Result<void>::Err(fmt::format("SSH handshake with {} failed ({})", target_, rc),
                                 ErrorKind::Protocol);
    }

    libssh2_keepalive_config(session_, 1, 30);

    auto hostkey = verify_host_key();
    if (hostkey.is_err()) {
        close();
        return hostkey;
    }

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth = authenticate(callback);
    if (auth.is_err()) {
        close();
        return auth;
    }

    active_.store(true);
    debug(fmt::format("direct session to {} established", target_));
    return Result<void>::Ok();
}

Result<void> DirectSession::verify_host_key() {
    std::lock_guard<std::recursive_mutex> guard(lock_->mutex);

    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        return Result<void>::Err("server sent no host key", ErrorKind::Protocol);
    }

    auto files = split_fields(host_.get("UserKnownHostsFile"));
    auto known_file = resolve_home_dir(files.empty() ? "~/.ssh/known_hosts" : files.front());

    LIBSSH2_KNOWNHOSTS* known = libssh2_knownhost_init(session_);
    if (!known) {
        warning("cannot initialize known hosts, skipping host key check");
        return Result<void>::Ok();
    }
    if (libssh2_knownhost_readfile(known, known_file.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        debug(fmt::format("read {} failed", known_file));
    }

    struct libssh2_knownhost* found = nullptr;
    int check = libssh2_knownhost_checkp(known, host_.hostname().c_str(), host_.port(),
                                         key, key_len,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW,
                                         &found);
    libssh2_knownhost_free(known);

    bool strict = to_lower(host_.get("StrictHostKeyChecking")) == "yes";
    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return Result<void>::Ok();
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        return Result<void>::Err(
            fmt::format("host key for {} does not match {}", host_.hostname(), known_file),
            ErrorKind::Auth);
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        if (strict) {
            return Result<void>::Err(
                fmt::format("no host key for {} in {}", host_.hostname(), known_file),
                ErrorKind::Auth);
        }
        warning(fmt::format("host {} is not in {}", host_.hostname(), known_file));
        return Result<void>::Ok();
    default:
        warning(fmt::format("host key check for {} failed", host_.hostname()));
        return Result<void>::Ok();
    }
}

bool DirectSession::auth_agent(const std::string& user) {
    LIBSSH2_AGENT* agent = nullptr;
    {
        std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
        agent = agent_.connect(session_);
    }
    if (!agent) return false;

    if (retry_eagain(*lock_, [agent] { return libssh2_agent_list_identities(agent); }) != 0) {
        debug("agent: list identities failed");
        return false;
    }

    struct libssh2_agent_publickey* prev = nullptr;
    struct libssh2_agent_publickey* identity = nullptr;
    while (true) {
        int rc;
        {
            std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
            rc = libssh2_agent_get_identity(agent, &identity, prev);
        }
        if (rc != 0) break;  // 1 = end of list, < 0 = error

        rc = retry_eagain(*lock_, [&] {
            return libssh2_agent_userauth(agent, user.c_str(), identity);
        });
        if (rc == 0) {
            debug(fmt::format("authenticated with agent key {}",
                              identity->comment ? identity->comment : ""));
            return true;
        }
        prev = identity;
    }
    return false;
}

bool DirectSession::auth_key_file(const std::string& user, const std::string& path) {
    auto priv = resolve_home_dir(path);
    if (!is_file_exist(priv)) return false;
    auto pub = priv + ".pub";
    const char* pub_path = is_file_exist(pub) ? pub.c_str() : nullptr;

    int rc = retry_eagain(*lock_, [&] {
        return libssh2_userauth_publickey_fromfile_ex(
            session_, user.c_str(), static_cast<unsigned int>(user.size()),
            pub_path, priv.c_str(), "");
    });
    if (rc == 0) {
        debug(fmt::format("authenticated with {}", priv));
        return true;
    }
    debug(fmt::format("key {} rejected ({})", priv, rc));
    return false;
}

Result<void> DirectSession::authenticate(StatusCallback callback) {
    auto user = host_.user();

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while (true) {
        {
            std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
            auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.size()));
            if (auth_list || libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        }
        platform::sleep_ms(IO_POLL_INTERVAL_MS);
    }

    bool authed = false;
    {
        std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
        authed = libssh2_userauth_authenticated(session_) != 0;
    }
    if (authed) return Result<void>::Ok();  // "none" was accepted

    std::string methods = auth_list ? auth_list : "";
    debug(fmt::format("auth methods for {}: {}", user, methods));

    if (methods.find("publickey") != std::string::npos) {
        if (callback) callback("Trying agent keys...");
        if (auth_agent(user)) return Result<void>::Ok();

        std::vector<std::string> keys = host_.args().identities;
        for (const auto& k : host_.get_all("IdentityFile")) keys.push_back(k);
        for (const char* k : {"~/.ssh/id_ed25519", "~/.ssh/id_ecdsa", "~/.ssh/id_rsa"}) {
            keys.push_back(k);
        }

        if (callback) callback("Trying key files...");
        for (const auto& key : keys) {
            if (auth_key_file(user, key)) return Result<void>::Ok();
        }
    }

    return Result<void>::Err(
        fmt::format("{}: authentication failed (server accepts: {})", target_, methods),
        ErrorKind::Auth);
}

// ── Running commands ──────────────────────────────────────────

Result<int> DirectSession::run(const SessionRequest& req) {
    if (!active_.load()) {
        return Result<int>::Err("session not connected", ErrorKind::Other);
    }

    LIBSSH2_CHANNEL* ch = nullptr;
    while (true) {
        {
            std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
            ch = libssh2_channel_open_session(session_);
            if (ch || libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        }
        platform::sleep_ms(IO_POLL_INTERVAL_MS);
    }
    if (!ch) return Result<int>::Err("Failed to open SSH channel", ErrorKind::Protocol);

    auto free_channel = [&]() {
        std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
        if (lock_->alive) libssh2_channel_free(ch);
    };

    if (req.want_agent) {
        int rc = retry_eagain(*lock_, [ch] { return libssh2_channel_request_auth_agent(ch); });
        if (rc != 0) warning(fmt::format("agent forwarding request failed ({})", rc));
    }

    for (const auto& env : req.env) {
        int rc = retry_eagain(*lock_, [&] {
            return libssh2_channel_setenv_ex(ch, env.name.c_str(),
                                             static_cast<unsigned int>(env.name.size()),
                                             env.value.c_str(),
                                             static_cast<unsigned int>(env.value.size()));
        });
        if (rc != 0) debug(fmt::format("set env {} failed ({})", env.name, rc));
    }

    if (req.want_tty) {
        auto size = platform::terminal_size(req.stdin_fd);
        int rc = retry_eagain(*lock_, [&] {
            return libssh2_channel_request_pty_ex(
                ch, req.term.c_str(), static_cast<unsigned int>(req.term.size()),
                nullptr, 0, size.cols, size.rows, 0, 0);
        });
        if (rc != 0) warning("PTY allocation request failed");
    }

    int rc;
    if (req.command.empty()) {
        rc = retry_eagain(*lock_, [ch] { return libssh2_channel_shell(ch); });
    } else {
        rc = retry_eagain(*lock_, [&] { return libssh2_channel_exec(ch, req.command.c_str()); });
    }
    if (rc != 0) {
        free_channel();
        return Result<int>::Err(
            req.command.empty() ? "Failed to request shell" : "Failed to exec command",
            ErrorKind::Protocol);
    }

    std::optional<platform::RawModeGuard> raw;
    std::optional<platform::ResizeWatcher> resize;
    if (req.want_tty) {
        raw.emplace(req.stdin_fd);
        resize.emplace();
    }

    char buf[SSH_READ_BUF_SIZE];
    bool stdin_open = req.stdin_fd >= 0;
    bool failed = false;

    while (!failed) {
        bool idle = true;

        // stdin → channel
        if (stdin_open && platform::poll_socket(req.stdin_fd, POLLIN, 0) != 0) {
            ssize_t n = ::read(req.stdin_fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                stdin_open = false;
                retry_eagain(*lock_, [ch] { return libssh2_channel_send_eof(ch); });
            } else if (!channel_write_all(*lock_, ch, buf, static_cast<size_t>(n))) {
                failed = true;
                break;
            }
            idle = false;
        }

        // channel → stdout / stderr
        bool eof = false;
        for (int stream : {0, SSH_EXTENDED_DATA_STDERR}) {
            ssize_t n;
            {
                std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
                n = libssh2_channel_read_ex(ch, stream, buf, sizeof(buf));
                eof = libssh2_channel_eof(ch) != 0;
            }
            if (n > 0) {
                int fd = stream == 0 ? req.stdout_fd : req.stderr_fd;
                platform::write_all(fd, buf, static_cast<size_t>(n));
                idle = false;
            } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                debug(fmt::format("channel read failed ({})", n));
                failed = true;
            }
        }
        if (eof && idle) break;

        if (resize && resize->consume()) {
            auto size = platform::terminal_size(req.stdin_fd);
            retry_eagain(*lock_, [&] {
                return libssh2_channel_request_pty_size(ch, size.cols, size.rows);
            });
        }

        if (idle) {
            if (stdin_open) platform::poll_socket(req.stdin_fd, POLLIN, IO_POLL_INTERVAL_MS);
            else platform::sleep_ms(IO_POLL_INTERVAL_MS);
        }
    }

    resize.reset();
    raw.reset();

    retry_eagain(*lock_, [ch] { return libssh2_channel_close(ch); });
    retry_eagain(*lock_, [ch] { return libssh2_channel_wait_closed(ch); });

    int status;
    char* signal_name = nullptr;
    {
        std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
        status = libssh2_channel_get_exit_status(ch);
        libssh2_channel_get_exit_signal(ch, &signal_name, nullptr, nullptr, nullptr,
                                        nullptr, nullptr);
    }
    if (signal_name) {
        debug(fmt::format("remote command killed by signal {}", signal_name));
        libssh2_free(session_, signal_name);
        status = EXIT_CONNECT_FAILED;
    }
    free_channel();

    if (failed) {
        return Result<int>::Err(fmt::format("connection to {} lost", target_), ErrorKind::Protocol);
    }
    return Result<int>::Ok(status);
}

// ── Agent channels ────────────────────────────────────────────

std::shared_ptr<ChannelQueue> DirectSession::handle_channel_open(const std::string& type) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    if (handlers_.count(type)) return nullptr;
    auto queue = std::make_shared<ChannelQueue>();
    handlers_[type] = queue;
    return queue;
}

void DirectSession::agent_channel_callback(LIBSSH2_SESSION* /*session*/,
                                           LIBSSH2_CHANNEL* channel, void** abstract) {
    auto* self = static_cast<DirectSession*>(*abstract);
    if (self) self->deliver_agent_channel(channel);
}

// Called from inside libssh2 packet processing, with the session lock held.
void DirectSession::deliver_agent_channel(LIBSSH2_CHANNEL* channel) {
    std::shared_ptr<ChannelQueue> queue;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(AGENT_CHANNEL_TYPE);
        if (it != handlers_.end()) queue = it->second;
    }
    if (!queue) {
        // Freed with the session; closing here would re-enter libssh2.
        debug("agent channel opened without a handler, ignoring");
        return;
    }
    auto wrapped = std::make_unique<Libssh2Channel>(channel, lock_);
    auto* raw = wrapped.get();
    if (auto rejected = queue->push(std::move(wrapped))) {
        raw->abandon();
        debug("agent channel opened after forwarding stopped, ignoring");
    }
}

void DirectSession::close() {
    active_.store(false);

    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (auto& [type, queue] : handlers_) queue->close();
    }

    {
        std::lock_guard<std::recursive_mutex> guard(lock_->mutex);
        if (session_) {
            agent_.release();
            libssh2_session_disconnect(session_, "Normal disconnection");
            libssh2_session_free(session_);
            session_ = nullptr;
            lock_->alive = false;
        }
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}
