#pragma once

// A stand-in agent on a unix socket: echoes every connection until EOF.

#include <atomic>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

class EchoAgent {
public:
    explicit EchoAgent(const std::string& path) : path_(path) {
        listen_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        struct sockaddr_un addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        unlink(path.c_str());
        bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
        listen(listen_fd_, 8);
        accept_thread_ = std::thread([this] {
            while (true) {
                int conn = accept(listen_fd_, nullptr, nullptr);
                if (conn < 0) return;
                connections_.fetch_add(1);
                std::lock_guard<std::mutex> lock(mutex_);
                workers_.emplace_back([conn] { echo(conn); });
            }
        });
    }

    ~EchoAgent() {
        shutdown(listen_fd_, SHUT_RDWR);
        close(listen_fd_);
        if (accept_thread_.joinable()) accept_thread_.join();
        for (auto& t : workers_) t.join();
        unlink(path_.c_str());
    }

    EchoAgent(const EchoAgent&) = delete;
    EchoAgent& operator=(const EchoAgent&) = delete;

    int connections() const { return connections_.load(); }

private:
    std::string path_;
    int listen_fd_ = -1;
    std::thread accept_thread_;
    std::mutex mutex_;
    std::vector<std::thread> workers_;
    std::atomic<int> connections_{0};

    static void echo(int conn) {
        char buf[1024];
        while (true) {
            ssize_t n = read(conn, buf, sizeof(buf));
            if (n <= 0) break;
            if (write(conn, buf, static_cast<size_t>(n)) != n) break;
        }
        close(conn);
    }
};
