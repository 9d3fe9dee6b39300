#pragma once

#include <string>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <atomic>
#include <mutex>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string ctlssh_log_path() {
    static std::string path = (platform::temp_dir() / "ctlssh_debug.log").string();
    return path;
}

// Set by -v. Debug lines also go to stderr while this is on.
inline std::atomic<bool> g_debug_logging{false};

inline void set_debug_logging(bool enabled) { g_debug_logging.store(enabled); }
inline bool debug_logging_enabled() { return g_debug_logging.load(); }

inline std::string log_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

inline void ctlssh_log(const std::string& msg) {
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(ctlssh_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << log_timestamp() << "] " << msg << "\n";
}

inline void debug(const std::string& msg) {
    ctlssh_log(msg);
    if (debug_logging_enabled()) {
        std::cerr << fmt::format("\033[0;36m[{}] {}\033[0m\r\n", log_timestamp(), msg);
    }
}

inline void warning(const std::string& msg) {
    ctlssh_log("WARNING: " + msg);
    std::cerr << fmt::format("\033[0;33mWarning: {}\033[0m\r\n", msg);
}
