#include "platform.hpp"
#include <cstdlib>
#include <system_error>

#include <unistd.h>
#include <pwd.h>
#include <limits.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);
    if (struct passwd* pw = getpwuid(getuid())) {
        if (pw->pw_dir) return fs::path(pw->pw_dir);
    }
    return temp_dir();
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

std::string local_user() {
    if (struct passwd* pw = getpwuid(getuid())) {
        if (pw->pw_name) return pw->pw_name;
    }
    const char* user = std::getenv("USER");
    return user ? user : "";
}

std::string local_hostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) return "localhost";
    return buf;
}

std::string self_executable() {
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    return ec ? std::string() : p.string();
}

std::string real_path(const std::string& path) {
    std::error_code ec;
    auto p = fs::canonical(path, ec);
    return ec ? path : p.string();
}

} // namespace platform
