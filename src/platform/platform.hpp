#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the passwd entry).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Login name of the current user.
std::string local_user();

// Host name of this machine.
std::string local_hostname();

// Absolute path of the running program.
std::string self_executable();

// path with symlinks resolved, or path itself if it cannot be resolved.
std::string real_path(const std::string& path);

} // namespace platform
