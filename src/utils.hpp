#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <filesystem>

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Exclusive per-package lock (RAII). Throws PackageBusyError when another
// install or uninstall of the same package holds it.
class PackageLock {
public:
    explicit PackageLock(const std::string& pkg_name);
    ~PackageLock();
    PackageLock(const PackageLock&) = delete;
    PackageLock& operator=(const PackageLock&) = delete;
private:
    std::filesystem::path lock_path_;
    int lock_fd_ = -1;
};

// Filesystem utilities
void ensure_dir_exists(const std::filesystem::path& path);
std::string read_file(const std::filesystem::path& path);
void write_file_atomic(const std::filesystem::path& path, std::string_view content);

// String utilities
std::string trim(std::string_view s);
