#include "utils.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

PackageLock::PackageLock(const std::string& pkg_name)
    : lock_path_(LOCK_DIR / (pkg_name + ".lck")) {
    ensure_dir_exists(LOCK_DIR);
    lock_fd_ = open(lock_path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (lock_fd_ < 0) {
        throw HotpackException(string_format("error.create_file_failed", lock_path_.string()));
    }

    if (flock(lock_fd_, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(lock_fd_);
        lock_fd_ = -1;
        if (err == EWOULDBLOCK) {
            throw PackageBusyError(string_format("error.package_busy", pkg_name));
        }
        throw HotpackException(string_format("error.package_lock_failed", pkg_name, std::string(strerror(err))));
    }
}

PackageLock::~PackageLock() {
    if (lock_fd_ != -1) {
        if (flock(lock_fd_, LOCK_UN) < 0) {
            log_warning(string_format("warning.unlock_failed", lock_path_.string(), std::string(strerror(errno))));
        }
        close(lock_fd_);
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec) && ec) {
            throw HotpackException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw HotpackException(string_format("error.path_not_dir", path.string()));
    }
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw HotpackException(string_format("error.open_file_failed", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void write_file_atomic(const fs::path& path, std::string_view content) {
    fs::path tmp_path = path.string() + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw HotpackException(string_format("error.create_file_failed", tmp_path.string()));
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            throw HotpackException(string_format("error.write_file_failed", tmp_path.string()));
        }
    }
    fs::rename(tmp_path, path);
}

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}
