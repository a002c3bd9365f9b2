#include "self_service.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

std::vector<std::string> restart_arguments(const std::string& program, const LaunchOptions& options) {
    std::vector<std::string> args{program};
    if (!options.root.empty()) {
        args.push_back("--root");
        args.push_back(options.root);
    }
    if (!options.platform.empty()) {
        args.push_back("--platform");
        args.push_back(options.platform);
    }
    if (!options.api_url.empty()) {
        args.push_back("--api-url");
        args.push_back(options.api_url);
    }
    if (options.no_safe_mode) {
        args.push_back("--no-safe-mode");
    }
    return args;
}

ProcessSelfService::ProcessSelfService(std::vector<std::string> argv) : argv_(std::move(argv)) {}

void ProcessSelfService::run_update_script(const std::string& script) {
    ensure_dir_exists(get_tmp_dir());
    const fs::path script_path = get_tmp_dir() / "installer.sh";
    write_file_atomic(script_path, script);
    fs::permissions(script_path, fs::perms::owner_all, fs::perm_options::replace);

    log_info(string_format("info.running_update_script", script_path.string()));

    // Run the script directly, no shell command line
    pid_t pid = fork();
    if (pid == -1) {
        throw HotpackException(string_format("error.fork_failed", std::string(strerror(errno))));
    }
    if (pid == 0) {
        execl("/bin/sh", "sh", script_path.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw HotpackException(string_format("error.waitpid_failed", std::string(strerror(errno))));
        }
    }
    std::error_code ec;
    fs::remove(script_path, ec);

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        throw HotpackException(string_format("error.update_script_failed", code));
    }
}

void ProcessSelfService::restart() {
    std::vector<char*> c_args;
    for (auto& arg : argv_) c_args.push_back(arg.data());
    c_args.push_back(nullptr);

    log_info(get_string("info.restarting"));
    execv("/proc/self/exe", c_args.data());
    throw HotpackException(string_format("error.restart_failed", std::string(strerror(errno))));
}
