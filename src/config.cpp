#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/utsname.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

fs::path CONFIG_DIR = HOTPACK_CONF_DIR;
fs::path STATE_DIR = HOTPACK_STATE_DIR;
fs::path L10N_DIR = HOTPACK_L10N_DIR;
fs::path LOCK_DIR = HOTPACK_LOCK_DIR;

// Derived paths
fs::path DATA_DIR = fs::path(HOTPACK_STATE_DIR) / "data/";
fs::path PACKAGES_DIR = fs::path(HOTPACK_STATE_DIR) / "packages/";
fs::path SETTINGS_CONF = fs::path(HOTPACK_CONF_DIR) / "hotpack.conf";

void set_root_path(const std::string& root_path) {
    fs::path root = fs::path(root_path).lexically_normal();
    if (root.empty()) root = "/";

    auto rebase = [&](const std::string& default_path) {
        fs::path p(default_path);
        if (p.is_absolute()) {
            return root / p.relative_path();
        }
        return root / p;
    };

    CONFIG_DIR = rebase(HOTPACK_CONF_DIR);
    STATE_DIR = rebase(HOTPACK_STATE_DIR);
    LOCK_DIR = rebase(HOTPACK_LOCK_DIR);

    DATA_DIR = STATE_DIR / "data/";
    PACKAGES_DIR = STATE_DIR / "packages/";
    SETTINGS_CONF = CONFIG_DIR / "hotpack.conf";
}

fs::path get_tmp_dir() {
    static const fs::path tmp_dir = fs::path("/tmp") / ("hotpack_" + std::to_string(getpid()));
    return tmp_dir;
}

void init_filesystem() {
    ensure_dir_exists(CONFIG_DIR);
    ensure_dir_exists(STATE_DIR);
    ensure_dir_exists(DATA_DIR);
    ensure_dir_exists(PACKAGES_DIR);
    ensure_dir_exists(LOCK_DIR);
}

namespace {

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "yes" || value == "1") return true;
    if (value == "false" || value == "no" || value == "0") return false;
    throw HotpackException(string_format("error.invalid_setting", key, value));
}

}

Settings load_settings() {
    Settings settings;
    std::ifstream file(SETTINGS_CONF);
    if (!file.is_open()) {
        return settings; // Defaults
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            log_warning(string_format("warning.malformed_setting", line));
            continue;
        }
        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));

        if (key == "api_url") {
            while (!value.empty() && value.back() == '/') value.pop_back();
            settings.api_url = value;
        } else if (key == "safe_mode") {
            settings.safe_mode = parse_bool(key, value);
        } else if (key == "outdated_warnings") {
            settings.outdated_warnings = parse_bool(key, value);
        } else if (key == "platform") {
            settings.platform = value;
        } else if (key == "self_owner") {
            settings.self_owner = value;
        } else if (key == "self_repo") {
            settings.self_repo = value;
        } else if (key == "self_update_path") {
            settings.self_update_path = value;
        } else if (key == "registry_path") {
            settings.registry_path = value;
        } else if (key == "version_path") {
            settings.version_path = value;
        } else if (key == "maintainer") {
            settings.maintainer = value;
        } else {
            log_warning(string_format("warning.unknown_setting", key));
        }
    }
    return settings;
}

static std::string g_platform_override;

void set_platform(const std::string& platform) {
    g_platform_override = platform;
}

std::string get_architecture() {
    struct utsname buf;
    if (uname(&buf) != 0) {
        throw HotpackException(get_string("error.get_arch_failed"));
    }
    std::string arch(buf.machine);
    if (arch == "x86_64") return "amd64";
    if (arch == "aarch64") return "arm64";
    return arch;
}

std::string get_platform(const Settings& settings) {
    if (!g_platform_override.empty()) {
        return g_platform_override;
    }
    if (!settings.platform.empty()) {
        return settings.platform;
    }
    return "linux-" + get_architecture();
}
