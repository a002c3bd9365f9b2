#pragma once

#include <string>
#include <filesystem>

// Global variables for paths (initially set to defaults, rebased by set_root_path)
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path STATE_DIR;
extern std::filesystem::path L10N_DIR;
extern std::filesystem::path LOCK_DIR;

// Derived paths
extern std::filesystem::path DATA_DIR;      // persisted manifests, one <name>.yml per package
extern std::filesystem::path PACKAGES_DIR;  // installed files, one directory per package
extern std::filesystem::path SETTINGS_CONF;
std::filesystem::path get_tmp_dir();

struct Settings {
    std::string api_url = "https://api.github.com";
    bool safe_mode = true;
    bool outdated_warnings = true;
    std::string platform;
    std::string self_owner = "hotpack-dev";
    std::string self_repo = "hotpack";
    std::string self_update_path = "installer.sh";
    std::string registry_path = "verified.txt";
    std::string version_path = "VERSION";
    std::string maintainer = "hotpack-dev";
};

// Functions
void set_root_path(const std::string& root_path);
void init_filesystem();
Settings load_settings();
void set_platform(const std::string& platform); // Manually override the host identity
std::string get_architecture();
std::string get_platform(const Settings& settings);
