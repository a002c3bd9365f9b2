#pragma once

#include "config.hpp"
#include "content_source.hpp"
#include "extension_host.hpp"
#include "installer.hpp"
#include "manifest.hpp"
#include "self_service.hpp"
#include "verification.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct InstallReport {
    PackageManifest manifest;
    RepositoryRef repo;
    bool registry_match = false;
    std::vector<InstalledFile> installed;
    std::vector<FileFailure> failures;
    Activation activation = Activation::Loaded;
    std::chrono::milliseconds duration{0};
};

struct PackageView {
    PackageManifest manifest;
    std::vector<InstalledFile> files;
    bool files_present = false;
};

struct SelfView {
    std::string version;
    std::optional<std::string> latest_version; // set when the remote version could be read
    bool outdated = false;
};

class PackageManager {
public:
    PackageManager(Settings settings, VerificationService& verifier, ContentSource& source,
                   ExtensionHost& host, SelfService& self);

    // Trust gate -> manifest fetch -> file install -> activation.
    InstallReport install(const std::string& reference);

    // Throws PackageNotFoundError, without touching the filesystem, when the
    // package directory does not exist.
    void uninstall(const std::string& pkg_name);

    // Grants the one-shot confirmation consumed by the next install.
    void verify();

    // Offline: reads the persisted manifest. Throws PackageNotFoundError.
    PackageView view(const std::string& pkg_name) const;
    SelfView view_self();

    void update_self();
    void reload_self();

    const Settings& settings() const { return settings_; }
    std::string platform() const;

private:
    RepositoryRef self_repo() const;

    Settings settings_;
    VerificationService& verifier_;
    ContentSource& source_;
    ExtensionHost& host_;
    SelfService& self_;
};
