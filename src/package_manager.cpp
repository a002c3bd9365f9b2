#include "package_manager.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

PackageManager::PackageManager(Settings settings, VerificationService& verifier, ContentSource& source,
                               ExtensionHost& host, SelfService& self)
    : settings_(std::move(settings)), verifier_(verifier), source_(source), host_(host), self_(self) {}

std::string PackageManager::platform() const {
    return get_platform(settings_);
}

RepositoryRef PackageManager::self_repo() const {
    return RepositoryRef{settings_.self_owner, settings_.self_repo};
}

InstallReport PackageManager::install(const std::string& reference) {
    const GateResult gate = verifier_.evaluate(reference, settings_.safe_mode);
    if (gate.decision == GateDecision::Blocked) {
        log_warning(string_format("warning.unverified_package", gate.repo.owner, gate.repo.repository));
        throw UntrustedReferenceError(get_string("error.untrusted_reference"));
    }
    if (gate.confirmation_consumed) {
        log_info(get_string("info.confirmation_consumed"));
    }

    const auto start = std::chrono::steady_clock::now();

    log_info(string_format("info.fetching_manifest", source_.content_root(gate.repo) + MANIFEST_PATH));
    FetchedManifest fetched = fetch_manifest(source_, gate.repo);
    const std::string& pkg_name = fetched.manifest.name;

    PackageLock lock(pkg_name);
    persist_manifest(fetched);

    log_info(string_format("info.installing_package", pkg_name, fetched.manifest.version));
    FileInstallReport files = install_package_files(source_, gate.repo, fetched.manifest, platform());
    write_digest_record(pkg_name, files.installed);

    InstallReport report;
    report.activation = activate_extension(host_, pkg_name);
    report.manifest = std::move(fetched.manifest);
    report.repo = gate.repo;
    report.registry_match = gate.registry_match;
    report.installed = std::move(files.installed);
    report.failures = std::move(files.failures);
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    log_info(string_format("info.package_installed", report.manifest.name, report.duration.count()));
    return report;
}

void PackageManager::uninstall(const std::string& pkg_name) {
    const fs::path dir = package_dir(pkg_name);
    if (pkg_name.empty() || pkg_name.find('/') != std::string::npos || pkg_name == "." || pkg_name == ".."
        || !fs::is_directory(dir)) {
        throw PackageNotFoundError(string_format("error.package_not_installed", pkg_name));
    }

    PackageLock lock(pkg_name);
    if (!fs::is_directory(dir)) { // removed while we waited for the lock
        throw PackageNotFoundError(string_format("error.package_not_installed", pkg_name));
    }

    log_info(string_format("info.removing_package", pkg_name));
    fs::remove_all(dir);
    std::error_code ec;
    fs::remove(local_manifest_path(pkg_name), ec);
    fs::remove(digest_record_path(pkg_name), ec);

    if (!deactivate_extension(host_, pkg_name)) {
        log_info(string_format("info.module_not_loaded", module_name_for(pkg_name)));
    }
    log_info(string_format("info.package_removed", pkg_name));
}

void PackageManager::verify() {
    verifier_.confirm();
    log_info(get_string("info.confirmation_granted"));
}

PackageView PackageManager::view(const std::string& pkg_name) const {
    std::optional<PackageManifest> manifest = load_local_manifest(pkg_name);
    if (!manifest) {
        throw PackageNotFoundError(string_format("error.package_not_found", pkg_name));
    }
    PackageView view;
    view.files = read_digest_record(pkg_name);
    view.files_present = fs::is_directory(package_dir(pkg_name));
    view.manifest = std::move(*manifest);
    return view;
}

SelfView PackageManager::view_self() {
    SelfView view;
    view.version = HOTPACK_VERSION;
    if (!settings_.outdated_warnings) {
        return view;
    }

    try {
        ContentResponse response = source_.fetch(self_repo(), settings_.version_path);
        if (response.ok()) {
            view.latest_version = trim(response.content);
            view.outdated = *view.latest_version != view.version;
        }
    } catch (const HotpackException& e) {
        log_warning(string_format("warning.version_check_failed", std::string(e.what())));
    }
    return view;
}

void PackageManager::update_self() {
    ContentResponse response = source_.fetch(self_repo(), settings_.self_update_path);
    if (!response.ok()) {
        throw FetchFailedError(string_format("error.self_update_failed", settings_.maintainer, response.status),
                               response.status, settings_.maintainer);
    }
    self_.run_update_script(response.content);
    log_info(get_string("info.self_updated"));
}

void PackageManager::reload_self() {
    self_.restart();
}
