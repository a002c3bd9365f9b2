#include "installer.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fstream>
#include <functional>
#include <future>
#include <set>
#include <sstream>
#include <variant>

namespace fs = std::filesystem;

namespace {

using FileOutcome = std::variant<InstalledFile, FileFailure>;

bool is_safe_relative_path(const std::string& path) {
    if (path.empty()) return false;
    fs::path p(path);
    if (p.is_absolute() || p.has_root_name()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

FileOutcome install_one(ContentSource& source, const RepositoryRef& repo,
                        const PackageManifest& manifest, const fs::path& target_dir,
                        const std::string& file) {
    FileFailure failure{file, 0, manifest.author, ""};
    try {
        ContentResponse response = source.fetch(repo, manifest.name + "/" + file);
        if (!response.ok()) {
            failure.status = response.status;
            failure.detail = response.error;
            return failure;
        }

        const fs::path target = target_dir / fs::path(file).lexically_normal();
        ensure_dir_exists(target.parent_path());
        write_file_atomic(target, response.content);
        return InstalledFile{file, calculate_sha256(target)};
    } catch (const HotpackException& e) {
        failure.detail = e.what();
    } catch (const fs::filesystem_error& e) {
        failure.detail = e.what();
    }
    return failure;
}

}

fs::path package_dir(const std::string& pkg_name) {
    return PACKAGES_DIR / pkg_name;
}

fs::path digest_record_path(const std::string& pkg_name) {
    return DATA_DIR / (pkg_name + ".files");
}

FileInstallReport install_package_files(ContentSource& source,
                                        const RepositoryRef& repo,
                                        const PackageManifest& manifest,
                                        const std::string& platform) {
    if (!manifest.supports(platform)) {
        throw UnsupportedPlatformError(string_format("error.unsupported_platform", manifest.name, platform));
    }

    const fs::path target_dir = package_dir(manifest.name);
    ensure_dir_exists(target_dir); // a directory left by an earlier install is reused

    FileInstallReport report;
    std::set<std::string> seen;
    std::vector<std::future<FileOutcome>> pending;

    for (const auto& file : manifest.files) {
        if (!seen.insert(file).second) continue;
        if (!is_safe_relative_path(file)) {
            report.failures.push_back(FileFailure{file, 0, manifest.author, get_string("error.unsafe_file_path")});
            continue;
        }
        pending.push_back(std::async(std::launch::async, install_one,
                                     std::ref(source), std::cref(repo), std::cref(manifest),
                                     std::cref(target_dir), file));
    }

    for (auto& task : pending) {
        FileOutcome outcome = task.get();
        if (auto* installed = std::get_if<InstalledFile>(&outcome)) {
            report.installed.push_back(std::move(*installed));
        } else {
            report.failures.push_back(std::move(std::get<FileFailure>(outcome)));
        }
    }

    for (const auto& failure : report.failures) {
        log_warning(string_format("warning.file_install_failed", failure.path, failure.author, failure.status));
    }
    return report;
}

void write_digest_record(const std::string& pkg_name, const std::vector<InstalledFile>& files) {
    std::ostringstream out;
    for (const auto& file : files) {
        out << file.sha256 << "  " << file.path << "\n";
    }
    ensure_dir_exists(DATA_DIR);
    write_file_atomic(digest_record_path(pkg_name), out.str());
}

std::vector<InstalledFile> read_digest_record(const std::string& pkg_name) {
    std::vector<InstalledFile> files;
    std::ifstream in(digest_record_path(pkg_name));
    std::string line;
    while (std::getline(in, line)) {
        const size_t sep = line.find("  ");
        if (sep == std::string::npos) continue;
        files.push_back(InstalledFile{line.substr(sep + 2), line.substr(0, sep)});
    }
    return files;
}
