#pragma once

#include "content_source.hpp"
#include "manifest.hpp"

#include <filesystem>
#include <string>
#include <vector>

struct InstalledFile {
    std::string path;    // relative to the package directory
    std::string sha256;
};

// A listed file that could not be installed. Not fatal to the install.
struct FileFailure {
    std::string path;
    long status = 0;     // remote status, 0 when no response was received
    std::string author;  // who to report it to
    std::string detail;
};

struct FileInstallReport {
    std::vector<InstalledFile> installed;
    std::vector<FileFailure> failures;
};

std::filesystem::path package_dir(const std::string& pkg_name);
std::filesystem::path digest_record_path(const std::string& pkg_name);

// Materializes every file the manifest lists under package_dir(manifest.name).
// Throws UnsupportedPlatformError before touching the filesystem when the
// manifest does not list `platform`. Files are fetched concurrently from
// "<manifest.name>/<file>" in `repo`; individual failures are collected in the
// report and never abort the remaining files.
FileInstallReport install_package_files(ContentSource& source,
                                        const RepositoryRef& repo,
                                        const PackageManifest& manifest,
                                        const std::string& platform);

// Records "<sha256>  <path>" for each installed file next to the manifest.
void write_digest_record(const std::string& pkg_name, const std::vector<InstalledFile>& files);
std::vector<InstalledFile> read_digest_record(const std::string& pkg_name);
