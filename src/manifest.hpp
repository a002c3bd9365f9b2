#pragma once

#include "content_source.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

inline constexpr const char* MANIFEST_PATH = "package.yml";
inline constexpr const char* DEFAULT_COLOR = "03BAFC";

struct PackageManifest {
    std::string name;
    std::string author;
    std::string description;
    std::string version;
    std::vector<std::string> files;
    std::set<std::string> supported;
    std::optional<std::string> color;
    std::optional<std::string> logo;

    std::string display_color() const { return color.value_or(DEFAULT_COLOR); }
    bool supports(const std::string& platform) const { return supported.contains(platform); }
};

struct FetchedManifest {
    PackageManifest manifest;
    std::string raw; // decoded document bytes, persisted verbatim
};

// Parses a package.yml document. Throws HotpackException on malformed input.
PackageManifest parse_manifest(const std::string& document);

std::filesystem::path local_manifest_path(const std::string& pkg_name);

// Retrieves and parses package.yml from the repository. Throws
// FetchFailedError on a non-success status, attributed to the repository owner.
FetchedManifest fetch_manifest(ContentSource& source, const RepositoryRef& repo);

// Writes the fetched bytes to the local manifest file, replacing any earlier copy.
void persist_manifest(const FetchedManifest& fetched);

// Reads a previously persisted manifest; std::nullopt when none exists.
std::optional<PackageManifest> load_local_manifest(const std::string& pkg_name);
