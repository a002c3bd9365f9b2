#include "manifest.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace {

std::string required_scalar(const YAML::Node& doc, const char* key) {
    const YAML::Node node = doc[key];
    if (!node || !node.IsScalar()) {
        throw HotpackException(string_format("error.manifest_missing_field", std::string(key)));
    }
    return node.as<std::string>();
}

std::optional<std::string> optional_scalar(const YAML::Node& doc, const char* key) {
    const YAML::Node node = doc[key];
    if (!node || node.IsNull()) return std::nullopt;
    if (!node.IsScalar()) {
        throw HotpackException(string_format("error.manifest_bad_field", std::string(key)));
    }
    return node.as<std::string>();
}

std::vector<std::string> string_list(const YAML::Node& doc, const char* key) {
    std::vector<std::string> values;
    const YAML::Node node = doc[key];
    if (!node || node.IsNull()) return values;
    if (node.IsScalar()) { // single entry written without a list
        values.push_back(node.as<std::string>());
        return values;
    }
    if (!node.IsSequence()) {
        throw HotpackException(string_format("error.manifest_bad_field", std::string(key)));
    }
    for (const auto& item : node) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

bool is_valid_package_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    });
}

}

PackageManifest parse_manifest(const std::string& document) {
    YAML::Node doc;
    try {
        doc = YAML::Load(document);
    } catch (const YAML::Exception& e) {
        throw HotpackException(string_format("error.manifest_parse_failed", std::string(e.what())));
    }
    if (!doc.IsMap()) {
        throw HotpackException(get_string("error.manifest_not_map"));
    }

    PackageManifest manifest;
    try {
        manifest.name = required_scalar(doc, "name");
        manifest.version = required_scalar(doc, "version");
        manifest.author = optional_scalar(doc, "author").value_or("");
        manifest.description = optional_scalar(doc, "description").value_or("");
        manifest.files = string_list(doc, "files");
        for (auto& platform : string_list(doc, "supported")) {
            manifest.supported.insert(std::move(platform));
        }
        manifest.color = optional_scalar(doc, "color");
        manifest.logo = optional_scalar(doc, "logo");
    } catch (const YAML::Exception& e) {
        throw HotpackException(string_format("error.manifest_parse_failed", std::string(e.what())));
    }

    if (!is_valid_package_name(manifest.name)) {
        throw HotpackException(string_format("error.manifest_bad_name", manifest.name));
    }
    if (manifest.color && !manifest.color->empty() && manifest.color->front() == '#') {
        manifest.color->erase(0, 1);
    }
    return manifest;
}

fs::path local_manifest_path(const std::string& pkg_name) {
    return DATA_DIR / (pkg_name + ".yml");
}

FetchedManifest fetch_manifest(ContentSource& source, const RepositoryRef& repo) {
    ContentResponse response = source.fetch(repo, MANIFEST_PATH);
    if (!response.ok()) {
        throw FetchFailedError(
            string_format("error.manifest_fetch_failed", repo.repository, repo.owner, response.status),
            response.status, repo.owner);
    }

    PackageManifest manifest = parse_manifest(response.content);
    return FetchedManifest{std::move(manifest), std::move(response.content)};
}

void persist_manifest(const FetchedManifest& fetched) {
    ensure_dir_exists(DATA_DIR);
    write_file_atomic(local_manifest_path(fetched.manifest.name), fetched.raw);
}

std::optional<PackageManifest> load_local_manifest(const std::string& pkg_name) {
    if (!is_valid_package_name(pkg_name)) return std::nullopt;
    const fs::path path = local_manifest_path(pkg_name);
    if (!fs::exists(path)) return std::nullopt;
    return parse_manifest(read_file(path));
}
