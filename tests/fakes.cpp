#include "fakes.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "manifest.hpp"

#include <sstream>

void FakeContentSource::put(const RepositoryRef& repo, const std::string& path, std::string content) {
    std::lock_guard<std::mutex> lock(mtx_);
    ContentResponse response;
    response.status = 200;
    response.content = std::move(content);
    responses_[Key{repo.owner, repo.repository, path}] = std::move(response);
}

void FakeContentSource::fail(const RepositoryRef& repo, const std::string& path, long status) {
    std::lock_guard<std::mutex> lock(mtx_);
    ContentResponse response;
    response.status = status;
    responses_[Key{repo.owner, repo.repository, path}] = std::move(response);
}

ContentResponse FakeContentSource::fetch(const RepositoryRef& repo, const std::string& path) {
    ++fetches_;
    std::lock_guard<std::mutex> lock(mtx_);
    requested_.push_back(repo.owner + "/" + repo.repository + ":" + path);
    const size_t slash = path.find('/');
    if (slash != std::string::npos) {
        const std::string pkg_name = path.substr(0, slash);
        manifest_at_first_file_.try_emplace(pkg_name, std::filesystem::exists(local_manifest_path(pkg_name)));
    }
    auto it = responses_.find(Key{repo.owner, repo.repository, path});
    if (it == responses_.end()) {
        ContentResponse missing;
        missing.status = 404;
        return missing;
    }
    return it->second;
}

std::string FakeContentSource::content_root(const RepositoryRef& repo) const {
    return "fake://repos/" + repo.owner + "/" + repo.repository + "/contents/";
}

std::vector<std::string> FakeContentSource::requested_paths() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return requested_;
}

std::optional<bool> FakeContentSource::manifest_present_at_first_file(const std::string& pkg_name) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = manifest_at_first_file_.find(pkg_name);
    if (it == manifest_at_first_file_.end()) return std::nullopt;
    return it->second;
}

LoadResult FakeExtensionHost::load(const std::string& module_name) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!failure_.empty()) {
        throw HotpackException(failure_);
    }
    ++loads;
    if (!loaded_.insert(module_name).second) {
        return LoadResult::AlreadyLoaded;
    }
    return LoadResult::Loaded;
}

void FakeExtensionHost::reload(const std::string& module_name) {
    std::lock_guard<std::mutex> lock(mtx_);
    ++reloads;
    loaded_.insert(module_name);
}

void FakeExtensionHost::unload(const std::string& module_name) {
    std::lock_guard<std::mutex> lock(mtx_);
    ++unloads;
    loaded_.erase(module_name);
}

bool FakeExtensionHost::is_loaded(const std::string& module_name) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return loaded_.contains(module_name);
}

void use_test_root(const std::filesystem::path& root) {
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);
    set_root_path(root.string());
    set_platform("");
    L10N_DIR = HOTPACK_TEST_L10N_DIR;
    init_localization();
    init_filesystem();
}

std::string package_yaml(const std::string& name, const std::vector<std::string>& files,
                         const std::vector<std::string>& supported) {
    std::ostringstream out;
    out << "name: " << name << "\n"
        << "author: acme-dev\n"
        << "description: Widgets for the host\n"
        << "version: 1.2.0\n"
        << "files:\n";
    for (const auto& file : files) out << "  - " << file << "\n";
    out << "supported:\n";
    for (const auto& platform : supported) out << "  - " << platform << "\n";
    return out.str();
}
