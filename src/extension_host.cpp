#include "extension_host.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <dlfcn.h>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view MODULE_PREFIX = "packages.";

using SetupFn = int (*)();
using TeardownFn = void (*)();

}

std::string module_name_for(const std::string& pkg_name) {
    return std::string(MODULE_PREFIX) + pkg_name;
}

Activation activate_extension(ExtensionHost& host, const std::string& pkg_name) {
    const std::string module_name = module_name_for(pkg_name);
    try {
        if (host.load(module_name) == LoadResult::Loaded) {
            log_info(string_format("info.module_loaded", module_name));
            return Activation::Loaded;
        }
        host.reload(module_name);
        log_info(string_format("info.module_reloaded", module_name));
        return Activation::Reloaded;
    } catch (const std::exception& e) {
        throw ActivationFailedError(
            string_format("error.activation_failed", module_name, std::string(e.what())), module_name);
    }
}

bool deactivate_extension(ExtensionHost& host, const std::string& pkg_name) {
    const std::string module_name = module_name_for(pkg_name);
    if (!host.is_loaded(module_name)) {
        return false;
    }
    host.unload(module_name);
    log_info(string_format("info.module_unloaded", module_name));
    return true;
}

void DlopenExtensionHost::DlcloseDeleter::operator()(void* handle) const {
    if (handle) {
        dlclose(handle);
    }
}

DlopenExtensionHost::~DlopenExtensionHost() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& [name, handle] : modules_) {
        if (auto teardown = reinterpret_cast<TeardownFn>(dlsym(handle.get(), "hotpack_extension_teardown"))) {
            teardown();
        }
    }
    modules_.clear();
}

fs::path DlopenExtensionHost::library_path(const std::string& module_name) {
    std::string_view name = module_name;
    if (name.starts_with(MODULE_PREFIX)) {
        name.remove_prefix(MODULE_PREFIX.size());
    }
    const std::string pkg_name(name);
    return PACKAGES_DIR / pkg_name / (pkg_name + ".so");
}

DlopenExtensionHost::LibraryHandle DlopenExtensionHost::open_library(const std::string& module_name) {
    const fs::path path = library_path(module_name);
    if (!fs::exists(path)) {
        throw HotpackException(string_format("error.module_library_missing", path.string()));
    }

    dlerror(); // Clear any stale error
    LibraryHandle handle(dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL));
    if (!handle) {
        const char* err = dlerror();
        throw HotpackException(string_format("error.dlopen_failed", path.string(), std::string(err ? err : "")));
    }

    if (auto setup = reinterpret_cast<SetupFn>(dlsym(handle.get(), "hotpack_extension_setup"))) {
        const int rc = setup();
        if (rc != 0) {
            throw HotpackException(string_format("error.module_setup_failed", module_name, rc));
        }
    }
    return handle;
}

void DlopenExtensionHost::close_library(const std::string& module_name, LibraryHandle handle) {
    if (auto teardown = reinterpret_cast<TeardownFn>(dlsym(handle.get(), "hotpack_extension_teardown"))) {
        teardown();
    }
    handle.reset();
    log_info(string_format("info.library_closed", module_name));
}

LoadResult DlopenExtensionHost::load(const std::string& module_name) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (modules_.contains(module_name)) {
        return LoadResult::AlreadyLoaded;
    }
    modules_.emplace(module_name, open_library(module_name));
    return LoadResult::Loaded;
}

void DlopenExtensionHost::reload(const std::string& module_name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = modules_.find(module_name);
    if (it != modules_.end()) {
        LibraryHandle old = std::move(it->second);
        modules_.erase(it);
        close_library(module_name, std::move(old));
    }
    modules_.emplace(module_name, open_library(module_name));
}

void DlopenExtensionHost::unload(const std::string& module_name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = modules_.find(module_name);
    if (it == modules_.end()) {
        throw HotpackException(string_format("error.module_not_loaded", module_name));
    }
    LibraryHandle handle = std::move(it->second);
    modules_.erase(it);
    close_library(module_name, std::move(handle));
}

bool DlopenExtensionHost::is_loaded(const std::string& module_name) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return modules_.contains(module_name);
}
