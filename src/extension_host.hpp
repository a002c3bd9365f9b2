#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

enum class LoadResult {
    Loaded,
    AlreadyLoaded
};

// Host runtime that owns the live code modules. load() reports an already
// active module as AlreadyLoaded; every other failure is thrown.
class ExtensionHost {
public:
    virtual ~ExtensionHost() = default;

    virtual LoadResult load(const std::string& module_name) = 0;
    virtual void reload(const std::string& module_name) = 0;
    virtual void unload(const std::string& module_name) = 0;
    virtual bool is_loaded(const std::string& module_name) const = 0;
};

enum class Activation {
    Loaded,
    Reloaded
};

std::string module_name_for(const std::string& pkg_name);

// Loads the package's module, falling back to reload when it is already
// active. Throws ActivationFailedError naming the module on any other failure.
Activation activate_extension(ExtensionHost& host, const std::string& pkg_name);

// Unloads the package's module if it is active; returns false when it was not.
bool deactivate_extension(ExtensionHost& host, const std::string& pkg_name);

// Loads packages as shared objects: packages.<name> maps to
// <packages>/<name>/<name>.so. Optional C entry points:
//   int  hotpack_extension_setup(void);    non-zero fails the load
//   void hotpack_extension_teardown(void);
class DlopenExtensionHost : public ExtensionHost {
public:
    DlopenExtensionHost() = default;
    ~DlopenExtensionHost() override;

    DlopenExtensionHost(const DlopenExtensionHost&) = delete;
    DlopenExtensionHost& operator=(const DlopenExtensionHost&) = delete;

    LoadResult load(const std::string& module_name) override;
    void reload(const std::string& module_name) override;
    void unload(const std::string& module_name) override;
    bool is_loaded(const std::string& module_name) const override;

    static std::filesystem::path library_path(const std::string& module_name);

private:
    struct DlcloseDeleter {
        void operator()(void* handle) const;
    };
    using LibraryHandle = std::unique_ptr<void, DlcloseDeleter>;

    LibraryHandle open_library(const std::string& module_name);
    void close_library(const std::string& module_name, LibraryHandle handle);

    std::map<std::string, LibraryHandle> modules_;
    mutable std::mutex mtx_;
};
