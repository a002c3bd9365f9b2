#include <gtest/gtest.h>
#include "config.hpp"
#include "exception.hpp"
#include "extension_host.hpp"
#include "fakes.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <dlfcn.h>
#include <filesystem>

namespace fs = std::filesystem;

class ExtensionHostTest : public ::testing::Test {
protected:
    fs::path test_root;

    void SetUp() override {
        test_root = fs::absolute("tmp_extension_host_test");
        use_test_root(test_root);
    }

    void TearDown() override {
        unsetenv("HOTPACK_SAMPLE_FAIL");
        set_root_path("/");
        fs::remove_all(test_root);
    }

    // Installs the sample module as packages.<name>
    fs::path install_sample(const std::string& name) {
        fs::path dir = PACKAGES_DIR / name;
        ensure_dir_exists(dir);
        fs::path target = dir / (name + ".so");
        fs::copy_file(HOTPACK_SAMPLE_EXTENSION, target, fs::copy_options::overwrite_existing);
        return target;
    }

    static int sample_active(const fs::path& library) {
        void* handle = dlopen(library.c_str(), RTLD_NOW | RTLD_NOLOAD);
        if (!handle) return -1;
        auto active = reinterpret_cast<int (*)()>(dlsym(handle, "hotpack_sample_active"));
        int value = active ? active() : -1;
        dlclose(handle);
        return value;
    }
};

TEST_F(ExtensionHostTest, ModuleNameIsNamespaced) {
    EXPECT_EQ(module_name_for("widgets"), "packages.widgets");
    EXPECT_EQ(DlopenExtensionHost::library_path("packages.widgets"), PACKAGES_DIR / "widgets" / "widgets.so");
}

TEST_F(ExtensionHostTest, SecondActivationReloads) {
    FakeExtensionHost host;
    EXPECT_EQ(activate_extension(host, "widgets"), Activation::Loaded);
    EXPECT_EQ(activate_extension(host, "widgets"), Activation::Reloaded);
    EXPECT_EQ(host.reloads, 1);
    EXPECT_TRUE(host.is_loaded("packages.widgets"));
}

TEST_F(ExtensionHostTest, LoadFailureNamesTheModule) {
    FakeExtensionHost host;
    host.fail_loads_with("syntax error in module");
    try {
        activate_extension(host, "widgets");
        FAIL() << "expected ActivationFailedError";
    } catch (const ActivationFailedError& e) {
        EXPECT_EQ(e.module_name(), "packages.widgets");
        EXPECT_NE(std::string(e.what()).find("syntax error in module"), std::string::npos);
    }
}

TEST_F(ExtensionHostTest, DeactivateSkipsModulesThatAreNotLoaded) {
    FakeExtensionHost host;
    EXPECT_FALSE(deactivate_extension(host, "widgets"));
    EXPECT_EQ(host.unloads, 0);

    activate_extension(host, "widgets");
    EXPECT_TRUE(deactivate_extension(host, "widgets"));
    EXPECT_EQ(host.unloads, 1);
    EXPECT_FALSE(host.is_loaded("packages.widgets"));
}

TEST_F(ExtensionHostTest, DlopenHostLoadsReloadsAndUnloads) {
    fs::path library = install_sample("sample");
    DlopenExtensionHost host;

    EXPECT_EQ(host.load("packages.sample"), LoadResult::Loaded);
    EXPECT_TRUE(host.is_loaded("packages.sample"));
    EXPECT_EQ(sample_active(library), 1);

    EXPECT_EQ(host.load("packages.sample"), LoadResult::AlreadyLoaded);
    host.reload("packages.sample");
    EXPECT_TRUE(host.is_loaded("packages.sample"));
    EXPECT_EQ(sample_active(library), 1);

    host.unload("packages.sample");
    EXPECT_FALSE(host.is_loaded("packages.sample"));
    EXPECT_THROW(host.unload("packages.sample"), HotpackException);
}

TEST_F(ExtensionHostTest, DlopenHostReportsMissingLibrary) {
    DlopenExtensionHost host;
    EXPECT_THROW(host.load("packages.absent"), HotpackException);
    EXPECT_FALSE(host.is_loaded("packages.absent"));
    EXPECT_THROW(activate_extension(host, "absent"), ActivationFailedError);
}

TEST_F(ExtensionHostTest, DlopenHostRejectsFailingSetup) {
    install_sample("broken");
    setenv("HOTPACK_SAMPLE_FAIL", "1", 1);

    DlopenExtensionHost host;
    EXPECT_THROW(host.load("packages.broken"), HotpackException);
    EXPECT_FALSE(host.is_loaded("packages.broken"));
}
