#include "simdbuild/runtime/artifact_locator.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>

using namespace simdbuild;
using namespace simdbuild::runtime;
using simdbuild::test::TempDir;
using simdbuild::test::write_file;

class ArtifactLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_.cwd = dir_.path();
        env_.target = "x86_64-unknown-linux-gnu";
    }

    fs::path static_lib(const fs::path& dir) {
        return dir / "libkernelsx86_64-unknown-linux-gnu.a";
    }

    TempDir dir_;
    build::BuildEnv env_;
};

// ============================================================================
// Search Order
// ============================================================================

TEST_F(ArtifactLocatorTest, SearchDirectories) {
    env_.prebuilt_path = (dir_.path() / "env1").string() + ":" + (dir_.path() / "env2").string();
    ArtifactLocator locator("kernels", env_);
    locator.search_path("explicit");

    auto dirs = locator.search_dirs();
    ASSERT_EQ(dirs.size(), 4u);
    EXPECT_EQ(dirs[0], dir_.path() / "explicit");
    EXPECT_EQ(dirs[1], dir_.path() / "env1");
    EXPECT_EQ(dirs[2], dir_.path() / "env2");
    EXPECT_EQ(dirs[3], dir_.path() / "prebuilt");
}

TEST_F(ArtifactLocatorTest, OutlivesTemporaryEnvironment) {
    write_file(static_lib(dir_.path() / "env1"), "!<arch>\n");
    auto make_env = [this] {
        build::BuildEnv env = env_;
        env.prebuilt_path = (dir_.path() / "env1").string();
        return env;
    };
    ArtifactLocator locator("kernels", make_env());
    env_.cwd = dir_.path() / "elsewhere";

    ASSERT_EQ(locator.search_dirs().size(), 2u);
    EXPECT_EQ(locator.search_dirs()[1], dir_.path() / "prebuilt");
    auto result = locator.locate();
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result).library, static_lib(dir_.path() / "env1"));
}

TEST_F(ArtifactLocatorTest, ExplicitDirectoryWins) {
    write_file(static_lib(dir_.path() / "prebuilt"), "!<arch>\n");
    write_file(static_lib(dir_.path() / "vendor"), "!<arch>\n");

    ArtifactLocator locator("kernels", env_);
    locator.search_path(dir_.path() / "vendor");
    auto result = locator.locate();
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result).library, static_lib(dir_.path() / "vendor"));
    EXPECT_EQ(unwrap(result).directory, dir_.path() / "vendor");
}

TEST_F(ArtifactLocatorTest, FallsBackToPrebuiltDirectory) {
    write_file(static_lib(dir_.path() / "prebuilt"), "!<arch>\n");

    ArtifactLocator locator("kernels", env_);
    auto result = locator.locate();
    ASSERT_TRUE(is_ok(result));
    const auto& artifact = unwrap(result);
    EXPECT_EQ(artifact.kind, build::LibraryKind::Static);
    EXPECT_FALSE(artifact.bindings.has_value());

    ASSERT_EQ(artifact.directives.link_libs.size(), 1u);
    EXPECT_EQ(artifact.directives.link_libs[0], "static=kernelsx86_64-unknown-linux-gnu");
    ASSERT_EQ(artifact.directives.link_search.size(), 1u);
    EXPECT_EQ(artifact.directives.link_search[0], dir_.path() / "prebuilt");
}

TEST_F(ArtifactLocatorTest, StaticBeforeShared) {
    auto dir = dir_.path() / "prebuilt";
    write_file(dir / "libkernelsx86_64-unknown-linux-gnu.so", "ELF");
    ArtifactLocator locator("kernels", env_);

    auto shared = locator.locate();
    ASSERT_TRUE(is_ok(shared));
    EXPECT_EQ(unwrap(shared).kind, build::LibraryKind::Shared);
    EXPECT_EQ(unwrap(shared).directives.link_libs[0], "dylib=kernelsx86_64-unknown-linux-gnu");

    write_file(static_lib(dir), "!<arch>\n");
    auto both = locator.locate();
    ASSERT_TRUE(is_ok(both));
    EXPECT_EQ(unwrap(both).kind, build::LibraryKind::Static);
}

TEST_F(ArtifactLocatorTest, BindingsAreReportedAndWatched) {
    auto dir = dir_.path() / "prebuilt";
    write_file(static_lib(dir), "!<arch>\n");
    write_file(dir / "kernels.rs", "pub mod kernels {}\n");

    auto result = ArtifactLocator("kernels", env_).locate();
    ASSERT_TRUE(is_ok(result));
    const auto& artifact = unwrap(result);
    ASSERT_TRUE(artifact.bindings.has_value());
    EXPECT_EQ(*artifact.bindings, dir / "kernels.rs");

    const auto& watched = artifact.directives.rerun_if_changed;
    EXPECT_NE(std::find(watched.begin(), watched.end(), static_lib(dir)), watched.end());
    EXPECT_NE(std::find(watched.begin(), watched.end(), dir / "kernels.rs"), watched.end());
}

TEST_F(ArtifactLocatorTest, TargetOverride) {
    write_file(dir_.path() / "prebuilt" / "libkernelsaarch64-apple-darwin.a", "!<arch>\n");
    ArtifactLocator locator("kernels", env_);
    EXPECT_TRUE(is_err(locator.locate()));

    locator.target("aarch64-apple-darwin");
    EXPECT_TRUE(is_ok(locator.locate()));
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ArtifactLocatorTest, NotFoundListsSearchedDirectories) {
    ArtifactLocator locator("kernels", env_);
    locator.search_path("vendor");
    auto result = locator.locate();
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.kind, build::ErrorKind::ArtifactNotFound);
    EXPECT_EQ(error.message,
              "No prebuilt library 'kernels' for target x86_64-unknown-linux-gnu");
    EXPECT_EQ(error.detail, "Searched:\n  " + (dir_.path() / "vendor").string() + "\n  " +
                                (dir_.path() / "prebuilt").string() + "\n");
}

TEST_F(ArtifactLocatorTest, DirectoryWithLibraryNameIsIgnored) {
    fs::create_directories(static_lib(dir_.path() / "prebuilt"));
    auto result = ArtifactLocator("kernels", env_).locate();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, build::ErrorKind::ArtifactNotFound);
}
