#include <gtest/gtest.h>

#include "guard/ProjectValidator.hpp"
#include "temp_dir.hpp"

#include <algorithm>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

static bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

TEST(ProjectValidator, RejectsEtc) {
    const auto v = guard::validate_project_path("/etc");
    EXPECT_FALSE(v.valid);
    EXPECT_TRUE(contains(v.message, "Access to system directory")) << v.message;
}

TEST(ProjectValidator, RejectsPathsUnderDeniedDirectory) {
    const auto v = guard::validate_project_path("/etc/ssh");
    EXPECT_FALSE(v.valid);
    EXPECT_TRUE(contains(v.message, "system directory")) << v.message;

    EXPECT_FALSE(guard::validate_project_path("/proc/self").valid);
    EXPECT_FALSE(guard::validate_project_path("/usr/bin").valid);
}

TEST(ProjectValidator, RejectsTraversal) {
    const auto v = guard::validate_project_path("/tmp/../etc/passwd");
    EXPECT_FALSE(v.valid);
    EXPECT_TRUE(contains(v.message, "traversal")) << v.message;

    EXPECT_FALSE(guard::validate_project_path("books/../../home").valid);
}

TEST(ProjectValidator, RejectsFilesystemRoot) {
    const auto v = guard::validate_project_path("/");
    EXPECT_FALSE(v.valid);
    EXPECT_TRUE(contains(v.message, "system directory")) << v.message;
}

TEST(ProjectValidator, RejectsEmptyAndNul) {
    EXPECT_FALSE(guard::validate_project_path("").valid);
    EXPECT_FALSE(guard::validate_project_path(std::string("/tmp\0/x", 7)).valid);
}

TEST(ProjectValidator, AcceptsOrdinaryDirectory) {
    testutil::TempDir tmp("mdbundle-validator");
    const auto v = guard::validate_project_path(tmp.path().string());
    EXPECT_TRUE(v.valid) << v.message;
    EXPECT_EQ(v.message, "OK");
}

TEST(ProjectValidator, RejectsMissingAndNonDirectory) {
    testutil::TempDir tmp("mdbundle-validator");

    const auto missing = guard::validate_project_path((tmp.path() / "nope").string());
    EXPECT_FALSE(missing.valid);
    EXPECT_TRUE(contains(missing.message, "does not exist")) << missing.message;

    testutil::write_file(tmp.path() / "file.md", "x");
    const auto file = guard::validate_project_path((tmp.path() / "file.md").string());
    EXPECT_FALSE(file.valid);
    EXPECT_TRUE(contains(file.message, "not a directory")) << file.message;
}

TEST(ProjectValidator, RejectsSymlinkIntoDeniedDirectory) {
    testutil::TempDir tmp("mdbundle-validator");
    fs::create_directory_symlink("/etc", tmp.path() / "book");
    const auto v = guard::validate_project_path((tmp.path() / "book").string());
    EXPECT_FALSE(v.valid);
    EXPECT_TRUE(contains(v.message, "system directory")) << v.message;
}

TEST(ProjectValidator, CustomPolicyIsComponentWise) {
    testutil::TempDir tmp("mdbundle-validator");
    fs::create_directories(tmp.path() / "private" / "book");
    fs::create_directories(tmp.path() / "private2");

    guard::ProjectPolicy policy = guard::default_policy();
    policy.denied_dirs.push_back((tmp.path() / "private").string());

    EXPECT_FALSE(guard::validate_project_path((tmp.path() / "private" / "book").string(), policy).valid);
    EXPECT_TRUE(guard::validate_project_path((tmp.path() / "private2").string(), policy).valid);
}

TEST(ProjectValidator, DefaultDenyListCoversSystemRoots) {
    const auto dirs = guard::default_denied_dirs();
    for (const char* d : {"/etc", "/proc", "/sys", "/dev", "/boot"}) {
        EXPECT_NE(std::find(dirs.begin(), dirs.end(), d), dirs.end()) << d;
    }
}
