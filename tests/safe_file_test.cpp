#include <gtest/gtest.h>

#include "guard/Errors.hpp"
#include "guard/SafeFile.hpp"
#include "temp_dir.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

class SafeFileTest : public ::testing::Test {
protected:
    testutil::TempDir tmp{"mdbundle-safefile"};
    fs::path base;

    void SetUp() override {
        base = tmp.path() / "base";
        fs::create_directories(base / "src");
        testutil::write_file(base / "src" / "intro.md", "Hello | world\n");
        testutil::write_file(tmp.path() / "secret.txt", "secret");
    }
};

TEST_F(SafeFileTest, ReadsFileInsideRoot) {
    EXPECT_EQ(guard::read_file(base, "src/intro.md"), "Hello | world\n");
}

TEST_F(SafeFileTest, AcceptsExplicitCanonicalizer) {
    const guard::FilesystemCanonicalizer canon{};
    EXPECT_EQ(guard::read_file(base, "src/../src/intro.md", canon), "Hello | world\n");
}

TEST_F(SafeFileTest, MissingFileIsNotFoundNotSecurity) {
    EXPECT_THROW(guard::read_file(base, "src/missing.md"), guard::FileNotFound);
}

TEST_F(SafeFileTest, TraversalIsSecurityEvenWhenTargetExists) {
    try {
        guard::read_file(base, "../secret.txt");
        FAIL() << "expected SecurityViolation";
    } catch (const guard::SecurityViolation& e) {
        EXPECT_NE(std::string(e.what()).find("Security violation"), std::string::npos);
    }
}

TEST_F(SafeFileTest, TraversalToMissingFileIsStillSecurity) {
    EXPECT_THROW(guard::read_file(base, "../nowhere.txt"), guard::SecurityViolation);
}

TEST_F(SafeFileTest, SymlinkToOutsideFileIsSecurity) {
    fs::create_symlink(tmp.path() / "secret.txt", base / "link.txt");
    EXPECT_THROW(guard::read_file(base, "link.txt"), guard::SecurityViolation);
}

TEST_F(SafeFileTest, DanglingSymlinkOutsideIsSecurityNotNotFound) {
    fs::create_directories(tmp.path() / "outside");
    fs::create_symlink(tmp.path() / "outside" / "x", base / "gone.md");
    fs::create_directory_symlink(tmp.path() / "outside" / "x", base / "gonedir");

    EXPECT_THROW(guard::read_file(base, "gone.md"), guard::SecurityViolation);
    EXPECT_THROW(guard::read_file(base, "gonedir/ch.md"), guard::SecurityViolation);
}

TEST_F(SafeFileTest, ResolveOutputRejectsDanglingSymlinkOutside) {
    fs::create_directories(tmp.path() / "outside");
    fs::create_symlink(tmp.path() / "outside" / "x", base / "book.html");
    fs::create_directory_symlink(tmp.path() / "outside" / "x", base / "site");

    EXPECT_THROW(guard::resolve_output(base, "book.html"), guard::SecurityViolation);
    EXPECT_THROW(guard::resolve_output(base, "site/book.html"), guard::SecurityViolation);
    EXPECT_FALSE(fs::exists(tmp.path() / "outside" / "x"));
}

TEST_F(SafeFileTest, DirectoryIsIoError) {
    EXPECT_THROW(guard::read_file(base, "src"), guard::IoError);
}

TEST_F(SafeFileTest, ResolveOutputCreatesParents) {
    const fs::path out = guard::resolve_output(base, "build/html/book.html");
    EXPECT_EQ(out, base / "build" / "html" / "book.html");
    EXPECT_TRUE(fs::is_directory(base / "build" / "html"));

    guard::write_text(out, "<html></html>\n");
    EXPECT_EQ(guard::read_file(base, "build/html/book.html"), "<html></html>\n");
}

TEST_F(SafeFileTest, ResolveOutputRejectsEscape) {
    EXPECT_THROW(guard::resolve_output(base, "../book.html"), guard::SecurityViolation);
    EXPECT_FALSE(fs::exists(tmp.path() / "book.html"));
}

TEST_F(SafeFileTest, ResolveOutputRejectsSymlinkedParent) {
    fs::create_directories(tmp.path() / "elsewhere");
    fs::create_directory_symlink(tmp.path() / "elsewhere", base / "out");
    EXPECT_THROW(guard::resolve_output(base, "out/book.html"), guard::SecurityViolation);
}

TEST_F(SafeFileTest, ResolveOutputRejectsRoot) {
    EXPECT_THROW(guard::resolve_output(base, ""), guard::IoError);
    EXPECT_THROW(guard::resolve_output(base, "."), guard::IoError);
}
