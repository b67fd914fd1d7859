/**
 * @file test_path_guard.cpp
 * @brief Unit tests for path_guard
 */

#include <gtest/gtest.h>

#include <portal/core/path_guard.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace portal::test {

namespace fs = std::filesystem;

class PathGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
                    ("portal_guard_test_" + std::to_string(std::random_device{}()));
        root_ = test_dir_ / "root";
        fs::create_directories(root_);

        auto guard = path_guard::create(root_);
        ASSERT_TRUE(guard.has_value()) << guard.error().message;
        guard_.emplace(std::move(guard.value()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    auto canonical_root() const -> fs::path { return fs::canonical(root_); }

    fs::path test_dir_;
    fs::path root_;
    std::optional<path_guard> guard_;
};

TEST_F(PathGuardTest, RootIsCanonical) {
    EXPECT_EQ(guard_->root(), canonical_root());
}

TEST_F(PathGuardTest, CreateRejectsMissingRoot) {
    auto guard = path_guard::create(test_dir_ / "missing");
    ASSERT_FALSE(guard.has_value());
    EXPECT_EQ(guard.error().code, error_code::invalid_configuration);
}

TEST_F(PathGuardTest, CreateRejectsFileRoot) {
    auto file = test_dir_ / "plain.txt";
    std::ofstream(file) << "x";

    auto guard = path_guard::create(file);
    ASSERT_FALSE(guard.has_value());
    EXPECT_EQ(guard.error().code, error_code::invalid_configuration);
}

TEST_F(PathGuardTest, SimpleName) {
    auto target = guard_->resolve("a.txt");
    ASSERT_TRUE(target.has_value()) << target.error().message;
    EXPECT_EQ(target.value(), canonical_root() / "a.txt");
}

TEST_F(PathGuardTest, NestedNameIsNotCreated) {
    auto target = guard_->resolve("docs/2024/a.txt");
    ASSERT_TRUE(target.has_value()) << target.error().message;
    EXPECT_EQ(target.value(), canonical_root() / "docs" / "2024" / "a.txt");
    EXPECT_FALSE(fs::exists(root_ / "docs"));
}

TEST_F(PathGuardTest, LeadingSlashIsRelativeToRoot) {
    auto target = guard_->resolve("/photos/a.jpg");
    ASSERT_TRUE(target.has_value()) << target.error().message;
    EXPECT_EQ(target.value(), canonical_root() / "photos" / "a.jpg");
}

TEST_F(PathGuardTest, EmptyAndDotSegmentsAreDropped) {
    auto target = guard_->resolve("./docs//./a.txt");
    ASSERT_TRUE(target.has_value()) << target.error().message;
    EXPECT_EQ(target.value(), canonical_root() / "docs" / "a.txt");
}

TEST_F(PathGuardTest, InnerParentThatStaysInsideIsAllowed) {
    auto target = guard_->resolve("docs/../a.txt");
    ASSERT_TRUE(target.has_value()) << target.error().message;
    EXPECT_EQ(target.value(), canonical_root() / "a.txt");
}

TEST_F(PathGuardTest, EscapesAreRejected) {
    for (const char* name : {"../escape.txt", "docs/../../escape.txt", "/../escape.txt",
                             "..", "a/b/../../../x"}) {
        auto target = guard_->resolve(name);
        ASSERT_FALSE(target.has_value()) << name;
        EXPECT_EQ(target.error().code, error_code::path_violation) << name;
    }
    EXPECT_FALSE(fs::exists(test_dir_ / "escape.txt"));
}

TEST_F(PathGuardTest, RootItselfIsRejected) {
    for (const char* name : {"", "/", ".", "./", "docs/.."}) {
        auto target = guard_->resolve(name);
        ASSERT_FALSE(target.has_value()) << "'" << name << "'";
        EXPECT_EQ(target.error().code, error_code::path_violation);
    }
}

TEST_F(PathGuardTest, NulIsRejected) {
    std::string name("a\0b.txt", 7);
    auto target = guard_->resolve(name);
    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error().code, error_code::path_violation);
}

TEST_F(PathGuardTest, SymlinkOutOfRootIsRejected) {
    auto outside = test_dir_ / "outside";
    fs::create_directories(outside);

    std::error_code ec;
    fs::create_directory_symlink(outside, root_ / "link", ec);
    if (ec) {
        GTEST_SKIP() << "Cannot create symlinks: " << ec.message();
    }

    auto target = guard_->resolve("link/secret.txt");
    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error().code, error_code::path_violation);
}

TEST_F(PathGuardTest, SymlinkInsideRootIsAllowed) {
    fs::create_directories(root_ / "real");

    std::error_code ec;
    fs::create_directory_symlink(root_ / "real", root_ / "alias", ec);
    if (ec) {
        GTEST_SKIP() << "Cannot create symlinks: " << ec.message();
    }

    auto target = guard_->resolve("alias/a.txt");
    ASSERT_TRUE(target.has_value()) << target.error().message;
    EXPECT_EQ(target.value(), canonical_root() / "real" / "a.txt");
}

}  // namespace portal::test
