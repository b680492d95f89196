/*
 * test_virtual_fs.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_virtual_fs.cpp
 * @brief Tests for the /input, /output and /tmp mount areas
 */

#include <gtest/gtest.h>
#include "guest/access_policy.hpp"
#include "guest/virtual_fs.hpp"

#include <fstream>
#include <sstream>

#include <unistd.h>

using namespace enclave::guest;
using namespace enclave::protocol;
namespace fs = std::filesystem;

class VirtualFilesystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("enclave-vfs-test-" + std::to_string(::getpid()) + "-" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        vfs_ = std::make_unique<VirtualFilesystem>(root_);
        ASSERT_TRUE(vfs_->reset().has_value());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static void writeFile(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    fs::path root_;
    std::unique_ptr<VirtualFilesystem> vfs_;
};

TEST_F(VirtualFilesystemTest, ResetCreatesMountAreas) {
    EXPECT_TRUE(fs::is_directory(root_ / "input"));
    EXPECT_TRUE(fs::is_directory(root_ / "output"));
    EXPECT_TRUE(fs::is_directory(root_ / "tmp"));
}

TEST_F(VirtualFilesystemTest, RelativePathsMountUnderInput) {
    auto resolved = vfs_->resolve("data/report.csv");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, root_ / "input" / "data" / "report.csv");
}

TEST_F(VirtualFilesystemTest, EscapingPathIsSecurityError) {
    auto resolved = vfs_->resolve("../../etc/passwd");
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().kind, ErrorKind::Security);

    auto mounted = vfs_->mount({{"../../escape.txt", "x", FileEncoding::Text}});
    ASSERT_FALSE(mounted.has_value());
    EXPECT_EQ(mounted.error().kind, ErrorKind::Security);
    EXPECT_FALSE(fs::exists(root_.parent_path() / "escape.txt"));
}

TEST_F(VirtualFilesystemTest, MountsTextAndBase64) {
    auto mounted = vfs_->mount({{"notes.txt", "hello", FileEncoding::Text},
                                {"blob.bin", "AP8Q", FileEncoding::Base64}});
    ASSERT_TRUE(mounted.has_value());
    EXPECT_EQ(readFile(root_ / "input" / "notes.txt"), "hello");
    EXPECT_EQ(readFile(root_ / "input" / "blob.bin"), std::string("\x00\xff\x10", 3));
}

TEST_F(VirtualFilesystemTest, BadBase64IsRuntimeError) {
    auto mounted = vfs_->mount({{"blob.bin", "!!!", FileEncoding::Base64}});
    ASSERT_FALSE(mounted.has_value());
    EXPECT_EQ(mounted.error().kind, ErrorKind::Runtime);
}

TEST_F(VirtualFilesystemTest, ResetClearsPreviousRun) {
    ASSERT_TRUE(vfs_->mount({{"secret.txt", "from run one", FileEncoding::Text}}).has_value());
    writeFile(root_ / "output" / "left.txt", "stale");
    writeFile(root_ / "stray.txt", "cwd write");

    ASSERT_TRUE(vfs_->reset().has_value());
    EXPECT_FALSE(fs::exists(root_ / "input" / "secret.txt"));
    EXPECT_FALSE(fs::exists(root_ / "stray.txt"));
    EXPECT_TRUE(vfs_->collectOutputs().empty());
}

TEST_F(VirtualFilesystemTest, MapsGuestPaths) {
    auto mapped = vfs_->mapGuestPath("/output/result.json");
    ASSERT_TRUE(mapped.has_value());
    ASSERT_TRUE(mapped->has_value());
    EXPECT_EQ(**mapped, root_ / "output" / "result.json");

    EXPECT_FALSE(vfs_->mapGuestPath("relative.txt").has_value());
    EXPECT_FALSE(vfs_->mapGuestPath("/etc/hosts").has_value());
    EXPECT_FALSE(vfs_->mapGuestPath("/outputs/x").has_value());
}

TEST_F(VirtualFilesystemTest, HostPathsUnderRootAreNotRemapped) {
    // The root normally lives under /tmp itself
    auto hostPath = (vfs_->root() / "output" / "plot.png").string();
    EXPECT_FALSE(vfs_->mapGuestPath(hostPath).has_value());
    EXPECT_FALSE(vfs_->mapGuestPath(vfs_->root().string()).has_value());
}

TEST_F(VirtualFilesystemTest, MappedTraversalIsRejected) {
    auto mapped = vfs_->mapGuestPath("/tmp/../../../etc/passwd");
    ASSERT_TRUE(mapped.has_value());
    ASSERT_FALSE(mapped->has_value());
    EXPECT_EQ(mapped->error().kind, ErrorKind::Security);
}

TEST_F(VirtualFilesystemTest, CollectsOutputsSortedWithEncoding) {
    fs::create_directories(root_ / "output" / "plots");
    writeFile(root_ / "output" / "summary.txt", "done");
    writeFile(root_ / "output" / "plots" / "a.png", std::string("\x89PNG\r\n\x1a\n", 8));

    auto outputs = vfs_->collectOutputs();
    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_EQ(outputs[0].path, "/output/plots/a.png");
    EXPECT_EQ(outputs[0].encoding, FileEncoding::Base64);
    EXPECT_EQ(outputs[0].mimeType, "image/png");
    EXPECT_EQ(outputs[1].path, "/output/summary.txt");
    EXPECT_EQ(outputs[1].encoding, FileEncoding::Text);
    EXPECT_EQ(outputs[1].content, "done");
}

// =============================================================================
// Access Policy Tests
// =============================================================================

TEST_F(VirtualFilesystemTest, AccessPolicyConfinesWritesToRoot) {
    AccessPolicy policy(root_, {"/usr"});
    EXPECT_TRUE(policy.check(root_ / "output" / "result.txt", GuestAccess::Write).has_value());
    EXPECT_TRUE(policy.check(root_ / "input", GuestAccess::Read, true).has_value());

    auto denied = policy.check("/usr/lib/evil.so", GuestAccess::Write);
    ASSERT_FALSE(denied.has_value());
    EXPECT_NE(denied.error().find("not allowed in the sandbox"), std::string::npos);
    EXPECT_FALSE(policy.check(root_ / "input" / ".." / ".." / "x", GuestAccess::Write));
}

TEST_F(VirtualFilesystemTest, AccessPolicyReadsOnlyListedPrefixes) {
    AccessPolicy policy(root_, {"/usr"});
    EXPECT_TRUE(policy.check("/usr/lib", GuestAccess::Read).has_value());
    EXPECT_FALSE(policy.check("/etc/passwd", GuestAccess::Read).has_value());
    EXPECT_FALSE(policy.check("/proc/self/environ", GuestAccess::Read).has_value());
    // A directory handle outside the root would allow dir_fd lookups
    EXPECT_FALSE(policy.check("/usr", GuestAccess::Read, true).has_value());
    EXPECT_TRUE(policy.check("/dev/null", GuestAccess::Write).has_value());
}

TEST_F(VirtualFilesystemTest, AccessPolicyFollowsSymlinks) {
    std::error_code ec;
    fs::create_directory_symlink("/etc", root_ / "input" / "link", ec);
    ASSERT_FALSE(ec) << ec.message();

    AccessPolicy policy(root_, {});
    EXPECT_FALSE(policy.check(root_ / "input" / "link" / "passwd", GuestAccess::Read));
}
