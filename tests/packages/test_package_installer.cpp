/*
 * test_package_installer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_package_installer.cpp
 * @brief Tests for the batch installer, with pip kept out of the loop
 */

#include <gtest/gtest.h>
#include "packages/package_installer.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace enclave::packages;

class PackageInstallerTest : public ::testing::Test {
protected:
    void SetUp() override {
        installer_.setAvailabilityCheck([this](std::string_view name) {
            checked_.emplace_back(name);
            return available_;
        });
    }

    bool wasChecked(const std::string& name) const {
        return std::find(checked_.begin(), checked_.end(), name) != checked_.end();
    }

    PackageInstaller installer_;
    std::vector<std::string> checked_;
    bool available_{true};
};

TEST_F(PackageInstallerTest, AvailablePackagesAreReportedInstalled) {
    auto report = installer_.installAll({"numpy", "requests"});
    EXPECT_EQ(report.installed, (std::vector<std::string>{"numpy", "requests"}));
    EXPECT_TRUE(report.notes.empty());
    EXPECT_TRUE(installer_.isPackageInstalled("numpy"));
}

TEST_F(PackageInstallerTest, SecondInstallSkipsAvailabilityCheck) {
    ASSERT_TRUE(installer_.installPackage("numpy").has_value());
    checked_.clear();
    ASSERT_TRUE(installer_.installPackage("NumPy").has_value());
    EXPECT_TRUE(checked_.empty());
}

TEST_F(PackageInstallerTest, AliasProducesNote) {
    auto report = installer_.installAll({"cv2"});
    ASSERT_EQ(report.installed.size(), 1u);
    EXPECT_EQ(report.installed[0], "opencv-python");
    ASSERT_EQ(report.notes.size(), 1u);
    EXPECT_EQ(report.notes[0], "Note: Resolved package alias \"cv2\" → \"opencv-python\"");
}

TEST_F(PackageInstallerTest, IncompatiblePackagesAreNeverAttempted) {
    auto report = installer_.installAll({"torch", "pdf2image", "numpy"});
    EXPECT_FALSE(wasChecked("torch"));
    EXPECT_FALSE(wasChecked("pdf2image"));
    EXPECT_EQ(report.installed, std::vector<std::string>{"numpy"});
    ASSERT_EQ(report.notes.size(), 2u);
    EXPECT_EQ(report.notes[0].rfind("Warning: \"torch\" is not supported in the sandbox", 0), 0u);
}

TEST_F(PackageInstallerTest, IncompatibleSinglePackageFails) {
    auto result = installer_.installPackage("tensorflow");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error, PackageError::Incompatible);
}

TEST_F(PackageInstallerTest, InvalidNameRejectedWithoutAvailabilityCheck) {
    auto result = installer_.installPackage("--index-url=evil");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error, PackageError::InvalidName);
    EXPECT_TRUE(checked_.empty());
}

TEST_F(PackageInstallerTest, UnconfiguredInstallerReportsFailureAsWarning) {
    available_ = false;
    auto report = installer_.installAll({"requests"});
    EXPECT_TRUE(report.installed.empty());
    ASSERT_EQ(report.notes.size(), 1u);
    EXPECT_EQ(report.notes[0].rfind("Warning: Failed to install \"requests\"", 0), 0u);
}

TEST_F(PackageInstallerTest, ProgressCallbackPerAttempt) {
    std::vector<std::string> messages;
    auto report = installer_.installAll(
        {"numpy", "torch"}, [&](std::string_view message) { messages.emplace_back(message); });
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "Installing numpy...");
}

TEST(BoundedOperationTimeoutTest, RequestTimeoutCapsConfiguredLimit) {
    using std::chrono::seconds;
    EXPECT_EQ(boundedOperationTimeout(seconds{120}, 60000), seconds{60});
    EXPECT_EQ(boundedOperationTimeout(seconds{120}, 5500), seconds{6});
    EXPECT_EQ(boundedOperationTimeout(seconds{120}, 300000), seconds{120});
    EXPECT_EQ(boundedOperationTimeout(seconds{120}, 1), seconds{1});
    EXPECT_EQ(boundedOperationTimeout(seconds{120}, 0), seconds{120});
}

TEST(PackageFailureTest, MessagePrefersDetail) {
    PackageFailure failure{PackageError::Timeout, {}};
    EXPECT_EQ(failure.message(), "Package installation timed out");
    failure.detail = "timed out after 120s";
    EXPECT_EQ(failure.message(), "timed out after 120s");
}
