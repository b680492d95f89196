/*
 * test_guest_policy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "protocol/guest_policy.hpp"

using namespace enclave::protocol;

TEST(GuestPolicyTest, DefaultBlocksProcessAndNetworkModules) {
    GuestPolicy policy;
    auto denial = policy.importDenial("subprocess");
    ASSERT_TRUE(denial.has_value());
    EXPECT_EQ(*denial, "Import of 'subprocess' is not allowed in the sandbox");
    EXPECT_TRUE(policy.importDenial("socket").has_value());
    EXPECT_TRUE(policy.importDenial("multiprocessing.pool").has_value());
    EXPECT_FALSE(policy.importDenial("json").has_value());
    EXPECT_FALSE(policy.importDenial("os.path").has_value());
}

TEST(GuestPolicyTest, AllowListAdmitsOnlyNamedPackages) {
    GuestPolicy policy;
    policy.blockedImports.clear();
    policy.allowedImports = {"math", "numpy"};
    EXPECT_FALSE(policy.importDenial("numpy.linalg").has_value());
    EXPECT_FALSE(policy.importDenial("math").has_value());
    EXPECT_TRUE(policy.importDenial("json").has_value());
}

TEST(GuestPolicyTest, BlockListWinsOverAllowList) {
    GuestPolicy policy;
    policy.allowedImports = {"socket", "json"};
    EXPECT_TRUE(policy.importDenial("socket").has_value());
    EXPECT_FALSE(policy.importDenial("json").has_value());
}

TEST(GuestPolicyTest, EmptyNameIsNotJudged) {
    EXPECT_FALSE(GuestPolicy{}.importDenial("").has_value());
}

TEST(ModuleListTest, SplitsAndTrims) {
    EXPECT_EQ(parseModuleList(" subprocess, socket,,ctypes "),
              (std::vector<std::string>{"subprocess", "socket", "ctypes"}));
    EXPECT_TRUE(parseModuleList("").empty());
    EXPECT_EQ(joinModuleList({"a", "b"}), "a,b");
    EXPECT_EQ(joinModuleList({}), "");
}
