/*
 * test_serializer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "ipc/serializer.hpp"

#include <string>

using namespace enclave::ipc;

TEST(IPCSerializerTest, SerializeEmptyObject) {
    auto result = IPCSerializer::serialize(json::object());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::string(result->begin(), result->end()), "{}");
}

TEST(IPCSerializerTest, SerializeDeserializeRoundTrip) {
    json original = {{"code", "print('héllo')"}, {"list", {1, 2, 3}}, {"nested", {{"a", nullptr}}}};
    auto bytes = IPCSerializer::serialize(original);
    ASSERT_TRUE(bytes.has_value());
    auto decoded = IPCSerializer::deserialize(*bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, original);
}

TEST(IPCSerializerTest, InvalidUtf8IsReplaced) {
    json original = {{"text", std::string("bad\xff")}};
    EXPECT_TRUE(IPCSerializer::serialize(original).has_value());
}

TEST(IPCSerializerTest, DeserializeInvalidData) {
    std::string garbage = "{not json";
    std::vector<uint8_t> data(garbage.begin(), garbage.end());
    auto result = IPCSerializer::deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), IPCError::DeserializationFailed);
}
