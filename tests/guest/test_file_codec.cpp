/*
 * test_file_codec.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "guest/file_codec.hpp"

using namespace enclave::guest;

TEST(FileCodecTest, Utf8Validation) {
    EXPECT_TRUE(isValidUtf8("plain ascii"));
    EXPECT_TRUE(isValidUtf8("h\xc3\xa9llo \xe2\x80\xa6 \xf0\x9f\x98\x80"));
    EXPECT_FALSE(isValidUtf8("\x89PNG\r\n\x1a\n"));
    EXPECT_FALSE(isValidUtf8("\xc0\xaf"));          // overlong
    EXPECT_FALSE(isValidUtf8("\xed\xa0\x80"));      // surrogate
    EXPECT_FALSE(isValidUtf8("\xe2\x80"));          // truncated
}

TEST(FileCodecTest, EncodeKnownVectors) {
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("f"), "Zg==");
    EXPECT_EQ(base64Encode("fo"), "Zm8=");
    EXPECT_EQ(base64Encode("foo"), "Zm9v");
    EXPECT_EQ(base64Encode("foobar"), "Zm9vYmFy");
}

TEST(FileCodecTest, DecodeKnownVectors) {
    EXPECT_EQ(base64Decode("Zm9vYmFy").value(), "foobar");
    EXPECT_EQ(base64Decode("Zg==").value(), "f");
    EXPECT_EQ(base64Decode("Zm9v\nYmFy\n").value(), "foobar");
}

TEST(FileCodecTest, BinaryBytesSurvive) {
    std::string bytes("\x00\xff\x10\x80", 4);
    auto decoded = base64Decode(base64Encode(bytes));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
}

TEST(FileCodecTest, DecodeRejectsMalformedInput) {
    EXPECT_FALSE(base64Decode("Zm9v!").has_value());
    EXPECT_FALSE(base64Decode("Zg==Zg").has_value());
    EXPECT_FALSE(base64Decode("Z").has_value());
}
