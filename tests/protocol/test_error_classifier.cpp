/*
 * test_error_classifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "protocol/error_classifier.hpp"

using namespace enclave::protocol;

TEST(ErrorClassifierTest, SyntaxErrors) {
    EXPECT_EQ(classifyError("SyntaxError: invalid syntax"), ErrorKind::Syntax);
    EXPECT_EQ(classifyError("unexpected token '}'"), ErrorKind::Syntax);
    EXPECT_EQ(classifyError("Unexpected end of input"), ErrorKind::Syntax);
}

TEST(ErrorClassifierTest, TimeoutErrors) {
    EXPECT_EQ(classifyError("Timeout while waiting"), ErrorKind::Timeout);
    EXPECT_EQ(classifyError("maximum execution time exceeded"), ErrorKind::Timeout);
}

TEST(ErrorClassifierTest, SecurityErrors) {
    EXPECT_EQ(classifyError("PermissionError: access not allowed"), ErrorKind::Security);
    EXPECT_EQ(classifyError("Forbidden path"), ErrorKind::Security);
}

TEST(ErrorClassifierTest, TimeoutTakesPrecedenceOverSyntax) {
    EXPECT_EQ(classifyError("SyntaxError raised after timeout"), ErrorKind::Timeout);
}

TEST(ErrorClassifierTest, EverythingElseIsRuntime) {
    EXPECT_EQ(classifyError("ZeroDivisionError: division by zero"), ErrorKind::Runtime);
    EXPECT_EQ(classifyError(""), ErrorKind::Runtime);
}
