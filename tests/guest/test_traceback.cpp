/*
 * test_traceback.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "guest/traceback.hpp"

using namespace enclave::guest;

TEST(TracebackTest, StripsSandboxExitTraceback) {
    std::string stderrText =
        "usage: script.py [-h] --input INPUT\n"
        "script.py: error: the following arguments are required: --input\n"
        "Traceback (most recent call last):\n"
        "  File \"<script>\", line 5, in <module>\n"
        "    args = parser.parse_args()\n"
        "_SandboxExit: 2\n";
    EXPECT_EQ(cleanTraceback(stderrText),
              "usage: script.py [-h] --input INPUT\n"
              "script.py: error: the following arguments are required: --input");
}

TEST(TracebackTest, KeepsTextAfterTraceback) {
    std::string stderrText =
        "Traceback (most recent call last):\n"
        "  File \"<script>\", line 1, in <module>\n"
        "ValueError: bad\n"
        "after\n";
    EXPECT_EQ(cleanTraceback(stderrText), "after");
}

TEST(TracebackTest, PlainTextUntouched) {
    EXPECT_EQ(cleanTraceback("  warning: something\n"), "warning: something");
    EXPECT_EQ(cleanTraceback(""), "");
}

TEST(TracebackTest, ExitMessageMentionsCodeAndStderr) {
    auto message = sysExitMessage(2, "error: missing --input");
    EXPECT_EQ(message.rfind("Script called sys.exit(2).", 0), 0u);
    EXPECT_NE(message.find("--key value"), std::string::npos);
    EXPECT_NE(message.find("\n\nScript stderr:\nerror: missing --input"), std::string::npos);
}

TEST(TracebackTest, ExitMessageWithoutStderr) {
    auto message = sysExitMessage(1, "");
    EXPECT_EQ(message.find("Script stderr"), std::string::npos);
}
