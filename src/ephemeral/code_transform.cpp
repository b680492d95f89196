/*
 * code_transform.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "code_transform.hpp"

#include <fmt/format.h>

#include <regex>

namespace enclave::ephemeral {

namespace {

const std::regex& exportDetector() {
    static const std::regex pattern(R"(export\s+default\b)");
    return pattern;
}

const std::regex& exportRewriter() {
    static const std::regex pattern(R"(export\s+default\s+)");
    return pattern;
}

}  // namespace

bool hasDefaultExport(const std::string& code) {
    return std::regex_search(code, exportDetector());
}

std::string wrapCode(const std::string& code) {
    if (hasDefaultExport(code)) {
        auto transformed =
            std::regex_replace(code, exportRewriter(), fmt::format("{} = ", RESULT_VARIABLE));
        return fmt::format("var {0} = undefined;\n{1}\n;{0};\n", RESULT_VARIABLE, transformed);
    }
    return fmt::format("(function() {{\n{}\n}})();\n", code);
}

}  // namespace enclave::ephemeral
