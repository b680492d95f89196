/*
 * error_classifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "error_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace enclave::protocol {

namespace {

struct Rule {
    ErrorKind kind;
    std::array<std::string_view, 3> phrases;
};

// Order matters
constexpr std::array<Rule, 3> kRules{{
    {ErrorKind::Timeout, {"timeout", "execution time", ""}},
    {ErrorKind::Syntax, {"syntaxerror", "unexpected token", "unexpected end"}},
    {ErrorKind::Security, {"not allowed", "forbidden", "security"}},
}};

}  // namespace

ErrorKind classifyError(std::string_view message) {
    std::string lower(message);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& rule : kRules) {
        for (auto phrase : rule.phrases) {
            if (!phrase.empty() && lower.find(phrase) != std::string::npos) {
                return rule.kind;
            }
        }
    }
    return ErrorKind::Runtime;
}

}  // namespace enclave::protocol
