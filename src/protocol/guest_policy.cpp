/*
 * guest_policy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "guest_policy.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace enclave::protocol {

namespace {

bool listed(const std::vector<std::string>& modules, std::string_view name) {
    return std::find(modules.begin(), modules.end(), name) != modules.end();
}

std::string_view trimmed(std::string_view text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

}  // namespace

std::optional<std::string> GuestPolicy::importDenial(std::string_view module) const {
    const auto topLevel = module.substr(0, module.find('.'));
    if (topLevel.empty()) {
        return std::nullopt;
    }
    if ((!allowedImports.empty() && !listed(allowedImports, topLevel)) ||
        listed(blockedImports, topLevel)) {
        return fmt::format("Import of '{}' is not allowed in the sandbox", topLevel);
    }
    return std::nullopt;
}

std::vector<std::string> parseModuleList(std::string_view csv) {
    std::vector<std::string> modules;
    while (!csv.empty()) {
        const auto comma = csv.find(',');
        const auto item = trimmed(csv.substr(0, comma));
        if (!item.empty()) {
            modules.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        csv.remove_prefix(comma + 1);
    }
    return modules;
}

std::string joinModuleList(const std::vector<std::string>& modules) {
    return fmt::format("{}", fmt::join(modules, ","));
}

}  // namespace enclave::protocol
