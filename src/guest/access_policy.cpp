/*
 * access_policy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "access_policy.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace enclave::guest {

namespace {

constexpr std::array<std::string_view, 4> DEVICES = {"/dev/null", "/dev/zero", "/dev/random",
                                                     "/dev/urandom"};

fs::path canonicalOf(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = path;
    if (path.is_relative()) {
        absolute = fs::current_path(ec) / path;
    }
    auto resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        resolved = absolute.lexically_normal();
    }
    if (!resolved.has_filename() && resolved.has_parent_path() &&
        resolved != resolved.root_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

bool isWithin(const fs::path& path, const fs::path& base) {
    auto [baseEnd, pathIt] = std::mismatch(base.begin(), base.end(), path.begin(), path.end());
    return baseEnd == base.end();
}

}  // namespace

AccessPolicy::AccessPolicy(const fs::path& root, const std::vector<fs::path>& readOnly)
    : root_(canonicalOf(root)) {
    readOnly_.reserve(readOnly.size());
    for (const auto& prefix : readOnly) {
        if (prefix.is_absolute()) {
            readOnly_.push_back(canonicalOf(prefix));
        }
    }
}

std::expected<void, std::string> AccessPolicy::check(const fs::path& path, GuestAccess access,
                                                     bool opensHandle) const {
    const auto resolved = canonicalOf(path);
    if (isWithin(resolved, root_)) {
        return {};
    }
    if (std::ranges::find(DEVICES, std::string_view(resolved.native())) != DEVICES.end()) {
        return {};
    }
    if (access == GuestAccess::Read) {
        const bool readable = std::ranges::any_of(
            readOnly_, [&](const fs::path& prefix) { return isWithin(resolved, prefix); });
        std::error_code ec;
        if (readable && !(opensHandle && fs::is_directory(resolved, ec))) {
            return {};
        }
    }
    return std::unexpected(
        fmt::format("Access to '{}' is not allowed in the sandbox", path.string()));
}

std::vector<fs::path> publicReadPaths() {
    return {"/usr/share/zoneinfo", "/usr/share/fonts", "/etc/mime.types"};
}

}  // namespace enclave::guest
