/*
 * access_policy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_GUEST_ACCESS_POLICY_HPP
#define ENCLAVE_GUEST_ACCESS_POLICY_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace enclave::guest {

enum class GuestAccess : uint8_t { Read, Write };

/**
 * @brief Host filesystem reach of guest code
 *
 * Everything under the sandbox root may be read and written. Paths under a
 * read-only prefix (the interpreter's library directories, a few public
 * system data directories) may only be read, and never opened as a
 * directory handle. Paths are judged after symlinks are resolved.
 */
class AccessPolicy {
public:
    AccessPolicy(const std::filesystem::path& root,
                 const std::vector<std::filesystem::path>& readOnly);

    [[nodiscard]] std::expected<void, std::string> check(const std::filesystem::path& path,
                                                         GuestAccess access,
                                                         bool opensHandle = false) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    std::vector<std::filesystem::path> readOnly_;
};

/**
 * @brief System data any guest may read (zoneinfo, fonts, mime types)
 */
[[nodiscard]] std::vector<std::filesystem::path> publicReadPaths();

}  // namespace enclave::guest

#endif  // ENCLAVE_GUEST_ACCESS_POLICY_HPP
