/*
 * guest_policy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_PROTOCOL_GUEST_POLICY_HPP
#define ENCLAVE_PROTOCOL_GUEST_POLICY_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace enclave::protocol {

/**
 * @brief Modules guest Python code may import
 *
 * Imports are judged by their top-level package. A non-empty allow list
 * admits only the packages it names; the block list is applied on top.
 */
struct GuestPolicy {
    std::vector<std::string> blockedImports{"subprocess", "socket", "ctypes",
                                            "multiprocessing", "pty"};
    std::vector<std::string> allowedImports;

    /**
     * @brief Reason an import of @p module is refused, if it is
     */
    [[nodiscard]] std::optional<std::string> importDenial(std::string_view module) const;
};

/**
 * @brief Split a comma separated module list, dropping blanks
 */
[[nodiscard]] std::vector<std::string> parseModuleList(std::string_view csv);

[[nodiscard]] std::string joinModuleList(const std::vector<std::string>& modules);

}  // namespace enclave::protocol

#endif  // ENCLAVE_PROTOCOL_GUEST_POLICY_HPP
