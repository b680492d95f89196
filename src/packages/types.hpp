/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Type definitions for guest package resolution and installation
 * @date 2024
 * @version 1.0.0
 */

#ifndef ENCLAVE_PACKAGES_TYPES_HPP
#define ENCLAVE_PACKAGES_TYPES_HPP

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace enclave::packages {

/**
 * @brief Availability class of a requested package
 */
enum class PackageClass {
    Prebuilt,      ///< Compiled artifact available without installation
    Installable,   ///< Assumed to install from the package index
    Incompatible,  ///< Needs OS facilities the sandbox does not offer
    Unknown        ///< Not a recognizable distribution name
};

[[nodiscard]] constexpr std::string_view packageClassToString(PackageClass cls) noexcept {
    switch (cls) {
        case PackageClass::Prebuilt: return "prebuilt";
        case PackageClass::Installable: return "installable";
        case PackageClass::Incompatible: return "incompatible";
        case PackageClass::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * @brief Error codes for package installation
 */
enum class PackageError {
    Success = 0,
    InvalidName,
    Incompatible,
    InstallerNotFound,
    InstallFailed,
    Timeout,
    UnknownError
};

/**
 * @brief Get string representation of PackageError
 */
[[nodiscard]] constexpr std::string_view packageErrorToString(PackageError error) noexcept {
    switch (error) {
        case PackageError::Success: return "Success";
        case PackageError::InvalidName: return "Invalid package name";
        case PackageError::Incompatible: return "Package is not supported in the sandbox";
        case PackageError::InstallerNotFound: return "Package installer not found";
        case PackageError::InstallFailed: return "Package installation failed";
        case PackageError::Timeout: return "Package installation timed out";
        case PackageError::UnknownError: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Error code plus the installer's own explanation
 */
struct PackageFailure {
    PackageError error{PackageError::UnknownError};
    std::string detail;

    /**
     * @brief Detail when present, otherwise the generic error text
     */
    [[nodiscard]] std::string message() const {
        return detail.empty() ? std::string(packageErrorToString(error)) : detail;
    }
};

/**
 * @brief Result type for package operations
 */
template<typename T>
using PackageResult = std::expected<T, PackageFailure>;

/**
 * @brief A requested name after alias resolution
 */
struct ResolvedPackage {
    std::string requested;   ///< Name as the guest asked for it
    std::string canonical;   ///< Distribution name
    PackageClass cls{PackageClass::Unknown};

    [[nodiscard]] bool wasAliased() const noexcept { return requested != canonical; }
};

/**
 * @brief Outcome of installing a batch of packages
 */
struct InstallReport {
    std::vector<std::string> installed;  ///< Canonical names now importable
    std::vector<std::string> notes;      ///< Alias notes and warnings, one per line
};

/**
 * @brief Progress callback for installation
 */
using ProgressCallback = std::function<void(std::string_view message)>;

}  // namespace enclave::packages

#endif  // ENCLAVE_PACKAGES_TYPES_HPP
