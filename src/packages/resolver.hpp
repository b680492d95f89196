/*
 * resolver.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file resolver.hpp
 * @brief Package alias resolution and compatibility classification
 * @date 2024
 * @version 1.0.0
 *
 * Pure lookups over static tables:
 * - import names such as "cv2" map to distribution names such as
 *   "opencv-python"
 * - distribution names are classified as prebuilt, installable,
 *   incompatible or unknown
 */

#ifndef ENCLAVE_PACKAGES_RESOLVER_HPP
#define ENCLAVE_PACKAGES_RESOLVER_HPP

#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace enclave::packages {

/**
 * @brief Static package compatibility tables
 */
class PackageResolver {
public:
    /**
     * @brief Map an import or informal name to its distribution name
     *
     * Exact match is tried first, then a lowercase match. Unknown names are
     * returned unchanged.
     */
    [[nodiscard]] static std::string resolveAlias(std::string_view name);

    /**
     * @brief Lowercase and replace underscores with hyphens
     */
    [[nodiscard]] static std::string normalize(std::string_view name);

    /**
     * @brief Classify a requested name (aliases are resolved first)
     */
    [[nodiscard]] static PackageClass classify(std::string_view name);

    /**
     * @brief Resolve and classify in one step
     */
    [[nodiscard]] static ResolvedPackage resolve(std::string_view name);

    /**
     * @brief Resolve a batch, dropping duplicates after resolution
     */
    [[nodiscard]] static std::vector<ResolvedPackage> resolveAll(
        const std::vector<std::string>& names);

    /**
     * @brief Split requested names into ones worth installing and rejected
     *        incompatible ones
     * @return {installable canonical names, incompatible names as requested}
     */
    [[nodiscard]] static std::pair<std::vector<std::string>, std::vector<std::string>>
    partition(const std::vector<std::string>& names);

    /**
     * @brief Why an incompatible package cannot run in the sandbox
     * @return Reason, or nullopt when the package is not incompatible
     */
    [[nodiscard]] static std::optional<std::string_view> getIncompatibleReason(
        std::string_view name);

    /**
     * @brief Check a string against the distribution name grammar
     */
    [[nodiscard]] static bool isValidPackageName(std::string_view name);

    [[nodiscard]] static bool isPrebuilt(std::string_view name);
    [[nodiscard]] static bool isIncompatible(std::string_view name);
};

}  // namespace enclave::packages

#endif  // ENCLAVE_PACKAGES_RESOLVER_HPP
