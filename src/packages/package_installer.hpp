/*
 * package_installer.hpp
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_PACKAGES_PACKAGE_INSTALLER_HPP
#define ENCLAVE_PACKAGES_PACKAGE_INSTALLER_HPP

#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>

namespace enclave::packages {

/**
 * @brief Tells whether a distribution is already importable
 */
using AvailabilityCheck = std::function<bool(std::string_view distribution)>;

/**
 * @brief Time one pip run may take while serving a request
 *
 * The request's timeout caps the configured limit, with a one second
 * floor; a request without a timeout gets the configured limit.
 */
[[nodiscard]] std::chrono::seconds boundedOperationTimeout(std::chrono::seconds configured,
                                                           int64_t requestTimeoutMs);

/**
 * @brief Installs guest packages into a private site directory with pip
 *
 * Installation is per package so one bad name does not sink the batch.
 * Successful installs are remembered for the lifetime of the installer.
 */
class PackageInstaller {
public:
    PackageInstaller();
    ~PackageInstaller();

    PackageInstaller(const PackageInstaller&) = delete;
    PackageInstaller& operator=(const PackageInstaller&) = delete;
    PackageInstaller(PackageInstaller&&) noexcept;
    PackageInstaller& operator=(PackageInstaller&&) noexcept;

    // Python used to run "python -m pip"
    void setPythonExecutable(const std::filesystem::path& pythonPath);

    // Directory passed to pip --target; must be on the guest's sys.path
    void setTargetDirectory(const std::filesystem::path& directory);

    void setOperationTimeout(std::chrono::seconds timeout);

    void setAvailabilityCheck(AvailabilityCheck check);

    /**
     * @brief Install one distribution by canonical name
     */
    [[nodiscard]] PackageResult<void> installPackage(std::string_view package);

    [[nodiscard]] bool isPackageInstalled(std::string_view package) const;

    /**
     * @brief Resolve, filter and install a guest's package list
     *
     * Alias resolutions and per-package problems are reported as lines in
     * InstallReport::notes; nothing here is fatal.
     */
    [[nodiscard]] InstallReport installAll(const std::vector<std::string>& requested,
                                           ProgressCallback callback = nullptr);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace enclave::packages

#endif
