/*
 * package_installer.cpp
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "package_installer.hpp"

#include "process_utils.hpp"
#include "resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include <mutex>
#include <sstream>
#include <unordered_set>

namespace enclave::packages {

namespace {

/**
 * @brief Last non-empty line of pip's stderr, which carries the reason
 */
std::string summarizeFailure(const CommandResult& result) {
    std::istringstream stream(result.errorOutput.empty() ? result.output
                                                         : result.errorOutput);
    std::string line;
    std::string last;
    while (std::getline(stream, line)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            last = line;
        }
    }
    if (last.empty()) {
        return "pip exited with code " + std::to_string(result.exitCode);
    }
    return last;
}

}  // anonymous namespace

class PackageInstaller::Impl {
public:
    void setPythonExecutable(const std::filesystem::path& pythonPath) {
        std::lock_guard<std::mutex> lock(mutex_);
        pythonPath_ = pythonPath;
        spdlog::debug("Package installer uses python: {}", pythonPath_.string());
    }

    void setTargetDirectory(const std::filesystem::path& directory) {
        std::lock_guard<std::mutex> lock(mutex_);
        targetDir_ = directory;
    }

    void setOperationTimeout(std::chrono::seconds timeout) {
        operationTimeout_ = timeout;
    }

    void setAvailabilityCheck(AvailabilityCheck check) {
        availabilityCheck_ = std::move(check);
    }

    PackageResult<void> installPackage(std::string_view package) {
        if (!PackageResolver::isValidPackageName(package)) {
            return std::unexpected(PackageFailure{PackageError::InvalidName, {}});
        }
        if (PackageResolver::isIncompatible(package)) {
            return std::unexpected(PackageFailure{PackageError::Incompatible, {}});
        }
        if (isPackageInstalled(package)) {
            return {};
        }
        if (availabilityCheck_ && availabilityCheck_(package)) {
            markInstalled(package);
            return {};
        }
        if (pythonPath_.empty() || targetDir_.empty()) {
            spdlog::error("Package installer is not configured");
            return std::unexpected(PackageFailure{PackageError::InstallerNotFound, {}});
        }

        std::vector<std::string> cmd = {
            pythonPath_.string(), "-m", "pip", "install",
            "--quiet", "--disable-pip-version-check", "--no-input",
            "--target", targetDir_.string(),
            std::string(package)
        };

        spdlog::info("Installing package: {}", package);

        auto result = executeCommand(cmd, operationTimeout_);
        if (result.timedOut) {
            spdlog::error("Installing {} timed out", package);
            return std::unexpected(PackageFailure{
                PackageError::Timeout,
                "timed out after " + std::to_string(operationTimeout_.count()) + "s"});
        }
        if (result.exitCode != 0) {
            auto detail = summarizeFailure(result);
            spdlog::error("Failed to install package {}: {}", package, detail);
            return std::unexpected(PackageFailure{PackageError::InstallFailed, detail});
        }

        markInstalled(package);
        spdlog::info("Successfully installed package: {}", package);
        return {};
    }

    bool isPackageInstalled(std::string_view package) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return installed_.contains(PackageResolver::normalize(package));
    }

    InstallReport installAll(const std::vector<std::string>& requested,
                             ProgressCallback callback) {
        InstallReport report;

        for (const auto& pkg : PackageResolver::resolveAll(requested)) {
            if (pkg.wasAliased()) {
                report.notes.push_back("Note: Resolved package alias \"" + pkg.requested +
                                       "\" → \"" + pkg.canonical + "\"");
            }

            if (pkg.cls == PackageClass::Incompatible) {
                auto reason = PackageResolver::getIncompatibleReason(pkg.canonical);
                report.notes.push_back("Warning: \"" + pkg.canonical +
                                       "\" is not supported in the sandbox (" +
                                       std::string(reason.value_or("unsupported")) + ")");
                continue;
            }
            if (pkg.cls == PackageClass::Unknown) {
                report.notes.push_back("Warning: Skipping \"" + pkg.requested +
                                       "\": not a valid package name");
                continue;
            }

            if (callback) {
                callback("Installing " + pkg.canonical + "...");
            }

            auto result = installPackage(pkg.canonical);
            if (result) {
                report.installed.push_back(pkg.canonical);
            } else {
                report.notes.push_back("Warning: Failed to install \"" + pkg.canonical +
                                       "\": " + result.error().message());
            }
        }
        return report;
    }

private:
    void markInstalled(std::string_view package) {
        std::lock_guard<std::mutex> lock(mutex_);
        installed_.insert(PackageResolver::normalize(package));
    }

    std::filesystem::path pythonPath_;
    std::filesystem::path targetDir_;
    std::chrono::seconds operationTimeout_{300};
    AvailabilityCheck availabilityCheck_;
    std::unordered_set<std::string> installed_;
    mutable std::mutex mutex_;
};

PackageInstaller::PackageInstaller() : pImpl_(std::make_unique<Impl>()) {}
PackageInstaller::~PackageInstaller() = default;
PackageInstaller::PackageInstaller(PackageInstaller&&) noexcept = default;
PackageInstaller& PackageInstaller::operator=(PackageInstaller&&) noexcept = default;

void PackageInstaller::setPythonExecutable(const std::filesystem::path& pythonPath) {
    pImpl_->setPythonExecutable(pythonPath);
}

void PackageInstaller::setTargetDirectory(const std::filesystem::path& directory) {
    pImpl_->setTargetDirectory(directory);
}

void PackageInstaller::setOperationTimeout(std::chrono::seconds timeout) {
    pImpl_->setOperationTimeout(timeout);
}

void PackageInstaller::setAvailabilityCheck(AvailabilityCheck check) {
    pImpl_->setAvailabilityCheck(std::move(check));
}

PackageResult<void> PackageInstaller::installPackage(std::string_view package) {
    return pImpl_->installPackage(package);
}

bool PackageInstaller::isPackageInstalled(std::string_view package) const {
    return pImpl_->isPackageInstalled(package);
}

InstallReport PackageInstaller::installAll(const std::vector<std::string>& requested,
                                           ProgressCallback callback) {
    return pImpl_->installAll(requested, std::move(callback));
}

std::chrono::seconds boundedOperationTimeout(std::chrono::seconds configured,
                                             int64_t requestTimeoutMs) {
    if (requestTimeoutMs <= 0) {
        return configured;
    }
    auto budget =
        std::chrono::ceil<std::chrono::seconds>(std::chrono::milliseconds{requestTimeoutMs});
    return std::min(std::max(budget, std::chrono::seconds{1}), configured);
}

}  // namespace enclave::packages
