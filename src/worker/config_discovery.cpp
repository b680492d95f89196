/*
 * config_discovery.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_discovery.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace enclave::worker {

namespace {

constexpr const char* WORKER_NAME = "enclave_worker";

bool isExecutable(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> searchPath(const std::string& name) {
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return std::nullopt;

    std::stringstream ss(pathEnv);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        auto candidate = std::filesystem::path(dir) / name;
        if (isExecutable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::filesystem::path> ConfigDiscovery::findWorkerExecutable() {
    if (const char* env = std::getenv("ENCLAVE_WORKER"); env && *env) {
        if (isExecutable(env)) {
            return std::filesystem::path(env);
        }
        spdlog::warn("ENCLAVE_WORKER={} is not an executable file", env);
    }

    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    std::vector<std::filesystem::path> searchPaths;
    if (!ec) {
        searchPaths.push_back(self.parent_path() / WORKER_NAME);
    }
    searchPaths.push_back(std::filesystem::path("/usr/local/bin") / WORKER_NAME);
    searchPaths.push_back(std::filesystem::path("/usr/bin") / WORKER_NAME);
    searchPaths.push_back(std::filesystem::path("/usr/local/libexec/enclave") / WORKER_NAME);

    for (const auto& path : searchPaths) {
        if (isExecutable(path)) {
            return path;
        }
    }
    return searchPath(WORKER_NAME);
}

std::optional<std::filesystem::path> ConfigDiscovery::findPythonExecutable() {
    std::vector<std::filesystem::path> searchPaths = {
        "/usr/bin/python3",
        "/usr/local/bin/python3",
        "/usr/bin/python"
    };

    for (const auto& path : searchPaths) {
        if (isExecutable(path)) {
            return path;
        }
    }
    return searchPath("python3");
}

WorkerOptions ConfigDiscovery::resolveOptions(WorkerOptions options) {
    if (options.workerExecutable.empty()) {
        options.workerExecutable = findWorkerExecutable().value_or(std::filesystem::path{});
    }
    if (options.pythonExecutable.empty()) {
        options.pythonExecutable = findPythonExecutable().value_or(std::filesystem::path{});
    }

    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) base = "/tmp";
    auto processDir = base / ("enclave-" + std::to_string(getpid()));

    if (options.sandboxRoot.empty()) {
        options.sandboxRoot = processDir / "sandbox";
    }
    if (options.siteDirectory.empty()) {
        options.siteDirectory = processDir / "site-packages";
    }
    return options;
}

Result<void> ConfigDiscovery::validateOptions(const WorkerOptions& options) {
    if (options.workerExecutable.empty() || !isExecutable(options.workerExecutable)) {
        spdlog::error("Worker executable not found: '{}'", options.workerExecutable.string());
        return std::unexpected(RunnerError::WorkerNotFound);
    }
    if (options.sandboxRoot.empty() || options.siteDirectory.empty()) {
        return std::unexpected(RunnerError::InvalidConfiguration);
    }
    if (options.initTimeout.count() <= 0) {
        return std::unexpected(RunnerError::InvalidConfiguration);
    }
    return {};
}

}  // namespace enclave::worker
