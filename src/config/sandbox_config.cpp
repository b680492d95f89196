/*
 * sandbox_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sandbox_config.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace enclave::config {

worker::WorkerOptions PythonConfig::toWorkerOptions() const {
    worker::WorkerOptions options;
    auto level = worker::isolationLevelFromString(isolation);
    if (!level) {
        spdlog::warn("Unknown isolation level '{}', using subprocess", isolation);
    }
    options.level = level.value_or(worker::IsolationLevel::Subprocess);
    options.workerExecutable = workerExecutable;
    options.pythonExecutable = pythonExecutable;
    options.sandboxRoot = sandboxRoot;
    options.siteDirectory = siteDirectory;
    options.maxMemoryMB = maxMemoryMB;
    options.initTimeout = std::chrono::milliseconds{initTimeoutMs};
    options.pipTimeout = std::chrono::seconds{pipTimeoutSeconds};
    options.synthesizeArgv = synthesizeArgv;
    options.logLevel = workerLogLevel;
    options.guestPolicy.blockedImports = blockedImports;
    options.guestPolicy.allowedImports = allowedImports;
    return options;
}

std::expected<SandboxConfig, std::string> loadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected("Cannot open config file: " + path.string());
    }

    try {
        auto j = json::parse(file, nullptr, true, true);
        if (!j.is_object()) {
            return std::unexpected("Config root must be an object: " + path.string());
        }
        auto config = SandboxConfig::fromJson(j);
        spdlog::debug("Loaded configuration from {}", path.string());
        return config;
    } catch (const json::exception& e) {
        return std::unexpected("Invalid config " + path.string() + ": " + e.what());
    }
}

}  // namespace enclave::config
