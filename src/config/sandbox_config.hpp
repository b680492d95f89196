/*
 * sandbox_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Configuration sections for the sandbox and its engines

**************************************************/

#ifndef ENCLAVE_CONFIG_SANDBOX_CONFIG_HPP
#define ENCLAVE_CONFIG_SANDBOX_CONFIG_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ephemeral/engine.hpp"
#include "logging/types.hpp"
#include "protocol/guest_policy.hpp"
#include "protocol/timeouts.hpp"
#include "worker/types.hpp"

namespace enclave::config {

using json = nlohmann::json;

/**
 * @brief Timeout bounds per language
 */
struct LimitsConfig {
    int64_t minTimeoutMs{5000};               ///< Floor for every language
    int64_t javascriptDefaultTimeoutMs{5000};
    int64_t javascriptMaxTimeoutMs{30000};
    int64_t pythonDefaultTimeoutMs{60000};
    int64_t pythonMaxTimeoutMs{300000};

    [[nodiscard]] protocol::TimeoutPolicy policyFor(protocol::Language language) const {
        if (language == protocol::Language::Python) {
            return {pythonDefaultTimeoutMs, minTimeoutMs, pythonMaxTimeoutMs};
        }
        return {javascriptDefaultTimeoutMs, minTimeoutMs, javascriptMaxTimeoutMs};
    }

    [[nodiscard]] json toJson() const {
        return {
            {"minTimeoutMs", minTimeoutMs},
            {"javascriptDefaultTimeoutMs", javascriptDefaultTimeoutMs},
            {"javascriptMaxTimeoutMs", javascriptMaxTimeoutMs},
            {"pythonDefaultTimeoutMs", pythonDefaultTimeoutMs},
            {"pythonMaxTimeoutMs", pythonMaxTimeoutMs}
        };
    }

    [[nodiscard]] static LimitsConfig fromJson(const json& j) {
        LimitsConfig cfg;
        cfg.minTimeoutMs = j.value("minTimeoutMs", cfg.minTimeoutMs);
        cfg.javascriptDefaultTimeoutMs =
            j.value("javascriptDefaultTimeoutMs", cfg.javascriptDefaultTimeoutMs);
        cfg.javascriptMaxTimeoutMs = j.value("javascriptMaxTimeoutMs", cfg.javascriptMaxTimeoutMs);
        cfg.pythonDefaultTimeoutMs = j.value("pythonDefaultTimeoutMs", cfg.pythonDefaultTimeoutMs);
        cfg.pythonMaxTimeoutMs = j.value("pythonMaxTimeoutMs", cfg.pythonMaxTimeoutMs);
        return cfg;
    }
};

/**
 * @brief QuickJS runtime limits
 */
struct JavaScriptConfig {
    size_t memoryLimitMB{32};  ///< Heap ceiling per run
    size_t maxStackKB{1024};   ///< 0 disables the stack check

    [[nodiscard]] ephemeral::EphemeralOptions toEngineOptions() const {
        return {memoryLimitMB * 1024 * 1024, maxStackKB * 1024};
    }

    [[nodiscard]] json toJson() const {
        return {{"memoryLimitMB", memoryLimitMB}, {"maxStackKB", maxStackKB}};
    }

    [[nodiscard]] static JavaScriptConfig fromJson(const json& j) {
        JavaScriptConfig cfg;
        cfg.memoryLimitMB = j.value("memoryLimitMB", cfg.memoryLimitMB);
        cfg.maxStackKB = j.value("maxStackKB", cfg.maxStackKB);
        return cfg;
    }
};

/**
 * @brief Python worker process settings
 *
 * Empty paths are discovered at startup (see worker::ConfigDiscovery).
 */
struct PythonConfig {
    std::string workerExecutable;        ///< enclave_worker path
    std::string pythonExecutable;        ///< Interpreter used for pip
    std::string sandboxRoot;             ///< Backing directory of /input, /output, /tmp
    std::string siteDirectory;           ///< Package install target
    std::string isolation{"subprocess"}; ///< subprocess or sandboxed
    size_t maxMemoryMB{0};               ///< Sandboxed only, 0 = unlimited
    int64_t initTimeoutMs{30000};
    int64_t pipTimeoutSeconds{120};
    bool synthesizeArgv{true};           ///< Build sys.argv from the context map
    std::string workerLogLevel{"warn"};
    std::vector<std::string> blockedImports{protocol::GuestPolicy{}.blockedImports};
    std::vector<std::string> allowedImports;  ///< Empty = any module not blocked

    [[nodiscard]] worker::WorkerOptions toWorkerOptions() const;

    [[nodiscard]] json toJson() const {
        return {
            {"workerExecutable", workerExecutable},
            {"pythonExecutable", pythonExecutable},
            {"sandboxRoot", sandboxRoot},
            {"siteDirectory", siteDirectory},
            {"isolation", isolation},
            {"maxMemoryMB", maxMemoryMB},
            {"initTimeoutMs", initTimeoutMs},
            {"pipTimeoutSeconds", pipTimeoutSeconds},
            {"synthesizeArgv", synthesizeArgv},
            {"workerLogLevel", workerLogLevel},
            {"blockedImports", blockedImports},
            {"allowedImports", allowedImports}
        };
    }

    [[nodiscard]] static PythonConfig fromJson(const json& j) {
        PythonConfig cfg;
        cfg.workerExecutable = j.value("workerExecutable", cfg.workerExecutable);
        cfg.pythonExecutable = j.value("pythonExecutable", cfg.pythonExecutable);
        cfg.sandboxRoot = j.value("sandboxRoot", cfg.sandboxRoot);
        cfg.siteDirectory = j.value("siteDirectory", cfg.siteDirectory);
        cfg.isolation = j.value("isolation", cfg.isolation);
        cfg.maxMemoryMB = j.value("maxMemoryMB", cfg.maxMemoryMB);
        cfg.initTimeoutMs = j.value("initTimeoutMs", cfg.initTimeoutMs);
        cfg.pipTimeoutSeconds = j.value("pipTimeoutSeconds", cfg.pipTimeoutSeconds);
        cfg.synthesizeArgv = j.value("synthesizeArgv", cfg.synthesizeArgv);
        cfg.workerLogLevel = j.value("workerLogLevel", cfg.workerLogLevel);
        cfg.blockedImports = j.value("blockedImports", cfg.blockedImports);
        cfg.allowedImports = j.value("allowedImports", cfg.allowedImports);
        return cfg;
    }
};

/**
 * @brief Top-level configuration
 */
struct SandboxConfig {
    LimitsConfig limits;
    JavaScriptConfig javascript;
    PythonConfig python;
    ::enclave::logging::LoggingConfig logging;

    [[nodiscard]] json toJson() const {
        return {
            {"limits", limits.toJson()},
            {"javascript", javascript.toJson()},
            {"python", python.toJson()},
            {"logging", logging.toJson()}
        };
    }

    [[nodiscard]] static SandboxConfig fromJson(const json& j) {
        SandboxConfig cfg;
        if (j.contains("limits")) cfg.limits = LimitsConfig::fromJson(j["limits"]);
        if (j.contains("javascript")) cfg.javascript = JavaScriptConfig::fromJson(j["javascript"]);
        if (j.contains("python")) cfg.python = PythonConfig::fromJson(j["python"]);
        if (j.contains("logging")) {
            cfg.logging = ::enclave::logging::LoggingConfig::fromJson(j["logging"]);
        }
        return cfg;
    }
};

/**
 * @brief Read a JSON configuration file
 *
 * Comments are accepted. Missing keys keep their defaults; a missing file,
 * a parse error or a value of the wrong type is reported as text.
 */
[[nodiscard]] std::expected<SandboxConfig, std::string> loadConfig(
    const std::filesystem::path& path);

}  // namespace enclave::config

#endif  // ENCLAVE_CONFIG_SANDBOX_CONFIG_HPP
