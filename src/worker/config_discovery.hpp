/*
 * config_discovery.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_WORKER_CONFIG_DISCOVERY_HPP
#define ENCLAVE_WORKER_CONFIG_DISCOVERY_HPP

#include "types.hpp"

#include <filesystem>
#include <optional>

namespace enclave::worker {

/**
 * @brief Locates executables and fills in defaulted worker options
 */
class ConfigDiscovery {
public:
    /**
     * @brief Find the enclave_worker binary
     *
     * Looks at $ENCLAVE_WORKER, then beside the running executable, then
     * the usual install prefixes.
     */
    [[nodiscard]] static std::optional<std::filesystem::path> findWorkerExecutable();

    /**
     * @brief Find a Python interpreter to run pip with
     */
    [[nodiscard]] static std::optional<std::filesystem::path> findPythonExecutable();

    /**
     * @brief Fill empty paths with discovered or per-process defaults
     *
     * The sandbox root and site directory default to directories under the
     * system temp directory keyed by the host pid.
     */
    [[nodiscard]] static WorkerOptions resolveOptions(WorkerOptions options);

    /**
     * @brief Validate worker options
     * @return Success or error
     */
    [[nodiscard]] static Result<void> validateOptions(const WorkerOptions& options);
};

}  // namespace enclave::worker

#endif  // ENCLAVE_WORKER_CONFIG_DISCOVERY_HPP
