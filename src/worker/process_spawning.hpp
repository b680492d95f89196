/*
 * process_spawning.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_WORKER_PROCESS_SPAWNING_HPP
#define ENCLAVE_WORKER_PROCESS_SPAWNING_HPP

#include "types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace enclave::worker {

/**
 * @brief Starts and reaps worker processes
 */
class ProcessSpawner {
public:
    /**
     * @brief Build the worker's command line
     * @param options Worker options (paths, limits, log level)
     * @param subprocessFds IPC descriptors the worker inherits (read, write)
     */
    [[nodiscard]] static std::vector<std::string> buildCommandLine(
        const WorkerOptions& options, std::pair<int, int> subprocessFds);

    /**
     * @brief Environment the worker runs with, as NAME=value entries
     *
     * Nothing is inherited except PATH, locale, interpreter location,
     * proxy and certificate settings. HOME and TMPDIR point into the
     * sandbox's tmp/.
     */
    [[nodiscard]] static std::vector<std::string> buildEnvironment(const WorkerOptions& options);

    /**
     * @brief Fork and exec the worker
     *
     * The child keeps only the two IPC descriptors across exec, reads stdin
     * from /dev/null, has stdout folded into stderr and gets the
     * buildEnvironment() environment. Sandboxed workers with a memory
     * limit also get RLIMIT_AS.
     */
    [[nodiscard]] static Result<int> spawn(const WorkerOptions& options,
                                           std::pair<int, int> subprocessFds);

    /**
     * @brief Reap a worker
     * @param timeoutMs Give up after this long; 0 or less blocks
     * @return Exit code, ProcessCrashed when a signal ended it, or Timeout
     */
    [[nodiscard]] static Result<int> waitForProcess(int processId, int timeoutMs = 0);

    /**
     * @brief SIGKILL a process and reap it
     */
    [[nodiscard]] static Result<void> killProcess(int processId);

    [[nodiscard]] static bool isProcessRunning(int processId);
};

}  // namespace enclave::worker

#endif  // ENCLAVE_WORKER_PROCESS_SPAWNING_HPP
