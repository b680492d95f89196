/*
 * process_utils.hpp
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_PACKAGES_PROCESS_UTILS_HPP
#define ENCLAVE_PACKAGES_PROCESS_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace enclave::packages {

/**
 * @brief Result of a command execution
 */
struct CommandResult {
    int exitCode{-1};
    bool timedOut{false};
    std::string output;
    std::string errorOutput;
};

/**
 * @brief Run a program directly (no shell) and capture its output
 *
 * Arguments are passed verbatim to execvp, so guest-supplied strings are
 * never interpreted by a shell. The child is killed when the timeout
 * elapses.
 *
 * @param argv Program followed by its arguments
 * @param timeout Maximum execution time
 * @param workingDirectory Directory to run in (empty = inherit)
 * @return CommandResult with exit code and output
 */
CommandResult executeCommand(const std::vector<std::string>& argv,
                             std::chrono::seconds timeout = std::chrono::seconds{300},
                             const std::filesystem::path& workingDirectory = {});

}  // namespace enclave::packages

#endif
