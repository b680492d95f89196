/*
 * request_handler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_GUEST_REQUEST_HANDLER_HPP
#define ENCLAVE_GUEST_REQUEST_HANDLER_HPP

#include "argv.hpp"
#include "protocol/types.hpp"

#include <functional>
#include <string>

namespace enclave::packages {
class PackageInstaller;
}

namespace enclave::guest {

class PythonHost;
class VirtualFilesystem;

/**
 * @brief Runs one request inside the worker from mount to result
 *
 * Order: reset the filesystem, mount files, install packages, build argv,
 * run, collect output files. Every failure becomes a failed
 * ExecutionResult carrying whatever output was captured.
 */
class RequestHandler {
public:
    using ProgressSink = std::function<void(protocol::ProgressType, const std::string&)>;

    RequestHandler(PythonHost& host, VirtualFilesystem& vfs,
                   packages::PackageInstaller& installer);

    void setArgvConvention(ArgvConvention convention);

    [[nodiscard]] protocol::ExecutionResult handle(const protocol::ExecutionRequest& request,
                                                   bool synthesizeArgv,
                                                   const ProgressSink& progress);

private:
    PythonHost& host_;
    VirtualFilesystem& vfs_;
    packages::PackageInstaller& installer_;
    ArgvConvention convention_;
};

/**
 * @brief One console entry per non-empty stream: stdout as log, stderr as error
 */
[[nodiscard]] std::vector<protocol::ConsoleEntry> consoleFromStreams(const std::string& output,
                                                                     const std::string& errorOutput,
                                                                     int64_t timestampMs);

}  // namespace enclave::guest

#endif  // ENCLAVE_GUEST_REQUEST_HANDLER_HPP
