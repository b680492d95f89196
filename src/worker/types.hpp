/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_WORKER_TYPES_HPP
#define ENCLAVE_WORKER_TYPES_HPP

#include "protocol/guest_policy.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace enclave::worker {

/**
 * @brief How tightly a Python worker is confined
 */
enum class IsolationLevel : uint8_t {
    Subprocess,  ///< Separate process, no resource limits
    Sandboxed    ///< Separate process with RLIMIT_AS and memory sampling
};

[[nodiscard]] constexpr std::string_view isolationLevelToString(IsolationLevel level) noexcept {
    switch (level) {
        case IsolationLevel::Subprocess: return "subprocess";
        case IsolationLevel::Sandboxed: return "sandboxed";
    }
    return "subprocess";
}

[[nodiscard]] std::optional<IsolationLevel> isolationLevelFromString(std::string_view name);

/**
 * @brief Why a worker could not be started, reached or kept alive
 */
enum class RunnerError {
    WorkerNotFound,        ///< No enclave_worker binary could be located
    InvalidConfiguration,  ///< WorkerOptions failed validation
    ProcessSpawnFailed,    ///< fork() or pipe setup failed
    HandshakeFailed,       ///< Worker never answered the handshake
    InitializationFailed,  ///< Worker answered but reported it cannot run Python
    NotReady,              ///< Request arrived before initialize() succeeded
    CommunicationError,    ///< Channel broke while a request was in flight
    Timeout,
    MemoryLimitExceeded,
    ProcessCrashed,        ///< Worker died on a signal or exited unexpectedly
    ProcessKilled          ///< Host-side SIGKILL could not be delivered
};

[[nodiscard]] constexpr std::string_view runnerErrorToString(RunnerError error) noexcept {
    switch (error) {
        case RunnerError::WorkerNotFound: return "enclave_worker executable not found";
        case RunnerError::InvalidConfiguration: return "worker options are invalid";
        case RunnerError::ProcessSpawnFailed: return "could not start the worker process";
        case RunnerError::HandshakeFailed: return "worker did not complete the handshake";
        case RunnerError::InitializationFailed: return "worker could not initialize Python";
        case RunnerError::NotReady: return "worker is not ready";
        case RunnerError::CommunicationError: return "lost contact with the worker";
        case RunnerError::Timeout: return "worker did not respond in time";
        case RunnerError::MemoryLimitExceeded: return "worker exceeded its memory limit";
        case RunnerError::ProcessCrashed: return "worker process died";
        case RunnerError::ProcessKilled: return "worker process could not be killed";
    }
    return "worker failure";
}

/**
 * @brief Result type for worker host operations
 */
template<typename T>
using Result = std::expected<T, RunnerError>;

/**
 * @brief Everything needed to start and talk to one worker process
 */
struct WorkerOptions {
    IsolationLevel level{IsolationLevel::Subprocess};

    std::filesystem::path workerExecutable;  ///< enclave_worker binary
    std::filesystem::path pythonExecutable;  ///< Interpreter used to run pip
    std::filesystem::path sandboxRoot;       ///< Holds input/, output/, tmp/
    std::filesystem::path siteDirectory;     ///< pip --target for installed packages

    size_t maxMemoryMB{0};                   ///< 0 = unlimited
    std::chrono::milliseconds initTimeout{30000};
    std::chrono::seconds pipTimeout{120};
    bool synthesizeArgv{true};
    std::string logLevel{"warn"};            ///< Worker's own stderr log level
    protocol::GuestPolicy guestPolicy;       ///< Imports and network reach of guest code
};

}  // namespace enclave::worker

#endif  // ENCLAVE_WORKER_TYPES_HPP
