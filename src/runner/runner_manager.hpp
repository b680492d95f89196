/*
 * runner_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file runner_manager.hpp
 * @brief Owns one engine and everything around a call to it
 * @date 2024
 * @version 1.0.0
 *
 * The manager picks the engine from its language, gives every call an id,
 * clamps the timeout, tracks the call until it resolves and fans progress
 * out to listeners. execute() never throws: every failure becomes a failed
 * ExecutionResult.
 *
 * JavaScript calls each run on their own thread and interpreter. Python
 * calls are queued and run one at a time on the shared worker; when a
 * Python call outlives its timeout the worker is killed and the engine
 * returns to idle until the next call starts it again.
 */

#ifndef ENCLAVE_RUNNER_RUNNER_MANAGER_HPP
#define ENCLAVE_RUNNER_RUNNER_MANAGER_HPP

#include "ephemeral/engine.hpp"
#include "progress_hub.hpp"
#include "protocol/timeouts.hpp"
#include "protocol/types.hpp"
#include "worker/persistent_engine.hpp"
#include "worker/types.hpp"

#include <future>
#include <memory>
#include <string>
#include <variant>

namespace enclave::runner {

/// Closed set of engines a manager can own
using Engine = std::variant<ephemeral::EphemeralEngine, worker::PersistentWorkerEngine>;

struct RunnerOptions {
    protocol::Language language{protocol::Language::JavaScript};
    protocol::TimeoutPolicy timeouts{protocol::defaultTimeoutPolicy(protocol::Language::JavaScript)};
    ephemeral::EphemeralOptions javascript;  ///< Used when language is JavaScript
    worker::WorkerOptions python;            ///< Used when language is Python
};

/**
 * @brief Build an id of the form exec_<epochMs>_<random>
 */
[[nodiscard]] std::string generateRequestId();

class RunnerManager {
public:
    explicit RunnerManager(RunnerOptions options);

    /**
     * @brief Destructor - resolves outstanding calls as terminated and stops the engine
     */
    ~RunnerManager();

    RunnerManager(const RunnerManager&) = delete;
    RunnerManager& operator=(const RunnerManager&) = delete;

    /**
     * @brief Run a request on this manager's engine
     *
     * The request's language is not consulted; routing happens before.
     */
    [[nodiscard]] std::future<protocol::ExecutionResult> execute(protocol::ExecutionRequest request);

    /**
     * @brief Register a progress listener
     * @return Callable that removes the listener
     */
    Unsubscribe onProgress(protocol::ProgressListener listener);

    /**
     * @brief Start the engine ahead of the first call
     *
     * Blocks until the Python worker is ready; a no-op for JavaScript.
     */
    [[nodiscard]] worker::Result<void> warmup();

    /**
     * @brief Fail every queued and running call with "Sandbox was terminated"
     *        and kill the Python worker
     */
    void terminate();

    [[nodiscard]] protocol::EngineState state() const;

    [[nodiscard]] bool isReady() const;

    [[nodiscard]] protocol::CancellationMode cancellationMode() const noexcept;

    [[nodiscard]] protocol::Language language() const noexcept;

    /**
     * @brief Calls accepted but not yet resolved
     */
    [[nodiscard]] size_t pendingCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace enclave::runner

#endif  // ENCLAVE_RUNNER_RUNNER_MANAGER_HPP
