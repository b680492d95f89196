/*
 * persistent_engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file persistent_engine.hpp
 * @brief Long-lived Python worker process behind a message channel
 * @date 2024
 * @version 1.0.0
 *
 * The engine spawns enclave_worker, performs the handshake and waits for
 * the worker's Ready message. Requests are dispatched as Execute messages;
 * everything the worker sends back is turned into EngineEvent values by a
 * reader thread. The engine does not time requests: the runner manager
 * does, and calls terminate() when a deadline passes.
 */

#ifndef ENCLAVE_WORKER_PERSISTENT_ENGINE_HPP
#define ENCLAVE_WORKER_PERSISTENT_ENGINE_HPP

#include "events.hpp"
#include "types.hpp"
#include "protocol/types.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace enclave::worker {

/**
 * @brief Persistent worker engine (destructive cancellation)
 *
 * State machine: idle -> loading -> ready <-> executing, with error
 * reachable from any state. After terminate() or a fault the next
 * initialize() starts a fresh worker.
 */
class PersistentWorkerEngine {
public:
    /**
     * @param options Worker options; empty paths are discovered
     * @param events Channel receiving everything the worker reports
     */
    PersistentWorkerEngine(WorkerOptions options, std::shared_ptr<EventChannel> events);

    /**
     * @brief Destructor - asks the worker to exit, then kills it
     */
    ~PersistentWorkerEngine();

    PersistentWorkerEngine(const PersistentWorkerEngine&) = delete;
    PersistentWorkerEngine& operator=(const PersistentWorkerEngine&) = delete;

    PersistentWorkerEngine(PersistentWorkerEngine&&) noexcept;
    PersistentWorkerEngine& operator=(PersistentWorkerEngine&&) noexcept;

    /**
     * @brief Start the worker and block until it is ready
     *
     * Idempotent: returns immediately when already ready or executing.
     * Fails when the worker cannot be spawned, the handshake fails, the
     * worker reports an error while loading, or the init timeout passes.
     */
    [[nodiscard]] Result<void> initialize();

    /**
     * @brief Send one request to the ready worker
     * @param requestId Id the result event will carry
     * @param request The request
     * @param timeout Clamped timeout; the worker caps package installs by it
     */
    [[nodiscard]] Result<void> dispatch(const std::string& requestId,
                                        const protocol::ExecutionRequest& request,
                                        std::chrono::milliseconds timeout);

    /**
     * @brief SIGKILL the worker and return to idle
     */
    void terminate();

    /**
     * @brief Ask the worker to exit gracefully and return to idle
     */
    void shutdown();

    [[nodiscard]] protocol::EngineState state() const noexcept;

    [[nodiscard]] bool isReady() const noexcept;

    /**
     * @brief Worker pid, or -1 when no worker runs
     */
    [[nodiscard]] int processId() const;

    [[nodiscard]] const WorkerOptions& options() const;

    [[nodiscard]] static constexpr protocol::CancellationMode cancellationMode() noexcept {
        return protocol::CancellationMode::Destructive;
    }

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace enclave::worker

#endif  // ENCLAVE_WORKER_PERSISTENT_ENGINE_HPP
