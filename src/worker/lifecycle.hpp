/*
 * lifecycle.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_WORKER_LIFECYCLE_HPP
#define ENCLAVE_WORKER_LIFECYCLE_HPP

#include "types.hpp"

#include <atomic>
#include <mutex>

namespace enclave::ipc {
class BidirectionalChannel;
}

namespace enclave::worker {

/**
 * @brief Process lifecycle management
 *
 * Owns the worker's process id and is the only place that kills or reaps
 * it. Killing never touches the IPC channel: the reader thread may still be
 * blocked on it and the engine closes it after joining that thread.
 */
class ProcessLifecycle {
public:
    ProcessLifecycle() = default;
    ~ProcessLifecycle();

    ProcessLifecycle(const ProcessLifecycle&) = delete;
    ProcessLifecycle& operator=(const ProcessLifecycle&) = delete;

    /**
     * @brief Adopt a freshly spawned process
     */
    void attach(int processId);

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] int getProcessId() const noexcept;

    /**
     * @brief SIGKILL and reap the process; safe to call from any thread
     * @return True if this call killed it
     */
    bool kill();

    /**
     * @brief Ask the worker to exit, then kill it if it lingers
     * @param channel Channel to send Shutdown on
     * @param graceMs How long to wait for a voluntary exit
     */
    void shutdown(ipc::BidirectionalChannel& channel, int graceMs = 1000);

private:
    // Marks the process gone and hands back its pid, or -1 if already gone
    int release();

    mutable std::mutex mutex_;
    std::atomic<bool> running_{false};
    int processId_{-1};
};

}  // namespace enclave::worker

#endif  // ENCLAVE_WORKER_LIFECYCLE_HPP
