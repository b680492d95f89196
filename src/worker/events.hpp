/*
 * events.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file events.hpp
 * @brief Tagged events from the worker engine to the runner manager
 * @date 2024
 * @version 1.0.0
 *
 * The engine's reader thread turns IPC messages into EngineEvent values and
 * pushes them onto an EventChannel. The runner manager drains the channel
 * on its dispatcher thread and demultiplexes by request id.
 */

#ifndef ENCLAVE_WORKER_EVENTS_HPP
#define ENCLAVE_WORKER_EVENTS_HPP

#include "protocol/types.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace enclave::worker {

/// Worker finished loading and accepts requests
struct ReadyEvent {
    std::string pythonVersion;
};

/// Runtime loading step (no request attached)
struct LoadingEvent {
    std::string message;
};

/// Per-request progress step
struct ProgressStepEvent {
    std::string requestId;
    protocol::ProgressType type{protocol::ProgressType::Executing};
    std::string message;
};

/// A request completed inside the worker
struct ResultEvent {
    std::string requestId;
    protocol::ExecutionResult result;
};

/// The worker died or misbehaved; requestId is the request in flight, if any
struct FaultEvent {
    std::string requestId;
    protocol::ErrorKind kind{protocol::ErrorKind::Runtime};
    std::string message;
};

using EngineEvent =
    std::variant<ReadyEvent, LoadingEvent, ProgressStepEvent, ResultEvent, FaultEvent>;

/**
 * @brief Unbounded multi-producer queue of engine events
 */
class EventChannel {
public:
    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /**
     * @brief Enqueue an event; dropped once the channel is closed
     */
    void push(EngineEvent event);

    /**
     * @brief Dequeue the next event
     * @return Event, or nullopt on timeout or when closed and drained
     */
    [[nodiscard]] std::optional<EngineEvent> pop(std::chrono::milliseconds timeout);

    /**
     * @brief Wake all waiters and refuse further events
     */
    void close();

    [[nodiscard]] bool isClosed() const;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<EngineEvent> queue_;
    bool closed_{false};
};

}  // namespace enclave::worker

#endif  // ENCLAVE_WORKER_EVENTS_HPP
