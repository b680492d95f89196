/*
 * lifecycle.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "lifecycle.hpp"
#include "process_spawning.hpp"
#include "ipc/channel.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace enclave::worker {

ProcessLifecycle::~ProcessLifecycle() {
    kill();
}

void ProcessLifecycle::attach(int processId) {
    std::lock_guard<std::mutex> lock(mutex_);
    processId_ = processId;
    running_ = processId > 0;
}

bool ProcessLifecycle::isRunning() const noexcept {
    return running_;
}

int ProcessLifecycle::getProcessId() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return processId_;
}

int ProcessLifecycle::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.exchange(false)) {
        return -1;
    }
    return std::exchange(processId_, -1);
}

bool ProcessLifecycle::kill() {
    int pid = release();
    if (pid <= 0) {
        return false;
    }
    if (auto killed = ProcessSpawner::killProcess(pid); !killed) {
        spdlog::warn("Worker {} did not take SIGKILL: {}", pid,
                     runnerErrorToString(killed.error()));
    } else {
        spdlog::debug("Worker {} killed", pid);
    }
    return true;
}

void ProcessLifecycle::shutdown(ipc::BidirectionalChannel& channel, int graceMs) {
    int pid = getProcessId();
    if (!running_ || pid <= 0) {
        return;
    }

    if (!channel.send(ipc::MessageType::Shutdown, nlohmann::json::object())) {
        kill();
        return;
    }

    auto exited = ProcessSpawner::waitForProcess(pid, graceMs);
    if (!exited && exited.error() == RunnerError::Timeout) {
        spdlog::debug("Worker {} ignored Shutdown for {} ms", pid, graceMs);
        kill();
        return;
    }
    // Reaped already; only forget the pid
    release();
    spdlog::debug("Worker {} left with code {}", pid, exited.value_or(-1));
}

}  // namespace enclave::worker
