/*
 * progress_hub.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "progress_hub.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <vector>

namespace enclave::runner {

Unsubscribe ProgressHub::subscribe(protocol::ProgressListener listener) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextId_++;
        listeners_.emplace(id, std::move(listener));
    }

    std::weak_ptr<ProgressHub> weak = weak_from_this();
    return [weak, id] {
        if (auto hub = weak.lock()) {
            hub->remove(id);
        }
    };
}

void ProgressHub::publish(const protocol::ProgressEvent& event) const {
    std::vector<protocol::ProgressListener> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            snapshot.push_back(listener);
        }
    }

    for (const auto& listener : snapshot) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::warn("Progress listener threw: {}", e.what());
        } catch (...) {
            spdlog::warn("Progress listener threw a non-standard exception");
        }
    }
}

size_t ProgressHub::listenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

void ProgressHub::remove(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

}  // namespace enclave::runner
