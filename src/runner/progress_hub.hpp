/*
 * progress_hub.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_RUNNER_PROGRESS_HUB_HPP
#define ENCLAVE_RUNNER_PROGRESS_HUB_HPP

#include "protocol/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace enclave::runner {

using Unsubscribe = std::function<void()>;

/**
 * @brief Fans progress events out to registered listeners
 *
 * Listeners run on the publishing thread, outside the hub's lock, in
 * registration order. A listener that throws is logged and skipped.
 */
class ProgressHub : public std::enable_shared_from_this<ProgressHub> {
public:
    ProgressHub() = default;

    ProgressHub(const ProgressHub&) = delete;
    ProgressHub& operator=(const ProgressHub&) = delete;

    /**
     * @brief Register a listener
     * @return Callable removing the listener; safe to call after the hub is gone
     */
    Unsubscribe subscribe(protocol::ProgressListener listener);

    void publish(const protocol::ProgressEvent& event) const;

    [[nodiscard]] size_t listenerCount() const;

private:
    void remove(uint64_t id);

    mutable std::mutex mutex_;
    std::map<uint64_t, protocol::ProgressListener> listeners_;
    uint64_t nextId_{0};
};

}  // namespace enclave::runner

#endif  // ENCLAVE_RUNNER_PROGRESS_HUB_HPP
