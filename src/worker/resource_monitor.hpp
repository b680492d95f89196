/*
 * resource_monitor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_WORKER_RESOURCE_MONITOR_HPP
#define ENCLAVE_WORKER_RESOURCE_MONITOR_HPP

#include <cstddef>
#include <optional>

namespace enclave::worker {

/**
 * @brief One reading of a process's memory, in bytes
 */
struct MemorySample {
    size_t residentBytes{0};  ///< VmRSS
    size_t peakBytes{0};      ///< VmHWM

    /**
     * @brief Whether the resident size is above limitMB (0 = unlimited)
     */
    [[nodiscard]] bool exceeds(size_t limitMB) const noexcept {
        return limitMB != 0 && residentBytes > limitMB * 1024 * 1024;
    }
};

/**
 * @brief Memory sampling for the worker process (reads /proc/<pid>/status)
 */
class ResourceMonitor {
public:
    /**
     * @return The sample, or nullopt when the process is gone
     */
    [[nodiscard]] static std::optional<MemorySample> sample(int processId);
};

}  // namespace enclave::worker

#endif  // ENCLAVE_WORKER_RESOURCE_MONITOR_HPP
