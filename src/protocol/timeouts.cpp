/*
 * timeouts.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "timeouts.hpp"

#include <algorithm>

namespace enclave::protocol {

std::chrono::milliseconds clampTimeout(std::optional<int64_t> requestedMs,
                                       const TimeoutPolicy& policy) noexcept {
    // A misconfigured policy with min > max still yields max
    const auto upper = std::max<int64_t>(policy.maxMs, 1);
    const auto lower = std::min(std::max<int64_t>(policy.minMs, 1), upper);

    const auto requested = requestedMs.value_or(policy.defaultMs);
    return std::chrono::milliseconds{std::clamp(requested, lower, upper)};
}

}  // namespace enclave::protocol
