/*
 * timeouts.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_PROTOCOL_TIMEOUTS_HPP
#define ENCLAVE_PROTOCOL_TIMEOUTS_HPP

#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace enclave::protocol {

/**
 * @brief Timeout bounds for one language
 */
struct TimeoutPolicy {
    int64_t defaultMs{5000};
    int64_t minMs{5000};
    int64_t maxMs{30000};
};

/**
 * @brief Built-in policy for a language
 *
 * JavaScript defaults to 5s (max 30s), Python to 60s (max 300s). Neither
 * accepts less than 5s.
 */
[[nodiscard]] constexpr TimeoutPolicy defaultTimeoutPolicy(Language language) noexcept {
    switch (language) {
        case Language::JavaScript: return {5000, 5000, 30000};
        case Language::Python: return {60000, 5000, 300000};
    }
    return {};
}

/**
 * @brief Clamp a requested timeout into the policy range
 *
 * Absent requests get the default. Out-of-range values are clamped, never
 * rejected.
 */
[[nodiscard]] std::chrono::milliseconds clampTimeout(std::optional<int64_t> requestedMs,
                                                     const TimeoutPolicy& policy) noexcept;

}  // namespace enclave::protocol

#endif  // ENCLAVE_PROTOCOL_TIMEOUTS_HPP
