/*
 * error_classifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_PROTOCOL_ERROR_CLASSIFIER_HPP
#define ENCLAVE_PROTOCOL_ERROR_CLASSIFIER_HPP

#include "types.hpp"

#include <string_view>

namespace enclave::protocol {

/**
 * @brief Classify an error message into the sandbox taxonomy
 *
 * Checks run in a fixed order and the first hit wins: timeout vocabulary,
 * then parse errors, then permission errors. Anything else is a runtime
 * error. Matching is case-insensitive.
 *
 * @param message Error text reported by an interpreter or the host
 * @return The error kind
 */
[[nodiscard]] ErrorKind classifyError(std::string_view message);

}  // namespace enclave::protocol

#endif  // ENCLAVE_PROTOCOL_ERROR_CLASSIFIER_HPP
