/*
 * result_formatter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_PROTOCOL_RESULT_FORMATTER_HPP
#define ENCLAVE_PROTOCOL_RESULT_FORMATTER_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace enclave::protocol {

/// Placeholder stored for guest values that cannot leave the interpreter
inline constexpr std::string_view kFunctionTag = "[Function]";
inline constexpr std::string_view kObjectTag = "[Object]";
inline constexpr std::string_view kArrayTag = "[Array]";

/**
 * @brief Render a guest value for display
 *
 * - NaN and infinities render as NaN, Infinity, -Infinity
 * - strings render raw, null as "null"
 * - arrays render as compact JSON, objects as JSON indented by two spaces
 * - if serialization throws the type tag is returned instead
 */
[[nodiscard]] std::string formatResult(const nlohmann::json& value);

/**
 * @brief Render an optional guest value, nullopt being "undefined"
 */
[[nodiscard]] std::string formatResult(const std::optional<nlohmann::json>& value);

}  // namespace enclave::protocol

#endif  // ENCLAVE_PROTOCOL_RESULT_FORMATTER_HPP
