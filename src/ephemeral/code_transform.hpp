/*
 * code_transform.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file code_transform.hpp
 * @brief Source rewriting applied before guest JavaScript is evaluated
 *
 * The engine evaluates plain scripts, not modules. Code using the
 * `export default <expr>` convention has the export turned into an
 * assignment to a result variable that the script then yields; anything
 * else is run as a function body so a top-level `return` works.
 */

#ifndef ENCLAVE_EPHEMERAL_CODE_TRANSFORM_HPP
#define ENCLAVE_EPHEMERAL_CODE_TRANSFORM_HPP

#include <string>
#include <string_view>

namespace enclave::ephemeral {

/// Variable receiving the default export
inline constexpr std::string_view RESULT_VARIABLE = "__result__";

/**
 * @brief Whether the code uses the `export default` convention
 */
[[nodiscard]] bool hasDefaultExport(const std::string& code);

/**
 * @brief Rewrite guest code into an evaluable script
 *
 * With a default export every `export default ` becomes
 * `__result__ = ` and the script ends by yielding `__result__`.
 * Otherwise the code is wrapped in `(function() { ... })()`.
 */
[[nodiscard]] std::string wrapCode(const std::string& code);

}  // namespace enclave::ephemeral

#endif  // ENCLAVE_EPHEMERAL_CODE_TRANSFORM_HPP
