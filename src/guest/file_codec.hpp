/*
 * file_codec.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_GUEST_FILE_CODEC_HPP
#define ENCLAVE_GUEST_FILE_CODEC_HPP

#include <expected>
#include <string>
#include <string_view>

namespace enclave::guest {

/**
 * @brief Strict UTF-8 validation (no overlongs, no surrogates, max U+10FFFF)
 */
[[nodiscard]] bool isValidUtf8(std::string_view data) noexcept;

/**
 * @brief Standard base64 with padding
 */
[[nodiscard]] std::string base64Encode(std::string_view data);

/**
 * @brief Decode standard base64; whitespace is ignored
 * @return Bytes, or a reason when the input is malformed
 */
[[nodiscard]] std::expected<std::string, std::string> base64Decode(std::string_view encoded);

}  // namespace enclave::guest

#endif  // ENCLAVE_GUEST_FILE_CODEC_HPP
