/*
 * mime.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_PROTOCOL_MIME_HPP
#define ENCLAVE_PROTOCOL_MIME_HPP

#include <string>
#include <string_view>

namespace enclave::protocol {

/**
 * @brief Infer a MIME type from a file extension
 * @return Known type, or application/octet-stream
 */
[[nodiscard]] std::string inferMimeType(std::string_view path);

/**
 * @brief Whether a MIME type denotes binary content
 */
[[nodiscard]] bool isBinaryMimeType(std::string_view mimeType) noexcept;

}  // namespace enclave::protocol

#endif  // ENCLAVE_PROTOCOL_MIME_HPP
