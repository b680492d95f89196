/*
 * serializer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_IPC_SERIALIZER_HPP
#define ENCLAVE_IPC_SERIALIZER_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <span>
#include <vector>

#include "message_types.hpp"

namespace enclave::ipc {

using json = nlohmann::json;

/**
 * @brief Payload codec for IPC messages
 *
 * Payloads are UTF-8 JSON text. Guest output is not guaranteed to be valid
 * UTF-8, so invalid sequences are replaced rather than failing the message.
 */
class IPCSerializer {
public:
    /**
     * @brief Serialize JSON to bytes
     * @return Bytes, or SerializationFailed / MessageTooLarge
     */
    [[nodiscard]] static IPCResult<std::vector<uint8_t>> serialize(const json& data);

    /**
     * @brief Deserialize bytes to JSON
     */
    [[nodiscard]] static IPCResult<json> deserialize(std::span<const uint8_t> data);
};

}  // namespace enclave::ipc

#endif  // ENCLAVE_IPC_SERIALIZER_HPP
