/*
 * serializer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "serializer.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <span>

namespace enclave::ipc {

IPCResult<std::vector<uint8_t>> IPCSerializer::serialize(const json& data) {
    std::string text;
    try {
        // Guest output may hold invalid UTF-8; it is replaced, not rejected
        text = data.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        spdlog::error("Could not encode IPC payload: {}", e.what());
        return std::unexpected(IPCError::SerializationFailed);
    }

    if (text.size() > ProtocolConstants::MAX_PAYLOAD_SIZE) {
        spdlog::error("IPC payload is {} bytes, limit is {}", text.size(),
                      ProtocolConstants::MAX_PAYLOAD_SIZE);
        return std::unexpected(IPCError::MessageTooLarge);
    }
    auto bytes = std::as_bytes(std::span{text});
    std::vector<uint8_t> out(bytes.size());
    std::memcpy(out.data(), bytes.data(), bytes.size());
    return out;
}

IPCResult<json> IPCSerializer::deserialize(std::span<const uint8_t> data) {
    auto parsed = json::parse(data.begin(), data.end(), nullptr, false);
    if (parsed.is_discarded()) {
        spdlog::error("Could not decode {} byte IPC payload", data.size());
        return std::unexpected(IPCError::DeserializationFailed);
    }
    return parsed;
}

}  // namespace enclave::ipc
