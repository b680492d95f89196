/*
 * message.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file message.hpp
 * @brief Wire frames exchanged with enclave_worker
 *
 * A frame is a fixed 16 byte big-endian header followed by a JSON document.
 * The structs below are the typed views of those documents.
 */

#ifndef ENCLAVE_IPC_MESSAGE_HPP
#define ENCLAVE_IPC_MESSAGE_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "message_types.hpp"
#include "protocol/types.hpp"

namespace enclave::ipc {

using json = nlohmann::json;

/**
 * @brief Fixed-size frame header
 */
struct MessageHeader {
    static constexpr uint32_t MAGIC = ProtocolConstants::MAGIC;
    static constexpr uint8_t VERSION = ProtocolConstants::VERSION;
    static constexpr size_t SIZE = ProtocolConstants::HEADER_SIZE;

    uint32_t magic{MAGIC};
    uint8_t version{VERSION};
    MessageType type{MessageType::Handshake};
    uint32_t payloadSize{0};
    uint32_t sequenceId{0};  ///< Per-sender counter, diagnostic only
    uint8_t flags{0};        ///< Unused, always zero
    uint8_t reserved{0};

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /**
     * @return InvalidMessage for short input or a foreign magic/version,
     *         MessageTooLarge when payloadSize is over MAX_PAYLOAD_SIZE
     */
    [[nodiscard]] static IPCResult<MessageHeader> deserialize(
        std::span<const uint8_t> data);

    [[nodiscard]] bool isValid() const noexcept;
};

/// One complete frame
struct Message {
    MessageHeader header;
    std::vector<uint8_t> payload;

    [[nodiscard]] static IPCResult<Message> create(MessageType type, const json& payload,
                                                   uint32_t sequenceId = 0);

    [[nodiscard]] IPCResult<json> getPayloadAsJson() const;

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] static IPCResult<Message> deserialize(
        std::span<const uint8_t> data);
};

/// Execute: one request for the worker to run
struct ExecuteCommand {
    std::string requestId;
    protocol::ExecutionRequest request;
    int64_t timeoutMs{0};       ///< Clamped by the host; bounds package installs
    bool synthesizeArgv{true};  ///< Build sys.argv from the context map

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<ExecuteCommand> fromJson(const json& j);
};

/// Result: the outcome of an Execute, matched by requestId
struct ExecuteReply {
    std::string requestId;
    protocol::ExecutionResult result;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<ExecuteReply> fromJson(const json& j);
};

/**
 * @brief Progress or Loading notice
 *
 * Loading notices come from package installs and carry no requestId; the
 * host attributes them to the request in flight.
 */
struct ProgressNotice {
    std::string requestId;  ///< Empty for Loading messages
    protocol::ProgressType type{protocol::ProgressType::Loading};
    std::string message;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<ProgressNotice> fromJson(const json& j);
};

/// Error: the worker could not produce a Result for requestId
struct ErrorNotice {
    std::string requestId;
    std::string message;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<ErrorNotice> fromJson(const json& j);
};

/**
 * @brief Handshake payload
 *
 * The host sends its version and pid; the worker answers with its Python
 * version, capabilities and pid.
 */
struct HandshakePayload {
    std::string version;
    std::string pythonVersion;
    std::vector<std::string> capabilities;
    uint32_t pid{0};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<HandshakePayload> fromJson(const json& j);
};

}  // namespace enclave::ipc

#endif  // ENCLAVE_IPC_MESSAGE_HPP
