/*
 * message_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file message_types.hpp
 * @brief Host/worker IPC message kinds, error codes and wire constants
 * @date 2024
 * @version 1.1.0
 */

#ifndef ENCLAVE_IPC_MESSAGE_TYPES_HPP
#define ENCLAVE_IPC_MESSAGE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>

namespace enclave::ipc {

/**
 * @brief Failures of framing and channel operations
 */
enum class IPCError {
    PipeError,              ///< pipe(), read() or write() failed
    ChannelClosed,          ///< Peer closed its end or the channel was closed
    Timeout,                ///< No complete frame before the deadline
    MessageTooLarge,        ///< Payload above MAX_PAYLOAD_SIZE
    InvalidMessage,         ///< Bad magic, version or unexpected message kind
    SerializationFailed,    ///< Payload could not be encoded
    DeserializationFailed   ///< Payload was not the expected JSON
};

[[nodiscard]] constexpr std::string_view ipcErrorToString(IPCError error) noexcept {
    switch (error) {
        case IPCError::PipeError: return "Pipe I/O failed";
        case IPCError::ChannelClosed: return "Peer closed the channel";
        case IPCError::Timeout: return "Timed out waiting for the peer";
        case IPCError::MessageTooLarge: return "Message exceeds the frame limit";
        case IPCError::InvalidMessage: return "Malformed or unexpected message";
        case IPCError::SerializationFailed: return "Payload could not be encoded";
        case IPCError::DeserializationFailed: return "Payload could not be decoded";
    }
    return "Unknown IPC error";
}

template<typename T>
using IPCResult = std::expected<T, IPCError>;

/**
 * @brief Message kinds exchanged between host and worker
 *
 * The comment on each kind names the sender.
 */
enum class MessageType : uint8_t {
    // Session
    Handshake = 0x01,    ///< host: greets a freshly spawned worker
    HandshakeAck = 0x02, ///< worker: identifies itself
    Shutdown = 0x03,     ///< host: asks the worker to exit
    ShutdownAck = 0x04,  ///< worker: about to exit
    Loading = 0x05,      ///< worker: interpreter start-up step
    Ready = 0x06,        ///< worker: requests may follow

    // Requests
    Execute = 0x10,      ///< host: run one request
    Result = 0x11,       ///< worker: outcome of one request
    Error = 0x12,        ///< worker: request could not be served at all

    // Notifications
    Progress = 0x20,     ///< worker: per-request status update
    Log = 0x21           ///< worker: log record relayed to the host
};

[[nodiscard]] constexpr std::string_view messageTypeName(MessageType type) noexcept {
    switch (type) {
        case MessageType::Handshake: return "Handshake";
        case MessageType::HandshakeAck: return "HandshakeAck";
        case MessageType::Shutdown: return "Shutdown";
        case MessageType::ShutdownAck: return "ShutdownAck";
        case MessageType::Loading: return "Loading";
        case MessageType::Ready: return "Ready";
        case MessageType::Execute: return "Execute";
        case MessageType::Result: return "Result";
        case MessageType::Error: return "Error";
        case MessageType::Progress: return "Progress";
        case MessageType::Log: return "Log";
    }
    return "Unknown";
}

/**
 * @brief Whether the worker is the sender of this kind
 */
[[nodiscard]] constexpr bool sentByWorker(MessageType type) noexcept {
    switch (type) {
        case MessageType::Handshake:
        case MessageType::Shutdown:
        case MessageType::Execute:
            return false;
        default:
            return true;
    }
}

/**
 * @brief Wire constants
 */
struct ProtocolConstants {
    static constexpr uint32_t MAGIC = 0x454E434C;  // "ENCL"
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 16;
    static constexpr size_t MAX_PAYLOAD_SIZE = 64 * 1024 * 1024;
};

}  // namespace enclave::ipc

#endif  // ENCLAVE_IPC_MESSAGE_TYPES_HPP
