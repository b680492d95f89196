/*
 * message.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "message.hpp"
#include "serializer.hpp"

#include <spdlog/spdlog.h>

#include <string_view>

namespace enclave::ipc {

namespace {

// Header layout, all integers big-endian:
//   0 magic(4) | 4 version | 5 type | 6 payloadSize(4) | 10 sequenceId(4) | 14 flags | 15 reserved
constexpr size_t OFF_MAGIC = 0;
constexpr size_t OFF_VERSION = 4;
constexpr size_t OFF_TYPE = 5;
constexpr size_t OFF_SIZE = 6;
constexpr size_t OFF_SEQUENCE = 10;
constexpr size_t OFF_FLAGS = 14;
constexpr size_t OFF_RESERVED = 15;

void putBigEndian(std::span<uint8_t> out, size_t at, uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
        out[at + i] = static_cast<uint8_t>(value >> (24 - 8 * i));
    }
}

uint32_t getBigEndian(std::span<const uint8_t> in, size_t at) {
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        value = (value << 8) | in[at + i];
    }
    return value;
}

/// Runs a payload decoder, turning JSON type errors into DeserializationFailed
template <typename T, typename Decode>
IPCResult<T> decodePayload(std::string_view what, const json& j, Decode&& decode) {
    if (!j.is_object()) {
        spdlog::error("{} payload is not an object", what);
        return std::unexpected(IPCError::DeserializationFailed);
    }
    try {
        return decode();
    } catch (const json::exception& e) {
        spdlog::error("Malformed {} payload: {}", what, e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

}  // namespace

// ============================================================================
// MessageHeader
// ============================================================================

std::vector<uint8_t> MessageHeader::serialize() const {
    std::vector<uint8_t> out(SIZE, 0);
    putBigEndian(out, OFF_MAGIC, magic);
    out[OFF_VERSION] = version;
    out[OFF_TYPE] = static_cast<uint8_t>(type);
    putBigEndian(out, OFF_SIZE, payloadSize);
    putBigEndian(out, OFF_SEQUENCE, sequenceId);
    out[OFF_FLAGS] = flags;
    out[OFF_RESERVED] = reserved;
    return out;
}

IPCResult<MessageHeader> MessageHeader::deserialize(std::span<const uint8_t> data) {
    if (data.size() < SIZE) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    MessageHeader header;
    header.magic = getBigEndian(data, OFF_MAGIC);
    header.version = data[OFF_VERSION];
    header.type = static_cast<MessageType>(data[OFF_TYPE]);
    header.payloadSize = getBigEndian(data, OFF_SIZE);
    header.sequenceId = getBigEndian(data, OFF_SEQUENCE);
    header.flags = data[OFF_FLAGS];
    header.reserved = data[OFF_RESERVED];

    if (!header.isValid()) {
        spdlog::debug("Rejecting frame: magic {:#010x}, version {}", header.magic,
                      header.version);
        return std::unexpected(IPCError::InvalidMessage);
    }
    // Checked before any payload is read so a corrupt size never allocates
    if (header.payloadSize > ProtocolConstants::MAX_PAYLOAD_SIZE) {
        return std::unexpected(IPCError::MessageTooLarge);
    }
    return header;
}

bool MessageHeader::isValid() const noexcept {
    return magic == MAGIC && version == VERSION;
}

// ============================================================================
// Message
// ============================================================================

IPCResult<Message> Message::create(MessageType type, const json& payload,
                                   uint32_t sequenceId) {
    return IPCSerializer::serialize(payload).transform([&](std::vector<uint8_t> bytes) {
        Message message;
        message.header.type = type;
        message.header.sequenceId = sequenceId;
        message.header.payloadSize = static_cast<uint32_t>(bytes.size());
        message.payload = std::move(bytes);
        return message;
    });
}

IPCResult<json> Message::getPayloadAsJson() const {
    if (payload.empty()) {
        return json::object();
    }
    return IPCSerializer::deserialize(payload);
}

std::vector<uint8_t> Message::serialize() const {
    auto frame = header.serialize();
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

IPCResult<Message> Message::deserialize(std::span<const uint8_t> data) {
    auto header = MessageHeader::deserialize(data);
    if (!header) {
        return std::unexpected(header.error());
    }
    auto body = data.subspan(MessageHeader::SIZE);
    if (body.size() < header->payloadSize) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    Message message;
    message.header = *header;
    message.payload.assign(body.begin(), body.begin() + header->payloadSize);
    return message;
}

// ============================================================================
// Payloads
// ============================================================================

json ExecuteCommand::toJson() const {
    return {{"request_id", requestId},
            {"request", request.toJson()},
            {"timeout_ms", timeoutMs},
            {"synthesize_argv", synthesizeArgv}};
}

IPCResult<ExecuteCommand> ExecuteCommand::fromJson(const json& j) {
    return decodePayload<ExecuteCommand>("Execute", j, [&]() -> IPCResult<ExecuteCommand> {
        auto request = protocol::ExecutionRequest::fromJson(j.at("request"));
        if (!request) {
            spdlog::error("Execute payload carries a bad request: {}", request.error());
            return std::unexpected(IPCError::DeserializationFailed);
        }
        ExecuteCommand command;
        command.requestId = j.at("request_id").get<std::string>();
        command.request = std::move(*request);
        command.timeoutMs = j.value("timeout_ms", int64_t{0});
        command.synthesizeArgv = j.value("synthesize_argv", true);
        return command;
    });
}

json ExecuteReply::toJson() const {
    return {{"request_id", requestId}, {"result", result.toJson()}};
}

IPCResult<ExecuteReply> ExecuteReply::fromJson(const json& j) {
    return decodePayload<ExecuteReply>("Result", j, [&]() -> IPCResult<ExecuteReply> {
        auto result = protocol::ExecutionResult::fromJson(j.at("result"));
        if (!result) {
            spdlog::error("Result payload carries a bad result: {}", result.error());
            return std::unexpected(IPCError::DeserializationFailed);
        }
        ExecuteReply reply;
        reply.requestId = j.at("request_id").get<std::string>();
        reply.result = std::move(*result);
        return reply;
    });
}

json ProgressNotice::toJson() const {
    return {{"request_id", requestId},
            {"type", protocol::progressTypeToString(type)},
            {"message", message}};
}

IPCResult<ProgressNotice> ProgressNotice::fromJson(const json& j) {
    return decodePayload<ProgressNotice>("Progress", j, [&]() -> IPCResult<ProgressNotice> {
        auto type = protocol::progressTypeFromString(j.value("type", std::string{}));
        if (!type) {
            return std::unexpected(IPCError::InvalidMessage);
        }
        ProgressNotice notice;
        notice.requestId = j.value("request_id", std::string{});
        notice.type = *type;
        notice.message = j.value("message", std::string{});
        return notice;
    });
}

json ErrorNotice::toJson() const {
    return {{"request_id", requestId}, {"message", message}};
}

IPCResult<ErrorNotice> ErrorNotice::fromJson(const json& j) {
    return decodePayload<ErrorNotice>("Error", j, [&]() -> IPCResult<ErrorNotice> {
        ErrorNotice notice;
        notice.requestId = j.value("request_id", std::string{});
        notice.message = j.value("message", std::string{"Worker failed without a message"});
        return notice;
    });
}

json HandshakePayload::toJson() const {
    return {{"version", version},
            {"python_version", pythonVersion},
            {"capabilities", capabilities},
            {"pid", pid}};
}

IPCResult<HandshakePayload> HandshakePayload::fromJson(const json& j) {
    return decodePayload<HandshakePayload>("Handshake", j, [&]() -> IPCResult<HandshakePayload> {
        HandshakePayload payload;
        payload.version = j.value("version", std::string{});
        payload.pythonVersion = j.value("python_version", std::string{});
        payload.capabilities = j.value("capabilities", std::vector<std::string>{});
        payload.pid = j.value("pid", uint32_t{0});
        return payload;
    });
}

}  // namespace enclave::ipc
