/*
 * test_message.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_message.cpp
 * @brief Tests for IPC framing and the worker payload structs
 */

#include <gtest/gtest.h>
#include "ipc/message.hpp"

#include <vector>

using namespace enclave::ipc;
namespace protocol = enclave::protocol;

// =============================================================================
// MessageHeader Tests
// =============================================================================

class MessageHeaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        header_.type = MessageType::Execute;
        header_.payloadSize = 100;
        header_.sequenceId = 42;
    }

    MessageHeader header_;
};

TEST_F(MessageHeaderTest, DefaultConstruction) {
    MessageHeader h;
    EXPECT_EQ(h.magic, MessageHeader::MAGIC);
    EXPECT_EQ(h.version, MessageHeader::VERSION);
    EXPECT_EQ(h.payloadSize, 0u);
    EXPECT_TRUE(h.isValid());
}

TEST_F(MessageHeaderTest, SerializedSizeIsFixed) {
    EXPECT_EQ(header_.serialize().size(), MessageHeader::SIZE);
}

TEST_F(MessageHeaderTest, SerializeDeserializeRoundTrip) {
    auto data = header_.serialize();
    auto result = MessageHeader::deserialize(data);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, MessageType::Execute);
    EXPECT_EQ(result->payloadSize, 100u);
    EXPECT_EQ(result->sequenceId, 42u);
}

TEST_F(MessageHeaderTest, RejectsWrongMagic) {
    header_.magic = 0x12345678;
    auto result = MessageHeader::deserialize(header_.serialize());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), IPCError::InvalidMessage);
}

TEST_F(MessageHeaderTest, RejectsShortBuffer) {
    std::vector<uint8_t> data(MessageHeader::SIZE - 1, 0);
    EXPECT_FALSE(MessageHeader::deserialize(data).has_value());
}

TEST_F(MessageHeaderTest, RejectsOversizedPayload) {
    header_.payloadSize = static_cast<uint32_t>(ProtocolConstants::MAX_PAYLOAD_SIZE + 1);
    auto result = MessageHeader::deserialize(header_.serialize());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), IPCError::MessageTooLarge);
}

// =============================================================================
// Message Tests
// =============================================================================

TEST(MessageTest, CreateSetsPayloadSize) {
    auto msg = Message::create(MessageType::Progress, {{"message", "hi"}}, 7);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->header.type, MessageType::Progress);
    EXPECT_EQ(msg->header.sequenceId, 7u);
    EXPECT_EQ(msg->header.payloadSize, msg->payload.size());
}

TEST(MessageTest, FramedRoundTrip) {
    auto msg = Message::create(MessageType::Ready, {{"python_version", "3.11.2"}});
    ASSERT_TRUE(msg.has_value());

    auto decoded = Message::deserialize(msg->serialize());
    ASSERT_TRUE(decoded.has_value());
    auto payload = decoded->getPayloadAsJson();
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ((*payload)["python_version"], "3.11.2");
}

TEST(MessageTest, TruncatedPayloadIsInvalid) {
    auto msg = Message::create(MessageType::Ready, {{"key", "value"}});
    ASSERT_TRUE(msg.has_value());
    auto data = msg->serialize();
    data.pop_back();
    EXPECT_FALSE(Message::deserialize(data).has_value());
}

TEST(MessageTest, EmptyPayloadIsEmptyObject) {
    Message msg;
    auto payload = msg.getPayloadAsJson();
    ASSERT_TRUE(payload.has_value());
    EXPECT_TRUE(payload->is_object());
}

// =============================================================================
// Payload Struct Tests
// =============================================================================

TEST(PayloadTest, ExecuteCommandCarriesRequest) {
    ExecuteCommand command;
    command.requestId = "exec_1";
    command.request.language = protocol::Language::Python;
    command.request.code = "print(1)";
    command.request.packages = {"numpy"};
    command.timeoutMs = 60000;
    command.synthesizeArgv = false;

    auto j = command.toJson();
    EXPECT_EQ(j["request_id"], "exec_1");

    auto parsed = ExecuteCommand::fromJson(j);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->requestId, "exec_1");
    EXPECT_EQ(parsed->request.language, protocol::Language::Python);
    EXPECT_EQ(parsed->request.code, "print(1)");
    EXPECT_EQ(parsed->timeoutMs, 60000);
    EXPECT_FALSE(parsed->synthesizeArgv);
}

TEST(PayloadTest, ExecuteCommandWithoutRequestFails) {
    EXPECT_FALSE(ExecuteCommand::fromJson({{"request_id", "x"}}).has_value());
}

TEST(PayloadTest, ExecuteReplyCarriesResult) {
    ExecuteReply reply;
    reply.requestId = "exec_2";
    reply.result = protocol::ExecutionResult::failure(
        protocol::Language::Python, protocol::ErrorKind::Syntax, "SyntaxError: bad");

    auto parsed = ExecuteReply::fromJson(reply.toJson());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->requestId, "exec_2");
    EXPECT_FALSE(parsed->result.success);
    EXPECT_EQ(parsed->result.errorKind, protocol::ErrorKind::Syntax);
}

TEST(PayloadTest, ProgressNoticeRejectsUnknownType) {
    json j = {{"request_id", "a"}, {"type", "bogus"}, {"message", "m"}};
    auto parsed = ProgressNotice::fromJson(j);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error(), IPCError::InvalidMessage);
}

TEST(PayloadTest, ProgressNoticeRoundTrip) {
    ProgressNotice notice{"exec_3", protocol::ProgressType::Installing,
                          "Installing packages: numpy"};
    auto parsed = ProgressNotice::fromJson(notice.toJson());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->type, protocol::ProgressType::Installing);
    EXPECT_EQ(parsed->message, "Installing packages: numpy");
}

TEST(PayloadTest, HandshakeRoundTrip) {
    HandshakePayload payload;
    payload.version = "1.0";
    payload.capabilities = {"execute", "progress"};
    payload.pid = 1234;

    auto parsed = HandshakePayload::fromJson(payload.toJson());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->version, "1.0");
    EXPECT_EQ(parsed->capabilities.size(), 2u);
    EXPECT_EQ(parsed->pid, 1234u);
}
