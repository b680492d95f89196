/*
 * channel.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file channel.hpp
 * @brief Framed message pipes between the host and enclave_worker
 *
 * Frames are read against a single deadline covering header and payload,
 * so a worker that stalls halfway through a frame still times out.
 */

#ifndef ENCLAVE_IPC_CHANNEL_HPP
#define ENCLAVE_IPC_CHANNEL_HPP

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <utility>

#include "message_types.hpp"

namespace enclave::ipc {

using json = nlohmann::json;

struct HandshakePayload;
struct Message;

/**
 * @brief Unidirectional pipe carrying framed messages
 */
class PipeChannel {
public:
    PipeChannel();
    ~PipeChannel();

    PipeChannel(const PipeChannel&) = delete;
    PipeChannel& operator=(const PipeChannel&) = delete;

    PipeChannel(PipeChannel&& other) noexcept;
    PipeChannel& operator=(PipeChannel&& other) noexcept;

    /**
     * @brief Create the pipe
     *
     * Both ends are close-on-exec; the spawner clears the flag on the ends
     * it hands to the worker.
     */
    [[nodiscard]] IPCResult<void> create();

    /**
     * @brief Take ownership of inherited descriptors (-1 for none)
     */
    void adopt(int readFd, int writeFd);

    void close();

    [[nodiscard]] bool isOpen() const noexcept;

    /**
     * @brief Send a message, writing header and payload completely
     */
    [[nodiscard]] IPCResult<void> send(const Message& message);

    /**
     * @brief Read one frame before the timeout elapses
     *
     * Timeout when the frame is not complete in time, ChannelClosed on EOF,
     * MessageTooLarge when the header announces more than the frame limit.
     */
    [[nodiscard]] IPCResult<Message> receive(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    [[nodiscard]] int getReadFd() const noexcept;
    [[nodiscard]] int getWriteFd() const noexcept;

    void closeRead();
    void closeWrite();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

/**
 * @brief Full-duplex channel over two pipes
 *
 * The host creates the channel, hands getSubprocessFds() to the worker and
 * calls setupParent(). The worker calls attach() with the inherited
 * descriptors. send() and receive() pick the pipe for the caller's role and
 * reject message types that only the other side may send.
 */
class BidirectionalChannel {
public:
    enum class Role { Parent, Child };

    BidirectionalChannel();
    ~BidirectionalChannel();

    BidirectionalChannel(const BidirectionalChannel&) = delete;
    BidirectionalChannel& operator=(const BidirectionalChannel&) = delete;

    [[nodiscard]] IPCResult<void> create();

    /**
     * @brief Use inherited descriptors as the child end
     * @param readFd Read end of the parent-to-child pipe
     * @param writeFd Write end of the child-to-parent pipe
     */
    void attach(int readFd, int writeFd);

    void close();

    [[nodiscard]] bool isOpen() const noexcept;

    [[nodiscard]] Role role() const noexcept { return role_; }

    [[nodiscard]] IPCResult<void> send(const Message& message);

    /**
     * @brief Build and send a JSON message with the next sequence id
     */
    [[nodiscard]] IPCResult<void> send(MessageType type, const json& payload);

    [[nodiscard]] IPCResult<Message> receive(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Descriptors the worker needs (read from parent, write to parent)
     */
    [[nodiscard]] std::pair<int, int> getSubprocessFds() const noexcept;

    /**
     * @brief Close the ends the parent does not use (call after spawning)
     */
    void setupParent();

    /**
     * @brief Host side of the handshake
     * @return The worker's handshake reply
     */
    [[nodiscard]] IPCResult<HandshakePayload> performHandshake(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Worker side of the handshake: wait for the greeting and answer
     * @return The host's greeting
     */
    [[nodiscard]] IPCResult<HandshakePayload> acceptHandshake(
        const HandshakePayload& reply,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

private:
    PipeChannel parentToChild_;
    PipeChannel childToParent_;
    Role role_{Role::Parent};
    std::atomic<uint32_t> sequenceId_{0};
    mutable std::mutex mutex_;
};

}  // namespace enclave::ipc

#endif  // ENCLAVE_IPC_CHANNEL_HPP
