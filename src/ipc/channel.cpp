/*
 * channel.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "channel.hpp"
#include "message.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <span>
#include <string_view>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace enclave::ipc {

namespace {

using Clock = std::chrono::steady_clock;

// Time allowed for the rest of a frame once its first byte has arrived
constexpr auto kFrameCompletionTimeout = std::chrono::seconds{30};

void ignoreSigpipe() {
    static std::once_flag once;
    // A vanished peer must surface as ChannelClosed, not kill the process
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// Waits for fd to become readable before the deadline
IPCResult<void> awaitReadable(int fd, Clock::time_point deadline) {
    for (;;) {
        auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());
        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(std::max<int64_t>(left.count(), 0)));
        if (ready > 0) {
            return {};
        }
        if (ready == 0) {
            return std::unexpected(IPCError::Timeout);
        }
        if (errno != EINTR) {
            return std::unexpected(IPCError::PipeError);
        }
    }
}

/// Fills the whole span; a frame that stalls past the deadline is a timeout
IPCResult<void> readFrame(int fd, std::span<uint8_t> out, Clock::time_point deadline) {
    while (!out.empty()) {
        if (auto ready = awaitReadable(fd, deadline); !ready) {
            return ready;
        }
        auto n = ::read(fd, out.data(), out.size());
        if (n == 0) {
            return std::unexpected(IPCError::ChannelClosed);
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return std::unexpected(IPCError::PipeError);
        }
        out = out.subspan(static_cast<size_t>(n));
    }
    return {};
}

/// A partial frame leaves the stream unusable, so it never reads as Timeout
IPCError midFrameError(IPCError error, std::string_view part) {
    if (error != IPCError::ChannelClosed) {
        spdlog::warn("Incomplete {} frame: {}", part, ipcErrorToString(error));
    }
    return error == IPCError::Timeout ? IPCError::InvalidMessage : error;
}

IPCResult<void> writeFrame(int fd, std::span<const uint8_t> data) {
    while (!data.empty()) {
        auto n = ::write(fd, data.data(), data.size());
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            auto code = errno;
            spdlog::debug("Pipe write failed: {}", std::strerror(code));
            return std::unexpected(code == EPIPE ? IPCError::ChannelClosed : IPCError::PipeError);
        }
        data = data.subspan(static_cast<size_t>(n));
    }
    return {};
}

}  // namespace

// ============================================================================
// PipeChannel
// ============================================================================

class PipeChannel::Impl {
public:
    ~Impl() { close(); }

    IPCResult<void> create() {
        ignoreSigpipe();
        close();
        std::array<int, 2> fds{};
        if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
            spdlog::error("pipe2 failed: {}", std::strerror(errno));
            return std::unexpected(IPCError::PipeError);
        }
        readFd_ = fds[0];
        writeFd_ = fds[1];
        return {};
    }

    void adopt(int readFd, int writeFd) {
        ignoreSigpipe();
        close();
        readFd_ = readFd;
        writeFd_ = writeFd;
    }

    IPCResult<void> send(const Message& message) {
        if (writeFd_ < 0) {
            return std::unexpected(IPCError::ChannelClosed);
        }
        auto frame = message.serialize();
        std::lock_guard<std::mutex> lock(writeMutex_);
        return writeFrame(writeFd_, frame);
    }

    IPCResult<Message> receive(std::chrono::milliseconds timeout) {
        if (readFd_ < 0) {
            return std::unexpected(IPCError::ChannelClosed);
        }
        // The caller's timeout only bounds the wait for a frame to start
        if (auto ready = awaitReadable(readFd_, Clock::now() + timeout); !ready) {
            return std::unexpected(ready.error());
        }

        // From the first byte on, the frame is finished or the stream is lost
        const auto frameDeadline = Clock::now() + kFrameCompletionTimeout;

        std::array<uint8_t, MessageHeader::SIZE> raw{};
        if (auto r = readFrame(readFd_, raw, frameDeadline); !r) {
            return std::unexpected(midFrameError(r.error(), "header"));
        }
        auto header = MessageHeader::deserialize(raw);
        if (!header) {
            return std::unexpected(header.error());
        }

        Message message;
        message.header = *header;
        message.payload.resize(header->payloadSize);
        if (auto r = readFrame(readFd_, message.payload, frameDeadline); !r) {
            return std::unexpected(midFrameError(r.error(), messageTypeName(header->type)));
        }
        return message;
    }

    void close() {
        closeFd(readFd_);
        closeFd(writeFd_);
    }

    int readFd_{-1};
    int writeFd_{-1};

private:
    std::mutex writeMutex_;
};

PipeChannel::PipeChannel() : pImpl_(std::make_unique<Impl>()) {}
PipeChannel::~PipeChannel() = default;

PipeChannel::PipeChannel(PipeChannel&& other) noexcept = default;
PipeChannel& PipeChannel::operator=(PipeChannel&& other) noexcept = default;

IPCResult<void> PipeChannel::create() { return pImpl_->create(); }

void PipeChannel::adopt(int readFd, int writeFd) { pImpl_->adopt(readFd, writeFd); }

void PipeChannel::close() { pImpl_->close(); }

bool PipeChannel::isOpen() const noexcept {
    return pImpl_->readFd_ >= 0 || pImpl_->writeFd_ >= 0;
}

IPCResult<void> PipeChannel::send(const Message& message) { return pImpl_->send(message); }

IPCResult<Message> PipeChannel::receive(std::chrono::milliseconds timeout) {
    return pImpl_->receive(timeout);
}

int PipeChannel::getReadFd() const noexcept { return pImpl_->readFd_; }

int PipeChannel::getWriteFd() const noexcept { return pImpl_->writeFd_; }

void PipeChannel::closeRead() { closeFd(pImpl_->readFd_); }

void PipeChannel::closeWrite() { closeFd(pImpl_->writeFd_); }

// ============================================================================
// BidirectionalChannel
// ============================================================================

BidirectionalChannel::BidirectionalChannel() = default;
BidirectionalChannel::~BidirectionalChannel() = default;

IPCResult<void> BidirectionalChannel::create() {
    role_ = Role::Parent;
    if (auto r = parentToChild_.create(); !r) {
        return r;
    }
    if (auto r = childToParent_.create(); !r) {
        parentToChild_.close();
        return r;
    }
    return {};
}

void BidirectionalChannel::attach(int readFd, int writeFd) {
    role_ = Role::Child;
    parentToChild_.adopt(readFd, -1);
    childToParent_.adopt(-1, writeFd);
}

void BidirectionalChannel::close() {
    parentToChild_.close();
    childToParent_.close();
}

bool BidirectionalChannel::isOpen() const noexcept {
    return parentToChild_.isOpen() && childToParent_.isOpen();
}

IPCResult<void> BidirectionalChannel::send(const Message& message) {
    const bool fromWorker = role_ == Role::Child;
    if (sentByWorker(message.header.type) != fromWorker) {
        spdlog::error("{} may not be sent by the {}", messageTypeName(message.header.type),
                      fromWorker ? "worker" : "host");
        return std::unexpected(IPCError::InvalidMessage);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return fromWorker ? childToParent_.send(message) : parentToChild_.send(message);
}

IPCResult<void> BidirectionalChannel::send(MessageType type, const json& payload) {
    auto message = Message::create(type, payload, sequenceId_.fetch_add(1));
    if (!message) {
        return std::unexpected(message.error());
    }
    return send(*message);
}

IPCResult<Message> BidirectionalChannel::receive(std::chrono::milliseconds timeout) {
    const bool atWorker = role_ == Role::Child;
    auto message = atWorker ? parentToChild_.receive(timeout) : childToParent_.receive(timeout);
    if (message && sentByWorker(message->header.type) == atWorker) {
        spdlog::error("Received {} travelling the wrong way",
                      messageTypeName(message->header.type));
        return std::unexpected(IPCError::InvalidMessage);
    }
    return message;
}

std::pair<int, int> BidirectionalChannel::getSubprocessFds() const noexcept {
    return {parentToChild_.getReadFd(), childToParent_.getWriteFd()};
}

void BidirectionalChannel::setupParent() {
    role_ = Role::Parent;
    parentToChild_.closeRead();
    childToParent_.closeWrite();
}

namespace {

/// Receives one message of the given kind and decodes its handshake payload
IPCResult<HandshakePayload> expectHandshake(BidirectionalChannel& channel, MessageType expected,
                                            std::chrono::milliseconds timeout) {
    auto message = channel.receive(timeout);
    if (!message) {
        return std::unexpected(message.error());
    }
    if (message->header.type != expected) {
        spdlog::error("Handshake: expected {}, got {}", messageTypeName(expected),
                      messageTypeName(message->header.type));
        return std::unexpected(IPCError::InvalidMessage);
    }
    return message->getPayloadAsJson().and_then(
        [](const json& j) { return HandshakePayload::fromJson(j); });
}

}  // namespace

IPCResult<HandshakePayload> BidirectionalChannel::performHandshake(
    std::chrono::milliseconds timeout) {
    HandshakePayload greeting;
    greeting.version = "1.0";
    greeting.pid = static_cast<uint32_t>(::getpid());
    greeting.capabilities = {"execute", "progress"};

    if (auto sent = send(MessageType::Handshake, greeting.toJson()); !sent) {
        return std::unexpected(sent.error());
    }
    return expectHandshake(*this, MessageType::HandshakeAck, timeout);
}

IPCResult<HandshakePayload> BidirectionalChannel::acceptHandshake(
    const HandshakePayload& reply, std::chrono::milliseconds timeout) {
    auto host = expectHandshake(*this, MessageType::Handshake, timeout);
    if (!host) {
        return host;
    }
    if (auto sent = send(MessageType::HandshakeAck, reply.toJson()); !sent) {
        return std::unexpected(sent.error());
    }
    return host;
}

}  // namespace enclave::ipc
