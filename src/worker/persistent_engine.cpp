/*
 * persistent_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "persistent_engine.hpp"
#include "config_discovery.hpp"
#include "lifecycle.hpp"
#include "process_spawning.hpp"
#include "resource_monitor.hpp"
#include "ipc/channel.hpp"
#include "ipc/message.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace enclave::worker {

using protocol::EngineState;

namespace {

constexpr std::chrono::milliseconds POLL_INTERVAL{100};

}  // namespace

class PersistentWorkerEngine::Impl {
public:
    Impl(WorkerOptions options, std::shared_ptr<EventChannel> events)
        : options_(ConfigDiscovery::resolveOptions(std::move(options))),
          events_(std::move(events)) {}

    ~Impl() {
        shutdown();
        std::error_code ec;
        std::filesystem::remove_all(options_.sandboxRoot, ec);
    }

    Result<void> initialize() {
        std::lock_guard<std::mutex> lock(mutex_);

        auto current = state_.load();
        if (current == EngineState::Ready || current == EngineState::Executing) {
            return {};
        }

        teardownLocked(false);

        if (auto valid = ConfigDiscovery::validateOptions(options_); !valid) {
            state_ = EngineState::Error;
            return valid;
        }

        state_ = EngineState::Loading;
        events_->push(LoadingEvent{"Loading Python runtime…"});

        channel_ = std::make_unique<ipc::BidirectionalChannel>();
        if (auto created = channel_->create(); !created) {
            return failLocked(RunnerError::CommunicationError,
                              ipc::ipcErrorToString(created.error()));
        }

        auto spawnResult = ProcessSpawner::spawn(options_, channel_->getSubprocessFds());
        if (!spawnResult) {
            return failLocked(spawnResult.error(), "spawn failed");
        }
        lifecycle_.attach(*spawnResult);
        channel_->setupParent();

        auto handshake = channel_->performHandshake(options_.initTimeout);
        if (!handshake) {
            return failLocked(RunnerError::HandshakeFailed,
                              ipc::ipcErrorToString(handshake.error()));
        }
        spdlog::debug("Worker {} handshake complete (protocol {})", *spawnResult,
                      handshake->version);

        auto ready = awaitReadyLocked();
        if (!ready) {
            return ready;
        }

        state_ = EngineState::Ready;
        reader_ = std::jthread([this](std::stop_token stopToken) { readerLoop(stopToken); });
        spdlog::info("Python worker {} ready", *spawnResult);
        return {};
    }

    Result<void> dispatch(const std::string& requestId,
                          const protocol::ExecutionRequest& request,
                          std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != EngineState::Ready || !channel_) {
            return std::unexpected(RunnerError::NotReady);
        }

        {
            std::lock_guard<std::mutex> requestLock(requestMutex_);
            currentRequest_ = requestId;
        }
        state_ = EngineState::Executing;

        ipc::ExecuteCommand command;
        command.requestId = requestId;
        command.request = request;
        command.timeoutMs = timeout.count();
        command.synthesizeArgv = options_.synthesizeArgv;

        auto sent = channel_->send(ipc::MessageType::Execute, command.toJson());
        if (!sent) {
            spdlog::error("Failed to send request {} to worker: {}", requestId,
                          ipc::ipcErrorToString(sent.error()));
            takeCurrentRequest();
            state_ = EngineState::Error;
            return std::unexpected(RunnerError::CommunicationError);
        }
        return {};
    }

    void terminate() {
        std::lock_guard<std::mutex> lock(mutex_);
        teardownLocked(false);
        std::error_code ec;
        std::filesystem::remove_all(options_.sandboxRoot, ec);
        state_ = EngineState::Idle;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        teardownLocked(true);
        state_ = EngineState::Idle;
    }

    EngineState state() const noexcept { return state_; }

    int processId() const { return lifecycle_.getProcessId(); }

    const WorkerOptions& options() const { return options_; }

private:
    Result<void> failLocked(RunnerError error, std::string_view detail) {
        spdlog::error("Python worker failed to start: {} ({})", runnerErrorToString(error),
                      detail);
        teardownLocked(false);
        state_ = EngineState::Error;
        return std::unexpected(error);
    }

    /// Forward Loading messages until Ready, an Error or the init timeout
    Result<void> awaitReadyLocked() {
        auto deadline = std::chrono::steady_clock::now() + options_.initTimeout;

        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return failLocked(RunnerError::Timeout, "no Ready message before init timeout");
            }

            auto msg = channel_->receive(remaining);
            if (!msg) {
                if (msg.error() == ipc::IPCError::Timeout) continue;
                return failLocked(RunnerError::ProcessCrashed,
                                  ipc::ipcErrorToString(msg.error()));
            }

            auto payload = msg->getPayloadAsJson();
            if (!payload) {
                return failLocked(RunnerError::CommunicationError,
                                  ipc::ipcErrorToString(payload.error()));
            }

            switch (msg->header.type) {
                case ipc::MessageType::Loading: {
                    auto notice = ipc::ProgressNotice::fromJson(*payload);
                    if (notice) {
                        events_->push(LoadingEvent{notice->message});
                    }
                    break;
                }
                case ipc::MessageType::Ready:
                    events_->push(ReadyEvent{payload->value("python_version", std::string{})});
                    return {};
                case ipc::MessageType::Error: {
                    auto notice = ipc::ErrorNotice::fromJson(*payload);
                    return failLocked(RunnerError::InitializationFailed,
                                      notice ? notice->message : std::string{"unknown"});
                }
                case ipc::MessageType::Log:
                    forwardLog(*payload);
                    break;
                default:
                    spdlog::warn("Unexpected {} while loading worker",
                                 ipc::messageTypeName(msg->header.type));
                    break;
            }
        }
    }

    /// Kill or stop the worker and release the channel; mutex_ must be held
    void teardownLocked(bool graceful) {
        if (reader_.joinable()) {
            reader_.request_stop();
        }
        if (graceful && channel_ && lifecycle_.isRunning()) {
            lifecycle_.shutdown(*channel_);
        } else {
            lifecycle_.kill();
        }
        if (reader_.joinable()) {
            reader_.join();
        }
        if (channel_) {
            channel_->close();
            channel_.reset();
        }
        takeCurrentRequest();
    }

    std::string takeCurrentRequest() {
        std::lock_guard<std::mutex> lock(requestMutex_);
        return std::exchange(currentRequest_, std::string{});
    }

    void readerLoop(std::stop_token stopToken) {
        while (!stopToken.stop_requested()) {
            auto msg = channel_->receive(POLL_INTERVAL);
            if (!msg) {
                if (msg.error() == ipc::IPCError::Timeout) {
                    if (auto usage = memoryOverLimit()) {
                        auto requestId = takeCurrentRequest();
                        spdlog::warn("Worker at {} MB (limit {} MB) while running {}",
                                     usage->residentBytes / (1024 * 1024),
                                     options_.maxMemoryMB, requestId);
                        state_ = EngineState::Error;
                        lifecycle_.kill();
                        events_->push(FaultEvent{requestId, protocol::ErrorKind::Runtime,
                                                 "Memory limit exceeded"});
                        return;
                    }
                    continue;
                }
                if (stopToken.stop_requested()) {
                    return;
                }
                auto requestId = takeCurrentRequest();
                spdlog::error("Worker channel failed: {}", ipc::ipcErrorToString(msg.error()));
                state_ = EngineState::Error;
                lifecycle_.kill();
                events_->push(FaultEvent{requestId, protocol::ErrorKind::Runtime,
                                         "Worker process exited unexpectedly"});
                return;
            }
            handleMessage(*msg);
        }
    }

    std::optional<MemorySample> memoryOverLimit() const {
        if (state_ != EngineState::Executing) return std::nullopt;
        if (options_.level != IsolationLevel::Sandboxed || options_.maxMemoryMB == 0) {
            return std::nullopt;
        }
        auto usage = ResourceMonitor::sample(lifecycle_.getProcessId());
        if (!usage || !usage->exceeds(options_.maxMemoryMB)) {
            return std::nullopt;
        }
        return usage;
    }

    void handleMessage(const ipc::Message& msg) {
        auto payload = msg.getPayloadAsJson();
        if (!payload) {
            spdlog::warn("Dropping undecodable {} message",
                         ipc::messageTypeName(msg.header.type));
            return;
        }

        switch (msg.header.type) {
            case ipc::MessageType::Result: {
                auto reply = ipc::ExecuteReply::fromJson(*payload);
                if (!reply) return;
                finishRequest(reply->requestId);
                events_->push(ResultEvent{reply->requestId, std::move(reply->result)});
                break;
            }
            case ipc::MessageType::Progress: {
                auto notice = ipc::ProgressNotice::fromJson(*payload);
                if (!notice) return;
                events_->push(ProgressStepEvent{notice->requestId, notice->type,
                                                std::move(notice->message)});
                break;
            }
            case ipc::MessageType::Loading: {
                auto notice = ipc::ProgressNotice::fromJson(*payload);
                if (notice) events_->push(LoadingEvent{std::move(notice->message)});
                break;
            }
            case ipc::MessageType::Error: {
                auto notice = ipc::ErrorNotice::fromJson(*payload);
                if (!notice) return;
                finishRequest(notice->requestId);
                events_->push(ResultEvent{
                    notice->requestId,
                    protocol::ExecutionResult::failure(protocol::Language::Python,
                                                       protocol::ErrorKind::Runtime,
                                                       notice->message)});
                break;
            }
            case ipc::MessageType::Log:
                forwardLog(*payload);
                break;
            case ipc::MessageType::ShutdownAck:
                spdlog::debug("Worker acknowledged shutdown");
                break;
            default:
                spdlog::warn("Unexpected {} from worker",
                             ipc::messageTypeName(msg.header.type));
                break;
        }
    }

    void finishRequest(const std::string& requestId) {
        std::lock_guard<std::mutex> lock(requestMutex_);
        if (currentRequest_ == requestId) {
            currentRequest_.clear();
            auto expected = EngineState::Executing;
            state_.compare_exchange_strong(expected, EngineState::Ready);
        }
    }

    static void forwardLog(const nlohmann::json& payload) {
        auto level = spdlog::level::from_str(payload.value("level", std::string{"info"}));
        spdlog::log(level, "[worker] {}", payload.value("message", std::string{}));
    }

    WorkerOptions options_;
    std::shared_ptr<EventChannel> events_;

    std::mutex mutex_;
    std::unique_ptr<ipc::BidirectionalChannel> channel_;
    ProcessLifecycle lifecycle_;
    std::jthread reader_;
    std::atomic<EngineState> state_{EngineState::Idle};

    std::mutex requestMutex_;
    std::string currentRequest_;
};

// ============================================================================
// PersistentWorkerEngine Implementation
// ============================================================================

PersistentWorkerEngine::PersistentWorkerEngine(WorkerOptions options,
                                               std::shared_ptr<EventChannel> events)
    : pImpl_(std::make_unique<Impl>(std::move(options), std::move(events))) {}

PersistentWorkerEngine::~PersistentWorkerEngine() = default;

PersistentWorkerEngine::PersistentWorkerEngine(PersistentWorkerEngine&&) noexcept = default;
PersistentWorkerEngine& PersistentWorkerEngine::operator=(PersistentWorkerEngine&&) noexcept =
    default;

Result<void> PersistentWorkerEngine::initialize() { return pImpl_->initialize(); }

Result<void> PersistentWorkerEngine::dispatch(const std::string& requestId,
                                              const protocol::ExecutionRequest& request,
                                              std::chrono::milliseconds timeout) {
    return pImpl_->dispatch(requestId, request, timeout);
}

void PersistentWorkerEngine::terminate() { pImpl_->terminate(); }

void PersistentWorkerEngine::shutdown() { pImpl_->shutdown(); }

protocol::EngineState PersistentWorkerEngine::state() const noexcept {
    return pImpl_->state();
}

bool PersistentWorkerEngine::isReady() const noexcept {
    return pImpl_->state() == EngineState::Ready;
}

int PersistentWorkerEngine::processId() const { return pImpl_->processId(); }

const WorkerOptions& PersistentWorkerEngine::options() const { return pImpl_->options(); }

}  // namespace enclave::worker
