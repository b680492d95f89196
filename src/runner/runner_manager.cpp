/*
 * runner_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "runner_manager.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <stop_token>
#include <system_error>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace enclave::runner {

namespace {

using Clock = std::chrono::steady_clock;
using protocol::ErrorKind;
using protocol::ExecutionResult;
using protocol::Language;
using protocol::ProgressType;

constexpr auto kEventPollInterval = std::chrono::milliseconds{100};
constexpr std::string_view kTerminatedMessage = "Sandbox was terminated";

Engine makeEngine(const RunnerOptions& options, std::shared_ptr<worker::EventChannel> events) {
    if (options.language == Language::Python) {
        return Engine{std::in_place_type<worker::PersistentWorkerEngine>, options.python,
                      std::move(events)};
    }
    return Engine{std::in_place_type<ephemeral::EphemeralEngine>, options.javascript};
}

std::future<ExecutionResult> readyFuture(ExecutionResult result) {
    std::promise<ExecutionResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

int64_t elapsedMs(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

}  // namespace

std::string generateRequestId() {
    static constexpr std::string_view DIGITS = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, DIGITS.size() - 1);

    std::string suffix(9, '0');
    for (auto& c : suffix) {
        c = DIGITS[pick(generator)];
    }

    auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
    return fmt::format("exec_{}_{}", epochMs, suffix);
}

// ============================================================================
// RunnerManager::Impl
// ============================================================================

class RunnerManager::Impl {
public:
    explicit Impl(RunnerOptions options)
        : options_(std::move(options)),
          hub_(std::make_shared<ProgressHub>()),
          events_(std::make_shared<worker::EventChannel>()),
          engine_(makeEngine(options_, events_)) {
        if (isPython()) {
            dispatcher_ = std::jthread([this](std::stop_token st) { dispatchLoop(st); });
            executor_ = std::jthread([this](std::stop_token st) { executorLoop(st); });
        }
        spdlog::debug("Runner for {} created ({} cancellation)",
                      protocol::languageToString(options_.language),
                      protocol::cancellationModeToString(cancellationMode()));
    }

    ~Impl() {
        if (isPython()) {
            executor_.request_stop();
            if (executor_.joinable()) executor_.join();

            failOutstanding();
            std::get<worker::PersistentWorkerEngine>(engine_).shutdown();

            events_->close();
            dispatcher_.request_stop();
            if (dispatcher_.joinable()) dispatcher_.join();
        }
    }

    std::future<ExecutionResult> execute(protocol::ExecutionRequest request) {
        auto id = generateRequestId();
        spdlog::info("Request {} accepted ({}, trace={}, label={})", id,
                     protocol::languageToString(options_.language),
                     request.traceId.empty() ? "-" : request.traceId,
                     request.label.empty() ? "-" : request.label);

        if (isPython()) {
            return enqueue(std::move(id), std::move(request));
        }
        return runJavaScript(std::move(id), std::move(request));
    }

    Unsubscribe onProgress(protocol::ProgressListener listener) {
        return hub_->subscribe(std::move(listener));
    }

    worker::Result<void> warmup() {
        if (!isPython()) {
            return {};
        }
        return std::get<worker::PersistentWorkerEngine>(engine_).initialize();
    }

    void terminate() {
        if (!isPython()) {
            // Running interpreters stop at their own deadline
            spdlog::debug("terminate() on the JavaScript runner: {} call(s) left to finish",
                          jsInFlight_->load());
            return;
        }
        auto count = failOutstanding();
        std::get<worker::PersistentWorkerEngine>(engine_).terminate();
        spdlog::info("Python sandbox terminated, {} call(s) failed", count);
    }

    protocol::EngineState state() const {
        if (!isPython()) {
            return protocol::EngineState::Ready;
        }
        return std::get<worker::PersistentWorkerEngine>(engine_).state();
    }

    bool isReady() const {
        return state() == protocol::EngineState::Ready;
    }

    protocol::CancellationMode cancellationMode() const noexcept {
        return std::visit(
            [](const auto& engine) {
                return std::decay_t<decltype(engine)>::cancellationMode();
            },
            engine_);
    }

    Language language() const noexcept { return options_.language; }

    size_t pendingCount() const {
        if (!isPython()) {
            return jsInFlight_->load();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size() + pending_.size();
    }

private:
    struct QueuedCall {
        std::string id;
        protocol::ExecutionRequest request;
        std::promise<ExecutionResult> promise;
    };

    bool isPython() const noexcept { return options_.language == Language::Python; }

    void publish(ProgressType type, std::string message, const std::string& requestId) const {
        hub_->publish({type, std::move(message), options_.language, requestId});
    }

    // ------------------------------------------------------------------------
    // JavaScript: one thread and interpreter per call
    // ------------------------------------------------------------------------

    std::future<ExecutionResult> runJavaScript(std::string id, protocol::ExecutionRequest request) {
        if (!request.packages.empty() || !request.files.empty()) {
            spdlog::debug("Request {}: packages and files are ignored for JavaScript", id);
        }

        auto timeout = protocol::clampTimeout(request.timeoutMs, options_.timeouts);
        auto engine = std::get<ephemeral::EphemeralEngine>(engine_);

        // Shared state only: the call may outlive the manager
        auto hub = hub_;
        auto inFlight = jsInFlight_;
        inFlight->fetch_add(1);

        std::promise<ExecutionResult> promise;
        auto future = promise.get_future();
        try {
            // Detached: a caller that drops the future must not wait for the run
            std::thread([engine, hub, inFlight, timeout, id = std::move(id),
                         request = std::move(request), promise = std::move(promise)]() mutable {
                hub->publish({ProgressType::Executing, "Running script…",
                              Language::JavaScript, id});
                auto result = engine.run(request.code, request.context, timeout);
                spdlog::debug("Request {} finished in {}ms ({})", id, result.executionTimeMs,
                              result.success ? "ok" : result.error);
                if (result.success) {
                    hub->publish({ProgressType::Complete, "Execution complete",
                                  Language::JavaScript, id});
                }
                inFlight->fetch_sub(1);
                promise.set_value(std::move(result));
            }).detach();
        } catch (const std::system_error& e) {
            inFlight->fetch_sub(1);
            spdlog::error("Cannot start JavaScript execution thread: {}", e.what());
            return readyFuture(ExecutionResult::failure(
                Language::JavaScript, ErrorKind::Runtime,
                fmt::format("Failed to start execution: {}", e.what())));
        }
        return future;
    }

    // ------------------------------------------------------------------------
    // Python: queued calls on the shared worker
    // ------------------------------------------------------------------------

    std::future<ExecutionResult> enqueue(std::string id, protocol::ExecutionRequest request) {
        std::promise<ExecutionResult> promise;
        auto future = promise.get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back({std::move(id), std::move(request), std::move(promise)});
        }
        cv_.notify_all();
        return future;
    }

    void executorLoop(std::stop_token st) {
        while (!st.stop_requested()) {
            QueuedCall call;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (!cv_.wait(lock, st, [this] { return !queue_.empty(); })) {
                    return;
                }
                call = std::move(queue_.front());
                queue_.pop_front();
                current_ = call.id;
            }

            runPython(std::move(call), st);

            std::lock_guard<std::mutex> lock(mutex_);
            current_.clear();
        }
    }

    void runPython(QueuedCall call, std::stop_token st) {
        auto& engine = std::get<worker::PersistentWorkerEngine>(engine_);
        auto timeout = protocol::clampTimeout(call.request.timeoutMs, options_.timeouts);

        auto ready = engine.initialize();
        if (!ready) {
            spdlog::error("Request {}: Python runtime unavailable: {}", call.id,
                          worker::runnerErrorToString(ready.error()));
            call.promise.set_value(ExecutionResult::failure(
                Language::Python, ErrorKind::Runtime,
                fmt::format("Failed to start the Python runtime: {}",
                            worker::runnerErrorToString(ready.error()))));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.emplace(call.id, std::move(call.promise));
        }

        auto sent = engine.dispatch(call.id, call.request, timeout);
        if (!sent) {
            if (auto promise = takePending(call.id)) {
                promise->set_value(ExecutionResult::failure(
                    Language::Python, ErrorKind::Runtime,
                    fmt::format("Failed to send the request to the Python worker: {}",
                                worker::runnerErrorToString(sent.error()))));
            }
            return;
        }

        const auto dispatched = Clock::now();
        bool settled;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            settled = cv_.wait_until(lock, st, dispatched + timeout,
                                     [this, &call] { return !pending_.contains(call.id); });
        }
        if (settled || st.stop_requested()) {
            return;
        }

        auto promise = takePending(call.id);
        if (!promise) {
            return;
        }
        spdlog::warn("Request {} exceeded {}ms, killing the Python worker", call.id,
                     timeout.count());
        engine.terminate();

        auto result = ExecutionResult::failure(
            Language::Python, ErrorKind::Timeout,
            fmt::format("Execution timed out after {}ms", timeout.count()));
        result.executionTimeMs = elapsedMs(dispatched);
        promise->set_value(std::move(result));
    }

    std::optional<std::promise<ExecutionResult>> takePending(const std::string& id) {
        std::optional<std::promise<ExecutionResult>> promise;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id);
            if (it == pending_.end()) {
                return std::nullopt;
            }
            promise = std::move(it->second);
            pending_.erase(it);
        }
        cv_.notify_all();
        return promise;
    }

    size_t failOutstanding() {
        std::vector<std::promise<ExecutionResult>> orphans;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& call : queue_) {
                orphans.push_back(std::move(call.promise));
            }
            queue_.clear();
            for (auto& [id, promise] : pending_) {
                orphans.push_back(std::move(promise));
            }
            pending_.clear();
        }
        cv_.notify_all();

        for (auto& promise : orphans) {
            promise.set_value(ExecutionResult::failure(Language::Python, ErrorKind::Runtime,
                                                       std::string(kTerminatedMessage)));
        }
        return orphans.size();
    }

    // ------------------------------------------------------------------------
    // Worker events
    // ------------------------------------------------------------------------

    void dispatchLoop(std::stop_token st) {
        while (!st.stop_requested()) {
            auto event = events_->pop(kEventPollInterval);
            if (!event) {
                if (events_->isClosed()) return;
                continue;
            }
            std::visit([this](auto& e) { handleEvent(e); }, *event);
        }
    }

    void handleEvent(worker::ReadyEvent& e) {
        spdlog::info("Python runtime ready (Python {})", e.pythonVersion);
        publish(ProgressType::Loading, "Python runtime ready", currentRequest());
    }

    void handleEvent(worker::LoadingEvent& e) {
        publish(ProgressType::Loading, std::move(e.message), currentRequest());
    }

    void handleEvent(worker::ProgressStepEvent& e) {
        publish(e.type, std::move(e.message), e.requestId);
    }

    void handleEvent(worker::ResultEvent& e) {
        auto promise = takePending(e.requestId);
        if (!promise) {
            spdlog::debug("Dropping result for unknown request {}", e.requestId);
            return;
        }
        spdlog::debug("Request {} finished in {}ms ({})", e.requestId, e.result.executionTimeMs,
                      e.result.success ? "ok" : e.result.error);
        if (e.result.success) {
            publish(ProgressType::Complete, "Execution complete", e.requestId);
        }
        promise->set_value(std::move(e.result));
    }

    void handleEvent(worker::FaultEvent& e) {
        if (e.requestId.empty()) {
            spdlog::warn("Python worker fault while idle: {}", e.message);
            return;
        }
        auto promise = takePending(e.requestId);
        if (!promise) {
            spdlog::debug("Fault for unknown request {}: {}", e.requestId, e.message);
            return;
        }
        spdlog::error("Request {} failed: {}", e.requestId, e.message);
        promise->set_value(ExecutionResult::failure(Language::Python, e.kind, e.message));
    }

    std::string currentRequest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    RunnerOptions options_;
    std::shared_ptr<ProgressHub> hub_;
    std::shared_ptr<worker::EventChannel> events_;
    Engine engine_;
    std::shared_ptr<std::atomic<size_t>> jsInFlight_{std::make_shared<std::atomic<size_t>>(0)};

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<QueuedCall> queue_;
    std::unordered_map<std::string, std::promise<ExecutionResult>> pending_;
    std::string current_;

    std::jthread dispatcher_;
    std::jthread executor_;
};

// ============================================================================
// RunnerManager
// ============================================================================

RunnerManager::RunnerManager(RunnerOptions options)
    : pImpl_(std::make_unique<Impl>(std::move(options))) {}

RunnerManager::~RunnerManager() = default;

std::future<ExecutionResult> RunnerManager::execute(protocol::ExecutionRequest request) {
    return pImpl_->execute(std::move(request));
}

Unsubscribe RunnerManager::onProgress(protocol::ProgressListener listener) {
    return pImpl_->onProgress(std::move(listener));
}

worker::Result<void> RunnerManager::warmup() { return pImpl_->warmup(); }

void RunnerManager::terminate() { pImpl_->terminate(); }

protocol::EngineState RunnerManager::state() const { return pImpl_->state(); }

bool RunnerManager::isReady() const { return pImpl_->isReady(); }

protocol::CancellationMode RunnerManager::cancellationMode() const noexcept {
    return pImpl_->cancellationMode();
}

Language RunnerManager::language() const noexcept { return pImpl_->language(); }

size_t RunnerManager::pendingCount() const { return pImpl_->pendingCount(); }

}  // namespace enclave::runner
