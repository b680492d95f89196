/*
 * sandbox.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sandbox.hpp"

#include <spdlog/spdlog.h>

namespace enclave::runner {

Sandbox::Sandbox(config::SandboxConfig config)
    : config_(std::move(config)), hub_(std::make_shared<ProgressHub>()) {}

Sandbox::~Sandbox() { terminateAll(); }

std::future<protocol::ExecutionResult> Sandbox::execute(protocol::ExecutionRequest request) {
    return runnerFor(request.language)->execute(std::move(request));
}

std::future<protocol::ExecutionResult> Sandbox::execute(const nlohmann::json& request) {
    auto parsed = protocol::ExecutionRequest::fromJson(request);
    if (!parsed) {
        spdlog::warn("Rejected request: {}", parsed.error());
        std::promise<protocol::ExecutionResult> promise;
        promise.set_value(protocol::ExecutionResult::failure(
            protocol::Language::JavaScript, protocol::ErrorKind::Runtime, parsed.error()));
        return promise.get_future();
    }
    return execute(std::move(*parsed));
}

protocol::ExecutionResult Sandbox::run(protocol::ExecutionRequest request) {
    return execute(std::move(request)).get();
}

Unsubscribe Sandbox::onProgress(protocol::ProgressListener listener) {
    return hub_->subscribe(std::move(listener));
}

worker::Result<void> Sandbox::warmup(protocol::Language language) {
    return runnerFor(language)->warmup();
}

void Sandbox::terminate(protocol::Language language) {
    std::shared_ptr<RunnerManager> runner;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runners_.find(language);
        if (it == runners_.end()) {
            return;
        }
        runner = std::move(it->second);
        runners_.erase(it);
    }
    runner->terminate();
}

void Sandbox::terminateAll() {
    std::map<protocol::Language, std::shared_ptr<RunnerManager>> runners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runners.swap(runners_);
    }
    for (auto& [language, runner] : runners) {
        runner->terminate();
    }
}

protocol::EngineState Sandbox::state(protocol::Language language) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runners_.find(language);
    return it == runners_.end() ? protocol::EngineState::Idle : it->second->state();
}

bool Sandbox::isReady(protocol::Language language) const {
    return state(language) == protocol::EngineState::Ready;
}

std::vector<protocol::Language> Sandbox::supportedLanguages() {
    return {protocol::Language::Python, protocol::Language::JavaScript};
}

std::shared_ptr<RunnerManager> Sandbox::runnerFor(protocol::Language language) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& runner = runners_[language];
    if (!runner) {
        runner = std::make_shared<RunnerManager>(optionsFor(language));
        // Forward into the sandbox-wide hub; dropped with the runner
        std::weak_ptr<ProgressHub> hub = hub_;
        runner->onProgress([hub](const protocol::ProgressEvent& event) {
            if (auto target = hub.lock()) {
                target->publish(event);
            }
        });
        spdlog::info("Created {} runner", protocol::languageToString(language));
    }
    return runner;
}

RunnerOptions Sandbox::optionsFor(protocol::Language language) const {
    RunnerOptions options;
    options.language = language;
    options.timeouts = config_.limits.policyFor(language);
    options.javascript = config_.javascript.toEngineOptions();
    options.python = config_.python.toWorkerOptions();
    return options;
}

}  // namespace enclave::runner
