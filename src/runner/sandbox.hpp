/*
 * sandbox.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file sandbox.hpp
 * @brief Entry point routing requests to one runner per language
 * @date 2024
 * @version 1.0.0
 */

#ifndef ENCLAVE_RUNNER_SANDBOX_HPP
#define ENCLAVE_RUNNER_SANDBOX_HPP

#include "config/sandbox_config.hpp"
#include "runner_manager.hpp"

#include <nlohmann/json.hpp>

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace enclave::runner {

/**
 * @brief Polyglot sandbox
 *
 * Runners are created on first use and live until terminated. Progress
 * listeners registered here receive events from every runner, including
 * runners created after registration.
 */
class Sandbox {
public:
    explicit Sandbox(config::SandboxConfig config = {});
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    /**
     * @brief Route a request to the runner for its language
     */
    [[nodiscard]] std::future<protocol::ExecutionResult> execute(protocol::ExecutionRequest request);

    /**
     * @brief Parse and route a JSON request
     *
     * A request that does not parse, including one naming an unsupported
     * language, resolves immediately to a runtime failure.
     */
    [[nodiscard]] std::future<protocol::ExecutionResult> execute(const nlohmann::json& request);

    /**
     * @brief Blocking convenience wrapper around execute()
     */
    [[nodiscard]] protocol::ExecutionResult run(protocol::ExecutionRequest request);

    Unsubscribe onProgress(protocol::ProgressListener listener);

    /**
     * @brief Create the runner for a language and start its engine
     */
    [[nodiscard]] worker::Result<void> warmup(protocol::Language language);

    /**
     * @brief Terminate and drop the runner for a language, if it exists
     */
    void terminate(protocol::Language language);

    void terminateAll();

    /**
     * @brief Engine state; Idle when no runner exists yet
     */
    [[nodiscard]] protocol::EngineState state(protocol::Language language) const;

    [[nodiscard]] bool isReady(protocol::Language language) const;

    [[nodiscard]] static std::vector<protocol::Language> supportedLanguages();

    [[nodiscard]] const config::SandboxConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<RunnerManager> runnerFor(protocol::Language language);
    [[nodiscard]] RunnerOptions optionsFor(protocol::Language language) const;

    config::SandboxConfig config_;
    std::shared_ptr<ProgressHub> hub_;
    mutable std::mutex mutex_;
    std::map<protocol::Language, std::shared_ptr<RunnerManager>> runners_;
};

}  // namespace enclave::runner

#endif  // ENCLAVE_RUNNER_SANDBOX_HPP
