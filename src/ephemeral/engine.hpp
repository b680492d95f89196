/*
 * engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file engine.hpp
 * @brief Ephemeral JavaScript engine built on QuickJS
 * @date 2024
 * @version 1.0.0
 *
 * Each run() creates its own QuickJS runtime and context and frees both
 * before returning, so calls share no state and may run concurrently on
 * different threads. The only globals the guest sees beyond the language
 * built-ins are `console` and `input`.
 */

#ifndef ENCLAVE_EPHEMERAL_ENGINE_HPP
#define ENCLAVE_EPHEMERAL_ENGINE_HPP

#include "protocol/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace enclave::ephemeral {

/**
 * @brief Per-runtime limits
 */
struct EphemeralOptions {
    size_t memoryLimitBytes{32 * 1024 * 1024};  ///< Heap ceiling per run
    size_t maxStackBytes{1024 * 1024};          ///< 0 disables the stack check
};

class EphemeralEngine {
public:
    explicit EphemeralEngine(EphemeralOptions options = {});

    /**
     * @brief Evaluate guest code to completion or interruption
     *
     * Never throws. Interruption by the deadline yields a timeout failure;
     * any other guest error is classified from its message. Console
     * entries recorded before a failure are kept.
     *
     * @param code JavaScript source
     * @param input Value bound to the global `input`; null skips it
     * @param timeout Already clamped deadline for the run
     */
    [[nodiscard]] protocol::ExecutionResult run(const std::string& code,
                                                const nlohmann::json& input,
                                                std::chrono::milliseconds timeout) const;

    [[nodiscard]] const EphemeralOptions& options() const noexcept { return options_; }

    [[nodiscard]] static constexpr protocol::CancellationMode cancellationMode() noexcept {
        return protocol::CancellationMode::Cooperative;
    }

private:
    EphemeralOptions options_;
};

}  // namespace enclave::ephemeral

#endif  // ENCLAVE_EPHEMERAL_ENGINE_HPP
