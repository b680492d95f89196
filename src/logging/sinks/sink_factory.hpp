/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Factory for creating spdlog sinks from configuration

**************************************************/

#ifndef ENCLAVE_LOGGING_SINKS_SINK_FACTORY_HPP
#define ENCLAVE_LOGGING_SINKS_SINK_FACTORY_HPP

#include <spdlog/spdlog.h>

#include "../types.hpp"

namespace enclave::logging {

/**
 * @brief Builds spdlog sinks from SinkConfig entries
 *
 * Console sinks are colored. File sinks create their parent directory
 * and append to existing files.
 */
class SinkFactory {
public:
    /**
     * @brief Create a sink from configuration
     * @return The sink with level and pattern applied, or nullptr when the
     *         target cannot be opened
     */
    [[nodiscard]] static auto createSink(const SinkConfig& config)
        -> spdlog::sink_ptr;

    /**
     * @brief Colored stderr sink, the fallback of every enclave process
     */
    [[nodiscard]] static auto createStderrSink(
        spdlog::level::level_enum level = spdlog::level::trace)
        -> spdlog::sink_ptr;

private:
    static auto openTarget(const SinkConfig& config) -> spdlog::sink_ptr;
};

}  // namespace enclave::logging

#endif  // ENCLAVE_LOGGING_SINKS_SINK_FACTORY_HPP
