/*
 * setup.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Process-wide logger setup for the enclave executables

**************************************************/

#ifndef ENCLAVE_LOGGING_SETUP_HPP
#define ENCLAVE_LOGGING_SETUP_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace enclave::logging {

/**
 * @brief Build the configured sinks and install the default logger
 *
 * Sinks that fail to build are skipped with a warning. When none remain a
 * stderr sink is used. Sinks carrying their own pattern keep it; the rest
 * use the configured default pattern.
 *
 * @return The logger now returned by spdlog::default_logger()
 */
auto setupLogging(const LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace enclave::logging

#endif  // ENCLAVE_LOGGING_SETUP_HPP
