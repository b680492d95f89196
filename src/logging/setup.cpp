/*
 * setup.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "setup.hpp"

#include <vector>

#include <spdlog/sinks/sink.h>

#include "sinks/sink_factory.hpp"

namespace enclave::logging {

auto setupLogging(const LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sink_list;
    std::vector<std::pair<spdlog::sink_ptr, std::string>> own_patterns;

    for (const auto& sink_config : config.sinks) {
        auto sink = SinkFactory::createSink(sink_config);
        if (!sink) {
            continue;
        }
        sink_list.push_back(sink);
        if (!sink_config.pattern.empty()) {
            own_patterns.emplace_back(sink, sink_config.pattern);
        }
    }

    if (sink_list.empty()) {
        sink_list.push_back(SinkFactory::createStderrSink());
    }

    auto logger = std::make_shared<spdlog::logger>(
        config.logger_name, sink_list.begin(), sink_list.end());
    logger->set_level(config.default_level);
    logger->set_pattern(config.default_pattern);
    for (const auto& [sink, pattern] : own_patterns) {
        sink->set_pattern(pattern);
    }
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    return logger;
}

}  // namespace enclave::logging
