/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace enclave::logging {

auto SinkFactory::createSink(const SinkConfig& config) -> spdlog::sink_ptr {
    if (config.writesFile()) {
        if (config.file_path.empty()) {
            spdlog::error("Log sink '{}' ({}) has no file_path", config.name,
                          sinkKindToString(config.kind));
            return nullptr;
        }
        std::error_code ec;
        auto parent = std::filesystem::path(config.file_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        if (ec) {
            spdlog::error("Cannot create log directory {}: {}", parent.string(),
                          ec.message());
            return nullptr;
        }
    }

    spdlog::sink_ptr sink;
    try {
        sink = openTarget(config);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Failed to open log sink '{}': {}", config.name, e.what());
        return nullptr;
    }

    sink->set_level(config.level);
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    }
    return sink;
}

auto SinkFactory::createStderrSink(spdlog::level::level_enum level)
    -> spdlog::sink_ptr {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_level(level);
    return sink;
}

auto SinkFactory::openTarget(const SinkConfig& config) -> spdlog::sink_ptr {
    switch (config.kind) {
        case SinkKind::Stdout:
            return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        case SinkKind::Stderr:
            return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        case SinkKind::File:
            return std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.file_path, false);
        case SinkKind::RotatingFile:
            return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files);
        case SinkKind::DailyFile:
            return std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                config.file_path, config.rotation_hour, config.rotation_minute);
    }
    return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
}

}  // namespace enclave::logging
