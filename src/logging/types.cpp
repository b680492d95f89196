/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <array>
#include <utility>

namespace enclave::logging {

namespace {

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 10>
    LEVEL_NAMES{{{"trace", spdlog::level::trace},
                 {"debug", spdlog::level::debug},
                 {"info", spdlog::level::info},
                 {"warn", spdlog::level::warn},
                 {"warning", spdlog::level::warn},
                 {"error", spdlog::level::err},
                 {"err", spdlog::level::err},
                 {"critical", spdlog::level::critical},
                 {"fatal", spdlog::level::critical},
                 {"off", spdlog::level::off}}};

}  // namespace

auto sinkKindFromString(std::string_view name) -> std::optional<SinkKind> {
    if (name == "stdout" || name == "console") return SinkKind::Stdout;
    if (name == "stderr") return SinkKind::Stderr;
    if (name == "file" || name == "basic_file") return SinkKind::File;
    if (name == "rotating_file") return SinkKind::RotatingFile;
    if (name == "daily_file") return SinkKind::DailyFile;
    return std::nullopt;
}

// ============================================================================
// SinkConfig
// ============================================================================

auto SinkConfig::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"name", name},
                        {"type", sinkKindToString(kind)},
                        {"level", levelToString(level)}};
    if (!pattern.empty()) {
        j["pattern"] = pattern;
    }

    switch (kind) {
        case SinkKind::RotatingFile:
            j["max_file_size"] = max_file_size;
            j["max_files"] = max_files;
            break;
        case SinkKind::DailyFile:
            j["rotation_hour"] = rotation_hour;
            j["rotation_minute"] = rotation_minute;
            break;
        default:
            break;
    }
    if (writesFile()) {
        j["file_path"] = file_path;
    }
    return j;
}

auto SinkConfig::fromJson(const nlohmann::json& j) -> std::optional<SinkConfig> {
    auto kind = sinkKindFromString(j.value("type", std::string{"stderr"}));
    if (!kind) {
        return std::nullopt;
    }

    SinkConfig config;
    config.kind = *kind;
    config.name = j.value("name", std::string{sinkKindToString(*kind)});
    config.level = levelFromString(j.value("level", std::string{"trace"}));
    config.pattern = j.value("pattern", "");
    config.file_path = j.value("file_path", "");
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
    config.rotation_hour = j.value("rotation_hour", 0);
    config.rotation_minute = j.value("rotation_minute", 0);
    return config;
}

// ============================================================================
// LoggingConfig
// ============================================================================

auto LoggingConfig::toJson() const -> nlohmann::json {
    auto sinks_json = nlohmann::json::array();
    for (const auto& sink : sinks) {
        sinks_json.push_back(sink.toJson());
    }
    return {{"logger_name", logger_name},
            {"default_level", levelToString(default_level)},
            {"default_pattern", default_pattern},
            {"sinks", std::move(sinks_json)}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    config.logger_name = j.value("logger_name", config.logger_name);
    config.default_level =
        levelFromString(j.value("default_level", std::string{"info"}));
    config.default_pattern = j.value("default_pattern", config.default_pattern);

    if (auto it = j.find("sinks"); it != j.end() && it->is_array()) {
        for (const auto& entry : *it) {
            if (auto sink = SinkConfig::fromJson(entry)) {
                config.sinks.push_back(std::move(*sink));
            } else {
                spdlog::warn("Ignoring log sink of unknown type '{}'",
                             entry.value("type", std::string{}));
            }
        }
    }
    return config;
}

// ============================================================================
// Levels
// ============================================================================

auto levelFromString(std::string_view level) -> spdlog::level::level_enum {
    for (const auto& [name, value] : LEVEL_NAMES) {
        if (name == level) {
            return value;
        }
    }
    return spdlog::level::info;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    auto sv = spdlog::level::to_string_view(level);
    return std::string(sv.data(), sv.size());
}

}  // namespace enclave::logging
