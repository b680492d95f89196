/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging configuration types

**************************************************/

#ifndef ENCLAVE_LOGGING_TYPES_HPP
#define ENCLAVE_LOGGING_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace enclave::logging {

/**
 * @brief Where a sink writes
 */
enum class SinkKind : uint8_t {
    Stdout,
    Stderr,
    File,
    RotatingFile,
    DailyFile
};

[[nodiscard]] constexpr auto sinkKindToString(SinkKind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case SinkKind::Stdout: return "stdout";
        case SinkKind::Stderr: return "stderr";
        case SinkKind::File: return "file";
        case SinkKind::RotatingFile: return "rotating_file";
        case SinkKind::DailyFile: return "daily_file";
    }
    return "stderr";
}

/**
 * @brief Parse a sink kind; "console" and "basic_file" are accepted aliases
 */
[[nodiscard]] auto sinkKindFromString(std::string_view name)
    -> std::optional<SinkKind>;

/**
 * @brief One sink of the process logger
 */
struct SinkConfig {
    std::string name;
    SinkKind kind{SinkKind::Stderr};
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;  ///< Empty keeps the logger's pattern

    // File kinds only
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{5};
    int rotation_hour{0};
    int rotation_minute{0};

    [[nodiscard]] auto writesFile() const noexcept -> bool {
        return kind == SinkKind::File || kind == SinkKind::RotatingFile ||
               kind == SinkKind::DailyFile;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Parse a sink entry
     * @return nullopt when "type" names no known sink
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> std::optional<SinkConfig>;
};

/**
 * @brief Process logging configuration
 *
 * With no sinks configured a single stderr sink is used; stdout is left
 * to the command line front end's JSON output.
 */
struct LoggingConfig {
    std::string logger_name{"enclave"};
    spdlog::level::level_enum default_level{spdlog::level::info};
    std::string default_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    std::vector<SinkConfig> sinks;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Parse the section; sink entries of unknown type are dropped
     *        with a warning
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> LoggingConfig;
};

/**
 * @brief Convert level string to spdlog enum, info when unrecognised
 */
[[nodiscard]] auto levelFromString(std::string_view level)
    -> spdlog::level::level_enum;

[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace enclave::logging

#endif  // ENCLAVE_LOGGING_TYPES_HPP
