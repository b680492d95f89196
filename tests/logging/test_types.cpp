/*
 * test_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for logging configuration types

**************************************************/

#include <gtest/gtest.h>

#include "logging/types.hpp"

#include <string>

using namespace enclave::logging;

// ============================================================================
// Level Conversion Tests
// ============================================================================

TEST(LevelConversionTest, FromString) {
    EXPECT_EQ(levelFromString("trace"), spdlog::level::trace);
    EXPECT_EQ(levelFromString("debug"), spdlog::level::debug);
    EXPECT_EQ(levelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(levelFromString("err"), spdlog::level::err);
    EXPECT_EQ(levelFromString("fatal"), spdlog::level::critical);
    EXPECT_EQ(levelFromString("off"), spdlog::level::off);
}

TEST(LevelConversionTest, UnknownDefaultsToInfo) {
    EXPECT_EQ(levelFromString("loud"), spdlog::level::info);
    EXPECT_EQ(levelFromString(""), spdlog::level::info);
}

TEST(LevelConversionTest, ToString) {
    EXPECT_EQ(levelToString(spdlog::level::warn), "warning");
    EXPECT_EQ(levelToString(spdlog::level::err), "error");
    EXPECT_EQ(levelFromString(levelToString(spdlog::level::critical)),
              spdlog::level::critical);
}

// ============================================================================
// SinkKind Tests
// ============================================================================

TEST(SinkKindTest, NamesAndAliases) {
    EXPECT_EQ(sinkKindToString(SinkKind::RotatingFile), "rotating_file");
    EXPECT_EQ(sinkKindFromString("console"), SinkKind::Stdout);
    EXPECT_EQ(sinkKindFromString("basic_file"), SinkKind::File);
    EXPECT_EQ(sinkKindFromString("daily_file"), SinkKind::DailyFile);
    EXPECT_FALSE(sinkKindFromString("syslog").has_value());
}

// ============================================================================
// SinkConfig Tests
// ============================================================================

TEST(SinkConfigTest, DefaultsToStderr) {
    auto config = SinkConfig::fromJson(nlohmann::json::object());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->kind, SinkKind::Stderr);
    EXPECT_EQ(config->name, "stderr");
    EXPECT_EQ(config->level, spdlog::level::trace);
    EXPECT_FALSE(config->writesFile());
}

TEST(SinkConfigTest, UnknownTypeRejected) {
    EXPECT_FALSE(SinkConfig::fromJson({{"type", "syslog"}}).has_value());
}

TEST(SinkConfigTest, FileFieldsOnlyForFileSinks) {
    SinkConfig stderr_sink;
    EXPECT_FALSE(stderr_sink.toJson().contains("file_path"));

    SinkConfig rotating;
    rotating.kind = SinkKind::RotatingFile;
    rotating.file_path = "logs/enclave.log";
    rotating.max_files = 3;
    auto j = rotating.toJson();
    EXPECT_EQ(j["type"], "rotating_file");
    EXPECT_EQ(j["file_path"], "logs/enclave.log");
    EXPECT_EQ(j["max_files"], 3);
    EXPECT_FALSE(j.contains("rotation_hour"));
}

TEST(SinkConfigTest, DailyFileFromJson) {
    auto parsed = SinkConfig::fromJson(nlohmann::json::parse(R"({
        "name": "daily", "type": "daily_file", "level": "warn",
        "file_path": "logs/daily.log", "rotation_hour": 4, "rotation_minute": 30
    })"));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->name, "daily");
    EXPECT_EQ(parsed->level, spdlog::level::warn);
    EXPECT_TRUE(parsed->writesFile());
    EXPECT_EQ(parsed->rotation_hour, 4);
    EXPECT_EQ(parsed->rotation_minute, 30);
}

// ============================================================================
// LoggingConfig Tests
// ============================================================================

TEST(LoggingConfigTest, Defaults) {
    LoggingConfig config;
    EXPECT_EQ(config.logger_name, "enclave");
    EXPECT_EQ(config.default_level, spdlog::level::info);
    EXPECT_TRUE(config.sinks.empty());
}

TEST(LoggingConfigTest, ParsesSinks) {
    auto j = nlohmann::json::parse(R"({
        "logger_name": "svc",
        "default_level": "debug",
        "sinks": [{"type": "stderr"}, {"type": "carrier_pigeon"},
                  {"type": "file", "file_path": "a.log"}]
    })");
    auto config = LoggingConfig::fromJson(j);
    EXPECT_EQ(config.logger_name, "svc");
    EXPECT_EQ(config.default_level, spdlog::level::debug);
    ASSERT_EQ(config.sinks.size(), 2u);
    EXPECT_EQ(config.sinks[1].kind, SinkKind::File);
    EXPECT_EQ(config.sinks[1].file_path, "a.log");
}
