/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file app.cpp
 * @brief enclave command line tool
 *
 * Reads one JSON execution request, runs it in the sandbox and prints the
 * JSON result on stdout. Logs and progress go to stderr.
 *
 * Exit status: 0 when the execution succeeded, 1 when it failed, 2 when
 * the request or configuration could not be read.
 */

#include "config/sandbox_config.hpp"
#include "logging/setup.hpp"
#include "protocol/types.hpp"
#include "runner/sandbox.hpp"

#include <gflags/gflags.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

DEFINE_string(request, "-", "JSON request file, or - to read stdin.");
DEFINE_string(config, "", "JSON configuration file.");
DEFINE_string(log_level, "", "Overrides the configured log level.");
DEFINE_bool(pretty, false, "Indent the printed result.");

using namespace enclave;

namespace {

std::string readRequestText(const std::string& source) {
    if (source == "-") {
        return {std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    }
    std::ifstream file(source);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open request file: " + source);
    }
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

}  // namespace

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("enclave --request <file|-> [--config <file>]");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    config::SandboxConfig sandboxConfig;
    if (!FLAGS_config.empty()) {
        auto loaded = config::loadConfig(FLAGS_config);
        if (!loaded) {
            logging::setupLogging({});
            spdlog::critical("{}", loaded.error());
            return 2;
        }
        sandboxConfig = std::move(*loaded);
    }
    if (!FLAGS_log_level.empty()) {
        sandboxConfig.logging.default_level = logging::levelFromString(FLAGS_log_level);
    }
    logging::setupLogging(sandboxConfig.logging);

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(readRequestText(FLAGS_request));
    } catch (const nlohmann::json::exception& e) {
        spdlog::critical("Request is not valid JSON: {}", e.what());
        return 2;
    } catch (const std::runtime_error& e) {
        spdlog::critical("{}", e.what());
        return 2;
    }

    runner::Sandbox sandbox(std::move(sandboxConfig));
    sandbox.onProgress([](const protocol::ProgressEvent& event) {
        spdlog::info("[{}] {}: {}", event.requestId.empty() ? "-" : event.requestId,
                     protocol::progressTypeToString(event.type), event.message);
    });

    auto result = sandbox.execute(request).get();
    std::cout << result.toJson().dump(FLAGS_pretty ? 2 : -1, ' ', false,
                                      nlohmann::json::error_handler_t::replace)
              << std::endl;

    sandbox.terminateAll();
    spdlog::default_logger()->flush();
    gflags::ShutDownCommandLineFlags();
    return result.success ? 0 : 1;
}
