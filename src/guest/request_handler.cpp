/*
 * request_handler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "request_handler.hpp"
#include "python_host.hpp"
#include "traceback.hpp"
#include "virtual_fs.hpp"
#include "packages/package_installer.hpp"
#include "packages/resolver.hpp"
#include "protocol/error_classifier.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace enclave::guest {

using protocol::ErrorKind;
using protocol::ExecutionResult;
using protocol::Language;
using protocol::ProgressType;

std::vector<protocol::ConsoleEntry> consoleFromStreams(const std::string& output,
                                                       const std::string& errorOutput,
                                                       int64_t timestampMs) {
    std::vector<protocol::ConsoleEntry> entries;
    if (!output.empty()) {
        entries.push_back({protocol::ConsoleKind::Log, {output}, timestampMs});
    }
    if (!errorOutput.empty()) {
        entries.push_back({protocol::ConsoleKind::Error, {errorOutput}, timestampMs});
    }
    return entries;
}

RequestHandler::RequestHandler(PythonHost& host, VirtualFilesystem& vfs,
                               packages::PackageInstaller& installer)
    : host_(host), vfs_(vfs), installer_(installer) {}

void RequestHandler::setArgvConvention(ArgvConvention convention) {
    convention_ = std::move(convention);
}

ExecutionResult RequestHandler::handle(const protocol::ExecutionRequest& request,
                                       bool synthesizeArgv, const ProgressSink& progress) {
    auto start = std::chrono::steady_clock::now();
    auto elapsedMs = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start)
            .count();
    };
    auto report = [&progress](ProgressType type, const std::string& message) {
        if (progress) progress(type, message);
    };

    std::string notes;

    if (auto reset = vfs_.reset(); !reset) {
        auto result = ExecutionResult::failure(Language::Python, reset.error().kind,
                                               reset.error().message);
        result.executionTimeMs = elapsedMs();
        return result;
    }

    if (!request.files.empty()) {
        report(ProgressType::Loading,
               fmt::format("Mounting {} input file(s)…", request.files.size()));
        if (auto mounted = vfs_.mount(request.files); !mounted) {
            auto result = ExecutionResult::failure(Language::Python, mounted.error().kind,
                                                   mounted.error().message);
            result.executionTimeMs = elapsedMs();
            return result;
        }
    }

    std::vector<std::string> installed;
    if (!request.packages.empty()) {
        // Incompatible and invalid names are only reported in the notes
        auto installable = packages::PackageResolver::partition(request.packages).first;
        if (!installable.empty()) {
            report(ProgressType::Installing,
                   fmt::format("Installing packages: {}…", fmt::join(installable, ", ")));
        }

        auto installReport = installer_.installAll(
            request.packages, [](std::string_view message) { spdlog::debug("{}", message); });
        for (const auto& note : installReport.notes) {
            notes += note;
            notes += '\n';
        }
        installed = std::move(installReport.installed);
        host_.invalidateImportCaches();
    }

    auto argv = synthesizeArgv ? buildArgv(request.context, convention_)
                               : std::vector<std::string>{convention_.scriptName};

    report(ProgressType::Executing, "Running script…");
    auto outcome = host_.run(request.code, request.context, argv, vfs_);

    ExecutionResult result;
    result.language = Language::Python;
    result.output = std::move(outcome.output);
    result.errorOutput = notes + outcome.errorOutput;
    result.packagesInstalled = std::move(installed);

    if (outcome.exitCode) {
        result.errorOutput = cleanTraceback(result.errorOutput);
        if (*outcome.exitCode != 0) {
            result.success = false;
            result.errorKind = ErrorKind::Runtime;
            result.error = sysExitMessage(*outcome.exitCode, result.errorOutput);
        } else {
            result.success = true;
        }
    } else if (outcome.error) {
        result.success = false;
        result.errorKind = protocol::classifyError(*outcome.error);
        result.error = std::move(*outcome.error);
    } else {
        result.success = true;
        if (outcome.value) {
            result.value = nlohmann::json(std::move(*outcome.value));
        }
    }

    if (result.success) {
        result.outputFiles = vfs_.collectOutputs();
    }

    result.executionTimeMs = elapsedMs();
    result.console = consoleFromStreams(result.output, result.errorOutput, result.executionTimeMs);

    if (!request.traceId.empty()) {
        spdlog::debug("[{}] {} finished in {} ms (success={})", request.traceId,
                      request.label.empty() ? "request" : request.label,
                      result.executionTimeMs, result.success);
    }
    return result;
}

}  // namespace enclave::guest
