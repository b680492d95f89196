/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"
#include "result_formatter.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>

namespace enclave::protocol {

namespace {

// JSON numbers may be fractional or far outside int64; both saturate so
// clampTimeout sees the intended end of the range
std::optional<int64_t> millisFromJson(const json& value) {
    using Limits = std::numeric_limits<int64_t>;
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        return v > static_cast<uint64_t>(Limits::max()) ? Limits::max()
                                                        : static_cast<int64_t>(v);
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    auto v = value.get<double>();
    if (std::isnan(v)) {
        return std::nullopt;
    }
    // 2^63 is exactly representable; anything at or past it saturates
    if (v >= 9223372036854775808.0) return Limits::max();
    if (v <= -9223372036854775808.0) return Limits::min();
    return static_cast<int64_t>(v);
}

}  // namespace

std::optional<Language> languageFromString(std::string_view name) {
    if (name == "javascript" || name == "js") return Language::JavaScript;
    if (name == "python" || name == "py") return Language::Python;
    return std::nullopt;
}

std::optional<ErrorKind> errorKindFromString(std::string_view name) {
    if (name == "syntax") return ErrorKind::Syntax;
    if (name == "runtime") return ErrorKind::Runtime;
    if (name == "timeout") return ErrorKind::Timeout;
    if (name == "security") return ErrorKind::Security;
    return std::nullopt;
}

std::optional<ConsoleKind> consoleKindFromString(std::string_view name) {
    if (name == "log") return ConsoleKind::Log;
    if (name == "warn") return ConsoleKind::Warn;
    if (name == "error") return ConsoleKind::Error;
    if (name == "info") return ConsoleKind::Info;
    if (name == "debug") return ConsoleKind::Debug;
    return std::nullopt;
}

std::optional<ProgressType> progressTypeFromString(std::string_view name) {
    if (name == "loading") return ProgressType::Loading;
    if (name == "installing") return ProgressType::Installing;
    if (name == "executing") return ProgressType::Executing;
    if (name == "complete") return ProgressType::Complete;
    return std::nullopt;
}

// ============================================================================
// Files and console entries
// ============================================================================

json SandboxFile::toJson() const {
    return {
        {"path", path},
        {"content", content},
        {"encoding", fileEncodingToString(encoding)}
    };
}

std::expected<SandboxFile, std::string> SandboxFile::fromJson(const json& j) {
    if (!j.is_object()) {
        return std::unexpected("file entry must be an object");
    }
    SandboxFile file;
    try {
        file.path = j.at("path").get<std::string>();
        file.content = j.value("content", std::string{});
        auto encoding = j.value("encoding", std::string{"text"});
        if (encoding == "base64") {
            file.encoding = FileEncoding::Base64;
        } else if (encoding != "text") {
            return std::unexpected("unknown file encoding \"" + encoding + "\"");
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid file entry: ") + e.what());
    }
    if (file.path.empty()) {
        return std::unexpected("file entry has an empty path");
    }
    return file;
}

json OutputFile::toJson() const {
    return {
        {"path", path},
        {"content", content},
        {"encoding", fileEncodingToString(encoding)},
        {"mimeType", mimeType}
    };
}

OutputFile OutputFile::fromJson(const json& j) {
    OutputFile file;
    file.path = j.value("path", std::string{});
    file.content = j.value("content", std::string{});
    file.encoding = j.value("encoding", std::string{"text"}) == "base64"
                        ? FileEncoding::Base64
                        : FileEncoding::Text;
    file.mimeType = j.value("mimeType", std::string{"application/octet-stream"});
    return file;
}

json ConsoleEntry::toJson() const {
    return {
        {"type", consoleKindToString(kind)},
        {"args", args},
        {"timestamp", timestampMs}
    };
}

ConsoleEntry ConsoleEntry::fromJson(const json& j) {
    ConsoleEntry entry;
    entry.kind = consoleKindFromString(j.value("type", std::string{"log"}))
                     .value_or(ConsoleKind::Log);
    if (j.contains("args") && j["args"].is_array()) {
        entry.args = j["args"].get<std::vector<std::string>>();
    }
    entry.timestampMs = j.value("timestamp", int64_t{0});
    return entry;
}

// ============================================================================
// ExecutionRequest
// ============================================================================

json ExecutionRequest::toJson() const {
    json files_json = json::array();
    for (const auto& file : files) {
        files_json.push_back(file.toJson());
    }
    json j = {
        {"language", languageToString(language)},
        {"code", code},
        {"context", context},
        {"packages", packages},
        {"files", files_json}
    };
    if (timeoutMs) j["timeout"] = *timeoutMs;
    if (!traceId.empty()) j["traceId"] = traceId;
    if (!label.empty()) j["label"] = label;
    return j;
}

std::expected<ExecutionRequest, std::string> ExecutionRequest::fromJson(const json& j) {
    if (!j.is_object()) {
        return std::unexpected("request must be a JSON object");
    }

    ExecutionRequest request;
    try {
        auto language = j.value("language", std::string{"javascript"});
        auto parsed = languageFromString(language);
        if (!parsed) {
            return std::unexpected("Unsupported language: \"" + language +
                                   "\". Supported: python, javascript");
        }
        request.language = *parsed;
        request.code = j.at("code").get<std::string>();

        // "input" is accepted as an alias of "context"
        const char* contextKey = j.contains("context") ? "context" : "input";
        if (j.contains(contextKey) && !j[contextKey].is_null()) {
            if (!j[contextKey].is_object()) {
                return std::unexpected(std::string(contextKey) + " must be an object");
            }
            request.context = j[contextKey];
        }

        if (j.contains("packages") && j["packages"].is_array()) {
            request.packages = j["packages"].get<std::vector<std::string>>();
        }

        if (j.contains("files") && j["files"].is_array()) {
            for (const auto& item : j["files"]) {
                auto file = SandboxFile::fromJson(item);
                if (!file) {
                    return std::unexpected(file.error());
                }
                request.files.push_back(std::move(*file));
            }
        }

        if (j.contains("timeout") && j["timeout"].is_number()) {
            request.timeoutMs = millisFromJson(j["timeout"]);
        }
        request.traceId = j.value("traceId", std::string{});
        request.label = j.value("label", std::string{});
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse ExecutionRequest: {}", e.what());
        return std::unexpected(std::string("invalid request: ") + e.what());
    }
    return request;
}

// ============================================================================
// ExecutionResult
// ============================================================================

ExecutionResult ExecutionResult::failure(Language language, ErrorKind kind,
                                         std::string message) {
    ExecutionResult result;
    result.success = false;
    result.language = language;
    result.errorKind = kind;
    result.error = std::move(message);
    return result;
}

json ExecutionResult::toJson() const {
    json console_json = json::array();
    for (const auto& entry : console) {
        console_json.push_back(entry.toJson());
    }

    json j = {
        {"success", success},
        {"language", languageToString(language)},
        {"stdout", output},
        {"stderr", errorOutput},
        {"console", console_json},
        {"executionTimeMs", executionTimeMs}
    };

    if (value) {
        j["value"] = *value;
        j["result"] = formatResult(value);
    }
    if (!outputFiles.empty()) {
        json files_json = json::array();
        for (const auto& file : outputFiles) {
            files_json.push_back(file.toJson());
        }
        j["outputFiles"] = std::move(files_json);
    }
    if (!packagesInstalled.empty()) {
        j["packagesInstalled"] = packagesInstalled;
    }
    if (!success) {
        j["error"] = error;
        j["errorType"] = errorKindToString(errorKind.value_or(ErrorKind::Runtime));
    }
    return j;
}

std::expected<ExecutionResult, std::string> ExecutionResult::fromJson(const json& j) {
    try {
        ExecutionResult result;
        result.success = j.at("success").get<bool>();
        result.language = languageFromString(j.value("language", std::string{"javascript"}))
                              .value_or(Language::JavaScript);
        if (j.contains("value")) result.value = j["value"];
        result.output = j.value("stdout", std::string{});
        result.errorOutput = j.value("stderr", std::string{});
        if (j.contains("console") && j["console"].is_array()) {
            for (const auto& entry : j["console"]) {
                result.console.push_back(ConsoleEntry::fromJson(entry));
            }
        }
        if (j.contains("outputFiles") && j["outputFiles"].is_array()) {
            for (const auto& file : j["outputFiles"]) {
                result.outputFiles.push_back(OutputFile::fromJson(file));
            }
        }
        if (j.contains("packagesInstalled") && j["packagesInstalled"].is_array()) {
            result.packagesInstalled =
                j["packagesInstalled"].get<std::vector<std::string>>();
        }
        result.executionTimeMs = j.value("executionTimeMs", int64_t{0});
        if (!result.success) {
            result.error = j.value("error", std::string{"Unknown error"});
            result.errorKind = errorKindFromString(j.value("errorType", std::string{}))
                                   .value_or(ErrorKind::Runtime);
        }
        return result;
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse ExecutionResult: {}", e.what());
        return std::unexpected(std::string("invalid result: ") + e.what());
    }
}

}  // namespace enclave::protocol
