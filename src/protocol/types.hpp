/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Execution request/result contracts shared by both engines
 * @date 2024
 * @version 1.0.0
 *
 * These structures cross every boundary in the sandbox: the caller hands an
 * ExecutionRequest to the Sandbox, the worker process receives it over IPC,
 * and an ExecutionResult travels the same way back.
 */

#ifndef ENCLAVE_PROTOCOL_TYPES_HPP
#define ENCLAVE_PROTOCOL_TYPES_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace enclave::protocol {

using json = nlohmann::json;

/**
 * @brief Guest languages understood by the sandbox
 */
enum class Language {
    JavaScript,  ///< ECMAScript, run by the ephemeral QuickJS engine
    Python       ///< Python, run by the persistent worker engine
};

/**
 * @brief Get wire name of a Language
 */
[[nodiscard]] constexpr std::string_view languageToString(Language language) noexcept {
    switch (language) {
        case Language::JavaScript: return "javascript";
        case Language::Python: return "python";
    }
    return "javascript";
}

/**
 * @brief Parse a wire name into a Language
 */
[[nodiscard]] std::optional<Language> languageFromString(std::string_view name);

/**
 * @brief Error taxonomy, stable across guest languages
 */
enum class ErrorKind {
    Syntax,    ///< Code failed to parse
    Runtime,   ///< Guest exception, injection or mount failure
    Timeout,   ///< Deadline exceeded
    Security   ///< Guest attempted a disallowed operation
};

[[nodiscard]] constexpr std::string_view errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Syntax: return "syntax";
        case ErrorKind::Runtime: return "runtime";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Security: return "security";
    }
    return "runtime";
}

[[nodiscard]] std::optional<ErrorKind> errorKindFromString(std::string_view name);

/**
 * @brief Console method that produced an entry
 */
enum class ConsoleKind { Log, Warn, Error, Info, Debug };

[[nodiscard]] constexpr std::string_view consoleKindToString(ConsoleKind kind) noexcept {
    switch (kind) {
        case ConsoleKind::Log: return "log";
        case ConsoleKind::Warn: return "warn";
        case ConsoleKind::Error: return "error";
        case ConsoleKind::Info: return "info";
        case ConsoleKind::Debug: return "debug";
    }
    return "log";
}

[[nodiscard]] std::optional<ConsoleKind> consoleKindFromString(std::string_view name);

/**
 * @brief Content encoding of a mounted or produced file
 */
enum class FileEncoding { Text, Base64 };

[[nodiscard]] constexpr std::string_view fileEncodingToString(FileEncoding encoding) noexcept {
    return encoding == FileEncoding::Base64 ? "base64" : "text";
}

/**
 * @brief Lifecycle state of an engine
 */
enum class EngineState {
    Idle,       ///< Nothing loaded
    Loading,    ///< Runtime is starting
    Ready,      ///< Runtime loaded and waiting for work
    Executing,  ///< A request is running
    Error       ///< Initialization failed or the runtime died
};

[[nodiscard]] constexpr std::string_view engineStateToString(EngineState state) noexcept {
    switch (state) {
        case EngineState::Idle: return "idle";
        case EngineState::Loading: return "loading";
        case EngineState::Ready: return "ready";
        case EngineState::Executing: return "executing";
        case EngineState::Error: return "error";
    }
    return "idle";
}

/**
 * @brief How an engine stops a running guest
 */
enum class CancellationMode {
    Cooperative,  ///< Interpreter polls a deadline between instructions
    Destructive   ///< The execution unit is killed
};

[[nodiscard]] constexpr std::string_view cancellationModeToString(CancellationMode mode) noexcept {
    return mode == CancellationMode::Cooperative ? "cooperative" : "destructive";
}

/**
 * @brief A file mounted into the virtual filesystem
 */
struct SandboxFile {
    std::string path;                          ///< "data.csv" mounts at /input/data.csv
    std::string content;                       ///< Text or base64 payload
    FileEncoding encoding{FileEncoding::Text};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static std::expected<SandboxFile, std::string> fromJson(const json& j);
};

/**
 * @brief A file collected from the guest's output directory
 */
struct OutputFile {
    std::string path;      ///< Virtual path, always under /output/
    std::string content;
    FileEncoding encoding{FileEncoding::Text};
    std::string mimeType;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static OutputFile fromJson(const json& j);
};

/**
 * @brief One console call made by guest code
 */
struct ConsoleEntry {
    ConsoleKind kind{ConsoleKind::Log};
    std::vector<std::string> args;
    int64_t timestampMs{0};  ///< Relative to execution start

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static ConsoleEntry fromJson(const json& j);
};

/**
 * @brief Immutable input to one execution
 */
struct ExecutionRequest {
    Language language{Language::JavaScript};
    std::string code;
    json context = json::object();       ///< Injected into guest globals
    std::vector<std::string> packages;   ///< Python only
    std::vector<SandboxFile> files;
    std::optional<int64_t> timeoutMs;    ///< Clamped by the runner
    std::string traceId;
    std::string label;

    [[nodiscard]] json toJson() const;

    /**
     * @brief Parse a request
     * @return Request, or a human-readable reason (unknown language, bad field)
     */
    [[nodiscard]] static std::expected<ExecutionRequest, std::string> fromJson(const json& j);
};

/**
 * @brief Outcome of one execution
 *
 * Success and failure share the capture fields so partial output always
 * travels with an error.
 */
struct ExecutionResult {
    bool success{false};
    Language language{Language::JavaScript};
    std::optional<json> value;          ///< Guest result, nullopt for undefined
    std::string output;                 ///< Captured stdout
    std::string errorOutput;            ///< Captured stderr
    std::vector<ConsoleEntry> console;
    std::vector<OutputFile> outputFiles;
    std::vector<std::string> packagesInstalled;
    int64_t executionTimeMs{0};
    std::optional<ErrorKind> errorKind;
    std::string error;                  ///< Message when !success

    /**
     * @brief Build a failure, classifying nothing
     */
    [[nodiscard]] static ExecutionResult failure(Language language, ErrorKind kind,
                                                 std::string message);

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static std::expected<ExecutionResult, std::string> fromJson(const json& j);
};

/**
 * @brief Category of an advisory progress event
 */
enum class ProgressType { Loading, Installing, Executing, Complete };

[[nodiscard]] constexpr std::string_view progressTypeToString(ProgressType type) noexcept {
    switch (type) {
        case ProgressType::Loading: return "loading";
        case ProgressType::Installing: return "installing";
        case ProgressType::Executing: return "executing";
        case ProgressType::Complete: return "complete";
    }
    return "loading";
}

[[nodiscard]] std::optional<ProgressType> progressTypeFromString(std::string_view name);

/**
 * @brief Advisory status update, never part of the result contract
 */
struct ProgressEvent {
    ProgressType type{ProgressType::Loading};
    std::string message;
    std::optional<Language> language;
    std::string requestId;  ///< Empty for engine-wide events
};

using ProgressListener = std::function<void(const ProgressEvent&)>;

}  // namespace enclave::protocol

#endif  // ENCLAVE_PROTOCOL_TYPES_HPP
