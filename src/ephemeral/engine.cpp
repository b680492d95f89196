/*
 * engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "engine.hpp"
#include "code_transform.hpp"

#include "protocol/error_classifier.hpp"
#include "protocol/result_formatter.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <quickjs.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <memory>
#include <new>
#include <utility>
#include <vector>

namespace enclave::ephemeral {

namespace {

using Clock = std::chrono::steady_clock;
using json = nlohmann::json;

constexpr const char* SCRIPT_FILENAME = "<script>";
constexpr const char* INPUT_FILENAME = "<input>";

// Non-finite numbers and functions survive JSON.stringify as typed tokens
constexpr std::string_view RESULT_REPLACER = R"JS((function (key, value) {
  if (typeof value === "function") return "[Function]";
  if (typeof value === "number") {
    if (value !== value) return "NaN";
    if (value === 1 / 0) return "Infinity";
    if (value === -1 / 0) return "-Infinity";
  }
  if (typeof value === "bigint") return value.toString();
  return value;
}))JS";

struct RuntimeDeleter {
    void operator()(JSRuntime* runtime) const noexcept { JS_FreeRuntime(runtime); }
};

struct ContextDeleter {
    void operator()(JSContext* context) const noexcept { JS_FreeContext(context); }
};

using RuntimePtr = std::unique_ptr<JSRuntime, RuntimeDeleter>;
using ContextPtr = std::unique_ptr<JSContext, ContextDeleter>;

/**
 * @brief Owns one JSValue reference for the lifetime of a scope
 */
class ScopedValue {
public:
    ScopedValue(JSContext* context, JSValue value) : context_(context), value_(value) {}
    ~ScopedValue() { JS_FreeValue(context_, value_); }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

    [[nodiscard]] JSValueConst get() const noexcept { return value_; }

    /// Hand the reference to a QuickJS call that consumes it
    [[nodiscard]] JSValue release() noexcept {
        JSValue value = value_;
        value_ = JS_UNDEFINED;
        return value;
    }

private:
    JSContext* context_;
    JSValue value_;
};

/**
 * @brief State reachable from the interrupt handler and console methods
 */
struct CallState {
    Clock::time_point start;
    Clock::time_point deadline;
    bool deadlineHit{false};
    std::vector<protocol::ConsoleEntry> console;
};

int interruptHandler(JSRuntime* /*runtime*/, void* opaque) {
    auto* state = static_cast<CallState*>(opaque);
    if (Clock::now() > state->deadline) {
        state->deadlineHit = true;
        return 1;
    }
    return 0;
}

void discardPendingException(JSContext* context) {
    JS_FreeValue(context, JS_GetException(context));
}

std::string toStdString(JSContext* context, JSValueConst value) {
    size_t length = 0;
    const char* text = JS_ToCStringLen(context, &length, value);
    if (text == nullptr) {
        discardPendingException(context);
        return std::string(protocol::kObjectTag);
    }
    std::string result(text, length);
    JS_FreeCString(context, text);
    return result;
}

std::string describeSymbol(JSContext* context, JSValueConst symbol) {
    ScopedValue description(context, JS_GetPropertyStr(context, symbol, "description"));
    if (JS_IsException(description.get())) {
        discardPendingException(context);
        return "Symbol()";
    }
    if (JS_IsUndefined(description.get())) {
        return "Symbol()";
    }
    return fmt::format("Symbol({})", toStdString(context, description.get()));
}

/// Console argument text: strings raw, objects as JSON when possible
std::string stringifyArgument(JSContext* context, JSValueConst value) {
    if (JS_IsUndefined(value)) return "undefined";
    if (JS_IsNull(value)) return "null";
    if (JS_IsSymbol(value)) return describeSymbol(context, value);
    if (JS_IsFunction(context, value)) return std::string(protocol::kFunctionTag);

    if (JS_IsObject(value)) {
        ScopedValue text(context, JS_JSONStringify(context, value, JS_UNDEFINED, JS_UNDEFINED));
        if (JS_IsException(text.get())) {
            discardPendingException(context);
            return toStdString(context, value);
        }
        if (JS_IsString(text.get())) {
            return toStdString(context, text.get());
        }
    }
    return toStdString(context, value);
}

JSValue consoleMethod(JSContext* context, JSValueConst /*thisValue*/, int argc,
                      JSValueConst* argv, int magic) {
    auto* state = static_cast<CallState*>(JS_GetContextOpaque(context));
    try {
        protocol::ConsoleEntry entry;
        entry.kind = static_cast<protocol::ConsoleKind>(magic);
        entry.args.reserve(static_cast<size_t>(argc));
        for (int i = 0; i < argc; ++i) {
            entry.args.push_back(stringifyArgument(context, argv[i]));
        }
        entry.timestampMs =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - state->start)
                .count();
        state->console.push_back(std::move(entry));
    } catch (const std::bad_alloc&) {
        return JS_ThrowOutOfMemory(context);
    }
    return JS_UNDEFINED;
}

void installConsole(JSContext* context, JSValueConst global) {
    static constexpr std::pair<const char*, protocol::ConsoleKind> METHODS[] = {
        {"log", protocol::ConsoleKind::Log},     {"warn", protocol::ConsoleKind::Warn},
        {"error", protocol::ConsoleKind::Error}, {"info", protocol::ConsoleKind::Info},
        {"debug", protocol::ConsoleKind::Debug},
    };

    JSValue console = JS_NewObject(context);
    for (const auto& [name, kind] : METHODS) {
        JS_SetPropertyStr(context, console, name,
                          JS_NewCFunctionMagic(context, consoleMethod, name, 0,
                                               JS_CFUNC_generic_magic, static_cast<int>(kind)));
    }
    JS_SetPropertyStr(context, global, "console", console);
}

/// `Name: message` for Error objects, the plain text otherwise
std::string describeException(JSContext* context, JSValueConst exception) {
    if (JS_IsError(context, exception)) {
        return toStdString(context, exception);
    }
    return stringifyArgument(context, exception);
}

/// Convert the completion value; nullopt for undefined
std::optional<json> dumpValue(JSContext* context, JSValueConst value, JSValueConst replacer) {
    if (JS_IsUndefined(value)) return std::nullopt;
    if (JS_IsNull(value)) return json(nullptr);
    if (JS_IsBool(value)) return json(JS_ToBool(context, value) != 0);
    if (JS_IsString(value)) return json(toStdString(context, value));
    if (JS_IsSymbol(value)) return json(describeSymbol(context, value));
    if (JS_IsFunction(context, value)) return json(std::string(protocol::kFunctionTag));

    if (JS_IsNumber(value)) {
        double number = 0.0;
        if (JS_ToFloat64(context, &number, value) != 0) {
            discardPendingException(context);
            return json(nullptr);
        }
        // Integral values within the exact range keep integer formatting
        if (std::isfinite(number) && std::trunc(number) == number &&
            std::fabs(number) <= 9007199254740992.0) {
            return json(static_cast<int64_t>(number));
        }
        return json(number);
    }

    if (JS_IsObject(value)) {
        const auto tag = JS_IsArray(context, value) > 0 ? protocol::kArrayTag
                                                        : protocol::kObjectTag;
        ScopedValue text(context, JS_JSONStringify(context, value, replacer, JS_UNDEFINED));
        if (JS_IsException(text.get())) {
            discardPendingException(context);
            return json(std::string(tag));
        }
        if (!JS_IsString(text.get())) {
            return json(std::string(tag));
        }
        auto parsed = json::parse(toStdString(context, text.get()), nullptr, false);
        if (parsed.is_discarded()) {
            return json(std::string(tag));
        }
        return parsed;
    }

    // BigInt and anything newer
    return json(toStdString(context, value));
}

std::string joinArguments(const protocol::ConsoleEntry& entry) {
    return fmt::format("{}\n", fmt::join(entry.args, " "));
}

/// Mirror the console into the stream fields
void fillStreams(protocol::ExecutionResult& result) {
    for (const auto& entry : result.console) {
        switch (entry.kind) {
            case protocol::ConsoleKind::Warn:
            case protocol::ConsoleKind::Error:
                result.errorOutput += joinArguments(entry);
                break;
            default:
                result.output += joinArguments(entry);
                break;
        }
    }
}

}  // namespace

EphemeralEngine::EphemeralEngine(EphemeralOptions options) : options_(options) {}

protocol::ExecutionResult EphemeralEngine::run(const std::string& code,
                                               const nlohmann::json& input,
                                               std::chrono::milliseconds timeout) const {
    using protocol::ErrorKind;
    using protocol::Language;

    CallState state;
    state.start = Clock::now();
    state.deadline = state.start + timeout;

    auto finish = [&state](protocol::ExecutionResult result) {
        result.language = Language::JavaScript;
        result.console = std::move(state.console);
        result.executionTimeMs =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - state.start)
                .count();
        fillStreams(result);
        return result;
    };

    RuntimePtr runtime(JS_NewRuntime());
    if (!runtime) {
        spdlog::error("Failed to create QuickJS runtime");
        return finish(protocol::ExecutionResult::failure(
            Language::JavaScript, ErrorKind::Runtime, "Failed to create JavaScript runtime"));
    }
    JS_SetMemoryLimit(runtime.get(), options_.memoryLimitBytes);
    JS_SetMaxStackSize(runtime.get(), options_.maxStackBytes);
    JS_SetInterruptHandler(runtime.get(), interruptHandler, &state);

    ContextPtr context(JS_NewContext(runtime.get()));
    if (!context) {
        spdlog::error("Failed to create QuickJS context");
        return finish(protocol::ExecutionResult::failure(
            Language::JavaScript, ErrorKind::Runtime, "Failed to create JavaScript context"));
    }
    JSContext* ctx = context.get();
    JS_SetContextOpaque(ctx, &state);

    // Guest errors become failures; runtime and context are freed on every path
    auto guestFailure = [&](const std::string& prefix) {
        ScopedValue exception(ctx, JS_GetException(ctx));
        if (state.deadlineHit) {
            return finish(protocol::ExecutionResult::failure(
                Language::JavaScript, ErrorKind::Timeout,
                fmt::format("Execution timed out after {}ms", timeout.count())));
        }
        auto message = prefix + describeException(ctx, exception.get());
        auto kind = prefix.empty() ? protocol::classifyError(message) : ErrorKind::Runtime;
        return finish(protocol::ExecutionResult::failure(Language::JavaScript, kind, message));
    };

    ScopedValue replacer(ctx, JS_Eval(ctx, RESULT_REPLACER.data(), RESULT_REPLACER.size(),
                                      "<replacer>", JS_EVAL_TYPE_GLOBAL));
    if (JS_IsException(replacer.get())) {
        return guestFailure("Failed to prepare context: ");
    }

    {
        ScopedValue global(ctx, JS_GetGlobalObject(ctx));
        installConsole(ctx, global.get());

        if (!input.is_null()) {
            std::string literal;
            try {
                literal = input.dump();
            } catch (const nlohmann::json::exception& e) {
                return finish(protocol::ExecutionResult::failure(
                    Language::JavaScript, ErrorKind::Runtime,
                    fmt::format("Failed to inject input: {}", e.what())));
            }
            // JS_ParseJSON needs a terminated buffer; std::string provides one
            ScopedValue parsed(ctx, JS_ParseJSON(ctx, literal.c_str(), literal.size(),
                                                 INPUT_FILENAME));
            if (JS_IsException(parsed.get())) {
                return guestFailure("Failed to inject input: ");
            }
            JS_SetPropertyStr(ctx, global.get(), "input", parsed.release());
        }
    }

    const std::string script = wrapCode(code);
    spdlog::debug("Evaluating {} bytes of JavaScript (timeout {}ms)", script.size(),
                  timeout.count());

    ScopedValue completion(
        ctx, JS_Eval(ctx, script.c_str(), script.size(), SCRIPT_FILENAME, JS_EVAL_TYPE_GLOBAL));
    if (JS_IsException(completion.get())) {
        return guestFailure("");
    }

    protocol::ExecutionResult result;
    result.success = true;
    result.value = dumpValue(ctx, completion.get(), replacer.get());
    return finish(std::move(result));
}

}  // namespace enclave::ephemeral
