/*
 * test_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_engine.cpp
 * @brief Tests for the per-call QuickJS engine
 */

#include <gtest/gtest.h>
#include "ephemeral/engine.hpp"

#include <future>
#include <vector>

using namespace enclave::ephemeral;
using namespace enclave::protocol;
using namespace std::chrono_literals;
using json = nlohmann::json;

class EphemeralEngineTest : public ::testing::Test {
protected:
    ExecutionResult run(const std::string& code, const json& input = nullptr,
                        std::chrono::milliseconds timeout = 5000ms) {
        return engine_.run(code, input, timeout);
    }

    EphemeralEngine engine_;
};

// =============================================================================
// Values
// =============================================================================

TEST_F(EphemeralEngineTest, DefaultExportObject) {
    auto result = run("export default {a: 1, b: [2, 3]};");
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.language, Language::JavaScript);
    ASSERT_TRUE(result.value.has_value());
    EXPECT_EQ(*result.value, (json{{"a", 1}, {"b", {2, 3}}}));
}

TEST_F(EphemeralEngineTest, ReturnValueOfWrappedCode) {
    auto result = run("const x = 20; return x + 22;");
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(*result.value, json(42));
}

TEST_F(EphemeralEngineTest, NoReturnIsUndefined) {
    auto result = run("const x = 1;");
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.value.has_value());
}

TEST_F(EphemeralEngineTest, SpecialValues) {
    EXPECT_EQ(*run("return 0.5;").value, json(0.5));
    EXPECT_EQ(*run("return null;").value, json(nullptr));
    EXPECT_EQ(*run("return 'text';").value, json("text"));
    EXPECT_EQ(*run("return () => 1;").value, json("[Function]"));
    EXPECT_EQ(*run("return [NaN, Infinity];").value, (json{"NaN", "Infinity"}));
}

TEST_F(EphemeralEngineTest, InputIsInjected) {
    auto result = run("return input.items.map(x => x * input.factor);",
                      {{"items", {1, 2, 3}}, {"factor", 2}});
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(*result.value, (json{2, 4, 6}));
}

TEST_F(EphemeralEngineTest, NullInputLeavesGlobalUndefined) {
    auto result = run("return typeof input;");
    EXPECT_EQ(*result.value, json("undefined"));
}

// =============================================================================
// Console
// =============================================================================

TEST_F(EphemeralEngineTest, ConsoleIsCapturedAndMirrored) {
    auto result = run(
        "console.log('a', 1, {k: true});\n"
        "console.warn('careful');\n"
        "console.info(undefined, null);\n"
        "console.log(Symbol('s'), function f() {});");
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.console.size(), 4u);
    EXPECT_EQ(result.console[0].kind, ConsoleKind::Log);
    EXPECT_EQ(result.console[0].args, (std::vector<std::string>{"a", "1", "{\"k\":true}"}));
    EXPECT_EQ(result.console[1].kind, ConsoleKind::Warn);
    EXPECT_EQ(result.console[2].args, (std::vector<std::string>{"undefined", "null"}));
    EXPECT_EQ(result.console[3].args, (std::vector<std::string>{"Symbol(s)", "[Function]"}));

    EXPECT_EQ(result.output, "a 1 {\"k\":true}\nundefined null\nSymbol(s) [Function]\n");
    EXPECT_EQ(result.errorOutput, "careful\n");
}

TEST_F(EphemeralEngineTest, PartialConsoleSurvivesThrow) {
    auto result = run(
        "console.log('one');\nconsole.log('two');\nconsole.log('three');\n"
        "throw new Error('boom');");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Runtime);
    EXPECT_EQ(result.error, "Error: boom");
    EXPECT_EQ(result.console.size(), 3u);
    EXPECT_EQ(result.output, "one\ntwo\nthree\n");
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(EphemeralEngineTest, SyntaxError) {
    auto result = run("const = ;");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Syntax);
    EXPECT_NE(result.error.find("SyntaxError"), std::string::npos);
}

TEST_F(EphemeralEngineTest, ThrownNonErrorValue) {
    auto result = run("throw {code: 7};");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "{\"code\":7}");
}

TEST_F(EphemeralEngineTest, InfiniteLoopTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto result = run("while (true) {}", nullptr, 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Timeout);
    EXPECT_EQ(result.error, "Execution timed out after 200ms");
    EXPECT_LT(elapsed, 5s);
}

TEST_F(EphemeralEngineTest, MemoryLimitIsEnforced) {
    EphemeralEngine small(EphemeralOptions{4 * 1024 * 1024, 1024 * 1024});
    auto result = small.run("const a = []; while (true) a.push('x'.repeat(1024));", nullptr,
                            10000ms);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Runtime);
}

TEST_F(EphemeralEngineTest, RunawayRecursionFails) {
    auto result = run("function f() { return f() + 1; } return f();");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Runtime);
}

// =============================================================================
// Isolation
// =============================================================================

TEST_F(EphemeralEngineTest, GlobalsDoNotPersist) {
    ASSERT_TRUE(run("globalThis.leak = 1;").success);
    EXPECT_EQ(*run("return typeof leak;").value, json("undefined"));
}

TEST_F(EphemeralEngineTest, ConcurrentCallsAreIsolated) {
    std::vector<std::future<ExecutionResult>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(std::async(std::launch::async, [this, i] {
            return engine_.run(
                "globalThis.counter = (globalThis.counter || 0) + input.n;\n"
                "console.log('call', input.n);\n"
                "return counter;",
                json{{"n", i}}, 5000ms);
        }));
    }
    for (int i = 0; i < 8; ++i) {
        auto result = futures[i].get();
        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(*result.value, json(i));
        ASSERT_EQ(result.console.size(), 1u);
        EXPECT_EQ(result.console[0].args[1], std::to_string(i));
    }
}

TEST(EphemeralEngineStaticTest, IsCooperative) {
    EXPECT_EQ(EphemeralEngine::cancellationMode(), CancellationMode::Cooperative);
}
