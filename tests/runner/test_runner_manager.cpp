/*
 * test_runner_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_runner_manager.cpp
 * @brief Tests for request scheduling, timeouts and progress reporting
 */

#include <gtest/gtest.h>
#include "runner/runner_manager.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <regex>
#include <set>
#include <thread>

using namespace enclave::runner;
using namespace enclave::protocol;
using namespace std::chrono_literals;

namespace {

ExecutionRequest javascript(std::string code) {
    ExecutionRequest request;
    request.language = Language::JavaScript;
    request.code = std::move(code);
    return request;
}

std::filesystem::path workerPath() {
#ifdef ENCLAVE_WORKER_PATH
    return ENCLAVE_WORKER_PATH;
#else
    return {};
#endif
}

}  // namespace

// =============================================================================
// Request Id Tests
// =============================================================================

TEST(RequestIdTest, FormatAndUniqueness) {
    static const std::regex pattern(R"(^exec_\d+_[0-9a-z]{9}$)");
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = generateRequestId();
        EXPECT_TRUE(std::regex_match(id, pattern)) << id;
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

// =============================================================================
// JavaScript Runner Tests
// =============================================================================

class JavaScriptRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        RunnerOptions options;
        options.language = Language::JavaScript;
        runner_ = std::make_unique<RunnerManager>(options);
    }

    std::unique_ptr<RunnerManager> runner_;
};

TEST_F(JavaScriptRunnerTest, AlwaysReadyAndCooperative) {
    EXPECT_EQ(runner_->state(), EngineState::Ready);
    EXPECT_TRUE(runner_->isReady());
    EXPECT_EQ(runner_->cancellationMode(), CancellationMode::Cooperative);
    EXPECT_EQ(runner_->language(), Language::JavaScript);
    EXPECT_TRUE(runner_->warmup().has_value());
}

TEST_F(JavaScriptRunnerTest, ExecutesAndReportsProgress) {
    std::mutex mutex;
    std::vector<ProgressEvent> events;
    runner_->onProgress([&](const ProgressEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    });

    auto request = javascript("export default input.a + 1;");
    request.context = {{"a", 41}};
    auto result = runner_->execute(request).get();
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(*result.value, nlohmann::json(42));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events.front().type, ProgressType::Executing);
    EXPECT_EQ(events.front().message, "Running script…");
    EXPECT_EQ(events.front().requestId, events.back().requestId);
    EXPECT_EQ(events.back().type, ProgressType::Complete);
    EXPECT_EQ(events.back().message, "Execution complete");
    EXPECT_EQ(events.back().language, Language::JavaScript);
    EXPECT_FALSE(events.back().requestId.empty());
}

TEST_F(JavaScriptRunnerTest, FailedRunHasNoCompleteEvent) {
    std::vector<ProgressType> types;
    std::mutex mutex;
    runner_->onProgress([&](const ProgressEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        types.push_back(event.type);
    });
    auto result = runner_->execute(javascript("throw new Error('x');")).get();
    EXPECT_FALSE(result.success);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(types, std::vector<ProgressType>{ProgressType::Executing});
}

TEST_F(JavaScriptRunnerTest, TimeoutIsClampedToMinimum) {
    auto request = javascript("const end = Date.now() + 1000; while (Date.now() < end) {} return 'ok';");
    request.timeoutMs = 10;
    auto result = runner_->execute(request).get();
    EXPECT_TRUE(result.success) << result.error;
}

TEST_F(JavaScriptRunnerTest, ConcurrentCallsAllResolve) {
    std::vector<std::future<ExecutionResult>> futures;
    for (int i = 0; i < 4; ++i) {
        auto request = javascript("return input.n * 2;");
        request.context = {{"n", i}};
        futures.push_back(runner_->execute(request));
    }
    for (int i = 0; i < 4; ++i) {
        auto result = futures[i].get();
        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(*result.value, nlohmann::json(i * 2));
    }
    EXPECT_EQ(runner_->pendingCount(), 0u);
}

TEST_F(JavaScriptRunnerTest, PackagesAndFilesAreIgnored) {
    auto request = javascript("return 'fine';");
    request.packages = {"lodash"};
    request.files.push_back({"a.txt", "x", FileEncoding::Text});
    auto result = runner_->execute(request).get();
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.packagesInstalled.empty());
}

TEST_F(JavaScriptRunnerTest, DroppingTheFutureDoesNotBlock) {
    auto started = std::chrono::steady_clock::now();
    {
        auto dropped = runner_->execute(
            javascript("const end = Date.now() + 1500; while (Date.now() < end) {} return 1;"));
    }
    auto waited = std::chrono::steady_clock::now() - started;
    EXPECT_LT(waited, std::chrono::milliseconds{1000});

    // Let the detached run finish before the runner goes away
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
    while (runner_->pendingCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    EXPECT_EQ(runner_->pendingCount(), 0u);
}

TEST_F(JavaScriptRunnerTest, TerminateDoesNotBreakRunner) {
    runner_->terminate();
    EXPECT_TRUE(runner_->execute(javascript("return 1;")).get().success);
}

// =============================================================================
// Python Runner Tests
// =============================================================================

class PythonRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto worker = workerPath();
        if (worker.empty() || !std::filesystem::exists(worker)) {
            GTEST_SKIP() << "enclave_worker not built";
        }
        RunnerOptions options;
        options.language = Language::Python;
        options.timeouts = defaultTimeoutPolicy(Language::Python);
        options.python.workerExecutable = worker;
        runner_ = std::make_unique<RunnerManager>(options);
    }

    ExecutionRequest python(std::string code) {
        ExecutionRequest request;
        request.language = Language::Python;
        request.code = std::move(code);
        return request;
    }

    std::unique_ptr<RunnerManager> runner_;
};

TEST(PythonRunnerBasicTest, MissingWorkerFailsRequest) {
    RunnerOptions options;
    options.language = Language::Python;
    options.python.workerExecutable = "/nonexistent/enclave_worker";
    RunnerManager runner(options);
    EXPECT_EQ(runner.cancellationMode(), CancellationMode::Destructive);

    ExecutionRequest request;
    request.language = Language::Python;
    request.code = "1";
    auto result = runner.execute(request).get();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.rfind("Failed to start the Python runtime", 0), 0u);
}

TEST_F(PythonRunnerTest, RequestsAreSerialized) {
    auto first = runner_->execute(python("import time\ntime.sleep(0.3)\n'first'"));
    auto second = runner_->execute(python("'second'"));
    auto firstResult = first.get();
    auto secondResult = second.get();
    ASSERT_TRUE(firstResult.success) << firstResult.error;
    ASSERT_TRUE(secondResult.success) << secondResult.error;
    EXPECT_EQ(*firstResult.value, nlohmann::json("first"));
    EXPECT_EQ(*secondResult.value, nlohmann::json("second"));
    EXPECT_TRUE(runner_->isReady());
}

TEST_F(PythonRunnerTest, TimeoutKillsWorkerAndNextCallRespawns) {
    auto request = python("while True:\n    pass");
    request.timeoutMs = 5000;
    auto result = runner_->execute(request).get();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Timeout);
    EXPECT_EQ(result.error, "Execution timed out after 5000ms");

    auto next = runner_->execute(python("'alive'")).get();
    ASSERT_TRUE(next.success) << next.error;
    EXPECT_EQ(*next.value, nlohmann::json("alive"));
}

TEST_F(PythonRunnerTest, TerminateFailsOutstandingCalls) {
    ASSERT_TRUE(runner_->warmup().has_value());
    auto running = runner_->execute(python("import time\ntime.sleep(30)"));
    auto queued = runner_->execute(python("1"));
    std::this_thread::sleep_for(300ms);
    runner_->terminate();

    auto runningResult = running.get();
    auto queuedResult = queued.get();
    EXPECT_EQ(runningResult.error, "Sandbox was terminated");
    EXPECT_EQ(queuedResult.error, "Sandbox was terminated");
    EXPECT_EQ(runner_->pendingCount(), 0u);
}

TEST_F(PythonRunnerTest, ProgressCarriesRequestId) {
    std::mutex mutex;
    std::vector<ProgressEvent> events;
    runner_->onProgress([&](const ProgressEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    });
    auto result = runner_->execute(python("'x'")).get();
    ASSERT_TRUE(result.success) << result.error;

    std::lock_guard<std::mutex> lock(mutex);
    bool sawExecuting = false;
    bool sawComplete = false;
    for (const auto& event : events) {
        if (event.type == ProgressType::Executing) {
            sawExecuting = true;
            EXPECT_FALSE(event.requestId.empty());
        }
        if (event.type == ProgressType::Complete) sawComplete = true;
    }
    EXPECT_TRUE(sawExecuting);
    EXPECT_TRUE(sawComplete);
}
