/*
 * test_python_host.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_python_host.cpp
 * @brief Tests for guest execution inside the embedded interpreter
 *
 * The interpreter can only be initialized once per process, so every test
 * shares one PythonHost.
 */

#include <gtest/gtest.h>
#include "guest/python_host.hpp"
#include "guest/request_handler.hpp"
#include "guest/virtual_fs.hpp"
#include "packages/package_installer.hpp"

#include <filesystem>

#include <unistd.h>

using namespace enclave::guest;
using namespace enclave::protocol;
namespace fs = std::filesystem;

namespace {

PythonHost& sharedHost() {
    static PythonHost host;
    return host;
}

}  // namespace

class PythonHostTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("enclave-host-test-" + std::to_string(::getpid()));
        vfs_ = std::make_unique<VirtualFilesystem>(root_);
        ASSERT_TRUE(vfs_->reset().has_value());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    RunOutcome run(const std::string& code, const nlohmann::json& context = nlohmann::json::object(),
                   const std::vector<std::string>& argv = {"script.py"}) {
        return sharedHost().run(code, context, argv, *vfs_);
    }

    fs::path root_;
    std::unique_ptr<VirtualFilesystem> vfs_;
};

// =============================================================================
// PythonHost Tests
// =============================================================================

TEST_F(PythonHostTest, CapturesOutputAndLastExpression) {
    auto outcome = run("import sys\nprint('out')\nprint('err', file=sys.stderr)\n6 * 7");
    EXPECT_EQ(outcome.output, "out\n");
    EXPECT_EQ(outcome.errorOutput, "err\n");
    EXPECT_EQ(outcome.value, "42");
    EXPECT_FALSE(outcome.error.has_value());
}

TEST_F(PythonHostTest, NoneValueIsAbsent) {
    auto outcome = run("x = 1\nNone");
    EXPECT_FALSE(outcome.value.has_value());
}

TEST_F(PythonHostTest, ContextBecomesGlobals) {
    auto outcome = run("f'{name}:{len(items)}:{opts[\"deep\"]}'",
                       {{"name", "ada"}, {"items", {1, 2, 3}}, {"opts", {{"deep", true}}}});
    EXPECT_EQ(outcome.value, "ada:3:True");
}

TEST_F(PythonHostTest, GlobalsDoNotLeakBetweenRuns) {
    auto first = run("leaked = 1");
    EXPECT_FALSE(first.error.has_value());
    auto second = run("leaked");
    ASSERT_TRUE(second.error.has_value());
    EXPECT_NE(second.error->find("NameError"), std::string::npos);
}

TEST_F(PythonHostTest, SyntaxErrorIsReported) {
    auto outcome = run("def broken(:\n    pass");
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error->find("SyntaxError"), std::string::npos);
}

TEST_F(PythonHostTest, ExitDoesNotEndProcess) {
    auto zero = run("import sys\nsys.exit()");
    EXPECT_EQ(zero.exitCode, 0);

    auto two = run("import sys\nprint('before')\nsys.exit(2)");
    EXPECT_EQ(two.exitCode, 2);
    EXPECT_EQ(two.output, "before\n");

    auto message = run("exit('fatal')");
    EXPECT_EQ(message.exitCode, 1);
    EXPECT_NE(message.errorOutput.find("fatal"), std::string::npos);

    auto after = run("'still alive'");
    EXPECT_EQ(after.value, "still alive");
}

TEST_F(PythonHostTest, ArgvIsVisible) {
    auto outcome = run("import sys\n' '.join(sys.argv)", nlohmann::json::object(),
                       {"script.py", "--limit", "3"});
    EXPECT_EQ(outcome.value, "script.py --limit 3");
}

TEST_F(PythonHostTest, OpenIsMappedIntoSandbox) {
    ASSERT_TRUE(vfs_->mount({{"in.txt", "payload", FileEncoding::Text}}).has_value());
    auto outcome = run(
        "text = open('/input/in.txt').read()\n"
        "with open('/output/out.txt', 'w') as f:\n"
        "    f.write(text[::-1])\n");
    ASSERT_FALSE(outcome.error.has_value()) << *outcome.error;
    auto outputs = vfs_->collectOutputs();
    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_EQ(outputs[0].content, "daolyap");
}

TEST_F(PythonHostTest, TraversalOutOfSandboxIsDenied) {
    auto outcome = run("open('/tmp/../../../etc/passwd').read()");
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error->find("PermissionError"), std::string::npos);
}

TEST_F(PythonHostTest, OpenOutsideMountAreasIsDenied) {
    for (const char* code : {"open('/etc/passwd').read()", "open('/proc/self/environ').read()",
                             "open('../../x', 'w')"}) {
        auto outcome = run(code);
        ASSERT_TRUE(outcome.error.has_value()) << code;
        EXPECT_NE(outcome.error->find("PermissionError"), std::string::npos) << code;
        EXPECT_NE(outcome.error->find("not allowed in the sandbox"), std::string::npos) << code;
    }
}

TEST_F(PythonHostTest, OsAndPathlibSeeMountAreas) {
    ASSERT_TRUE(vfs_->mount({{"in.txt", "payload", FileEncoding::Text}}).has_value());
    auto outcome = run(
        "import os, pathlib\n"
        "assert os.path.exists('/input/in.txt')\n"
        "assert pathlib.Path('/input/in.txt').read_text() == 'payload'\n"
        "os.makedirs('/output/sub', exist_ok=True)\n"
        "pathlib.Path('/output/sub/p.txt').write_text('from pathlib')\n"
        "with open('/output/o.txt', 'w') as f:\n"
        "    f.write('x')\n"
        "sorted(os.listdir('/output'))");
    ASSERT_FALSE(outcome.error.has_value()) << *outcome.error;
    EXPECT_EQ(outcome.value, "['o.txt', 'sub']");

    auto outputs = vfs_->collectOutputs();
    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_EQ(outputs[0].path, "/output/o.txt");
    EXPECT_EQ(outputs[1].path, "/output/sub/p.txt");
    EXPECT_EQ(outputs[1].content, "from pathlib");
}

TEST_F(PythonHostTest, AbsoluteHostPathsInsideRootStillWork) {
    auto outcome = run(
        "import os\n"
        "target = os.path.join(os.getcwd(), 'output', 'abs.txt')\n"
        "with open(target, 'w') as f:\n"
        "    f.write('absolute')\n"
        "os.path.exists(target)");
    ASSERT_FALSE(outcome.error.has_value()) << *outcome.error;
    EXPECT_EQ(outcome.value, "True");
    auto outputs = vfs_->collectOutputs();
    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_EQ(outputs[0].path, "/output/abs.txt");
}

TEST_F(PythonHostTest, ListingOutsideTheSandboxIsDenied) {
    auto outcome = run("import os\nos.listdir('/etc')");
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error->find("PermissionError"), std::string::npos);
}

TEST_F(PythonHostTest, ProcessesCannotBeStarted) {
    auto viaImportlib =
        run("import importlib\nimportlib.import_module('subprocess').run(['true'])");
    ASSERT_TRUE(viaImportlib.error.has_value());
    EXPECT_NE(viaImportlib.error->find("not allowed in the sandbox"), std::string::npos);

    auto viaOs = run("import os\nos.system('true')");
    ASSERT_TRUE(viaOs.error.has_value());
    EXPECT_NE(viaOs.error->find("PermissionError"), std::string::npos);
}

TEST_F(PythonHostTest, NetworkIsDenied) {
    auto outcome = run("import http.client\nhttp.client.HTTPConnection('127.0.0.1', 9).connect()");
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error->find("Network access is not allowed"), std::string::npos);
}

TEST_F(PythonHostTest, LibrariesKeepTheirOwnImports) {
    // email.utils imports socket, which guest code may not import itself
    auto outcome = run("import email.utils\nemail.utils.formataddr(('A', 'a@b.c'))");
    ASSERT_FALSE(outcome.error.has_value()) << *outcome.error;
    EXPECT_EQ(outcome.value, "A <a@b.c>");
}

// =============================================================================
// RequestHandler Tests
// =============================================================================

class RequestHandlerTest : public PythonHostTest {
protected:
    void SetUp() override {
        PythonHostTest::SetUp();
        installer_.setAvailabilityCheck([](std::string_view) { return true; });
        handler_ = std::make_unique<RequestHandler>(sharedHost(), *vfs_, installer_);
    }

    ExecutionResult handle(const ExecutionRequest& request, bool synthesizeArgv = true) {
        return handler_->handle(request, synthesizeArgv,
                                [this](ProgressType type, const std::string& message) {
                                    progress_.emplace_back(type, message);
                                });
    }

    static ExecutionRequest python(std::string code) {
        ExecutionRequest request;
        request.language = Language::Python;
        request.code = std::move(code);
        return request;
    }

    enclave::packages::PackageInstaller installer_;
    std::unique_ptr<RequestHandler> handler_;
    std::vector<std::pair<ProgressType, std::string>> progress_;
};

TEST_F(RequestHandlerTest, SuccessfulRun) {
    auto result = handle(python("print('hi')\n'done'"));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.language, Language::Python);
    EXPECT_EQ(result.output, "hi\n");
    EXPECT_EQ(result.value, nlohmann::json("done"));
    ASSERT_EQ(result.console.size(), 1u);
    EXPECT_EQ(result.console[0].kind, ConsoleKind::Log);
    ASSERT_FALSE(progress_.empty());
    EXPECT_EQ(progress_.back().first, ProgressType::Executing);
    EXPECT_EQ(progress_.back().second, "Running script…");
}

TEST_F(RequestHandlerTest, ArgparseFailureExplainsArguments) {
    auto request = python(
        "import argparse\n"
        "parser = argparse.ArgumentParser()\n"
        "parser.add_argument('--input-file', required=True)\n"
        "args = parser.parse_args()\n");
    auto result = handle(request);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Runtime);
    EXPECT_EQ(result.error.rfind("Script called sys.exit(2).", 0), 0u);
    EXPECT_EQ(result.errorOutput.find("Traceback"), std::string::npos);

    request.context = {{"input_file", "/input/a.csv"}};
    auto fixed = handle(request);
    EXPECT_TRUE(fixed.success) << fixed.error;
}

TEST_F(RequestHandlerTest, ArgvSynthesisCanBeDisabled) {
    auto request = python("import sys\nlen(sys.argv)");
    request.context = {{"a", 1}};
    EXPECT_EQ(handle(request, true).value, nlohmann::json("3"));
    EXPECT_EQ(handle(request, false).value, nlohmann::json("1"));
}

TEST_F(RequestHandlerTest, ExceptionIsClassified) {
    auto result = handle(python("1 / 0"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Runtime);
    EXPECT_NE(result.error.find("ZeroDivisionError"), std::string::npos);

    auto syntax = handle(python("def (:"));
    EXPECT_EQ(syntax.errorKind, ErrorKind::Syntax);
}

TEST_F(RequestHandlerTest, PartialOutputSurvivesFailure) {
    auto result = handle(python("print('one')\nprint('two')\nprint('three')\n"
                                "raise RuntimeError('boom')"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "one\ntwo\nthree\n");
    EXPECT_EQ(result.errorKind, ErrorKind::Runtime);
    EXPECT_NE(result.error.find("RuntimeError: boom"), std::string::npos);
}

TEST_F(RequestHandlerTest, SandboxViolationsAreSecurityFailures) {
    for (const char* code : {"open('/etc/passwd').read()", "import subprocess", "import socket",
                             "from multiprocessing import Pool"}) {
        auto result = handle(python(code));
        EXPECT_FALSE(result.success) << code;
        EXPECT_EQ(result.errorKind, ErrorKind::Security) << code << ": " << result.error;
    }
}

TEST_F(RequestHandlerTest, EscapingFileIsSecurityFailure) {
    auto request = python("1");
    request.files.push_back({"../../x.txt", "x", FileEncoding::Text});
    auto result = handle(request);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Security);
}

TEST_F(RequestHandlerTest, PackagesAreReportedWithNotes) {
    auto request = python("1");
    request.packages = {"cv2", "torch"};
    auto result = handle(request);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.packagesInstalled, std::vector<std::string>{"opencv-python"});
    EXPECT_NE(result.errorOutput.find("Note: Resolved package alias \"cv2\""), std::string::npos);
    EXPECT_NE(result.errorOutput.find("Warning: \"torch\" is not supported"), std::string::npos);

    bool sawInstalling = false;
    for (const auto& [type, message] : progress_) {
        if (type == ProgressType::Installing) {
            sawInstalling = true;
            EXPECT_EQ(message, "Installing packages: opencv-python…");
        }
    }
    EXPECT_TRUE(sawInstalling);
}

TEST_F(RequestHandlerTest, NoInstallProgressWhenNothingIsInstallable) {
    auto request = python("1");
    request.packages = {"torch", "not a name!"};
    auto result = handle(request);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.packagesInstalled.empty());
    for (const auto& [type, message] : progress_) {
        EXPECT_NE(type, ProgressType::Installing) << message;
    }
}

TEST_F(RequestHandlerTest, OutputFilesOnlyOnSuccess) {
    auto failing = handle(python("open('/output/x.txt', 'w').write('x')\nraise ValueError('no')"));
    EXPECT_FALSE(failing.success);
    EXPECT_TRUE(failing.outputFiles.empty());

    auto ok = handle(python("open('/output/x.txt', 'w').write('x')"));
    EXPECT_TRUE(ok.success);
    ASSERT_EQ(ok.outputFiles.size(), 1u);
    EXPECT_EQ(ok.outputFiles[0].path, "/output/x.txt");
}

TEST(ConsoleFromStreamsTest, OneEntryPerNonEmptyStream) {
    EXPECT_TRUE(consoleFromStreams("", "", 0).empty());
    auto entries = consoleFromStreams("a\n", "b\n", 12);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].kind, ConsoleKind::Error);
    EXPECT_EQ(entries[1].timestampMs, 12);
}
