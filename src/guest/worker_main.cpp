/*
 * worker_main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file worker_main.cpp
 * @brief Entry point of the enclave_worker process
 *
 * The host spawns this executable with the two pipe descriptors it should
 * talk on. The worker answers the handshake, loads the interpreter,
 * reports Ready and then serves Execute messages one at a time until it is
 * told to shut down or the host goes away.
 */

#include "guest/python_host.hpp"
#include "guest/request_handler.hpp"
#include "guest/virtual_fs.hpp"
#include "ipc/channel.hpp"
#include "ipc/message.hpp"
#include "logging/setup.hpp"
#include "logging/sinks/forwarding_sink.hpp"
#include "logging/sinks/sink_factory.hpp"
#include "packages/package_installer.hpp"
#include "protocol/guest_policy.hpp"

#include <gflags/gflags.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <filesystem>
#include <memory>
#include <utility>

#include <unistd.h>

DEFINE_int32(read_fd, -1, "Descriptor the host writes requests to.");
DEFINE_int32(write_fd, -1, "Descriptor the worker writes replies to.");
DEFINE_string(sandbox_root, "", "Directory backing /input, /output and /tmp.");
DEFINE_string(site_dir, "", "Directory packages are installed into.");
DEFINE_string(python, "", "Interpreter used to run pip; found on PATH when empty.");
DEFINE_int64(pip_timeout, 120, "Seconds allowed for a single package install.");
DEFINE_string(log_level, "warn", "Minimum level for worker log output.");
DEFINE_string(blocked_imports, "subprocess,socket,ctypes,multiprocessing,pty",
              "Comma separated top-level modules guest code may not import.");
DEFINE_string(allowed_imports, "",
              "Comma separated top-level modules guest code may import; empty allows all.");

using namespace enclave;

namespace {

constexpr auto kReceiveInterval = std::chrono::milliseconds{500};
constexpr auto kHandshakeTimeout = std::chrono::milliseconds{10000};

void setupWorkerLogging(ipc::BidirectionalChannel& channel) {
    logging::LoggingConfig config;
    config.logger_name = "enclave-worker";
    config.default_level = logging::levelFromString(FLAGS_log_level);
    auto logger = logging::setupLogging(config);

    // Warnings and above also reach the host's log
    auto forwarder = std::make_shared<logging::ForwardingSinkMt>(
        [&channel](spdlog::level::level_enum level, const std::string& message) {
            nlohmann::json payload = {{"level", logging::levelToString(level)},
                                      {"message", message}};
            // On failure the stderr sink still holds the record
            if (!channel.send(ipc::MessageType::Log, payload)) {
                return;
            }
        });
    forwarder->set_level(spdlog::level::warn);
    logger->sinks().push_back(forwarder);
}

bool sendLoading(ipc::BidirectionalChannel& channel, const std::string& message) {
    ipc::ProgressNotice notice;
    notice.type = protocol::ProgressType::Loading;
    notice.message = message;
    return channel.send(ipc::MessageType::Loading, notice.toJson()).has_value();
}

/// Runs one Execute message; false when the reply could not be delivered
bool serveExecute(ipc::BidirectionalChannel& channel, guest::RequestHandler& handler,
                  packages::PackageInstaller& installer, const ipc::Message& message) {
    auto payload = message.getPayloadAsJson();
    auto command = payload.and_then(
        [](const nlohmann::json& j) { return ipc::ExecuteCommand::fromJson(j); });
    if (!command) {
        spdlog::error("Rejecting malformed Execute message: {}",
                      ipc::ipcErrorToString(command.error()));
        ipc::ErrorNotice notice;
        if (payload && payload->is_object()) {
            notice.requestId = payload->value("request_id", std::string{});
        }
        notice.message = "Malformed execute request";
        return channel.send(ipc::MessageType::Error, notice.toJson()).has_value();
    }

    const auto& requestId = command->requestId;
    // pip's own child outlives a worker the host kills at the deadline
    installer.setOperationTimeout(packages::boundedOperationTimeout(
        std::chrono::seconds{FLAGS_pip_timeout}, command->timeoutMs));
    auto result = handler.handle(
        command->request, command->synthesizeArgv,
        [&channel, &requestId](protocol::ProgressType type, const std::string& text) {
            ipc::ProgressNotice notice{requestId, type, text};
            if (!channel.send(ipc::MessageType::Progress, notice.toJson())) {
                spdlog::debug("Dropped progress notice for {}", requestId);
            }
        });

    ipc::ExecuteReply reply{requestId, std::move(result)};
    if (auto sent = channel.send(ipc::MessageType::Result, reply.toJson()); !sent) {
        spdlog::error("Failed to deliver result for {}: {}", requestId,
                      ipc::ipcErrorToString(sent.error()));
        return false;
    }
    return true;
}

int serve(ipc::BidirectionalChannel& channel) {
    if (!sendLoading(channel, "Initializing Python interpreter…")) {
        return 1;
    }

    std::unique_ptr<guest::PythonHost> host;
    try {
        protocol::GuestPolicy policy;
        policy.blockedImports = protocol::parseModuleList(FLAGS_blocked_imports);
        policy.allowedImports = protocol::parseModuleList(FLAGS_allowed_imports);
        host = std::make_unique<guest::PythonHost>(std::move(policy));
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        ipc::ErrorNotice notice{"", e.what()};
        if (!channel.send(ipc::MessageType::Error, notice.toJson())) {
            spdlog::debug("Host gone before the init failure was reported");
        }
        return 1;
    }

    std::filesystem::path siteDir = FLAGS_site_dir;
    std::error_code ec;
    std::filesystem::create_directories(siteDir, ec);
    if (ec) {
        spdlog::warn("Cannot create package directory {}: {}", siteDir.string(),
                     ec.message());
    }
    host->addSitePath(siteDir);

    packages::PackageInstaller installer;
    if (!FLAGS_python.empty()) {
        installer.setPythonExecutable(FLAGS_python);
    }
    installer.setTargetDirectory(siteDir);
    installer.setOperationTimeout(std::chrono::seconds{FLAGS_pip_timeout});
    installer.setAvailabilityCheck([&host](std::string_view distribution) {
        return host->isDistributionInstalled(distribution);
    });

    guest::VirtualFilesystem vfs(FLAGS_sandbox_root);
    guest::RequestHandler handler(*host, vfs, installer);

    if (!channel.send(ipc::MessageType::Ready,
                      {{"python_version", host->pythonVersion()}})) {
        return 1;
    }
    spdlog::info("Worker ready (pid {})", getpid());

    while (true) {
        auto message = channel.receive(kReceiveInterval);
        if (!message) {
            if (message.error() == ipc::IPCError::Timeout) {
                continue;
            }
            spdlog::info("Host channel closed: {}", ipc::ipcErrorToString(message.error()));
            return 0;
        }

        switch (message->header.type) {
            case ipc::MessageType::Execute:
                if (!serveExecute(channel, handler, installer, *message)) {
                    return 1;
                }
                break;
            case ipc::MessageType::Shutdown:
                if (!channel.send(ipc::MessageType::ShutdownAck, nlohmann::json::object())) {
                    spdlog::debug("Host gone before ShutdownAck");
                }
                return 0;
            default:
                spdlog::warn("Ignoring unexpected {} message",
                             ipc::messageTypeName(message->header.type));
                break;
        }
    }
}

}  // namespace

int main(int argc, char** argv) {
    gflags::SetUsageMessage("enclave_worker --read_fd=N --write_fd=N --sandbox_root=DIR");
    gflags::ParseCommandLineFlags(&argc, &argv, false);

    if (FLAGS_read_fd < 0 || FLAGS_write_fd < 0 || FLAGS_sandbox_root.empty()) {
        logging::setupLogging({});
        spdlog::critical("enclave_worker must be started by the enclave host");
        return 2;
    }

    ipc::BidirectionalChannel channel;
    channel.attach(FLAGS_read_fd, FLAGS_write_fd);
    setupWorkerLogging(channel);

    ipc::HandshakePayload reply;
    reply.version = "1.0";
    reply.pid = static_cast<uint32_t>(getpid());
    reply.capabilities = {"execute", "progress"};
    auto greeting = channel.acceptHandshake(reply, kHandshakeTimeout);
    if (!greeting) {
        spdlog::critical("Handshake with host failed: {}",
                         ipc::ipcErrorToString(greeting.error()));
        return 1;
    }
    spdlog::debug("Connected to host pid {} (protocol {})", greeting->pid, greeting->version);

    int status = serve(channel);
    spdlog::default_logger()->flush();
    gflags::ShutDownCommandLineFlags();
    return status;
}
