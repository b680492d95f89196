/*
 * process_spawning_unix.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "process_spawning.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace enclave::worker {

namespace {

// Exit status the child reports when execv itself fails
constexpr int kExecFailedStatus = 127;
constexpr auto kReapPollInterval = std::chrono::milliseconds{10};

constexpr std::array<const char*, 18> kInheritedVariables = {
    "PATH",        "LANG",          "LC_ALL",           "PYTHONHOME",
    "PYTHONPATH",  "VIRTUAL_ENV",   "LD_LIBRARY_PATH",  "HTTP_PROXY",
    "HTTPS_PROXY", "NO_PROXY",      "http_proxy",       "https_proxy",
    "no_proxy",    "PIP_INDEX_URL", "PIP_EXTRA_INDEX_URL", "PIP_TRUSTED_HOST",
    "SSL_CERT_FILE", "REQUESTS_CA_BUNDLE"};

/**
 * Everything the forked child needs, built in the parent so the child
 * only makes async-signal-safe calls.
 */
struct ChildLaunch {
    std::vector<std::string> args;
    std::vector<char*> argv;
    std::vector<std::string> environment;
    std::vector<char*> envp;
    int readFd = -1;
    int writeFd = -1;
    std::optional<rlimit> addressSpace;

    ChildLaunch(const WorkerOptions& options, std::pair<int, int> fds)
        : args(ProcessSpawner::buildCommandLine(options, fds)),
          environment(ProcessSpawner::buildEnvironment(options)),
          readFd(fds.first),
          writeFd(fds.second) {
        argv.reserve(args.size() + 1);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        envp.reserve(environment.size() + 1);
        for (auto& entry : environment) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);

        if (options.level == IsolationLevel::Sandboxed && options.maxMemoryMB > 0) {
            rlimit limit{};
            limit.rlim_cur = static_cast<rlim_t>(options.maxMemoryMB) * 1024 * 1024;
            limit.rlim_max = limit.rlim_cur;
            addressSpace = limit;
        }
    }

    ChildLaunch(const ChildLaunch&) = delete;
    ChildLaunch& operator=(const ChildLaunch&) = delete;

    [[noreturn]] void runInChild() const {
        // IPC ends are the only descriptors meant to cross exec
        ::fcntl(readFd, F_SETFD, 0);
        ::fcntl(writeFd, F_SETFD, 0);

        if (int devNull = ::open("/dev/null", O_RDONLY); devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        // Stray native prints land on stderr, never on the host's stdout
        ::dup2(STDERR_FILENO, STDOUT_FILENO);

        if (addressSpace) {
            ::setrlimit(RLIMIT_AS, &*addressSpace);
        }

        ::execve(argv[0], argv.data(), envp.data());
        ::_exit(kExecFailedStatus);
    }
};

auto exitCodeFrom(int pid, int status) -> Result<int> {
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == kExecFailedStatus) {
            spdlog::warn("Worker {} exited with {}; the executable may be missing", pid,
                         code);
        }
        return code;
    }
    if (WIFSIGNALED(status)) {
        spdlog::debug("Worker {} terminated by signal {}", pid, WTERMSIG(status));
    }
    return std::unexpected(RunnerError::ProcessCrashed);
}

}  // namespace

std::vector<std::string> ProcessSpawner::buildCommandLine(
    const WorkerOptions& options, std::pair<int, int> subprocessFds) {
    std::vector<std::string> args;
    args.reserve(8);
    args.push_back(options.workerExecutable.string());
    args.push_back(fmt::format("--read_fd={}", subprocessFds.first));
    args.push_back(fmt::format("--write_fd={}", subprocessFds.second));
    args.push_back(fmt::format("--sandbox_root={}", options.sandboxRoot.string()));
    args.push_back(fmt::format("--site_dir={}", options.siteDirectory.string()));
    args.push_back(fmt::format("--pip_timeout={}", options.pipTimeout.count()));
    args.push_back(fmt::format("--log_level={}", options.logLevel));
    if (!options.pythonExecutable.empty()) {
        args.push_back(fmt::format("--python={}", options.pythonExecutable.string()));
    }
    const auto& policy = options.guestPolicy;
    args.push_back(
        fmt::format("--blocked_imports={}", protocol::joinModuleList(policy.blockedImports)));
    args.push_back(
        fmt::format("--allowed_imports={}", protocol::joinModuleList(policy.allowedImports)));
    return args;
}

std::vector<std::string> ProcessSpawner::buildEnvironment(const WorkerOptions& options) {
    std::vector<std::string> environment;
    bool hasPath = false;
    bool hasLocale = false;
    for (const char* name : kInheritedVariables) {
        if (const char* value = std::getenv(name)) {
            environment.push_back(fmt::format("{}={}", name, value));
            hasPath = hasPath || std::strcmp(name, "PATH") == 0;
            hasLocale = hasLocale || std::strcmp(name, "LANG") == 0;
        }
    }
    if (!hasPath) {
        environment.emplace_back("PATH=/usr/local/bin:/usr/bin:/bin");
    }
    if (!hasLocale) {
        environment.emplace_back("LANG=C.UTF-8");
    }

    const auto scratch = (options.sandboxRoot / "tmp").string();
    environment.push_back(fmt::format("HOME={}", scratch));
    environment.push_back(fmt::format("TMPDIR={}", scratch));
    environment.push_back(fmt::format("MPLCONFIGDIR={}", scratch));
    environment.emplace_back("PYTHONDONTWRITEBYTECODE=1");
    environment.emplace_back("PYTHONNOUSERSITE=1");
    return environment;
}

Result<int> ProcessSpawner::spawn(const WorkerOptions& options,
                                  std::pair<int, int> subprocessFds) {
    const ChildLaunch launch(options, subprocessFds);

    pid_t pid = ::fork();
    if (pid < 0) {
        spdlog::error("Could not fork the worker: {}", std::strerror(errno));
        return std::unexpected(RunnerError::ProcessSpawnFailed);
    }
    if (pid == 0) {
        launch.runInChild();
    }

    spdlog::debug("Worker {} started from {} ({}{})", pid, launch.args.front(),
                  isolationLevelToString(options.level),
                  launch.addressSpace ? ", address space capped" : "");
    return static_cast<int>(pid);
}

Result<int> ProcessSpawner::waitForProcess(int processId, int timeoutMs) {
    int status = 0;

    if (timeoutMs <= 0) {
        pid_t reaped;
        do {
            reaped = ::waitpid(processId, &status, 0);
        } while (reaped < 0 && errno == EINTR);
        if (reaped != processId) {
            return std::unexpected(RunnerError::ProcessCrashed);
        }
        return exitCodeFrom(processId, status);
    }

    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds{timeoutMs};
    for (;;) {
        pid_t reaped = ::waitpid(processId, &status, WNOHANG);
        if (reaped == processId) {
            return exitCodeFrom(processId, status);
        }
        if (reaped < 0 && errno != EINTR) {
            return std::unexpected(RunnerError::ProcessCrashed);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::unexpected(RunnerError::Timeout);
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

Result<void> ProcessSpawner::killProcess(int processId) {
    if (::kill(processId, SIGKILL) != 0) {
        spdlog::debug("SIGKILL to {} failed: {}", processId, std::strerror(errno));
        return std::unexpected(RunnerError::ProcessKilled);
    }

    int status = 0;
    while (::waitpid(processId, &status, 0) < 0 && errno == EINTR) {
    }
    return {};
}

bool ProcessSpawner::isProcessRunning(int processId) {
    if (processId <= 0) {
        return false;
    }
    // A zombie is reaped here rather than reported as alive
    int status = 0;
    if (::waitpid(processId, &status, WNOHANG) == processId) {
        return false;
    }
    return ::kill(processId, 0) == 0;
}

}  // namespace enclave::worker
