/*
 * process_utils.cpp
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "process_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace enclave::packages {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// Drain whatever is readable on fd into out; closes fd on EOF
void drain(int& fd, std::string& out) {
    std::array<char, 4096> buffer;
    auto bytesRead = ::read(fd, buffer.data(), buffer.size());
    if (bytesRead > 0) {
        out.append(buffer.data(), static_cast<size_t>(bytesRead));
    } else if (bytesRead == 0 || errno != EINTR) {
        closeFd(fd);
    }
}

}  // namespace

CommandResult executeCommand(const std::vector<std::string>& argv,
                             std::chrono::seconds timeout,
                             const std::filesystem::path& workingDirectory) {
    CommandResult result;
    if (argv.empty()) {
        result.errorOutput = "Empty command";
        return result;
    }

    std::array<int, 2> stdoutPipe{-1, -1};
    std::array<int, 2> stderrPipe{-1, -1};

    if (pipe(stdoutPipe.data()) != 0 || pipe(stderrPipe.data()) != 0) {
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        result.errorOutput = "Failed to create pipes";
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        closeFd(stderrPipe[0]);
        closeFd(stderrPipe[1]);
        result.errorOutput = "Failed to fork";
        return result;
    }

    if (pid == 0) {
        // Child process
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        dup2(stdoutPipe[1], STDOUT_FILENO);
        dup2(stderrPipe[1], STDERR_FILENO);
        ::close(stdoutPipe[1]);
        ::close(stderrPipe[1]);

        if (!workingDirectory.empty() && chdir(workingDirectory.c_str()) != 0) {
            _exit(126);
        }
        execvp(args[0], args.data());
        _exit(127);
    }

    // Parent process
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int outFd = stdoutPipe[0];
    int errFd = stderrPipe[0];

    while (outFd >= 0 || errFd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            spdlog::warn("Command '{}' exceeded {}s, killing", argv[0], timeout.count());
            ::kill(pid, SIGKILL);
            result.timedOut = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (outFd >= 0) fds[count++] = {outFd, POLLIN, 0};
        if (errFd >= 0) fds[count++] = {errFd, POLLIN, 0};

        int ret = poll(fds.data(), count, static_cast<int>(remaining.count()));
        if (ret < 0 && errno != EINTR) {
            break;
        }
        for (nfds_t i = 0; i < count && ret > 0; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == outFd) {
                drain(outFd, result.output);
            } else {
                drain(errFd, result.errorOutput);
            }
        }
    }

    closeFd(outFd);
    closeFd(errFd);

    int status = 0;
    if (waitpid(pid, &status, 0) == pid && WIFEXITED(status) && !result.timedOut) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = result.timedOut ? -2 : -1;
    }
    return result;
}

}  // namespace enclave::packages
