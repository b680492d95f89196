/*
 * guest_guard.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "guest_guard.hpp"

#include <pybind11/pybind11.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>

#include <array>
#include <stdexcept>
#include <string_view>

namespace fs = std::filesystem;

namespace enclave::guest {

namespace {

enum class EventClass : uint8_t { Path, Process, Network, Native, Symlink };

struct AuditedEvent {
    std::string_view name;
    EventClass kind;
    GuestAccess access{GuestAccess::Read};
    Py_ssize_t pathArguments{0};
};

constexpr std::array<AuditedEvent, 38> EVENTS = {{
    {"os.listdir", EventClass::Path, GuestAccess::Read, 1},
    {"os.scandir", EventClass::Path, GuestAccess::Read, 1},
    {"os.chdir", EventClass::Path, GuestAccess::Write, 1},
    {"os.mkdir", EventClass::Path, GuestAccess::Write, 1},
    {"os.remove", EventClass::Path, GuestAccess::Write, 1},
    {"os.rmdir", EventClass::Path, GuestAccess::Write, 1},
    {"os.rename", EventClass::Path, GuestAccess::Write, 2},
    {"os.link", EventClass::Path, GuestAccess::Write, 2},
    {"os.chmod", EventClass::Path, GuestAccess::Write, 1},
    {"os.chown", EventClass::Path, GuestAccess::Write, 1},
    {"os.utime", EventClass::Path, GuestAccess::Write, 1},
    {"os.truncate", EventClass::Path, GuestAccess::Write, 1},
    {"os.mkfifo", EventClass::Path, GuestAccess::Write, 1},
    {"os.mknod", EventClass::Path, GuestAccess::Write, 1},
    {"os.setxattr", EventClass::Path, GuestAccess::Write, 1},
    {"os.removexattr", EventClass::Path, GuestAccess::Write, 1},
    {"shutil.rmtree", EventClass::Path, GuestAccess::Write, 1},
    {"os.symlink", EventClass::Symlink},
    {"subprocess.Popen", EventClass::Process},
    {"os.system", EventClass::Process},
    {"os.exec", EventClass::Process},
    {"os.posix_spawn", EventClass::Process},
    {"os.spawn", EventClass::Process},
    {"os.fork", EventClass::Process},
    {"os.forkpty", EventClass::Process},
    {"os.kill", EventClass::Process},
    {"os.killpg", EventClass::Process},
    {"pty.spawn", EventClass::Process},
    {"socket.connect", EventClass::Network},
    {"socket.bind", EventClass::Network},
    {"socket.getaddrinfo", EventClass::Network},
    {"socket.gethostbyname", EventClass::Network},
    {"socket.gethostbyaddr", EventClass::Network},
    {"socket.sendto", EventClass::Network},
    {"socket.sendmsg", EventClass::Network},
    {"ctypes.dlopen", EventClass::Native},
    {"ctypes.dlsym", EventClass::Native},
    {"ctypes.call_function", EventClass::Native},
}};

constexpr int WRITE_FLAGS = O_WRONLY | O_RDWR | O_CREAT | O_TRUNC | O_APPEND;

struct GuardState {
    AccessPolicy access;
};

// Guarded by the GIL
std::optional<GuardState>& guardState() {
    static std::optional<GuardState> state;
    return state;
}

/// Host path named by a str, bytes or PathLike argument; nullopt for fds and None
std::optional<fs::path> pathArgument(PyObject* args, Py_ssize_t index) {
    if (!PyTuple_Check(args) || index >= PyTuple_GET_SIZE(args)) {
        return std::nullopt;
    }
    PyObject* item = PyTuple_GET_ITEM(args, index);
    if (item == Py_None || PyLong_Check(item)) {
        return std::nullopt;
    }
    PyObject* fspath = PyOS_FSPath(item);
    if (fspath == nullptr) {
        PyErr_Clear();
        return std::nullopt;
    }
    PyObject* bytes = fspath;
    if (PyUnicode_Check(fspath)) {
        bytes = PyUnicode_EncodeFSDefault(fspath);
        Py_DECREF(fspath);
        if (bytes == nullptr) {
            PyErr_Clear();
            return std::nullopt;
        }
    }
    fs::path path(std::string(PyBytes_AS_STRING(bytes),
                              static_cast<size_t>(PyBytes_GET_SIZE(bytes))));
    Py_DECREF(bytes);
    return path;
}

bool opensForWriting(PyObject* args) {
    if (!PyTuple_Check(args) || PyTuple_GET_SIZE(args) < 3) {
        return false;
    }
    PyObject* mode = PyTuple_GET_ITEM(args, 1);
    if (mode != nullptr && PyUnicode_Check(mode)) {
        const char* text = PyUnicode_AsUTF8(mode);
        if (text == nullptr) {
            PyErr_Clear();
            return true;
        }
        if (std::string_view(text).find_first_of("wax+") != std::string_view::npos) {
            return true;
        }
    }
    PyObject* flags = PyTuple_GET_ITEM(args, 2);
    if (flags != nullptr && PyLong_Check(flags)) {
        long value = PyLong_AsLong(flags);
        if (value == -1 && PyErr_Occurred()) {
            PyErr_Clear();
            return true;
        }
        return (value & WRITE_FLAGS) != 0;
    }
    return false;
}

std::optional<std::string> judgeEvent(const GuardState& state, std::string_view event,
                                      PyObject* args) {
    if (event == "open") {
        auto path = pathArgument(args, 0);
        if (!path) {
            return std::nullopt;
        }
        auto access = opensForWriting(args) ? GuestAccess::Write : GuestAccess::Read;
        auto verdict = state.access.check(*path, access, true);
        return verdict ? std::nullopt : std::optional<std::string>(verdict.error());
    }

    for (const auto& audited : EVENTS) {
        if (audited.name != event) {
            continue;
        }
        switch (audited.kind) {
            case EventClass::Process:
                return "Starting or signalling processes is not allowed in the sandbox";
            case EventClass::Network:
                return "Network access is not allowed in the sandbox";
            case EventClass::Native:
                return "Loading native code is not allowed in the sandbox";
            case EventClass::Symlink:
                return "Creating symbolic links is not allowed in the sandbox";
            case EventClass::Path:
                for (Py_ssize_t i = 0; i < audited.pathArguments; ++i) {
                    if (auto path = pathArgument(args, i)) {
                        auto verdict = state.access.check(*path, audited.access);
                        if (!verdict) {
                            return verdict.error();
                        }
                    }
                }
                return std::nullopt;
        }
    }
    return std::nullopt;
}

int auditHook(const char* event, PyObject* args, void* /*userData*/) {
    const auto& state = guardState();
    if (!state) {
        return 0;
    }
    try {
        if (auto denial = judgeEvent(*state, event, args)) {
            spdlog::debug("Denied {}: {}", event, *denial);
            PyErr_SetString(PyExc_PermissionError, denial->c_str());
            return -1;
        }
        return 0;
    } catch (const std::exception& e) {
        PyErr_SetString(PyExc_PermissionError, e.what());
        return -1;
    }
}

bool installed = false;

}  // namespace

void GuestGuard::install() {
    if (installed) {
        return;
    }
    if (PySys_AddAuditHook(&auditHook, nullptr) < 0) {
        PyErr_Clear();
        throw std::runtime_error("Interpreter refused the sandbox audit hook");
    }
    installed = true;
    spdlog::debug("Sandbox audit hook installed");
}

void GuestGuard::arm(AccessPolicy access) {
    guardState().emplace(GuardState{std::move(access)});
}

bool GuestGuard::isArmed() noexcept { return guardState().has_value(); }

}  // namespace enclave::guest
