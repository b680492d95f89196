/*
 * python_host.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "python_host.hpp"
#include "access_policy.hpp"
#include "guest_guard.hpp"
#include "traceback.hpp"
#include "virtual_fs.hpp"

#include <pybind11/embed.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace py = pybind11;

namespace enclave::guest {

namespace {

constexpr const char* SCRIPT_FILENAME = "<script>";

/**
 * @brief Attribute replacements that are put back, newest first, on
 *        destruction
 */
class AttributePatches {
public:
    AttributePatches() = default;

    ~AttributePatches() {
        for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
            try {
                if (it->existed) {
                    py::setattr(it->owner, it->name.c_str(), it->value);
                } else if (py::hasattr(it->owner, it->name.c_str())) {
                    py::delattr(it->owner, it->name.c_str());
                }
            } catch (const py::error_already_set& e) {
                spdlog::error("Failed to restore {}: {}", it->name, e.what());
            }
        }
    }

    AttributePatches(const AttributePatches&) = delete;
    AttributePatches& operator=(const AttributePatches&) = delete;

    void replace(const py::handle& owner, const char* name, py::object value) {
        Saved saved{py::reinterpret_borrow<py::object>(owner), name, py::none(), false};
        saved.existed = py::hasattr(saved.owner, name);
        if (saved.existed) {
            saved.value = saved.owner.attr(name);
        }
        saved_.push_back(std::move(saved));
        py::setattr(owner, name, std::move(value));
    }

private:
    struct Saved {
        py::object owner;
        std::string name;
        py::object value;
        bool existed;
    };
    std::vector<Saved> saved_;
};

/// Host location of a virtual str or PathLike path; other values pass through
py::object hostPath(const VirtualFilesystem& vfs, const py::object& value) {
    py::object path = value;
    if (!py::isinstance<py::str>(path)) {
        if (!py::hasattr(path, "__fspath__")) {
            return value;
        }
        path = path.attr("__fspath__")();
        if (!py::isinstance<py::str>(path)) {
            return value;
        }
    }
    auto mapped = vfs.mapGuestPath(path.cast<std::string>());
    if (!mapped) {
        return value;
    }
    if (!*mapped) {
        PyErr_SetString(PyExc_PermissionError, mapped->error().message.c_str());
        throw py::error_already_set();
    }
    return py::str((*mapped)->string());
}

/**
 * @brief Wrap a path-taking callable so its path arguments are mapped
 *
 * @param positions Positional indexes holding paths
 * @param keywords Keyword names holding paths
 */
py::object remapping(py::object original, VirtualFilesystem vfs, std::vector<size_t> positions,
                     std::vector<std::string> keywords) {
    return py::cpp_function([original = std::move(original), vfs = std::move(vfs),
                             positions = std::move(positions), keywords = std::move(keywords)](
                                py::args args, py::kwargs kwargs) -> py::object {
        py::list adjusted(args);
        for (auto index : positions) {
            if (index < adjusted.size()) {
                py::object current = adjusted[index];
                adjusted[index] = hostPath(vfs, current);
            }
        }
        for (const auto& key : keywords) {
            if (kwargs.contains(key)) {
                py::object current = kwargs[key.c_str()];
                kwargs[key.c_str()] = hostPath(vfs, current);
            }
        }
        return original(*py::tuple(adjusted), **kwargs);
    });
}

/**
 * @brief Point every path entry of builtins, io and os at the sandbox
 *
 * os.path, shutil and pathlib look these functions up on the os and io
 * modules at call time, so they follow the same mapping.
 */
void redirectPaths(AttributePatches& patches, const py::module_& builtins, const py::module_& io,
                   const py::module_& os, const VirtualFilesystem& vfs) {
    patches.replace(builtins, "open", remapping(builtins.attr("open"), vfs, {0}, {"file"}));
    patches.replace(io, "open", remapping(io.attr("open"), vfs, {0}, {"file"}));

    for (const char* name : {"open", "stat", "lstat", "listdir", "scandir", "mkdir", "remove",
                             "unlink", "rmdir", "access", "chdir", "utime", "chmod",
                             "truncate"}) {
        if (py::hasattr(os, name)) {
            patches.replace(os, name, remapping(os.attr(name), vfs, {0}, {"path"}));
        }
    }
    for (const char* name : {"rename", "replace"}) {
        patches.replace(os, name, remapping(os.attr(name), vfs, {0, 1}, {"src", "dst"}));
    }
}

/**
 * @brief builtins.__import__ that refuses modules the policy blocks
 *
 * Only imports issued by guest code (its globals, or none at all) are
 * judged; libraries keep their own imports.
 */
py::object guardImports(py::object original, py::dict guestGlobals,
                        protocol::GuestPolicy policy) {
    return py::cpp_function([original = std::move(original), guestGlobals = std::move(guestGlobals),
                             policy = std::move(policy)](py::args args,
                                                         py::kwargs kwargs) -> py::object {
        if (args.size() > 0 && py::isinstance<py::str>(args[0])) {
            py::object globals = py::none();
            if (args.size() > 1) {
                globals = py::object(args[1]);
            } else if (kwargs.contains("globals")) {
                globals = py::object(kwargs["globals"]);
            }
            int level = 0;
            if (args.size() > 4) {
                level = args[4].cast<int>();
            } else if (kwargs.contains("level")) {
                level = kwargs["level"].cast<int>();
            }

            if (level == 0 && (globals.is_none() || globals.is(guestGlobals))) {
                if (auto denial = policy.importDenial(args[0].cast<std::string>())) {
                    PyErr_SetString(PyExc_ImportError, denial->c_str());
                    throw py::error_already_set();
                }
            }
        }
        return original(*args, **kwargs);
    });
}

}  // namespace

class PythonHost::Impl {
public:
    explicit Impl(protocol::GuestPolicy policy) : policy_(std::move(policy)) {
        auto builtins = py::module_::import("builtins");
        auto sys = py::module_::import("sys");

        // type("_SandboxExit", (Exception,), {})
        sentinel_ = builtins.attr("type")(std::string(SANDBOX_EXIT_TYPE),
                                          py::make_tuple(builtins.attr("Exception")),
                                          py::dict());

        py::object sentinel = sentinel_;
        exitFunction_ = py::cpp_function(
            [sentinel](py::object code) -> py::object {
                PyErr_SetObject(sentinel.ptr(), py::make_tuple(code).ptr());
                throw py::error_already_set();
            },
            py::arg("code") = py::none());

        sys.attr("dont_write_bytecode") = true;
        tempfile_ = py::module_::import("tempfile");
        // ctypes dlopens libpython on import, which the armed guard refuses
        try {
            py::module_::import("ctypes");
        } catch (const py::error_already_set& e) {
            spdlog::debug("ctypes unavailable: {}", e.what());
        }

        collectReadablePaths(sys);
        GuestGuard::install();

        spdlog::info("Embedded Python {} initialized", pythonVersion());
    }

    std::string pythonVersion() const {
        return py::module_::import("platform").attr("python_version")().cast<std::string>();
    }

    void addSitePath(const std::filesystem::path& directory) {
        py::list path = py::module_::import("sys").attr("path");
        path.attr("insert")(0, directory.string());
        readablePaths_.push_back(directory);
    }

    bool isDistributionInstalled(std::string_view distribution) const {
        auto metadata = py::module_::import("importlib.metadata");
        try {
            metadata.attr("version")(std::string(distribution));
            return true;
        } catch (const py::error_already_set& e) {
            if (!e.matches(metadata.attr("PackageNotFoundError"))) {
                spdlog::debug("Metadata lookup for {} failed: {}", distribution, e.what());
            }
            return false;
        }
    }

    void invalidateImportCaches() {
        py::module_::import("importlib").attr("invalidate_caches")();
    }

    RunOutcome run(const std::string& code, const nlohmann::json& context,
                   const std::vector<std::string>& argv, const VirtualFilesystem& vfs) {
        RunOutcome outcome;
        try {
            auto sys = py::module_::import("sys");
            auto builtins = py::module_::import("builtins");
            auto os = py::module_::import("os");
            auto io = py::module_::import("io");

            GuestGuard::arm(AccessPolicy(vfs.root(), readablePaths_));
            os.attr("chdir")(vfs.root().string());

            py::dict globals;
            globals["__builtins__"] = builtins;
            globals["__name__"] = "__main__";

            py::object stdoutBuffer = io.attr("StringIO")();
            py::object stderrBuffer = io.attr("StringIO")();
            {
                AttributePatches patches;
                patches.replace(sys, "stdout", stdoutBuffer);
                patches.replace(sys, "stderr", stderrBuffer);
                patches.replace(sys, "argv", py::cast(argv));
                patches.replace(sys, "exit", exitFunction_);
                patches.replace(os, "_exit", exitFunction_);
                patches.replace(builtins, "exit", exitFunction_);
                patches.replace(builtins, "quit", exitFunction_);
                patches.replace(builtins, "__import__",
                                guardImports(builtins.attr("__import__"), globals, policy_));
                patches.replace(tempfile_, "tempdir", py::str((vfs.root() / "tmp").string()));
                redirectPaths(patches, builtins, io, os, vfs);

                execute(code, context, globals, builtins, outcome);
            }
            outcome.output = stdoutBuffer.attr("getvalue")().cast<std::string>();
            outcome.errorOutput += stderrBuffer.attr("getvalue")().cast<std::string>();
        } catch (const py::error_already_set& e) {
            spdlog::error("Interpreter failure outside guest code: {}", e.what());
            outcome.error = e.what();
        }
        return outcome;
    }

private:
    /// Interpreter library directories plus public system data; read-only to guests
    void collectReadablePaths(const py::module_& sys) {
        readablePaths_ = publicReadPaths();
        py::dict paths = py::module_::import("sysconfig").attr("get_paths")();
        for (const char* key : {"stdlib", "platstdlib", "purelib", "platlib"}) {
            if (paths.contains(key)) {
                readablePaths_.emplace_back(paths[key].cast<std::string>());
            }
        }
        py::list path = sys.attr("path");
        for (auto entry : path) {
            if (py::isinstance<py::str>(entry)) {
                std::filesystem::path directory(entry.cast<std::string>());
                if (directory.is_absolute()) {
                    readablePaths_.push_back(std::move(directory));
                }
            }
        }
    }

    void execute(const std::string& code, const nlohmann::json& context, py::dict& globals,
                 const py::module_& builtins, RunOutcome& outcome) {
        try {
            auto loads = py::module_::import("json").attr("loads");
            if (context.is_object()) {
                for (const auto& [key, value] : context.items()) {
                    globals[py::str(key)] = loads(value.dump(
                        -1, ' ', false, nlohmann::json::error_handler_t::replace));
                }
            }
        } catch (const py::error_already_set& e) {
            outcome.error = std::string("Failed to inject context: ") + e.what();
            return;
        }

        try {
            auto ast = py::module_::import("ast");
            py::object tree = ast.attr("parse")(code, SCRIPT_FILENAME, "exec");
            py::list body = tree.attr("body");

            py::object lastExpression = py::none();
            if (py::len(body) > 0 && py::isinstance(body[py::len(body) - 1], ast.attr("Expr"))) {
                py::object last = body.attr("pop")();
                lastExpression = ast.attr("Expression")(last.attr("value"));
            }

            builtins.attr("exec")(builtins.attr("compile")(tree, SCRIPT_FILENAME, "exec"),
                                  globals);
            if (!lastExpression.is_none()) {
                py::object value = builtins.attr("eval")(
                    builtins.attr("compile")(lastExpression, SCRIPT_FILENAME, "eval"), globals);
                if (!value.is_none()) {
                    outcome.value = py::str(value).cast<std::string>();
                }
            }
        } catch (py::error_already_set& e) {
            if (e.matches(sentinel_)) {
                outcome.exitCode = exitCode(e.value(), outcome);
            } else {
                outcome.error = formatException(e);
            }
        }
    }

    /// Python's own rules: None is 0, an int is itself, anything else is 1
    static int exitCode(const py::object& exception, RunOutcome& outcome) {
        py::tuple args = exception.attr("args");
        if (py::len(args) == 0 || args[0].is_none()) {
            return 0;
        }
        py::object code = args[0];
        if (py::isinstance<py::int_>(code)) {
            return code.cast<int>();
        }
        outcome.errorOutput += py::str(code).cast<std::string>() + "\n";
        return 1;
    }

    static std::string formatException(py::error_already_set& e) {
        try {
            auto traceback = py::module_::import("traceback");
            py::object trace = e.trace() ? py::reinterpret_borrow<py::object>(e.trace())
                                         : py::object(py::none());
            py::list lines = traceback.attr("format_exception")(e.type(), e.value(), trace);
            std::string text = py::str("").attr("join")(lines).cast<std::string>();
            while (!text.empty() && text.back() == '\n') text.pop_back();
            return text;
        } catch (const py::error_already_set&) {
            return e.what();
        }
    }

    // Declared first so it is destroyed last
    py::scoped_interpreter interpreter_;
    protocol::GuestPolicy policy_;
    py::object sentinel_;
    py::object exitFunction_;
    py::module_ tempfile_;
    std::vector<std::filesystem::path> readablePaths_;
};

// ============================================================================
// PythonHost Implementation
// ============================================================================

PythonHost::PythonHost(protocol::GuestPolicy policy) {
    try {
        pImpl_ = std::make_unique<Impl>(std::move(policy));
    } catch (const py::error_already_set& e) {
        throw std::runtime_error(std::string("Python initialization failed: ") + e.what());
    }
}

PythonHost::~PythonHost() = default;

std::string PythonHost::pythonVersion() const { return pImpl_->pythonVersion(); }

void PythonHost::addSitePath(const std::filesystem::path& directory) {
    pImpl_->addSitePath(directory);
}

bool PythonHost::isDistributionInstalled(std::string_view distribution) const {
    return pImpl_->isDistributionInstalled(distribution);
}

void PythonHost::invalidateImportCaches() { pImpl_->invalidateImportCaches(); }

RunOutcome PythonHost::run(const std::string& code, const nlohmann::json& context,
                           const std::vector<std::string>& argv,
                           const VirtualFilesystem& vfs) {
    return pImpl_->run(code, context, argv, vfs);
}

}  // namespace enclave::guest
