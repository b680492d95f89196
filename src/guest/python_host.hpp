/*
 * python_host.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file python_host.hpp
 * @brief Embedded CPython interpreter that runs guest scripts
 * @date 2024
 * @version 1.0.0
 *
 * One PythonHost exists per worker process and owns the interpreter for
 * the process lifetime. Every run gets a fresh globals dict; stdout and
 * stderr go to in-memory buffers, the exit functions raise a sentinel
 * exception instead of ending the process, imports are checked against
 * the GuestPolicy, and open() plus the os path functions map the virtual
 * /input, /output and /tmp paths into the sandbox root. All of that is
 * undone when the run returns, however it ends. The GuestGuard audit hook
 * keeps guest code inside the root for the rest of the process.
 */

#ifndef ENCLAVE_GUEST_PYTHON_HOST_HPP
#define ENCLAVE_GUEST_PYTHON_HOST_HPP

#include "protocol/guest_policy.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace enclave::guest {

class VirtualFilesystem;

/**
 * @brief What a single guest run produced
 */
struct RunOutcome {
    std::string output;                 ///< Captured sys.stdout
    std::string errorOutput;            ///< Captured sys.stderr
    std::optional<std::string> value;   ///< str() of the final expression, if not None
    std::optional<int> exitCode;        ///< Set when the guest called an exit function
    std::optional<std::string> error;   ///< Formatted guest exception
};

class PythonHost {
public:
    /**
     * @brief Start the interpreter and register the sandbox audit hook
     * @throws std::runtime_error if the interpreter cannot be set up
     */
    explicit PythonHost(protocol::GuestPolicy policy = {});
    ~PythonHost();

    PythonHost(const PythonHost&) = delete;
    PythonHost& operator=(const PythonHost&) = delete;

    /**
     * @brief e.g. "3.11.2"
     */
    [[nodiscard]] std::string pythonVersion() const;

    /**
     * @brief Put a directory at the front of sys.path
     */
    void addSitePath(const std::filesystem::path& directory);

    /**
     * @brief Check importlib.metadata for an installed distribution
     */
    [[nodiscard]] bool isDistributionInstalled(std::string_view distribution) const;

    /**
     * @brief Make freshly installed packages importable
     */
    void invalidateImportCaches();

    /**
     * @brief Run guest code
     *
     * When the last statement is an expression it is evaluated separately
     * and its str() becomes the value.
     *
     * @param code Python source
     * @param context JSON object; each key becomes a global
     * @param argv sys.argv for the run
     * @param vfs Filesystem the run's paths are mapped into and confined to
     */
    [[nodiscard]] RunOutcome run(const std::string& code, const nlohmann::json& context,
                                 const std::vector<std::string>& argv,
                                 const VirtualFilesystem& vfs);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace enclave::guest

#endif  // ENCLAVE_GUEST_PYTHON_HOST_HPP
