/*
 * traceback.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENCLAVE_GUEST_TRACEBACK_HPP
#define ENCLAVE_GUEST_TRACEBACK_HPP

#include <string>
#include <string_view>

namespace enclave::guest {

/// Name of the exception type raised by the patched exit functions
inline constexpr std::string_view SANDBOX_EXIT_TYPE = "_SandboxExit";

/**
 * @brief Strip Python traceback blocks from captured stderr
 *
 * From a "Traceback (most recent call last):" line on, indented lines,
 * blank lines, "During handling of..." lines, lines mentioning the sandbox
 * exit type and "XxxError:"/"XxxException:" lines are dropped until the
 * first line that is none of those. The result is trimmed.
 */
[[nodiscard]] std::string cleanTraceback(std::string_view stderrText);

/**
 * @brief Failure message for a guest that exited with a non-zero code
 * @param exitCode Code passed to sys.exit
 * @param cleanedStderr Output of cleanTraceback, appended when non-empty
 */
[[nodiscard]] std::string sysExitMessage(int exitCode, std::string_view cleanedStderr);

}  // namespace enclave::guest

#endif  // ENCLAVE_GUEST_TRACEBACK_HPP
