/*
 * traceback.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "traceback.hpp"

#include <fmt/format.h>

#include <cctype>
#include <vector>

namespace enclave::guest {

namespace {

/// Matches ^\w+(Error|Exception):
bool isExceptionLine(std::string_view line) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) return false;

    auto name = line.substr(0, colon);
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return name.ends_with("Error") || name.ends_with("Exception");
}

bool isTracebackNoise(std::string_view line) {
    return line.empty() || line.starts_with("  ") || line.starts_with('\t') ||
           line.starts_with("During handling of") ||
           line.find(SANDBOX_EXIT_TYPE) != std::string_view::npos || isExceptionLine(line);
}

std::string_view trim(std::string_view text) {
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && isSpace(text.front())) text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back())) text.remove_suffix(1);
    return text;
}

}  // namespace

std::string cleanTraceback(std::string_view stderrText) {
    std::vector<std::string_view> kept;
    bool inTraceback = false;

    size_t start = 0;
    while (start <= stderrText.size()) {
        auto end = stderrText.find('\n', start);
        if (end == std::string_view::npos) end = stderrText.size();
        auto line = stderrText.substr(start, end - start);
        start = end + 1;

        if (line.starts_with("Traceback (most recent call last):")) {
            inTraceback = true;
            continue;
        }
        if (inTraceback) {
            if (isTracebackNoise(line)) continue;
            inTraceback = false;
        }
        kept.push_back(line);
    }

    std::string joined;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) joined += '\n';
        joined += kept[i];
    }
    return std::string(trim(joined));
}

std::string sysExitMessage(int exitCode, std::string_view cleanedStderr) {
    auto message = fmt::format(
        "Script called sys.exit({}). This typically means argparse could not parse the "
        "provided arguments. Make sure to pass the required arguments as key-value pairs in "
        "the \"arguments\" object — they are injected as --key value in sys.argv "
        "(underscores become hyphens).",
        exitCode);
    if (!cleanedStderr.empty()) {
        message += fmt::format("\n\nScript stderr:\n{}", cleanedStderr);
    }
    return message;
}

}  // namespace enclave::guest
