/*
 * resource_monitor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "resource_monitor.hpp"

#include <charconv>
#include <fstream>
#include <string>
#include <string_view>

namespace enclave::worker {

namespace {

/// Parses the kB figure of a "Key:   1234 kB" status line
std::optional<size_t> statusKilobytes(std::string_view line, std::string_view key) {
    if (!line.starts_with(key)) {
        return std::nullopt;
    }
    line.remove_prefix(key.size());
    auto digits = line.find_first_of("0123456789");
    if (digits == std::string_view::npos) {
        return std::nullopt;
    }
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(line.data() + digits, line.data() + line.size(), value);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return value * 1024;
}

}  // namespace

std::optional<MemorySample> ResourceMonitor::sample(int processId) {
    if (processId <= 0) {
        return std::nullopt;
    }
    std::ifstream status("/proc/" + std::to_string(processId) + "/status");
    if (!status) {
        return std::nullopt;
    }

    MemorySample result;
    bool sawResident = false;
    std::string line;
    while (std::getline(status, line)) {
        if (auto rss = statusKilobytes(line, "VmRSS:")) {
            result.residentBytes = *rss;
            sawResident = true;
        } else if (auto hwm = statusKilobytes(line, "VmHWM:")) {
            result.peakBytes = *hwm;
        }
    }
    // Zombies keep a status file without memory lines
    if (!sawResident) {
        return std::nullopt;
    }
    return result;
}

}  // namespace enclave::worker
