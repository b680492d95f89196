/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

namespace enclave::worker {

std::optional<IsolationLevel> isolationLevelFromString(std::string_view name) {
    if (name == "subprocess") return IsolationLevel::Subprocess;
    if (name == "sandboxed") return IsolationLevel::Sandboxed;
    return std::nullopt;
}

}  // namespace enclave::worker
