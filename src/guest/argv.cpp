/*
 * argv.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "argv.hpp"

#include <algorithm>

namespace enclave::guest {

std::vector<std::string> buildArgv(const nlohmann::json& context,
                                   const ArgvConvention& convention) {
    std::vector<std::string> argv{convention.scriptName};
    if (!context.is_object()) {
        return argv;
    }

    for (const auto& [key, value] : context.items()) {
        std::string flag = "--" + key;
        if (convention.hyphenateKeys) {
            std::replace(flag.begin() + 2, flag.end(), '_', '-');
        }

        if (value.is_null()) continue;
        if (value.is_boolean()) {
            if (value.get<bool>()) argv.push_back(std::move(flag));
            continue;
        }

        argv.push_back(std::move(flag));
        argv.push_back(value.is_string() ? value.get<std::string>()
                                         : value.dump(-1, ' ', false,
                                                      nlohmann::json::error_handler_t::replace));
    }
    return argv;
}

}  // namespace enclave::guest
