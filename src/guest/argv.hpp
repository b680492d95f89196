/*
 * argv.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file argv.hpp
 * @brief Command line synthesis for guest scripts
 * @date 2024
 * @version 1.0.0
 */

#ifndef ENCLAVE_GUEST_ARGV_HPP
#define ENCLAVE_GUEST_ARGV_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace enclave::guest {

/**
 * @brief How request context becomes sys.argv
 *
 * Scripts written for argparse read their parameters from sys.argv, so the
 * context map is also rendered as a command line:
 *
 *   argv[0]      scriptName
 *   "a_b": "x"   --a-b x        (underscores become hyphens)
 *   "v": true    --v            (bare flag)
 *   "v": false   (omitted)
 *   "v": null    (omitted)
 *   "n": 3       --n 3          (non-strings as compact JSON)
 *
 * Keys keep the context's iteration order.
 */
struct ArgvConvention {
    std::string scriptName{"script.py"};
    bool hyphenateKeys{true};
};

/**
 * @brief Build sys.argv from a context object
 * @param context JSON object; anything else yields just the script name
 */
[[nodiscard]] std::vector<std::string> buildArgv(const nlohmann::json& context,
                                                 const ArgvConvention& convention = {});

}  // namespace enclave::guest

#endif  // ENCLAVE_GUEST_ARGV_HPP
