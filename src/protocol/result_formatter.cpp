/*
 * result_formatter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "result_formatter.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>

namespace enclave::protocol {

namespace {

std::string formatNumber(double number) {
    if (std::isnan(number)) {
        return "NaN";
    }
    if (std::isinf(number)) {
        return number > 0 ? "Infinity" : "-Infinity";
    }
    return fmt::format("{}", number);
}

}  // namespace

std::string formatResult(const nlohmann::json& value) {
    using value_t = nlohmann::json::value_t;

    switch (value.type()) {
        case value_t::null:
            return "null";
        case value_t::discarded:
            return "undefined";
        case value_t::string:
            return value.get<std::string>();
        case value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case value_t::number_float:
            return formatNumber(value.get<double>());
        case value_t::number_integer:
        case value_t::number_unsigned:
            return value.dump();
        case value_t::array:
            try {
                return value.dump();
            } catch (const nlohmann::json::exception& e) {
                spdlog::debug("Array result is not serializable: {}", e.what());
                return std::string(kArrayTag);
            }
        case value_t::object:
        case value_t::binary:
            try {
                return value.dump(2);
            } catch (const nlohmann::json::exception& e) {
                spdlog::debug("Object result is not serializable: {}", e.what());
                return std::string(kObjectTag);
            }
    }
    return std::string(kObjectTag);
}

std::string formatResult(const std::optional<nlohmann::json>& value) {
    if (!value) {
        return "undefined";
    }
    return formatResult(*value);
}

}  // namespace enclave::protocol
