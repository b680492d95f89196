/*
 * forwarding_sink.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Sink handing raw records to a callback, used by the
worker to relay its log lines to the host process

**************************************************/

#ifndef ENCLAVE_LOGGING_SINKS_FORWARDING_SINK_HPP
#define ENCLAVE_LOGGING_SINKS_FORWARDING_SINK_HPP

#include <functional>
#include <mutex>
#include <string>

#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/base_sink.h>

namespace enclave::logging {

using ForwardCallback =
    std::function<void(spdlog::level::level_enum, const std::string&)>;

/**
 * @brief Passes each record's level and raw payload to a callback
 *
 * The callback runs under the sink mutex and must not log through a
 * logger that owns this sink.
 */
template <typename Mutex>
class ForwardingSink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit ForwardingSink(ForwardCallback callback)
        : callback_(std::move(callback)) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (callback_) {
            callback_(msg.level,
                      std::string(msg.payload.data(), msg.payload.size()));
        }
    }

    void flush_() override {}

private:
    ForwardCallback callback_;
};

using ForwardingSinkMt = ForwardingSink<std::mutex>;

}  // namespace enclave::logging

#endif  // ENCLAVE_LOGGING_SINKS_FORWARDING_SINK_HPP
