// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_CORE_LOGGING_SPDLOG_HPP
#define CTRUST_CORE_LOGGING_SPDLOG_HPP

#include <memory>
#include <optional>
#include <vector>

#include <spdlog/common.h>

#include "ctrust/core/logging.hpp"

namespace ctrust::logging::spdlogimpl
{
    /// @returns The provided `log_level` value converted to the equivalent value for `spdlog`.
    inline constexpr auto to_spdlog(log_level level) -> spdlog::level::level_enum
    {
        static_assert(
            static_cast<int>(log_level::all) == static_cast<int>(spdlog::level::level_enum::n_levels)
        );
        return static_cast<spdlog::level::level_enum>(level);
    }

    /** `LogHandler` implementation using `spdlog` library.

        One logger is registered per `log_source`, all writing to the standard error with the
        pattern from `LoggingParams`. Loggers are owned by the `spdlog` registry.

        @see `ctrust::logging::LogHandler`
    */
    class LogHandler_spdlog
    {
    public:

        LogHandler_spdlog();
        ~LogHandler_spdlog();

        LogHandler_spdlog(const LogHandler_spdlog& other) = delete;
        LogHandler_spdlog& operator=(const LogHandler_spdlog& other) = delete;

        LogHandler_spdlog(LogHandler_spdlog&& other) noexcept;
        LogHandler_spdlog& operator=(LogHandler_spdlog&& other) noexcept;

        auto start_log_handling(LoggingParams params, std::vector<log_source> sources) -> void;
        auto stop_log_handling() -> void;

        auto set_log_level(log_level new_level) -> void;
        auto set_params(LoggingParams new_params) -> void;

        auto log(LogRecord record) -> void;

        auto flush(std::optional<log_source> source = {}) -> void;

        [[nodiscard]] auto is_started() const -> bool;

    private:

        struct Impl;
        std::unique_ptr<Impl> pimpl;
    };

    static_assert(logging::LogHandler<LogHandler_spdlog>);
}

#endif
