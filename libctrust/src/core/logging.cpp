// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <mutex>
#include <shared_mutex>

#include <fmt/format.h>

#include "ctrust/core/logging.hpp"
#include "ctrust/util/synchronized_value.hpp"

namespace ctrust::logging
{
    namespace details
    {
        util::synchronized_value<LoggingParams, std::shared_mutex> logging_params;
        AnyLogHandler current_log_handler;
    }

    AnyLogHandler::~AnyLogHandler()
    {
        // A handler still registered while being destroyed is only possible at program exit.
        if (has_value() and this == &details::current_log_handler)
        {
            try
            {
                m_storage->stop_log_handling();
            }
            catch (const std::exception& error)
            {
                std::cerr << fmt::format(
                    "ctrust::logging termination failure: call to `stop_log_handling()` ended with an error: {}",
                    error.what()
                ) << std::endl;
            }
        }
    }

    auto AnyLogHandler::start_log_handling(LoggingParams params, std::vector<log_source> sources)
        -> void
    {
        m_storage->start_log_handling(std::move(params), std::move(sources));
    }

    auto AnyLogHandler::stop_log_handling() -> void
    {
        m_storage->stop_log_handling();
    }

    auto AnyLogHandler::set_log_level(log_level new_level) -> void
    {
        m_storage->set_log_level(new_level);
    }

    auto AnyLogHandler::set_params(LoggingParams new_params) -> void
    {
        m_storage->set_params(std::move(new_params));
    }

    auto AnyLogHandler::log(LogRecord record) -> void
    {
        m_storage->log(std::move(record));
    }

    auto AnyLogHandler::flush(std::optional<log_source> source) -> void
    {
        m_storage->flush(source);
    }

    auto AnyLogHandler::has_value() const noexcept -> bool
    {
        return m_storage != nullptr;
    }

    auto AnyLogHandler::type_id() const noexcept -> std::optional<std::type_index>
    {
        if (m_storage)
        {
            return m_storage->type_id();
        }
        return {};
    }

    auto set_log_handler(AnyLogHandler new_handler, std::optional<LoggingParams> maybe_new_params)
        -> AnyLogHandler
    {
        if (details::current_log_handler)
        {
            details::current_log_handler.stop_log_handling();
        }

        auto previous_handler = std::exchange(details::current_log_handler, std::move(new_handler));

        auto params = details::logging_params.synchronize();
        if (maybe_new_params)
        {
            *params = *maybe_new_params;
        }

        if (details::current_log_handler)
        {
            details::current_log_handler.start_log_handling(*params, all_log_sources());
        }

        return previous_handler;
    }

    auto stop_logging() -> AnyLogHandler
    {
        return set_log_handler({});
    }

    auto get_log_handler() -> AnyLogHandler&
    {
        return details::current_log_handler;
    }

    auto set_log_level(log_level new_level) -> log_level
    {
        auto synched_params = details::logging_params.synchronize();
        const auto previous_level = synched_params->logging_level;
        synched_params->logging_level = new_level;
        if (details::current_log_handler)
        {
            details::current_log_handler.set_log_level(new_level);
        }
        return previous_level;
    }

    auto get_log_level() -> log_level
    {
        return details::logging_params->logging_level;
    }

    auto get_logging_params() -> LoggingParams
    {
        return details::logging_params.value();
    }

    auto set_logging_params(LoggingParams new_params) -> LoggingParams
    {
        auto synched_params = details::logging_params.synchronize();
        auto previous_params = std::exchange(*synched_params, std::move(new_params));
        if (details::current_log_handler)
        {
            details::current_log_handler.set_params(*synched_params);
        }
        return previous_params;
    }

    auto log(LogRecord record) -> void
    {
        if (auto& handler = get_log_handler())
        {
            handler.log(std::move(record));
        }
    }

    auto flush_logs(std::optional<log_source> source) -> void
    {
        if (auto& handler = get_log_handler())
        {
            handler.flush(source);
        }
    }

    MessageLogger::MessageLogger(log_level level, std::source_location location)
        : m_level(level)
        , m_location(std::move(location))
    {
    }

    MessageLogger::~MessageLogger()
    {
        log({ m_stream.str(), m_level, log_source::libctrust, std::move(m_location) });
    }
}
