// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_CORE_LOGGING_TOOLS_HPP
#define CTRUST_CORE_LOGGING_TOOLS_HPP

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

#include "ctrust/core/logging.hpp"
#include "ctrust/util/synchronized_value.hpp"

namespace ctrust::logging
{
    struct LogHandler_History_Options  // not nested type because clang and gcc dont like it
    {
        std::size_t max_records_count = 0;
        bool clear_on_stop = true;
    };

    /** `LogHandler` that retains `LogRecord`s in order of being logged.

        Holds at most `max_records_count` records if non-zero, otherwise all of them.
        All operations are thread-safe except move operations.
    */
    class LogHandler_History
    {
    public:

        using Options = LogHandler_History_Options;

        LogHandler_History(Options options = Options{});

        LogHandler_History(const LogHandler_History& other) = delete;
        LogHandler_History& operator=(const LogHandler_History& other) = delete;

        LogHandler_History(LogHandler_History&& other) noexcept = default;
        LogHandler_History& operator=(LogHandler_History&& other) noexcept = default;

        auto start_log_handling(LoggingParams params, const std::vector<log_source>&) -> void;
        auto stop_log_handling() -> void;

        auto set_log_level(log_level new_level) -> void;
        auto set_params(LoggingParams new_params) -> void;

        auto log(LogRecord record) -> void;

        auto flush(std::optional<log_source> source = {}) -> void;

        /** @returns A copy of the current log record history.
                     The history is empty if `is_started() == false`.
        */
        [[nodiscard]] auto capture_history() const -> std::vector<LogRecord>;

        auto clear_history() -> void;

        [[nodiscard]] auto is_started() const -> bool;

    private:

        struct Impl
        {
            util::synchronized_value<std::deque<LogRecord>> history;
            std::atomic<log_level> current_log_level = log_level::info;
        };

        std::unique_ptr<Impl> pimpl;
        Options options;
    };

    static_assert(LogHandler<LogHandler_History>);

    ////////////////////////////////////////////////////////////////////////////////////////////////

    inline LogHandler_History::LogHandler_History(Options options_)
        : options(std::move(options_))
    {
    }

    inline auto
    LogHandler_History::start_log_handling(LoggingParams params, const std::vector<log_source>&)
        -> void
    {
        if (not pimpl)
        {
            pimpl = std::make_unique<Impl>();
        }
        pimpl->current_log_level = params.logging_level;
    }

    inline auto LogHandler_History::stop_log_handling() -> void
    {
        if (options.clear_on_stop)
        {
            pimpl.reset();
        }
    }

    inline auto LogHandler_History::set_log_level(log_level new_level) -> void
    {
        if (pimpl)
        {
            pimpl->current_log_level = new_level;
        }
    }

    inline auto LogHandler_History::set_params(LoggingParams new_params) -> void
    {
        set_log_level(new_params.logging_level);
    }

    inline auto LogHandler_History::log(LogRecord record) -> void
    {
        if (not pimpl or record.level < pimpl->current_log_level.load())
        {
            return;
        }

        auto history = pimpl->history.synchronize();
        history->push_back(std::move(record));
        if (options.max_records_count > 0 and history->size() > options.max_records_count)
        {
            history->pop_front();
        }
    }

    inline auto LogHandler_History::flush(std::optional<log_source>) -> void
    {
        // nothing to flush
    }

    inline auto LogHandler_History::capture_history() const -> std::vector<LogRecord>
    {
        if (not pimpl)
        {
            return {};
        }
        auto history = pimpl->history.synchronize();
        return { history->begin(), history->end() };
    }

    inline auto LogHandler_History::clear_history() -> void
    {
        if (pimpl)
        {
            pimpl->history->clear();
        }
    }

    inline auto LogHandler_History::is_started() const -> bool
    {
        return pimpl != nullptr;
    }
}

#endif
