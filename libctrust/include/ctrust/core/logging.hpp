// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_CORE_LOGGING_HPP
#define CTRUST_CORE_LOGGING_HPP

#include <array>
#include <concepts>
#include <memory>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   ctrust::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(ctrust::log_level::trace)
#define LOG_DEBUG       LOG(ctrust::log_level::debug)
#define LOG_INFO        LOG(ctrust::log_level::info)
#define LOG_WARNING     LOG(ctrust::log_level::warn)
#define LOG_ERROR       LOG(ctrust::log_level::err)
#define LOG_CRITICAL    LOG(ctrust::log_level::critical)
// clang-format on

namespace ctrust
{
    /** Level of logging, used to filter out logs which are at a lower level than the current one.
        @see `ctrust::LoggingParams`
        @see `ctrust::logging::LogRecord`
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        // Special values:
        off,
        all
    };

    inline constexpr auto operator<=>(log_level left, log_level right) noexcept
    {
        return static_cast<int>(left) <=> static_cast<int>(right);
    }

    /// @returns The name of the specified log level as an UTF-8 null-terminated string.
    inline constexpr auto name_of(log_level level) noexcept -> const char*
    {
        constexpr std::array names{ "trace", "debug",    "info", "warning",
                                    "error", "critical", "off",  "all" };
        return names[static_cast<std::size_t>(level)];
    }

    /** Parameters for the logging system.
     */
    struct LoggingParams
    {
        /// Minimum level a log record must have to not be filtered out.
        log_level logging_level{ log_level::warn };

        /// Formatting pattern to use in formatted logs.
        std::string log_pattern{ "%^%-9!l%-8n%$ %v" };

        auto operator==(const LoggingParams& other) const noexcept -> bool = default;
    };

    /** Specifies the source a `LogRecord` is originating from.
     */
    enum class log_source
    {
        libctrust,  // default
        tests,      // only used for testing
    };

    /// @returns The name of the specified log source as an UTF-8 null-terminated string.
    inline constexpr auto name_of(log_source source) noexcept -> const char*
    {
        constexpr std::array names{ "libctrust", "tests" };
        return names[static_cast<std::size_t>(source)];
    }

    /// @returns All `log_source` values used by the library.
    inline auto all_log_sources() -> std::vector<log_source>
    {
        return { log_source::libctrust, log_source::tests };
    }

    namespace logging
    {
        // Helper comparison of source locations, to help with testing.
        inline constexpr bool
        operator==(const std::source_location& left, const std::source_location& right)
        {
            return std::string_view(left.file_name()) == std::string_view(right.file_name())
                   && std::string_view(left.function_name())
                          == std::string_view(right.function_name())
                   && left.line() == right.line() && left.column() == right.column();
        }

        /** All the information about a log.

            @see `ctrust::logging::log`
            @see The `LOG_...` macros
         */
        struct LogRecord
        {
            /// Message to be printed/captured in the logging implementation.
            std::string message;

            /// Level of this log. If lower than the current level, this log will be ignored.
            log_level level = log_level::off;

            /// Origin of this log.
            log_source source = log_source::libctrust;

            /// Source location of this log if available, otherwise empty.
            std::source_location location = {};

            auto operator==(const LogRecord& other) const noexcept -> bool = default;
        };

        /** Requirements for types which provide log handling implementations.

            All the required operations must be thread-safe, with the exception of
            `start_log_handling` and `stop_log_handling` which are called by the logging system
            while registering and unregistering the handler.
            The implementation must ignore log records with a lower level than the one last
            provided through `set_log_level` or `set_params`.
         */
        template <typename T>
        concept LogHandler = requires(
            T& handler,
            LoggingParams params,
            std::vector<log_source> sources,
            LogRecord log_record,
            std::optional<log_source> source
        ) {
            handler.start_log_handling(params, sources);
            handler.stop_log_handling();
            handler.set_log_level(params.logging_level);
            handler.set_params(params);
            handler.log(log_record);
            handler.flush(source);
        };

        template <typename T>
        concept LogHandlerPtr = std::is_pointer_v<T> and LogHandler<std::remove_pointer_t<T>>;

        template <typename T>
        concept LogHandlerOrPtr = (LogHandler<T> and std::movable<T>) or LogHandlerPtr<T>;

        /** Stores or refers to a log handler implementation satisfying `LogHandler`.

            When constructed from a pointer, the pointed handler must outlive this object.
         */
        class AnyLogHandler
        {
        public:

            AnyLogHandler() noexcept = default;
            ~AnyLogHandler();

            AnyLogHandler(AnyLogHandler&&) noexcept = default;
            AnyLogHandler& operator=(AnyLogHandler&&) noexcept = default;

            template <LogHandlerOrPtr T>
                requires(not std::is_same_v<std::remove_cvref_t<T>, AnyLogHandler>)
            AnyLogHandler(T handler);

            auto start_log_handling(LoggingParams params, std::vector<log_source> sources) -> void;
            auto stop_log_handling() -> void;
            auto set_log_level(log_level new_level) -> void;
            auto set_params(LoggingParams new_params) -> void;
            auto log(LogRecord record) -> void;
            auto flush(std::optional<log_source> source = {}) -> void;

            [[nodiscard]] auto has_value() const noexcept -> bool;

            explicit operator bool() const noexcept
            {
                return has_value();
            }

            [[nodiscard]] auto type_id() const noexcept -> std::optional<std::type_index>;

        private:

            struct Interface
            {
                virtual ~Interface() = default;
                virtual void start_log_handling(LoggingParams, std::vector<log_source>) = 0;
                virtual void stop_log_handling() = 0;
                virtual void set_log_level(log_level) = 0;
                virtual void set_params(LoggingParams) = 0;
                virtual void log(LogRecord) = 0;
                virtual void flush(std::optional<log_source>) = 0;
                virtual auto type_id() const -> std::type_index = 0;
            };

            template <LogHandlerOrPtr T>
            struct Wrapper : Interface
            {
                T handler;

                explicit Wrapper(T h)
                    : handler(std::move(h))
                {
                }

                auto& impl()
                {
                    if constexpr (std::is_pointer_v<T>)
                    {
                        return *handler;
                    }
                    else
                    {
                        return handler;
                    }
                }

                void start_log_handling(LoggingParams params, std::vector<log_source> sources) override
                {
                    impl().start_log_handling(std::move(params), std::move(sources));
                }

                void stop_log_handling() override
                {
                    impl().stop_log_handling();
                }

                void set_log_level(log_level level) override
                {
                    impl().set_log_level(level);
                }

                void set_params(LoggingParams params) override
                {
                    impl().set_params(std::move(params));
                }

                void log(LogRecord record) override
                {
                    impl().log(std::move(record));
                }

                void flush(std::optional<log_source> source) override
                {
                    impl().flush(source);
                }

                auto type_id() const -> std::type_index override
                {
                    return typeid(T);
                }
            };

            std::unique_ptr<Interface> m_storage;
        };

        template <LogHandlerOrPtr T>
            requires(not std::is_same_v<std::remove_cvref_t<T>, AnyLogHandler>)
        AnyLogHandler::AnyLogHandler(T handler)
            : m_storage(std::make_unique<Wrapper<T>>(std::move(handler)))
        {
        }

        ////////////////////////////////////////////////////////////////////////////////
        // Logging System API

        /** Registers a log handler to use in the logging system, or no log handler.

            The previously registered handler, if any, is stopped before the new one is started
            with the current (or provided) parameters.
            This call is NOT thread-safe.

            @returns The previously registered log handler if any.
        */
        auto
        set_log_handler(AnyLogHandler handler, std::optional<LoggingParams> maybe_new_params = {})
            -> AnyLogHandler;

        /// Equivalent to `set_log_handler({})`.
        auto stop_logging() -> AnyLogHandler;

        /// @returns The currently registered log handler, if any. This call is NOT thread-safe.
        auto get_log_handler() -> AnyLogHandler&;

        /// @returns The previous log level of the logging system.
        auto set_log_level(log_level new_level) -> log_level;

        auto get_log_level() -> log_level;

        auto get_logging_params() -> LoggingParams;

        /// @returns The previous configuration of the logging system.
        auto set_logging_params(LoggingParams new_params) -> LoggingParams;

        /// Sends the record to the registered log handler, if any.
        auto log(LogRecord record) -> void;

        auto flush_logs(std::optional<log_source> source = {}) -> void;

        class MessageLogger
        {
        public:

            MessageLogger(
                log_level level,
                std::source_location location = std::source_location::current()
            );
            ~MessageLogger();

            std::stringstream& stream()
            {
                return m_stream;
            }

        private:

            log_level m_level;
            std::stringstream m_stream;
            std::source_location m_location;
        };
    }
}

#endif
