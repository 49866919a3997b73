// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_CORE_LOGGING_HPP
#define ARTPORT_CORE_LOGGING_HPP

#include <array>
#include <cassert>
#include <concepts>
#include <memory>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   artport::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(artport::log_level::trace)
#define LOG_DEBUG       LOG(artport::log_level::debug)
#define LOG_INFO        LOG(artport::log_level::info)
#define LOG_WARNING     LOG(artport::log_level::warn)
#define LOG_ERROR       LOG(artport::log_level::err)
#define LOG_CRITICAL    LOG(artport::log_level::critical)
// clang-format on

namespace artport
{
    /** Level of logging, used to filter out logs which are at a lower level than the current one.
        @see `artport::LoggingParams`
        @see `artport::logging::set_log_level`
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

    /// @returns The level matching a name produced by `name_of`, if any.
    auto log_level_parse(std::string_view name) -> std::optional<log_level>;

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

    namespace logging
    {
        /** All the information about a log.

            @see `artport::logging::log`
            @see The `LOG_...` macros
         */
        struct LogRecord
        {
            /// Message to be printed/captured in the logging implementation.
            std::string message;

            /// Level of this log. If lower than the current level, this log will be ignored.
            log_level level = log_level::off;

            /// Source location of this log if available, otherwise empty.
            std::source_location location = {};
        };

        // clang-format off
        /** Requirements for types which provides log handling implementations.

            Every operation but `start_log_handling` and `stop_log_handling` must be
            thread-safe.
         */
        template <class T>
        concept LogHandler = requires(T& handler)
        {
            handler.start_log_handling(LoggingParams{});
            handler.stop_log_handling();
            handler.set_log_level(log_level::info);
            handler.log(LogRecord{});
            handler.flush();
        };
        // clang-format on

        template <typename T>
        concept LogHandlerPtr = std::is_pointer_v<T> and LogHandler<std::remove_pointer_t<T>>;

        template <typename T>
        concept LogHandlerOrPtr = (LogHandler<T> and std::movable<T>) or LogHandlerPtr<T>;

        /** Stores or refers to a log handler implementation satisfying `LogHandler`.

            A handler passed by value is owned by this object, a handler passed by pointer
            is only referred to and must outlive this object.
        */
        class AnyLogHandler
        {
        public:

            AnyLogHandler() noexcept = default;
            ~AnyLogHandler() = default;

            AnyLogHandler(AnyLogHandler&&) noexcept = default;
            AnyLogHandler& operator=(AnyLogHandler&&) noexcept = default;

            template <class T>
                requires(not std::is_same_v<std::remove_cvref_t<T>, AnyLogHandler>)
                        and LogHandlerOrPtr<std::remove_cvref_t<T>>
            AnyLogHandler(T&& handler);

            auto start_log_handling(LoggingParams params) -> void;
            auto stop_log_handling() -> void;
            auto set_log_level(log_level new_level) -> void;
            auto log(LogRecord record) -> void;
            auto flush() -> void;

            auto has_value() const noexcept -> bool;

            explicit operator bool() const noexcept
            {
                return has_value();
            }

            auto type_id() const noexcept -> std::optional<std::type_index>;

        private:

            struct Interface;

            template <LogHandlerOrPtr T>
            struct Wrapper;

            std::unique_ptr<Interface> m_storage;
        };

        ////////////////////////////////////////////////////////////////////////////////
        // Logging System API

        /** Registers a log handler to use in the logging system, or no log handler.

            The previously registered handler, if any, is stopped; the new one is started
            with the current (or provided) parameters.
            This call is NOT thread-safe.

            @returns The previously registered log handler if any.
        */
        auto
        set_log_handler(AnyLogHandler handler, std::optional<LoggingParams> maybe_new_params = {})
            -> AnyLogHandler;

        /// @returns The currently registered log handler, if any. This call is NOT thread-safe.
        auto get_log_handler() -> AnyLogHandler&;

        /// Changes the logging level. @returns The previous level.
        auto set_log_level(log_level new_level) -> log_level;
        auto get_log_level() -> log_level;

        auto get_logging_params() -> LoggingParams;

        /// Forwards the record to the registered handler if its level is not filtered out.
        auto log(LogRecord record) -> void;

        auto flush_logs() -> void;

        /** Builds a log record through a stream and emits it at destruction. */
        class MessageLogger
        {
        public:

            MessageLogger(
                log_level level,
                std::source_location location = std::source_location::current()
            );
            ~MessageLogger();

            MessageLogger(const MessageLogger&) = delete;
            MessageLogger& operator=(const MessageLogger&) = delete;

            std::stringstream& stream()
            {
                return m_stream;
            }

        private:

            log_level m_level;
            std::stringstream m_stream;
            std::source_location m_location;
        };

        ////////////////////////////////////////////////////////////////////////////////
        // AnyLogHandler implementation

        struct AnyLogHandler::Interface
        {
            virtual ~Interface() = default;
            virtual void start_log_handling(LoggingParams params) = 0;
            virtual void stop_log_handling() = 0;
            virtual void set_log_level(log_level new_level) = 0;
            virtual void log(LogRecord record) = 0;
            virtual void flush() = 0;
            virtual std::type_index type_id() const noexcept = 0;
        };

        template <LogHandler T>
        T& as_ref(T& object)
        {
            return object;
        }

        template <LogHandler T>
        T& as_ref(T* object)
        {
            assert(object);
            return *object;
        }

        template <LogHandlerOrPtr T>
        struct AnyLogHandler::Wrapper : Interface
        {
            T object;

            Wrapper(T new_object)
                : object(std::move(new_object))
            {
            }

            void start_log_handling(LoggingParams params) override
            {
                as_ref(object).start_log_handling(std::move(params));
            }

            void stop_log_handling() override
            {
                as_ref(object).stop_log_handling();
            }

            void set_log_level(log_level new_level) override
            {
                as_ref(object).set_log_level(new_level);
            }

            void log(LogRecord record) override
            {
                as_ref(object).log(std::move(record));
            }

            void flush() override
            {
                as_ref(object).flush();
            }

            std::type_index type_id() const noexcept override
            {
                return typeid(object);
            }
        };

        template <class T>
            requires(not std::is_same_v<std::remove_cvref_t<T>, AnyLogHandler>)
                    and LogHandlerOrPtr<std::remove_cvref_t<T>>
        AnyLogHandler::AnyLogHandler(T&& handler)
            : m_storage(
                  std::make_unique<Wrapper<std::remove_cvref_t<T>>>(std::forward<T>(handler))
              )
        {
        }

        inline auto AnyLogHandler::start_log_handling(LoggingParams params) -> void
        {
            assert(m_storage);
            m_storage->start_log_handling(std::move(params));
        }

        inline auto AnyLogHandler::stop_log_handling() -> void
        {
            assert(m_storage);
            m_storage->stop_log_handling();
        }

        inline auto AnyLogHandler::set_log_level(log_level new_level) -> void
        {
            assert(m_storage);
            m_storage->set_log_level(new_level);
        }

        inline auto AnyLogHandler::log(LogRecord record) -> void
        {
            assert(m_storage);
            m_storage->log(std::move(record));
        }

        inline auto AnyLogHandler::flush() -> void
        {
            assert(m_storage);
            m_storage->flush();
        }

        inline auto AnyLogHandler::has_value() const noexcept -> bool
        {
            return m_storage ? true : false;
        }

        inline auto AnyLogHandler::type_id() const noexcept -> std::optional<std::type_index>
        {
            return has_value() ? std::make_optional(m_storage->type_id()) : std::nullopt;
        }
    }
}

#endif
