// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <shared_mutex>
#include <utility>

#include "artport/core/logging.hpp"
#include "artport/util/synchronized_value.hpp"

namespace artport
{
    auto log_level_parse(std::string_view name) -> std::optional<log_level>
    {
        for (auto level : { log_level::trace,
                            log_level::debug,
                            log_level::info,
                            log_level::warn,
                            log_level::err,
                            log_level::critical,
                            log_level::off,
                            log_level::all })
        {
            if (name == name_of(level))
            {
                return level;
            }
        }
        return std::nullopt;
    }
}

namespace artport::logging
{
    namespace details
    {
        util::synchronized_value<LoggingParams, std::shared_mutex>& logging_params()
        {
            static util::synchronized_value<LoggingParams, std::shared_mutex> params;
            return params;
        }

        AnyLogHandler& current_log_handler()
        {
            static AnyLogHandler handler;
            return handler;
        }
    }

    auto set_log_handler(AnyLogHandler new_handler, std::optional<LoggingParams> maybe_new_params)
        -> AnyLogHandler
    {
        auto& current = details::current_log_handler();
        if (current)
        {
            current.stop_log_handling();
        }

        auto previous_handler = std::exchange(current, std::move(new_handler));

        auto params = details::logging_params().synchronize();
        if (maybe_new_params)
        {
            *params = std::move(*maybe_new_params);
        }

        if (current)
        {
            current.start_log_handling(*params);
        }

        return previous_handler;
    }

    auto get_log_handler() -> AnyLogHandler&
    {
        return details::current_log_handler();
    }

    auto set_log_level(log_level new_level) -> log_level
    {
        auto synched_params = details::logging_params().synchronize();
        const auto previous_level = synched_params->logging_level;
        synched_params->logging_level = new_level;
        if (auto& handler = details::current_log_handler())
        {
            handler.set_log_level(new_level);
        }
        return previous_level;
    }

    auto get_log_level() -> log_level
    {
        return details::logging_params()->logging_level;
    }

    auto get_logging_params() -> LoggingParams
    {
        return details::logging_params().value();
    }

    auto log(LogRecord record) -> void
    {
        auto& handler = details::current_log_handler();
        if (!handler)
        {
            return;
        }
        // BEWARE: `get_log_level()` takes a shared lock, only call it once we have a handler.
        const auto level = get_log_level();
        if (level == log_level::off || (level != log_level::all && record.level < level))
        {
            return;
        }
        handler.log(std::move(record));
    }

    auto flush_logs() -> void
    {
        if (auto& handler = details::current_log_handler())
        {
            handler.flush();
        }
    }

    ///////////////////////////////////////////////////////////////////
    // MessageLogger

    MessageLogger::MessageLogger(log_level level, std::source_location location)
        : m_level(level)
        , m_location(std::move(location))
    {
    }

    MessageLogger::~MessageLogger()
    {
        log(LogRecord{
            .message = m_stream.str(),
            .level = m_level,
            .location = std::move(m_location),
        });
    }
}
