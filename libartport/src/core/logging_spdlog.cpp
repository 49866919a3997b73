// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>
#include <string>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "artport/core/logging_spdlog.hpp"

namespace artport::logging::spdlogimpl
{
    struct LogHandler_spdlog::Impl
    {
        std::shared_ptr<spdlog::logger> logger;
        std::atomic_bool is_active{ false };
    };

    LogHandler_spdlog::LogHandler_spdlog()
        : pimpl(std::make_unique<Impl>())
    {
    }

    LogHandler_spdlog::~LogHandler_spdlog() = default;

    LogHandler_spdlog::LogHandler_spdlog(LogHandler_spdlog&& other) noexcept = default;
    LogHandler_spdlog& LogHandler_spdlog::operator=(LogHandler_spdlog&& other) noexcept = default;

    auto LogHandler_spdlog::start_log_handling(LoggingParams params) -> void
    {
        assert(pimpl);
        const auto name = std::string(logger_name);

        // A previous handler may have left its logger registered.
        spdlog::drop(name);

        auto logger = std::make_shared<spdlog::logger>(
            name,
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
        );
        logger->set_formatter(std::make_unique<spdlog::pattern_formatter>(
            params.log_pattern,
            spdlog::pattern_time_type::local
        ));
        logger->set_level(to_spdlog(params.logging_level));
        logger->flush_on(spdlog::level::err);
        spdlog::register_logger(logger);

        pimpl->logger = std::move(logger);
        pimpl->is_active = true;
    }

    auto LogHandler_spdlog::stop_log_handling() -> void
    {
        if (not pimpl)
        {
            return;
        }
        if (pimpl->logger)
        {
            pimpl->logger->flush();
            spdlog::drop(pimpl->logger->name());
            pimpl->logger.reset();
        }
        pimpl->is_active = false;
    }

    auto LogHandler_spdlog::set_log_level(log_level new_level) -> void
    {
        if (pimpl->logger)
        {
            pimpl->logger->set_level(to_spdlog(new_level));
        }
    }

    auto LogHandler_spdlog::log(LogRecord record) -> void
    {
        if (!pimpl->logger)
        {
            return;
        }
        pimpl->logger->log(
            spdlog::source_loc{
                record.location.file_name(),
                static_cast<int>(record.location.line()),
                record.location.function_name(),
            },
            to_spdlog(record.level),
            record.message
        );
    }

    auto LogHandler_spdlog::flush() -> void
    {
        if (pimpl->logger)
        {
            pimpl->logger->flush();
        }
    }

    auto LogHandler_spdlog::is_started() const -> bool
    {
        return pimpl and pimpl->is_active;
    }
}
