// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_CORE_LOGGING_SPDLOG_HPP
#define ARTPORT_CORE_LOGGING_SPDLOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/common.h>

#include "artport/core/logging.hpp"

namespace artport::logging::spdlogimpl
{
    /**
     * @returns The provided `log_level` value converted to the equivalent value for `spdlog`.
     *
     * ``log_level::all`` lets every record through, which is ``spdlog::level::trace``.
     */
    inline constexpr auto to_spdlog(log_level level) -> spdlog::level::level_enum
    {
        static_assert(
            static_cast<int>(log_level::off) == static_cast<int>(spdlog::level::level_enum::off)
        );
        if (level == log_level::all)
        {
            return spdlog::level::trace;
        }
        return static_cast<spdlog::level::level_enum>(level);
    }

    /** `LogHandler` implementation using `spdlog` library.

        Translates the calls specified by `artport::logging::LogHandler` into calls to
        `spdlog`'s API. The logger itself is owned by the `spdlog` registry.
    */
    class LogHandler_spdlog
    {
    public:

        static constexpr std::string_view logger_name = "artport";

        LogHandler_spdlog();
        ~LogHandler_spdlog();

        LogHandler_spdlog(const LogHandler_spdlog& other) = delete;
        LogHandler_spdlog& operator=(const LogHandler_spdlog& other) = delete;

        LogHandler_spdlog(LogHandler_spdlog&& other) noexcept;
        LogHandler_spdlog& operator=(LogHandler_spdlog&& other) noexcept;

        auto start_log_handling(LoggingParams params) -> void;
        auto stop_log_handling() -> void;
        auto set_log_level(log_level new_level) -> void;
        auto log(LogRecord record) -> void;
        auto flush() -> void;

        auto is_started() const -> bool;

    private:

        struct Impl;
        std::unique_ptr<Impl> pimpl;
    };

    static_assert(logging::LogHandler<LogHandler_spdlog>);
}

#endif
