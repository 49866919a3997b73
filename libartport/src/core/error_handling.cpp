// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "artport/core/error_handling.hpp"

namespace artport
{
    auto name_of(artport_error_code ec) noexcept -> std::string_view
    {
        switch (ec)
        {
            case artport_error_code::unsupported_scheme:
                return "unsupported_scheme";
            case artport_error_code::mixed_schemes:
                return "mixed_schemes";
            case artport_error_code::invalid_credentials_type:
                return "invalid_credentials_type";
            case artport_error_code::missing_credentials:
                return "missing_credentials";
            case artport_error_code::unsupported_authentication:
                return "unsupported_authentication";
            case artport_error_code::incompatible_credentials:
                return "incompatible_credentials";
            case artport_error_code::invalid_connector:
                return "invalid_connector";
            case artport_error_code::invalid_configuration:
                return "invalid_configuration";
            case artport_error_code::unknown:
                break;
        }
        return "unknown";
    }

    artport_error::artport_error(const std::string& msg, artport_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    artport_error::artport_error(const char* msg, artport_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    auto artport_error::error_code() const noexcept -> artport_error_code
    {
        return m_error_code;
    }

    auto make_unexpected(const char* msg, artport_error_code ec) -> tl::unexpected<artport_error>
    {
        return tl::make_unexpected(artport_error(msg, ec));
    }

    auto make_unexpected(const std::string& msg, artport_error_code ec)
        -> tl::unexpected<artport_error>
    {
        return tl::make_unexpected(artport_error(msg, ec));
    }
}
