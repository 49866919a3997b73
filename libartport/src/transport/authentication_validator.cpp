// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "artport/core/logging.hpp"
#include "artport/transport/authentication_validator.hpp"

namespace artport::transport
{
    auto validate_authentication(
        const ConnectorDescriptor& connector,
        const specs::SchemeSet& schemes,
        const specs::NormalizedCredentials& credentials,
        const specs::AuthenticationSet& authentication
    ) -> expected_t<specs::AuthenticationSet>
    {
        if (authentication.empty())
        {
            return { authentication };
        }

        if (!credentials.has_value())
        {
            return make_unexpected(
                "You cannot configure authentication protocols for a repository if no credentials are provided.",
                artport_error_code::missing_credentials
            );
        }

        for (const auto kind : authentication)
        {
            if (!connector.supports_authentication(kind))
            {
                return make_unexpected(
                    fmt::format(
                        "Authentication type of '{}' is not supported by protocols [{}]",
                        specs::authentication_kind_name(kind),
                        fmt::join(schemes, ", ")
                    ),
                    artport_error_code::unsupported_authentication
                );
            }
        }

        const auto creds_kind = specs::credentials_kind(*credentials);
        for (const auto kind : authentication)
        {
            if (!specs::authentication_accepts(kind, creds_kind))
            {
                return make_unexpected(
                    fmt::format(
                        "Credentials type of '{}' is not supported by authentication protocol '{}'",
                        specs::credentials_kind_name(creds_kind),
                        specs::authentication_kind_name(kind)
                    ),
                    artport_error_code::incompatible_credentials
                );
            }
        }

        LOG_TRACE << fmt::format(
            "Authentication [{}] accepted by connector '{}'",
            fmt::join(authentication, ", "),
            connector.name()
        );
        return { authentication };
    }
}
