// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "artport/core/logging.hpp"
#include "artport/transport/scheme_resolver.hpp"

namespace artport::transport
{
    namespace
    {
        auto unsupported_scheme(
            const ConnectorRegistry& registry,
            std::string_view scheme,
            const std::optional<std::string>& repository_name
        ) -> tl::unexpected<artport_error>
        {
            const auto valid = fmt::format("[{}]", fmt::join(registry.all_valid_schemes(), ", "));
            auto message = std::string();
            if (repository_name)
            {
                message = fmt::format(
                    "Not a supported repository protocol '{}' for repository '{}': valid protocols are {}",
                    scheme,
                    *repository_name,
                    valid
                );
            }
            else
            {
                message = fmt::format(
                    "Not a supported repository protocol '{}': valid protocols are {}",
                    scheme,
                    valid
                );
            }
            return make_unexpected(message, artport_error_code::unsupported_scheme);
        }
    }

    auto resolve_connector(
        const ConnectorRegistry& registry,
        const specs::SchemeSet& schemes,
        const std::optional<std::string>& repository_name
    ) -> expected_t<connector_ptr>
    {
        const auto& valid = registry.all_valid_schemes();

        if (schemes.empty())
        {
            return make_unexpected(
                fmt::format("No repository protocol declared: valid protocols are [{}]", fmt::join(valid, ", ")),
                artport_error_code::unsupported_scheme
            );
        }

        for (const auto& scheme : schemes)
        {
            if (!valid.contains(scheme))
            {
                return unsupported_scheme(registry, scheme, repository_name);
            }
        }

        const auto candidates = registry.connectors_serving(schemes);

        if (candidates.size() > 1)
        {
            return make_unexpected(
                "You cannot mix different URL schemes for a single repository. "
                "Please declare separate repositories.",
                artport_error_code::mixed_schemes
            );
        }

        if (candidates.empty())
        {
            return unsupported_scheme(registry, schemes.front(), repository_name);
        }

        const auto& connector = candidates.front();
        const auto uncovered = set_difference(schemes, connector->supported_schemes());
        if (!uncovered.empty())
        {
            return unsupported_scheme(registry, uncovered.front(), repository_name);
        }

        LOG_DEBUG << fmt::format(
            "Protocols [{}] are served by connector '{}'",
            fmt::join(schemes, ", "),
            connector->name()
        );
        return { connector };
    }
}
