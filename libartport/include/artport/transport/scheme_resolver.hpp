// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_TRANSPORT_SCHEME_RESOLVER_HPP
#define ARTPORT_TRANSPORT_SCHEME_RESOLVER_HPP

#include <optional>
#include <string_view>

#include "artport/core/error_handling.hpp"
#include "artport/specs/repository_request.hpp"
#include "artport/transport/connector_registry.hpp"

namespace artport::transport
{
    /**
     * Select the single connector serving every requested scheme.
     *
     * Fails with ``unsupported_scheme`` if a scheme is served by no connector (the message
     * lists every valid scheme, sorted), and with ``mixed_schemes`` if the schemes are served by
     * more than one connector, the local file handler included.
     */
    [[nodiscard]] auto resolve_connector(
        const ConnectorRegistry& registry,
        const specs::SchemeSet& schemes,
        const std::optional<std::string>& repository_name = std::nullopt
    ) -> expected_t<connector_ptr>;
}
#endif
