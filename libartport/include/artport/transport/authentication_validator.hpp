// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_TRANSPORT_AUTHENTICATION_VALIDATOR_HPP
#define ARTPORT_TRANSPORT_AUTHENTICATION_VALIDATOR_HPP

#include "artport/core/error_handling.hpp"
#include "artport/specs/authentication.hpp"
#include "artport/specs/credentials.hpp"
#include "artport/specs/repository_request.hpp"
#include "artport/transport/connector.hpp"

namespace artport::transport
{
    /**
     * Check the declared authentication against the connector and the credentials.
     *
     * Rules are checked in this order, the first violation being reported:
     *
     * 1. Declaring authentication without credentials fails with ``missing_credentials``.
     * 2. For each kind, in set order, the connector must support it, else
     *    ``unsupported_authentication``.
     * 3. For each kind, in set order, the credentials kind must be accepted, else
     *    ``incompatible_credentials``.
     *
     * @param schemes The requested schemes, only used in diagnostics.
     * @return The validated authentication set.
     */
    [[nodiscard]] auto validate_authentication(
        const ConnectorDescriptor& connector,
        const specs::SchemeSet& schemes,
        const specs::NormalizedCredentials& credentials,
        const specs::AuthenticationSet& authentication
    ) -> expected_t<specs::AuthenticationSet>;
}
#endif
