// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_TRANSPORT_TRANSPORT_FACTORY_HPP
#define ARTPORT_TRANSPORT_TRANSPORT_FACTORY_HPP

#include <memory>
#include <optional>
#include <string>

#include "artport/core/error_handling.hpp"
#include "artport/specs/repository_request.hpp"
#include "artport/transport/connector_registry.hpp"
#include "artport/transport/transport.hpp"
#include "artport/transport/transport_cache.hpp"

namespace artport::transport
{
    struct TransportFactoryParams
    {
        /** Hand out the same transport for equivalent requests. */
        bool cache_transports = true;
    };

    /**
     * Decide whether a transport may serve a repository, and which one.
     *
     * A request goes through four stages, the first failing stage being reported:
     *
     * 1. `resolve_connector` selects the connector serving every scheme,
     * 2. `specs::normalize_credentials` checks the credentials type,
     * 3. `validate_authentication` checks authentication against connector and credentials,
     * 4. `build_transport` assembles the result.
     *
     * Scheme errors therefore take precedence over credentials errors.
     * The factory can be shared between threads.
     */
    class TransportFactory
    {
    public:

        using registry_ptr = std::shared_ptr<const ConnectorRegistry>;

        explicit TransportFactory(registry_ptr registry, TransportFactoryParams params = {});

        [[nodiscard]] auto create_transport(const specs::RepositoryRequest& request) const
            -> expected_t<transport_ptr>;

        [[nodiscard]] auto create_transport(
            const specs::SchemeSet& schemes,
            const std::optional<std::string>& repository_name,
            const std::optional<specs::CredentialsValue>& credentials,
            const specs::AuthenticationSet& authentication
        ) const -> expected_t<transport_ptr>;

        [[nodiscard]] auto registry() const -> const ConnectorRegistry&;
        [[nodiscard]] auto params() const -> const TransportFactoryParams&;
        [[nodiscard]] auto cache() const -> const TransportCache&;

    private:

        registry_ptr m_registry;
        TransportFactoryParams m_params;
        mutable TransportCache m_cache;
    };
}
#endif
