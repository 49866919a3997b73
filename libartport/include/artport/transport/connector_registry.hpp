// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_TRANSPORT_CONNECTOR_REGISTRY_HPP
#define ARTPORT_TRANSPORT_CONNECTOR_REGISTRY_HPP

#include <memory>
#include <vector>

#include "artport/core/error_handling.hpp"
#include "artport/transport/connector.hpp"

namespace artport::transport
{
    /**
     * The collection of connectors a process can use.
     *
     * Populated at startup through `register_connector`, then shared as
     * ``std::shared_ptr<const ConnectorRegistry>``: every operation available on a
     * ``const`` registry is safe to call concurrently.
     *
     * The local file handler is always present and always comes first in `connectors()`.
     */
    class ConnectorRegistry
    {
    public:

        ConnectorRegistry();

        ConnectorRegistry(const ConnectorRegistry&) = delete;
        ConnectorRegistry& operator=(const ConnectorRegistry&) = delete;

        /** A moved-from registry is left as a newly constructed one, holding the local file handler. */
        ConnectorRegistry(ConnectorRegistry&& other);
        ConnectorRegistry& operator=(ConnectorRegistry&& other);

        /**
         * Register every descriptor of every provider, in order.
         */
        [[nodiscard]] static auto from_providers(const std::vector<ConnectorProvider>& providers)
            -> expected_t<ConnectorRegistry>;

        /**
         * Add a descriptor.
         *
         * Fails with ``invalid_connector`` if the descriptor is null, advertises no scheme,
         * advertises the reserved "file" scheme, or advertises a scheme already served by
         * another registered connector.
         */
        auto register_connector(connector_ptr connector) -> expected_t<void>;

        auto register_provider(const ConnectorProvider& provider) -> expected_t<void>;

        /** ``{"file"}`` union every registered scheme, sorted. */
        [[nodiscard]] auto all_valid_schemes() const -> const specs::SchemeSet&;

        /** Every registered connector, the local file handler first. */
        [[nodiscard]] auto connectors() const -> const connector_list&;

        [[nodiscard]] auto local_file_connector() const -> const connector_ptr&;

        [[nodiscard]] auto is_local_file_connector(const ConnectorDescriptor& connector) const
            -> bool;

        /** Every registered connector serving at least one scheme of @p schemes, in order. */
        [[nodiscard]] auto connectors_serving(const specs::SchemeSet& schemes) const
            -> connector_list;

        /**
         * The single connector serving every scheme of @p schemes, if any.
         *
         * Returns null when no connector or more than one connector is involved.
         */
        [[nodiscard]] auto find_connector(const specs::SchemeSet& schemes) const -> connector_ptr;

    private:

        connector_list m_connectors;
        specs::SchemeSet m_valid_schemes;
    };
}
#endif
