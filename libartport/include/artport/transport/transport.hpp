// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_TRANSPORT_TRANSPORT_HPP
#define ARTPORT_TRANSPORT_TRANSPORT_HPP

#include <functional>
#include <memory>

#include <nlohmann/json_fwd.hpp>

#include "artport/core/error_handling.hpp"
#include "artport/specs/authentication.hpp"
#include "artport/specs/credentials.hpp"
#include "artport/specs/repository_request.hpp"
#include "artport/transport/connector.hpp"

namespace artport::transport
{
    /**
     * Identity of a transport: two requests with equal keys get the same transport.
     */
    struct TransportKey
    {
        specs::SchemeSet schemes;
        specs::NormalizedCredentials credentials;
        specs::AuthenticationSet authentication;
    };

    auto operator==(const TransportKey& a, const TransportKey& b) -> bool;
    auto operator!=(const TransportKey& a, const TransportKey& b) -> bool;

    /**
     * A connector together with the credentials and authentication it was validated with.
     *
     * Immutable once built, and handed out as a ``std::shared_ptr<const ValidatedTransport>``
     * to the network clients.
     */
    class ValidatedTransport
    {
    public:

        ValidatedTransport(
            transport::connector_ptr connector,
            bool is_local,
            specs::SchemeSet schemes,
            specs::NormalizedCredentials credentials,
            specs::AuthenticationSet authentication
        );

        [[nodiscard]] auto connector() const -> const ConnectorDescriptor&;
        [[nodiscard]] auto shared_connector() const -> const transport::connector_ptr&;

        /** True if the repository is accessed through the local file handler. */
        [[nodiscard]] auto is_local() const -> bool;

        [[nodiscard]] auto schemes() const -> const specs::SchemeSet&;
        [[nodiscard]] auto credentials() const -> const specs::NormalizedCredentials&;
        [[nodiscard]] auto authentication() const -> const specs::AuthenticationSet&;

        /**
         * The credentials as username and password, for clients only speaking that.
         *
         * Fails with ``invalid_credentials_type`` if there are other credentials, or none.
         */
        [[nodiscard]] auto password_credentials() const -> expected_t<specs::PasswordCredentials>;

        [[nodiscard]] auto key() const -> const TransportKey&;

    private:

        transport::connector_ptr m_connector;
        TransportKey m_key;
        bool m_is_local;
    };

    using transport_ptr = std::shared_ptr<const ValidatedTransport>;

    /**
     * Assemble a transport from already validated parts.
     */
    [[nodiscard]] auto build_transport(
        transport::connector_ptr connector,
        bool is_local,
        specs::SchemeSet schemes,
        specs::NormalizedCredentials credentials,
        specs::AuthenticationSet authentication
    ) -> transport_ptr;

    /**
     * Serialize with secrets hidden.
     */
    void to_json(nlohmann::json& j, const ValidatedTransport& transport);
}

template <>
struct std::hash<artport::transport::TransportKey>
{
    auto operator()(const artport::transport::TransportKey& key) const -> std::size_t;
};

#endif
