// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <tuple>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "artport/transport/transport.hpp"
#include "artport/util/tuple_hash.hpp"

namespace artport::transport
{
    namespace
    {
        auto attrs(const TransportKey& key)
        {
            return std::tie(key.schemes, key.credentials, key.authentication);
        }
    }

    auto operator==(const TransportKey& a, const TransportKey& b) -> bool
    {
        return attrs(a) == attrs(b);
    }

    auto operator!=(const TransportKey& a, const TransportKey& b) -> bool
    {
        return !(a == b);
    }

    /*************************************
     * ValidatedTransport implementation *
     *************************************/

    ValidatedTransport::ValidatedTransport(
        transport::connector_ptr connector,
        bool is_local,
        specs::SchemeSet schemes,
        specs::NormalizedCredentials credentials,
        specs::AuthenticationSet authentication
    )
        : m_connector(std::move(connector))
        , m_key{ std::move(schemes), std::move(credentials), std::move(authentication) }
        , m_is_local(is_local)
    {
    }

    auto ValidatedTransport::connector() const -> const ConnectorDescriptor&
    {
        return *m_connector;
    }

    auto ValidatedTransport::shared_connector() const -> const transport::connector_ptr&
    {
        return m_connector;
    }

    auto ValidatedTransport::is_local() const -> bool
    {
        return m_is_local;
    }

    auto ValidatedTransport::schemes() const -> const specs::SchemeSet&
    {
        return m_key.schemes;
    }

    auto ValidatedTransport::credentials() const -> const specs::NormalizedCredentials&
    {
        return m_key.credentials;
    }

    auto ValidatedTransport::authentication() const -> const specs::AuthenticationSet&
    {
        return m_key.authentication;
    }

    auto ValidatedTransport::password_credentials() const -> expected_t<specs::PasswordCredentials>
    {
        if (!m_key.credentials)
        {
            return make_unexpected(
                fmt::format(
                    "Credentials must be an instance of: {}",
                    specs::CredentialsKind::password
                ),
                artport_error_code::invalid_credentials_type
            );
        }
        return specs::to_password_credentials(*m_key.credentials);
    }

    auto ValidatedTransport::key() const -> const TransportKey&
    {
        return m_key;
    }

    auto build_transport(
        transport::connector_ptr connector,
        bool is_local,
        specs::SchemeSet schemes,
        specs::NormalizedCredentials credentials,
        specs::AuthenticationSet authentication
    ) -> transport_ptr
    {
        return std::make_shared<const ValidatedTransport>(
            std::move(connector),
            is_local,
            std::move(schemes),
            std::move(credentials),
            std::move(authentication)
        );
    }

    void to_json(nlohmann::json& j, const ValidatedTransport& transport)
    {
        j["connector"] = transport.connector().name();
        j["local"] = transport.is_local();
        j["schemes"] = std::vector<std::string>(transport.schemes().begin(), transport.schemes().end());
        if (const auto& creds = transport.credentials())
        {
            j["credentials"] = *creds;
        }
        else
        {
            j["credentials"] = nullptr;
        }
        j["authentication"] = std::vector<specs::AuthenticationKind>(
            transport.authentication().begin(),
            transport.authentication().end()
        );
    }
}

auto
std::hash<artport::transport::TransportKey>::operator()(const artport::transport::TransportKey& key
) const -> std::size_t
{
    return artport::util::hash_vals(key.schemes, key.credentials, key.authentication);
}
