// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "artport/transport/connector.hpp"

namespace artport::transport
{
    /**************************************
     * ConnectorDescriptor implementation *
     **************************************/

    auto ConnectorDescriptor::supports_scheme(std::string_view scheme) const -> bool
    {
        return supported_schemes().contains(std::string(scheme));
    }

    auto ConnectorDescriptor::supports_authentication(specs::AuthenticationKind kind) const -> bool
    {
        return supported_authentication().contains(kind);
    }

    /**********************************
     * StaticConnector implementation *
     **********************************/

    StaticConnector::StaticConnector(
        std::string name,
        specs::SchemeSet schemes,
        specs::AuthenticationSet authentication
    )
        : m_name(std::move(name))
        , m_schemes(std::move(schemes))
        , m_authentication(std::move(authentication))
    {
    }

    auto StaticConnector::name() const -> std::string_view
    {
        return m_name;
    }

    auto StaticConnector::supported_schemes() const -> const specs::SchemeSet&
    {
        return m_schemes;
    }

    auto StaticConnector::supported_authentication() const -> const specs::AuthenticationSet&
    {
        return m_authentication;
    }

    auto make_connector(
        std::string name,
        specs::SchemeSet schemes,
        specs::AuthenticationSet authentication
    ) -> connector_ptr
    {
        return std::make_shared<const StaticConnector>(
            std::move(name),
            std::move(schemes),
            std::move(authentication)
        );
    }

    /*************************************
     * LocalFileConnector implementation *
     *************************************/

    LocalFileConnector::LocalFileConnector()
        : m_schemes{ std::string(scheme) }
    {
    }

    auto LocalFileConnector::name() const -> std::string_view
    {
        return scheme;
    }

    auto LocalFileConnector::supported_schemes() const -> const specs::SchemeSet&
    {
        return m_schemes;
    }

    auto LocalFileConnector::supported_authentication() const -> const specs::AuthenticationSet&
    {
        return m_authentication;
    }
}
