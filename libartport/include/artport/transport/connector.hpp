// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_TRANSPORT_CONNECTOR_HPP
#define ARTPORT_TRANSPORT_CONNECTOR_HPP

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "artport/specs/authentication.hpp"
#include "artport/specs/repository_request.hpp"

namespace artport::transport
{
    /**
     * Capabilities advertised by a network client implementation.
     *
     * Descriptors are registered once at startup and never change afterwards.
     */
    class ConnectorDescriptor
    {
    public:

        virtual ~ConnectorDescriptor() = default;

        ConnectorDescriptor(const ConnectorDescriptor&) = delete;
        ConnectorDescriptor& operator=(const ConnectorDescriptor&) = delete;
        ConnectorDescriptor(ConnectorDescriptor&&) = delete;
        ConnectorDescriptor& operator=(ConnectorDescriptor&&) = delete;

        /** Identifier used in diagnostics and logs. */
        [[nodiscard]] virtual auto name() const -> std::string_view = 0;

        [[nodiscard]] virtual auto supported_schemes() const -> const specs::SchemeSet& = 0;

        [[nodiscard]] virtual auto supported_authentication() const
            -> const specs::AuthenticationSet& = 0;

        [[nodiscard]] auto supports_scheme(std::string_view scheme) const -> bool;
        [[nodiscard]] auto supports_authentication(specs::AuthenticationKind kind) const -> bool;

    protected:

        ConnectorDescriptor() = default;
    };

    using connector_ptr = std::shared_ptr<const ConnectorDescriptor>;
    using connector_list = std::vector<connector_ptr>;

    /** Supplies the descriptors of one family of connectors. */
    using ConnectorProvider = std::function<connector_list()>;

    /**
     * A descriptor with fixed capabilities.
     */
    class StaticConnector final : public ConnectorDescriptor
    {
    public:

        StaticConnector(
            std::string name,
            specs::SchemeSet schemes,
            specs::AuthenticationSet authentication = {}
        );

        [[nodiscard]] auto name() const -> std::string_view override;
        [[nodiscard]] auto supported_schemes() const -> const specs::SchemeSet& override;
        [[nodiscard]] auto supported_authentication() const
            -> const specs::AuthenticationSet& override;

    private:

        std::string m_name;
        specs::SchemeSet m_schemes;
        specs::AuthenticationSet m_authentication;
    };

    [[nodiscard]] auto make_connector(
        std::string name,
        specs::SchemeSet schemes,
        specs::AuthenticationSet authentication = {}
    ) -> connector_ptr;

    /**
     * The built-in handler for the "file" scheme.
     *
     * It supports no authentication.
     */
    class LocalFileConnector final : public ConnectorDescriptor
    {
    public:

        static constexpr std::string_view scheme = "file";

        LocalFileConnector();

        [[nodiscard]] auto name() const -> std::string_view override;
        [[nodiscard]] auto supported_schemes() const -> const specs::SchemeSet& override;
        [[nodiscard]] auto supported_authentication() const
            -> const specs::AuthenticationSet& override;

    private:

        specs::SchemeSet m_schemes;
        specs::AuthenticationSet m_authentication;
    };
}
#endif
