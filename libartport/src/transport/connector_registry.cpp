// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <iterator>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "artport/core/logging.hpp"
#include "artport/transport/connector_registry.hpp"

namespace artport::transport
{
    namespace
    {
        auto invalid_connector(std::string message) -> tl::unexpected<artport_error>
        {
            LOG_DEBUG << "Rejected connector: " << message;
            return make_unexpected(message, artport_error_code::invalid_connector);
        }
    }

    ConnectorRegistry::ConnectorRegistry()
        : m_connectors{ std::make_shared<const LocalFileConnector>() }
        , m_valid_schemes{ std::string(LocalFileConnector::scheme) }
    {
    }

    ConnectorRegistry::ConnectorRegistry(ConnectorRegistry&& other)
        : ConnectorRegistry()
    {
        std::swap(m_connectors, other.m_connectors);
        std::swap(m_valid_schemes, other.m_valid_schemes);
    }

    ConnectorRegistry& ConnectorRegistry::operator=(ConnectorRegistry&& other)
    {
        if (this != &other)
        {
            auto fresh = ConnectorRegistry();
            m_connectors = std::exchange(other.m_connectors, std::move(fresh.m_connectors));
            m_valid_schemes = std::exchange(other.m_valid_schemes, std::move(fresh.m_valid_schemes));
        }
        return *this;
    }

    auto ConnectorRegistry::from_providers(const std::vector<ConnectorProvider>& providers)
        -> expected_t<ConnectorRegistry>
    {
        auto registry = ConnectorRegistry();
        for (const auto& provider : providers)
        {
            if (auto res = registry.register_provider(provider); !res)
            {
                return forward_error(res);
            }
        }
        return { std::move(registry) };
    }

    auto ConnectorRegistry::register_connector(connector_ptr connector) -> expected_t<void>
    {
        if (connector == nullptr)
        {
            return invalid_connector("Cannot register a null connector");
        }

        const auto& schemes = connector->supported_schemes();
        if (schemes.empty())
        {
            return invalid_connector(
                fmt::format("Connector '{}' does not support any repository protocol", connector->name())
            );
        }

        for (const auto& scheme : schemes)
        {
            if (scheme == LocalFileConnector::scheme)
            {
                return invalid_connector(fmt::format(
                    "Connector '{}' cannot serve the reserved repository protocol '{}'",
                    connector->name(),
                    scheme
                ));
            }
            const auto owner = std::find_if(
                m_connectors.cbegin(),
                m_connectors.cend(),
                [&scheme](const auto& registered) { return registered->supports_scheme(scheme); }
            );
            if (owner != m_connectors.cend())
            {
                return invalid_connector(fmt::format(
                    "Repository protocol '{}' of connector '{}' is already provided by connector '{}'",
                    scheme,
                    connector->name(),
                    (*owner)->name()
                ));
            }
        }

        LOG_DEBUG << fmt::format(
            "Registered connector '{}' for protocols [{}]",
            connector->name(),
            fmt::join(schemes, ", ")
        );
        m_valid_schemes = set_union(m_valid_schemes, schemes);
        m_connectors.push_back(std::move(connector));
        return {};
    }

    auto ConnectorRegistry::register_provider(const ConnectorProvider& provider) -> expected_t<void>
    {
        if (!provider)
        {
            return invalid_connector("Cannot register an empty connector provider");
        }
        for (auto& connector : provider())
        {
            if (auto res = register_connector(std::move(connector)); !res)
            {
                return res;
            }
        }
        return {};
    }

    auto ConnectorRegistry::all_valid_schemes() const -> const specs::SchemeSet&
    {
        return m_valid_schemes;
    }

    auto ConnectorRegistry::connectors() const -> const connector_list&
    {
        return m_connectors;
    }

    auto ConnectorRegistry::local_file_connector() const -> const connector_ptr&
    {
        return m_connectors.front();
    }

    auto ConnectorRegistry::is_local_file_connector(const ConnectorDescriptor& connector) const
        -> bool
    {
        return &connector == local_file_connector().get();
    }

    auto ConnectorRegistry::connectors_serving(const specs::SchemeSet& schemes) const
        -> connector_list
    {
        auto out = connector_list();
        std::copy_if(
            m_connectors.cbegin(),
            m_connectors.cend(),
            std::back_inserter(out),
            [&schemes](const auto& connector)
            { return !set_is_disjoint_of(connector->supported_schemes(), schemes); }
        );
        return out;
    }

    auto ConnectorRegistry::find_connector(const specs::SchemeSet& schemes) const -> connector_ptr
    {
        const auto serving = connectors_serving(schemes);
        if ((serving.size() == 1) && set_is_superset_of(serving.front()->supported_schemes(), schemes))
        {
            return serving.front();
        }
        return nullptr;
    }
}
