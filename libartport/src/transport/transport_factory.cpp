// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cassert>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "artport/core/logging.hpp"
#include "artport/transport/authentication_validator.hpp"
#include "artport/transport/scheme_resolver.hpp"
#include "artport/transport/transport_factory.hpp"

namespace artport::transport
{
    namespace
    {
        template <typename T>
        auto log_rejection(
            const expected_t<T>& res,
            const specs::SchemeSet& schemes,
            const std::optional<std::string>& repository_name
        ) -> const expected_t<T>&
        {
            if (!res)
            {
                LOG_DEBUG << fmt::format(
                    "Rejected transport for repository '{}' with protocols [{}]: {} ({})",
                    repository_name.value_or("<unnamed>"),
                    fmt::join(schemes, ", "),
                    res.error().what(),
                    name_of(res.error().error_code())
                );
            }
            return res;
        }
    }

    TransportFactory::TransportFactory(registry_ptr registry, TransportFactoryParams params)
        : m_registry(std::move(registry))
        , m_params(std::move(params))
    {
        assert(m_registry != nullptr);
    }

    auto TransportFactory::create_transport(const specs::RepositoryRequest& request) const
        -> expected_t<transport_ptr>
    {
        return create_transport(
            request.schemes,
            request.repository_name,
            request.credentials,
            request.authentication
        );
    }

    auto TransportFactory::create_transport(
        const specs::SchemeSet& schemes,
        const std::optional<std::string>& repository_name,
        const std::optional<specs::CredentialsValue>& credentials,
        const specs::AuthenticationSet& authentication
    ) const -> expected_t<transport_ptr>
    {
        const auto connector = resolve_connector(*m_registry, schemes, repository_name);
        if (!log_rejection(connector, schemes, repository_name))
        {
            return forward_error(connector);
        }

        const auto normalized = specs::normalize_credentials(credentials);
        if (!log_rejection(normalized, schemes, repository_name))
        {
            return forward_error(normalized);
        }

        const auto validated = validate_authentication(
            **connector,
            schemes,
            *normalized,
            authentication
        );
        if (!log_rejection(validated, schemes, repository_name))
        {
            return forward_error(validated);
        }

        const bool is_local = m_registry->is_local_file_connector(**connector);
        auto build = [&]()
        { return build_transport(*connector, is_local, schemes, *normalized, *validated); };

        if (!m_params.cache_transports)
        {
            return build();
        }
        return m_cache.get_or_create(TransportKey{ schemes, *normalized, *validated }, build);
    }

    auto TransportFactory::registry() const -> const ConnectorRegistry&
    {
        return *m_registry;
    }

    auto TransportFactory::params() const -> const TransportFactoryParams&
    {
        return m_params;
    }

    auto TransportFactory::cache() const -> const TransportCache&
    {
        return m_cache;
    }
}
