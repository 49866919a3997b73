// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_CORE_CONFIGURATION_HPP
#define ARTPORT_CORE_CONFIGURATION_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "artport/core/error_handling.hpp"
#include "artport/core/logging.hpp"
#include "artport/specs/authentication.hpp"
#include "artport/specs/credentials.hpp"
#include "artport/specs/repository_request.hpp"
#include "artport/transport/connector.hpp"
#include "artport/transport/connector_registry.hpp"
#include "artport/transport/transport_factory.hpp"

namespace artport
{
    /**
     * A connector declared in a configuration file, on top of the stock ones.
     */
    struct ConnectorDeclaration
    {
        std::string name;
        specs::SchemeSet schemes;
        specs::AuthenticationSet authentication = {};
    };

    /**
     * A repository as declared by the user.
     */
    struct RepositoryDeclaration
    {
        std::string name;
        std::vector<std::string> urls;
        std::optional<specs::CredentialsValue> credentials = std::nullopt;
        specs::AuthenticationSet authentication = {};

        /**
         * The transport request for this repository.
         *
         * The schemes are taken from every URL, locations without a scheme being local paths.
         */
        [[nodiscard]] auto to_request() const -> specs::RepositoryRequest;
    };

    struct Configuration
    {
        LoggingParams logging = {};
        transport::TransportFactoryParams transport = {};
        std::vector<ConnectorDeclaration> connectors = {};
        std::vector<RepositoryDeclaration> repositories = {};
    };

    /**
     * Read a YAML configuration.
     *
     * Every key is optional:
     *
     * @code{.yaml}
     * logging:
     *   level: debug
     * transport:
     *   cache: true
     * connectors:
     *   - name: artifactory
     *     schemes: [arti]
     *     authentication: [basic]
     * repositories:
     *   - name: internal
     *     urls: [https://repo.example.com/maven]
     *     credentials: { type: password, username: user, password: secret }
     *     authentication: [basic]
     * @endcode
     *
     * Fails with ``invalid_configuration`` on YAML syntax errors, malformed nodes, and unknown
     * level or authentication names.
     * The credentials type is not checked here but when the transport is created.
     */
    [[nodiscard]] auto parse_configuration(std::string_view yaml) -> expected_t<Configuration>;

    [[nodiscard]] auto load_configuration(const std::filesystem::path& file)
        -> expected_t<Configuration>;

    /** A provider for the connectors declared in @p config. */
    [[nodiscard]] auto configuration_connector_provider(const Configuration& config)
        -> transport::ConnectorProvider;

    /** A registry with the stock connectors followed by the ones declared in @p config. */
    [[nodiscard]] auto make_registry(const Configuration& config)
        -> expected_t<std::shared_ptr<const transport::ConnectorRegistry>>;
}
#endif
