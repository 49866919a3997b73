// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "artport/core/configuration.hpp"
#include "artport/transport/default_connectors.hpp"
#include "artport/util/url_manip.hpp"

namespace artport
{
    namespace
    {
        [[noreturn]] void throw_invalid(const std::string& msg)
        {
            throw artport_error(msg, artport_error_code::invalid_configuration);
        }

        auto as_string_list(const YAML::Node& node, std::string_view what)
            -> std::vector<std::string>
        {
            if (!node)
            {
                return {};
            }
            if (!node.IsSequence())
            {
                throw_invalid(fmt::format("'{}' must be a list of strings", what));
            }
            return node.as<std::vector<std::string>>();
        }

        auto parse_authentication(const YAML::Node& node, std::string_view owner)
            -> specs::AuthenticationSet
        {
            auto out = specs::AuthenticationSet();
            for (const auto& name : as_string_list(node, "authentication"))
            {
                const auto kind = specs::authentication_kind_parse(name);
                if (!kind)
                {
                    throw_invalid(
                        fmt::format("Unknown authentication '{}' declared by '{}'", name, owner)
                    );
                }
                out.insert(*kind);
            }
            return out;
        }

        auto parse_credentials(const YAML::Node& node, std::string_view owner)
            -> std::optional<specs::CredentialsValue>
        {
            if (!node || node.IsNull())
            {
                return std::nullopt;
            }
            if (!node.IsMap() || !node["type"])
            {
                throw_invalid(fmt::format("Credentials of '{}' must be a map with a 'type'", owner));
            }

            auto value = specs::CredentialsValue();
            for (const auto& entry : node)
            {
                auto key = entry.first.as<std::string>();
                if (key == "type")
                {
                    value.type = entry.second.as<std::string>();
                }
                else
                {
                    value.properties.emplace(std::move(key), entry.second.as<std::string>());
                }
            }
            return { std::move(value) };
        }

        auto parse_logging(const YAML::Node& node) -> LoggingParams
        {
            auto params = LoggingParams();
            if (node && !node.IsNull() && !node.IsMap())
            {
                throw_invalid("'logging' must be a map");
            }
            if (node && node["level"])
            {
                const auto name = node["level"].as<std::string>();
                const auto level = log_level_parse(name);
                if (!level)
                {
                    throw_invalid(fmt::format("Unknown logging level '{}'", name));
                }
                params.logging_level = *level;
            }
            if (node && node["pattern"])
            {
                params.log_pattern = node["pattern"].as<std::string>();
            }
            return params;
        }

        auto parse_transport(const YAML::Node& node) -> transport::TransportFactoryParams
        {
            auto params = transport::TransportFactoryParams();
            if (node && !node.IsNull() && !node.IsMap())
            {
                throw_invalid("'transport' must be a map");
            }
            if (node && node["cache"])
            {
                params.cache_transports = node["cache"].as<bool>();
            }
            return params;
        }

        auto parse_connector(const YAML::Node& node) -> ConnectorDeclaration
        {
            if (!node.IsMap() || !node["name"])
            {
                throw_invalid("Every connector must be a map with a 'name'");
            }
            auto decl = ConnectorDeclaration();
            decl.name = node["name"].as<std::string>();
            decl.schemes = specs::SchemeSet(as_string_list(node["schemes"], "schemes"));
            decl.authentication = parse_authentication(node["authentication"], decl.name);
            return decl;
        }

        auto parse_repository(const YAML::Node& node) -> RepositoryDeclaration
        {
            if (!node.IsMap() || !node["name"])
            {
                throw_invalid("Every repository must be a map with a 'name'");
            }
            auto decl = RepositoryDeclaration();
            decl.name = node["name"].as<std::string>();
            decl.urls = as_string_list(node["urls"], "urls");
            if (node["url"])
            {
                decl.urls.push_back(node["url"].as<std::string>());
            }
            decl.credentials = parse_credentials(node["credentials"], decl.name);
            decl.authentication = parse_authentication(node["authentication"], decl.name);
            return decl;
        }

        template <typename Decl, typename Parser>
        auto parse_list(const YAML::Node& node, std::string_view what, Parser parser)
            -> std::vector<Decl>
        {
            auto out = std::vector<Decl>();
            if (!node)
            {
                return out;
            }
            if (!node.IsSequence())
            {
                throw_invalid(fmt::format("'{}' must be a list", what));
            }
            for (const auto& item : node)
            {
                out.push_back(parser(item));
            }
            return out;
        }

        auto parse_root(const YAML::Node& root) -> Configuration
        {
            auto config = Configuration();
            if (!root || root.IsNull())
            {
                return config;
            }
            if (!root.IsMap())
            {
                throw_invalid("The configuration must be a map");
            }
            config.logging = parse_logging(root["logging"]);
            config.transport = parse_transport(root["transport"]);
            config.connectors = parse_list<ConnectorDeclaration>(
                root["connectors"],
                "connectors",
                parse_connector
            );
            config.repositories = parse_list<RepositoryDeclaration>(
                root["repositories"],
                "repositories",
                parse_repository
            );
            return config;
        }
    }

    auto RepositoryDeclaration::to_request() const -> specs::RepositoryRequest
    {
        auto schemes = std::vector<std::string>();
        schemes.reserve(urls.size());
        for (const auto& url : urls)
        {
            schemes.emplace_back(util::location_scheme(url));
        }
        return {
            /* .schemes= */ specs::SchemeSet(std::move(schemes)),
            /* .repository_name= */ name,
            /* .credentials= */ credentials,
            /* .authentication= */ authentication,
        };
    }

    auto parse_configuration(std::string_view yaml) -> expected_t<Configuration>
    {
        try
        {
            return parse_root(YAML::Load(std::string(yaml)));
        }
        catch (const artport_error& e)
        {
            return tl::unexpected(e);
        }
        catch (const YAML::Exception& e)
        {
            return make_unexpected(
                fmt::format("Invalid configuration: {}", e.what()),
                artport_error_code::invalid_configuration
            );
        }
    }

    auto load_configuration(const std::filesystem::path& file) -> expected_t<Configuration>
    {
        auto in = std::ifstream(file);
        if (!in)
        {
            return make_unexpected(
                fmt::format("Cannot open configuration file '{}'", file.string()),
                artport_error_code::invalid_configuration
            );
        }
        auto contents = std::stringstream();
        contents << in.rdbuf();

        LOG_DEBUG << "Loading configuration file '" << file.string() << "'";
        auto config = parse_configuration(contents.str());
        if (!config)
        {
            return make_unexpected(
                fmt::format("In '{}': {}", file.string(), config.error().what()),
                artport_error_code::invalid_configuration
            );
        }
        return config;
    }

    auto configuration_connector_provider(const Configuration& config) -> transport::ConnectorProvider
    {
        return [declarations = config.connectors]()
        {
            auto out = transport::connector_list();
            out.reserve(declarations.size());
            for (const auto& decl : declarations)
            {
                out.push_back(transport::make_connector(decl.name, decl.schemes, decl.authentication));
            }
            return out;
        };
    }

    auto make_registry(const Configuration& config)
        -> expected_t<std::shared_ptr<const transport::ConnectorRegistry>>
    {
        auto registry = transport::ConnectorRegistry::from_providers({
            transport::default_connector_provider(),
            configuration_connector_provider(config),
        });
        if (!registry)
        {
            return forward_error(registry);
        }
        return { std::make_shared<const transport::ConnectorRegistry>(std::move(registry).value()) };
    }
}
