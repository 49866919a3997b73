// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>

#include <catch2/catch_all.hpp>

#include "artport/transport/authentication_validator.hpp"

#include "transport/fake_connectors.hpp"

using namespace artport;
using namespace artport::transport;
using namespace artport::specs;

namespace
{
    using Auth = AuthenticationKind;

    TEST_CASE("validate_authentication")
    {
        const auto connector = make_connector(
            "http",
            { "http", "https" },
            { Auth::basic, Auth::digest, Auth::http_header }
        );
        const auto schemes = SchemeSet{ "http", "https" };
        const auto password = NormalizedCredentials(PasswordCredentials{ "user", "pass" });
        const auto aws = NormalizedCredentials(AwsCredentials{ "key", "secret" });
        const auto header = NormalizedCredentials(HttpHeaderCredentials{ "Private-Token", "tok" });

        SECTION("No authentication")
        {
            for (const auto& creds : { NormalizedCredentials(), password, aws })
            {
                const auto res = validate_authentication(*connector, schemes, creds, {});
                REQUIRE(res.has_value());
                REQUIRE(res->empty());
            }
        }

        SECTION("Compatible authentication")
        {
            auto res = validate_authentication(*connector, schemes, password, { Auth::basic, Auth::digest });
            REQUIRE(res.has_value());
            REQUIRE(*res == AuthenticationSet{ Auth::basic, Auth::digest });

            res = validate_authentication(*connector, schemes, header, { Auth::http_header });
            REQUIRE(res.has_value());
            REQUIRE(*res == AuthenticationSet{ Auth::http_header });
        }

        SECTION("Missing credentials")
        {
            const auto res = validate_authentication(*connector, schemes, std::nullopt, { Auth::basic });
            REQUIRE_FALSE(res.has_value());
            REQUIRE(res.error().error_code() == artport_error_code::missing_credentials);
            REQUIRE(
                std::string(res.error().what())
                == "You cannot configure authentication protocols for a repository if no credentials are provided."
            );
        }

        SECTION("Missing credentials takes precedence over unsupported authentication")
        {
            const auto res = validate_authentication(
                *connector,
                schemes,
                std::nullopt,
                { Auth::aws_signature }
            );
            REQUIRE(res.error().error_code() == artport_error_code::missing_credentials);
        }

        SECTION("Unsupported authentication")
        {
            const auto res = validate_authentication(*connector, schemes, aws, { Auth::aws_signature });
            REQUIRE_FALSE(res.has_value());
            REQUIRE(res.error().error_code() == artport_error_code::unsupported_authentication);
            REQUIRE(
                std::string(res.error().what())
                == "Authentication type of 'AwsSignatureAuthentication' is not supported by protocols [http, https]"
            );
        }

        SECTION("Unsupported authentication is checked before credentials compatibility")
        {
            // basic is incompatible with AWS credentials, but aws_signature is not supported at all
            const auto res = validate_authentication(
                *connector,
                schemes,
                aws,
                { Auth::basic, Auth::aws_signature }
            );
            REQUIRE(res.error().error_code() == artport_error_code::unsupported_authentication);
        }

        SECTION("Incompatible credentials")
        {
            const auto res = validate_authentication(*connector, schemes, aws, { Auth::basic });
            REQUIRE_FALSE(res.has_value());
            REQUIRE(res.error().error_code() == artport_error_code::incompatible_credentials);
            REQUIRE(
                std::string(res.error().what())
                == "Credentials type of 'AwsCredentials' is not supported by authentication protocol 'BasicAuthentication'"
            );
        }

        SECTION("A single incompatible kind fails the request")
        {
            const auto res = validate_authentication(
                *connector,
                schemes,
                password,
                { Auth::basic, Auth::digest, Auth::http_header }
            );
            REQUIRE(res.error().error_code() == artport_error_code::incompatible_credentials);
            REQUIRE(
                std::string(res.error().what())
                == "Credentials type of 'PasswordCredentials' is not supported by authentication protocol 'HttpHeaderAuthentication'"
            );
        }

        SECTION("The first incompatible kind in set order is reported")
        {
            const auto res = validate_authentication(
                *connector,
                schemes,
                header,
                { Auth::http_header, Auth::digest, Auth::basic }
            );
            REQUIRE(
                std::string(res.error().what())
                == "Credentials type of 'HttpHeaderCredentials' is not supported by authentication protocol 'BasicAuthentication'"
            );
        }

        SECTION("Connector without authentication")
        {
            const auto gcs = make_connector("gcs", { "gcs" });
            REQUIRE(validate_authentication(*gcs, { "gcs" }, password, {}).has_value());

            const auto res = validate_authentication(*gcs, { "gcs" }, password, { Auth::basic });
            REQUIRE(res.error().error_code() == artport_error_code::unsupported_authentication);
            REQUIRE(
                std::string(res.error().what())
                == "Authentication type of 'BasicAuthentication' is not supported by protocols [gcs]"
            );
        }
    }
}
