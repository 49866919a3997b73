// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>

#include "artport/transport/transport_factory.hpp"

#include "transport/fake_connectors.hpp"

using namespace artport;
using namespace artport::transport;
using namespace artport::specs;

namespace
{
    using Auth = AuthenticationKind;

    // Authentication supported by connector1, and one it does not support
    constexpr auto good_auth = Auth::basic;
    constexpr auto no_supported_auth = Auth::digest;

    auto good_credentials() -> CredentialsValue
    {
        return { "password", { { "username", "user" }, { "password", "pass" } } };
    }

    auto bad_credentials() -> CredentialsValue
    {
        return { "aws", { { "access_key", "AKIA" }, { "secret_key", "secret" } } };
    }

    auto error_of(const expected_t<transport_ptr>& res) -> const artport_error&
    {
        REQUIRE_FALSE(res.has_value());
        return res.error();
    }

    TEST_CASE("TransportFactory scenarios")
    {
        const auto factory = TransportFactory(testing::make_fake_registry());

        SECTION("Unsupported protocol")
        {
            const auto res = factory.create_transport({ "unsupported" }, "name", std::nullopt, {});
            const auto& error = error_of(res);
            REQUIRE(error.error_code() == artport_error_code::unsupported_scheme);
            REQUIRE(
                std::string(error.what())
                == "Not a supported repository protocol 'unsupported' for repository 'name': "
                   "valid protocols are [file, protocol1, protocol2a, protocol2b]"
            );
        }

        SECTION("Mixed protocols")
        {
            const auto res = factory.create_transport({ "protocol1", "protocol2b" }, "name", std::nullopt, {});
            const auto& error = error_of(res);
            REQUIRE(error.error_code() == artport_error_code::mixed_schemes);
            REQUIRE(
                std::string(error.what())
                == "You cannot mix different URL schemes for a single repository. Please declare separate repositories."
            );
        }

        SECTION("Credentials without authentication")
        {
            const auto res = factory.create_transport({ "protocol1" }, "name", good_credentials(), {});
            REQUIRE(res.has_value());
            const auto& transport = **res;
            REQUIRE(transport.connector().name() == "connector1");
            REQUIRE_FALSE(transport.is_local());
            REQUIRE(transport.schemes() == SchemeSet{ "protocol1" });
            REQUIRE(transport.credentials() == NormalizedCredentials(PasswordCredentials{ "user", "pass" }));
            REQUIRE(transport.authentication().empty());
        }

        SECTION("Credentials with supported authentication")
        {
            const auto res = factory.create_transport({ "protocol1" }, "name", good_credentials(), { good_auth });
            REQUIRE(res.has_value());
            REQUIRE((*res)->connector().name() == "connector1");
            REQUIRE((*res)->authentication() == AuthenticationSet{ good_auth });
        }

        SECTION("Unsupported authentication")
        {
            const auto res = factory.create_transport(
                { "protocol1" },
                "name",
                good_credentials(),
                { no_supported_auth }
            );
            const auto& error = error_of(res);
            REQUIRE(error.error_code() == artport_error_code::unsupported_authentication);
            REQUIRE(
                std::string(error.what())
                == "Authentication type of 'DigestAuthentication' is not supported by protocols [protocol1]"
            );
        }

        SECTION("Incompatible credentials")
        {
            const auto res = factory.create_transport({ "protocol1" }, "name", bad_credentials(), { good_auth });
            const auto& error = error_of(res);
            REQUIRE(error.error_code() == artport_error_code::incompatible_credentials);
            REQUIRE(
                std::string(error.what())
                == "Credentials type of 'AwsCredentials' is not supported by authentication protocol 'BasicAuthentication'"
            );
        }

        SECTION("Authentication without credentials")
        {
            const auto res = factory.create_transport({ "protocol1" }, "name", std::nullopt, { good_auth });
            const auto& error = error_of(res);
            REQUIRE(error.error_code() == artport_error_code::missing_credentials);
            REQUIRE(
                std::string(error.what())
                == "You cannot configure authentication protocols for a repository if no credentials are provided."
            );
        }
    }

    TEST_CASE("TransportFactory properties")
    {
        const auto factory = TransportFactory(testing::make_fake_registry());

        SECTION("Any pair of connectors is a mix")
        {
            const auto groups = std::vector<std::vector<std::string>>{
                { "file" },
                { "protocol1" },
                { "protocol2a", "protocol2b" },
            };
            for (std::size_t i = 0; i < groups.size(); ++i)
            {
                for (std::size_t j = i + 1; j < groups.size(); ++j)
                {
                    for (const auto& left : groups[i])
                    {
                        for (const auto& right : groups[j])
                        {
                            const auto res = factory.create_transport({ left, right }, std::nullopt, std::nullopt, {});
                            REQUIRE(error_of(res).error_code() == artport_error_code::mixed_schemes);
                        }
                    }
                }
            }
        }

        SECTION("Missing credentials regardless of the protocol")
        {
            for (const auto& scheme : { "file", "protocol1", "protocol2a" })
            {
                const auto res = factory.create_transport({ scheme }, std::nullopt, std::nullopt, { good_auth });
                REQUIRE(error_of(res).error_code() == artport_error_code::missing_credentials);
            }
        }

        SECTION("Unknown credentials type")
        {
            const auto res = factory.create_transport({ "protocol1" }, "name", CredentialsValue{ "kerberos" }, {});
            const auto& error = error_of(res);
            REQUIRE(error.error_code() == artport_error_code::invalid_credentials_type);
            REQUIRE(
                std::string(error.what())
                == "Credentials must be an instance of: AwsCredentials, HttpHeaderCredentials, PasswordCredentials"
            );
        }

        SECTION("Scheme errors take precedence over credentials errors")
        {
            auto res = factory.create_transport({ "unsupported" }, "name", CredentialsValue{ "kerberos" }, {});
            REQUIRE(error_of(res).error_code() == artport_error_code::unsupported_scheme);

            res = factory.create_transport({ "protocol1", "protocol2a" }, "name", CredentialsValue{ "kerberos" }, {});
            REQUIRE(error_of(res).error_code() == artport_error_code::mixed_schemes);
        }

        SECTION("Credentials errors take precedence over authentication errors")
        {
            const auto res = factory.create_transport(
                { "protocol1" },
                "name",
                CredentialsValue{ "kerberos" },
                { no_supported_auth }
            );
            REQUIRE(error_of(res).error_code() == artport_error_code::invalid_credentials_type);
        }

        SECTION("Local file repository")
        {
            const auto res = factory.create_transport({ "file" }, "local", good_credentials(), {});
            REQUIRE(res.has_value());
            REQUIRE((*res)->is_local());
            REQUIRE((*res)->connector().name() == "file");
        }

        SECTION("Idempotence")
        {
            const auto request = RepositoryRequest{ { "protocol1" }, "name", bad_credentials(), { good_auth } };
            const auto first = factory.create_transport(request);
            const auto second = factory.create_transport(request);
            REQUIRE(error_of(first).error_code() == error_of(second).error_code());
            REQUIRE(std::string(error_of(first).what()) == std::string(error_of(second).what()));
        }
    }

    TEST_CASE("TransportFactory caching")
    {
        const auto request = RepositoryRequest{ { "protocol1" }, "name", good_credentials(), { good_auth } };

        SECTION("Equivalent requests share a transport")
        {
            const auto factory = TransportFactory(testing::make_fake_registry());
            const auto first = factory.create_transport(request);
            REQUIRE(first.has_value());

            // The repository name does not take part in the transport identity
            auto renamed = request;
            renamed.repository_name = "other";
            const auto second = factory.create_transport(renamed);
            REQUIRE(second.has_value());
            REQUIRE(*first == *second);
            REQUIRE(factory.cache().size() == 1);

            auto other_creds = request;
            other_creds.credentials->properties["password"] = "other";
            const auto third = factory.create_transport(other_creds);
            REQUIRE(third.has_value());
            REQUIRE(*third != *first);
            REQUIRE(factory.cache().size() == 2);
        }

        SECTION("Failures are not cached")
        {
            const auto factory = TransportFactory(testing::make_fake_registry());
            REQUIRE_FALSE(factory.create_transport({ "unsupported" }, std::nullopt, std::nullopt, {}).has_value());
            REQUIRE(factory.cache().size() == 0);
        }

        SECTION("Caching disabled")
        {
            const auto factory = TransportFactory(
                testing::make_fake_registry(),
                TransportFactoryParams{ /* .cache_transports= */ false }
            );
            const auto first = factory.create_transport(request);
            const auto second = factory.create_transport(request);
            REQUIRE(first.has_value());
            REQUIRE(second.has_value());
            REQUIRE(*first != *second);
            REQUIRE((*first)->key() == (*second)->key());
            REQUIRE(factory.cache().size() == 0);
        }

        SECTION("Concurrent requests")
        {
            const auto factory = TransportFactory(testing::make_fake_registry());
            static constexpr std::size_t thread_count = 8;
            auto results = std::vector<transport_ptr>(thread_count);

            std::vector<std::thread> workers;
            for (std::size_t i = 0; i < thread_count; ++i)
            {
                workers.emplace_back([&, i] { results[i] = extract(factory.create_transport(request)); });
            }
            for (auto& worker : workers)
            {
                worker.join();
            }

            REQUIRE(factory.cache().size() == 1);
            for (const auto& res : results)
            {
                REQUIRE(res != nullptr);
                REQUIRE(res == results.front());
            }
        }
    }

    TEST_CASE("ValidatedTransport")
    {
        const auto factory = TransportFactory(testing::make_fake_registry());

        SECTION("Password credentials")
        {
            const auto transport = extract(
                factory.create_transport({ "protocol1" }, "name", good_credentials(), { good_auth })
            );
            const auto password = transport->password_credentials();
            REQUIRE(password.has_value());
            REQUIRE(password->username == "user");
            REQUIRE(password->password == "pass");
        }

        SECTION("Other credentials")
        {
            const auto transport = extract(
                factory.create_transport({ "protocol2a" }, "name", bad_credentials(), {})
            );
            const auto password = transport->password_credentials();
            REQUIRE_FALSE(password.has_value());
            REQUIRE(password.error().error_code() == artport_error_code::invalid_credentials_type);
            REQUIRE(
                std::string(password.error().what())
                == "Credentials must be an instance of: PasswordCredentials"
            );
        }

        SECTION("No credentials")
        {
            const auto transport = extract(
                factory.create_transport({ "protocol2a", "protocol2b" }, "name", std::nullopt, {})
            );
            REQUIRE_FALSE(transport->credentials().has_value());
            REQUIRE_FALSE(transport->password_credentials().has_value());
        }

        SECTION("JSON hides secrets")
        {
            const auto transport = extract(
                factory.create_transport({ "protocol1" }, "name", good_credentials(), { good_auth })
            );
            const auto j = nlohmann::json(*transport);
            REQUIRE(j["connector"] == "connector1");
            REQUIRE(j["local"] == false);
            REQUIRE(j["schemes"] == nlohmann::json::array({ "protocol1" }));
            REQUIRE(j["credentials"]["username"] == "user");
            REQUIRE(j["credentials"]["password"] == "*****");
            REQUIRE(j["authentication"] == nlohmann::json::array({ "basic" }));
        }
    }
}
