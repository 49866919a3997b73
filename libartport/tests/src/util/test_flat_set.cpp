// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <functional>
#include <string>

#include <catch2/catch_all.hpp>

#include "artport/util/flat_set.hpp"

using namespace artport::util;

namespace
{
    TEST_CASE("flat_set constructor")
    {
        const auto s1 = flat_set<int>();
        REQUIRE(s1.size() == 0);
        REQUIRE(s1.empty());

        const auto s2 = flat_set<int>({ 1, 2 });
        REQUIRE(s2.size() == 2);

        const auto s3 = flat_set<int>{ s2 };
        REQUIRE(s3.size() == 2);

        const auto s4 = flat_set<int>{ std::move(s2) };
        REQUIRE(s4.size() == 2);

        // CTAD
        auto s5 = flat_set({ 1, 2 });
        REQUIRE(s5.size() == 2);
        STATIC_REQUIRE(std::is_same_v<decltype(s5)::value_type, int>);

        const auto s6 = flat_set<int>({ 4, 1, 2, 1, 4 });
        REQUIRE(s6.size() == 3);
        REQUIRE(s6.front() == 1);
    }

    TEST_CASE("flat_set equality")
    {
        REQUIRE(flat_set<int>() == flat_set<int>());
        REQUIRE(flat_set<int>({ 1, 2 }) == flat_set<int>({ 1, 2 }));
        REQUIRE(flat_set<int>({ 1, 2 }) == flat_set<int>({ 2, 1 }));
        REQUIRE(flat_set<int>({ 1, 2, 1 }) == flat_set<int>({ 2, 2, 1 }));
        REQUIRE(flat_set<int>({ 1, 2 }) != flat_set<int>({ 1, 2, 3 }));
        REQUIRE(flat_set<int>({ 2 }) != flat_set<int>({}));
    }

    TEST_CASE("flat_set insert")
    {
        auto s = flat_set<std::string>();
        s.insert("https");
        REQUIRE(s.size() == 1);
        s.insert("http");
        REQUIRE(s.size() == 2);
        REQUIRE(s.front() == "http");

        const auto [it, inserted] = s.insert("https");
        REQUIRE_FALSE(inserted);
        REQUIRE(*it == "https");
        REQUIRE(s.size() == 2);
    }

    TEST_CASE("flat_set contains")
    {
        const auto s = flat_set<std::string>({ "s3", "http", "file" });
        REQUIRE(s.contains("http"));
        REQUIRE(s.contains("file"));
        REQUIRE_FALSE(s.contains("HTTP"));
        REQUIRE_FALSE(s.contains("sftp"));
    }

    TEST_CASE("flat_set iteration order")
    {
        const auto s = flat_set<std::string>({ "protocol2b", "file", "protocol1", "protocol2a" });
        const auto expected = std::vector<std::string>{ "file", "protocol1", "protocol2a", "protocol2b" };
        REQUIRE(std::vector<std::string>(s.begin(), s.end()) == expected);

        const auto reversed = flat_set<int, std::greater<int>>({ 1, 3, 2 });
        REQUIRE(reversed.front() == 3);
    }

    TEST_CASE("flat_set set operations")
    {
        const auto s1 = flat_set<int>({ 1, 3, 4, 5 });
        const auto s2 = flat_set<int>({ 3, 5 });
        const auto s3 = flat_set<int>({ 4, 6 });

        SECTION("Disjoint")
        {
            REQUIRE(set_is_disjoint_of(s1, flat_set<int>{}));
            REQUIRE_FALSE(set_is_disjoint_of(s1, s1));
            REQUIRE_FALSE(set_is_disjoint_of(s1, s2));
            REQUIRE_FALSE(set_is_disjoint_of(s1, s3));
            REQUIRE(set_is_disjoint_of(s2, s3));
            REQUIRE(set_is_disjoint_of(s3, s2));
        }

        SECTION("Subset")
        {
            REQUIRE(set_is_subset_of(s1, s1));
            REQUIRE_FALSE(set_is_subset_of(s1, s2));
            REQUIRE(set_is_subset_of(s2, s1));
            REQUIRE_FALSE(set_is_subset_of(s3, s1));
            REQUIRE(set_is_subset_of(flat_set<int>{}, s1));
        }

        SECTION("Superset")
        {
            REQUIRE(set_is_superset_of(s1, s1));
            REQUIRE(set_is_superset_of(s1, s2));
            REQUIRE_FALSE(set_is_superset_of(s2, s1));
            REQUIRE_FALSE(set_is_superset_of(s1, s3));
        }

        SECTION("Union")
        {
            REQUIRE(set_union(s1, s1) == s1);
            REQUIRE(set_union(s1, s2) == s1);
            REQUIRE(set_union(s2, s3) == flat_set<int>{ 3, 4, 5, 6 });
            REQUIRE(set_union(s1, s3) == flat_set<int>{ 1, 3, 4, 5, 6 });
        }

        SECTION("Difference")
        {
            REQUIRE(set_difference(s1, s1) == flat_set<int>{});
            REQUIRE(set_difference(s1, s2) == flat_set<int>{ 1, 4 });
            REQUIRE(set_difference(s2, s1) == flat_set<int>{});
            REQUIRE(set_difference(s1, s3) == flat_set<int>{ 1, 3, 5 });
        }
    }

    TEST_CASE("flat_set hash")
    {
        const auto hasher = std::hash<flat_set<std::string>>();
        REQUIRE(
            hasher(flat_set<std::string>({ "http", "https" }))
            == hasher(flat_set<std::string>({ "https", "http" }))
        );
        REQUIRE(
            hasher(flat_set<std::string>({ "http" }))
            != hasher(flat_set<std::string>({ "http", "https" }))
        );
    }
}
