// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <algorithm>
#include <cctype>

#include "artport/util/url_manip.hpp"

namespace artport::util
{
    auto url_get_scheme(std::string_view url) -> std::string_view
    {
        static constexpr auto is_scheme_char = [](char c) -> bool
        {
            return std::isalnum(static_cast<unsigned char>(c)) || (c == '.') || (c == '-')
                   || (c == '_') || (c == '+');
        };

        const auto sep = url.find("://");
        if ((0 < sep) && (sep < std::string_view::npos))
        {
            auto scheme = url.substr(0, sep);
            if (std::all_of(scheme.cbegin(), scheme.cend(), is_scheme_char))
            {
                return scheme;
            }
        }
        return "";
    }

    auto url_has_scheme(std::string_view url) -> bool
    {
        return !url_get_scheme(url).empty();
    }

    auto location_scheme(std::string_view location) -> std::string_view
    {
        if (const auto scheme = url_get_scheme(location); !scheme.empty())
        {
            return scheme;
        }
        return "file";
    }
}
