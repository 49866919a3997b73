// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_UTIL_URL_MANIP_HPP
#define ARTPORT_UTIL_URL_MANIP_HPP

#include <string_view>

namespace artport::util
{
    /**
     * If @p url starts with a scheme, return it, otherwise return empty string.
     *
     * Does not include "://"
     */
    [[nodiscard]] auto url_get_scheme(std::string_view url) -> std::string_view;

    /**
     * Return true if @p url starts with a URL scheme.
     */
    [[nodiscard]] auto url_has_scheme(std::string_view url) -> bool;

    /**
     * Scheme under which @p location is served.
     *
     * Locations without a scheme are local paths and served under "file".
     */
    [[nodiscard]] auto location_scheme(std::string_view location) -> std::string_view;
}
#endif
