// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_UTIL_TUPLE_HASH_HPP
#define ARTPORT_UTIL_TUPLE_HASH_HPP

#include <functional>

namespace artport::util
{
    constexpr auto hash_combine(std::size_t seed, std::size_t other) -> std::size_t
    {
        const auto boost_magic_num = 0x9e3779b9;
        seed ^= other + boost_magic_num + (seed << 6) + (seed >> 2);
        return seed;
    }

    template <class T, typename Hasher = std::hash<T>>
    constexpr auto hash_combine_val(std::size_t seed, const T& val, const Hasher& hasher = {})
        -> std::size_t
    {
        return hash_combine(seed, hasher(val));
    }

    template <typename... T>
    constexpr auto hash_vals(const T&... vals) -> std::size_t
    {
        std::size_t seed = 0;
        auto combine = [&seed](const auto& val) { seed = hash_combine_val(seed, val); };
        (combine(vals), ...);
        return seed;
    }

    template <typename Range>
    constexpr auto hash_range(const Range& rng) -> std::size_t
    {
        std::size_t seed = 0;
        for (const auto& val : rng)
        {
            seed = hash_combine_val(seed, val);
        }
        return seed;
    }
}
#endif
