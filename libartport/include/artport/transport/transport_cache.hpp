// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_TRANSPORT_TRANSPORT_CACHE_HPP
#define ARTPORT_TRANSPORT_TRANSPORT_CACHE_HPP

#include <cstddef>
#include <functional>
#include <unordered_map>

#include "artport/transport/transport.hpp"
#include "artport/util/synchronized_value.hpp"

namespace artport::transport
{
    /**
     * Thread-safe memoization of validated transports.
     *
     * A transport is built at most once per key, even when several threads ask for the same
     * key for the first time at once. Every later request for an equal key returns the very
     * same handle.
     */
    class TransportCache
    {
    public:

        using builder_type = std::function<transport_ptr()>;

        TransportCache() = default;

        /**
         * Return the cached transport for @p key, calling @p builder to create it if absent.
         *
         * The builder is called with the cache locked and must not use the cache itself.
         */
        auto get_or_create(const TransportKey& key, const builder_type& builder) -> transport_ptr;

        [[nodiscard]] auto find(const TransportKey& key) const -> transport_ptr;
        [[nodiscard]] auto size() const -> std::size_t;

        void clear();

    private:

        using map_type = std::unordered_map<TransportKey, transport_ptr>;

        util::synchronized_value<map_type> m_transports;
    };
}
#endif
