// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "artport/transport/transport_cache.hpp"

namespace artport::transport
{
    auto TransportCache::get_or_create(const TransportKey& key, const builder_type& builder)
        -> transport_ptr
    {
        auto transports = m_transports.synchronize();
        if (auto it = transports->find(key); it != transports->end())
        {
            return it->second;
        }
        auto transport = builder();
        transports->emplace(key, transport);
        return transport;
    }

    auto TransportCache::find(const TransportKey& key) const -> transport_ptr
    {
        return m_transports.apply(
            [&key](const map_type& transports) -> transport_ptr
            {
                if (auto it = transports.find(key); it != transports.end())
                {
                    return it->second;
                }
                return nullptr;
            }
        );
    }

    auto TransportCache::size() const -> std::size_t
    {
        return m_transports->size();
    }

    void TransportCache::clear()
    {
        m_transports->clear();
    }
}
