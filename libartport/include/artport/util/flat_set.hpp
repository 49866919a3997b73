// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_UTIL_FLAT_SET_HPP
#define ARTPORT_UTIL_FLAT_SET_HPP

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <utility>
#include <vector>

#include "artport/util/tuple_hash.hpp"

namespace artport::util
{
    /**
     * A sorted vector behaving like a set.
     *
     * Iteration is always in ``Compare`` order, which is what makes the diagnostics built from
     * scheme and authentication sets reproducible.
     * Uniqueness is determined with the equivalence relation ``!comp(a, b) && !comp(b, a)``.
     */
    template <typename Key, typename Compare = std::less<Key>>
    class flat_set : private std::vector<Key>
    {
    public:

        using Base = std::vector<Key>;
        using typename Base::const_iterator;
        using typename Base::size_type;
        using typename Base::value_type;
        using key_compare = Compare;

        using Base::cbegin;
        using Base::cend;
        using Base::empty;
        using Base::size;

        flat_set() = default;
        flat_set(std::initializer_list<value_type> il, key_compare compare = key_compare());
        template <typename InputIterator>
        flat_set(InputIterator first, InputIterator last, key_compare compare = key_compare());
        explicit flat_set(std::vector<Key>&& other, key_compare compare = key_compare());

        flat_set(const flat_set&) = default;
        flat_set(flat_set&&) = default;
        auto operator=(const flat_set&) -> flat_set& = default;
        auto operator=(flat_set&&) -> flat_set& = default;

        auto key_comp() const -> const key_compare&;

        auto front() const noexcept -> const value_type&;
        auto begin() const noexcept -> const_iterator;
        auto end() const noexcept -> const_iterator;

        /** Insert an element in the set, invalidating iterators. */
        auto insert(const value_type& value) -> std::pair<const_iterator, bool>;
        auto insert(value_type&& value) -> std::pair<const_iterator, bool>;

        template <class T>
        auto contains(const T& value) const -> bool;

    private:

        key_compare m_compare;

        auto key_eq(const value_type& a, const value_type& b) const -> bool;
        template <typename U>
        auto insert_impl(U&& value) -> std::pair<const_iterator, bool>;
        void sort_and_remove_duplicates();

        template <typename K, typename C>
        friend auto operator==(const flat_set<K, C>& lhs, const flat_set<K, C>& rhs) -> bool;

        template <typename K, typename C>
        friend auto set_union(const flat_set<K, C>&, const flat_set<K, C>&) -> flat_set<K, C>;
        template <typename K, typename C>
        friend auto set_difference(const flat_set<K, C>&, const flat_set<K, C>&) -> flat_set<K, C>;
    };

    template <class Key, class Compare = std::less<Key>>
    flat_set(std::initializer_list<Key>, Compare = Compare()) -> flat_set<Key, Compare>;

    template <
        class InputIt,
        class Comp = std::less<typename std::iterator_traits<InputIt>::value_type>>
    flat_set(InputIt, InputIt, Comp = Comp())
        -> flat_set<typename std::iterator_traits<InputIt>::value_type, Comp>;

    template <typename Key, typename Compare>
    auto operator==(const flat_set<Key, Compare>& lhs, const flat_set<Key, Compare>& rhs) -> bool;

    template <typename Key, typename Compare>
    auto operator!=(const flat_set<Key, Compare>& lhs, const flat_set<Key, Compare>& rhs) -> bool;

    template <typename Key, typename Compare>
    auto set_is_disjoint_of(const flat_set<Key, Compare>& lhs, const flat_set<Key, Compare>& rhs)
        -> bool;

    template <typename Key, typename Compare>
    auto set_is_subset_of(const flat_set<Key, Compare>& lhs, const flat_set<Key, Compare>& rhs)
        -> bool;

    template <typename Key, typename Compare>
    auto set_is_superset_of(const flat_set<Key, Compare>& lhs, const flat_set<Key, Compare>& rhs)
        -> bool;

    template <typename Key, typename Compare>
    auto set_union(const flat_set<Key, Compare>& lhs, const flat_set<Key, Compare>& rhs)
        -> flat_set<Key, Compare>;

    template <typename Key, typename Compare>
    auto set_difference(const flat_set<Key, Compare>& lhs, const flat_set<Key, Compare>& rhs)
        -> flat_set<Key, Compare>;

    /*****************************
     *  flat_set Implementation  *
     *****************************/

    template <typename K, typename C>
    flat_set<K, C>::flat_set(std::initializer_list<value_type> il, key_compare compare)
        : Base(il)
        , m_compare(std::move(compare))
    {
        sort_and_remove_duplicates();
    }

    template <typename K, typename C>
    template <typename InputIterator>
    flat_set<K, C>::flat_set(InputIterator first, InputIterator last, key_compare compare)
        : Base(first, last)
        , m_compare(std::move(compare))
    {
        sort_and_remove_duplicates();
    }

    template <typename K, typename C>
    flat_set<K, C>::flat_set(std::vector<K>&& other, key_compare compare)
        : Base(std::move(other))
        , m_compare(std::move(compare))
    {
        sort_and_remove_duplicates();
    }

    template <typename K, typename C>
    auto flat_set<K, C>::key_comp() const -> const key_compare&
    {
        return m_compare;
    }

    template <typename K, typename C>
    auto flat_set<K, C>::front() const noexcept -> const value_type&
    {
        return Base::front();
    }

    template <typename K, typename C>
    auto flat_set<K, C>::begin() const noexcept -> const_iterator
    {
        return Base::begin();
    }

    template <typename K, typename C>
    auto flat_set<K, C>::end() const noexcept -> const_iterator
    {
        return Base::end();
    }

    template <typename K, typename C>
    auto flat_set<K, C>::insert(const value_type& value) -> std::pair<const_iterator, bool>
    {
        return insert_impl(value);
    }

    template <typename K, typename C>
    auto flat_set<K, C>::insert(value_type&& value) -> std::pair<const_iterator, bool>
    {
        return insert_impl(std::move(value));
    }

    template <typename K, typename C>
    template <class T>
    auto flat_set<K, C>::contains(const T& value) const -> bool
    {
        return std::binary_search(begin(), end(), value, m_compare);
    }

    template <typename K, typename C>
    auto flat_set<K, C>::key_eq(const value_type& a, const value_type& b) const -> bool
    {
        return !m_compare(a, b) && !m_compare(b, a);
    }

    template <typename K, typename C>
    template <typename U>
    auto flat_set<K, C>::insert_impl(U&& value) -> std::pair<const_iterator, bool>
    {
        auto it = std::lower_bound(begin(), end(), value, m_compare);
        if ((it != end()) && key_eq(*it, value))
        {
            return { it, false };
        }
        it = Base::insert(it, std::forward<U>(value));
        return { it, true };
    }

    template <typename K, typename C>
    void flat_set<K, C>::sort_and_remove_duplicates()
    {
        std::sort(Base::begin(), Base::end(), m_compare);
        auto is_eq = [this](const value_type& a, const value_type& b) { return key_eq(a, b); };
        Base::erase(std::unique(Base::begin(), Base::end(), is_eq), Base::end());
    }

    template <typename K, typename C>
    auto operator==(const flat_set<K, C>& lhs, const flat_set<K, C>& rhs) -> bool
    {
        auto is_eq = [&lhs](const auto& a, const auto& b) { return lhs.key_eq(a, b); };
        return std::equal(lhs.cbegin(), lhs.cend(), rhs.cbegin(), rhs.cend(), is_eq);
    }

    template <typename K, typename C>
    auto operator!=(const flat_set<K, C>& lhs, const flat_set<K, C>& rhs) -> bool
    {
        return !(lhs == rhs);
    }

    template <typename K, typename C>
    auto set_is_disjoint_of(const flat_set<K, C>& lhs, const flat_set<K, C>& rhs) -> bool
    {
        const auto& comp = lhs.key_comp();
        auto first1 = lhs.cbegin();
        auto first2 = rhs.cbegin();
        while ((first1 != lhs.cend()) && (first2 != rhs.cend()))
        {
            if (comp(*first1, *first2))
            {
                ++first1;
            }
            else if (comp(*first2, *first1))
            {
                ++first2;
            }
            else
            {
                return false;
            }
        }
        return true;
    }

    template <typename K, typename C>
    auto set_is_subset_of(const flat_set<K, C>& lhs, const flat_set<K, C>& rhs) -> bool
    {
        return (lhs.size() <= rhs.size())
               && std::includes(rhs.cbegin(), rhs.cend(), lhs.cbegin(), lhs.cend(), lhs.key_comp());
    }

    template <typename K, typename C>
    auto set_is_superset_of(const flat_set<K, C>& lhs, const flat_set<K, C>& rhs) -> bool
    {
        return set_is_subset_of(rhs, lhs);
    }

    template <typename K, typename C>
    auto set_union(const flat_set<K, C>& lhs, const flat_set<K, C>& rhs) -> flat_set<K, C>
    {
        auto out = flat_set<K, C>();
        std::set_union(
            lhs.cbegin(),
            lhs.cend(),
            rhs.cbegin(),
            rhs.cend(),
            std::back_inserter(static_cast<typename flat_set<K, C>::Base&>(out)),
            lhs.m_compare
        );
        return out;
    }

    template <typename K, typename C>
    auto set_difference(const flat_set<K, C>& lhs, const flat_set<K, C>& rhs) -> flat_set<K, C>
    {
        auto out = flat_set<K, C>();
        std::set_difference(
            lhs.cbegin(),
            lhs.cend(),
            rhs.cbegin(),
            rhs.cend(),
            std::back_inserter(static_cast<typename flat_set<K, C>::Base&>(out)),
            lhs.m_compare
        );
        return out;
    }
}

template <typename Key, typename Compare>
struct std::hash<artport::util::flat_set<Key, Compare>>
{
    auto operator()(const artport::util::flat_set<Key, Compare>& set) const -> std::size_t
    {
        return artport::util::hash_range(set);
    }
};

#endif
